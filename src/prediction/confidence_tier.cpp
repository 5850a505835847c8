#include "line_ngin/prediction/confidence_tier.hpp"
#include <cmath>

namespace line_ngin {

ConfidenceTiering::ConfidenceTiering(const SportProfile& profile)
    : spread_tiers_(profile.spread_tiers),
      total_tiers_(profile.total_tiers),
      moneyline_tiers_(profile.moneyline_tiers),
      high_conviction_spread_edge_(profile.high_conviction_spread_edge) {}

ConfidenceTier ConfidenceTiering::tier_for(double edge, const TierThresholds& thresholds) {
    if (edge >= thresholds.high) {
        return ConfidenceTier::HIGH;
    }
    if (edge >= thresholds.medium) {
        return ConfidenceTier::MEDIUM;
    }
    return ConfidenceTier::LOW;
}

ConfidenceTiers ConfidenceTiering::evaluate(double predicted_spread, double predicted_total,
                                            double home_win_probability,
                                            const std::optional<MarketLine>& line) const {
    ConfidenceTiers tiers;

    if (line && line->spread) {
        tiers.spread_edge = std::abs(predicted_spread - *line->spread);
    }
    if (line && line->total && *line->total > 0.0) {
        tiers.total_edge = std::abs(predicted_total - *line->total);
    }
    tiers.moneyline_edge = std::abs(home_win_probability - 0.5) * 100.0;

    // Without a market line the edge stays 0, which lands in LOW unless a threshold is 0
    tiers.spread = (line && line->spread) ? tier_for(tiers.spread_edge, spread_tiers_)
                                          : ConfidenceTier::LOW;
    tiers.total = (line && line->total && *line->total > 0.0)
                      ? tier_for(tiers.total_edge, total_tiers_)
                      : ConfidenceTier::LOW;
    tiers.moneyline = tier_for(tiers.moneyline_edge, moneyline_tiers_);
    return tiers;
}

bool ConfidenceTiering::is_high_conviction(const PredictionRecord& prediction,
                                           const std::optional<MarketLine>& line) const {
    if (!line || !line->spread) {
        return false;
    }
    return std::abs(prediction.spread - *line->spread) >= high_conviction_spread_edge_;
}

}  // namespace line_ngin
