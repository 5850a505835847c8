// include/line_ngin/prediction/confidence_tier.hpp
#pragma once

#include <optional>
#include "line_ngin/core/sport_profile.hpp"
#include "line_ngin/core/types.hpp"

namespace line_ngin {

/**
 * @brief Maps model-vs-market edges to confidence tiers
 *
 * Tiers are metadata for reporting only; they never change a pick.
 */
class ConfidenceTiering {
public:
    explicit ConfidenceTiering(const SportProfile& profile);

    static ConfidenceTier tier_for(double edge, const TierThresholds& thresholds);

    /**
     * @brief Edges and tiers for a prediction
     * @param predicted_spread Model spread (away - home)
     * @param predicted_total Model total
     * @param home_win_probability Model home win probability
     * @param line Market line, if captured. Missing spread/total yield edge 0.
     */
    ConfidenceTiers evaluate(double predicted_spread, double predicted_total,
                             double home_win_probability,
                             const std::optional<MarketLine>& line) const;

    /**
     * @brief True when a market spread exists and the spread edge reaches the sport's
     *        high-conviction threshold
     */
    bool is_high_conviction(const PredictionRecord& prediction,
                            const std::optional<MarketLine>& line) const;

private:
    TierThresholds spread_tiers_;
    TierThresholds total_tiers_;
    TierThresholds moneyline_tiers_;
    double high_conviction_spread_edge_;
};

}  // namespace line_ngin
