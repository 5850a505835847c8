#include "line_ngin/backtest/backtest_summary.hpp"
#include <cmath>

namespace line_ngin {
namespace backtest {

void OutcomeTally::record(Outcome outcome) {
    switch (outcome) {
        case Outcome::WIN:
            wins++;
            break;
        case Outcome::LOSS:
            losses++;
            break;
        case Outcome::PUSH:
            pushes++;
            break;
    }
}

double OutcomeTally::win_pct() const {
    return BacktestSummaryCalculator::percentage(wins, wins + losses);
}

double OutcomeTally::profit() const {
    return wins * 100.0 - losses * 110.0;
}

OutcomeTally& MarketTallies::for_source(LineSource source) {
    switch (source) {
        case LineSource::MODEL:
            return model;
        case LineSource::BASELINE:
            return baseline;
        case LineSource::MARKET:
        default:
            return market;
    }
}

const OutcomeTally& MarketTallies::for_source(LineSource source) const {
    switch (source) {
        case LineSource::MODEL:
            return model;
        case LineSource::BASELINE:
            return baseline;
        case LineSource::MARKET:
        default:
            return market;
    }
}

double BacktestSummaryCalculator::percentage(int numerator, int denominator) {
    if (denominator <= 0) {
        return 0.0;
    }
    return std::round(1000.0 * numerator / denominator) / 10.0;
}

BacktestSummary BacktestSummaryCalculator::calculate(
    const std::vector<BacktestResult>& results) const {
    BacktestSummary summary;
    summary.total_games = static_cast<int>(results.size());

    double spread_error = 0.0;
    double total_error = 0.0;

    for (const auto& result : results) {
        if (result.spread) {
            summary.spread.for_source(result.spread->source).record(result.spread->outcome);
        }
        if (result.moneyline) {
            summary.moneyline.for_source(result.moneyline->source)
                .record(result.moneyline->outcome);
        }
        if (result.total) {
            summary.total.for_source(result.total->source).record(result.total->outcome);
        }

        if (result.is_high_conviction) {
            summary.high_conviction_games++;
            if (result.spread) {
                summary.high_conviction_spread.for_source(result.spread->source)
                    .record(result.spread->outcome);
            }
            if (result.moneyline) {
                summary.high_conviction_moneyline.for_source(result.moneyline->source)
                    .record(result.moneyline->outcome);
            }
            if (result.total) {
                summary.high_conviction_total.for_source(result.total->source)
                    .record(result.total->outcome);
            }
        }

        spread_error += std::abs(result.prediction.spread - result.actual_spread());
        total_error += std::abs(result.prediction.total - result.actual_total());
    }

    if (!results.empty()) {
        summary.spread_mae = spread_error / results.size();
        summary.total_mae = total_error / results.size();
    }
    return summary;
}

nlohmann::json to_json(const OutcomeTally& tally) {
    return nlohmann::json{{"wins", tally.wins},
                          {"losses", tally.losses},
                          {"pushes", tally.pushes},
                          {"total_graded", tally.total_graded()},
                          {"win_pct", tally.win_pct()}};
}

nlohmann::json to_json(const MarketTallies& tallies) {
    return nlohmann::json{{"market", to_json(tallies.market)},
                          {"model", to_json(tallies.model)},
                          {"baseline", to_json(tallies.baseline)}};
}

nlohmann::json to_json(const BacktestSummary& summary) {
    nlohmann::json j;
    j["total_games"] = summary.total_games;
    j["spread"] = to_json(summary.spread);
    j["moneyline"] = to_json(summary.moneyline);
    j["total"] = to_json(summary.total);
    j["high_conviction"] = {{"games", summary.high_conviction_games},
                            {"spread", to_json(summary.high_conviction_spread)},
                            {"moneyline", to_json(summary.high_conviction_moneyline)},
                            {"total", to_json(summary.high_conviction_total)}};
    j["spread_mae"] = summary.spread_mae;
    j["total_mae"] = summary.total_mae;
    return j;
}

}  // namespace backtest
}  // namespace line_ngin
