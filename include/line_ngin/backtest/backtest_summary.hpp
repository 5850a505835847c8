// include/line_ngin/backtest/backtest_summary.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <vector>
#include "line_ngin/core/types.hpp"

namespace line_ngin {
namespace backtest {

/**
 * @brief Win/loss/push counts for one market and line source
 */
struct OutcomeTally {
    int wins{0};
    int losses{0};
    int pushes{0};

    void record(Outcome outcome);

    int total_graded() const {
        return wins + losses + pushes;
    }

    /**
     * @brief Wins over decided bets in percent, one decimal; 0 when nothing was decided
     */
    double win_pct() const;

    /**
     * @brief Flat-stake profit at -110: 100 per win, -110 per loss, pushes refunded
     */
    double profit() const;
};

/**
 * @brief Tallies for one market, one per line source, never merged
 */
struct MarketTallies {
    OutcomeTally market;
    OutcomeTally model;
    OutcomeTally baseline;

    OutcomeTally& for_source(LineSource source);
    const OutcomeTally& for_source(LineSource source) const;
};

struct BacktestSummary {
    int total_games{0};  // Result log entries
    MarketTallies spread;
    MarketTallies moneyline;
    MarketTallies total;

    int high_conviction_games{0};
    MarketTallies high_conviction_spread;
    MarketTallies high_conviction_moneyline;
    MarketTallies high_conviction_total;

    // Mean absolute prediction errors over the log
    double spread_mae{0.0};
    double total_mae{0.0};
};

/**
 * @brief Stateless summary computation over a result log
 *
 * The summary is always derived from the log; nothing here keeps state between calls.
 */
class BacktestSummaryCalculator {
public:
    BacktestSummaryCalculator() = default;

    BacktestSummary calculate(const std::vector<BacktestResult>& results) const;

    /**
     * @brief Percentage rounded to one decimal; 0 when the denominator is 0
     */
    static double percentage(int numerator, int denominator);
};

nlohmann::json to_json(const OutcomeTally& tally);
nlohmann::json to_json(const MarketTallies& tallies);
nlohmann::json to_json(const BacktestSummary& summary);

}  // namespace backtest
}  // namespace line_ngin
