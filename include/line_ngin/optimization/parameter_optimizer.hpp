// include/line_ngin/optimization/parameter_optimizer.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "line_ngin/backtest/backtest_runner.hpp"
#include "line_ngin/core/config_base.hpp"
#include "line_ngin/core/error.hpp"
#include "line_ngin/core/simulation_params.hpp"
#include "line_ngin/core/sport_profile.hpp"
#include "line_ngin/core/types.hpp"
#include "line_ngin/grading/grading_engine.hpp"
#include "line_ngin/optimization/parameter_space.hpp"

namespace line_ngin {
namespace optimization {

/**
 * @brief Configuration for a parameter search
 */
struct OptimizerConfig : public ConfigBase {
    int min_sample_size{50};        // Minimum graded spread bets for a ranked configuration
    int top_n{20};                  // Distinct configurations reported
    int max_parallel_trials{4};     // Concurrent backtests
    double breakeven_win_pct{52.4};  // Win rate needed at -110
    std::vector<FieldTolerance> duplicate_tolerances =
        NearDuplicateFilter::defaults().tolerances();
    SpreadLineMode spread_line_mode{SpreadLineMode::MODEL_ONLY};

    // Configuration metadata
    std::string version{"1.0.0"};

    Result<void> validate() const override;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Outcome of one trial configuration
 */
struct SimulationResult {
    SimulationParams params;
    int wins{0};
    int losses{0};
    int pushes{0};
    int total_graded{0};  // Spread bets inside the [min_spread, max_spread] window
    int total_games{0};   // Games in the result log
    double win_pct{0.0};
    double profit{0.0};
    size_t trial_index{0};
};

struct OptimizationReport {
    int total_simulations{0};
    int games_analyzed{0};
    std::optional<SimulationResult> baseline;
    std::optional<SimulationResult> best_by_win_pct;
    std::optional<SimulationResult> best_by_profit;
    std::optional<SimulationResult> best_by_volume;  // Most bets at or above break-even
    std::vector<SimulationResult> top;
};

/**
 * @brief Grid search over SimulationParams
 *
 * Every trial is an independent backtest with its own RatingStore, so trials run
 * concurrently in batches of max_parallel_trials.
 */
class ParameterOptimizer {
public:
    ParameterOptimizer(SportProfile profile, OptimizerConfig config);

    /**
     * @brief Evaluate every configuration in the space
     * @param baseline Configuration evaluated first and reported separately
     * @param space Grids applied on top of the baseline
     */
    Result<OptimizationReport> optimize(const std::vector<Game>& games,
                                        const std::vector<Team>& teams,
                                        const backtest::LineMap& lines,
                                        const SimulationParams& baseline,
                                        const ParameterSpace& space) const;

    /**
     * @brief Run one trial
     */
    Result<SimulationResult> evaluate(const std::vector<Game>& games,
                                      const std::vector<Team>& teams,
                                      const backtest::LineMap& lines,
                                      const SimulationParams& params) const;

    /**
     * @brief Tally spread bets from a result log, counting only games whose unrounded
     *        predicted spread lies inside the params' window
     *
     * Bets graded against the model's own line are regraded on the unrounded spread;
     * market-line bets keep their outcome.
     */
    static SimulationResult score(const std::vector<BacktestResult>& results,
                                  const SimulationParams& params);

    /**
     * @brief Rank, filter and deduplicate finished trials
     */
    OptimizationReport rank(std::vector<SimulationResult> results,
                            const SimulationParams& baseline, int games_analyzed) const;

private:
    SportProfile profile_;
    OptimizerConfig config_;
};

nlohmann::json to_json(const SimulationResult& result);
nlohmann::json to_json(const OptimizationReport& report);

}  // namespace optimization
}  // namespace line_ngin
