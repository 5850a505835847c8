// src/optimization/parameter_optimizer.cpp
#include "line_ngin/optimization/parameter_optimizer.hpp"
#include <algorithm>
#include <cmath>
#include <future>
#include <stdexcept>
#include "line_ngin/backtest/backtest_summary.hpp"
#include "line_ngin/core/logger.hpp"

namespace line_ngin {
namespace optimization {

// ========== OptimizerConfig ==========

Result<void> OptimizerConfig::validate() const {
    if (min_sample_size < 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "min_sample_size cannot be negative", "OptimizerConfig");
    }
    if (top_n <= 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "top_n must be positive",
                                "OptimizerConfig");
    }
    if (max_parallel_trials <= 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "max_parallel_trials must be positive", "OptimizerConfig");
    }
    if (!std::isfinite(breakeven_win_pct) || breakeven_win_pct < 0.0 ||
        breakeven_win_pct > 100.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "breakeven_win_pct must be within [0, 100]", "OptimizerConfig");
    }
    for (const auto& t : duplicate_tolerances) {
        if (!std::isfinite(t.tolerance) || t.tolerance < 0.0) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Tolerance for " + to_string(t.field) +
                                        " must be non-negative",
                                    "OptimizerConfig");
        }
    }
    return Result<void>();
}

nlohmann::json OptimizerConfig::to_json() const {
    nlohmann::json j;
    j["min_sample_size"] = min_sample_size;
    j["top_n"] = top_n;
    j["max_parallel_trials"] = max_parallel_trials;
    j["breakeven_win_pct"] = breakeven_win_pct;
    nlohmann::json tolerances = nlohmann::json::array();
    for (const auto& t : duplicate_tolerances) {
        tolerances.push_back({{"field", to_string(t.field)}, {"tolerance", t.tolerance}});
    }
    j["duplicate_tolerances"] = tolerances;
    j["spread_line_mode"] = to_string(spread_line_mode);
    j["version"] = version;
    return j;
}

void OptimizerConfig::from_json(const nlohmann::json& j) {
    if (j.contains("min_sample_size")) min_sample_size = j.at("min_sample_size").get<int>();
    if (j.contains("top_n")) top_n = j.at("top_n").get<int>();
    if (j.contains("max_parallel_trials")) {
        max_parallel_trials = j.at("max_parallel_trials").get<int>();
    }
    if (j.contains("breakeven_win_pct")) {
        breakeven_win_pct = j.at("breakeven_win_pct").get<double>();
    }
    if (j.contains("duplicate_tolerances")) {
        duplicate_tolerances.clear();
        for (const auto& item : j.at("duplicate_tolerances")) {
            auto field = param_field_from_string(item.at("field").get<std::string>());
            if (!field) {
                throw std::invalid_argument("Unknown parameter field: " +
                                            item.at("field").get<std::string>());
            }
            duplicate_tolerances.push_back({*field, item.at("tolerance").get<double>()});
        }
    }
    if (j.contains("spread_line_mode")) {
        auto mode = spread_line_mode_from_string(j.at("spread_line_mode").get<std::string>());
        if (!mode) {
            throw std::invalid_argument("Unknown spread line mode: " +
                                        j.at("spread_line_mode").get<std::string>());
        }
        spread_line_mode = *mode;
    }
    if (j.contains("version")) version = j.at("version").get<std::string>();
}

// ========== ParameterOptimizer ==========

ParameterOptimizer::ParameterOptimizer(SportProfile profile, OptimizerConfig config)
    : profile_(std::move(profile)), config_(std::move(config)) {}

SimulationResult ParameterOptimizer::score(const std::vector<BacktestResult>& results,
                                           const SimulationParams& params) {
    SimulationResult sim;
    sim.params = params;
    sim.total_games = static_cast<int>(results.size());

    for (const auto& result : results) {
        if (!result.spread) {
            continue;
        }
        const double raw_spread = result.prediction.raw_spread;
        const double abs_spread = std::abs(raw_spread);
        if (abs_spread < params.min_spread || abs_spread > params.max_spread) {
            continue;
        }
        Outcome outcome = result.spread->outcome;
        if (result.spread->source == LineSource::MODEL) {
            outcome = GradingEngine::grade_spread_against(raw_spread, raw_spread,
                                                          LineSource::MODEL,
                                                          result.actual_home_score,
                                                          result.actual_away_score)
                          .outcome;
        }
        switch (outcome) {
            case Outcome::WIN:
                sim.wins++;
                break;
            case Outcome::LOSS:
                sim.losses++;
                break;
            case Outcome::PUSH:
                sim.pushes++;
                break;
        }
    }

    sim.total_graded = sim.wins + sim.losses + sim.pushes;
    sim.win_pct = backtest::BacktestSummaryCalculator::percentage(sim.wins, sim.wins + sim.losses);
    sim.profit = sim.wins * 100.0 - sim.losses * 110.0;
    return sim;
}

Result<SimulationResult> ParameterOptimizer::evaluate(const std::vector<Game>& games,
                                                      const std::vector<Team>& teams,
                                                      const backtest::LineMap& lines,
                                                      const SimulationParams& params) const {
    backtest::BacktestConfig bt_config;
    bt_config.profile = profile_;
    bt_config.params = params;
    bt_config.spread_line_mode = config_.spread_line_mode;

    backtest::BacktestRunner runner(bt_config);
    auto run_result = runner.run(games, teams, lines);
    if (run_result.is_error()) {
        return forward_error<SimulationResult>(*run_result.error(), "ParameterOptimizer");
    }
    return score(run_result.value().results, params);
}

Result<OptimizationReport> ParameterOptimizer::optimize(const std::vector<Game>& games,
                                                        const std::vector<Team>& teams,
                                                        const backtest::LineMap& lines,
                                                        const SimulationParams& baseline,
                                                        const ParameterSpace& space) const {
    Logger::register_component("ParameterOptimizer");

    auto valid = config_.validate();
    if (valid.is_error()) {
        return forward_error<OptimizationReport>(*valid.error(), "ParameterOptimizer");
    }

    auto expanded = space.expand(baseline);
    if (expanded.is_error()) {
        return forward_error<OptimizationReport>(*expanded.error(), "ParameterOptimizer");
    }
    const std::vector<SimulationParams>& trials = expanded.value();

    int games_analyzed = 0;
    for (const auto& game : games) {
        if (game.is_completed()) {
            games_analyzed++;
        }
    }

    INFO("Evaluating " << trials.size() << " configurations over " << games_analyzed
                       << " completed games");

    std::vector<SimulationResult> results;
    results.reserve(trials.size());
    const size_t batch_size = static_cast<size_t>(config_.max_parallel_trials);

    for (size_t start = 0; start < trials.size(); start += batch_size) {
        size_t end = std::min(start + batch_size, trials.size());

        std::vector<std::future<Result<SimulationResult>>> batch;
        batch.reserve(end - start);
        for (size_t i = start; i < end; ++i) {
            batch.push_back(std::async(std::launch::async, [this, &games, &teams, &lines,
                                                            &trials, i]() {
                return evaluate(games, teams, lines, trials[i]);
            }));
        }

        for (size_t k = 0; k < batch.size(); ++k) {
            Result<SimulationResult> trial = batch[k].get();
            if (trial.is_error()) {
                // Drain the rest of the batch before reporting
                for (size_t rest = k + 1; rest < batch.size(); ++rest) {
                    batch[rest].wait();
                }
                return forward_error<OptimizationReport>(*trial.error(), "ParameterOptimizer");
            }
            SimulationResult sim = trial.value();
            sim.trial_index = start + k;
            DEBUG("Trial " << sim.trial_index << ": " << sim.wins << "-" << sim.losses << "-"
                           << sim.pushes << ", profit " << sim.profit);
            results.push_back(sim);
        }
    }

    OptimizationReport report = rank(std::move(results), baseline, games_analyzed);
    INFO("Optimization complete: " << report.total_simulations << " simulations, "
                                   << report.top.size() << " distinct configurations ranked");
    return std::move(report);
}

OptimizationReport ParameterOptimizer::rank(std::vector<SimulationResult> results,
                                            const SimulationParams& baseline,
                                            int games_analyzed) const {
    OptimizationReport report;
    report.total_simulations = static_cast<int>(results.size());
    report.games_analyzed = games_analyzed;

    for (const auto& result : results) {
        if (result.params == baseline) {
            report.baseline = result;
            break;
        }
    }

    std::vector<SimulationResult> viable;
    for (const auto& result : results) {
        if (result.total_graded >= config_.min_sample_size) {
            viable.push_back(result);
        }
    }
    if (viable.empty()) {
        WARN("No configuration reached " << config_.min_sample_size << " graded bets");
        return report;
    }

    std::sort(viable.begin(), viable.end(),
              [](const SimulationResult& a, const SimulationResult& b) {
                  if (a.profit != b.profit) return a.profit > b.profit;
                  if (a.win_pct != b.win_pct) return a.win_pct > b.win_pct;
                  return a.trial_index < b.trial_index;
              });

    report.best_by_profit = viable.front();

    // First maximum wins, so equal win rates go to the more profitable configuration
    auto best_win = std::max_element(viable.begin(), viable.end(),
                                     [](const SimulationResult& a, const SimulationResult& b) {
                                         return a.win_pct < b.win_pct;
                                     });
    report.best_by_win_pct = *best_win;

    const SimulationResult* best_volume = nullptr;
    for (const auto& result : viable) {
        if (result.win_pct < config_.breakeven_win_pct) {
            continue;
        }
        if (!best_volume || result.total_graded > best_volume->total_graded) {
            best_volume = &result;
        }
    }
    if (best_volume) {
        report.best_by_volume = *best_volume;
    }

    NearDuplicateFilter filter(config_.duplicate_tolerances);
    for (const auto& result : viable) {
        if (static_cast<int>(report.top.size()) >= config_.top_n) {
            break;
        }
        bool duplicate = std::any_of(report.top.begin(), report.top.end(),
                                     [&](const SimulationResult& kept) {
                                         return filter.is_near_duplicate(kept.params,
                                                                         result.params);
                                     });
        if (!duplicate) {
            report.top.push_back(result);
        }
    }
    return report;
}

nlohmann::json to_json(const SimulationResult& result) {
    nlohmann::json j;
    j["params"] = result.params.to_json();
    j["wins"] = result.wins;
    j["losses"] = result.losses;
    j["pushes"] = result.pushes;
    j["total_graded"] = result.total_graded;
    j["total_games"] = result.total_games;
    j["win_pct"] = result.win_pct;
    j["profit"] = result.profit;
    return j;
}

nlohmann::json to_json(const OptimizationReport& report) {
    auto optional_result = [](const std::optional<SimulationResult>& r) {
        return r ? to_json(*r) : nlohmann::json(nullptr);
    };

    nlohmann::json j;
    j["total_simulations"] = report.total_simulations;
    j["games_analyzed"] = report.games_analyzed;
    j["baseline"] = optional_result(report.baseline);
    j["best_by_win_pct"] = optional_result(report.best_by_win_pct);
    j["best_by_profit"] = optional_result(report.best_by_profit);
    j["best_by_volume"] = optional_result(report.best_by_volume);
    j["top"] = nlohmann::json::array();
    for (const auto& result : report.top) {
        j["top"].push_back(to_json(result));
    }
    return j;
}

}  // namespace optimization
}  // namespace line_ngin
