// include/line_ngin/backtest/backtest_runner.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include "line_ngin/backtest/backtest_summary.hpp"
#include "line_ngin/core/config_base.hpp"
#include "line_ngin/core/error.hpp"
#include "line_ngin/core/simulation_params.hpp"
#include "line_ngin/core/sport_profile.hpp"
#include "line_ngin/core/types.hpp"
#include "line_ngin/grading/grading_engine.hpp"
#include "line_ngin/rating/rating_store.hpp"
#include "line_ngin/statistics/calibrator.hpp"

namespace line_ngin {
namespace backtest {

/**
 * @brief Market lines keyed by game id
 */
using LineMap = std::unordered_map<std::string, MarketLine>;

/**
 * @brief Configuration for one historical replay
 */
struct BacktestConfig : public ConfigBase {
    SportProfile profile;
    SimulationParams params;  // Model constants for this run, defaults to profile.model
    bool rolling_stats{true};  // false: use the season averages on the Team records
    SpreadLineMode spread_line_mode{SpreadLineMode::POLICY};

    // Configuration metadata
    std::string version{"1.0.0"};

    /**
     * @brief Config running a league's calibrated model
     */
    static BacktestConfig for_sport(Sport sport) {
        BacktestConfig config;
        config.profile = SportProfile::for_sport(sport);
        config.params = config.profile.model;
        return config;
    }

    Result<void> validate() const override;

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["profile"] = profile.to_json();
        j["params"] = params.to_json();
        j["rolling_stats"] = rolling_stats;
        j["spread_line_mode"] = to_string(spread_line_mode);
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("profile")) {
            profile.from_json(j.at("profile"));
            params = profile.model;
        }
        if (j.contains("params"))
            params.from_json(j.at("params"));
        if (j.contains("rolling_stats"))
            rolling_stats = j.at("rolling_stats").get<bool>();
        if (j.contains("spread_line_mode")) {
            auto mode = spread_line_mode_from_string(j.at("spread_line_mode").get<std::string>());
            if (!mode) {
                throw std::invalid_argument("Unknown spread line mode: " +
                                            j.at("spread_line_mode").get<std::string>());
            }
            spread_line_mode = *mode;
        }
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }
};

/**
 * @brief Output of one replay
 */
struct BacktestReport {
    std::vector<BacktestResult> results;  // Chronological
    BacktestSummary summary;
    RatingStore final_ratings;
    int games_replayed{0};  // Completed games that advanced the ratings
    int games_skipped{0};   // Not final or missing a score
    int ties_excluded{0};   // Tied finals in a sport without ties
};

/**
 * @brief Replays a season chronologically, predicting each game from strictly earlier games
 *
 * Games sharing a scheduled time form a slate: every game of the slate is predicted from
 * the ratings before it, then the slate's results are applied in game id order.
 * Each call owns its RatingStore; nothing is shared between runs, so runs may execute
 * concurrently on the same inputs.
 */
class BacktestRunner {
public:
    explicit BacktestRunner(BacktestConfig config);

    /**
     * @brief Run the replay
     * @param games Historical games in any order
     * @param teams Team records (abbreviations, season averages for the static mode)
     * @param lines Market lines by game id; games without an entry follow the missing-line policy
     * @param initial_ratings Ratings carried over from a prior season, if any
     * @return Report, or an error for an invalid config or malformed game
     */
    Result<BacktestReport> run(const std::vector<Game>& games, const std::vector<Team>& teams,
                               const LineMap& lines,
                               const std::optional<RatingStore>& initial_ratings =
                                   std::nullopt) const;

    /**
     * @brief Ratings-only pass collecting pre-game (rating_diff, margin) pairs
     */
    Result<std::vector<statistics::RatingSample>> collect_rating_samples(
        const std::vector<Game>& games) const;

    /**
     * @brief Games ordered by scheduled time, ties broken by game id
     */
    static std::vector<Game> sort_chronologically(const std::vector<Game>& games);

    const BacktestConfig& config() const {
        return config_;
    }

private:
    BacktestConfig config_;

    Result<void> check_game(const Game& game) const;
};

}  // namespace backtest
}  // namespace line_ngin
