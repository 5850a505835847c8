// include/line_ngin/core/sport_profile.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "line_ngin/core/config_base.hpp"
#include "line_ngin/core/error.hpp"
#include "line_ngin/core/simulation_params.hpp"
#include "line_ngin/core/types.hpp"

namespace line_ngin {

/**
 * @brief What the grader does for a market when no sportsbook line exists
 */
enum class MissingLinePolicy {
    FALLBACK,  // Spread: grade against the model's own line. Total: grade against total_baseline.
    SKIP       // Leave the market ungraded and out of every denominator
};

/**
 * @brief Edge thresholds mapping an edge to a confidence tier
 */
struct TierThresholds {
    double high{0.0};    // edge >= high -> HIGH
    double medium{0.0};  // edge >= medium -> MEDIUM, otherwise LOW
};

/**
 * @brief Per-sport constants shared by every component
 *
 * The same formulas serve all leagues; only these constants differ. for_sport()
 * returns the calibrated values the production model runs with.
 */
struct SportProfile : public ConfigBase {
    Sport sport{Sport::NFL};

    // Scoring environment
    double league_average_points{22.0};  // Per team per game
    double total_baseline{44.0};         // Combined points used when no market total exists
    double score_granularity{0.1};
    double line_granularity{0.5};
    bool allows_ties{true};

    // Rating model
    double initial_rating{DEFAULT_RATING};
    double k_factor{20.0};
    double rating_home_advantage{48.0};       // Rating units, used by the post-game update
    double probability_home_advantage{48.0};  // Rating units, used for win probability
    bool margin_of_victory_scaling{true};
    bool round_ratings{true};

    // Grading
    MissingLinePolicy spread_missing_line{MissingLinePolicy::FALLBACK};
    MissingLinePolicy total_missing_line{MissingLinePolicy::FALLBACK};

    // Confidence tiers
    TierThresholds spread_tiers{3.0, 1.5};
    TierThresholds total_tiers{3.0, 1.5};
    TierThresholds moneyline_tiers{15.0, 7.0};
    double high_conviction_spread_edge{3.0};

    // Calibrated point-spread model
    SimulationParams model;

    std::string version{"1.0.0"};

    /**
     * @brief Calibrated profile for a league
     */
    static SportProfile for_sport(Sport sport);

    /**
     * @brief Check the profile for unusable values
     */
    Result<void> validate() const override;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

std::string to_string(MissingLinePolicy policy);

}  // namespace line_ngin
