// include/line_ngin/prediction/score_predictor.hpp
#pragma once

#include <optional>
#include <string>
#include "line_ngin/core/simulation_params.hpp"
#include "line_ngin/core/sport_profile.hpp"
#include "line_ngin/core/types.hpp"
#include "line_ngin/prediction/confidence_tier.hpp"

namespace line_ngin {

/**
 * @brief Pre-game view of one team as seen by the predictor
 * Scoring averages of 0 or below mean "unknown" and fall back to the league average.
 */
struct TeamInputs {
    Rating rating{DEFAULT_RATING};
    double points_scored_avg{0.0};
    double points_allowed_avg{0.0};
};

/**
 * @brief Turns ratings and scoring tendencies into a predicted final score
 *
 * Deterministic and side-effect free; the same inputs always give the same record.
 */
class ScorePredictor {
public:
    ScorePredictor(const SportProfile& profile, const SimulationParams& params);

    /**
     * @brief Predict a game
     * @param game_id Id copied into the record
     * @param home Home team inputs
     * @param away Away team inputs
     * @param weather_impact Point-valued weather impact, outdoor games only
     * @param market_line Market line for confidence metadata, if any
     * @return Prediction record
     */
    PredictionRecord predict(const std::string& game_id, const TeamInputs& home,
                             const TeamInputs& away,
                             const std::optional<double>& weather_impact = std::nullopt,
                             const std::optional<MarketLine>& market_line = std::nullopt) const;

    /**
     * @brief Regress a scoring average toward the league average
     */
    double regress(double average) const;

    /**
     * @brief Points added to the home score (and removed from the away score)
     *        for a rating difference, after the cap
     */
    double rating_adjustment(Rating home_rating, Rating away_rating) const;

    double home_win_probability(Rating home_rating, Rating away_rating) const;

    static double round_to(double value, double granularity);

    const SimulationParams& params() const {
        return params_;
    }

private:
    double league_average_;
    double score_granularity_;
    double line_granularity_;
    double probability_home_advantage_;
    SimulationParams params_;
    ConfidenceTiering tiering_;
};

}  // namespace line_ngin
