// include/line_ngin/rating/rating_updater.hpp
#pragma once

#include "line_ngin/core/error.hpp"
#include "line_ngin/core/sport_profile.hpp"
#include "line_ngin/core/types.hpp"
#include "line_ngin/rating/rating_store.hpp"

namespace line_ngin {

/**
 * @brief Post-game ratings for both participants
 */
struct RatingUpdate {
    Rating home_rating{DEFAULT_RATING};
    Rating away_rating{DEFAULT_RATING};
    double home_expected{0.5};  // Pre-game expected score for the home side
    double k_applied{0.0};      // K after margin-of-victory scaling
};

/**
 * @brief Elo update after a completed game
 *
 * Expected home score = 1 / (1 + 10^((away - home - home_advantage) / 400)).
 * Both teams move by K * (actual - expected); with margin-of-victory scaling K is
 * multiplied by ln(|margin| + 1) * 0.7 + 0.8.
 */
class RatingUpdater {
public:
    explicit RatingUpdater(const SportProfile& profile);

    /**
     * @brief Logistic expected score of a side against an opponent
     * @param rating Rating of the side
     * @param opponent_rating Rating of the opponent
     * @param advantage Bonus added to the side's rating (rating units)
     */
    static double expected_score(Rating rating, Rating opponent_rating, double advantage = 0.0);

    /**
     * @brief K multiplier for a margin of victory (1 for a tie)
     */
    static double margin_multiplier(int margin);

    /**
     * @brief Compute new ratings without touching any store
     */
    RatingUpdate update(Rating home_rating, Rating away_rating, int home_score,
                        int away_score) const;

    /**
     * @brief Advance a store with a completed game
     *
     * Updates both ratings and both teams' rolling scoring totals.
     *
     * @return The applied update, or INVALID_ARGUMENT if the game has no final score
     */
    Result<RatingUpdate> apply(RatingStore& store, const Game& game) const;

private:
    double k_factor_;
    double home_advantage_;
    bool margin_scaling_;
    bool round_ratings_;
};

}  // namespace line_ngin
