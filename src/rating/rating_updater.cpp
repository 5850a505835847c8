#include "line_ngin/rating/rating_updater.hpp"
#include <cmath>
#include <cstdlib>

namespace line_ngin {

RatingUpdater::RatingUpdater(const SportProfile& profile)
    : k_factor_(profile.k_factor),
      home_advantage_(profile.rating_home_advantage),
      margin_scaling_(profile.margin_of_victory_scaling),
      round_ratings_(profile.round_ratings) {}

double RatingUpdater::expected_score(Rating rating, Rating opponent_rating, double advantage) {
    return 1.0 / (1.0 + std::pow(10.0, (opponent_rating - rating - advantage) / 400.0));
}

double RatingUpdater::margin_multiplier(int margin) {
    if (margin == 0) {
        return 1.0;
    }
    return std::log(std::abs(margin) + 1.0) * 0.7 + 0.8;
}

RatingUpdate RatingUpdater::update(Rating home_rating, Rating away_rating, int home_score,
                                   int away_score) const {
    RatingUpdate result;
    result.home_expected = expected_score(home_rating, away_rating, home_advantage_);
    double away_expected = 1.0 - result.home_expected;

    double home_actual = 0.5;
    if (home_score > away_score) {
        home_actual = 1.0;
    } else if (home_score < away_score) {
        home_actual = 0.0;
    }
    double away_actual = 1.0 - home_actual;

    double k = k_factor_;
    if (margin_scaling_) {
        k *= margin_multiplier(home_score - away_score);
    }
    result.k_applied = k;

    result.home_rating = home_rating + k * (home_actual - result.home_expected);
    result.away_rating = away_rating + k * (away_actual - away_expected);
    if (round_ratings_) {
        result.home_rating = std::round(result.home_rating);
        result.away_rating = std::round(result.away_rating);
    }
    return result;
}

Result<RatingUpdate> RatingUpdater::apply(RatingStore& store, const Game& game) const {
    if (!game.is_completed()) {
        return make_error<RatingUpdate>(ErrorCode::INVALID_ARGUMENT,
                                        "Game " + game.id + " has no final score",
                                        "RatingUpdater");
    }
    const int home_score = *game.home_score;
    const int away_score = *game.away_score;

    RatingUpdate result = update(store.get(game.home_team_id), store.get(game.away_team_id),
                                 home_score, away_score);
    store.set(game.home_team_id, result.home_rating);
    store.set(game.away_team_id, result.away_rating);

    TeamStats home_stats = store.get_stats(game.home_team_id);
    home_stats.points_scored += home_score;
    home_stats.points_allowed += away_score;
    home_stats.games_played++;
    store.set_stats(game.home_team_id, home_stats);

    TeamStats away_stats = store.get_stats(game.away_team_id);
    away_stats.points_scored += away_score;
    away_stats.points_allowed += home_score;
    away_stats.games_played++;
    store.set_stats(game.away_team_id, away_stats);

    return result;
}

}  // namespace line_ngin
