#include "line_ngin/prediction/score_predictor.hpp"
#include <algorithm>
#include <cmath>
#include "line_ngin/rating/rating_updater.hpp"

namespace line_ngin {

ScorePredictor::ScorePredictor(const SportProfile& profile, const SimulationParams& params)
    : league_average_(profile.league_average_points),
      score_granularity_(profile.score_granularity),
      line_granularity_(profile.line_granularity),
      probability_home_advantage_(profile.probability_home_advantage),
      params_(params),
      tiering_(profile) {}

double ScorePredictor::round_to(double value, double granularity) {
    if (granularity <= 0.0) {
        return value;
    }
    double rounded = std::round(value / granularity) * granularity;
    // Avoid -0 in records
    return rounded == 0.0 ? 0.0 : rounded;
}

double ScorePredictor::regress(double average) const {
    if (average <= 0.0) {
        return league_average_;
    }
    return average * (1.0 - params_.stats_regression) + league_average_ * params_.stats_regression;
}

double ScorePredictor::rating_adjustment(Rating home_rating, Rating away_rating) const {
    double adjustment = ((home_rating - away_rating) * params_.rating_to_points / 100.0) / 2.0;
    if (params_.rating_cap > 0.0) {
        double half_cap = params_.rating_cap / 2.0;
        adjustment = std::clamp(adjustment, -half_cap, half_cap);
    }
    return adjustment;
}

double ScorePredictor::home_win_probability(Rating home_rating, Rating away_rating) const {
    return RatingUpdater::expected_score(home_rating, away_rating, probability_home_advantage_);
}

PredictionRecord ScorePredictor::predict(const std::string& game_id, const TeamInputs& home,
                                         const TeamInputs& away,
                                         const std::optional<double>& weather_impact,
                                         const std::optional<MarketLine>& market_line) const {
    // Offense against the opponent's defense
    double home_base = (regress(home.points_scored_avg) + regress(away.points_allowed_avg)) / 2.0;
    double away_base = (regress(away.points_scored_avg) + regress(home.points_allowed_avg)) / 2.0;

    double adjustment = rating_adjustment(home.rating, away.rating);
    double home_score = home_base + adjustment + params_.home_advantage / 2.0;
    double away_score = away_base - adjustment - params_.home_advantage / 2.0;

    if (weather_impact) {
        double per_side = *weather_impact * params_.weather_coefficient / 2.0;
        home_score -= per_side;
        away_score -= per_side;
    }

    home_score = std::max(0.0, home_score);
    away_score = std::max(0.0, away_score);

    PredictionRecord record;
    record.game_id = game_id;
    record.raw_spread = (away_score - home_score) * (1.0 - params_.spread_shrinkage);
    record.home_score = round_to(home_score, score_granularity_);
    record.away_score = round_to(away_score, score_granularity_);

    double rounded_gap = record.away_score - record.home_score;
    record.spread = round_to(rounded_gap * (1.0 - params_.spread_shrinkage), line_granularity_);
    record.total = round_to(record.home_score + record.away_score, line_granularity_);
    record.home_win_probability = home_win_probability(home.rating, away.rating);
    record.confidence = tiering_.evaluate(record.spread, record.total,
                                          record.home_win_probability, market_line);
    return record;
}

}  // namespace line_ngin
