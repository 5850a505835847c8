#include "line_ngin/backtest/backtest_runner.hpp"
#include <algorithm>
#include "line_ngin/core/logger.hpp"
#include "line_ngin/prediction/confidence_tier.hpp"
#include "line_ngin/prediction/score_predictor.hpp"
#include "line_ngin/rating/rating_updater.hpp"

namespace line_ngin {
namespace backtest {

namespace {

// One past the last game sharing ordered[begin]'s scheduled time
size_t slate_end(const std::vector<Game>& ordered, size_t begin) {
    size_t end = begin;
    while (end < ordered.size() && ordered[end].scheduled_time == ordered[begin].scheduled_time) {
        ++end;
    }
    return end;
}

}  // namespace

Result<void> BacktestConfig::validate() const {
    auto profile_result = profile.validate();
    if (profile_result.is_error()) {
        return forward_error<void>(*profile_result.error(), "BacktestConfig");
    }
    auto params_result = params.validate();
    if (params_result.is_error()) {
        return forward_error<void>(*params_result.error(), "BacktestConfig");
    }
    return Result<void>();
}

BacktestRunner::BacktestRunner(BacktestConfig config) : config_(std::move(config)) {}

std::vector<Game> BacktestRunner::sort_chronologically(const std::vector<Game>& games) {
    std::vector<Game> sorted = games;
    std::sort(sorted.begin(), sorted.end(), [](const Game& a, const Game& b) {
        if (a.scheduled_time != b.scheduled_time) {
            return a.scheduled_time < b.scheduled_time;
        }
        return a.id < b.id;
    });
    return sorted;
}

Result<void> BacktestRunner::check_game(const Game& game) const {
    if (game.home_team_id.empty() || game.away_team_id.empty()) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "Game " + game.id + " is missing a team id", "BacktestRunner");
    }
    if (game.home_team_id == game.away_team_id) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "Game " + game.id + " has the same team on both sides",
                                "BacktestRunner");
    }
    return Result<void>();
}

Result<BacktestReport> BacktestRunner::run(const std::vector<Game>& games,
                                           const std::vector<Team>& teams, const LineMap& lines,
                                           const std::optional<RatingStore>& initial_ratings) const {
    Logger::register_component("BacktestRunner");

    auto valid = config_.validate();
    if (valid.is_error()) {
        return forward_error<BacktestReport>(*valid.error(), "BacktestRunner");
    }

    const SportProfile& profile = config_.profile;
    ScorePredictor predictor(profile, config_.params);
    RatingUpdater updater(profile);
    GradingEngine grader(profile);
    ConfidenceTiering tiering(profile);
    BacktestSummaryCalculator calculator;

    std::unordered_map<TeamId, const Team*> team_index;
    for (const auto& team : teams) {
        team_index[team.id] = &team;
    }

    auto inputs_for = [&](const TeamId& team_id, const RatingStore& store) {
        TeamInputs inputs;
        inputs.rating = store.get(team_id);
        if (config_.rolling_stats) {
            TeamStats stats = store.get_stats(team_id);
            inputs.points_scored_avg = stats.points_scored_avg();
            inputs.points_allowed_avg = stats.points_allowed_avg();
        } else {
            auto it = team_index.find(team_id);
            if (it != team_index.end()) {
                inputs.points_scored_avg = it->second->points_scored_avg;
                inputs.points_allowed_avg = it->second->points_allowed_avg;
            }
        }
        return inputs;
    };

    auto abbreviation_for = [&](const TeamId& team_id) {
        auto it = team_index.find(team_id);
        if (it == team_index.end() || it->second->abbreviation.empty()) {
            return team_id;
        }
        return it->second->abbreviation;
    };

    BacktestReport report;
    report.final_ratings = initial_ratings ? *initial_ratings : RatingStore(profile.initial_rating);
    RatingStore& store = report.final_ratings;

    DEBUG("Starting " << to_string(profile.sport) << " backtest over " << games.size()
                      << " games");

    const std::vector<Game> ordered = sort_chronologically(games);
    for (size_t begin = 0; begin < ordered.size();) {
        const size_t end = slate_end(ordered, begin);
        std::vector<const Game*> finished;

        for (size_t i = begin; i < end; ++i) {
            const Game& game = ordered[i];
            if (!game.is_completed()) {
                report.games_skipped++;
                DEBUG("Skipping game " << game.id << ": not final");
                continue;
            }
            auto checked = check_game(game);
            if (checked.is_error()) {
                return forward_error<BacktestReport>(*checked.error(), "BacktestRunner");
            }
            finished.push_back(&game);

            const int home_score = *game.home_score;
            const int away_score = *game.away_score;

            if (home_score == away_score && !profile.allows_ties) {
                WARN("Game " << game.id
                             << " ended tied in a sport without ties; excluded from grading");
                report.ties_excluded++;
                continue;
            }

            std::optional<MarketLine> line;
            auto line_it = lines.find(game.id);
            if (line_it != lines.end()) {
                line = line_it->second;
            }

            TeamInputs home = inputs_for(game.home_team_id, store);
            TeamInputs away = inputs_for(game.away_team_id, store);

            BacktestResult result;
            result.game_id = game.id;
            result.scheduled_time = game.scheduled_time;
            result.home_team_id = game.home_team_id;
            result.away_team_id = game.away_team_id;
            result.home_abbreviation = abbreviation_for(game.home_team_id);
            result.away_abbreviation = abbreviation_for(game.away_team_id);
            result.home_rating = home.rating;
            result.away_rating = away.rating;
            result.prediction = predictor.predict(game.id, home, away, game.weather_impact, line);
            result.market_line = line;
            result.actual_home_score = home_score;
            result.actual_away_score = away_score;
            result.spread = grader.grade_spread(result.prediction, line, home_score, away_score,
                                                config_.spread_line_mode);
            result.moneyline = grader.grade_moneyline(result.prediction, home_score, away_score);
            result.total = grader.grade_total(result.prediction, line, home_score, away_score);
            result.is_high_conviction = tiering.is_high_conviction(result.prediction, line);
            report.results.push_back(std::move(result));
        }

        // Ratings move only after every game of the slate has been predicted and graded
        for (const Game* game : finished) {
            auto updated = updater.apply(store, *game);
            if (updated.is_error()) {
                return forward_error<BacktestReport>(*updated.error(), "BacktestRunner");
            }
            report.games_replayed++;
        }
        begin = end;
    }

    report.summary = calculator.calculate(report.results);

    DEBUG("Backtest complete: " << report.games_replayed << " games replayed, "
                                << report.results.size() << " graded, " << report.games_skipped
                                << " skipped, " << report.ties_excluded << " ties excluded");
    return std::move(report);
}

Result<std::vector<statistics::RatingSample>> BacktestRunner::collect_rating_samples(
    const std::vector<Game>& games) const {
    Logger::register_component("BacktestRunner");

    RatingUpdater updater(config_.profile);
    RatingStore store(config_.profile.initial_rating);
    std::vector<statistics::RatingSample> samples;

    const std::vector<Game> ordered = sort_chronologically(games);
    for (size_t begin = 0; begin < ordered.size();) {
        const size_t end = slate_end(ordered, begin);
        std::vector<const Game*> finished;

        for (size_t i = begin; i < end; ++i) {
            const Game& game = ordered[i];
            if (!game.is_completed()) {
                continue;
            }
            auto checked = check_game(game);
            if (checked.is_error()) {
                return forward_error<std::vector<statistics::RatingSample>>(*checked.error(),
                                                                            "BacktestRunner");
            }

            statistics::RatingSample sample;
            sample.rating_diff = store.get(game.home_team_id) - store.get(game.away_team_id);
            sample.margin = *game.home_score - *game.away_score;
            samples.push_back(sample);
            finished.push_back(&game);
        }

        for (const Game* game : finished) {
            auto updated = updater.apply(store, *game);
            if (updated.is_error()) {
                return forward_error<std::vector<statistics::RatingSample>>(*updated.error(),
                                                                            "BacktestRunner");
            }
        }
        begin = end;
    }

    DEBUG("Collected " << samples.size() << " rating samples");
    return std::move(samples);
}

}  // namespace backtest
}  // namespace line_ngin
