#include "line_ngin/core/sport_profile.hpp"
#include <stdexcept>

namespace line_ngin {

namespace {

nlohmann::json tiers_to_json(const TierThresholds& t) {
    return nlohmann::json{{"high", t.high}, {"medium", t.medium}};
}

void tiers_from_json(const nlohmann::json& j, TierThresholds& t) {
    if (j.contains("high")) t.high = j.at("high").get<double>();
    if (j.contains("medium")) t.medium = j.at("medium").get<double>();
}

MissingLinePolicy policy_from_string(const std::string& s) {
    if (s == "skip") return MissingLinePolicy::SKIP;
    if (s == "fallback") return MissingLinePolicy::FALLBACK;
    throw std::invalid_argument("Unknown missing line policy: " + s);
}

}  // namespace

std::string to_string(MissingLinePolicy policy) {
    return policy == MissingLinePolicy::SKIP ? "skip" : "fallback";
}

SportProfile SportProfile::for_sport(Sport sport) {
    SportProfile p;
    p.sport = sport;

    switch (sport) {
        case Sport::NFL:
            p.league_average_points = 22.0;
            p.total_baseline = 44.0;
            p.line_granularity = 0.5;
            p.allows_ties = true;
            p.spread_missing_line = MissingLinePolicy::FALLBACK;
            p.total_missing_line = MissingLinePolicy::FALLBACK;
            p.spread_tiers = {3.0, 1.5};
            p.total_tiers = {3.0, 1.5};
            p.moneyline_tiers = {15.0, 7.0};
            p.high_conviction_spread_edge = 3.0;
            // Calibrated on 227 games: 100 rating = 5.93 points, home field 2.28
            p.model = SimulationParams(5.93, 2.28, 0.55, 4.0, 0.0, 20.0, 0.3, 1.5);
            break;

        case Sport::NBA:
            p.league_average_points = 112.0;
            p.total_baseline = 224.0;
            p.line_granularity = 0.1;
            p.allows_ties = false;
            p.spread_missing_line = MissingLinePolicy::SKIP;
            p.total_missing_line = MissingLinePolicy::FALLBACK;
            p.spread_tiers = {2.5, 1.0};
            p.total_tiers = {5.0, 2.0};
            p.moneyline_tiers = {15.0, 7.0};
            p.high_conviction_spread_edge = 2.0;
            p.model = SimulationParams(4.0, 3.0, 0.55, 20.0, 0.0, 30.0, 0.3, 0.0);
            break;

        case Sport::NHL:
            p.league_average_points = 3.1;
            p.total_baseline = 6.2;
            p.line_granularity = 0.5;
            p.allows_ties = false;  // Shootouts decide every game
            p.spread_missing_line = MissingLinePolicy::SKIP;
            p.total_missing_line = MissingLinePolicy::SKIP;
            p.spread_tiers = {0.5, 0.2};
            p.total_tiers = {0.5, 0.2};
            p.moneyline_tiers = {12.0, 5.0};
            p.high_conviction_spread_edge = 1.5;
            p.model = SimulationParams(1.8, 0.25, 0.15, 3.0, 0.0, 5.0, 0.3, 0.0);
            break;

        case Sport::CBB:
            p.league_average_points = 72.0;
            p.total_baseline = 144.0;
            p.line_granularity = 0.1;
            p.allows_ties = false;
            p.spread_missing_line = MissingLinePolicy::SKIP;
            p.total_missing_line = MissingLinePolicy::FALLBACK;
            p.spread_tiers = {3.0, 1.5};
            p.total_tiers = {5.0, 3.0};
            p.moneyline_tiers = {15.0, 7.0};
            p.high_conviction_spread_edge = 3.0;
            p.model = SimulationParams(6.0, 4.5, 0.4, 20.0, 0.0, 40.0, 0.3, 0.0);
            break;
    }

    return p;
}

Result<void> SportProfile::validate() const {
    if (league_average_points <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "league_average_points must be positive", "SportProfile");
    }
    if (score_granularity <= 0.0 || line_granularity <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Granularities must be positive",
                                "SportProfile");
    }
    if (k_factor <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "k_factor must be positive",
                                "SportProfile");
    }
    if (total_missing_line == MissingLinePolicy::FALLBACK && total_baseline <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "total_baseline must be positive when totals fall back to it",
                                "SportProfile");
    }
    for (const auto* t : {&spread_tiers, &total_tiers, &moneyline_tiers}) {
        if (t->medium < 0.0 || t->high < t->medium) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Tier thresholds must satisfy 0 <= medium <= high",
                                    "SportProfile");
        }
    }
    return model.validate();
}

nlohmann::json SportProfile::to_json() const {
    nlohmann::json j;
    j["sport"] = to_string(sport);
    j["league_average_points"] = league_average_points;
    j["total_baseline"] = total_baseline;
    j["score_granularity"] = score_granularity;
    j["line_granularity"] = line_granularity;
    j["allows_ties"] = allows_ties;
    j["initial_rating"] = initial_rating;
    j["k_factor"] = k_factor;
    j["rating_home_advantage"] = rating_home_advantage;
    j["probability_home_advantage"] = probability_home_advantage;
    j["margin_of_victory_scaling"] = margin_of_victory_scaling;
    j["round_ratings"] = round_ratings;
    j["spread_missing_line"] = to_string(spread_missing_line);
    j["total_missing_line"] = to_string(total_missing_line);
    j["spread_tiers"] = tiers_to_json(spread_tiers);
    j["total_tiers"] = tiers_to_json(total_tiers);
    j["moneyline_tiers"] = tiers_to_json(moneyline_tiers);
    j["high_conviction_spread_edge"] = high_conviction_spread_edge;
    j["model"] = model.to_json();
    j["version"] = version;
    return j;
}

void SportProfile::from_json(const nlohmann::json& j) {
    // A sport key resets every constant to that league's calibrated values first
    if (j.contains("sport")) {
        auto parsed = sport_from_string(j.at("sport").get<std::string>());
        if (!parsed) {
            throw std::invalid_argument("Unknown sport: " + j.at("sport").get<std::string>());
        }
        *this = for_sport(*parsed);
    }
    if (j.contains("league_average_points"))
        league_average_points = j.at("league_average_points").get<double>();
    if (j.contains("total_baseline")) total_baseline = j.at("total_baseline").get<double>();
    if (j.contains("score_granularity"))
        score_granularity = j.at("score_granularity").get<double>();
    if (j.contains("line_granularity")) line_granularity = j.at("line_granularity").get<double>();
    if (j.contains("allows_ties")) allows_ties = j.at("allows_ties").get<bool>();
    if (j.contains("initial_rating")) initial_rating = j.at("initial_rating").get<double>();
    if (j.contains("k_factor")) k_factor = j.at("k_factor").get<double>();
    if (j.contains("rating_home_advantage"))
        rating_home_advantage = j.at("rating_home_advantage").get<double>();
    if (j.contains("probability_home_advantage"))
        probability_home_advantage = j.at("probability_home_advantage").get<double>();
    if (j.contains("margin_of_victory_scaling"))
        margin_of_victory_scaling = j.at("margin_of_victory_scaling").get<bool>();
    if (j.contains("round_ratings")) round_ratings = j.at("round_ratings").get<bool>();
    if (j.contains("spread_missing_line"))
        spread_missing_line = policy_from_string(j.at("spread_missing_line").get<std::string>());
    if (j.contains("total_missing_line"))
        total_missing_line = policy_from_string(j.at("total_missing_line").get<std::string>());
    if (j.contains("spread_tiers")) tiers_from_json(j.at("spread_tiers"), spread_tiers);
    if (j.contains("total_tiers")) tiers_from_json(j.at("total_tiers"), total_tiers);
    if (j.contains("moneyline_tiers")) tiers_from_json(j.at("moneyline_tiers"), moneyline_tiers);
    if (j.contains("high_conviction_spread_edge"))
        high_conviction_spread_edge = j.at("high_conviction_spread_edge").get<double>();
    if (j.contains("model")) model.from_json(j.at("model"));
    if (j.contains("version")) version = j.at("version").get<std::string>();
}

}  // namespace line_ngin
