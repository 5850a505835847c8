#include "line_ngin/data/record_codec.hpp"
#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include "line_ngin/core/time_utils.hpp"

namespace line_ngin {
namespace codec {

namespace {

using nlohmann::json;

class SchemaError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void expect_schema(const json& j, const std::string& record,
                   std::initializer_list<const char*> required,
                   std::initializer_list<const char*> optional) {
    if (!j.is_object()) {
        throw SchemaError(record + " must be a JSON object");
    }
    auto listed = [](std::initializer_list<const char*> keys, const std::string& key) {
        return std::any_of(keys.begin(), keys.end(),
                           [&](const char* k) { return key == k; });
    };
    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        if (key == "record") {
            if (!it.value().is_string() || it.value().get<std::string>() != record) {
                throw SchemaError("Expected a " + record + " record");
            }
            continue;
        }
        if (!listed(required, key) && !listed(optional, key)) {
            throw SchemaError(record + ": unknown field '" + key + "'");
        }
    }
    for (const char* key : required) {
        if (!j.contains(key)) {
            throw SchemaError(record + ": missing required field '" + key + "'");
        }
    }
}

bool present(const json& j, const char* key) {
    return j.contains(key) && !j.at(key).is_null();
}

std::string read_string(const json& j, const char* key, const std::string& record) {
    const json& v = j.at(key);
    if (!v.is_string()) {
        throw SchemaError(record + "." + key + " must be a string");
    }
    return v.get<std::string>();
}

int read_int(const json& j, const char* key, const std::string& record) {
    const json& v = j.at(key);
    if (!v.is_number_integer()) {
        throw SchemaError(record + "." + key + " must be an integer");
    }
    bool in_range = false;
    if (v.is_number_unsigned()) {
        in_range = v.get<std::uint64_t>() <=
                   static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    } else {
        const std::int64_t wide = v.get<std::int64_t>();
        in_range = wide >= std::numeric_limits<int>::min() &&
                   wide <= std::numeric_limits<int>::max();
    }
    if (!in_range) {
        throw SchemaError(record + "." + key + " is out of range");
    }
    return static_cast<int>(v.get<std::int64_t>());
}

// Scores and game counts
int read_count(const json& j, const char* key, const std::string& record) {
    int value = read_int(j, key, record);
    if (value < 0) {
        throw SchemaError(record + "." + key + " cannot be negative");
    }
    return value;
}

double read_double(const json& j, const char* key, const std::string& record) {
    const json& v = j.at(key);
    if (!v.is_number()) {
        throw SchemaError(record + "." + key + " must be a number");
    }
    return v.get<double>();
}

bool read_bool(const json& j, const char* key, const std::string& record) {
    const json& v = j.at(key);
    if (!v.is_boolean()) {
        throw SchemaError(record + "." + key + " must be a boolean");
    }
    return v.get<bool>();
}

std::optional<int> read_optional_count(const json& j, const char* key,
                                       const std::string& record) {
    return present(j, key) ? std::optional<int>(read_count(j, key, record)) : std::nullopt;
}

std::optional<double> read_optional_double(const json& j, const char* key,
                                           const std::string& record) {
    return present(j, key) ? std::optional<double>(read_double(j, key, record)) : std::nullopt;
}

Timestamp read_time(const json& j, const char* key, const std::string& record) {
    auto parsed = core::parse_iso8601(read_string(j, key, record));
    if (!parsed) {
        throw SchemaError(record + "." + key + " is not an ISO-8601 timestamp");
    }
    return *parsed;
}

std::optional<Timestamp> read_optional_time(const json& j, const char* key,
                                            const std::string& record) {
    return present(j, key) ? std::optional<Timestamp>(read_time(j, key, record)) : std::nullopt;
}

template <typename E>
E read_enum(const json& j, const char* key, const std::string& record,
            std::optional<E> (*parse)(const std::string&)) {
    std::string text = read_string(j, key, record);
    auto value = parse(text);
    if (!value) {
        throw SchemaError(record + "." + key + ": unknown value '" + text + "'");
    }
    return *value;
}

template <typename T>
json optional_value(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

json optional_time(const std::optional<Timestamp>& value) {
    return value ? json(core::to_iso8601(*value)) : json(nullptr);
}

template <typename T, typename Fn>
Result<T> decode_with(const std::string& record, Fn&& fn) {
    try {
        return fn();
    } catch (const SchemaError& e) {
        return make_error<T>(ErrorCode::INVALID_DATA, e.what(), "RecordCodec");
    } catch (const json::exception& e) {
        return make_error<T>(ErrorCode::INVALID_DATA, record + ": " + e.what(), "RecordCodec");
    }
}

// ========== Throwing decoders ==========

Team team_from(const json& j) {
    const std::string record = "team";
    expect_schema(j, record, {"id"},
                  {"abbreviation", "rating", "points_scored_avg", "points_allowed_avg",
                   "games_played"});
    Team team;
    team.id = read_string(j, "id", record);
    if (present(j, "abbreviation")) team.abbreviation = read_string(j, "abbreviation", record);
    if (present(j, "rating")) team.rating = read_double(j, "rating", record);
    if (present(j, "points_scored_avg"))
        team.points_scored_avg = read_double(j, "points_scored_avg", record);
    if (present(j, "points_allowed_avg"))
        team.points_allowed_avg = read_double(j, "points_allowed_avg", record);
    if (present(j, "games_played")) team.games_played = read_count(j, "games_played", record);
    return team;
}

Game game_from(const json& j) {
    const std::string record = "game";
    expect_schema(j, record, {"id", "home_team_id", "away_team_id", "scheduled_time", "status"},
                  {"home_score", "away_score", "weather_impact"});
    Game game;
    game.id = read_string(j, "id", record);
    game.home_team_id = read_string(j, "home_team_id", record);
    game.away_team_id = read_string(j, "away_team_id", record);
    game.scheduled_time = read_time(j, "scheduled_time", record);
    game.status = read_enum<GameStatus>(j, "status", record, game_status_from_string);
    game.home_score = read_optional_count(j, "home_score", record);
    game.away_score = read_optional_count(j, "away_score", record);
    game.weather_impact = read_optional_double(j, "weather_impact", record);
    if (game.status == GameStatus::FINAL && (!game.home_score || !game.away_score)) {
        throw SchemaError("game " + game.id + " is final without both scores");
    }
    return game;
}

MarketLine market_line_from(const json& j) {
    const std::string record = "market_line";
    expect_schema(j, record, {"game_id", "captured_at"},
                  {"spread", "total", "locked_at", "opening_spread", "opening_total",
                   "closing_spread", "closing_total"});
    MarketLine line;
    line.game_id = read_string(j, "game_id", record);
    line.captured_at = read_time(j, "captured_at", record);
    line.spread = read_optional_double(j, "spread", record);
    line.total = read_optional_double(j, "total", record);
    line.locked_at = read_optional_time(j, "locked_at", record);
    line.opening_spread = read_optional_double(j, "opening_spread", record);
    line.opening_total = read_optional_double(j, "opening_total", record);
    line.closing_spread = read_optional_double(j, "closing_spread", record);
    line.closing_total = read_optional_double(j, "closing_total", record);
    return line;
}

ConfidenceTiers confidence_from(const json& j) {
    const std::string record = "confidence";
    expect_schema(j, record,
                  {"spread", "total", "moneyline", "spread_edge", "total_edge", "moneyline_edge"},
                  {});
    ConfidenceTiers tiers;
    tiers.spread = read_enum<ConfidenceTier>(j, "spread", record, confidence_tier_from_string);
    tiers.total = read_enum<ConfidenceTier>(j, "total", record, confidence_tier_from_string);
    tiers.moneyline =
        read_enum<ConfidenceTier>(j, "moneyline", record, confidence_tier_from_string);
    tiers.spread_edge = read_double(j, "spread_edge", record);
    tiers.total_edge = read_double(j, "total_edge", record);
    tiers.moneyline_edge = read_double(j, "moneyline_edge", record);
    return tiers;
}

PredictionRecord prediction_from(const json& j) {
    const std::string record = "prediction";
    expect_schema(j, record,
                  {"game_id", "home_score", "away_score", "spread", "total",
                   "home_win_probability"},
                  {"raw_spread", "confidence"});
    PredictionRecord prediction;
    prediction.game_id = read_string(j, "game_id", record);
    prediction.home_score = read_double(j, "home_score", record);
    prediction.away_score = read_double(j, "away_score", record);
    prediction.spread = read_double(j, "spread", record);
    prediction.raw_spread = present(j, "raw_spread") ? read_double(j, "raw_spread", record)
                                                     : prediction.spread;
    prediction.total = read_double(j, "total", record);
    prediction.home_win_probability = read_double(j, "home_win_probability", record);
    if (prediction.home_win_probability < 0.0 || prediction.home_win_probability > 1.0) {
        throw SchemaError("prediction.home_win_probability must be within [0, 1]");
    }
    if (present(j, "confidence")) prediction.confidence = confidence_from(j.at("confidence"));
    return prediction;
}

GradedBet graded_bet_from(const json& j) {
    const std::string record = "graded_bet";
    expect_schema(j, record, {"market", "pick", "line", "source", "outcome"}, {});
    GradedBet bet;
    bet.market = read_enum<Market>(j, "market", record, market_from_string);
    bet.pick = read_enum<Pick>(j, "pick", record, pick_from_string);
    bet.line = read_double(j, "line", record);
    bet.source = read_enum<LineSource>(j, "source", record, line_source_from_string);
    bet.outcome = read_enum<Outcome>(j, "outcome", record, outcome_from_string);
    return bet;
}

std::optional<GradedBet> optional_bet_from(const json& j, const char* key, Market expected) {
    if (!present(j, key)) {
        return std::nullopt;
    }
    GradedBet bet = graded_bet_from(j.at(key));
    if (bet.market != expected) {
        throw SchemaError(std::string("backtest_result.") + key + " holds a " +
                          to_string(bet.market) + " bet");
    }
    return bet;
}

BacktestResult backtest_result_from(const json& j) {
    const std::string record = "backtest_result";
    expect_schema(j, record,
                  {"game_id", "scheduled_time", "home_team_id", "away_team_id", "home_rating",
                   "away_rating", "prediction", "actual_home_score", "actual_away_score"},
                  {"home_abbreviation", "away_abbreviation", "market_line", "actual_spread",
                   "actual_total", "spread", "moneyline", "total", "is_high_conviction"});
    BacktestResult result;
    result.game_id = read_string(j, "game_id", record);
    result.scheduled_time = read_time(j, "scheduled_time", record);
    result.home_team_id = read_string(j, "home_team_id", record);
    result.away_team_id = read_string(j, "away_team_id", record);
    if (present(j, "home_abbreviation"))
        result.home_abbreviation = read_string(j, "home_abbreviation", record);
    if (present(j, "away_abbreviation"))
        result.away_abbreviation = read_string(j, "away_abbreviation", record);
    result.home_rating = read_double(j, "home_rating", record);
    result.away_rating = read_double(j, "away_rating", record);
    result.prediction = prediction_from(j.at("prediction"));
    if (present(j, "market_line")) result.market_line = market_line_from(j.at("market_line"));
    result.actual_home_score = read_count(j, "actual_home_score", record);
    result.actual_away_score = read_count(j, "actual_away_score", record);

    // Derived values are written for readers; they must agree with the scores
    if (present(j, "actual_spread") &&
        read_int(j, "actual_spread", record) != result.actual_spread()) {
        throw SchemaError("backtest_result.actual_spread does not match the scores");
    }
    if (present(j, "actual_total") &&
        read_int(j, "actual_total", record) != result.actual_total()) {
        throw SchemaError("backtest_result.actual_total does not match the scores");
    }

    result.spread = optional_bet_from(j, "spread", Market::SPREAD);
    result.moneyline = optional_bet_from(j, "moneyline", Market::MONEYLINE);
    result.total = optional_bet_from(j, "total", Market::TOTAL);
    if (present(j, "is_high_conviction"))
        result.is_high_conviction = read_bool(j, "is_high_conviction", record);
    return result;
}

json encode_confidence(const ConfidenceTiers& tiers) {
    return json{{"spread", to_string(tiers.spread)},
                {"total", to_string(tiers.total)},
                {"moneyline", to_string(tiers.moneyline)},
                {"spread_edge", tiers.spread_edge},
                {"total_edge", tiers.total_edge},
                {"moneyline_edge", tiers.moneyline_edge}};
}

json optional_bet(const std::optional<GradedBet>& bet) {
    return bet ? encode(*bet) : json(nullptr);
}

}  // namespace

// ========== Encoders ==========

json encode(const Team& team) {
    json j;
    j["record"] = "team";
    j["id"] = team.id;
    j["abbreviation"] = team.abbreviation;
    j["rating"] = team.rating;
    j["points_scored_avg"] = team.points_scored_avg;
    j["points_allowed_avg"] = team.points_allowed_avg;
    j["games_played"] = team.games_played;
    return j;
}

json encode(const Game& game) {
    json j;
    j["record"] = "game";
    j["id"] = game.id;
    j["home_team_id"] = game.home_team_id;
    j["away_team_id"] = game.away_team_id;
    j["scheduled_time"] = core::to_iso8601(game.scheduled_time);
    j["status"] = to_string(game.status);
    j["home_score"] = optional_value(game.home_score);
    j["away_score"] = optional_value(game.away_score);
    j["weather_impact"] = optional_value(game.weather_impact);
    return j;
}

json encode(const MarketLine& line) {
    json j;
    j["record"] = "market_line";
    j["game_id"] = line.game_id;
    j["captured_at"] = core::to_iso8601(line.captured_at);
    j["spread"] = optional_value(line.spread);
    j["total"] = optional_value(line.total);
    j["locked_at"] = optional_time(line.locked_at);
    j["opening_spread"] = optional_value(line.opening_spread);
    j["opening_total"] = optional_value(line.opening_total);
    j["closing_spread"] = optional_value(line.closing_spread);
    j["closing_total"] = optional_value(line.closing_total);
    return j;
}

json encode(const PredictionRecord& prediction) {
    json j;
    j["record"] = "prediction";
    j["game_id"] = prediction.game_id;
    j["home_score"] = prediction.home_score;
    j["away_score"] = prediction.away_score;
    j["spread"] = prediction.spread;
    j["raw_spread"] = prediction.raw_spread;
    j["total"] = prediction.total;
    j["home_win_probability"] = prediction.home_win_probability;
    j["confidence"] = encode_confidence(prediction.confidence);
    return j;
}

json encode(const GradedBet& bet) {
    json j;
    j["record"] = "graded_bet";
    j["market"] = to_string(bet.market);
    j["pick"] = to_string(bet.pick);
    j["line"] = bet.line;
    j["source"] = to_string(bet.source);
    j["outcome"] = to_string(bet.outcome);
    return j;
}

json encode(const BacktestResult& result) {
    json j;
    j["record"] = "backtest_result";
    j["game_id"] = result.game_id;
    j["scheduled_time"] = core::to_iso8601(result.scheduled_time);
    j["home_team_id"] = result.home_team_id;
    j["away_team_id"] = result.away_team_id;
    j["home_abbreviation"] = result.home_abbreviation;
    j["away_abbreviation"] = result.away_abbreviation;
    j["home_rating"] = result.home_rating;
    j["away_rating"] = result.away_rating;
    j["prediction"] = encode(result.prediction);
    j["market_line"] = result.market_line ? encode(*result.market_line) : json(nullptr);
    j["actual_home_score"] = result.actual_home_score;
    j["actual_away_score"] = result.actual_away_score;
    j["actual_spread"] = result.actual_spread();
    j["actual_total"] = result.actual_total();
    j["spread"] = optional_bet(result.spread);
    j["moneyline"] = optional_bet(result.moneyline);
    j["total"] = optional_bet(result.total);
    j["is_high_conviction"] = result.is_high_conviction;
    return j;
}

// ========== Decoders ==========

Result<Team> decode_team(const json& j) {
    return decode_with<Team>("team", [&] { return team_from(j); });
}

Result<Game> decode_game(const json& j) {
    return decode_with<Game>("game", [&] { return game_from(j); });
}

Result<MarketLine> decode_market_line(const json& j) {
    return decode_with<MarketLine>("market_line", [&] { return market_line_from(j); });
}

Result<PredictionRecord> decode_prediction(const json& j) {
    return decode_with<PredictionRecord>("prediction", [&] { return prediction_from(j); });
}

Result<GradedBet> decode_graded_bet(const json& j) {
    return decode_with<GradedBet>("graded_bet", [&] { return graded_bet_from(j); });
}

Result<BacktestResult> decode_backtest_result(const json& j) {
    return decode_with<BacktestResult>("backtest_result",
                                       [&] { return backtest_result_from(j); });
}

}  // namespace codec
}  // namespace line_ngin
