// include/line_ngin/data/record_codec.hpp
#pragma once

#include <nlohmann/json.hpp>
#include "line_ngin/core/error.hpp"
#include "line_ngin/core/types.hpp"

namespace line_ngin {
namespace codec {

/**
 * @brief JSON encoding of the engine's records
 *
 * Every record type has a fixed schema. Decoding rejects unknown keys, missing required
 * keys and values of the wrong type with INVALID_DATA. A "record" key, when present,
 * must name the expected record type. Timestamps are ISO-8601 UTC strings.
 */

nlohmann::json encode(const Team& team);
nlohmann::json encode(const Game& game);
nlohmann::json encode(const MarketLine& line);
nlohmann::json encode(const PredictionRecord& prediction);
nlohmann::json encode(const GradedBet& bet);
nlohmann::json encode(const BacktestResult& result);

Result<Team> decode_team(const nlohmann::json& j);
Result<Game> decode_game(const nlohmann::json& j);
Result<MarketLine> decode_market_line(const nlohmann::json& j);
Result<PredictionRecord> decode_prediction(const nlohmann::json& j);
Result<GradedBet> decode_graded_bet(const nlohmann::json& j);
Result<BacktestResult> decode_backtest_result(const nlohmann::json& j);

}  // namespace codec
}  // namespace line_ngin
