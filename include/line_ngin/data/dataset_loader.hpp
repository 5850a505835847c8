// include/line_ngin/data/dataset_loader.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "line_ngin/backtest/backtest_runner.hpp"
#include "line_ngin/core/error.hpp"
#include "line_ngin/core/types.hpp"

namespace line_ngin {

/**
 * @brief One league's history as handed over by the schedule and odds collaborators
 */
struct Dataset {
    Sport sport{Sport::NFL};
    std::vector<Team> teams;
    std::vector<Game> games;
    backtest::LineMap lines;
};

/**
 * @brief Reads datasets from JSON files and writes JSON reports
 *
 * File layout: { "sport": "nfl", "teams": [...], "games": [...], "lines": [...] }, each
 * element in the record codec's schema.
 */
class DatasetLoader {
public:
    static Result<Dataset> load_file(const std::string& path);

    /**
     * @brief Decode an already-parsed dataset document
     *
     * Duplicate game ids, duplicate lines for one game and lines for unknown games are
     * rejected with INVALID_DATA.
     */
    static Result<Dataset> parse(const nlohmann::json& j);

    static Result<void> write_json(const std::string& path, const nlohmann::json& j);
};

}  // namespace line_ngin
