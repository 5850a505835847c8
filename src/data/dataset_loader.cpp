#include "line_ngin/data/dataset_loader.hpp"
#include <fstream>
#include <iomanip>
#include <unordered_set>
#include "line_ngin/core/logger.hpp"
#include "line_ngin/data/record_codec.hpp"

namespace line_ngin {

Result<Dataset> DatasetLoader::load_file(const std::string& path) {
    Logger::register_component("DatasetLoader");

    std::ifstream file(path);
    if (!file.is_open()) {
        return make_error<Dataset>(ErrorCode::FILE_NOT_FOUND,
                                   "Failed to open dataset for reading: " + path,
                                   "DatasetLoader");
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        return make_error<Dataset>(ErrorCode::JSON_PARSE_ERROR,
                                   std::string("Error parsing dataset: ") + e.what(),
                                   "DatasetLoader");
    }

    auto dataset = parse(j);
    if (dataset.is_ok()) {
        INFO("Loaded " << to_string(dataset.value().sport) << " dataset from " << path << ": "
                       << dataset.value().teams.size() << " teams, "
                       << dataset.value().games.size() << " games, "
                       << dataset.value().lines.size() << " lines");
    }
    return dataset;
}

Result<Dataset> DatasetLoader::parse(const nlohmann::json& j) {
    if (!j.is_object()) {
        return make_error<Dataset>(ErrorCode::INVALID_DATA, "Dataset must be a JSON object",
                                   "DatasetLoader");
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        if (key != "sport" && key != "teams" && key != "games" && key != "lines") {
            return make_error<Dataset>(ErrorCode::INVALID_DATA,
                                       "Unknown dataset field '" + key + "'", "DatasetLoader");
        }
    }
    if (!j.contains("sport") || !j.at("sport").is_string()) {
        return make_error<Dataset>(ErrorCode::INVALID_DATA, "Dataset requires a sport",
                                   "DatasetLoader");
    }
    auto sport = sport_from_string(j.at("sport").get<std::string>());
    if (!sport) {
        return make_error<Dataset>(ErrorCode::INVALID_DATA,
                                   "Unknown sport '" + j.at("sport").get<std::string>() + "'",
                                   "DatasetLoader");
    }
    for (const char* key : {"teams", "games", "lines"}) {
        if (j.contains(key) && !j.at(key).is_array()) {
            return make_error<Dataset>(ErrorCode::INVALID_DATA,
                                       std::string("Dataset field '") + key +
                                           "' must be an array",
                                       "DatasetLoader");
        }
    }

    Dataset dataset;
    dataset.sport = *sport;

    if (j.contains("teams")) {
        for (const auto& item : j.at("teams")) {
            auto team = codec::decode_team(item);
            if (team.is_error()) {
                return forward_error<Dataset>(*team.error(), "DatasetLoader");
            }
            dataset.teams.push_back(team.value());
        }
    }

    std::unordered_set<std::string> game_ids;
    if (j.contains("games")) {
        for (const auto& item : j.at("games")) {
            auto game = codec::decode_game(item);
            if (game.is_error()) {
                return forward_error<Dataset>(*game.error(), "DatasetLoader");
            }
            if (!game_ids.insert(game.value().id).second) {
                return make_error<Dataset>(ErrorCode::INVALID_DATA,
                                           "Duplicate game id " + game.value().id,
                                           "DatasetLoader");
            }
            dataset.games.push_back(game.value());
        }
    }

    if (j.contains("lines")) {
        for (const auto& item : j.at("lines")) {
            auto line = codec::decode_market_line(item);
            if (line.is_error()) {
                return forward_error<Dataset>(*line.error(), "DatasetLoader");
            }
            const std::string& game_id = line.value().game_id;
            if (game_ids.find(game_id) == game_ids.end()) {
                return make_error<Dataset>(ErrorCode::INVALID_DATA,
                                           "Market line for unknown game " + game_id,
                                           "DatasetLoader");
            }
            if (!dataset.lines.emplace(game_id, line.value()).second) {
                return make_error<Dataset>(ErrorCode::INVALID_DATA,
                                           "Duplicate market line for game " + game_id,
                                           "DatasetLoader");
            }
        }
    }

    return std::move(dataset);
}

Result<void> DatasetLoader::write_json(const std::string& path, const nlohmann::json& j) {
    std::ofstream file(path);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open file for writing: " + path, "DatasetLoader");
    }
    file << std::setw(2) << j << std::endl;
    if (!file) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed to write " + path,
                                "DatasetLoader");
    }
    return Result<void>();
}

}  // namespace line_ngin
