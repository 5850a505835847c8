// src/core/config_base.cpp

#include "line_ngin/core/config_base.hpp"
#include <iomanip>
#include <stdexcept>

namespace line_ngin {

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Cannot open config file for writing: " + filepath, "ConfigBase");
    }
    try {
        file << std::setw(4) << to_json() << std::endl;
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::CONVERSION_ERROR,
                                std::string("Cannot serialize config: ") + e.what(), "ConfigBase");
    }
    if (!file) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed writing config file: " + filepath,
                                "ConfigBase");
    }
    return Result<void>();
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND, "Config file not found: " + filepath,
                                "ConfigBase");
    }

    try {
        nlohmann::json j;
        file >> j;
        from_json(j);
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                "Bad config JSON in " + filepath + ": " + e.what(), "ConfigBase");
    } catch (const std::invalid_argument& e) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Bad config value in " + filepath + ": " + e.what(), "ConfigBase");
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::UNKNOWN_ERROR,
                                "Cannot load config " + filepath + ": " + e.what(), "ConfigBase");
    }

    return validate();
}

}  // namespace line_ngin
