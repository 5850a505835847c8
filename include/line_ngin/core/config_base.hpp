// include/line_ngin/core/config_base.hpp
#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include "line_ngin/core/error.hpp"

namespace line_ngin {

/**
 * @brief Base class for JSON-backed configuration
 *
 * Sport profiles, model params, run and optimizer configs all persist through this
 * interface. from_json() may throw (nlohmann type errors, std::invalid_argument for
 * unknown enum names); the file helpers turn those into Results.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Write the config as indented JSON
     * @return FILE_IO_ERROR if the file can't be opened
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Read, apply and validate a config file
     *
     * Fields absent from the file keep their current values. A config that parses but
     * fails validate() is reported with the validator's error.
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    virtual nlohmann::json to_json() const = 0;

    virtual void from_json(const nlohmann::json& j) = 0;

    /**
     * @brief Range checks on the loaded values, accepts everything by default
     */
    virtual Result<void> validate() const {
        return Result<void>();
    }
};

}  // namespace line_ngin
