// include/line_ngin/core/logger.hpp
#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>
#include "line_ngin/core/config_base.hpp"

namespace line_ngin {

enum class LogLevel {
    TRACE,    // Per-game arithmetic
    DEBUG,    // Per-trial and per-grade detail
    INFO,     // Run start and finish
    WARNING,  // Skipped or excluded games
    ERR,      // A run or trial failed
    FATAL
};

enum class LogDestination { CONSOLE, FILE, BOTH };

std::string level_to_string(LogLevel level);
std::optional<LogLevel> log_level_from_string(const std::string& s);

std::string log_destination_to_string(LogDestination dest);
std::optional<LogDestination> log_destination_from_string(const std::string& s);

/**
 * @brief Logger settings
 *
 * File output goes to <log_directory>/<filename_prefix>_<session>_part<N>.log. A part is
 * closed once it reaches max_file_size, and at most max_files parts with this prefix are
 * kept in the directory.
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"line_ngin"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{50 * 1024 * 1024};
    size_t max_files{10};

    std::string version{"1.0.0"};

    Result<void> validate() const override;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Process-wide, thread-safe logger
 *
 * Each thread tags its lines with the component it last registered, so optimizer trials
 * running on worker threads don't overwrite the caller's tag.
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Apply a config and open the first log part if writing to file
     * @throws std::runtime_error if the log directory or file can't be created
     */
    void initialize(const LoggerConfig& config);

    static void reset_for_tests() {
        Logger& logger = instance();
        std::lock_guard<std::mutex> lock(logger.mutex_);
        logger.initialized_ = false;
        if (logger.log_file_.is_open()) {
            logger.log_file_.close();
        }
        logger.session_timestamp_.clear();
        logger.part_number_ = 1;
    }

    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
    }

    LogLevel get_min_level() const {
        return config_.min_level;
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    static void register_component(const std::string& component) {
        current_component_ = component;
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::filesystem::path part_path(int part) const;
    void open_part_unsafe();
    void prune_parts_unsafe();
    void write_to_file_unsafe(const std::string& line);
    std::string format_line(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::filesystem::path log_dir_;
    std::atomic<bool> initialized_{false};
    static thread_local std::string current_component_;

    std::string session_timestamp_;  // YYYYMMDD_HHMMSS
    int part_number_{1};
};

#define LOG(level, message)                                             \
    do {                                                                \
        if (level >= ::line_ngin::Logger::instance().get_min_level()) { \
            std::ostringstream os;                                      \
            os << message;                                              \
            ::line_ngin::Logger::instance().log(level, os.str());       \
        }                                                               \
    } while (0)

#define TRACE(message) LOG(::line_ngin::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::line_ngin::LogLevel::DEBUG, message)
#define INFO(message) LOG(::line_ngin::LogLevel::INFO, message)
#define WARN(message) LOG(::line_ngin::LogLevel::WARNING, message)
#define ERROR(message) LOG(::line_ngin::LogLevel::ERR, message)
#define FATAL(message) LOG(::line_ngin::LogLevel::FATAL, message)
}  // namespace line_ngin
