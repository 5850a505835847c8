// src/core/logger.cpp

#include "line_ngin/core/logger.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <vector>
#include "line_ngin/core/time_utils.hpp"

namespace line_ngin {

thread_local std::string Logger::current_component_;

std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARNING:
            return "WARNING";
        case LogLevel::ERR:
            return "ERROR";
        case LogLevel::FATAL:
            return "FATAL";
        default:
            return "UNKNOWN";
    }
}

std::optional<LogLevel> log_level_from_string(const std::string& s) {
    for (auto level : {LogLevel::TRACE, LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARNING,
                       LogLevel::ERR, LogLevel::FATAL}) {
        if (level_to_string(level) == s) {
            return level;
        }
    }
    return std::nullopt;
}

std::string log_destination_to_string(LogDestination dest) {
    switch (dest) {
        case LogDestination::CONSOLE:
            return "CONSOLE";
        case LogDestination::FILE:
            return "FILE";
        case LogDestination::BOTH:
            return "BOTH";
        default:
            return "UNKNOWN";
    }
}

std::optional<LogDestination> log_destination_from_string(const std::string& s) {
    for (auto dest : {LogDestination::CONSOLE, LogDestination::FILE, LogDestination::BOTH}) {
        if (log_destination_to_string(dest) == s) {
            return dest;
        }
    }
    return std::nullopt;
}

Result<void> LoggerConfig::validate() const {
    if (filename_prefix.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "filename_prefix cannot be empty",
                                "LoggerConfig");
    }
    if (max_file_size == 0 || max_files == 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "max_file_size and max_files must be positive", "LoggerConfig");
    }
    return Result<void>();
}

nlohmann::json LoggerConfig::to_json() const {
    nlohmann::json j;
    j["min_level"] = level_to_string(min_level);
    j["destination"] = log_destination_to_string(destination);
    j["log_directory"] = log_directory;
    j["filename_prefix"] = filename_prefix;
    j["include_timestamp"] = include_timestamp;
    j["include_level"] = include_level;
    j["max_file_size"] = max_file_size;
    j["max_files"] = max_files;
    j["version"] = version;
    return j;
}

void LoggerConfig::from_json(const nlohmann::json& j) {
    if (j.contains("min_level")) {
        auto level = log_level_from_string(j.at("min_level").get<std::string>());
        if (!level) {
            throw std::invalid_argument("Unknown log level: " +
                                        j.at("min_level").get<std::string>());
        }
        min_level = *level;
    }
    if (j.contains("destination")) {
        auto dest = log_destination_from_string(j.at("destination").get<std::string>());
        if (!dest) {
            throw std::invalid_argument("Unknown log destination: " +
                                        j.at("destination").get<std::string>());
        }
        destination = *dest;
    }
    if (j.contains("log_directory"))
        log_directory = j.at("log_directory").get<std::string>();
    if (j.contains("filename_prefix"))
        filename_prefix = j.at("filename_prefix").get<std::string>();
    if (j.contains("include_timestamp"))
        include_timestamp = j.at("include_timestamp").get<bool>();
    if (j.contains("include_level"))
        include_level = j.at("include_level").get<bool>();
    if (j.contains("max_file_size"))
        max_file_size = j.at("max_file_size").get<size_t>();
    if (j.contains("max_files"))
        max_files = j.at("max_files").get<size_t>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::initialize(const LoggerConfig& config) {
    auto valid = config.validate();
    if (valid.is_error()) {
        throw std::runtime_error(valid.error()->to_string());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    if (log_file_.is_open()) {
        log_file_.close();
    }

    if (config_.destination != LogDestination::CONSOLE) {
        log_dir_ = std::filesystem::absolute(config_.log_directory);
        std::error_code ec;
        std::filesystem::create_directories(log_dir_, ec);
        if (ec) {
            throw std::runtime_error("Failed to create log directory " + log_dir_.string() +
                                     ": " + ec.message());
        }

        session_timestamp_ = core::get_formatted_time("%Y%m%d_%H%M%S");
        part_number_ = 1;
        prune_parts_unsafe();
        open_part_unsafe();
        if (!log_file_.is_open()) {
            throw std::runtime_error("Failed to open log file " + part_path(part_number_).string());
        }
    }

    initialized_.store(true, std::memory_order_release);
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!initialized_.load(std::memory_order_acquire)) {
        std::cerr << "Logger not initialized: " << message << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < config_.min_level) {
        return;
    }

    std::string line = format_line(level, message);
    if (config_.destination != LogDestination::FILE) {
        std::cout << line << std::endl;
    }
    if (config_.destination != LogDestination::CONSOLE) {
        write_to_file_unsafe(line);
    }
}

std::string Logger::format_line(LogLevel level, const std::string& message) const {
    std::ostringstream ss;
    if (config_.include_timestamp) {
        ss << core::get_formatted_time("%Y-%m-%d %H:%M:%S") << " ";
    }
    if (config_.include_level) {
        ss << "[" << level_to_string(level) << "] ";
    }
    if (!current_component_.empty()) {
        ss << "[" << current_component_ << "] ";
    }
    ss << message;
    return ss.str();
}

std::filesystem::path Logger::part_path(int part) const {
    return log_dir_ / (config_.filename_prefix + "_" + session_timestamp_ + "_part" +
                       std::to_string(part) + ".log");
}

void Logger::open_part_unsafe() {
    log_file_.open(part_path(part_number_), std::ios::app);
}

void Logger::write_to_file_unsafe(const std::string& line) {
    if (!log_file_.is_open()) {
        return;
    }
    log_file_ << line << std::endl;

    if (log_file_.tellp() >= static_cast<std::streampos>(config_.max_file_size)) {
        log_file_.close();
        part_number_++;
        prune_parts_unsafe();
        open_part_unsafe();
    }
}

void Logger::prune_parts_unsafe() {
    // Only parts written under this prefix are ours to delete
    const std::string prefix = config_.filename_prefix + "_";
    std::vector<std::filesystem::path> parts;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(log_dir_, ec)) {
        const std::string name = entry.path().filename().string();
        if (entry.is_regular_file() && entry.path().extension() == ".log" &&
            name.compare(0, prefix.size(), prefix) == 0) {
            parts.push_back(entry.path());
        }
    }

    std::sort(parts.begin(), parts.end(), [](const auto& a, const auto& b) {
        return std::filesystem::last_write_time(a) < std::filesystem::last_write_time(b);
    });

    // Leave room for the part about to be opened
    while (!parts.empty() && parts.size() >= config_.max_files) {
        std::filesystem::remove(parts.front(), ec);
        parts.erase(parts.begin());
    }
}

}  // namespace line_ngin
