#pragma once

#include <time.h>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace line_ngin {
namespace core {

// Reentrant localtime, used for log timestamps and session names. nullptr on failure.
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

// Reentrant gmtime. Game times are stored and printed in UTC.
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Inverse of safe_gmtime: interpret a broken-down time as UTC
 */
inline std::time_t safe_timegm(std::tm* time_info) {
#ifdef _WIN32
    return _mkgmtime(time_info);
#else
    return timegm(time_info);
#endif
}

/**
 * @brief Current wall-clock time through strftime
 * @param use_local_time false formats in UTC
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    std::tm result;

    if (use_local_time) {
        safe_localtime(&now_c, &result);
    } else {
        safe_gmtime(&now_c, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

/**
 * @brief Format a time point as UTC ISO-8601 (YYYY-MM-DDTHH:MM:SSZ)
 */
inline std::string to_iso8601(std::chrono::system_clock::time_point tp) {
    auto tt = std::chrono::system_clock::to_time_t(tp);
    std::tm result;
    safe_gmtime(&tt, &result);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &result);
    return std::string(buffer);
}

/**
 * @brief Parse a UTC ISO-8601 timestamp
 *
 * Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM", "YYYY-MM-DDTHH:MM:SS" with an optional
 * fractional part and an optional trailing 'Z'. Offsets other than UTC are rejected.
 *
 * @return The parsed time point, or std::nullopt when the text is malformed
 */
inline std::optional<std::chrono::system_clock::time_point> parse_iso8601(
    const std::string& text) {
    std::tm time_info{};
    std::istringstream ss(text);

    if (text.size() == 10) {
        ss >> std::get_time(&time_info, "%Y-%m-%d");
    } else if (text.size() == 16 || (text.size() == 17 && text.back() == 'Z')) {
        ss >> std::get_time(&time_info, "%Y-%m-%dT%H:%M");
    } else {
        ss >> std::get_time(&time_info, "%Y-%m-%dT%H:%M:%S");
    }
    if (ss.fail()) {
        return std::nullopt;
    }

    // Optional fractional seconds and 'Z'; anything else is an unsupported offset
    char c;
    while (ss.get(c)) {
        if (c == 'Z') {
            if (ss.peek() != std::char_traits<char>::eof()) {
                return std::nullopt;
            }
            break;
        }
        if (c != '.' && (c < '0' || c > '9')) {
            return std::nullopt;
        }
    }

    time_info.tm_isdst = 0;
    std::time_t tt = safe_timegm(&time_info);
    if (tt == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(tt);
}

}  // namespace core
}  // namespace line_ngin
