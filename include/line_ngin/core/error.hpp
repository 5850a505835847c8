// include/line_ngin/core/error.hpp

#pragma once

#include <memory>
#include <stdexcept>
#include <string>

namespace line_ngin {

/**
 * @brief Failure categories reported by the engine
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,  // Bad config values, bad search grids
    NOT_INITIALIZED = 3,

    // Record errors
    DATA_NOT_FOUND = 5,
    INVALID_DATA = 6,  // Schema violations, inconsistent games or lines
    CONVERSION_ERROR = 7,

    // Dataset and report files
    FILE_NOT_FOUND = 20,
    FILE_IO_ERROR = 21,
    JSON_PARSE_ERROR = 23
};

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::UNKNOWN_ERROR:
            return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::NOT_INITIALIZED:
            return "NOT_INITIALIZED";
        case ErrorCode::DATA_NOT_FOUND:
            return "DATA_NOT_FOUND";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::CONVERSION_ERROR:
            return "CONVERSION_ERROR";
        case ErrorCode::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Error carried by a failed Result
 *
 * The component names the stage that gave up (RecordCodec, BacktestRunner, ...).
 * When a stage passes a lower-level failure upward it re-tags the component but keeps
 * the code and message, see forward_error().
 */
class LineError : public std::runtime_error {
public:
    LineError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    ErrorCode code() const noexcept {
        return code_;
    }

    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Render as "[Component] CODE: message"
     */
    std::string to_string() const {
        std::string out;
        if (!component_.empty()) {
            out += "[" + component_ + "] ";
        }
        return out + error_code_to_string(code_) + ": " + what();
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Value or error returned by every fallible operation
 * @tparam T The type of the successful result
 */
template <typename T>
class Result {
public:
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    Result(std::unique_ptr<LineError> error) : error_(std::move(error)) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)), error_(std::move(other.error_)) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_ = std::move(other.error_);
        }
        return *this;
    }

    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool is_ok() const {
        return error_ == nullptr;
    }

    bool is_error() const {
        return error_ != nullptr;
    }

    /**
     * @brief Access the value
     * @throws LineError if the result holds an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    const LineError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<LineError> error_;
};

template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<LineError> error) : error_(std::move(error)) {}

    bool is_ok() const {
        return error_ == nullptr;
    }
    bool is_error() const {
        return error_ != nullptr;
    }

    void value() const {
        if (error_)
            throw *error_;
    }

    const LineError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<LineError> error_;
};

template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<LineError>(code, message, component));
}

/**
 * @brief Pass a lower-level failure upward under the caller's component
 * @param cause The failure being propagated, keeps its code and message
 * @param component Component reporting the failure
 */
template <typename T>
Result<T> forward_error(const LineError& cause, const std::string& component) {
    return make_error<T>(cause.code(), cause.what(), component);
}

}  // namespace line_ngin
