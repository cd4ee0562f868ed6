// include/gold_rotation/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace gold_rotation {

/**
 * @brief Error codes for the backtest engine
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,

    // Data errors
    EMPTY_DATA = 3,        // provider or table returned zero rows
    SCHEMA_ERROR = 4,      // required column unresolvable after alias mapping
    DATA_UNAVAILABLE = 5,  // every fallback source exhausted
    INVALID_DATA = 6,
    CONVERSION_ERROR = 7,

    // Configuration errors
    CONFIG_ERROR = 8,

    // Network errors
    CONNECTION_ERROR = 9,
    TIMEOUT_ERROR = 10,
    API_ERROR = 11,

    // File and I/O errors
    FILE_NOT_FOUND = 12,
    FILE_IO_ERROR = 13,

    // JSON and parsing errors
    JSON_PARSE_ERROR = 14
};

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::UNKNOWN_ERROR:
            return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::EMPTY_DATA:
            return "EMPTY_DATA";
        case ErrorCode::SCHEMA_ERROR:
            return "SCHEMA_ERROR";
        case ErrorCode::DATA_UNAVAILABLE:
            return "DATA_UNAVAILABLE";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::CONVERSION_ERROR:
            return "CONVERSION_ERROR";
        case ErrorCode::CONFIG_ERROR:
            return "CONFIG_ERROR";
        case ErrorCode::CONNECTION_ERROR:
            return "CONNECTION_ERROR";
        case ErrorCode::TIMEOUT_ERROR:
            return "TIMEOUT_ERROR";
        case ErrorCode::API_ERROR:
            return "API_ERROR";
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
 * @brief Network failures that are worth retrying against the same source
 */
inline bool is_transient(ErrorCode code) {
    return code == ErrorCode::CONNECTION_ERROR || code == ErrorCode::TIMEOUT_ERROR ||
           code == ErrorCode::API_ERROR;
}

/**
 * @brief Exception type carried by every failed Result
 */
class EngineError : public std::runtime_error {
public:
    /**
     * @brief Constructor for EngineError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    EngineError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    virtual ~EngineError() = default;

    /**
     * @brief Get the error code
     */
    ErrorCode code() const noexcept {
        return code_;
    }

    /**
     * @brief Get the component where error occurred
     */
    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Convert error to string representation
     * @return Formatted error string
     */
    std::string to_string() const {
        return "Error in " + component_ + ": " + what() + " (Code: " +
               error_code_to_string(code_) + ")";
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Result type for operations that can fail
 * @tparam T The type of the successful result
 */
template <typename T>
class Result {
public:
    /**
     * @brief Constructor for success case
     * @param value The successful result
     */
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    /**
     * @brief Constructor for error case
     * @param error The error that occurred
     */
    Result(std::unique_ptr<EngineError> error) : error_(std::move(error)) {}

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
     * @brief Get the success value
     * @throws EngineError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Move the success value out of the result
     * @throws EngineError if result represents an error
     */
    T take_value() {
        if (error_)
            throw *error_;
        return std::move(value_);
    }

    /**
     * @brief Get the error if present
     * @return Pointer to the error, or nullptr if success
     */
    const EngineError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<EngineError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<EngineError> error) : error_(std::move(error)) {}

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

    const EngineError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<EngineError> error_;
};

/**
 * @brief Helper for creating error results
 * @param code The error code
 * @param message The error message
 * @param component The component where error occurred
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<EngineError>(code, message, component));
}

/**
 * @brief Re-wrap an existing error under a new component, keeping its code
 */
template <typename T>
Result<T> forward_error(const EngineError& error, const std::string& component,
                        const std::string& context = "") {
    std::string message = context.empty() ? std::string(error.what())
                                          : context + ": " + error.what();
    return Result<T>(std::make_unique<EngineError>(error.code(), message, component));
}

}  // namespace gold_rotation
