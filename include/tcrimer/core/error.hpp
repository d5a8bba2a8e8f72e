// include/tcrimer/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace tcrimer {

/**
 * @brief Error codes shared by every tcrimer component
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Storage errors
    DATABASE_ERROR = 4,     // Non-transient backend failure (constraint, syntax)
    DATA_NOT_FOUND = 5,
    INVALID_DATA = 6,
    CONVERSION_ERROR = 7,
    DATA_ACCESS_ERROR = 8,  // Surfaced by the data store once retries are exhausted

    // Connectivity errors, retried by the data store
    CONNECTION_ERROR = 9,
    TIMEOUT_ERROR = 10,
    POOL_EXHAUSTED = 11,

    // Analytics errors
    INSUFFICIENT_DATA = 12,

    // Backtest failures
    BACKTEST_DATA_FAULT = 14,
    BACKTEST_CANCELLED = 15,
    BACKTEST_INVALID_PARAMS = 16,
    BACKTEST_TIMEOUT = 17,

    // Internal only, never returned to callers
    CACHE_DEGRADED = 18,

    // Upstream collectors
    UPSTREAM_ERROR = 19,

    // File and parsing errors
    FILE_NOT_FOUND = 20,
    FILE_IO_ERROR = 21,
    JSON_PARSE_ERROR = 22
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
        case ErrorCode::DATABASE_ERROR:
            return "DATABASE_ERROR";
        case ErrorCode::DATA_NOT_FOUND:
            return "DATA_NOT_FOUND";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::CONVERSION_ERROR:
            return "CONVERSION_ERROR";
        case ErrorCode::DATA_ACCESS_ERROR:
            return "DATA_ACCESS_ERROR";
        case ErrorCode::CONNECTION_ERROR:
            return "CONNECTION_ERROR";
        case ErrorCode::TIMEOUT_ERROR:
            return "TIMEOUT_ERROR";
        case ErrorCode::POOL_EXHAUSTED:
            return "POOL_EXHAUSTED";
        case ErrorCode::INSUFFICIENT_DATA:
            return "INSUFFICIENT_DATA";
        case ErrorCode::BACKTEST_DATA_FAULT:
            return "BACKTEST_DATA_FAULT";
        case ErrorCode::BACKTEST_CANCELLED:
            return "BACKTEST_CANCELLED";
        case ErrorCode::BACKTEST_INVALID_PARAMS:
            return "BACKTEST_INVALID_PARAMS";
        case ErrorCode::BACKTEST_TIMEOUT:
            return "BACKTEST_TIMEOUT";
        case ErrorCode::CACHE_DEGRADED:
            return "CACHE_DEGRADED";
        case ErrorCode::UPSTREAM_ERROR:
            return "UPSTREAM_ERROR";
        case ErrorCode::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        default:
            return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Whether an error is worth retrying against storage
 */
inline bool is_transient(ErrorCode code) {
    return code == ErrorCode::CONNECTION_ERROR || code == ErrorCode::TIMEOUT_ERROR;
}

/**
 * @brief Exception type carried by Result and thrown by Result::value()
 */
class TcrimerError : public std::runtime_error {
public:
    /**
     * @brief Constructor for TcrimerError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    TcrimerError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    ErrorCode code() const noexcept {
        return code_;
    }

    const std::string& component() const noexcept {
        return component_;
    }

    std::string to_string() const {
        return "Error in " + component_ + ": " + what() + " (" + error_code_to_string(code_) +
               ")";
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
    Result(std::unique_ptr<TcrimerError> error) : error_(std::move(error)) {}

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
     * @throws TcrimerError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Mutable access, used to move move-only values out
     * @throws TcrimerError if result represents an error
     */
    T& value() {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Get the error if present
     * @return Pointer to the error, or nullptr if success
     */
    const TcrimerError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<TcrimerError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<TcrimerError> error) : error_(std::move(error)) {}

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

    const TcrimerError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<TcrimerError> error_;
};

/**
 * @brief Helper for creating error results
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<TcrimerError>(code, message, component));
}

/**
 * @brief Re-wrap an existing error into a Result of another type
 */
template <typename T>
Result<T> forward_error(const TcrimerError* error) {
    return make_error<T>(error->code(), error->what(), error->component());
}

}  // namespace tcrimer
