// include/backfolio/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace backfolio {

/**
 * @brief Error codes for the backtest engine
 * Defines all error conditions a component can report
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,
    SETUP_ERROR = 4,

    // Data errors
    DATABASE_ERROR = 10,
    DATA_NOT_FOUND = 11,
    INVALID_DATA = 12,
    CONVERSION_ERROR = 13,
    CONNECTION_ERROR = 14,

    // Trading errors
    INVALID_FILL = 20,
    ORDER_REJECTED = 21,
    INSUFFICIENT_FUNDS = 22,
    POSITION_LIMIT_EXCEEDED = 23,
    MATCHING_INVARIANT_VIOLATION = 24,

    // Strategy errors
    STRATEGY_ERROR = 30,

    // Run control
    RUN_CANCELLED = 40,

    // File and parsing errors
    FILE_IO_ERROR = 50,
    JSON_PARSE_ERROR = 51
};

/**
 * @brief Convert an error code to its symbolic name
 */
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
        case ErrorCode::SETUP_ERROR:
            return "SETUP_ERROR";
        case ErrorCode::DATABASE_ERROR:
            return "DATABASE_ERROR";
        case ErrorCode::DATA_NOT_FOUND:
            return "DATA_NOT_FOUND";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::CONVERSION_ERROR:
            return "CONVERSION_ERROR";
        case ErrorCode::CONNECTION_ERROR:
            return "CONNECTION_ERROR";
        case ErrorCode::INVALID_FILL:
            return "INVALID_FILL";
        case ErrorCode::ORDER_REJECTED:
            return "ORDER_REJECTED";
        case ErrorCode::INSUFFICIENT_FUNDS:
            return "INSUFFICIENT_FUNDS";
        case ErrorCode::POSITION_LIMIT_EXCEEDED:
            return "POSITION_LIMIT_EXCEEDED";
        case ErrorCode::MATCHING_INVARIANT_VIOLATION:
            return "MATCHING_INVARIANT_VIOLATION";
        case ErrorCode::STRATEGY_ERROR:
            return "STRATEGY_ERROR";
        case ErrorCode::RUN_CANCELLED:
            return "RUN_CANCELLED";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Inverse of error_code_to_string; unrecognized names map to UNKNOWN_ERROR
 */
inline ErrorCode error_code_from_string(const std::string& name) {
    static const ErrorCode codes[] = {ErrorCode::NONE,
                                       ErrorCode::UNKNOWN_ERROR,
                                       ErrorCode::INVALID_ARGUMENT,
                                       ErrorCode::NOT_INITIALIZED,
                                       ErrorCode::SETUP_ERROR,
                                       ErrorCode::DATABASE_ERROR,
                                       ErrorCode::DATA_NOT_FOUND,
                                       ErrorCode::INVALID_DATA,
                                       ErrorCode::CONVERSION_ERROR,
                                       ErrorCode::CONNECTION_ERROR,
                                       ErrorCode::INVALID_FILL,
                                       ErrorCode::ORDER_REJECTED,
                                       ErrorCode::INSUFFICIENT_FUNDS,
                                       ErrorCode::POSITION_LIMIT_EXCEEDED,
                                       ErrorCode::MATCHING_INVARIANT_VIOLATION,
                                       ErrorCode::STRATEGY_ERROR,
                                       ErrorCode::RUN_CANCELLED,
                                       ErrorCode::FILE_IO_ERROR,
                                       ErrorCode::JSON_PARSE_ERROR};
    for (ErrorCode code : codes) {
        if (error_code_to_string(code) == name)
            return code;
    }
    return ErrorCode::UNKNOWN_ERROR;
}

/**
 * @brief Exception type carried by failed results
 */
class BacktestError : public std::runtime_error {
public:
    /**
     * @brief Constructor for BacktestError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    BacktestError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    ErrorCode code() const noexcept {
        return code_;
    }

    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Convert error to string representation
     * @return Formatted error string
     */
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
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    Result(std::unique_ptr<BacktestError> error) : error_(std::move(error)) {}

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
     * @return Reference to the contained value
     * @throws BacktestError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Move the success value out of the result
     * @throws BacktestError if result represents an error
     */
    T take_value() {
        if (error_)
            throw *error_;
        return std::move(value_);
    }

    const BacktestError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<BacktestError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<BacktestError> error) : error_(std::move(error)) {}

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

    const BacktestError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<BacktestError> error_;
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
    return Result<T>(std::make_unique<BacktestError>(code, message, component));
}

}  // namespace backfolio
