// include/cross_stats/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace cross_stats {

/**
 * @brief Error codes reported by the analysis library
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,

    // Data errors
    INVALID_DATA = 3,
    COLUMN_NOT_FOUND = 4,
    ENTITY_NOT_FOUND = 5,
    EMPTY_SOURCE = 6,

    // File and I/O errors
    FILE_NOT_FOUND = 7,
    FILE_IO_ERROR = 8,

    // JSON and parsing errors
    JSON_PARSE_ERROR = 9
};

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::UNKNOWN_ERROR:
            return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::COLUMN_NOT_FOUND:
            return "COLUMN_NOT_FOUND";
        case ErrorCode::ENTITY_NOT_FOUND:
            return "ENTITY_NOT_FOUND";
        case ErrorCode::EMPTY_SOURCE:
            return "EMPTY_SOURCE";
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
 * @brief Error raised or returned by analysis components
 */
class AnalysisError : public std::runtime_error {
public:
    /**
     * @brief Constructor for AnalysisError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    AnalysisError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    ErrorCode code() const noexcept {
        return code_;
    }

    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Formatted "component: message (code)" representation
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

    Result(std::unique_ptr<AnalysisError> error) : error_(std::move(error)) {}

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
     * @throws AnalysisError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Get the error if present, nullptr on success
     */
    const AnalysisError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<AnalysisError> error_;
};

template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<AnalysisError> error) : error_(std::move(error)) {}

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

    const AnalysisError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<AnalysisError> error_;
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
    return Result<T>(std::make_unique<AnalysisError>(code, message, component));
}

/**
 * @brief Re-wrap the error of one result as an error result of another type
 */
template <typename T, typename U>
Result<T> forward_error(const Result<U>& failed, const std::string& component) {
    return make_error<T>(failed.error()->code(), failed.error()->what(), component);
}

}  // namespace cross_stats
