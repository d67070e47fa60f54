#pragma once

#include <optional>
#include <string>
#include <utility>

namespace vecture {

/**
 * @brief Error codes for sever/restore operations
 */
enum class ErrorCode {
    NONE,
    INVALID_PATTERN,      // bad class or term configuration
    INVALID_INPUT,        // malformed arguments or spans
    INTEGRITY_ERROR,      // sanitized document does not match key digest
    DECRYPTION_ERROR,     // wrong passphrase or corrupted envelope
    UNSUPPORTED_FORMAT,   // key version or shape this build cannot read
    RECORD_MISMATCH       // replay found the key and document inconsistent
};

/**
 * @brief Process exit codes used by the CLI
 */
enum class ExitCode : int {
    SUCCESS = 0,
    INVALID_INPUT = 1,
    INTEGRITY_FAILURE = 2,
    DECRYPTION_FAILURE = 3,
    UNSUPPORTED_FORMAT = 4,
    RECORD_MISMATCH = 5
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "NONE";
        case ErrorCode::INVALID_PATTERN: return "INVALID_PATTERN";
        case ErrorCode::INVALID_INPUT: return "INVALID_INPUT";
        case ErrorCode::INTEGRITY_ERROR: return "INTEGRITY_ERROR";
        case ErrorCode::DECRYPTION_ERROR: return "DECRYPTION_ERROR";
        case ErrorCode::UNSUPPORTED_FORMAT: return "UNSUPPORTED_FORMAT";
        case ErrorCode::RECORD_MISMATCH: return "RECORD_MISMATCH";
        default: return "UNKNOWN";
    }
}

inline ExitCode exit_code_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return ExitCode::SUCCESS;
        case ErrorCode::INTEGRITY_ERROR: return ExitCode::INTEGRITY_FAILURE;
        case ErrorCode::DECRYPTION_ERROR: return ExitCode::DECRYPTION_FAILURE;
        case ErrorCode::UNSUPPORTED_FORMAT: return ExitCode::UNSUPPORTED_FORMAT;
        case ErrorCode::RECORD_MISMATCH: return ExitCode::RECORD_MISMATCH;
        case ErrorCode::INVALID_PATTERN:
        case ErrorCode::INVALID_INPUT:
        default: return ExitCode::INVALID_INPUT;
    }
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCode code, std::string message) {
        Result r;
        r.success_ = false;
        r.error_code_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    /// Re-wrap the error of a failed result of another type
    template<typename U>
    static Result forward_error(const Result<U>& other) {
        return error(other.error_code(), other.error_message());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCode error_code() const { return error_code_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCode error_code_ = ErrorCode::NONE;
    std::string error_message_;
};

} // namespace vecture
