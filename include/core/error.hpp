#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace textshield {

/**
 * @brief Error categories for the engine
 */
enum class ErrorCategory {
    NONE,
    REQUEST_ERROR,      // Unknown operation, missing/ill-typed parameter, malformed policy
    HANDLER_ERROR,      // Failure inside an operation handler
    INTERNAL_ERROR      // Unexpected exception escaping a handler
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "NONE";
        case ErrorCategory::REQUEST_ERROR: return "REQUEST_ERROR";
        case ErrorCategory::HANDLER_ERROR: return "HANDLER_ERROR";
        case ErrorCategory::INTERNAL_ERROR: return "INTERNAL_ERROR";
    }
    return "UNKNOWN";
}

/**
 * @brief Thrown by operation handlers; caught at the dispatcher boundary
 */
class SanitizationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

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

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

} // namespace textshield
