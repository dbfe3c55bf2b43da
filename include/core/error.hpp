#pragma once

#include <optional>
#include <string>
#include <utility>

namespace llmguard {

/**
 * @brief Error categories for the resilience core
 */
enum class ErrorCategory {
    NONE,
    CIRCUIT_OPEN,
    PROBE_FAILURE,
    RATE_LIMITED,
    NO_HEALTHY_PROVIDER,
    CONFIG_ERROR,
    UPSTREAM_ERROR,
    INTERNAL_ERROR
};

inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                return "none";
        case ErrorCategory::CIRCUIT_OPEN:        return "circuit_open";
        case ErrorCategory::PROBE_FAILURE:       return "probe_failure";
        case ErrorCategory::RATE_LIMITED:        return "rate_limited";
        case ErrorCategory::NO_HEALTHY_PROVIDER: return "no_healthy_provider";
        case ErrorCategory::CONFIG_ERROR:        return "config_error";
        case ErrorCategory::UPSTREAM_ERROR:      return "upstream_error";
        case ErrorCategory::INTERNAL_ERROR:      return "internal_error";
    }
    return "unknown";
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

/**
 * @brief Outcome of an operation with no value.
 *
 * Returned by functions wrapped in a CircuitBreaker. Any non-ok status
 * counts as a failure; the breaker hands it back to the caller untouched.
 */
class Status {
public:
    Status() = default;

    static Status ok() { return Status{}; }

    static Status error(ErrorCategory category, std::string message) {
        Status s;
        s.category_ = category;
        s.message_ = std::move(message);
        return s;
    }

    [[nodiscard]] bool is_ok() const { return category_ == ErrorCategory::NONE; }
    [[nodiscard]] bool is_error() const { return !is_ok(); }
    [[nodiscard]] bool is_circuit_open() const {
        return category_ == ErrorCategory::CIRCUIT_OPEN;
    }

    ErrorCategory error_category() const { return category_; }
    const std::string& error_message() const { return message_; }

private:
    ErrorCategory category_ = ErrorCategory::NONE;
    std::string message_;
};

} // namespace llmguard
