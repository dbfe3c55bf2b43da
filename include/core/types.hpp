#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

namespace llmguard {

// ============================================================================
// Circuit Breaker Types
// ============================================================================

enum class CircuitState {
    CLOSED,         // Normal operation
    OPEN,           // Failing, reject requests
    HALF_OPEN       // Testing recovery
};

inline const char* circuit_state_to_string(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED:    return "closed";
        case CircuitState::OPEN:      return "open";
        case CircuitState::HALF_OPEN: return "half-open";
    }
    return "unknown";
}

struct CircuitBreakerStats {
    CircuitState state;
    uint32_t failure_count;         // Current consecutive failures
    uint64_t total_successes;
    uint64_t total_failures;
    uint64_t rejected_calls;
    uint64_t times_opened;
    std::chrono::steady_clock::time_point last_failure;
    std::chrono::steady_clock::time_point opened_at;

    CircuitBreakerStats()
        : state(CircuitState::CLOSED), failure_count(0), total_successes(0),
          total_failures(0), rejected_calls(0), times_opened(0) {}
};

struct StateChangeEvent {
    CircuitState from;
    CircuitState to;
    std::chrono::steady_clock::time_point timestamp;
    std::string breaker_name;
};

// ============================================================================
// Rate Limiting Types
// ============================================================================

enum class ThrottleLevel {
    NONE,
    GLOBAL,
    IP,
    API_KEY
};

inline const char* throttle_level_to_string(ThrottleLevel level) {
    switch (level) {
        case ThrottleLevel::NONE:    return "none";
        case ThrottleLevel::GLOBAL:  return "global";
        case ThrottleLevel::IP:      return "ip";
        case ThrottleLevel::API_KEY: return "api_key";
    }
    return "unknown";
}

struct ThrottleResult {
    bool allowed;
    std::string reason;                 // Empty when allowed
    ThrottleLevel level;                // Level that denied, NONE when allowed
    std::chrono::milliseconds retry_after;

    ThrottleResult() : allowed(true), level(ThrottleLevel::NONE), retry_after(0) {}

    ThrottleResult(bool a, std::string r, ThrottleLevel lv, std::chrono::milliseconds ra)
        : allowed(a), reason(std::move(r)), level(lv), retry_after(ra) {}
};

} // namespace llmguard
