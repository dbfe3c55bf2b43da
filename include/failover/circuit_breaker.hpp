#pragma once

#include "core/clock.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace llmguard {

/**
 * @brief Circuit Breaker for provider failure isolation
 *
 * Three states:
 * - CLOSED:     Normal operation, all calls pass through
 * - OPEN:       Failing, reject calls immediately (provider is not contacted)
 * - HALF_OPEN:  Testing recovery, exactly one trial call in flight
 *
 * State transitions:
 * - CLOSED → OPEN:      consecutive failures >= failure_threshold
 * - OPEN → HALF_OPEN:   timeout elapsed since the last failure (on next call)
 * - HALF_OPEN → CLOSED: trial call succeeded
 * - HALF_OPEN → OPEN:   trial call failed
 *
 * Health probes feed the breaker through record_probe_result(). A healthy
 * probe moves an OPEN breaker to HALF_OPEN without waiting for the
 * timeout; the breaker still needs one more success to close.
 *
 * All state lives behind one mutex. The wrapped function runs outside it.
 */
class CircuitBreaker {
public:
    /**
     * @brief Configuration
     */
    struct Config {
        uint32_t failure_threshold;         // Failures to trip OPEN
        std::chrono::milliseconds timeout;  // Cooldown before a trial call

        Config()
            : failure_threshold(5),
              timeout(30000) {}
    };

    using StateChangeCallback = std::function<void(const StateChangeEvent&)>;

    /**
     * @brief Construct circuit breaker
     * @param name Circuit breaker identifier (usually the provider ID)
     * @param config Configuration
     * @param clock Time source
     * @throws std::invalid_argument on a zero threshold, negative timeout or null clock
     */
    explicit CircuitBreaker(std::string name, const Config& config = Config(),
                            std::shared_ptr<IClock> clock = default_clock());

    /**
     * @brief Run fn if the breaker admits it and record the outcome
     *
     * @return fn's status unchanged, or a CIRCUIT_OPEN status when the call
     *         was rejected without invoking fn
     *
     * An exception thrown by fn counts as a failure and is rethrown.
     */
    Status call(const std::function<Status()>& fn);

    /**
     * @brief Current state. Never triggers a transition.
     */
    [[nodiscard]] CircuitState get_state() const;

    /**
     * @brief True iff a call() issued now would invoke its function
     */
    [[nodiscard]] bool is_available() const;

    enum class Admission { REJECT, NORMAL, TRIAL };

    /**
     * @brief Claim permission for a call made outside call()
     *
     * Follows the same rules as call(): REJECT when the call must not be
     * made, TRIAL when the caller holds the single HALF_OPEN slot. Every
     * admission other than REJECT must be settled with release().
     */
    [[nodiscard]] Admission try_acquire();

    /**
     * @brief Settle an admission from try_acquire(). REJECT is ignored.
     */
    void release(Admission admission, bool success);

    /**
     * @brief Record the outcome of a call made outside call()
     *
     * Never settles a trial; use try_acquire()/release() for that.
     */
    void record_success();
    void record_failure();

    /**
     * @brief Record the outcome of a background health probe
     */
    void record_probe_result(bool healthy);

    [[nodiscard]] uint32_t failure_count() const;

    [[nodiscard]] CircuitBreakerStats get_stats() const;

    /**
     * @brief Force reset to CLOSED state
     */
    void reset();

    const std::string& name() const { return name_; }
    const Config& config() const { return config_; }

    /**
     * @brief Register callback for state transitions
     *
     * Invoked after the breaker lock is released.
     */
    void set_on_state_change(StateChangeCallback cb);

    /**
     * @brief Get recent state change events (most recent last)
     */
    [[nodiscard]] std::vector<StateChangeEvent> get_recent_events() const;

private:
    // Callers hold mutex_
    void apply_outcome_locked(bool success, std::vector<StateChangeEvent>& pending);
    void transition_locked(CircuitState to, std::vector<StateChangeEvent>& pending);

    void publish(const std::vector<StateChangeEvent>& events);

    std::string name_;
    Config config_;
    std::shared_ptr<IClock> clock_;

    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::CLOSED;
    uint32_t failure_count_ = 0;
    bool probe_in_flight_ = false;
    IClock::time_point last_failure_time_{};
    IClock::time_point opened_at_{};

    uint64_t total_successes_ = 0;
    uint64_t total_failures_ = 0;
    uint64_t rejected_calls_ = 0;
    uint64_t times_opened_ = 0;

    // State change events
    StateChangeCallback on_state_change_;
    std::deque<StateChangeEvent> recent_events_;
    mutable std::mutex events_mutex_;
    static constexpr size_t kMaxRecentEvents = 100;
};

} // namespace llmguard
