#include "failover/circuit_breaker.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace llmguard {

CircuitBreaker::CircuitBreaker(std::string name, const Config& config,
                               std::shared_ptr<IClock> clock)
    : name_(std::move(name)),
      config_(config),
      clock_(std::move(clock)) {
    if (config_.failure_threshold == 0) {
        throw std::invalid_argument("circuit breaker failure_threshold must be >= 1");
    }
    if (config_.timeout.count() < 0) {
        throw std::invalid_argument("circuit breaker timeout must not be negative");
    }
    if (!clock_) {
        throw std::invalid_argument("circuit breaker requires a clock");
    }
}

Status CircuitBreaker::call(const std::function<Status()>& fn) {
    const Admission admission = try_acquire();
    if (admission == Admission::REJECT) {
        return Status::error(ErrorCategory::CIRCUIT_OPEN,
            std::format("Circuit breaker '{}' is open", name_));
    }

    Status result;
    try {
        result = fn();
    } catch (...) {
        release(admission, false);
        throw;
    }

    release(admission, result.is_ok());
    return result;
}

CircuitBreaker::Admission CircuitBreaker::try_acquire() {
    std::vector<StateChangeEvent> pending;
    Admission admission = Admission::REJECT;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (state_) {
            case CircuitState::CLOSED:
                admission = Admission::NORMAL;
                break;

            case CircuitState::OPEN:
                if (clock_->now() - last_failure_time_ >= config_.timeout) {
                    transition_locked(CircuitState::HALF_OPEN, pending);
                    probe_in_flight_ = true;
                    admission = Admission::TRIAL;
                }
                break;

            case CircuitState::HALF_OPEN:
                // One trial at a time
                if (!probe_in_flight_) {
                    probe_in_flight_ = true;
                    admission = Admission::TRIAL;
                }
                break;
        }
        if (admission == Admission::REJECT) {
            ++rejected_calls_;
        }
    }
    publish(pending);
    return admission;
}

void CircuitBreaker::release(Admission admission, bool success) {
    if (admission == Admission::REJECT) {
        return;
    }

    std::vector<StateChangeEvent> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (admission == Admission::NORMAL && state_ == CircuitState::HALF_OPEN) {
            // A call admitted while CLOSED must not settle another caller's trial
            if (success) {
                ++total_successes_;
            } else {
                ++total_failures_;
            }
        } else {
            apply_outcome_locked(success, pending);
        }
    }
    publish(pending);
}

void CircuitBreaker::record_success() {
    std::vector<StateChangeEvent> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        apply_outcome_locked(true, pending);
    }
    publish(pending);
}

void CircuitBreaker::record_failure() {
    std::vector<StateChangeEvent> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        apply_outcome_locked(false, pending);
    }
    publish(pending);
}

void CircuitBreaker::record_probe_result(bool healthy) {
    std::vector<StateChangeEvent> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (state_) {
            case CircuitState::CLOSED:
                apply_outcome_locked(healthy, pending);
                break;

            case CircuitState::OPEN:
                if (healthy) {
                    ++total_successes_;
                    probe_in_flight_ = false;
                    transition_locked(CircuitState::HALF_OPEN, pending);
                } else {
                    apply_outcome_locked(false, pending);
                }
                break;

            case CircuitState::HALF_OPEN:
                // A trial call in flight owns the decision
                if (!probe_in_flight_) {
                    apply_outcome_locked(healthy, pending);
                }
                break;
        }
    }
    publish(pending);
}

void CircuitBreaker::apply_outcome_locked(bool success,
                                          std::vector<StateChangeEvent>& pending) {
    if (success) {
        ++total_successes_;
    } else {
        ++total_failures_;
    }

    switch (state_) {
        case CircuitState::CLOSED:
            if (success) {
                failure_count_ = 0;
                return;
            }
            ++failure_count_;
            last_failure_time_ = clock_->now();
            if (failure_count_ >= config_.failure_threshold) {
                transition_locked(CircuitState::OPEN, pending);
            }
            return;

        case CircuitState::HALF_OPEN:
            probe_in_flight_ = false;
            if (success) {
                failure_count_ = 0;
                transition_locked(CircuitState::CLOSED, pending);
            } else {
                ++failure_count_;
                last_failure_time_ = clock_->now();
                transition_locked(CircuitState::OPEN, pending);
            }
            return;

        case CircuitState::OPEN:
            if (!success) {
                last_failure_time_ = clock_->now();
            }
            return;
    }
}

void CircuitBreaker::transition_locked(CircuitState to,
                                       std::vector<StateChangeEvent>& pending) {
    if (state_ == to) {
        return;
    }

    const auto now = clock_->now();
    pending.push_back(StateChangeEvent{
        .from = state_,
        .to = to,
        .timestamp = now,
        .breaker_name = name_
    });

    state_ = to;
    if (to == CircuitState::OPEN) {
        opened_at_ = now;
        ++times_opened_;
    }
}

void CircuitBreaker::publish(const std::vector<StateChangeEvent>& events) {
    if (events.empty()) {
        return;
    }

    StateChangeCallback cb;
    {
        std::lock_guard<std::mutex> lock(events_mutex_);
        for (const auto& event : events) {
            recent_events_.push_back(event);
            if (recent_events_.size() > kMaxRecentEvents) {
                recent_events_.pop_front();
            }
        }
        cb = on_state_change_;
    }

    for (const auto& event : events) {
        const auto msg = std::format("Circuit breaker '{}': {} -> {}",
            event.breaker_name,
            circuit_state_to_string(event.from),
            circuit_state_to_string(event.to));
        if (event.to == CircuitState::OPEN) {
            utils::log::warn(msg);
        } else {
            utils::log::info(msg);
        }
        if (cb) {
            cb(event);
        }
    }
}

CircuitState CircuitBreaker::get_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool CircuitBreaker::is_available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_) {
        case CircuitState::CLOSED:
            return true;
        case CircuitState::OPEN:
            return clock_->now() - last_failure_time_ >= config_.timeout;
        case CircuitState::HALF_OPEN:
            return !probe_in_flight_;
    }
    return false;
}

uint32_t CircuitBreaker::failure_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_count_;
}

CircuitBreakerStats CircuitBreaker::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CircuitBreakerStats stats;
    stats.state = state_;
    stats.failure_count = failure_count_;
    stats.total_successes = total_successes_;
    stats.total_failures = total_failures_;
    stats.rejected_calls = rejected_calls_;
    stats.times_opened = times_opened_;
    stats.last_failure = last_failure_time_;
    stats.opened_at = opened_at_;
    return stats;
}

void CircuitBreaker::reset() {
    std::vector<StateChangeEvent> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transition_locked(CircuitState::CLOSED, pending);
        failure_count_ = 0;
        probe_in_flight_ = false;
        last_failure_time_ = {};
        opened_at_ = {};
        total_successes_ = 0;
        total_failures_ = 0;
        rejected_calls_ = 0;
        times_opened_ = 0;
    }
    publish(pending);
}

void CircuitBreaker::set_on_state_change(StateChangeCallback cb) {
    std::lock_guard<std::mutex> lock(events_mutex_);
    on_state_change_ = std::move(cb);
}

std::vector<StateChangeEvent> CircuitBreaker::get_recent_events() const {
    std::lock_guard<std::mutex> lock(events_mutex_);
    return {recent_events_.begin(), recent_events_.end()};
}

} // namespace llmguard
