#pragma once

#include <chrono>
#include <memory>

namespace llmguard {

/**
 * @brief Source of monotonic time for breakers and limiters.
 *
 * Every cooldown and window comparison goes through this interface so
 * tests can advance time without sleeping.
 */
class IClock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~IClock() = default;

    [[nodiscard]] virtual time_point now() const = 0;
};

class SteadyClock final : public IClock {
public:
    [[nodiscard]] time_point now() const override {
        return std::chrono::steady_clock::now();
    }
};

/// Process-wide default clock, shared by components built without one.
inline std::shared_ptr<IClock> default_clock() {
    static const std::shared_ptr<IClock> clock = std::make_shared<SteadyClock>();
    return clock;
}

} // namespace llmguard
