#pragma once

#include "core/clock.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace llmguard {

/**
 * @brief Fixed-window request counter keyed by an opaque identifier
 *
 * Each identifier gets {count, window_start}. A request that arrives once
 * the window has elapsed starts a fresh window before it is counted.
 * Denied requests still count, so a client hammering a closed window does
 * not get a larger budget for it.
 *
 * Identifiers are spread over independently locked shards; two identifiers
 * in different shards never contend.
 */
class RateLimiter {
public:
    struct Config {
        std::chrono::milliseconds window;
        uint32_t limit;
        uint32_t cleanup_interval_seconds;  // 0 = no background eviction
        size_t num_shards;

        Config()
            : window(60000),
              limit(60),
              cleanup_interval_seconds(0),
              num_shards(16) {}
    };

    struct Stats {
        uint64_t total_checks;
        uint64_t rejects;
        uint64_t evicted;
        size_t tracked_identifiers;
    };

    /**
     * @throws std::invalid_argument when window <= 0, limit == 0 or clock is null
     */
    RateLimiter(std::chrono::milliseconds window, uint32_t limit,
                std::shared_ptr<IClock> clock = default_clock());

    explicit RateLimiter(const Config& config,
                         std::shared_ptr<IClock> clock = default_clock());

    ~RateLimiter();

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /**
     * @brief Count one request for identifier
     * @return true if the request fits in the current window
     */
    [[nodiscard]] bool allow(const std::string& identifier);

    /**
     * @brief Requests left in the current window, never negative
     *
     * Unseen identifiers and identifiers whose window has elapsed report
     * the full limit.
     */
    [[nodiscard]] uint32_t get_remaining_requests(const std::string& identifier) const;

    /**
     * @brief When the identifier's current window ends (now + window if unseen)
     */
    [[nodiscard]] IClock::time_point get_reset_time(const std::string& identifier) const;

    uint32_t limit() const { return config_.limit; }
    std::chrono::milliseconds window() const { return config_.window; }

    void reset(const std::string& identifier);
    void reset_all();

    /**
     * @brief Drop identifiers whose window has ended
     * @return Number of identifiers removed
     */
    size_t evict_expired();

    [[nodiscard]] Stats get_stats() const;

private:
    struct WindowState {
        uint32_t count = 0;
        IClock::time_point window_start{};
    };

    class Shard {
    public:
        mutable std::mutex mutex;
        std::unordered_map<std::string, WindowState> windows;
    };

    [[nodiscard]] Shard& select_shard(const std::string& identifier) const;
    [[nodiscard]] bool expired(const WindowState& state, IClock::time_point now) const;

    void cleanup_loop();

    Config config_;
    std::shared_ptr<IClock> clock_;
    std::vector<std::unique_ptr<Shard>> shards_;

    std::atomic<uint64_t> total_checks_{0};
    std::atomic<uint64_t> rejects_{0};
    std::atomic<uint64_t> evicted_{0};

    // Background eviction
    std::thread cleanup_thread_;
    std::atomic<bool> cleanup_running_{false};
    std::mutex cleanup_mutex_;
    std::condition_variable cleanup_cv_;
};

/**
 * @brief Per-client-IP limiter with its own counter table
 */
class IpRateLimiter {
public:
    explicit IpRateLimiter(uint32_t requests_per_window,
                           std::chrono::milliseconds window = std::chrono::minutes(1),
                           std::shared_ptr<IClock> clock = default_clock());

    explicit IpRateLimiter(const RateLimiter::Config& config,
                           std::shared_ptr<IClock> clock = default_clock());

    [[nodiscard]] bool allow_ip(const std::string& ip) { return limiter_.allow(ip); }

    RateLimiter& limiter() { return limiter_; }
    const RateLimiter& limiter() const { return limiter_; }

private:
    RateLimiter limiter_;
};

/**
 * @brief Per-credential limiter with its own counter table
 */
class ApiKeyRateLimiter {
public:
    explicit ApiKeyRateLimiter(uint32_t requests_per_window,
                               std::chrono::milliseconds window = std::chrono::minutes(1),
                               std::shared_ptr<IClock> clock = default_clock());

    explicit ApiKeyRateLimiter(const RateLimiter::Config& config,
                               std::shared_ptr<IClock> clock = default_clock());

    [[nodiscard]] bool allow_api_key(const std::string& api_key) { return limiter_.allow(api_key); }

    RateLimiter& limiter() { return limiter_; }
    const RateLimiter& limiter() const { return limiter_; }

private:
    RateLimiter limiter_;
};

} // namespace llmguard
