#pragma once

#include "core/clock.hpp"
#include "core/types.hpp"
#include "server/rate_limiter.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace llmguard {

/**
 * @brief Three-level admission control for inbound requests
 *
 * Levels are checked in order, and the first denial wins:
 * 1. Global   - one shared counter for the whole process
 * 2. Per-IP   - keyed by client IP
 * 3. Per-key  - keyed by API key, skipped when no key is presented
 *
 * A request denied at a later level has already been counted at the
 * earlier ones.
 */
class RequestThrottler {
public:
    struct Config {
        std::chrono::milliseconds window;
        uint32_t global_limit;
        uint32_t ip_limit;
        uint32_t api_key_limit;
        uint32_t cleanup_interval_seconds;  // 0 = no background eviction

        Config()
            : window(60000),
              global_limit(1000),
              ip_limit(60),
              api_key_limit(100),
              cleanup_interval_seconds(0) {}
    };

    struct Stats {
        uint64_t total_checks;
        uint64_t global_rejects;
        uint64_t ip_rejects;
        uint64_t api_key_rejects;
    };

    static constexpr const char* kGlobalKey = "global";

    explicit RequestThrottler(const Config& config = Config(),
                              std::shared_ptr<IClock> clock = default_clock());

    /**
     * @brief Admit or deny one request
     * @param ip Client IP
     * @param api_key Presented credential, empty if none
     */
    [[nodiscard]] ThrottleResult check_request(const std::string& ip, const std::string& api_key);

    /**
     * @brief Response headers describing the caller's limits
     *
     * API key headers are present only when api_key is non-empty.
     */
    [[nodiscard]] std::map<std::string, std::string> get_rate_limit_headers(
        const std::string& ip, const std::string& api_key) const;

    [[nodiscard]] Stats get_stats() const;

    const Config& config() const { return config_; }

    RateLimiter& global_limiter() { return global_limiter_; }
    IpRateLimiter& ip_limiter() { return ip_limiter_; }
    ApiKeyRateLimiter& api_key_limiter() { return api_key_limiter_; }

private:
    [[nodiscard]] std::chrono::milliseconds retry_after(const RateLimiter& limiter,
                                                        const std::string& identifier) const;

    Config config_;
    std::shared_ptr<IClock> clock_;

    RateLimiter global_limiter_;
    IpRateLimiter ip_limiter_;
    ApiKeyRateLimiter api_key_limiter_;

    std::atomic<uint64_t> total_checks_{0};
    std::atomic<uint64_t> global_rejects_{0};
    std::atomic<uint64_t> ip_rejects_{0};
    std::atomic<uint64_t> api_key_rejects_{0};
};

} // namespace llmguard
