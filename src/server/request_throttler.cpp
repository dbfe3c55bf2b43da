#include "server/request_throttler.hpp"
#include "server/http_constants.hpp"

#include <algorithm>

namespace llmguard {

namespace {

RateLimiter::Config limiter_config(const RequestThrottler::Config& config, uint32_t limit) {
    RateLimiter::Config c;
    c.window = config.window;
    c.limit = limit;
    c.cleanup_interval_seconds = config.cleanup_interval_seconds;
    return c;
}

} // anonymous namespace

RequestThrottler::RequestThrottler(const Config& config, std::shared_ptr<IClock> clock)
    : config_(config),
      clock_(clock),
      global_limiter_([&] {
          // One key only: no need to shard or evict
          auto c = limiter_config(config, config.global_limit);
          c.num_shards = 1;
          c.cleanup_interval_seconds = 0;
          return c;
      }(), clock),
      ip_limiter_(limiter_config(config, config.ip_limit), clock),
      api_key_limiter_(limiter_config(config, config.api_key_limit), clock) {}

ThrottleResult RequestThrottler::check_request(const std::string& ip, const std::string& api_key) {
    total_checks_.fetch_add(1, std::memory_order_relaxed);

    // Level 1: Global
    if (!global_limiter_.allow(kGlobalKey)) {
        global_rejects_.fetch_add(1, std::memory_order_relaxed);
        return ThrottleResult{false, "Global rate limit exceeded", ThrottleLevel::GLOBAL,
                              retry_after(global_limiter_, kGlobalKey)};
    }

    // Level 2: Per-IP
    if (!ip_limiter_.allow_ip(ip)) {
        ip_rejects_.fetch_add(1, std::memory_order_relaxed);
        return ThrottleResult{false, "IP rate limit exceeded", ThrottleLevel::IP,
                              retry_after(ip_limiter_.limiter(), ip)};
    }

    // Level 3: Per-API-key
    if (!api_key.empty() && !api_key_limiter_.allow_api_key(api_key)) {
        api_key_rejects_.fetch_add(1, std::memory_order_relaxed);
        return ThrottleResult{false, "API key rate limit exceeded", ThrottleLevel::API_KEY,
                              retry_after(api_key_limiter_.limiter(), api_key)};
    }

    return ThrottleResult{};
}

std::map<std::string, std::string> RequestThrottler::get_rate_limit_headers(
    const std::string& ip, const std::string& api_key) const {
    std::map<std::string, std::string> headers;

    headers[http::kGlobalLimitHeader] = std::to_string(global_limiter_.limit());
    headers[http::kIpLimitHeader] = std::to_string(ip_limiter_.limiter().limit());
    headers[http::kIpRemainingHeader] =
        std::to_string(ip_limiter_.limiter().get_remaining_requests(ip));

    const auto reset_in = std::chrono::ceil<std::chrono::seconds>(
        ip_limiter_.limiter().get_reset_time(ip) - clock_->now());
    headers[http::kResetHeader] = std::to_string(std::max<int64_t>(reset_in.count(), 0));

    if (!api_key.empty()) {
        headers[http::kApiKeyLimitHeader] = std::to_string(api_key_limiter_.limiter().limit());
        headers[http::kApiKeyRemainingHeader] =
            std::to_string(api_key_limiter_.limiter().get_remaining_requests(api_key));
    }

    return headers;
}

std::chrono::milliseconds RequestThrottler::retry_after(const RateLimiter& limiter,
                                                        const std::string& identifier) const {
    const auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(
        limiter.get_reset_time(identifier) - clock_->now());
    return std::max(wait, std::chrono::milliseconds(0));
}

RequestThrottler::Stats RequestThrottler::get_stats() const {
    return {
        .total_checks = total_checks_.load(std::memory_order_relaxed),
        .global_rejects = global_rejects_.load(std::memory_order_relaxed),
        .ip_rejects = ip_rejects_.load(std::memory_order_relaxed),
        .api_key_rejects = api_key_rejects_.load(std::memory_order_relaxed),
    };
}

} // namespace llmguard
