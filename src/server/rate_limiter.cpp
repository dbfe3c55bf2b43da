#include "server/rate_limiter.hpp"
#include "core/utils.hpp"

#include <format>
#include <functional>
#include <stdexcept>

namespace llmguard {

namespace {

RateLimiter::Config make_config(std::chrono::milliseconds window, uint32_t limit) {
    RateLimiter::Config config;
    config.window = window;
    config.limit = limit;
    return config;
}

} // anonymous namespace

RateLimiter::RateLimiter(std::chrono::milliseconds window, uint32_t limit,
                         std::shared_ptr<IClock> clock)
    : RateLimiter(make_config(window, limit), std::move(clock)) {}

RateLimiter::RateLimiter(const Config& config, std::shared_ptr<IClock> clock)
    : config_(config),
      clock_(std::move(clock)) {
    if (config_.window.count() <= 0) {
        throw std::invalid_argument("rate limiter window must be positive");
    }
    if (config_.limit == 0) {
        throw std::invalid_argument("rate limiter limit must be >= 1");
    }
    if (!clock_) {
        throw std::invalid_argument("rate limiter requires a clock");
    }
    if (config_.num_shards == 0) {
        config_.num_shards = 1;
    }

    shards_.reserve(config_.num_shards);
    for (size_t i = 0; i < config_.num_shards; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }

    if (config_.cleanup_interval_seconds > 0) {
        cleanup_running_.store(true, std::memory_order_release);
        cleanup_thread_ = std::thread([this]() { cleanup_loop(); });
    }
}

RateLimiter::~RateLimiter() {
    {
        std::lock_guard<std::mutex> lock(cleanup_mutex_);
        cleanup_running_.store(false, std::memory_order_release);
    }
    cleanup_cv_.notify_all();
    if (cleanup_thread_.joinable()) {
        cleanup_thread_.join();
    }
}

RateLimiter::Shard& RateLimiter::select_shard(const std::string& identifier) const {
    return *shards_[std::hash<std::string>{}(identifier) % shards_.size()];
}

bool RateLimiter::expired(const WindowState& state, IClock::time_point now) const {
    return now - state.window_start >= config_.window;
}

bool RateLimiter::allow(const std::string& identifier) {
    total_checks_.fetch_add(1, std::memory_order_relaxed);
    const auto now = clock_->now();

    auto& shard = select_shard(identifier);
    bool allowed = false;
    {
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto [it, inserted] = shard.windows.try_emplace(identifier);
        auto& state = it->second;
        if (inserted || expired(state, now)) {
            state.count = 0;
            state.window_start = now;
        }
        // Saturate one past the limit
        if (state.count <= config_.limit) {
            ++state.count;
        }
        allowed = state.count <= config_.limit;
    }

    if (!allowed) {
        rejects_.fetch_add(1, std::memory_order_relaxed);
    }
    return allowed;
}

uint32_t RateLimiter::get_remaining_requests(const std::string& identifier) const {
    const auto now = clock_->now();
    const auto& shard = select_shard(identifier);

    std::lock_guard<std::mutex> lock(shard.mutex);
    const auto it = shard.windows.find(identifier);
    if (it == shard.windows.end() || expired(it->second, now)) {
        return config_.limit;
    }
    const uint32_t count = it->second.count;
    return count >= config_.limit ? 0 : config_.limit - count;
}

IClock::time_point RateLimiter::get_reset_time(const std::string& identifier) const {
    const auto now = clock_->now();
    const auto& shard = select_shard(identifier);

    std::lock_guard<std::mutex> lock(shard.mutex);
    const auto it = shard.windows.find(identifier);
    if (it == shard.windows.end() || expired(it->second, now)) {
        return now + config_.window;
    }
    return it->second.window_start + config_.window;
}

void RateLimiter::reset(const std::string& identifier) {
    auto& shard = select_shard(identifier);
    std::lock_guard<std::mutex> lock(shard.mutex);
    shard.windows.erase(identifier);
}

void RateLimiter::reset_all() {
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        shard->windows.clear();
    }
}

size_t RateLimiter::evict_expired() {
    const auto now = clock_->now();
    size_t evicted = 0;

    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        for (auto it = shard->windows.begin(); it != shard->windows.end(); ) {
            if (expired(it->second, now)) {
                it = shard->windows.erase(it);
                ++evicted;
            } else {
                ++it;
            }
        }
    }

    evicted_.fetch_add(evicted, std::memory_order_relaxed);
    return evicted;
}

RateLimiter::Stats RateLimiter::get_stats() const {
    size_t tracked = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        tracked += shard->windows.size();
    }
    return {
        .total_checks = total_checks_.load(std::memory_order_relaxed),
        .rejects = rejects_.load(std::memory_order_relaxed),
        .evicted = evicted_.load(std::memory_order_relaxed),
        .tracked_identifiers = tracked,
    };
}

void RateLimiter::cleanup_loop() {
    while (cleanup_running_.load(std::memory_order_acquire)) {
        // Wait for cleanup interval or shutdown signal
        {
            std::unique_lock<std::mutex> lock(cleanup_mutex_);
            cleanup_cv_.wait_for(lock,
                std::chrono::seconds(config_.cleanup_interval_seconds),
                [this]() { return !cleanup_running_.load(std::memory_order_acquire); });
        }

        if (!cleanup_running_.load(std::memory_order_acquire)) break;

        const size_t evicted = evict_expired();
        if (evicted > 0) {
            utils::log::debug(std::format("RateLimiter: evicted {} expired windows", evicted));
        }
    }
}

// ============================================================================
// IpRateLimiter / ApiKeyRateLimiter
// ============================================================================

IpRateLimiter::IpRateLimiter(uint32_t requests_per_window,
                             std::chrono::milliseconds window,
                             std::shared_ptr<IClock> clock)
    : limiter_(window, requests_per_window, std::move(clock)) {}

IpRateLimiter::IpRateLimiter(const RateLimiter::Config& config,
                             std::shared_ptr<IClock> clock)
    : limiter_(config, std::move(clock)) {}

ApiKeyRateLimiter::ApiKeyRateLimiter(uint32_t requests_per_window,
                                     std::chrono::milliseconds window,
                                     std::shared_ptr<IClock> clock)
    : limiter_(window, requests_per_window, std::move(clock)) {}

ApiKeyRateLimiter::ApiKeyRateLimiter(const RateLimiter::Config& config,
                                     std::shared_ptr<IClock> clock)
    : limiter_(config, std::move(clock)) {}

} // namespace llmguard
