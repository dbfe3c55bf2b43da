#pragma once

#include "core/clock.hpp"
#include "failover/circuit_breaker.hpp"
#include "failover/health_probe.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace llmguard {

/**
 * @brief Registry of per-provider circuit breakers plus a background
 *        health sweep that feeds probe results into them.
 *
 * The registry is read-heavy (every outbound call looks up a breaker), so it
 * sits behind a shared_mutex with a shared_lock fast path. The sweep
 * snapshots the registry under the shared lock and probes outside it.
 *
 * The checker owns the breakers it creates. A breaker handed out by
 * get_circuit_breaker() stays valid for its holder after remove_provider().
 */
class HealthChecker {
public:
    struct Config {
        std::chrono::milliseconds check_interval;       // Sweep period
        std::chrono::milliseconds stop_grace_period;    // stop() wait bound
        CircuitBreaker::Config breaker;                 // Applied to new breakers

        Config()
            : check_interval(30000),
              stop_grace_period(15000) {}
    };

    struct Stats {
        uint64_t sweeps;
        uint64_t probes;
        uint64_t probe_failures;
    };

    /**
     * @param config Sweep and breaker settings
     * @param probe Endpoint probe (HttpHealthProbe with a 10s timeout when null)
     * @param clock Time source handed to every breaker
     */
    explicit HealthChecker(const Config& config = Config(),
                           std::shared_ptr<IHealthProbe> probe = nullptr,
                           std::shared_ptr<IClock> clock = default_clock());

    ~HealthChecker();

    HealthChecker(const HealthChecker&) = delete;
    HealthChecker& operator=(const HealthChecker&) = delete;

    /**
     * @brief Register a provider. Idempotent: an existing breaker is kept.
     *
     * A non-empty endpoint replaces the stored one. Providers without an
     * endpoint get a breaker but are skipped by the sweep.
     */
    void add_provider(const std::string& provider_id, const std::string& endpoint = "");

    /**
     * @brief Drop a provider and its breaker. No-op if absent.
     */
    void remove_provider(const std::string& provider_id);

    /**
     * @return The provider's breaker, or nullptr if not registered
     */
    [[nodiscard]] std::shared_ptr<CircuitBreaker> get_circuit_breaker(
        const std::string& provider_id) const;

    /**
     * @return IDs whose breaker is available, sorted
     */
    [[nodiscard]] std::vector<std::string> get_healthy_providers() const;

    [[nodiscard]] std::vector<std::string> provider_ids() const;
    [[nodiscard]] std::string get_endpoint(const std::string& provider_id) const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] std::vector<std::pair<std::string, CircuitBreakerStats>> get_all_stats() const;

    /**
     * @brief Start the background sweep. No-op if already running.
     */
    void start();

    /**
     * @brief Stop the sweep and wait for it to acknowledge.
     *
     * Safe when never started and when called repeatedly.
     */
    void stop();

    [[nodiscard]] bool is_running() const { return running_.load(std::memory_order_acquire); }

    /**
     * @brief Run one sweep synchronously over every provider with an endpoint
     */
    void perform_health_checks();

    /**
     * @brief Probe one URL. Every failure mode, malformed URL included, is false.
     */
    [[nodiscard]] bool check_provider_endpoint(const std::string& url);

    /**
     * @brief Feed a probe result into the provider's breaker. No-op if unknown.
     */
    void update_provider_health(const std::string& provider_id, bool healthy);

    [[nodiscard]] Stats get_stats() const;

    const Config& config() const { return config_; }

private:
    struct ProviderEntry {
        std::string endpoint;
        std::shared_ptr<CircuitBreaker> breaker;
    };

    void sweep_loop();
    void run_sweep(bool honour_stop);

    Config config_;
    std::shared_ptr<IHealthProbe> probe_;
    std::shared_ptr<IClock> clock_;

    std::unordered_map<std::string, ProviderEntry> providers_;
    mutable std::shared_mutex providers_mutex_;

    // Background sweep
    std::atomic<bool> running_{false};
    std::thread sweep_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool sweep_exited_ = false;           // Guarded by cv_mutex_
    std::condition_variable exited_cv_;
    std::mutex lifecycle_mutex_;          // Serializes start()/stop()

    std::atomic<uint64_t> sweeps_{0};
    std::atomic<uint64_t> probes_{0};
    std::atomic<uint64_t> probe_failures_{0};
};

} // namespace llmguard
