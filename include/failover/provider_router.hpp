#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "failover/health_checker.hpp"
#include "failover/latency_tracker.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace llmguard {

/**
 * @brief Snapshot of one provider for status endpoints
 */
struct ProviderStatus {
    std::string provider_id;
    std::string endpoint;
    CircuitState circuit_state;
    bool available;
    uint32_t failure_count;
    std::chrono::microseconds average_latency;
    uint64_t latency_samples;
};

/**
 * @brief Spreads traffic over available providers and feeds call outcomes
 *        back into the breakers and the latency tracker.
 *
 * Healthy candidates are ordered by average latency (unmeasured first). The
 * fastest 70% of them receive 70% of the selections, the remainder the rest,
 * so slower providers keep producing fresh latency samples.
 *
 * Selecting a provider claims its breaker admission. A provider recovering
 * from OPEN is handed to exactly one caller as a trial; report_success() or
 * report_failure() settles it.
 */
class ProviderRouter {
public:
    /// Uniform draw in [0, 1)
    using RandomSource = std::function<double()>;

    static constexpr double kFastTierShare = 0.7;

    /**
     * @param random Selection randomness; nullptr uses a std::mt19937_64
     *        seeded from std::random_device
     * @throws std::invalid_argument when a collaborator is null
     */
    ProviderRouter(std::shared_ptr<HealthChecker> health_checker,
                   std::shared_ptr<LatencyTracker> latency_tracker,
                   RandomSource random = nullptr);

    /**
     * @brief Choose among candidates
     *
     * Unregistered candidates and candidates whose breaker rejects the call
     * are skipped.
     */
    [[nodiscard]] Result<std::string> select_provider(
        const std::vector<std::string>& candidates);

    /**
     * @brief select_provider() over every registered provider
     */
    [[nodiscard]] Result<std::string> select_any();

    void report_success(const std::string& provider_id, std::chrono::microseconds latency);
    void report_failure(const std::string& provider_id);

    [[nodiscard]] std::vector<ProviderStatus> provider_status() const;

private:
    [[nodiscard]] size_t pick_index(size_t count);
    void settle(const std::string& provider_id, const std::shared_ptr<CircuitBreaker>& breaker,
                bool success);

    std::shared_ptr<HealthChecker> health_checker_;
    std::shared_ptr<LatencyTracker> latency_tracker_;

    std::mutex random_mutex_;
    RandomSource random_;

    // Providers whose HALF_OPEN trial was handed out and not yet reported
    std::mutex trials_mutex_;
    std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> trials_;
};

} // namespace llmguard
