#pragma once

#include "core/clock.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace llmguard {

struct ProviderLatency {
    std::string provider_id;
    uint64_t sample_count = 0;
    std::chrono::microseconds average{0};   // Exponential moving average
    std::chrono::microseconds min{0};
    std::chrono::microseconds max{0};
    IClock::time_point last_updated{};
};

/**
 * @brief Per-provider response latency, smoothed with an EMA (alpha 0.1)
 */
class LatencyTracker {
public:
    static constexpr double kSmoothingFactor = 0.1;

    explicit LatencyTracker(std::shared_ptr<IClock> clock = default_clock());

    void record_latency(const std::string& provider_id, std::chrono::microseconds latency);

    [[nodiscard]] std::optional<ProviderLatency> get_latency_stats(
        const std::string& provider_id) const;

    [[nodiscard]] std::vector<ProviderLatency> get_all_latency_stats() const;

    /**
     * @return Candidate with the lowest average, or empty if none has samples
     */
    [[nodiscard]] std::string get_fastest_provider(
        const std::vector<std::string>& provider_ids) const;

    void forget(const std::string& provider_id);

private:
    std::shared_ptr<IClock> clock_;
    std::unordered_map<std::string, ProviderLatency> latencies_;
    mutable std::shared_mutex mutex_;
};

} // namespace llmguard
