#include "failover/latency_tracker.hpp"

#include <stdexcept>

namespace llmguard {

LatencyTracker::LatencyTracker(std::shared_ptr<IClock> clock)
    : clock_(std::move(clock)) {
    if (!clock_) {
        throw std::invalid_argument("latency tracker requires a clock");
    }
}

void LatencyTracker::record_latency(const std::string& provider_id,
                                    std::chrono::microseconds latency) {
    const auto now = clock_->now();

    std::unique_lock lock(mutex_);
    auto [it, inserted] = latencies_.try_emplace(provider_id);
    auto& entry = it->second;
    if (inserted) {
        entry.provider_id = provider_id;
    }

    if (entry.sample_count == 0) {
        entry.average = latency;
        entry.min = latency;
        entry.max = latency;
    } else {
        const double smoothed =
            static_cast<double>(entry.average.count()) * (1.0 - kSmoothingFactor) +
            static_cast<double>(latency.count()) * kSmoothingFactor;
        entry.average = std::chrono::microseconds(static_cast<int64_t>(smoothed));
        if (latency < entry.min) entry.min = latency;
        if (latency > entry.max) entry.max = latency;
    }

    ++entry.sample_count;
    entry.last_updated = now;
}

std::optional<ProviderLatency> LatencyTracker::get_latency_stats(
    const std::string& provider_id) const {
    std::shared_lock lock(mutex_);
    const auto it = latencies_.find(provider_id);
    if (it == latencies_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ProviderLatency> LatencyTracker::get_all_latency_stats() const {
    std::shared_lock lock(mutex_);
    std::vector<ProviderLatency> result;
    result.reserve(latencies_.size());
    for (const auto& [id, entry] : latencies_) {
        result.push_back(entry);
    }
    return result;
}

std::string LatencyTracker::get_fastest_provider(
    const std::vector<std::string>& provider_ids) const {
    std::shared_lock lock(mutex_);
    const ProviderLatency* best = nullptr;
    for (const auto& id : provider_ids) {
        const auto it = latencies_.find(id);
        if (it == latencies_.end()) continue;
        // Strict comparison keeps the earlier candidate on ties
        if (!best || it->second.average < best->average) {
            best = &it->second;
        }
    }
    return best ? best->provider_id : std::string{};
}

void LatencyTracker::forget(const std::string& provider_id) {
    std::unique_lock lock(mutex_);
    latencies_.erase(provider_id);
}

} // namespace llmguard
