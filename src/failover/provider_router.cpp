#include "failover/provider_router.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <random>
#include <stdexcept>

namespace llmguard {

namespace {

ProviderRouter::RandomSource make_default_random() {
    auto engine = std::make_shared<std::mt19937_64>(std::random_device{}());
    return [engine]() {
        return std::uniform_real_distribution<double>(0.0, 1.0)(*engine);
    };
}

struct Candidate {
    std::string id;
    std::shared_ptr<CircuitBreaker> breaker;
    std::chrono::microseconds latency;
};

} // anonymous namespace

ProviderRouter::ProviderRouter(std::shared_ptr<HealthChecker> health_checker,
                               std::shared_ptr<LatencyTracker> latency_tracker,
                               RandomSource random)
    : health_checker_(std::move(health_checker)),
      latency_tracker_(std::move(latency_tracker)),
      random_(random ? std::move(random) : make_default_random()) {
    if (!health_checker_ || !latency_tracker_) {
        throw std::invalid_argument("provider router requires a health checker and latency tracker");
    }
}

Result<std::string> ProviderRouter::select_provider(
    const std::vector<std::string>& candidates) {
    if (candidates.empty()) {
        return Result<std::string>::error(ErrorCategory::NO_HEALTHY_PROVIDER,
            "no providers available for model");
    }

    std::vector<Candidate> healthy;
    healthy.reserve(candidates.size());
    for (const auto& id : candidates) {
        auto breaker = health_checker_->get_circuit_breaker(id);
        if (!breaker || !breaker->is_available()) continue;

        const auto stats = latency_tracker_->get_latency_stats(id);
        healthy.push_back(Candidate{
            .id = id,
            .breaker = std::move(breaker),
            .latency = stats ? stats->average : std::chrono::microseconds{0},
        });
    }

    std::stable_sort(healthy.begin(), healthy.end(),
        [](const Candidate& a, const Candidate& b) { return a.latency < b.latency; });

    // A candidate can lose its admission between is_available() and
    // try_acquire() (another caller took the trial); drop it and pick again
    while (!healthy.empty()) {
        const size_t idx = pick_index(healthy.size());
        const auto& chosen = healthy[idx];

        const auto admission = chosen.breaker->try_acquire();
        if (admission == CircuitBreaker::Admission::TRIAL) {
            std::lock_guard<std::mutex> lock(trials_mutex_);
            trials_[chosen.id] = chosen.breaker;
        }
        if (admission != CircuitBreaker::Admission::REJECT) {
            return Result<std::string>::ok(chosen.id);
        }
        healthy.erase(healthy.begin() + static_cast<std::ptrdiff_t>(idx));
    }

    return Result<std::string>::error(ErrorCategory::NO_HEALTHY_PROVIDER,
        "no healthy providers available");
}

Result<std::string> ProviderRouter::select_any() {
    return select_provider(health_checker_->provider_ids());
}

size_t ProviderRouter::pick_index(size_t count) {
    if (count == 1) {
        return 0;
    }

    const size_t fast_count = std::max<size_t>(
        1, static_cast<size_t>(static_cast<double>(count) * kFastTierShare));

    double tier_draw = 0.0;
    double slot_draw = 0.0;
    {
        std::lock_guard<std::mutex> lock(random_mutex_);
        tier_draw = random_();
        slot_draw = random_();
    }

    size_t begin = 0;
    size_t size = fast_count;
    if (tier_draw >= kFastTierShare && fast_count < count) {
        begin = fast_count;
        size = count - fast_count;
    }
    const auto slot = static_cast<size_t>(slot_draw * static_cast<double>(size));
    return begin + std::min(slot, size - 1);
}

void ProviderRouter::report_success(const std::string& provider_id,
                                    std::chrono::microseconds latency) {
    latency_tracker_->record_latency(provider_id, latency);
    if (auto breaker = health_checker_->get_circuit_breaker(provider_id)) {
        settle(provider_id, breaker, true);
    }
}

void ProviderRouter::report_failure(const std::string& provider_id) {
    const auto breaker = health_checker_->get_circuit_breaker(provider_id);
    if (!breaker) {
        utils::log::warn(std::format("ProviderRouter: failure reported for unknown provider '{}'",
                                     provider_id));
        return;
    }
    settle(provider_id, breaker, false);
}

void ProviderRouter::settle(const std::string& provider_id,
                            const std::shared_ptr<CircuitBreaker>& breaker, bool success) {
    bool trial = false;
    {
        std::lock_guard<std::mutex> lock(trials_mutex_);
        const auto it = trials_.find(provider_id);
        // A re-registered provider has a new breaker; its old trial is moot
        if (it != trials_.end()) {
            trial = it->second == breaker;
            trials_.erase(it);
        }
    }
    breaker->release(trial ? CircuitBreaker::Admission::TRIAL
                           : CircuitBreaker::Admission::NORMAL,
                     success);
}

std::vector<ProviderStatus> ProviderRouter::provider_status() const {
    std::vector<ProviderStatus> result;
    for (const auto& id : health_checker_->provider_ids()) {
        const auto breaker = health_checker_->get_circuit_breaker(id);
        if (!breaker) continue;  // Removed since the id snapshot

        const auto stats = breaker->get_stats();
        const auto latency = latency_tracker_->get_latency_stats(id);
        result.push_back(ProviderStatus{
            .provider_id = id,
            .endpoint = health_checker_->get_endpoint(id),
            .circuit_state = stats.state,
            .available = breaker->is_available(),
            .failure_count = stats.failure_count,
            .average_latency = latency ? latency->average : std::chrono::microseconds{0},
            .latency_samples = latency ? latency->sample_count : 0,
        });
    }
    return result;
}

} // namespace llmguard
