#include "failover/health_checker.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace llmguard {

HealthChecker::HealthChecker(const Config& config,
                             std::shared_ptr<IHealthProbe> probe,
                             std::shared_ptr<IClock> clock)
    : config_(config),
      probe_(std::move(probe)),
      clock_(std::move(clock)) {
    if (config_.check_interval.count() <= 0) {
        throw std::invalid_argument("health check interval must be positive");
    }
    if (!clock_) {
        throw std::invalid_argument("health checker requires a clock");
    }
    if (!probe_) {
        probe_ = std::make_shared<HttpHealthProbe>();
    }
}

HealthChecker::~HealthChecker() {
    stop();
}

// ============================================================================
// Registry
// ============================================================================

void HealthChecker::add_provider(const std::string& provider_id, const std::string& endpoint) {
    // Fast path: already registered with this endpoint
    {
        std::shared_lock lock(providers_mutex_);
        const auto it = providers_.find(provider_id);
        if (it != providers_.end() && (endpoint.empty() || it->second.endpoint == endpoint)) {
            return;
        }
    }

    // Slow path: unique lock + try_emplace
    bool inserted = false;
    {
        std::unique_lock lock(providers_mutex_);
        auto [it, was_inserted] = providers_.try_emplace(provider_id);
        inserted = was_inserted;
        if (inserted) {
            it->second.breaker = std::make_shared<CircuitBreaker>(
                provider_id, config_.breaker, clock_);
        }
        if (!endpoint.empty()) {
            it->second.endpoint = endpoint;
        }
    }

    if (inserted) {
        utils::log::info(std::format("HealthChecker: registered provider '{}'{}",
            provider_id, endpoint.empty() ? "" : std::format(" ({})", endpoint)));
    }
}

void HealthChecker::remove_provider(const std::string& provider_id) {
    size_t erased = 0;
    {
        std::unique_lock lock(providers_mutex_);
        erased = providers_.erase(provider_id);
    }
    if (erased > 0) {
        utils::log::info(std::format("HealthChecker: removed provider '{}'", provider_id));
    }
}

std::shared_ptr<CircuitBreaker> HealthChecker::get_circuit_breaker(
    const std::string& provider_id) const {
    std::shared_lock lock(providers_mutex_);
    const auto it = providers_.find(provider_id);
    return it != providers_.end() ? it->second.breaker : nullptr;
}

std::vector<std::string> HealthChecker::get_healthy_providers() const {
    std::vector<std::string> healthy;
    {
        std::shared_lock lock(providers_mutex_);
        healthy.reserve(providers_.size());
        for (const auto& [id, entry] : providers_) {
            if (entry.breaker->is_available()) {
                healthy.push_back(id);
            }
        }
    }
    std::sort(healthy.begin(), healthy.end());
    return healthy;
}

std::vector<std::string> HealthChecker::provider_ids() const {
    std::vector<std::string> ids;
    {
        std::shared_lock lock(providers_mutex_);
        ids.reserve(providers_.size());
        for (const auto& [id, entry] : providers_) {
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::string HealthChecker::get_endpoint(const std::string& provider_id) const {
    std::shared_lock lock(providers_mutex_);
    const auto it = providers_.find(provider_id);
    return it != providers_.end() ? it->second.endpoint : std::string{};
}

size_t HealthChecker::size() const {
    std::shared_lock lock(providers_mutex_);
    return providers_.size();
}

std::vector<std::pair<std::string, CircuitBreakerStats>>
HealthChecker::get_all_stats() const {
    std::vector<std::pair<std::string, CircuitBreakerStats>> result;
    {
        std::shared_lock lock(providers_mutex_);
        result.reserve(providers_.size());
        for (const auto& [id, entry] : providers_) {
            result.emplace_back(id, entry.breaker->get_stats());
        }
    }
    std::sort(result.begin(), result.end(),
        [](const auto& a, const auto& b) { return a.first < b.first; });
    return result;
}

// ============================================================================
// Probing
// ============================================================================

bool HealthChecker::check_provider_endpoint(const std::string& url) {
    probes_.fetch_add(1, std::memory_order_relaxed);
    const bool healthy = probe_->probe(url);
    if (!healthy) {
        probe_failures_.fetch_add(1, std::memory_order_relaxed);
    }
    return healthy;
}

void HealthChecker::update_provider_health(const std::string& provider_id, bool healthy) {
    const auto breaker = get_circuit_breaker(provider_id);
    if (!breaker) {
        return;
    }
    breaker->record_probe_result(healthy);
}

void HealthChecker::perform_health_checks() {
    run_sweep(false);
}

void HealthChecker::run_sweep(bool honour_stop) {
    std::vector<std::pair<std::string, std::string>> targets;
    {
        std::shared_lock lock(providers_mutex_);
        targets.reserve(providers_.size());
        for (const auto& [id, entry] : providers_) {
            if (!entry.endpoint.empty()) {
                targets.emplace_back(id, entry.endpoint);
            }
        }
    }

    sweeps_.fetch_add(1, std::memory_order_relaxed);

    for (const auto& [id, endpoint] : targets) {
        if (honour_stop && !running_.load(std::memory_order_acquire)) {
            break;
        }
        const bool healthy = check_provider_endpoint(endpoint);
        if (!healthy) {
            utils::log::warn(std::format("HealthChecker: provider '{}' failed health check", id));
        }
        update_provider_health(id, healthy);
    }
}

// ============================================================================
// Background sweep
// ============================================================================

void HealthChecker::start() {
    std::lock_guard lifecycle(lifecycle_mutex_);

    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) return;

    {
        std::lock_guard lock(cv_mutex_);
        sweep_exited_ = false;
    }
    sweep_thread_ = std::thread(&HealthChecker::sweep_loop, this);
    utils::log::info(std::format("HealthChecker: started (interval={}ms, providers={})",
        config_.check_interval.count(), size()));
}

void HealthChecker::stop() {
    std::lock_guard lifecycle(lifecycle_mutex_);

    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) return;

    {
        std::unique_lock lock(cv_mutex_);
        cv_.notify_all();
        const bool acknowledged = exited_cv_.wait_for(lock, config_.stop_grace_period,
            [this] { return sweep_exited_; });
        if (!acknowledged) {
            utils::log::warn(std::format(
                "HealthChecker: sweep did not stop within {}ms, waiting for in-flight probe",
                config_.stop_grace_period.count()));
        }
    }

    if (sweep_thread_.joinable()) {
        sweep_thread_.join();
    }
    utils::log::info("HealthChecker: stopped");
}

void HealthChecker::sweep_loop() {
    while (running_.load(std::memory_order_acquire)) {
        run_sweep(true);

        std::unique_lock lock(cv_mutex_);
        cv_.wait_for(lock, config_.check_interval, [this] {
            return !running_.load(std::memory_order_acquire);
        });
    }

    {
        std::lock_guard lock(cv_mutex_);
        sweep_exited_ = true;
    }
    exited_cv_.notify_all();
}

HealthChecker::Stats HealthChecker::get_stats() const {
    return {
        .sweeps = sweeps_.load(std::memory_order_relaxed),
        .probes = probes_.load(std::memory_order_relaxed),
        .probe_failures = probe_failures_.load(std::memory_order_relaxed),
    };
}

} // namespace llmguard
