#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "failover/circuit_breaker.hpp"
#include "failover/health_checker.hpp"
#include "failover/health_probe.hpp"
#include "failover/latency_tracker.hpp"
#include "failover/provider_router.hpp"
#include "server/http_server.hpp"
#include "server/request_throttler.hpp"

#include <csignal>
#include <cstdlib>
#include <format>
#include <memory>

using namespace llmguard;

// Global instance for signal handling
std::shared_ptr<HttpServer> g_server;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));

    // Unblocks start() in main; background services stop there
    if (g_server) {
        g_server->stop();
    }
}

int main(int argc, char* argv[]) {
    try {
        utils::log::info("LLM Guard starting...");

        // Setup signal handlers
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // Configuration
        std::string config_file = "config/llm-guard.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/4] Loading configuration from {}", config_file));

        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        const GuardConfig& config = config_result.config;

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        // Health checker + breakers
        utils::log::info(std::format("[2/4] Registering {} providers", config.providers.size()));

        HealthChecker::Config hc_config;
        hc_config.check_interval = std::chrono::milliseconds(config.health_check.interval_ms);
        hc_config.stop_grace_period = std::chrono::milliseconds(config.health_check.stop_grace_ms);
        hc_config.breaker.failure_threshold =
            static_cast<uint32_t>(config.circuit_breaker.failure_threshold);
        hc_config.breaker.timeout = std::chrono::milliseconds(config.circuit_breaker.timeout_ms);

        auto probe = std::make_shared<HttpHealthProbe>(
            std::chrono::milliseconds(config.health_check.probe_timeout_ms));
        auto health_checker = std::make_shared<HealthChecker>(hc_config, probe);
        for (const auto& provider : config.providers) {
            health_checker->add_provider(provider.id, provider.endpoint);
        }

        auto latency_tracker = std::make_shared<LatencyTracker>();
        auto router = std::make_shared<ProviderRouter>(health_checker, latency_tracker);

        // Admission control
        std::shared_ptr<RequestThrottler> throttler;
        if (config.rate_limiting.enabled) {
            RequestThrottler::Config throttle_config;
            throttle_config.window = std::chrono::milliseconds(config.rate_limiting.window_ms);
            throttle_config.global_limit = static_cast<uint32_t>(config.rate_limiting.global_limit);
            throttle_config.ip_limit = static_cast<uint32_t>(config.rate_limiting.ip_limit);
            throttle_config.api_key_limit = static_cast<uint32_t>(config.rate_limiting.api_key_limit);
            throttle_config.cleanup_interval_seconds =
                static_cast<uint32_t>(config.rate_limiting.cleanup_interval_seconds);
            throttler = std::make_shared<RequestThrottler>(throttle_config);
            utils::log::info(std::format("[3/4] Rate limiting: global={} ip={} api_key={} per {}ms",
                throttle_config.global_limit, throttle_config.ip_limit,
                throttle_config.api_key_limit, throttle_config.window.count()));
        } else {
            utils::log::info("[3/4] Rate limiting: disabled");
        }

        if (config.health_check.enabled) {
            health_checker->start();
        } else {
            utils::log::info("Health checks: disabled");
        }

        HttpServer::Config server_config;
        server_config.host = config.server.host;
        server_config.port = config.server.port;
        server_config.thread_pool_size = static_cast<size_t>(config.server.thread_pool_size);
        g_server = std::make_shared<HttpServer>(server_config, health_checker, router, throttler);

        utils::log::info(std::format("[4/4] Server ready on http://{}:{}",
            server_config.host, server_config.port));

        // Start HTTP server (blocking)
        g_server->start();

        health_checker->stop();
        utils::log::info("LLM Guard stopped");

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
