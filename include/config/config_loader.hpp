#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace llmguard {

// ============================================================================
// Section configs (mirror the TOML layout)
// ============================================================================

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8090;
    int thread_pool_size = 4;
};

struct LoggingConfig {
    std::string level = "info";
};

struct CircuitBreakerConfig {
    int failure_threshold = 5;
    int timeout_ms = 30000;
};

struct HealthCheckConfig {
    bool enabled = true;
    int interval_ms = 30000;
    int probe_timeout_ms = 10000;
    int stop_grace_ms = 15000;
};

struct RateLimitingConfig {
    bool enabled = true;
    int window_ms = 60000;
    int global_limit = 1000;
    int ip_limit = 60;
    int api_key_limit = 100;
    int cleanup_interval_seconds = 300;
};

struct ProviderConfig {
    std::string id;
    std::string endpoint;
};

struct GuardConfig {
    ServerConfig server;
    LoggingConfig logging;
    CircuitBreakerConfig circuit_breaker;
    HealthCheckConfig health_check;
    RateLimitingConfig rate_limiting;
    std::vector<ProviderConfig> providers;
};

// ============================================================================
// ConfigLoader - Extract typed config from TOML
// ============================================================================

/**
 * @brief Loads llm-guard.toml
 *
 * String values may reference environment variables as ${NAME}; unset
 * variables expand to the empty string. Every validation problem is
 * reported at once in error_message.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        GuardConfig config;

        static LoadResult ok(GuardConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from TOML file
     * @param config_path Path to llm-guard.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check ranges and cross-field constraints
     * @return One message per problem, empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const GuardConfig& config);
};

} // namespace llmguard
