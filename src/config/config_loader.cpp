#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace llmguard {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

// ---- Section extractors ----------------------------------------------------

ServerConfig extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or("0.0.0.0"s);
    cfg.port = s["port"].value_or(8090);
    cfg.thread_pool_size = s["threads"].value_or(4);
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

CircuitBreakerConfig extract_circuit_breaker(const toml::table& root) {
    CircuitBreakerConfig cfg;
    const auto* cb = root["circuit_breaker"].as_table();
    if (!cb) return cfg;

    cfg.failure_threshold = (*cb)["failure_threshold"].value_or(5);
    cfg.timeout_ms = (*cb)["timeout_ms"].value_or(30000);
    return cfg;
}

HealthCheckConfig extract_health_check(const toml::table& root) {
    HealthCheckConfig cfg;
    const auto* hc = root["health_check"].as_table();
    if (!hc) return cfg;

    cfg.enabled = (*hc)["enabled"].value_or(true);
    cfg.interval_ms = (*hc)["interval_ms"].value_or(30000);
    cfg.probe_timeout_ms = (*hc)["probe_timeout_ms"].value_or(10000);
    cfg.stop_grace_ms = (*hc)["stop_grace_ms"].value_or(15000);
    return cfg;
}

RateLimitingConfig extract_rate_limiting(const toml::table& root) {
    RateLimitingConfig cfg;
    const auto* rl = root["rate_limiting"].as_table();
    if (!rl) return cfg;

    cfg.enabled = (*rl)["enabled"].value_or(true);
    cfg.window_ms = (*rl)["window_ms"].value_or(60000);
    cfg.global_limit = (*rl)["global_limit"].value_or(1000);
    cfg.ip_limit = (*rl)["ip_limit"].value_or(60);
    cfg.api_key_limit = (*rl)["api_key_limit"].value_or(100);
    cfg.cleanup_interval_seconds = (*rl)["cleanup_interval_seconds"].value_or(300);
    return cfg;
}

std::vector<ProviderConfig> extract_providers(const toml::table& root) {
    std::vector<ProviderConfig> result;
    const auto* arr = root["providers"].as_array();
    if (!arr) return result;

    result.reserve(arr->size());
    for (const auto& elem : *arr) {
        const auto* tbl = elem.as_table();
        if (!tbl) {
            throw std::runtime_error("providers entries must be tables ([[providers]])");
        }
        ProviderConfig provider;
        provider.id = (*tbl)["id"].value_or(""s);
        provider.endpoint = (*tbl)["endpoint"].value_or(""s);
        result.push_back(std::move(provider));
    }
    return result;
}

GuardConfig extract_all_sections(const toml::table& tbl) {
    GuardConfig config;
    config.server = extract_server(tbl);
    config.logging = extract_logging(tbl);
    config.circuit_breaker = extract_circuit_breaker(tbl);
    config.health_check = extract_health_check(tbl);
    config.rate_limiting = extract_rate_limiting(tbl);
    config.providers = extract_providers(tbl);
    return config;
}

ConfigLoader::LoadResult validate_and_return(GuardConfig config) {
    const auto errors = ConfigLoader::validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

} // anonymous namespace

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const GuardConfig& config) {
    std::vector<std::string> errors;

    if (config.server.port < 1 || config.server.port > 65535) {
        errors.push_back(std::format("server.port must be 1-65535, got {}", config.server.port));
    }
    if (config.server.thread_pool_size < 1) {
        errors.push_back("server.threads must be >= 1");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error (got '{}')",
            config.logging.level));
    }

    if (config.circuit_breaker.failure_threshold < 1) {
        errors.push_back(std::format("circuit_breaker.failure_threshold must be >= 1, got {}",
                                     config.circuit_breaker.failure_threshold));
    }
    if (config.circuit_breaker.timeout_ms < 1) {
        errors.push_back(std::format("circuit_breaker.timeout_ms must be >= 1, got {}",
                                     config.circuit_breaker.timeout_ms));
    }

    if (config.health_check.interval_ms < 1) {
        errors.push_back(std::format("health_check.interval_ms must be >= 1, got {}",
                                     config.health_check.interval_ms));
    }
    if (config.health_check.probe_timeout_ms < 1) {
        errors.push_back(std::format("health_check.probe_timeout_ms must be >= 1, got {}",
                                     config.health_check.probe_timeout_ms));
    }
    if (config.health_check.stop_grace_ms < 0) {
        errors.push_back(std::format("health_check.stop_grace_ms must be >= 0, got {}",
                                     config.health_check.stop_grace_ms));
    }

    if (config.rate_limiting.enabled) {
        const auto& rl = config.rate_limiting;
        if (rl.window_ms < 1) {
            errors.push_back(std::format("rate_limiting.window_ms must be >= 1, got {}", rl.window_ms));
        }
        if (rl.global_limit < 1) {
            errors.push_back(std::format("rate_limiting.global_limit must be >= 1, got {}", rl.global_limit));
        }
        if (rl.ip_limit < 1) {
            errors.push_back(std::format("rate_limiting.ip_limit must be >= 1, got {}", rl.ip_limit));
        }
        if (rl.api_key_limit < 1) {
            errors.push_back(std::format("rate_limiting.api_key_limit must be >= 1, got {}", rl.api_key_limit));
        }
        if (rl.cleanup_interval_seconds < 0) {
            errors.push_back(std::format("rate_limiting.cleanup_interval_seconds must be >= 0, got {}",
                                         rl.cleanup_interval_seconds));
        }
    }

    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < config.providers.size(); ++i) {
        const auto& provider = config.providers[i];
        if (provider.id.empty()) {
            errors.push_back(std::format("providers[{}].id must not be empty", i));
        } else if (!seen.insert(provider.id).second) {
            errors.push_back(std::format("providers[{}].id '{}' is duplicated", i, provider.id));
        }
    }

    return errors;
}

} // namespace llmguard
