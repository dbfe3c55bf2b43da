#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace llmguard;

TEST_CASE("ConfigLoader: empty config uses defaults", "[config]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.server.host == "0.0.0.0");
    CHECK(cfg.server.port == 8090);
    CHECK(cfg.logging.level == "info");
    CHECK(cfg.circuit_breaker.failure_threshold == 5);
    CHECK(cfg.circuit_breaker.timeout_ms == 30000);
    CHECK(cfg.health_check.enabled);
    CHECK(cfg.health_check.interval_ms == 30000);
    CHECK(cfg.health_check.probe_timeout_ms == 10000);
    CHECK(cfg.rate_limiting.window_ms == 60000);
    CHECK(cfg.rate_limiting.global_limit == 1000);
    CHECK(cfg.rate_limiting.ip_limit == 60);
    CHECK(cfg.rate_limiting.api_key_limit == 100);
    CHECK(cfg.providers.empty());
}

TEST_CASE("ConfigLoader: full config", "[config]") {
    const std::string toml = R"(
[server]
host = "127.0.0.1"
port = 9000
threads = 8

[logging]
level = "debug"

[circuit_breaker]
failure_threshold = 3
timeout_ms = 1000

[health_check]
enabled = false
interval_ms = 5000
probe_timeout_ms = 2000
stop_grace_ms = 3000

[rate_limiting]
enabled = true
window_ms = 1000
global_limit = 500
ip_limit = 10
api_key_limit = 20
cleanup_interval_seconds = 0

[[providers]]
id = "openai"
endpoint = "https://api.openai.com/v1/models"

[[providers]]
id = "mistral"
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.server.host == "127.0.0.1");
    CHECK(cfg.server.port == 9000);
    CHECK(cfg.server.thread_pool_size == 8);
    CHECK(cfg.logging.level == "debug");
    CHECK(cfg.circuit_breaker.failure_threshold == 3);
    CHECK(cfg.circuit_breaker.timeout_ms == 1000);
    CHECK_FALSE(cfg.health_check.enabled);
    CHECK(cfg.health_check.interval_ms == 5000);
    CHECK(cfg.health_check.probe_timeout_ms == 2000);
    CHECK(cfg.health_check.stop_grace_ms == 3000);
    CHECK(cfg.rate_limiting.window_ms == 1000);
    CHECK(cfg.rate_limiting.global_limit == 500);
    CHECK(cfg.rate_limiting.ip_limit == 10);
    CHECK(cfg.rate_limiting.api_key_limit == 20);
    CHECK(cfg.rate_limiting.cleanup_interval_seconds == 0);

    REQUIRE(cfg.providers.size() == 2);
    CHECK(cfg.providers[0].id == "openai");
    CHECK(cfg.providers[0].endpoint == "https://api.openai.com/v1/models");
    CHECK(cfg.providers[1].id == "mistral");
    CHECK(cfg.providers[1].endpoint.empty());
}

TEST_CASE("ConfigLoader: environment variable expansion", "[config]") {
    ::setenv("LLM_GUARD_TEST_HOST", "ollama.internal:11434", 1);
    ::unsetenv("LLM_GUARD_TEST_UNSET");

    const std::string toml = R"(
[[providers]]
id = "ollama"
endpoint = "http://${LLM_GUARD_TEST_HOST}/api/tags"

[[providers]]
id = "other"
endpoint = "http://${LLM_GUARD_TEST_UNSET}x/health"
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.providers[0].endpoint == "http://ollama.internal:11434/api/tags");
    CHECK(result.config.providers[1].endpoint == "http://x/health");
}

TEST_CASE("ConfigLoader: unclosed env var is a load error", "[config]") {
    const std::string toml = R"(
[logging]
level = "${BROKEN"
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Unclosed env var") != std::string::npos);
}

TEST_CASE("ConfigLoader: malformed TOML is a parse error", "[config]") {
    auto result = ConfigLoader::load_from_string("[server\nport = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

TEST_CASE("ConfigLoader: missing file", "[config]") {
    auto result = ConfigLoader::load_from_file("/nonexistent/llm-guard.toml");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to load config") != std::string::npos);
}

TEST_CASE("ConfigLoader: load from file", "[config]") {
    const auto path = std::filesystem::temp_directory_path() / "llm_guard_config_test.toml";
    {
        std::ofstream out(path);
        out << "[server]\nport = 8123\n\n[[providers]]\nid = \"a\"\n";
    }

    auto result = ConfigLoader::load_from_file(path.string());
    std::filesystem::remove(path);

    REQUIRE(result.success);
    CHECK(result.config.server.port == 8123);
    REQUIRE(result.config.providers.size() == 1);
    CHECK(result.config.providers[0].id == "a");
}

TEST_CASE("ConfigValidation: invalid values are all reported", "[config][validation]") {
    const std::string toml = R"(
[server]
port = 0

[logging]
level = "verbose"

[circuit_breaker]
failure_threshold = 0
timeout_ms = 0

[health_check]
interval_ms = 0

[rate_limiting]
ip_limit = 0
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE_FALSE(result.success);

    const auto& msg = result.error_message;
    CHECK(msg.find("Config validation failed") != std::string::npos);
    CHECK(msg.find("server.port") != std::string::npos);
    CHECK(msg.find("logging.level") != std::string::npos);
    CHECK(msg.find("circuit_breaker.failure_threshold") != std::string::npos);
    CHECK(msg.find("circuit_breaker.timeout_ms") != std::string::npos);
    CHECK(msg.find("health_check.interval_ms") != std::string::npos);
    CHECK(msg.find("rate_limiting.ip_limit") != std::string::npos);
}

TEST_CASE("ConfigValidation: rate limits ignored when disabled", "[config][validation]") {
    const std::string toml = R"(
[rate_limiting]
enabled = false
ip_limit = 0
)";
    CHECK(ConfigLoader::load_from_string(toml).success);
}

TEST_CASE("ConfigValidation: provider ids", "[config][validation]") {
    SECTION("empty id") {
        auto result = ConfigLoader::load_from_string("[[providers]]\nendpoint = \"http://x\"\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("providers[0].id must not be empty") != std::string::npos);
    }

    SECTION("duplicate id") {
        auto result = ConfigLoader::load_from_string(
            "[[providers]]\nid = \"a\"\n\n[[providers]]\nid = \"a\"\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("providers[1].id 'a' is duplicated") != std::string::npos);
    }
}

TEST_CASE("ConfigLoader: shipped sample config loads", "[config]") {
    auto result = ConfigLoader::load_from_file(LLM_GUARD_SOURCE_DIR "/config/llm-guard.toml");
    REQUIRE(result.success);
    CHECK(result.config.providers.size() == 3);
}
