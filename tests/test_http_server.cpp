#include <catch2/catch_test_macros.hpp>
#include "server/http_server.hpp"
#include "server/http_constants.hpp"
#include "mocks/manual_clock.hpp"
#include "mocks/mock_health_probe.hpp"

#include <httplib.h>

#include <thread>

using namespace llmguard;
using namespace std::chrono_literals;

namespace {

class ServerFixture {
public:
    explicit ServerFixture(uint32_t ip_limit) {
        HealthChecker::Config hc_cfg;
        hc_cfg.breaker.failure_threshold = 1;
        checker = std::make_shared<HealthChecker>(
            hc_cfg, std::make_shared<test::MockHealthProbe>(), clock);
        router = std::make_shared<ProviderRouter>(
            checker, std::make_shared<LatencyTracker>(clock));

        RequestThrottler::Config throttle_cfg;
        throttle_cfg.ip_limit = ip_limit;
        throttler = std::make_shared<RequestThrottler>(throttle_cfg, clock);

        HttpServer::Config cfg;
        cfg.host = "127.0.0.1";
        cfg.thread_pool_size = 2;
        server = std::make_unique<HttpServer>(cfg, checker, router, throttler);

        port = server->bind_to_any_port();
        thread = std::thread([this] { server->start(); });
        for (int i = 0; i < 200 && !server->is_running(); ++i) {
            std::this_thread::sleep_for(5ms);
        }
    }

    ~ServerFixture() {
        server->stop();
        if (thread.joinable()) thread.join();
    }

    httplib::Client client() const {
        httplib::Client cli("127.0.0.1", port);
        cli.set_connection_timeout(2s);
        cli.set_read_timeout(2s);
        return cli;
    }

    std::shared_ptr<test::ManualClock> clock = std::make_shared<test::ManualClock>();
    std::shared_ptr<HealthChecker> checker;
    std::shared_ptr<ProviderRouter> router;
    std::shared_ptr<RequestThrottler> throttler;
    std::unique_ptr<HttpServer> server;
    std::thread thread;
    int port = -1;
};

} // anonymous namespace

TEST_CASE("HttpServer: health and provider routes", "[http_server]") {
    ServerFixture f(100);
    REQUIRE(f.port > 0);
    REQUIRE(f.server->is_running());
    auto cli = f.client();

    SECTION("no providers is healthy") {
        auto res = cli.Get("/health");
        REQUIRE(res);
        CHECK(res->status == 200);
        CHECK(res->body.find(R"("status":"healthy")") != std::string::npos);
    }

    SECTION("all providers down is 503") {
        f.checker->add_provider("openai");
        f.checker->get_circuit_breaker("openai")->record_failure();
        auto res = cli.Get("/health");
        REQUIRE(res);
        CHECK(res->status == 503);
        CHECK(res->body.find(R"("status":"unhealthy")") != std::string::npos);
    }

    SECTION("provider listings") {
        f.checker->add_provider("openai", "https://api.openai.test/v1/models");
        f.checker->add_provider("anthropic");
        f.checker->get_circuit_breaker("anthropic")->record_failure();

        auto all = cli.Get("/api/v1/providers");
        REQUIRE(all);
        CHECK(all->status == 200);
        CHECK(all->body.find(R"("id":"openai")") != std::string::npos);
        CHECK(all->body.find(R"("circuit_state":"open")") != std::string::npos);

        auto healthy = cli.Get("/api/v1/providers/healthy");
        REQUIRE(healthy);
        CHECK(healthy->body == R"({"healthy":["openai"]})");
    }

    SECTION("reset a breaker") {
        f.checker->add_provider("anthropic");
        f.checker->get_circuit_breaker("anthropic")->record_failure();

        auto res = cli.Post("/api/v1/providers/anthropic/reset");
        REQUIRE(res);
        CHECK(res->status == 200);
        CHECK(f.checker->get_circuit_breaker("anthropic")->get_state() == CircuitState::CLOSED);

        auto missing = cli.Post("/api/v1/providers/ghost/reset");
        REQUIRE(missing);
        CHECK(missing->status == 404);
    }
}

TEST_CASE("HttpServer: throttled requests get 429", "[http_server]") {
    ServerFixture f(2);
    REQUIRE(f.port > 0);
    auto cli = f.client();
    const httplib::Headers headers = {{http::kForwardedForHeader, "203.0.113.9, 10.0.0.1"}};

    auto first = cli.Get("/health", headers);
    REQUIRE(first);
    CHECK(first->status == 200);
    CHECK(first->get_header_value(http::kIpLimitHeader) == "2");
    CHECK(first->get_header_value(http::kIpRemainingHeader) == "1");
    CHECK_FALSE(first->has_header(http::kApiKeyLimitHeader));

    REQUIRE(cli.Get("/health", headers));

    auto denied = cli.Get("/health", headers);
    REQUIRE(denied);
    CHECK(denied->status == 429);
    CHECK(denied->body == R"({"success":false,"error":"IP rate limit exceeded"})");
    CHECK(denied->get_header_value(http::kRetryAfterHeader) == "60");
    CHECK(denied->get_header_value(http::kIpRemainingHeader) == "0");

    // A different forwarded client is still admitted
    const httplib::Headers other = {{http::kForwardedForHeader, "198.51.100.4"},
                                    {http::kApiKeyHeader, "key-1"}};
    auto admitted = cli.Get("/health", other);
    REQUIRE(admitted);
    CHECK(admitted->status == 200);
    CHECK(admitted->get_header_value(http::kApiKeyLimitHeader) == "100");

    CHECK(f.server->get_stats().throttled == 1);
}
