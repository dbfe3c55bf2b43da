#include <catch2/catch_test_macros.hpp>
#include "failover/health_checker.hpp"
#include "mocks/manual_clock.hpp"
#include "mocks/mock_health_probe.hpp"

#include <algorithm>
#include <format>
#include <thread>
#include <vector>

using namespace llmguard;
using namespace std::chrono_literals;

namespace {

HealthChecker::Config checker_config(uint32_t threshold = 2) {
    HealthChecker::Config cfg;
    cfg.check_interval = 20ms;
    cfg.stop_grace_period = 2000ms;
    cfg.breaker.failure_threshold = threshold;
    cfg.breaker.timeout = 30000ms;
    return cfg;
}

} // anonymous namespace

TEST_CASE("HealthChecker: registry", "[health_checker]") {
    auto probe = std::make_shared<test::MockHealthProbe>();
    HealthChecker hc(checker_config(), probe);

    SECTION("unknown provider has no breaker") {
        CHECK(hc.get_circuit_breaker("missing") == nullptr);
    }

    SECTION("add_provider is idempotent") {
        hc.add_provider("openai", "http://openai.test/health");
        const auto first = hc.get_circuit_breaker("openai");
        REQUIRE(first != nullptr);

        hc.add_provider("openai");
        CHECK(hc.get_circuit_breaker("openai") == first);
        CHECK(hc.get_endpoint("openai") == "http://openai.test/health");

        hc.add_provider("openai", "http://openai.test/v2/health");
        CHECK(hc.get_circuit_breaker("openai") == first);
        CHECK(hc.get_endpoint("openai") == "http://openai.test/v2/health");
        CHECK(hc.size() == 1);
    }

    SECTION("remove_provider drops the breaker, no-op if absent") {
        hc.add_provider("a");
        const auto held = hc.get_circuit_breaker("a");
        hc.remove_provider("a");
        hc.remove_provider("a");
        hc.remove_provider("never-added");
        CHECK(hc.get_circuit_breaker("a") == nullptr);
        CHECK(hc.size() == 0);

        // Holders keep a usable breaker
        CHECK(held->call([] { return Status::ok(); }).is_ok());
    }

    SECTION("breakers use the configured settings") {
        hc.add_provider("a");
        CHECK(hc.get_circuit_breaker("a")->config().failure_threshold == 2);
        CHECK(hc.get_circuit_breaker("a")->name() == "a");
    }
}

TEST_CASE("HealthChecker: healthy providers follow breaker availability", "[health_checker]") {
    auto probe = std::make_shared<test::MockHealthProbe>();
    HealthChecker hc(checker_config(1), probe);

    hc.add_provider("c");
    hc.add_provider("a");
    hc.add_provider("b");
    CHECK(hc.get_healthy_providers() == std::vector<std::string>{"a", "b", "c"});

    hc.get_circuit_breaker("b")->record_failure();
    CHECK(hc.get_healthy_providers() == std::vector<std::string>{"a", "c"});
}

TEST_CASE("HealthChecker: sweep feeds probe results into breakers", "[health_checker]") {
    auto probe = std::make_shared<test::MockHealthProbe>();
    HealthChecker hc(checker_config(2), probe);

    hc.add_provider("up", "http://up.test/health");
    hc.add_provider("down", "http://down.test/health");
    hc.add_provider("no-endpoint");
    probe->set_result("http://up.test/health", true);
    probe->set_result("http://down.test/health", false);

    hc.perform_health_checks();
    hc.perform_health_checks();

    CHECK(hc.get_circuit_breaker("up")->get_state() == CircuitState::CLOSED);
    CHECK(hc.get_circuit_breaker("down")->get_state() == CircuitState::OPEN);
    CHECK(hc.get_circuit_breaker("no-endpoint")->get_state() == CircuitState::CLOSED);

    // Providers without an endpoint are not probed
    CHECK(probe->call_count() == 4);

    const auto stats = hc.get_stats();
    CHECK(stats.sweeps == 2);
    CHECK(stats.probes == 4);
    CHECK(stats.probe_failures == 2);
}

TEST_CASE("HealthChecker: per-provider breaker stats", "[health_checker]") {
    auto probe = std::make_shared<test::MockHealthProbe>();
    HealthChecker hc(checker_config(1), probe);

    hc.add_provider("b", "http://b.test/health");
    hc.add_provider("a");
    hc.perform_health_checks();

    const auto all = hc.get_all_stats();
    REQUIRE(all.size() == 2);
    CHECK(all[0].first == "a");
    CHECK(all[0].second.state == CircuitState::CLOSED);
    CHECK(all[0].second.total_failures == 0);
    CHECK(all[1].first == "b");
    CHECK(all[1].second.state == CircuitState::OPEN);
    CHECK(all[1].second.times_opened == 1);
    CHECK(hc.provider_ids() == std::vector<std::string>{"a", "b"});
}

TEST_CASE("HealthChecker: recovered provider rediscovered without traffic", "[health_checker]") {
    auto probe = std::make_shared<test::MockHealthProbe>();
    HealthChecker hc(checker_config(1), probe);

    hc.add_provider("flaky", "http://flaky.test/health");
    hc.perform_health_checks();
    REQUIRE(hc.get_circuit_breaker("flaky")->get_state() == CircuitState::OPEN);
    CHECK(hc.get_healthy_providers().empty());

    probe->set_result("http://flaky.test/health", true);
    hc.perform_health_checks();
    CHECK(hc.get_circuit_breaker("flaky")->get_state() == CircuitState::HALF_OPEN);
    CHECK(hc.get_healthy_providers() == std::vector<std::string>{"flaky"});

    hc.perform_health_checks();
    CHECK(hc.get_circuit_breaker("flaky")->get_state() == CircuitState::CLOSED);
}

TEST_CASE("HealthChecker: update_provider_health on unknown id is a no-op", "[health_checker]") {
    auto probe = std::make_shared<test::MockHealthProbe>();
    HealthChecker hc(checker_config(), probe);
    hc.update_provider_health("ghost", false);
    CHECK(hc.size() == 0);
}

TEST_CASE("HealthChecker: malformed endpoint is a probe failure", "[health_checker]") {
    HealthChecker hc(checker_config(1));

    CHECK_FALSE(hc.check_provider_endpoint("://invalid-url"));
    CHECK_FALSE(hc.check_provider_endpoint(""));

    hc.add_provider("bad", "not a url");
    hc.add_provider("also-bad", "ftp://example.test/health");
    hc.perform_health_checks();
    CHECK(hc.get_circuit_breaker("bad")->get_state() == CircuitState::OPEN);
    CHECK(hc.get_circuit_breaker("also-bad")->get_state() == CircuitState::OPEN);
}

TEST_CASE("HealthChecker: start/stop lifecycle", "[health_checker]") {
    auto probe = std::make_shared<test::MockHealthProbe>();
    HealthChecker hc(checker_config(), probe);

    SECTION("stop without start is safe") {
        hc.stop();
        hc.stop();
        CHECK_FALSE(hc.is_running());
    }

    SECTION("background sweep probes periodically and stops") {
        hc.add_provider("p", "http://p.test/health");
        probe->set_result("http://p.test/health", true);

        hc.start();
        hc.start();
        CHECK(hc.is_running());

        for (int i = 0; i < 200 && probe->call_count() < 2; ++i) {
            std::this_thread::sleep_for(10ms);
        }
        CHECK(probe->call_count() >= 2);

        hc.stop();
        CHECK_FALSE(hc.is_running());

        const auto after_stop = probe->call_count();
        std::this_thread::sleep_for(60ms);
        CHECK(probe->call_count() == after_stop);

        hc.stop();
    }

    SECTION("restart after stop") {
        hc.start();
        hc.stop();
        hc.start();
        CHECK(hc.is_running());
        hc.stop();
        CHECK_FALSE(hc.is_running());
    }
}

TEST_CASE("HealthChecker: concurrent registry access", "[health_checker]") {
    auto probe = std::make_shared<test::MockHealthProbe>();
    HealthChecker hc(checker_config(), probe);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&hc, t] {
            for (int i = 0; i < 200; ++i) {
                const auto id = std::format("p{}", i % 10);
                hc.add_provider(id);
                if (auto cb = hc.get_circuit_breaker(id)) {
                    (void)cb->get_state();
                }
                if ((i + t) % 7 == 0) {
                    hc.remove_provider(id);
                }
                (void)hc.get_healthy_providers();
            }
        });
    }
    for (auto& th : threads) th.join();

    CHECK(hc.size() <= 10);
}
