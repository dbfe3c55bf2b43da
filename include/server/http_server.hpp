#pragma once

#include "failover/health_checker.hpp"
#include "failover/provider_router.hpp"
#include "server/request_throttler.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace httplib {
class Server;
struct Request;
struct Response;
}

namespace llmguard {

/**
 * @brief HTTP ingress: admission control in front of provider status routes
 *
 * Every request goes through RequestThrottler before routing. Denials get
 * 429 with a JSON error, the rate-limit headers and Retry-After. Admitted
 * responses carry the same rate-limit headers.
 *
 * Routes:
 *   GET  /health
 *   GET  /api/v1/providers
 *   GET  /api/v1/providers/healthy
 *   POST /api/v1/providers/{id}/reset
 */
class HttpServer {
public:
    struct Config {
        std::string host;
        int port;
        size_t thread_pool_size;

        Config()
            : host("0.0.0.0"),
              port(8090),
              thread_pool_size(4) {}
    };

    /**
     * @param throttler Admission control; null disables it
     */
    HttpServer(const Config& config,
               std::shared_ptr<HealthChecker> health_checker,
               std::shared_ptr<ProviderRouter> router,
               std::shared_ptr<RequestThrottler> throttler);

    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Bind to an ephemeral port on config.host
     * @return The bound port, or -1 on failure
     */
    int bind_to_any_port();

    /**
     * @brief Serve until stop(). Blocks the calling thread.
     * @throws std::runtime_error if the listener cannot be started
     */
    void start();

    void stop();

    [[nodiscard]] bool is_running() const;

    struct Stats {
        uint64_t requests;
        uint64_t throttled;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    void register_routes();
    bool admit(const httplib::Request& req, httplib::Response& res);

    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_providers(const httplib::Request& req, httplib::Response& res);
    void handle_healthy_providers(const httplib::Request& req, httplib::Response& res);
    void handle_reset(const httplib::Request& req, httplib::Response& res);

    Config config_;
    std::shared_ptr<HealthChecker> health_checker_;
    std::shared_ptr<ProviderRouter> router_;
    std::shared_ptr<RequestThrottler> throttler_;

    std::unique_ptr<httplib::Server> svr_;
    bool bound_ = false;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> throttled_{0};
};

} // namespace llmguard
