#include "server/http_server.hpp"
#include "server/client_identity.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

#include <httplib.h>

#include <algorithm>
#include <format>
#include <stdexcept>
#include <vector>

namespace llmguard {

namespace {

constexpr const char* kHealthRoute = "/health";
constexpr const char* kProvidersRoute = "/api/v1/providers";
constexpr const char* kHealthyProvidersRoute = "/api/v1/providers/healthy";
constexpr const char* kResetRoute = R"(/api/v1/providers/([^/]+)/reset)";

std::string json_string_array(const std::vector<std::string>& values) {
    std::string out = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ',';
        out += std::format("\"{}\"", utils::escape_json(values[i]));
    }
    out += ']';
    return out;
}

std::string build_provider_json(const ProviderStatus& status) {
    return std::format(
        R"({{"id":"{}","endpoint":"{}","circuit_state":"{}","healthy":{},"failure_count":{},)"
        R"("average_latency_ms":{:.3f},"latency_samples":{}}})",
        utils::escape_json(status.provider_id),
        utils::escape_json(status.endpoint),
        circuit_state_to_string(status.circuit_state),
        utils::booltostr(status.available),
        status.failure_count,
        static_cast<double>(status.average_latency.count()) / 1000.0,
        status.latency_samples);
}

std::string error_json(const std::string& message) {
    return std::format(R"({{"success":false,"error":"{}"}})", utils::escape_json(message));
}

} // anonymous namespace

HttpServer::HttpServer(const Config& config,
                       std::shared_ptr<HealthChecker> health_checker,
                       std::shared_ptr<ProviderRouter> router,
                       std::shared_ptr<RequestThrottler> throttler)
    : config_(config),
      health_checker_(std::move(health_checker)),
      router_(std::move(router)),
      throttler_(std::move(throttler)),
      svr_(std::make_unique<httplib::Server>()) {
    if (!health_checker_ || !router_) {
        throw std::invalid_argument("http server requires a health checker and router");
    }

    const size_t pool_size = std::max<size_t>(config_.thread_pool_size, 1);
    svr_->new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    register_routes();
}

HttpServer::~HttpServer() {
    stop();
}

int HttpServer::bind_to_any_port() {
    const int port = svr_->bind_to_any_port(config_.host);
    bound_ = port > 0;
    return bound_ ? port : -1;
}

void HttpServer::start() {
    utils::log::info(std::format("Starting LLM Guard on {}:{} ({} threads, throttling {})",
        config_.host, config_.port, config_.thread_pool_size,
        throttler_ ? "on" : "off"));

    const bool ok = bound_ ? svr_->listen_after_bind()
                           : svr_->listen(config_.host, config_.port);
    if (!ok) {
        throw std::runtime_error(std::format("Failed to start HTTP server on {}:{}",
                                             config_.host, config_.port));
    }
}

void HttpServer::stop() {
    if (svr_ && svr_->is_running()) {
        svr_->stop();
        utils::log::info("Server stopped");
    }
}

bool HttpServer::is_running() const {
    return svr_->is_running();
}

HttpServer::Stats HttpServer::get_stats() const {
    return {
        .requests = requests_.load(std::memory_order_relaxed),
        .throttled = throttled_.load(std::memory_order_relaxed),
    };
}

// ============================================================================
// Admission control
// ============================================================================

bool HttpServer::admit(const httplib::Request& req, httplib::Response& res) {
    requests_.fetch_add(1, std::memory_order_relaxed);
    if (!throttler_) return true;

    const std::string ip = extract_client_ip(
        req.get_header_value(http::kForwardedForHeader),
        req.get_header_value(http::kRealIpHeader),
        req.remote_addr);
    const std::string api_key = extract_api_key(
        req.get_header_value(http::kApiKeyHeader),
        req.get_header_value(http::kAuthorizationHeader));

    const auto result = throttler_->check_request(ip, api_key);

    for (const auto& [name, value] : throttler_->get_rate_limit_headers(ip, api_key)) {
        res.set_header(name, value);
    }

    if (result.allowed) return true;

    throttled_.fetch_add(1, std::memory_order_relaxed);
    utils::log::debug(std::format("Throttled {} ({}): {}",
        ip, throttle_level_to_string(result.level), result.reason));

    // Retry-After = ceil(ms / 1000), min 1
    const auto retry_seconds = std::max<int64_t>(
        (result.retry_after.count() + 999) / 1000, 1);
    res.status = httplib::StatusCode::TooManyRequests_429;
    res.set_header(http::kRetryAfterHeader, std::to_string(retry_seconds));
    res.set_content(error_json(result.reason), http::kJsonContentType);
    return false;
}

// ============================================================================
// Routes
// ============================================================================

void HttpServer::register_routes() {
    svr_->set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        return admit(req, res) ? httplib::Server::HandlerResponse::Unhandled
                               : httplib::Server::HandlerResponse::Handled;
    });

    svr_->Get(kHealthRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
    svr_->Get(kHealthyProvidersRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_healthy_providers(req, res);
    });
    svr_->Get(kProvidersRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_providers(req, res);
    });
    svr_->Post(kResetRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_reset(req, res);
    });
}

void HttpServer::handle_health(const httplib::Request&, httplib::Response& res) {
    const size_t total = health_checker_->size();
    const size_t healthy = health_checker_->get_healthy_providers().size();

    const char* status = "healthy";
    if (total > 0 && healthy == 0) {
        status = "unhealthy";
        res.status = httplib::StatusCode::ServiceUnavailable_503;
    } else if (healthy < total) {
        status = "degraded";
    }

    res.set_content(std::format(R"({{"status":"{}","providers":{},"healthy_providers":{}}})",
                                status, total, healthy),
                    http::kJsonContentType);
}

void HttpServer::handle_providers(const httplib::Request&, httplib::Response& res) {
    const auto statuses = router_->provider_status();

    std::string body = R"({"providers":[)";
    for (size_t i = 0; i < statuses.size(); ++i) {
        if (i > 0) body += ',';
        body += build_provider_json(statuses[i]);
    }
    body += "]}";
    res.set_content(body, http::kJsonContentType);
}

void HttpServer::handle_healthy_providers(const httplib::Request&, httplib::Response& res) {
    res.set_content(std::format(R"({{"healthy":{}}})",
                                json_string_array(health_checker_->get_healthy_providers())),
                    http::kJsonContentType);
}

void HttpServer::handle_reset(const httplib::Request& req, httplib::Response& res) {
    const std::string id = req.matches[1];
    const auto breaker = health_checker_->get_circuit_breaker(id);
    if (!breaker) {
        res.status = httplib::StatusCode::NotFound_404;
        res.set_content(error_json(std::format("Unknown provider '{}'", id)),
                        http::kJsonContentType);
        return;
    }

    breaker->reset();
    utils::log::info(std::format("Circuit breaker for '{}' reset via API", id));
    res.set_content(std::format(R"({{"success":true,"provider":"{}","circuit_state":"{}"}})",
                                utils::escape_json(id),
                                circuit_state_to_string(breaker->get_state())),
                    http::kJsonContentType);
}

} // namespace llmguard
