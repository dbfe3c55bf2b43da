#include "failover/health_probe.hpp"
#include "core/utils.hpp"

#include <httplib.h>

#include <format>
#include <stdexcept>

namespace llmguard {

namespace {

constexpr const char* kUserAgent = "llm-guard-health-check/1.0";

} // anonymous namespace

std::string ProbeUrl::scheme_host_port() const {
    const bool ipv6 = host.find(':') != std::string::npos;
    return std::format("{}{}{}{}:{}", use_ssl ? "https://" : "http://",
                       ipv6 ? "[" : "", host, ipv6 ? "]" : "", port);
}

std::optional<ProbeUrl> parse_probe_url(const std::string& url) {
    ProbeUrl parsed;
    std::string rest;

    if (url.starts_with("https://")) {
        parsed.use_ssl = true;
        parsed.port = 443;
        rest = url.substr(8);
    } else if (url.starts_with("http://")) {
        parsed.use_ssl = false;
        parsed.port = 80;
        rest = url.substr(7);
    } else {
        return std::nullopt;
    }

    const auto path_pos = rest.find('/');
    std::string authority;
    if (path_pos != std::string::npos) {
        authority = rest.substr(0, path_pos);
        parsed.path = rest.substr(path_pos);
    } else {
        authority = rest;
        parsed.path = "/";
    }

    // Split off ":port"; a bracketed IPv6 literal keeps its inner colons
    std::optional<std::string> port_text;
    if (authority.starts_with('[')) {
        const auto close = authority.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        const std::string tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') {
                return std::nullopt;
            }
            port_text = tail.substr(1);
        }
        authority = authority.substr(1, close - 1);
        if (authority.find_first_not_of("0123456789abcdefABCDEF:.") != std::string::npos) {
            return std::nullopt;
        }
    } else if (const auto port_pos = authority.rfind(':'); port_pos != std::string::npos) {
        port_text = authority.substr(port_pos + 1);
        authority.resize(port_pos);
        if (authority.find(':') != std::string::npos) {
            return std::nullopt;  // Unbracketed IPv6
        }
    }

    if (port_text) {
        const auto port = utils::try_parse_int<int>(*port_text);
        if (!port || *port <= 0 || *port > 65535) {
            return std::nullopt;
        }
        parsed.port = *port;
    }

    if (authority.empty() || authority.find_first_of(" \t@[]") != std::string::npos) {
        return std::nullopt;
    }
    parsed.host = std::move(authority);
    return parsed;
}

HttpHealthProbe::HttpHealthProbe(std::chrono::milliseconds timeout)
    : timeout_(timeout) {
    if (timeout_.count() <= 0) {
        throw std::invalid_argument("health probe timeout must be positive");
    }
}

bool HttpHealthProbe::probe(const std::string& url) {
    const auto target = parse_probe_url(url);
    if (!target) {
        utils::log::warn(std::format("Health probe: malformed endpoint '{}'", url));
        return false;
    }

    try {
        httplib::Client client(target->scheme_host_port());
        if (!client.is_valid()) {
            utils::log::warn(std::format("Health probe: unsupported endpoint '{}'", url));
            return false;
        }
        client.set_connection_timeout(timeout_);
        client.set_read_timeout(timeout_);
        client.set_write_timeout(timeout_);

        const httplib::Headers headers = {{"User-Agent", kUserAgent}};
        utils::Timer timer;
        auto res = client.Get(target->path, headers);
        if (!res) {
            utils::log::warn(std::format("Health probe {} failed: {}",
                url, httplib::to_string(res.error())));
            return false;
        }
        if (res->status < 200 || res->status >= 300) {
            utils::log::warn(std::format("Health probe {} returned HTTP {}", url, res->status));
            return false;
        }
        utils::log::debug(std::format("Health probe {} ok in {}ms", url, timer.elapsed_ms().count()));
        return true;
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Health probe {} threw: {}", url, e.what()));
        return false;
    }
}

} // namespace llmguard
