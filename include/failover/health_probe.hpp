#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace llmguard {

/**
 * @brief Components of an http(s) probe URL
 */
struct ProbeUrl {
    bool use_ssl = false;
    std::string host;
    int port = 80;
    std::string path = "/";

    /// "http://host:port", re-bracketing IPv6 hosts
    [[nodiscard]] std::string scheme_host_port() const;
};

/**
 * @brief Split "http[s]://host[:port][/path]" into its parts
 *
 * IPv6 literals must be bracketed ("http://[::1]:8080/"); host holds the
 * address without brackets.
 * @return nullopt for anything else (missing scheme, empty host, bad port)
 */
[[nodiscard]] std::optional<ProbeUrl> parse_probe_url(const std::string& url);

/**
 * @brief Reachability check for a single endpoint
 *
 * Implementations never throw: every failure mode maps to false.
 */
class IHealthProbe {
public:
    virtual ~IHealthProbe() = default;

    [[nodiscard]] virtual bool probe(const std::string& url) = 0;
};

/**
 * @brief GET-based probe over cpp-httplib
 *
 * Healthy means a 2xx answer within the timeout. Malformed URLs, DNS
 * failures, refused connections, timeouts and other status codes are all
 * unhealthy.
 */
class HttpHealthProbe final : public IHealthProbe {
public:
    static constexpr std::chrono::milliseconds kDefaultTimeout{10000};

    explicit HttpHealthProbe(std::chrono::milliseconds timeout = kDefaultTimeout);

    [[nodiscard]] bool probe(const std::string& url) override;

    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
};

} // namespace llmguard
