#include "server/client_identity.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

namespace llmguard {

std::string_view strip_ipv6_mapped(std::string_view addr) {
    constexpr std::string_view kMappedPrefix = "::ffff:";
    if (addr.starts_with(kMappedPrefix)) {
        addr.remove_prefix(kMappedPrefix.size());
    }
    return addr;
}

std::string extract_client_ip(const std::string& forwarded_for,
                              const std::string& real_ip,
                              const std::string& remote_addr) {
    if (!forwarded_for.empty()) {
        // Take the first (leftmost) IP from X-Forwarded-For
        const auto comma = forwarded_for.find(',');
        auto ip = utils::trim(forwarded_for.substr(0, comma));
        if (!ip.empty()) {
            return ip;
        }
    }

    if (auto ip = utils::trim(real_ip); !ip.empty()) {
        return ip;
    }

    return std::string(strip_ipv6_mapped(remote_addr));
}

std::string extract_api_key(const std::string& api_key_header,
                            const std::string& authorization) {
    if (auto key = utils::trim(api_key_header); !key.empty()) {
        return key;
    }

    if (authorization.size() > http::kBearerPrefix.size() &&
        std::string_view(authorization).substr(0, http::kBearerPrefix.size()) == http::kBearerPrefix) {
        return utils::trim(authorization.substr(http::kBearerPrefix.size()));
    }
    return {};
}

} // namespace llmguard
