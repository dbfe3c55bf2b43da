#pragma once

#include <string>
#include <string_view>

namespace llmguard {

/**
 * @brief Strip the "::ffff:" prefix of an IPv6-mapped IPv4 address
 */
[[nodiscard]] std::string_view strip_ipv6_mapped(std::string_view addr);

/**
 * @brief Resolve the client IP used as the per-IP throttle key
 *
 * Order: leftmost X-Forwarded-For entry, then X-Real-IP, then the socket
 * address. Blank entries fall through to the next source.
 */
[[nodiscard]] std::string extract_client_ip(const std::string& forwarded_for,
                                            const std::string& real_ip,
                                            const std::string& remote_addr);

/**
 * @brief Resolve the presented credential
 *
 * X-API-Key wins over "Authorization: Bearer <token>". Empty if neither.
 */
[[nodiscard]] std::string extract_api_key(const std::string& api_key_header,
                                          const std::string& authorization);

} // namespace llmguard
