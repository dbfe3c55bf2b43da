#pragma once

#include <string>
#include <string_view>

namespace llmguard::http {

inline constexpr std::string_view kBearerPrefix = "Bearer ";
// std::string because cpp-httplib APIs require const std::string&
inline const std::string kAuthorizationHeader = "Authorization";
inline const std::string kApiKeyHeader = "X-API-Key";
inline const std::string kForwardedForHeader = "X-Forwarded-For";
inline const std::string kRealIpHeader = "X-Real-IP";
inline const std::string kRetryAfterHeader = "Retry-After";
inline constexpr const char* kJsonContentType = "application/json";

// Admission-control response headers
inline const std::string kGlobalLimitHeader = "X-RateLimit-Global-Limit";
inline const std::string kIpLimitHeader = "X-RateLimit-IP-Limit";
inline const std::string kIpRemainingHeader = "X-RateLimit-IP-Remaining";
inline const std::string kApiKeyLimitHeader = "X-RateLimit-APIKey-Limit";
inline const std::string kApiKeyRemainingHeader = "X-RateLimit-APIKey-Remaining";
inline const std::string kResetHeader = "X-RateLimit-Reset";

} // namespace llmguard::http
