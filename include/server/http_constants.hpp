#pragma once

#include <string>
#include <string_view>

namespace reqtrace::http {

inline constexpr const char* kJsonContentType = "application/json";
inline constexpr const char* kTextContentType = "text/plain";

// std::string because cpp-httplib APIs require const std::string&
inline const std::string kHostHeader = "Host";

inline constexpr std::string_view kHealthPath = "/health";
inline constexpr std::string_view kSpansPath = "/spans";

// Registered after every other route; matches any path
inline constexpr std::string_view kCatchAllPattern = ".*";

} // namespace reqtrace::http
