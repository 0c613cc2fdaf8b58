#pragma once

#include <string>

namespace nlquery::http {

inline constexpr const char* kJsonContentType = "application/json";

// std::string because cpp-httplib APIs require const std::string&
inline const std::string kConnectRoute = "/api/connect";
inline const std::string kQueryRoute = "/api/query";
inline const std::string kHistoryRoute = "/api/query/history";
inline const std::string kSchemaRoute = "/api/schema";
inline const std::string kHealthRoute = "/health";

} // namespace nlquery::http
