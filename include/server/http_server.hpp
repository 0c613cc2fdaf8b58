#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "engine/query_engine.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace nlquery {

/// HTTP status for an engine error category
[[nodiscard]] int http_status_for(ErrorCategory category);

/**
 * @brief Thin JSON API over a QueryEngine
 *
 *   POST /api/connect        {"connection_string"}
 *   POST /api/query          {"query", "page", "page_size"}
 *   GET  /api/query/history
 *   GET  /api/schema
 *   GET  /health
 */
class HttpServer {
public:
    HttpServer(std::shared_ptr<QueryEngine> engine, ServerConfig config);

    /// Blocks until stop() is called or listening fails
    void start();
    void stop();

    // ── Handler methods (one per endpoint, public for tests) ────────────
    void handle_connect(const httplib::Request& req, httplib::Response& res);
    void handle_query(const httplib::Request& req, httplib::Response& res);
    void handle_history(const httplib::Request& req, httplib::Response& res);
    void handle_schema(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res);

private:
    void register_routes(httplib::Server& svr);

    std::shared_ptr<QueryEngine> engine_;
    const ServerConfig config_;

    std::stop_source shutdown_;                 // cancels in-flight queries on stop()
    std::mutex server_mutex_;
    httplib::Server* server_ = nullptr;         // valid while start() runs
    std::atomic<bool> running_{false};
};

} // namespace nlquery
