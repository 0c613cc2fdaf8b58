#include "server/http_server.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <nlohmann/json.hpp>

#include <format>
#include <stdexcept>

namespace nlquery {

namespace {

void send_error(httplib::Response& res, int status, std::string_view message) {
    res.status = status;
    const nlohmann::json body = {{"success", false}, {"error", message}};
    res.set_content(body.dump(), http::kJsonContentType);
}

void send_json(httplib::Response& res, const nlohmann::json& body, int status = httplib::StatusCode::OK_200) {
    res.status = status;
    res.set_content(body.dump(), http::kJsonContentType);
}

/// Parse a JSON object body, or answer 400 and return nullopt
std::optional<nlohmann::json> parse_body(const httplib::Request& req, httplib::Response& res) {
    auto body = nlohmann::json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        send_error(res, httplib::StatusCode::BadRequest_400, "Invalid JSON: empty or malformed");
        return std::nullopt;
    }
    return body;
}

/// Integer field with a default; non-integers answer 400
std::optional<int64_t> int_field(const nlohmann::json& body, const char* field, int64_t fallback,
                                 httplib::Response& res) {
    const auto it = body.find(field);
    if (it == body.end() || it->is_null()) return fallback;
    if (!it->is_number_integer()) {
        send_error(res, httplib::StatusCode::BadRequest_400,
            std::format("Field '{}' must be an integer", field));
        return std::nullopt;
    }
    return it->get<int64_t>();
}

} // anonymous namespace

int http_status_for(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                 return httplib::StatusCode::OK_200;
        case ErrorCategory::CONNECTION_ERROR:     return httplib::StatusCode::BadRequest_400;
        case ErrorCategory::INTROSPECTION_ERROR:  return httplib::StatusCode::BadRequest_400;
        case ErrorCategory::QUERY_NOT_UNDERSTOOD: return httplib::StatusCode::UnprocessableContent_422;
        case ErrorCategory::TIMEOUT_ERROR:        return httplib::StatusCode::GatewayTimeout_504;
        case ErrorCategory::INDEX_UNAVAILABLE:    return httplib::StatusCode::ServiceUnavailable_503;
        case ErrorCategory::SYNTAX_ERROR:
        case ErrorCategory::CACHE_CORRUPTION:
        case ErrorCategory::INTERNAL_ERROR:       return httplib::StatusCode::InternalServerError_500;
    }
    return httplib::StatusCode::InternalServerError_500;
}

// ============================================================================
// Lifecycle
// ============================================================================

HttpServer::HttpServer(std::shared_ptr<QueryEngine> engine, ServerConfig config)
    : engine_(std::move(engine)),
      config_(std::move(config)) {
    if (!engine_) {
        throw std::invalid_argument("HttpServer requires a query engine");
    }
}

void HttpServer::start() {
    httplib::Server svr;

    // Configure thread pool size
    const size_t pool_size = config_.threads;
    svr.new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };
    svr.set_read_timeout(std::chrono::duration_cast<std::chrono::seconds>(config_.request_timeout));
    svr.set_write_timeout(std::chrono::duration_cast<std::chrono::seconds>(config_.request_timeout));

    register_routes(svr);

    {
        std::lock_guard lock(server_mutex_);
        server_ = &svr;
    }
    running_.store(true);

    utils::log::info(std::format("Starting nlquery server on {}:{} ({} threads)",
        config_.host, config_.port, config_.threads));

    const bool ok = svr.listen(config_.host, config_.port);

    {
        std::lock_guard lock(server_mutex_);
        server_ = nullptr;
    }
    const bool was_running = running_.exchange(false);
    if (!ok && was_running) {
        throw std::runtime_error(std::format("Failed to listen on {}:{}", config_.host, config_.port));
    }
}

void HttpServer::stop() {
    running_.store(false);
    shutdown_.request_stop();
    std::lock_guard lock(server_mutex_);
    if (server_) server_->stop();
    utils::log::info("Server stopped");
}

void HttpServer::register_routes(httplib::Server& svr) {
    svr.Post(http::kConnectRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_connect(req, res);
    });
    svr.Post(http::kQueryRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_query(req, res);
    });
    svr.Get(http::kHistoryRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_history(req, res);
    });
    svr.Get(http::kSchemaRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_schema(req, res);
    });
    svr.Get(http::kHealthRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
}

// ============================================================================
// Handlers
// ============================================================================

void HttpServer::handle_connect(const httplib::Request& req, httplib::Response& res) {
    const auto body = parse_body(req, res);
    if (!body) return;

    const auto it = body->find("connection_string");
    if (it == body->end() || !it->is_string() || it->get<std::string>().empty()) {
        send_error(res, httplib::StatusCode::BadRequest_400, "Missing required field: connection_string");
        return;
    }

    auto catalog = engine_->discover_schema(it->get<std::string>());
    if (catalog.is_error()) {
        send_error(res, http_status_for(catalog.error_category()), catalog.error_message());
        return;
    }

    send_json(res, {
        {"success", true},
        {"connection", engine_->connection_identity()},
        {"schema", catalog.value()->to_json()},
    });
}

void HttpServer::handle_query(const httplib::Request& req, httplib::Response& res) {
    const auto body = parse_body(req, res);
    if (!body) return;

    const auto it = body->find("query");
    if (it == body->end() || !it->is_string()) {
        send_error(res, httplib::StatusCode::BadRequest_400, "Missing required field: query");
        return;
    }
    const auto query = it->get<std::string>();
    if (query.size() > config_.max_query_length) {
        send_error(res, httplib::StatusCode::PayloadTooLarge_413,
            std::format("Query exceeds {} characters", config_.max_query_length));
        return;
    }

    const auto page = int_field(*body, "page", 1, res);
    if (!page) return;
    const auto page_size = int_field(*body, "page_size", 0, res);
    if (!page_size) return;

    auto outcome = engine_->run_query(query, *page, *page_size, shutdown_.get_token());
    if (!outcome.success) {
        outcome.body["success"] = false;
        send_json(res, outcome.body, http_status_for(outcome.error_category));
        return;
    }
    send_json(res, outcome.body);
}

void HttpServer::handle_history(const httplib::Request&, httplib::Response& res) {
    send_json(res, engine_->get_history());
}

void HttpServer::handle_schema(const httplib::Request&, httplib::Response& res) {
    auto schema = engine_->get_schema();
    if (schema.is_error()) {
        send_error(res, httplib::StatusCode::NotFound_404, schema.error_message());
        return;
    }
    send_json(res, schema.value());
}

void HttpServer::handle_health(const httplib::Request&, httplib::Response& res) {
    const auto stats = engine_->cache().get_stats();
    send_json(res, {
        {"status", "healthy"},
        {"service", "nlquery"},
        {"connected", engine_->is_connected()},
        {"cache", {
            {"hits", stats.hits},
            {"misses", stats.misses},
            {"evictions", stats.evictions},
            {"expirations", stats.expirations},
            {"invalidations", stats.invalidations},
            {"entries", stats.current_entries},
        }},
    });
}

} // namespace nlquery
