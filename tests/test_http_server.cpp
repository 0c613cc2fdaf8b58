#include <catch2/catch_test_macros.hpp>
#include "server/http_server.hpp"
#include "demo_database.hpp"
#include "mocks/mock_document_search.hpp"
#include "mocks/mock_query_executor.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

using namespace nlquery;

namespace {

struct Fixture {
    std::shared_ptr<testing::MockDocumentSearch> search = std::make_shared<testing::MockDocumentSearch>();
    std::shared_ptr<QueryEngine> engine;
    std::unique_ptr<HttpServer> server;

    explicit Fixture(ServerConfig config = {}) {
        EngineConfig engine_config;
        engine_config.query_timeout = std::chrono::milliseconds{2000};
        engine = std::make_shared<QueryEngine>(engine_config, HintRuleSet::defaults(), search);
        server = std::make_unique<HttpServer>(engine, config);
    }

    void attach_mock() {
        engine->attach("mock", testing::demo_catalog(), std::make_shared<testing::MockQueryExecutor>());
    }
};

httplib::Request json_request(const nlohmann::json& body) {
    httplib::Request req;
    req.body = body.dump();
    return req;
}

nlohmann::json body_of(const httplib::Response& res) {
    return nlohmann::json::parse(res.body);
}

} // anonymous namespace

TEST_CASE("http_status_for: categories map to statuses", "[http]") {
    CHECK(http_status_for(ErrorCategory::CONNECTION_ERROR) == 400);
    CHECK(http_status_for(ErrorCategory::INTROSPECTION_ERROR) == 400);
    CHECK(http_status_for(ErrorCategory::QUERY_NOT_UNDERSTOOD) == 422);
    CHECK(http_status_for(ErrorCategory::TIMEOUT_ERROR) == 504);
    CHECK(http_status_for(ErrorCategory::INDEX_UNAVAILABLE) == 503);
    CHECK(http_status_for(ErrorCategory::SYNTAX_ERROR) == 500);
    CHECK(http_status_for(ErrorCategory::INTERNAL_ERROR) == 500);
}

TEST_CASE("HttpServer: health reports connection and cache", "[http]") {
    Fixture f;
    httplib::Response res;
    f.server->handle_health(httplib::Request{}, res);

    CHECK(res.status == 200);
    const auto body = body_of(res);
    CHECK(body["status"] == "healthy");
    CHECK(body["connected"] == false);
    CHECK(body["cache"]["entries"] == 0);

    f.attach_mock();
    httplib::Response after;
    f.server->handle_health(httplib::Request{}, after);
    CHECK(body_of(after)["connected"] == true);
}

TEST_CASE("HttpServer: connect", "[http]") {
    Fixture f;

    SECTION("Malformed body") {
        httplib::Request req;
        req.body = "{not json";
        httplib::Response res;
        f.server->handle_connect(req, res);
        CHECK(res.status == 400);
        CHECK(body_of(res)["error"] == "Invalid JSON: empty or malformed");
    }

    SECTION("Missing connection string") {
        httplib::Response res;
        f.server->handle_connect(json_request({{"dsn", "x"}}), res);
        CHECK(res.status == 400);
        CHECK(body_of(res)["error"] == "Missing required field: connection_string");
    }

    SECTION("Unreachable database") {
        httplib::Response res;
        f.server->handle_connect(json_request({{"connection_string", "sqlite:////nonexistent/x.db"}}), res);
        CHECK(res.status == 400);
        CHECK(body_of(res)["success"] == false);
        CHECK_FALSE(f.engine->is_connected());
    }

    SECTION("Demo database") {
        testing::DemoDatabase db;
        httplib::Response res;
        f.server->handle_connect(json_request({{"connection_string", db.url()}}), res);
        REQUIRE(res.status == 200);
        const auto body = body_of(res);
        CHECK(body["success"] == true);
        CHECK(body["schema"]["tables"].size() == 2);
        CHECK(f.engine->is_connected());
    }
}

TEST_CASE("HttpServer: query", "[http]") {
    Fixture f;

    SECTION("Before connecting") {
        httplib::Response res;
        f.server->handle_query(json_request({{"query", "How many employees?"}}), res);
        CHECK(res.status == 400);
        CHECK(body_of(res)["category"] == "ConnectionError");
    }

    f.attach_mock();

    SECTION("Structured answer") {
        httplib::Response res;
        f.server->handle_query(json_request({{"query", "How many employees do we have?"}}), res);
        REQUIRE(res.status == 200);
        const auto body = body_of(res);
        CHECK(body["query_type"] == "structured");
        CHECK(body["results"]["rows"].size() == 2);
        CHECK(body["cache"]["hit"] == false);
    }

    SECTION("Not understood is 422 with what was matched") {
        httplib::Response res;
        f.server->handle_query(json_request({{"query", "how many of the"}}), res);
        CHECK(res.status == 422);
        const auto body = body_of(res);
        CHECK(body["success"] == false);
        CHECK(body["category"] == "QueryNotUnderstood");
        CHECK(body.contains("matched"));
        CHECK(body.contains("unmatched"));
    }

    SECTION("Index outage is 503") {
        f.search->fail_with(ErrorCategory::INDEX_UNAVAILABLE);
        httplib::Response res;
        f.server->handle_query(json_request({{"query", "Find resumes mentioning Python"}}), res);
        CHECK(res.status == 503);
    }

    SECTION("Missing query field") {
        httplib::Response res;
        f.server->handle_query(json_request({{"question", "x"}}), res);
        CHECK(res.status == 400);
        CHECK(body_of(res)["error"] == "Missing required field: query");
    }

    SECTION("Non-integer page") {
        httplib::Response res;
        f.server->handle_query(json_request({{"query", "show employees"}, {"page", "two"}}), res);
        CHECK(res.status == 400);
        CHECK(body_of(res)["error"] == "Field 'page' must be an integer");
    }

    SECTION("Pagination is passed through") {
        httplib::Response res;
        f.server->handle_query(
            json_request({{"query", "show employees"}, {"page", 2}, {"page_size", 5}}), res);
        REQUIRE(res.status == 200);
        CHECK(body_of(res)["results"]["page"] == 2);
        CHECK(body_of(res)["results"]["page_size"] == 5);
    }
}

TEST_CASE("HttpServer: overlong queries are rejected", "[http]") {
    ServerConfig config;
    config.max_query_length = 16;
    Fixture f(config);
    f.attach_mock();

    httplib::Response res;
    f.server->handle_query(json_request({{"query", std::string(17, 'a')}}), res);
    CHECK(res.status == 413);
    CHECK(body_of(res)["error"] == "Query exceeds 16 characters");
}

TEST_CASE("HttpServer: schema and history", "[http]") {
    Fixture f;

    httplib::Response missing;
    f.server->handle_schema(httplib::Request{}, missing);
    CHECK(missing.status == 404);

    f.attach_mock();
    httplib::Response schema;
    f.server->handle_schema(httplib::Request{}, schema);
    REQUIRE(schema.status == 200);
    CHECK(body_of(schema)["connection"] == "mock#1");

    httplib::Response query;
    f.server->handle_query(json_request({{"query", "How many employees do we have?"}}), query);
    REQUIRE(query.status == 200);

    httplib::Response history;
    f.server->handle_history(httplib::Request{}, history);
    CHECK(history.status == 200);
    const auto records = body_of(history);
    REQUIRE(records.size() == 1);
    CHECK(records[0]["query"] == "How many employees do we have?");
}

TEST_CASE("HttpServer: stop cancels later queries", "[http]") {
    Fixture f;
    f.attach_mock();
    f.server->stop();

    httplib::Response res;
    f.server->handle_query(json_request({{"query", "How many employees do we have?"}}), res);
    CHECK(res.status == 504);
    CHECK(body_of(res)["error"] == "Query was cancelled");
}

TEST_CASE("HttpServer: requires an engine", "[http]") {
    CHECK_THROWS_AS(HttpServer(nullptr, ServerConfig{}), std::invalid_argument);
}
