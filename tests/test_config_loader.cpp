#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace nlquery;

namespace {

bool mentions(const std::string& message, std::string_view fragment) {
    return message.find(fragment) != std::string::npos;
}

} // anonymous namespace

TEST_CASE("ConfigLoader: empty config uses defaults", "[config]") {
    ::unsetenv("DATABASE_URL");
    const auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.server.port == 8080);
    CHECK(cfg.server.threads == 4);
    CHECK(cfg.logging.level == "info");
    CHECK(cfg.database.connection_string.empty());
    CHECK(cfg.cache.enabled);
    CHECK(cfg.cache.ttl == std::chrono::seconds(300));
    CHECK(cfg.planner.default_page_size == 50);
    CHECK(cfg.planner.max_page_size == 200);
    CHECK_FALSE(cfg.documents.enabled);
    CHECK(cfg.history.capacity == 50);
    CHECK(cfg.hint_rules.empty());
}

TEST_CASE("ConfigLoader: sections are read", "[config]") {
    ::unsetenv("DATABASE_URL");
    const auto result = ConfigLoader::load_from_string(R"(
        [server]
        host = "127.0.0.1"
        port = 9090
        threads = 8
        request_timeout_ms = 1500
        branch_workers = 3

        [logging]
        level = "debug"

        [database]
        connection_string = "sqlite:///var/lib/hr.db"
        max_connections = 4
        query_timeout_ms = 2500
        sample_limit = 5

        [cache]
        enabled = false

        [planner]
        default_page_size = 20
        max_page_size = 100
        match_threshold = 0.9

        [documents]
        enabled = true
        endpoint = "http://search:8001"
        limit = 3

        [history]
        capacity = 10
    )");
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.server.host == "127.0.0.1");
    CHECK(cfg.server.port == 9090);
    CHECK(cfg.server.threads == 8);
    CHECK(cfg.server.request_timeout == std::chrono::milliseconds(1500));
    CHECK(cfg.logging.level == "debug");
    CHECK(cfg.database.connection_string == "sqlite:///var/lib/hr.db");
    CHECK(cfg.database.max_connections == 4);
    CHECK_FALSE(cfg.cache.enabled);
    CHECK(cfg.planner.match_threshold == 0.9);
    CHECK(cfg.documents.endpoint == "http://search:8001");
    CHECK(cfg.history.capacity == 10);

    SECTION("Engine settings follow the sections") {
        const auto engine = ConfigLoader::build_engine_config(cfg);
        CHECK(engine.planner.default_page_size == 20);
        CHECK(engine.planner.max_page_size == 100);
        CHECK(engine.match_threshold == 0.9);
        CHECK_FALSE(engine.cache.enabled);
        CHECK(engine.query_timeout == std::chrono::milliseconds(2500));
        CHECK(engine.discovery.sample_limit == 5);
        CHECK(engine.discovery.pool.max_connections == 4);
        CHECK(engine.document_limit == 3);
        CHECK(engine.history_capacity == 10);
        CHECK(engine.branch_workers == 3);
        CHECK(engine.max_pending_branches == 64);
    }
}

TEST_CASE("ConfigLoader: environment substitution", "[config]") {
    ::unsetenv("DATABASE_URL");
    ::setenv("NLQUERY_TEST_KEY", "s3cret", 1);
    ::unsetenv("NLQUERY_TEST_MISSING");

    const auto result = ConfigLoader::load_from_string(R"(
        [documents]
        api_key = "${NLQUERY_TEST_KEY}"
        path = "/v1${NLQUERY_TEST_MISSING}/search"
    )");
    REQUIRE(result.success);
    CHECK(result.config.documents.api_key == "s3cret");
    CHECK(result.config.documents.path == "/v1/search");

    SECTION("Unclosed substitution is an error") {
        const auto bad = ConfigLoader::load_from_string(R"(
            [documents]
            api_key = "${NLQUERY_TEST_KEY"
        )");
        CHECK_FALSE(bad.success);
        CHECK(mentions(bad.error_message, "Unclosed env var substitution"));
    }

    ::unsetenv("NLQUERY_TEST_KEY");
}

TEST_CASE("ConfigLoader: DATABASE_URL overrides the file", "[config]") {
    ::setenv("DATABASE_URL", "postgresql://hr:pw@db:5432/hr", 1);
    const auto result = ConfigLoader::load_from_string(R"(
        [database]
        connection_string = "sqlite:///var/lib/hr.db"
    )");
    ::unsetenv("DATABASE_URL");

    REQUIRE(result.success);
    CHECK(result.config.database.connection_string == "postgresql://hr:pw@db:5432/hr");
}

TEST_CASE("ConfigLoader: validation collects every problem", "[config]") {
    ::unsetenv("DATABASE_URL");
    const auto result = ConfigLoader::load_from_string(R"(
        [server]
        port = 70000
        threads = 0
        branch_workers = 0

        [logging]
        level = "verbose"

        [database]
        min_connections = 5
        max_connections = 2

        [planner]
        default_page_size = 500
        max_page_size = 100
        match_threshold = 1.5

        [documents]
        enabled = true
        endpoint = ""

        [history]
        capacity = 0
    )");
    REQUIRE_FALSE(result.success);

    const auto& msg = result.error_message;
    CHECK(mentions(msg, "server.port must be 1-65535"));
    CHECK(mentions(msg, "server.threads must be > 0"));
    CHECK(mentions(msg, "server.branch_workers must be > 0"));
    CHECK(mentions(msg, "logging.level must be"));
    CHECK(mentions(msg, "database.min_connections (5) > max_connections (2)"));
    CHECK(mentions(msg, "planner.default_page_size must be 1-100"));
    CHECK(mentions(msg, "planner.match_threshold must be in (0, 1]"));
    CHECK(mentions(msg, "documents.endpoint required"));
    CHECK(mentions(msg, "history.capacity must be > 0"));
}

TEST_CASE("ConfigLoader: malformed TOML is reported", "[config]") {
    const auto result = ConfigLoader::load_from_string("[server\nport = ");
    CHECK_FALSE(result.success);
    CHECK(mentions(result.error_message, "Failed to parse config"));
}

TEST_CASE("ConfigLoader: hint rules extend the defaults", "[config]") {
    ::unsetenv("DATABASE_URL");
    const auto result = ConfigLoader::load_from_string(R"(
        [planner]
        fuzzy_threshold = 0.9

        [[hint_rules]]
        hint = "skill-like"
        target = "column"
        synonyms = ["skill", "expertise"]

        [[hint_rules]]
        hint = "employee-like"
        target = "table"
        synonyms = ["engineer"]
    )");
    REQUIRE(result.success);
    REQUIRE(result.config.hint_rules.size() == 2);
    CHECK(result.config.hint_rules[0].target == HintTarget::COLUMN);

    const auto rules = ConfigLoader::build_hint_rules(result.config);
    CHECK(rules.fuzzy_threshold() == 0.9);
    CHECK(rules.hints_for_term("expertise").count("skill-like") == 1);
    CHECK(rules.hints_for_term("engineer").count("employee-like") == 1);
    // Defaults are still there
    CHECK(rules.hints_for_term("salary").count("salary-like") == 1);
}

TEST_CASE("ConfigLoader: invalid hint rules are rejected", "[config]") {
    ::unsetenv("DATABASE_URL");
    const auto result = ConfigLoader::load_from_string(R"(
        [[hint_rules]]
        hint = ""
        synonyms = ["x"]

        [[hint_rules]]
        hint = "skill-like"
        synonyms = []

        [[hint_rules]]
        hint = "skill-like"
        target = "row"
        synonyms = ["skill"]
    )");
    REQUIRE_FALSE(result.success);
    CHECK(mentions(result.error_message, "hint_rules[0].hint must not be empty"));
    CHECK(mentions(result.error_message, "hint_rules[1].synonyms must not be empty"));
    CHECK(mentions(result.error_message, "hint_rules[2].target must be table, column or any, got 'row'"));
}

TEST_CASE("ConfigLoader: load_from_file", "[config]") {
    ::unsetenv("DATABASE_URL");
    const auto path = std::filesystem::temp_directory_path() / "nlquery_test_config.toml";
    {
        std::ofstream out(path);
        out << "[server]\nport = 8181\n\n[history]\ncapacity = 7\n";
    }

    const auto result = ConfigLoader::load_from_file(path.string());
    std::filesystem::remove(path);
    REQUIRE(result.success);
    CHECK(result.config.server.port == 8181);
    CHECK(result.config.history.capacity == 7);

    const auto missing = ConfigLoader::load_from_file("/nonexistent/nlquery.toml");
    CHECK_FALSE(missing.success);
    CHECK(mentions(missing.error_message, "Failed to load config"));
}
