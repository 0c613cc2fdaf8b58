#include <catch2/catch_test_macros.hpp>
#include "engine/query_history.hpp"

#include <string>
#include <thread>
#include <vector>

using namespace nlquery;

namespace {

HistoryRecord make_record(std::string query, QueryType type = QueryType::STRUCTURED) {
    return {std::move(query), type, std::chrono::system_clock::now()};
}

} // anonymous namespace

TEST_CASE("QueryHistory: most recent first", "[history]") {
    QueryHistory history;
    history.record(make_record("How many employees?"));
    history.record(make_record("Find resumes mentioning Python", QueryType::DOCUMENT));

    const auto records = history.snapshot();
    REQUIRE(records.size() == 2);
    CHECK(records[0].query == "Find resumes mentioning Python");
    CHECK(records[0].query_type == QueryType::DOCUMENT);
    CHECK(records[1].query == "How many employees?");
}

TEST_CASE("QueryHistory: oldest records are dropped at capacity", "[history]") {
    QueryHistory history(3);
    for (int i = 0; i < 5; ++i) {
        history.record(make_record("q" + std::to_string(i)));
    }

    CHECK(history.size() == 3);
    const auto records = history.snapshot();
    REQUIRE(records.size() == 3);
    CHECK(records[0].query == "q4");
    CHECK(records[2].query == "q2");
}

TEST_CASE("QueryHistory: default and minimum capacity", "[history]") {
    CHECK(QueryHistory().capacity() == 50);
    QueryHistory tiny(0);
    CHECK(tiny.capacity() == 1);
    tiny.record(make_record("a"));
    tiny.record(make_record("b"));
    REQUIRE(tiny.size() == 1);
    CHECK(tiny.snapshot()[0].query == "b");
}

TEST_CASE("QueryHistory: snapshot is a copy", "[history]") {
    QueryHistory history;
    history.record(make_record("a"));
    const auto before = history.snapshot();
    history.record(make_record("b"));
    CHECK(before.size() == 1);
    CHECK(history.size() == 2);
}

TEST_CASE("QueryHistory: concurrent writers never exceed capacity", "[history]") {
    QueryHistory history(20);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&history, t] {
            for (int i = 0; i < 100; ++i) {
                history.record(make_record(std::to_string(t) + ":" + std::to_string(i)));
                (void)history.snapshot();
            }
        });
    }
    for (auto& th : threads) th.join();
    CHECK(history.size() == 20);
}
