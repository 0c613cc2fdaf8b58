#include <catch2/catch_test_macros.hpp>
#include "engine/hybrid_merger.hpp"
#include "mocks/mock_document_search.hpp"
#include "mocks/mock_query_executor.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>

using namespace nlquery;
using testing::MockDocumentSearch;
using testing::MockQueryExecutor;

namespace {

struct Branches {
    std::shared_ptr<MockQueryExecutor> executor = std::make_shared<MockQueryExecutor>();
    std::shared_ptr<MockDocumentSearch> search = std::make_shared<MockDocumentSearch>();
    BranchExecutor pool{4};

    HybridMerger::StructuredBranch structured() const {
        return [exec = executor] { return exec->execute(QueryPlan{}, std::chrono::seconds(5)); };
    }

    HybridMerger::DocumentBranch documents() const {
        return [s = search] { return s->search("Python", 10, std::chrono::seconds(5)); };
    }
};

} // anonymous namespace

TEST_CASE("HybridMerger: both branches succeed", "[hybrid]") {
    Branches b;
    const HybridMerger merger(b.pool, std::chrono::milliseconds{2000});

    const auto result = merger.run(b.structured(), b.documents());
    REQUIRE(result.is_ok());
    const auto& merged = result.value();

    CHECK_FALSE(merged.partial_failure);
    CHECK(merged.errors.empty());
    REQUIRE(merged.table.rows.size() == 2);
    CHECK(merged.table.rows[0][1] == "Alice Smith");
    REQUIRE(merged.documents.size() == 2);
    CHECK(merged.documents[0].metadata.at("source") == "resumes/alice.pdf");
    CHECK(b.executor->execute_count() == 1);
    CHECK(b.search->search_count() == 1);
}

TEST_CASE("HybridMerger: branches run concurrently", "[hybrid]") {
    Branches b;
    b.executor->set_delay(std::chrono::milliseconds{300});
    b.search->set_delay(std::chrono::milliseconds{300});
    const HybridMerger merger(b.pool, std::chrono::milliseconds{2000});

    const auto start = std::chrono::steady_clock::now();
    const auto result = merger.run(b.structured(), b.documents());
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(result.is_ok());
    CHECK_FALSE(result.value().partial_failure);
    CHECK(elapsed < std::chrono::milliseconds{550});
}

TEST_CASE("HybridMerger: a failed document branch keeps the rows", "[hybrid]") {
    Branches b;
    b.search->fail_with(ErrorCategory::INDEX_UNAVAILABLE);
    const HybridMerger merger(b.pool, std::chrono::milliseconds{2000});

    const auto result = merger.run(b.structured(), b.documents());
    REQUIRE(result.is_ok());
    const auto& merged = result.value();
    CHECK(merged.partial_failure);
    CHECK(merged.table.rows.size() == 2);
    CHECK(merged.documents.empty());
    REQUIRE(merged.errors.size() == 1);
    CHECK(merged.errors[0].branch == "document");
    CHECK(merged.errors[0].category == ErrorCategory::INDEX_UNAVAILABLE);
}

TEST_CASE("HybridMerger: a slow branch is cut at the deadline", "[hybrid]") {
    Branches b;
    b.search->set_delay(std::chrono::milliseconds{1000});
    const HybridMerger merger(b.pool, std::chrono::milliseconds{200});

    const auto start = std::chrono::steady_clock::now();
    const auto result = merger.run(b.structured(), b.documents());
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(result.is_ok());
    CHECK(elapsed < std::chrono::milliseconds{800});
    CHECK(result.value().partial_failure);
    CHECK(result.value().table.rows.size() == 2);
    REQUIRE(result.value().errors.size() == 1);
    CHECK(result.value().errors[0].category == ErrorCategory::TIMEOUT_ERROR);
}

TEST_CASE("HybridMerger: a failed structured branch keeps the documents", "[hybrid]") {
    Branches b;
    b.executor->fail_with(ErrorCategory::CONNECTION_ERROR);
    const HybridMerger merger(b.pool, std::chrono::milliseconds{2000});

    const auto result = merger.run(b.structured(), b.documents());
    REQUIRE(result.is_ok());
    CHECK(result.value().partial_failure);
    CHECK(result.value().table.rows.empty());
    CHECK(result.value().documents.size() == 2);
    REQUIRE(result.value().errors.size() == 1);
    CHECK(result.value().errors[0].branch == "structured");
}

TEST_CASE("HybridMerger: both branches failing reports the structured error", "[hybrid]") {
    Branches b;
    b.executor->fail_with(ErrorCategory::SYNTAX_ERROR);
    b.search->fail_with(ErrorCategory::INDEX_UNAVAILABLE);
    const HybridMerger merger(b.pool, std::chrono::milliseconds{2000});

    const auto result = merger.run(b.structured(), b.documents());
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::SYNTAX_ERROR);
}

TEST_CASE("HybridMerger: exceptions inside a branch become internal errors", "[hybrid]") {
    Branches b;
    const HybridMerger merger(b.pool, std::chrono::milliseconds{2000});

    const auto result = merger.run(
        []() -> Result<QueryResult> { throw std::runtime_error("driver exploded"); },
        b.documents());
    REQUIRE(result.is_ok());
    REQUIRE(result.value().errors.size() == 1);
    CHECK(result.value().errors[0].category == ErrorCategory::INTERNAL_ERROR);
    CHECK(result.value().errors[0].message == "driver exploded");
}
