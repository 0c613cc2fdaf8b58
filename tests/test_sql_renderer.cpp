#include <catch2/catch_test_macros.hpp>
#include "planner/sql_renderer.hpp"
#include "db/sqlite/sqlite_backend.hpp"

#include <format>

using namespace nlquery;

namespace {

/// Numbered placeholders, as PostgreSQL renders them
class NumberedDialect : public ISqlDialect {
public:
    [[nodiscard]] DatabaseType type() const override { return DatabaseType::POSTGRESQL; }
    [[nodiscard]] std::string quote_identifier(std::string_view identifier) const override {
        return dialect_detail::quote_with(identifier, '"');
    }
    [[nodiscard]] std::string placeholder(size_t index) const override {
        return std::format("${}", index);
    }
};

QueryPlan salary_plan() {
    QueryPlan plan;
    plan.table = "employees";
    plan.limit = 10;
    return plan;
}

} // anonymous namespace

TEST_CASE("SqlRenderer: every column of the primary table by default", "[renderer]") {
    const SqlRenderer renderer(std::make_shared<SqliteDialect>());
    const auto r = renderer.render(salary_plan());
    REQUIRE(r.is_ok());
    CHECK(r.value().sql == R"(SELECT t0.* FROM "employees" t0 LIMIT 10 OFFSET 0)");
    CHECK(r.value().params.empty());
}

TEST_CASE("SqlRenderer: comparison shapes", "[renderer]") {
    const SqlRenderer renderer(std::make_shared<SqliteDialect>());
    auto plan = salary_plan();

    SECTION("BETWEEN is inclusive") {
        plan.params = {"50000", "100000"};
        plan.predicates = {{{"t0", "annual_salary"}, CompareOp::BETWEEN, 0, 2}};
        const auto r = renderer.render(plan);
        REQUIRE(r.is_ok());
        CHECK(r.value().sql.find(
            R"(WHERE (t0."annual_salary" >= ? AND t0."annual_salary" <= ?))") != std::string::npos);
    }

    SECTION("RANGE is half-open") {
        plan.params = {"2021-01-01", "2022-01-01"};
        plan.predicates = {{{"t0", "join_date"}, CompareOp::RANGE, 0, 2}};
        const auto r = renderer.render(plan);
        REQUIRE(r.is_ok());
        CHECK(r.value().sql.find(
            R"(WHERE (t0."join_date" >= ? AND t0."join_date" < ?))") != std::string::npos);
    }

    SECTION("IN lists one placeholder per value") {
        plan.params = {"HR", "Engineering", "Sales"};
        plan.predicates = {{{"t0", "position"}, CompareOp::IN, 0, 3}};
        const auto r = renderer.render(plan);
        REQUIRE(r.is_ok());
        CHECK(r.value().sql.find(R"(WHERE t0."position" IN (?, ?, ?))") != std::string::npos);
        CHECK(r.value().params == std::vector<std::string>{"HR", "Engineering", "Sales"});
    }

    SECTION("Several predicates are ANDed") {
        plan.params = {"90000", "2022-01-01"};
        plan.predicates = {
            {{"t0", "annual_salary"}, CompareOp::GE, 0, 1},
            {{"t0", "join_date"}, CompareOp::LT, 1, 1},
        };
        const auto r = renderer.render(plan);
        REQUIRE(r.is_ok());
        CHECK(r.value().sql.find(R"(WHERE t0."annual_salary" >= ? AND t0."join_date" < ?)") !=
              std::string::npos);
    }
}

TEST_CASE("SqlRenderer: placeholders follow the dialect and parameter order", "[renderer]") {
    const SqlRenderer renderer(std::make_shared<NumberedDialect>());
    auto plan = salary_plan();
    // Parameters stored out of placeholder order
    plan.params = {"2022-01-01", "Engineering", "HR"};
    plan.predicates = {
        {{"t0", "position"}, CompareOp::IN, 1, 2},
        {{"t0", "join_date"}, CompareOp::GT, 0, 1},
    };

    const auto r = renderer.render(plan);
    REQUIRE(r.is_ok());
    CHECK(r.value().sql.find(R"(t0."position" IN ($1, $2) AND t0."join_date" > $3)") !=
          std::string::npos);
    CHECK(r.value().params == std::vector<std::string>{"Engineering", "HR", "2022-01-01"});
}

TEST_CASE("SqlRenderer: aggregates, grouping and ordering", "[renderer]") {
    const SqlRenderer renderer(std::make_shared<SqliteDialect>());
    QueryPlan plan;
    plan.table = "employees";
    plan.join = JoinSpec{"departments", "t1", {"t0", "dept_id"}, {"t1", "id"}};
    plan.select = {
        {{"t1", "dept_name"}, AggregateFunc::NONE, "dept_name"},
        {{"t0", "annual_salary"}, AggregateFunc::MAX, "max_annual_salary"},
        {{"t0", ""}, AggregateFunc::COUNT, "count"},
    };
    plan.group_by = {{"t1", "dept_name"}};
    plan.order_by = {{std::nullopt, "max_annual_salary", true}, {ColumnRef{"t1", "dept_name"}, "", false}};
    plan.limit = 20;
    plan.offset = 40;

    const auto r = renderer.render(plan);
    REQUIRE(r.is_ok());
    CHECK(r.value().sql ==
        R"(SELECT t1."dept_name" AS "dept_name", MAX(t0."annual_salary") AS "max_annual_salary", )"
        R"(COUNT(*) AS "count" FROM "employees" t0 JOIN "departments" t1 ON t0."dept_id" = t1."id" )"
        R"(GROUP BY t1."dept_name" ORDER BY "max_annual_salary" DESC, t1."dept_name" LIMIT 20 OFFSET 40)");
}

TEST_CASE("SqlRenderer: identifiers are quoted with embedded quotes doubled", "[renderer]") {
    const SqlRenderer renderer(std::make_shared<SqliteDialect>());
    QueryPlan plan;
    plan.table = "odd\"table";
    plan.select = {{{"t0", "col\"x"}, AggregateFunc::NONE, ""}};

    const auto r = renderer.render(plan);
    REQUIRE(r.is_ok());
    CHECK(r.value().sql == R"(SELECT t0."col""x" FROM "odd""table" t0 LIMIT 50 OFFSET 0)");
}

TEST_CASE("SqlRenderer: predicates past the parameter list are rejected", "[renderer]") {
    const SqlRenderer renderer(std::make_shared<SqliteDialect>());
    auto plan = salary_plan();
    plan.params = {"1"};

    SECTION("Single comparison") {
        plan.predicates = {{{"t0", "annual_salary"}, CompareOp::GT, 1, 1}};
        const auto r = renderer.render(plan);
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::INTERNAL_ERROR);
    }

    SECTION("Range upper bound missing") {
        plan.predicates = {{{"t0", "annual_salary"}, CompareOp::BETWEEN, 0, 2}};
        const auto r = renderer.render(plan);
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::INTERNAL_ERROR);
    }

    SECTION("IN list longer than the parameters") {
        plan.predicates = {{{"t0", "position"}, CompareOp::IN, 0, 3}};
        const auto r = renderer.render(plan);
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::INTERNAL_ERROR);
    }
}
