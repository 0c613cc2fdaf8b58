#include <catch2/catch_test_macros.hpp>
#include "planner/query_classifier.hpp"
#include "planner/query_planner.hpp"
#include "planner/sql_renderer.hpp"
#include "db/sqlite/sqlite_backend.hpp"
#include "demo_database.hpp"

#include <algorithm>
#include <limits>

using namespace nlquery;

namespace {

struct Planned {
    PlanResult result;
    std::string sql;
    std::vector<std::string> params;
};

Planned plan_for(std::string_view text,
                 std::shared_ptr<const SchemaCatalog> catalog = testing::demo_catalog(),
                 int64_t page = 1, int64_t page_size = 0) {
    const EntityMapper mapper(catalog, HintRuleSet::defaults());
    const auto intent = QueryClassifier::classify(mapper.map(text));
    REQUIRE(intent.is_ok());

    Planned out;
    out.result = QueryPlanner().plan(intent.value(), *catalog, page, page_size, text);
    if (out.result.success && out.result.plan) {
        const auto rendered = SqlRenderer(std::make_shared<SqliteDialect>()).render(*out.result.plan);
        REQUIRE(rendered.is_ok());
        out.sql = rendered.value().sql;
        out.params = rendered.value().params;
    }
    return out;
}

bool has_note(const QueryPlan& plan, std::string_view fragment) {
    return std::any_of(plan.notes.begin(), plan.notes.end(),
        [fragment](const std::string& n) { return n.find(fragment) != std::string::npos; });
}

/// Demo catalog plus a table nothing links to and one linked to employees
std::shared_ptr<const SchemaCatalog> extended_catalog() {
    auto tables = testing::demo_catalog()->tables();

    TableInfo projects;
    projects.name = "projects";
    projects.columns = {
        {"id", "INTEGER", LogicalType::IDENTIFIER, false, true, {}, {}},
        {"title", "TEXT", LogicalType::TEXT, true, false, {}, {"Apollo"}},
    };
    tables.push_back(projects);

    TableInfo badges;
    badges.name = "badges";
    badges.columns = {
        {"id", "INTEGER", LogicalType::IDENTIFIER, false, true, {}, {}},
        {"employee_id", "INTEGER", LogicalType::FOREIGN_KEY, true, false, {}, {}},
        {"color", "TEXT", LogicalType::TEXT, true, false, {}, {"Gold"}},
    };
    badges.foreign_keys = {{"employee_id", "employees", "id"}};
    tables.push_back(badges);

    return std::make_shared<const SchemaCatalog>(DatabaseType::SQLITE, std::move(tables));
}

} // anonymous namespace

// ============================================================================
// Plans from questions
// ============================================================================

TEST_CASE("QueryPlanner: plain count", "[planner]") {
    const auto p = plan_for("How many employees do we have?");
    REQUIRE(p.result.success);
    REQUIRE(p.result.plan.has_value());
    CHECK(p.result.plan->table == "employees");
    CHECK_FALSE(p.result.plan->join.has_value());
    CHECK(p.sql == R"(SELECT COUNT(*) AS "count" FROM "employees" t0 LIMIT 50 OFFSET 0)");
    CHECK(p.params.empty());
}

TEST_CASE("QueryPlanner: grouped count joins through the declared key", "[planner]") {
    const auto p = plan_for("How many employees per department?");
    REQUIRE(p.result.success);
    CHECK(p.sql ==
        R"(SELECT t1."dept_name" AS "dept_name", COUNT(*) AS "count" FROM "employees" t0 )"
        R"(JOIN "departments" t1 ON t0."dept_id" = t1."id" )"
        R"(GROUP BY t1."dept_name" ORDER BY "count" DESC LIMIT 50 OFFSET 0)");
}

TEST_CASE("QueryPlanner: aggregate over the mentioned numeric column", "[planner]") {
    const auto p = plan_for("average salary by department");
    REQUIRE(p.result.success);
    CHECK(p.result.plan->table == "employees");
    CHECK(p.sql ==
        R"(SELECT t1."dept_name" AS "dept_name", AVG(t0."annual_salary") AS "avg_annual_salary" )"
        R"(FROM "employees" t0 JOIN "departments" t1 ON t0."dept_id" = t1."id" )"
        R"(GROUP BY t1."dept_name" ORDER BY "avg_annual_salary" DESC LIMIT 50 OFFSET 0)");
}

TEST_CASE("QueryPlanner: aggregate without a numeric column fails", "[planner]") {
    const auto p = plan_for("average location");
    REQUIRE_FALSE(p.result.success);
    CHECK(p.result.error_category == ErrorCategory::QUERY_NOT_UNDERSTOOD);
    CHECK(p.result.error_message == "No numeric column of 'departments' to compute AVG over");
    CHECK_FALSE(p.result.intent.entities.empty());
}

TEST_CASE("QueryPlanner: hybrid lookup filters on the sampled value", "[planner]") {
    const auto p = plan_for("Show me all Python developers in Engineering");
    REQUIRE(p.result.success);
    CHECK(p.result.document_query == "Python");
    CHECK(p.sql ==
        R"(SELECT t0.* FROM "employees" t0 JOIN "departments" t1 ON t0."dept_id" = t1."id" )"
        R"(WHERE t1."dept_name" = ? ORDER BY t0."id" LIMIT 50 OFFSET 0)");
    CHECK(p.params == std::vector<std::string>{"Engineering"});
}

TEST_CASE("QueryPlanner: several values on one column become IN", "[planner]") {
    const auto p = plan_for("employees in Engineering or HR");
    REQUIRE(p.result.success);
    REQUIRE(p.result.plan->predicates.size() == 1);
    CHECK(p.result.plan->predicates[0].op == CompareOp::IN);
    CHECK(p.sql.find(R"(WHERE t1."dept_name" IN (?, ?))") != std::string::npos);
    CHECK(p.params == std::vector<std::string>{"Engineering", "HR"});
}

TEST_CASE("QueryPlanner: literal filters and projected columns", "[planner]") {
    SECTION("Numeric comparison, name column first") {
        const auto p = plan_for("employees with salary over 100k");
        REQUIRE(p.result.success);
        CHECK(p.sql ==
            R"(SELECT t0."name", t0."annual_salary" FROM "employees" t0 )"
            R"(WHERE t0."annual_salary" > ? ORDER BY t0."id" LIMIT 50 OFFSET 0)");
        CHECK(p.params == std::vector<std::string>{"100000"});
    }

    SECTION("Year range is half-open") {
        const auto p = plan_for("employees who joined in 2021");
        REQUIRE(p.result.success);
        CHECK(p.sql.find(R"(WHERE (t0."join_date" >= ? AND t0."join_date" < ?))") != std::string::npos);
        CHECK(p.params == std::vector<std::string>{"2021-01-01", "2022-01-01"});
    }
}

TEST_CASE("QueryPlanner: same-named columns across the join get distinct labels", "[planner]") {
    const auto column = [](std::string name, bool pk = false) {
        ColumnInfo c;
        c.name = std::move(name);
        c.sql_type = pk ? "INTEGER" : "TEXT";
        c.is_primary_key = pk;
        return c;
    };

    TableInfo departments;
    departments.name = "departments";
    departments.columns = {column("id", true), column("name")};

    TableInfo employees;
    employees.name = "employees";
    employees.columns = {column("id", true), column("name"), column("department_id")};
    employees.foreign_keys = {{"department_id", "departments", "id"}};

    std::vector<TableInfo> tables{departments, employees};
    SchemaDiscovery(HintRuleSet::defaults()).annotate(tables);
    const SchemaCatalog catalog(DatabaseType::SQLITE, std::move(tables));

    QueryIntent intent;
    intent.type = QueryType::STRUCTURED;
    intent.operation = Operation::LOOKUP;
    intent.entities = {
        {EntityKind::TABLE, "employee", "employees", "", "", "", LiteralKind::NONE, CompareOp::EQ, 1.0, 1},
        {EntityKind::COLUMN, "name", "employees", "name", "", "", LiteralKind::NONE, CompareOp::EQ, 1.0, 2},
        {EntityKind::COLUMN, "name", "departments", "name", "", "", LiteralKind::NONE, CompareOp::EQ, 1.0, 5},
    };

    const auto result = QueryPlanner().plan(intent, catalog, 1, 0, "show employee name and department name");
    REQUIRE(result.success);
    REQUIRE(result.plan.has_value());
    const auto& select = result.plan->select;
    REQUIRE(select.size() == 2);
    CHECK(select[0].column == ColumnRef{"t0", "name"});
    CHECK(select[0].label.empty());
    CHECK(select[1].column == ColumnRef{"t1", "name"});
    CHECK(select[1].label == "departments_name");

    const auto rendered = SqlRenderer(std::make_shared<SqliteDialect>()).render(*result.plan);
    REQUIRE(rendered.is_ok());
    CHECK(rendered.value().sql.starts_with(R"(SELECT t0."name", t1."name" AS "departments_name" FROM)"));
}

TEST_CASE("QueryPlanner: tables that cannot be joined are dropped with a note", "[planner]") {
    const auto catalog = extended_catalog();

    SECTION("No declared key") {
        const auto p = plan_for("employees on Apollo", catalog);
        REQUIRE(p.result.success);
        CHECK(p.result.plan->predicates.empty());
        CHECK(has_note(*p.result.plan,
            "Reduced to table 'employees': no declared foreign key links it to 'projects'"));
    }

    SECTION("A second join would be needed") {
        const auto p = plan_for("employees in Engineering with Gold", catalog);
        REQUIRE(p.result.success);
        REQUIRE(p.result.plan->join.has_value());
        CHECK(p.result.plan->join->table == "departments");
        CHECK(p.result.plan->predicates.size() == 1);
        CHECK(has_note(*p.result.plan, "'badges' would need a second join"));
    }
}

TEST_CASE("QueryPlanner: unresolved grouping is reported", "[planner]") {
    const auto p = plan_for("count employees by gender");
    REQUIRE(p.result.success);
    CHECK(p.result.plan->group_by.empty());
    CHECK(has_note(*p.result.plan, "Could not resolve grouping 'gender'"));
}

TEST_CASE("QueryPlanner: document questions carry no plan", "[planner]") {
    const auto p = plan_for("Find resumes mentioning Python");
    REQUIRE(p.result.success);
    CHECK_FALSE(p.result.plan.has_value());
    CHECK(p.result.intent.type == QueryType::DOCUMENT);
    CHECK(p.result.document_query == "Find resumes mentioning Python");
}

TEST_CASE("QueryPlanner: user text never reaches the SQL", "[planner][security]") {
    const char* hostile[] = {
        "Show employees named Robert'; DROP TABLE employees; --",
        "employees in \"Engineering'; DROP TABLE departments; --\"",
        "count employees where 1=1 /* or */ union select password",
    };

    for (const auto* text : hostile) {
        INFO(text);
        const auto p = plan_for(text);
        REQUIRE(p.result.success);
        REQUIRE(p.result.plan.has_value());
        CHECK(p.sql.find("DROP") == std::string::npos);
        CHECK(p.sql.find(';') == std::string::npos);
        CHECK(p.sql.find("--") == std::string::npos);
        CHECK(p.sql.find("/*") == std::string::npos);
        CHECK(p.sql.find("union") == std::string::npos);
        CHECK(p.sql.find("Robert") == std::string::npos);

        const auto catalog = testing::demo_catalog();
        CHECK_FALSE(QueryPlanner::validate(*p.result.plan, *catalog).has_value());
        CHECK(catalog->find_table(p.result.plan->table) != nullptr);
    }
}

// ============================================================================
// Pagination
// ============================================================================

TEST_CASE("QueryPlanner: pagination is clamped", "[planner]") {
    const QueryPlanner planner;

    SECTION("Defaults") {
        const auto p = planner.paginate(0, 0);
        CHECK(p.page == 1);
        CHECK(p.page_size == 50);
        CHECK(p.offset == 0);
    }

    SECTION("Oversized page size") {
        const auto p = planner.paginate(3, 100000);
        CHECK(p.page_size == 200);
        CHECK(p.limit == 200);
        CHECK(p.offset == 400);
    }

    SECTION("Negative values") {
        const auto p = planner.paginate(-4, -1);
        CHECK(p.page == 1);
        CHECK(p.page_size == 50);
    }

    SECTION("Plans carry the clamped values") {
        const auto planned = plan_for("How many employees do we have?", testing::demo_catalog(), 2, 5000);
        REQUIRE(planned.result.success);
        CHECK(planned.result.plan->limit == 200);
        CHECK(planned.result.plan->offset == 200);
    }

    SECTION("Huge page numbers keep the offset within BIGINT") {
        const auto p = planner.paginate(std::numeric_limits<int64_t>::max(), 200);
        CHECK(p.page_size == 200);
        CHECK(p.offset <= static_cast<size_t>(std::numeric_limits<int64_t>::max()));
        CHECK(p.offset + p.page_size > static_cast<size_t>(std::numeric_limits<int64_t>::max()));

        const auto q = planner.paginate(50000000000000000, 200);
        CHECK(q.offset <= static_cast<size_t>(std::numeric_limits<int64_t>::max()));
    }

    SECTION("Default page size never exceeds the maximum") {
        const QueryPlanner small({.default_page_size = 50, .max_page_size = 20});
        CHECK(small.paginate(1, 0).page_size == 20);
    }
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("QueryPlanner: validate rejects inconsistent plans", "[planner]") {
    const auto catalog = testing::demo_catalog();

    QueryPlan plan;
    plan.table = "employees";
    plan.select = {{{"t0", "name"}, AggregateFunc::NONE, ""}};
    REQUIRE_FALSE(QueryPlanner::validate(plan, *catalog).has_value());

    SECTION("Unknown table") {
        plan.table = "salaries";
        CHECK(QueryPlanner::validate(plan, *catalog) == "unknown table 'salaries'");
    }

    SECTION("Unknown column") {
        plan.select = {{{"t0", "bonus"}, AggregateFunc::NONE, ""}};
        CHECK(QueryPlanner::validate(plan, *catalog) == "unknown column 'employees.bonus'");
    }

    SECTION("Unknown alias") {
        plan.select = {{{"t1", "dept_name"}, AggregateFunc::NONE, ""}};
        CHECK(QueryPlanner::validate(plan, *catalog) == "unknown alias 't1'");
    }

    SECTION("Predicate past the parameter list") {
        plan.predicates = {{{"t0", "annual_salary"}, CompareOp::BETWEEN, 0, 2}};
        plan.params = {"1"};
        CHECK(QueryPlanner::validate(plan, *catalog).has_value());
    }

    SECTION("Join without a declared key") {
        plan.join = JoinSpec{"employees", "t1", {"t0", "id"}, {"t1", "manager_id"}};
        CHECK(QueryPlanner::validate(plan, *catalog).has_value());
    }

    SECTION("Order by a label that is not projected") {
        plan.order_by = {{std::nullopt, "count", true}};
        CHECK(QueryPlanner::validate(plan, *catalog) == "order by unknown label 'count'");
    }

    SECTION("Zero limit") {
        plan.limit = 0;
        CHECK(QueryPlanner::validate(plan, *catalog) == "limit must be positive");
    }
}

TEST_CASE("QueryPlanner: an intent without any table fails", "[planner]") {
    QueryIntent intent;
    intent.type = QueryType::STRUCTURED;
    const auto result = QueryPlanner().plan(intent, *testing::demo_catalog(), 1, 0, "");
    CHECK_FALSE(result.success);
    CHECK(result.error_message == "Could not determine which table the question is about");
}
