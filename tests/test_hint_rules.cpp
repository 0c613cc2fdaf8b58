#include <catch2/catch_test_macros.hpp>
#include "catalog/hint_rules.hpp"

using namespace nlquery;

TEST_CASE("HintRuleSet: default vocabulary labels common identifiers", "[hints]") {
    const auto rules = HintRuleSet::defaults();

    SECTION("Tables") {
        CHECK(rules.hints_for("employees", HintTarget::TABLE).count("employee-like") == 1);
        CHECK(rules.hints_for("Staff", HintTarget::TABLE).count("employee-like") == 1);
        CHECK(rules.hints_for("departments", HintTarget::TABLE).count("department-like") == 1);
        CHECK(rules.hints_for("invoices", HintTarget::TABLE).empty());
    }

    SECTION("Columns") {
        CHECK(rules.hints_for("annual_salary", HintTarget::COLUMN).count("salary-like") == 1);
        CHECK(rules.hints_for("hire_date", HintTarget::COLUMN).count("date-like") == 1);
        CHECK(rules.hints_for("managerId", HintTarget::COLUMN).count("manager-like") == 1);
        CHECK(rules.hints_for("job_title", HintTarget::COLUMN).count("position-like") == 1);
        CHECK(rules.hints_for("city", HintTarget::COLUMN).count("location-like") == 1);
    }

    SECTION("Department hints apply to tables and columns alike") {
        const auto hints = rules.hints_for("dept_name", HintTarget::COLUMN);
        CHECK(hints.count("department-like") == 1);
        CHECK(hints.count("name-like") == 1);
    }

    SECTION("Table-only rules do not label columns") {
        CHECK(rules.hints_for("employee", HintTarget::COLUMN).count("employee-like") == 0);
    }
}

TEST_CASE("HintRuleSet: multi-word synonyms match as word sequences", "[hints]") {
    const auto rules = HintRuleSet::defaults();
    CHECK(rules.hints_for("employee_full_name", HintTarget::COLUMN).count("name-like") == 1);
    CHECK(rules.hints_for("reports_to", HintTarget::COLUMN).count("manager-like") == 1);
    CHECK(rules.hints_for("base_pay_rate", HintTarget::COLUMN).count("salary-like") == 1);
}

TEST_CASE("HintRuleSet: misspelled words match fuzzily", "[hints]") {
    auto rules = HintRuleSet::defaults();

    CHECK(rules.hints_for("compensaton", HintTarget::COLUMN).count("salary-like") == 1);

    SECTION("Short words never match fuzzily") {
        CHECK(rules.hints_for("dat", HintTarget::COLUMN).count("date-like") == 0);
    }

    SECTION("A stricter threshold rejects the misspelling") {
        rules.set_fuzzy_threshold(0.95);
        CHECK(rules.hints_for("compensaton", HintTarget::COLUMN).count("salary-like") == 0);
    }
}

TEST_CASE("HintRuleSet: labeling is deterministic", "[hints]") {
    const auto rules = HintRuleSet::defaults();
    const auto first = rules.hints_for("employee_join_date", HintTarget::COLUMN);
    const auto second = rules.hints_for("employee_join_date", HintTarget::COLUMN);
    CHECK(first == second);
    CHECK(first.count("date-like") == 1);
}

TEST_CASE("HintRuleSet: custom rules", "[hints]") {
    auto rules = HintRuleSet::defaults();

    SECTION("A new label") {
        rules.add_rule({"project-like", HintTarget::TABLE, {"project", "initiative"}});
        CHECK(rules.hints_for("initiatives", HintTarget::TABLE).count("project-like") == 1);
        CHECK(rules.synonyms_for("project-like") == std::vector<std::string>{"project", "initiative"});
    }

    SECTION("An existing label gains synonyms without duplicates") {
        const auto before = rules.synonyms_for("salary-like").size();
        rules.add_rule({"salary-like", HintTarget::COLUMN, {"remuneration", "salary"}});
        const auto after = rules.synonyms_for("salary-like");
        CHECK(after.size() == before + 1);
        CHECK(rules.hints_for("remuneration_eur", HintTarget::COLUMN).count("salary-like") == 1);
    }

    SECTION("Synonyms are normalized on insertion") {
        rules.add_rule({"contract-like", HintTarget::ANY, {"Contracts", "  "}});
        CHECK(rules.synonyms_for("contract-like") == std::vector<std::string>{"contract"});
    }
}

TEST_CASE("HintRuleSet: hints_for_term matches synonyms exactly", "[hints]") {
    const auto rules = HintRuleSet::defaults();
    CHECK(rules.hints_for_term("wages").count("salary-like") == 1);
    CHECK(rules.hints_for_term("developers").count("employee-like") == 1);
    CHECK(rules.hints_for_term("salry").empty());
}

TEST_CASE("HintRuleSet: parse_hint_target", "[hints]") {
    CHECK(parse_hint_target("table") == HintTarget::TABLE);
    CHECK(parse_hint_target("COLUMN") == HintTarget::COLUMN);
    CHECK(parse_hint_target("any") == HintTarget::ANY);
    CHECK(parse_hint_target("") == HintTarget::ANY);
    CHECK_FALSE(parse_hint_target("row").has_value());
}
