#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nlquery {

// ============================================================================
// Intent
// ============================================================================

enum class Operation {
    COUNT,
    AGGREGATE,
    LOOKUP
};

enum class AggregateFunc {
    NONE,
    COUNT,
    SUM,
    AVG,
    MIN,
    MAX
};

/**
 * @brief Comparison applied by a filter predicate
 *
 * RANGE is half-open (>= lo AND < hi), BETWEEN is inclusive (>= lo AND <= hi),
 * IN is a list of equality alternatives on one column.
 */
enum class CompareOp {
    EQ,
    GT,
    GE,
    LT,
    LE,
    RANGE,
    BETWEEN,
    IN
};

enum class EntityKind {
    TABLE,
    COLUMN,
    VALUE,      // a sampled value of a column
    LITERAL     // number, date, year or relative period from the text
};

enum class LiteralKind {
    NONE,
    NUMBER,
    DATE,
    YEAR,
    PERIOD
};

[[nodiscard]] inline std::string_view operation_to_string(Operation op) {
    switch (op) {
        case Operation::COUNT:     return "count";
        case Operation::AGGREGATE: return "aggregate";
        case Operation::LOOKUP:    return "lookup";
    }
    return "lookup";
}

[[nodiscard]] inline std::string_view aggregate_to_sql(AggregateFunc func) {
    switch (func) {
        case AggregateFunc::NONE:  return "";
        case AggregateFunc::COUNT: return "COUNT";
        case AggregateFunc::SUM:   return "SUM";
        case AggregateFunc::AVG:   return "AVG";
        case AggregateFunc::MIN:   return "MIN";
        case AggregateFunc::MAX:   return "MAX";
    }
    return "";
}

[[nodiscard]] inline std::string_view entity_kind_to_string(EntityKind kind) {
    switch (kind) {
        case EntityKind::TABLE:   return "table";
        case EntityKind::COLUMN:  return "column";
        case EntityKind::VALUE:   return "value";
        case EntityKind::LITERAL: return "literal";
    }
    return "table";
}

/**
 * @brief A phrase of the question bound to a catalog element or a literal
 *
 * `table` and `column` always hold catalog spellings. For VALUE entities
 * `value` is the sampled value as stored; for LITERAL entities `value` (and
 * `upper` for ranges) hold the normalized literal text that will be bound.
 */
struct MappedEntity {
    EntityKind kind = EntityKind::TABLE;
    std::string phrase;
    std::string table;
    std::string column;
    std::string value;
    std::string upper;
    LiteralKind literal = LiteralKind::NONE;
    CompareOp op = CompareOp::EQ;
    double confidence = 0.0;
    size_t position = 0;        // token index of the first word of the phrase
};

struct QueryIntent {
    QueryType type = QueryType::STRUCTURED;
    Operation operation = Operation::LOOKUP;
    AggregateFunc aggregate = AggregateFunc::NONE;
    std::string group_by_phrase;
    std::vector<MappedEntity> entities;      // highest confidence first
    std::vector<std::string> free_text;      // unmapped tokens, in text order
};

// ============================================================================
// Plan
// ============================================================================

/// Column qualified by a plan-local table alias ("t0" primary, "t1" joined)
struct ColumnRef {
    std::string alias;
    std::string column;

    bool operator==(const ColumnRef&) const = default;
};

/**
 * @brief One projected expression
 *
 * An aggregate with an empty column renders as COUNT(*).
 */
struct SelectItem {
    ColumnRef column;
    AggregateFunc aggregate = AggregateFunc::NONE;
    std::string label;          // output column name
};

struct Predicate {
    ColumnRef column;
    CompareOp op = CompareOp::EQ;
    size_t first_param = 0;     // index into QueryPlan::params
    size_t param_count = 1;
};

struct JoinSpec {
    std::string table;
    std::string alias;
    ColumnRef left;             // primary side
    ColumnRef right;            // joined side
};

/// Orders by a column, or by a projected label when `column` is absent
struct OrderItem {
    std::optional<ColumnRef> column;
    std::string label;
    bool descending = false;
};

/**
 * @brief Parameterized structured query over catalog identifiers
 *
 * Every table and column name is copied from the SchemaCatalog; user values
 * only ever appear in `params`.
 */
struct QueryPlan {
    std::string table;
    std::string alias = "t0";
    std::optional<JoinSpec> join;
    std::vector<SelectItem> select;          // empty = every column of the primary table
    std::vector<Predicate> predicates;       // ANDed
    std::vector<std::string> params;
    std::vector<ColumnRef> group_by;
    std::vector<OrderItem> order_by;
    size_t limit = 50;
    size_t offset = 0;
    std::vector<std::string> notes;

    /// Catalog table behind an alias, "" when unknown
    [[nodiscard]] std::string table_for_alias(std::string_view a) const {
        if (a == alias) return table;
        if (join && a == join->alias) return join->table;
        return "";
    }
};

/**
 * @brief Outcome of classification and planning
 *
 * On failure `error_category` is QUERY_NOT_UNDERSTOOD and the intent still
 * carries the entities that were matched and the tokens that were not.
 */
struct PlanResult {
    bool success = false;
    ErrorCategory error_category = ErrorCategory::NONE;
    std::string error_message;

    QueryIntent intent;
    std::optional<QueryPlan> plan;          // absent for document queries
    std::string document_query;             // text for the document branch

    static PlanResult failure(QueryIntent intent, std::string message) {
        PlanResult r;
        r.success = false;
        r.error_category = ErrorCategory::QUERY_NOT_UNDERSTOOD;
        r.error_message = std::move(message);
        r.intent = std::move(intent);
        return r;
    }
};

/// Rendered SQL text plus the parameters bound to its placeholders, in order
struct RenderedQuery {
    std::string sql;
    std::vector<std::string> params;
};

} // namespace nlquery
