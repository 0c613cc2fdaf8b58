#include "planner/query_planner.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <limits>
#include <map>
#include <set>
#include <tuple>

namespace nlquery {

namespace {

constexpr const char* kJoinAlias = "t1";

bool same_name(std::string_view a, std::string_view b) {
    return utils::to_lower(a) == utils::to_lower(b);
}

/// Column best describing a table's rows: name-like, else first text column, else primary key
const ColumnInfo* label_column(const TableInfo& table) {
    if (const auto* c = table.column_with_hint("name-like")) return c;
    for (const auto& col : table.columns) {
        if (col.logical_type == LogicalType::TEXT) return &col;
    }
    if (const auto* pk = table.primary_key()) return pk;
    return table.columns.empty() ? nullptr : &table.columns.front();
}

std::string aggregate_label(AggregateFunc func, std::string_view column) {
    return std::format("{}_{}", utils::to_lower(aggregate_to_sql(func)), utils::to_lower(column));
}

size_t param_count_for(CompareOp op) {
    return (op == CompareOp::RANGE || op == CompareOp::BETWEEN) ? 2 : 1;
}

/**
 * @brief Incremental plan construction with the single-join rule
 */
class PlanBuilder {
public:
    PlanBuilder(const SchemaCatalog& catalog, const TableInfo& primary)
        : catalog_(catalog), primary_(primary) {
        plan_.table = primary.name;
    }

    /// Alias under which `table` is reachable, adding the join when allowed
    std::optional<std::string> alias_for(std::string_view table) {
        if (same_name(table, primary_.name)) return plan_.alias;
        if (plan_.join && same_name(plan_.join->table, table)) return plan_.join->alias;

        const auto link = catalog_.declared_link(primary_.name, table);
        if (!link) {
            note(std::format("Reduced to table '{}': no declared foreign key links it to '{}'; "
                             "its terms were ignored.", primary_.name, table));
            return std::nullopt;
        }
        if (plan_.join) {
            note(std::format("Reduced to table '{}' joined with '{}': '{}' would need a second join; "
                             "its terms were ignored.", primary_.name, plan_.join->table, table));
            return std::nullopt;
        }

        const auto* other = catalog_.find_table(table);
        JoinSpec join;
        join.table = other->name;
        join.alias = kJoinAlias;
        if (same_name(link->from_table, primary_.name)) {
            join.left = {plan_.alias, link->from_column};
            join.right = {join.alias, link->to_column};
        } else {
            join.left = {plan_.alias, link->to_column};
            join.right = {join.alias, link->from_column};
        }
        plan_.join = std::move(join);
        return std::string(kJoinAlias);
    }

    /// Mention a table without needing its columns: only unlinked tables produce a note
    void touch(std::string_view table) {
        if (same_name(table, primary_.name)) return;
        if (plan_.join && same_name(plan_.join->table, table)) return;
        if (!catalog_.declared_link(primary_.name, table)) {
            note(std::format("Reduced to table '{}': no declared foreign key links it to '{}'; "
                             "its terms were ignored.", primary_.name, table));
        }
    }

    void add_predicate(ColumnRef column, CompareOp op, std::vector<std::string> values) {
        Predicate p;
        p.column = std::move(column);
        p.op = op;
        p.first_param = plan_.params.size();
        p.param_count = values.size();
        for (auto& v : values) plan_.params.push_back(std::move(v));
        plan_.predicates.push_back(std::move(p));
    }

    void note(std::string text) {
        if (std::find(plan_.notes.begin(), plan_.notes.end(), text) == plan_.notes.end()) {
            plan_.notes.push_back(std::move(text));
        }
    }

    [[nodiscard]] const TableInfo* table_of(std::string_view alias) const {
        return catalog_.find_table(plan_.table_for_alias(alias));
    }

    QueryPlan& plan() { return plan_; }

private:
    const SchemaCatalog& catalog_;
    const TableInfo& primary_;
    QueryPlan plan_;
};

} // anonymous namespace

QueryPlanner::QueryPlanner(PlannerConfig config)
    : config_(config) {
    if (config_.default_page_size == 0) config_.default_page_size = 50;
    if (config_.max_page_size == 0) config_.max_page_size = 200;
    config_.default_page_size = std::min(config_.default_page_size, config_.max_page_size);
}

Pagination QueryPlanner::paginate(int64_t page, int64_t page_size) const {
    Pagination p;
    p.page = page < 1 ? 1 : static_cast<size_t>(page);
    if (page_size < 1) {
        p.page_size = config_.default_page_size;
    } else {
        p.page_size = std::min(static_cast<size_t>(page_size), config_.max_page_size);
    }
    // Keep the offset a valid SQL BIGINT; pages past it are simply empty
    const size_t max_page = static_cast<size_t>(std::numeric_limits<int64_t>::max()) / p.page_size + 1;
    p.page = std::min(p.page, max_page);
    p.limit = p.page_size;
    p.offset = (p.page - 1) * p.page_size;
    return p;
}

PlanResult QueryPlanner::plan(const QueryIntent& intent,
                              const SchemaCatalog& catalog,
                              int64_t page,
                              int64_t page_size,
                              std::string_view original_text) const {
    PlanResult result;
    result.intent = intent;

    if (intent.type == QueryType::DOCUMENT) {
        result.success = true;
        result.document_query = std::string(original_text);
        return result;
    }

    if (intent.type == QueryType::HYBRID) {
        for (const auto& word : intent.free_text) {
            if (!result.document_query.empty()) result.document_query += ' ';
            result.document_query += word;
        }
    }

    // Group-by target is never the primary table
    const MappedEntity* group_entity = nullptr;
    if (!intent.group_by_phrase.empty()) {
        for (const auto& e : intent.entities) {
            if (e.kind != EntityKind::LITERAL && same_name(e.phrase, intent.group_by_phrase)) {
                group_entity = &e;
                break;
            }
        }
    }

    // ---- primary table ----
    const TableInfo* primary = nullptr;
    for (const auto& e : intent.entities) {
        if (e.kind == EntityKind::TABLE && &e != group_entity) {
            primary = catalog.find_table(e.table);
            break;
        }
    }
    if (!primary) {
        for (const auto& e : intent.entities) {
            if (e.kind != EntityKind::TABLE && &e != group_entity && !e.table.empty()) {
                primary = catalog.find_table(e.table);
                break;
            }
        }
    }
    if (!primary && group_entity) {
        primary = catalog.find_table(group_entity->table);
        group_entity = nullptr;
    }
    if (!primary) {
        return PlanResult::failure(intent, "Could not determine which table the question is about");
    }

    PlanBuilder builder(catalog, *primary);

    // ---- filters ----
    // Values on one column combine into IN; literals keep their own operator
    std::map<std::tuple<std::string, std::string>, std::vector<std::string>> value_filters;
    std::vector<std::tuple<std::string, std::string>> value_order;

    for (const auto& e : intent.entities) {
        if (&e == group_entity) continue;
        switch (e.kind) {
            case EntityKind::TABLE:
                builder.touch(e.table);
                break;
            case EntityKind::COLUMN:
                break;
            case EntityKind::VALUE: {
                auto key = std::make_tuple(e.table, e.column);
                auto& values = value_filters[key];
                if (values.empty()) value_order.push_back(key);
                if (std::find(values.begin(), values.end(), e.value) == values.end()) {
                    values.push_back(e.value);
                }
                break;
            }
            case EntityKind::LITERAL: {
                const auto alias = builder.alias_for(e.table);
                if (!alias) break;
                std::vector<std::string> params{e.value};
                if (param_count_for(e.op) == 2) params.push_back(e.upper);
                builder.add_predicate({*alias, e.column}, e.op, std::move(params));
                break;
            }
        }
    }
    for (const auto& key : value_order) {
        const auto& [table, column] = key;
        const auto alias = builder.alias_for(table);
        if (!alias) continue;
        auto values = value_filters[key];
        const auto op = values.size() > 1 ? CompareOp::IN : CompareOp::EQ;
        builder.add_predicate({*alias, column}, op, std::move(values));
    }

    // ---- group-by ----
    std::optional<ColumnRef> group_column;
    if (group_entity) {
        const auto alias = builder.alias_for(group_entity->table);
        if (alias) {
            if (group_entity->kind == EntityKind::TABLE) {
                const auto* table = builder.table_of(*alias);
                if (const auto* col = table ? label_column(*table) : nullptr) {
                    group_column = ColumnRef{*alias, col->name};
                }
            } else {
                group_column = ColumnRef{*alias, group_entity->column};
            }
        }
    }
    if (!intent.group_by_phrase.empty() && !group_column) {
        builder.note(std::format("Could not resolve grouping '{}'; results are not grouped.",
            intent.group_by_phrase));
    }

    QueryPlan& plan = builder.plan();

    // ---- projection ----
    switch (intent.operation) {
        case Operation::COUNT: {
            if (group_column) {
                plan.select.push_back({*group_column, AggregateFunc::NONE, group_column->column});
                plan.group_by.push_back(*group_column);
            }
            plan.select.push_back({{plan.alias, ""}, AggregateFunc::COUNT, "count"});
            if (group_column) plan.order_by.push_back({std::nullopt, "count", true});
            break;
        }
        case Operation::AGGREGATE: {
            std::optional<ColumnRef> measure;
            for (const auto& e : intent.entities) {
                if (e.kind != EntityKind::COLUMN && e.kind != EntityKind::LITERAL) continue;
                if (&e == group_entity) continue;
                const auto* col = catalog.find_column(e.table, e.column);
                if (!col || col->logical_type != LogicalType::NUMERIC) continue;
                if (const auto alias = builder.alias_for(e.table)) {
                    measure = ColumnRef{*alias, col->name};
                    break;
                }
            }
            if (!measure) {
                const ColumnInfo* fallback = primary->column_with_hint("salary-like");
                if (fallback && fallback->logical_type != LogicalType::NUMERIC) fallback = nullptr;
                if (!fallback) {
                    for (const auto& col : primary->columns) {
                        if (col.logical_type == LogicalType::NUMERIC && !col.hints.empty()) {
                            fallback = &col;
                            break;
                        }
                    }
                }
                if (fallback) measure = ColumnRef{plan.alias, fallback->name};
            }
            if (!measure) {
                return PlanResult::failure(intent,
                    std::format("No numeric column of '{}' to compute {} over",
                        primary->name, aggregate_to_sql(intent.aggregate)));
            }

            const auto label = aggregate_label(intent.aggregate, measure->column);
            if (group_column) {
                plan.select.push_back({*group_column, AggregateFunc::NONE, group_column->column});
                plan.group_by.push_back(*group_column);
            }
            plan.select.push_back({*measure, intent.aggregate, label});
            if (group_column) plan.order_by.push_back({std::nullopt, label, true});
            break;
        }
        case Operation::LOOKUP: {
            std::vector<ColumnRef> columns;
            const auto add = [&columns](ColumnRef ref) {
                if (std::find(columns.begin(), columns.end(), ref) == columns.end()) {
                    columns.push_back(std::move(ref));
                }
            };
            for (const auto& e : intent.entities) {
                if (e.kind != EntityKind::COLUMN) continue;
                if (const auto alias = builder.alias_for(e.table)) {
                    add({*alias, catalog.find_column(e.table, e.column)->name});
                }
            }
            if (!columns.empty()) {
                if (const auto* name_col = primary->column_with_hint("name-like")) {
                    ColumnRef name_ref{plan.alias, name_col->name};
                    std::erase(columns, name_ref);
                    columns.insert(columns.begin(), std::move(name_ref));
                }
                // Result rows are keyed by column name, so a repeated name gets a table-qualified label
                std::set<std::string> taken;
                for (auto& c : columns) {
                    std::string label;
                    if (!taken.insert(utils::to_lower(c.column)).second) {
                        const auto base = std::format("{}_{}", plan.table_for_alias(c.alias), c.column);
                        label = base;
                        for (int n = 2; !taken.insert(utils::to_lower(label)).second; ++n) {
                            label = std::format("{}_{}", base, n);
                        }
                    }
                    plan.select.push_back({c, AggregateFunc::NONE, std::move(label)});
                }
            }
            if (const auto* pk = primary->primary_key()) {
                plan.order_by.push_back({ColumnRef{plan.alias, pk->name}, "", false});
            } else if (!primary->columns.empty()) {
                plan.order_by.push_back({ColumnRef{plan.alias, primary->columns.front().name}, "", false});
            }
            break;
        }
    }

    // ---- pagination ----
    const auto pagination = paginate(page, page_size);
    plan.limit = pagination.limit;
    plan.offset = pagination.offset;

    if (auto problem = validate(plan, catalog)) {
        utils::log::error(std::format("Rejected invalid plan: {}", *problem));
        return PlanResult::failure(intent, std::format("Generated plan failed validation: {}", *problem));
    }

    for (const auto& n : plan.notes) {
        utils::log::debug(n);
    }

    result.success = true;
    result.plan = std::move(plan);
    return result;
}

std::optional<std::string> QueryPlanner::validate(const QueryPlan& plan, const SchemaCatalog& catalog) {
    if (!catalog.find_table(plan.table)) {
        return std::format("unknown table '{}'", plan.table);
    }

    const auto check = [&](const ColumnRef& ref) -> std::optional<std::string> {
        const auto table = plan.table_for_alias(ref.alias);
        if (table.empty()) return std::format("unknown alias '{}'", ref.alias);
        if (!catalog.find_column(table, ref.column)) {
            return std::format("unknown column '{}.{}'", table, ref.column);
        }
        return std::nullopt;
    };

    if (plan.join) {
        if (!catalog.find_table(plan.join->table)) {
            return std::format("unknown table '{}'", plan.join->table);
        }
        if (plan.join->alias == plan.alias) return std::string("join alias collides with primary alias");
        if (!catalog.declared_link(plan.table, plan.join->table)) {
            return std::format("'{}' and '{}' share no declared foreign key", plan.table, plan.join->table);
        }
        if (auto e = check(plan.join->left)) return e;
        if (auto e = check(plan.join->right)) return e;
    }

    for (const auto& item : plan.select) {
        if (item.aggregate == AggregateFunc::COUNT && item.column.column.empty()) continue;
        if (auto e = check(item.column)) return e;
    }

    for (const auto& p : plan.predicates) {
        if (auto e = check(p.column)) return e;
        const size_t expected = p.op == CompareOp::IN ? p.param_count : param_count_for(p.op);
        if (p.param_count != expected || p.param_count == 0) {
            return std::format("predicate on '{}' binds {} parameters", p.column.column, p.param_count);
        }
        if (p.first_param + p.param_count > plan.params.size()) {
            return std::format("predicate on '{}' refers past the parameter list", p.column.column);
        }
    }

    for (const auto& g : plan.group_by) {
        if (auto e = check(g)) return e;
    }

    for (const auto& o : plan.order_by) {
        if (o.column) {
            if (auto e = check(*o.column)) return e;
            continue;
        }
        const bool projected = std::any_of(plan.select.begin(), plan.select.end(),
            [&o](const SelectItem& s) { return s.label == o.label; });
        if (!projected) return std::format("order by unknown label '{}'", o.label);
    }

    if (plan.limit == 0) return std::string("limit must be positive");
    return std::nullopt;
}

} // namespace nlquery
