#include "planner/sql_renderer.hpp"
#include <format>

namespace nlquery {

SqlRenderer::SqlRenderer(std::shared_ptr<const ISqlDialect> dialect)
    : dialect_(std::move(dialect)) {}

std::string SqlRenderer::column(const ColumnRef& ref) const {
    return std::format("{}.{}", ref.alias, dialect_->quote_identifier(ref.column));
}

std::string SqlRenderer::select_item(const SelectItem& item) const {
    std::string expr;
    if (item.aggregate == AggregateFunc::NONE) {
        expr = column(item.column);
    } else if (item.column.column.empty()) {
        expr = std::format("{}(*)", aggregate_to_sql(item.aggregate));
    } else {
        expr = std::format("{}({})", aggregate_to_sql(item.aggregate), column(item.column));
    }
    if (!item.label.empty()) {
        expr += " AS ";
        expr += dialect_->quote_identifier(item.label);
    }
    return expr;
}

Result<RenderedQuery> SqlRenderer::render(const QueryPlan& plan) const {
    RenderedQuery out;
    std::string& sql = out.sql;
    sql.reserve(256);

    // SELECT
    sql += "SELECT ";
    if (plan.select.empty()) {
        sql += plan.alias;
        sql += ".*";
    } else {
        for (size_t i = 0; i < plan.select.size(); ++i) {
            if (i > 0) sql += ", ";
            sql += select_item(plan.select[i]);
        }
    }

    // FROM / JOIN
    sql += std::format(" FROM {} {}", dialect_->quote_identifier(plan.table), plan.alias);
    if (plan.join) {
        sql += std::format(" JOIN {} {} ON {} = {}",
            dialect_->quote_identifier(plan.join->table), plan.join->alias,
            column(plan.join->left), column(plan.join->right));
    }

    // WHERE
    size_t next_placeholder = 1;
    const auto bind = [&](size_t param_index) -> Result<std::string> {
        if (param_index >= plan.params.size()) {
            return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR,
                std::format("Predicate refers to parameter {} of {}", param_index, plan.params.size()));
        }
        out.params.push_back(plan.params[param_index]);
        return Result<std::string>::ok(dialect_->placeholder(next_placeholder++));
    };

    for (size_t i = 0; i < plan.predicates.size(); ++i) {
        const auto& pred = plan.predicates[i];
        sql += i == 0 ? " WHERE " : " AND ";
        const std::string col = column(pred.column);

        const auto simple = [&](std::string_view op) -> Result<bool> {
            auto ph = bind(pred.first_param);
            if (ph.is_error()) return Result<bool>::error(ph.error_category(), ph.error_message());
            sql += std::format("{} {} {}", col, op, ph.value());
            return Result<bool>::ok(true);
        };

        Result<bool> status = Result<bool>::ok(true);
        switch (pred.op) {
            case CompareOp::EQ: status = simple("="); break;
            case CompareOp::GT: status = simple(">"); break;
            case CompareOp::GE: status = simple(">="); break;
            case CompareOp::LT: status = simple("<"); break;
            case CompareOp::LE: status = simple("<="); break;
            case CompareOp::RANGE:
            case CompareOp::BETWEEN: {
                auto lo = bind(pred.first_param);
                auto hi = lo.is_ok() ? bind(pred.first_param + 1) : lo;
                if (hi.is_error()) {
                    status = Result<bool>::error(hi.error_category(), hi.error_message());
                    break;
                }
                sql += std::format("({} >= {} AND {} {} {})", col, lo.value(), col,
                    pred.op == CompareOp::RANGE ? "<" : "<=", hi.value());
                break;
            }
            case CompareOp::IN: {
                sql += col;
                sql += " IN (";
                for (size_t k = 0; k < pred.param_count; ++k) {
                    auto ph = bind(pred.first_param + k);
                    if (ph.is_error()) {
                        status = Result<bool>::error(ph.error_category(), ph.error_message());
                        break;
                    }
                    if (k > 0) sql += ", ";
                    sql += ph.value();
                }
                sql += ')';
                break;
            }
        }
        if (status.is_error()) {
            return Result<RenderedQuery>::error(status.error_category(), status.error_message());
        }
    }

    // GROUP BY
    for (size_t i = 0; i < plan.group_by.size(); ++i) {
        sql += i == 0 ? " GROUP BY " : ", ";
        sql += column(plan.group_by[i]);
    }

    // ORDER BY
    for (size_t i = 0; i < plan.order_by.size(); ++i) {
        const auto& order = plan.order_by[i];
        sql += i == 0 ? " ORDER BY " : ", ";
        sql += order.column ? column(*order.column) : dialect_->quote_identifier(order.label);
        if (order.descending) sql += " DESC";
    }

    sql += std::format(" LIMIT {} OFFSET {}", plan.limit, plan.offset);
    return Result<RenderedQuery>::ok(std::move(out));
}

} // namespace nlquery
