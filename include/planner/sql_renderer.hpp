#pragma once

#include "db/isql_dialect.hpp"
#include "planner/query_types.hpp"
#include <memory>

namespace nlquery {

/**
 * @brief Renders a QueryPlan as dialect SQL with bound placeholders
 *
 * Identifiers are quoted by the dialect; aliases are the planner's own
 * "t0"/"t1". Parameters are re-emitted in placeholder order.
 */
class SqlRenderer {
public:
    explicit SqlRenderer(std::shared_ptr<const ISqlDialect> dialect);

    /**
     * @return RenderedQuery, or INTERNAL_ERROR when a predicate refers to
     *         parameters the plan does not carry
     */
    [[nodiscard]] Result<RenderedQuery> render(const QueryPlan& plan) const;

private:
    [[nodiscard]] std::string column(const ColumnRef& ref) const;
    [[nodiscard]] std::string select_item(const SelectItem& item) const;

    std::shared_ptr<const ISqlDialect> dialect_;
};

} // namespace nlquery
