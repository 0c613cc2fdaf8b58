#pragma once

#include "db/iquery_executor.hpp"
#include "db/iconnection_pool.hpp"
#include "db/isql_dialect.hpp"
#include "planner/sql_renderer.hpp"
#include <memory>

namespace nlquery {

/**
 * @brief Database-agnostic query executor
 *
 * Renders the plan with the backend's dialect, acquires a pooled
 * connection, applies the statement timeout and runs the statement with
 * bound parameters. No per-backend executor is needed.
 */
class GenericQueryExecutor : public IQueryExecutor {
public:
    GenericQueryExecutor(
        std::shared_ptr<IConnectionPool> pool,
        std::shared_ptr<const ISqlDialect> dialect);

    ~GenericQueryExecutor() override = default;

    [[nodiscard]] Result<QueryResult> execute(
        const QueryPlan& plan, std::chrono::milliseconds timeout) override;

    [[nodiscard]] const std::shared_ptr<IConnectionPool>& pool() const { return pool_; }

private:
    std::shared_ptr<IConnectionPool> pool_;
    SqlRenderer renderer_;
};

} // namespace nlquery
