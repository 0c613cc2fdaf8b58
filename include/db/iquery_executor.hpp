#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "planner/query_types.hpp"
#include <chrono>

namespace nlquery {

/**
 * @brief Abstract storage executor
 *
 * Executes a QueryPlan with parameterized execution only. The engine holds
 * shared_ptr<IQueryExecutor>; tests substitute a mock.
 */
class IQueryExecutor {
public:
    virtual ~IQueryExecutor() = default;

    /**
     * @brief Execute a plan within a time bound
     * @return Rows with column names and types, or CONNECTION_ERROR,
     *         TIMEOUT_ERROR or SYNTAX_ERROR
     */
    [[nodiscard]] virtual Result<QueryResult> execute(
        const QueryPlan& plan, std::chrono::milliseconds timeout) = 0;
};

} // namespace nlquery
