#pragma once

#include "core/column_type.hpp"
#include "core/error.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <memory>

namespace nlquery {

/**
 * @brief Result set from a query execution
 *
 * Returned by IDbConnection::execute().
 * Owns the result data (copied from native result handles).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;
    // CONNECTION_ERROR, TIMEOUT_ERROR or SYNTAX_ERROR when !success
    ErrorCategory error_category = ErrorCategory::NONE;

    std::vector<std::string> column_names;
    std::vector<ColumnTypeInfo> column_types;
    std::vector<std::vector<std::string>> rows;

    static DbResultSet failure(ErrorCategory category, std::string message) {
        DbResultSet r;
        r.success = false;
        r.error_category = category;
        r.error_message = std::move(message);
        return r;
    }
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (PGconn*, MYSQL*, sqlite3*).
 * Implementations are not thread-safe; thread safety comes from the pool.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a read-only statement with bound text parameters
     * @param sql SQL text using the dialect's placeholder syntax
     * @param params Values bound positionally; never spliced into the text
     * @return Result set with rows, or a categorized failure
     */
    [[nodiscard]] virtual DbResultSet execute(
        const std::string& sql, const std::vector<std::string>& params) = 0;

    /**
     * @brief Execute a statement without parameters (introspection, health checks)
     */
    [[nodiscard]] DbResultSet execute(const std::string& sql) {
        return execute(sql, {});
    }

    /**
     * @brief Check if the connection is healthy
     * @param health_check_query SQL to run (e.g., "SELECT 1")
     */
    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Set query timeout for subsequent queries
     * @param timeout_ms Timeout in milliseconds (0 = no timeout)
     *
     * PostgreSQL: SET statement_timeout = N
     * MySQL: SET SESSION max_execution_time = N
     * SQLite: progress-handler deadline checked during sqlite3_step
     */
    virtual bool set_query_timeout(uint32_t timeout_ms) = 0;

    virtual void close() = 0;
};

} // namespace nlquery
