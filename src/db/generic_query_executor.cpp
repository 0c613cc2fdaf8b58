#include "db/generic_query_executor.hpp"
#include "db/connection_lease.hpp"
#include "core/utils.hpp"
#include <format>

namespace nlquery {

GenericQueryExecutor::GenericQueryExecutor(
    std::shared_ptr<IConnectionPool> pool,
    std::shared_ptr<const ISqlDialect> dialect)
    : pool_(std::move(pool)),
      renderer_(std::move(dialect)) {}

Result<QueryResult> GenericQueryExecutor::execute(
    const QueryPlan& plan, std::chrono::milliseconds timeout) {

    utils::Timer timer;

    auto rendered = renderer_.render(plan);
    if (rendered.is_error()) {
        return Result<QueryResult>::error(rendered.error_category(), rendered.error_message());
    }

    auto conn_handle = pool_->acquire(timeout);
    if (!conn_handle || !conn_handle->is_valid()) {
        if (timer.elapsed_ms() >= timeout) {
            return Result<QueryResult>::error(ErrorCategory::TIMEOUT_ERROR,
                std::format("No connection available for '{}' within {}ms", pool_->name(), timeout.count()));
        }
        return Result<QueryResult>::error(ErrorCategory::CONNECTION_ERROR,
            std::format("Failed to acquire database connection for '{}'", pool_->name()));
    }

    // Whatever the acquire consumed is taken off the statement budget
    const auto remaining = timeout - timer.elapsed_ms();
    if (remaining.count() <= 0) {
        return Result<QueryResult>::error(ErrorCategory::TIMEOUT_ERROR,
            std::format("Query budget of {}ms spent waiting for a connection", timeout.count()));
    }
    if (!conn_handle->get()->set_query_timeout(static_cast<uint32_t>(remaining.count()))) {
        utils::log::warn(std::format("Could not set statement timeout on '{}'", pool_->name()));
    }

    utils::log::debug(std::format("Executing: {}", rendered.value().sql));
    auto db_result = conn_handle->get()->execute(rendered.value().sql, rendered.value().params);
    utils::log::debug(std::format("Connection on '{}' held for {}ms", pool_->name(), conn_handle->held_for().count()));

    if (!db_result.success) {
        const auto category = db_result.error_category == ErrorCategory::NONE
            ? ErrorCategory::SYNTAX_ERROR : db_result.error_category;
        return Result<QueryResult>::error(category, db_result.error_message);
    }

    QueryResult result;
    result.column_names = std::move(db_result.column_names);
    result.column_types = std::move(db_result.column_types);
    result.rows = std::move(db_result.rows);
    result.execution_time = timer.elapsed_us();
    return Result<QueryResult>::ok(std::move(result));
}

} // namespace nlquery
