#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "db/connection_descriptor.hpp"
#include "core/utils.hpp"
#include <format>
#include <memory>
#include <string_view>

namespace nlquery {

namespace {

struct PGResultDeleter {
    void operator()(PGresult* res) const noexcept {
        if (res) {
            PQclear(res);
        }
    }
};
using PGResultPtr = std::unique_ptr<PGresult, PGResultDeleter>;

// SQLSTATE classes/codes relevant to error categorization
constexpr std::string_view kQueryCanceled = "57014";
constexpr std::string_view kConnectionExceptionClass = "08";
constexpr std::string_view kOperatorInterventionClass = "57";

} // anonymous namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql, const std::vector<std::string>& params) {
    if (!conn_) {
        return DbResultSet::failure(ErrorCategory::CONNECTION_ERROR, "Connection is null");
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p.c_str());
    }

    PGResultPtr res(PQexecParams(conn_, sql.c_str(),
        static_cast<int>(values.size()),
        nullptr,                                  // let the server infer types
        values.empty() ? nullptr : values.data(),
        nullptr, nullptr,                         // text format
        0));                                      // text results

    if (!res) {
        return DbResultSet::failure(ErrorCategory::CONNECTION_ERROR, PQerrorMessage(conn_));
    }

    const ExecStatusType status = PQresultStatus(res.get());
    if (status == PGRES_TUPLES_OK) {
        return process_tuples_result(res.get());
    }
    if (status == PGRES_COMMAND_OK) {
        DbResultSet result;
        result.success = true;
        return result;
    }
    return process_error(res.get());
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
        return false;
    }

    PGResultPtr res(PQexec(conn_, health_check_query.c_str()));
    if (!res) {
        return false;
    }
    const ExecStatusType status = PQresultStatus(res.get());
    return status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK;
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_) {
        return false;
    }

    const std::string timeout_sql = std::format("SET statement_timeout = {}", timeout_ms);
    PGResultPtr res(PQexec(conn_, timeout_sql.c_str()));
    return res && PQresultStatus(res.get()) == PGRES_COMMAND_OK;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;
    result.success = true;

    const int ncols = PQnfields(res);
    for (int i = 0; i < ncols; i++) {
        result.column_names.emplace_back(PQfname(res, i));
        result.column_types.push_back(PgTypeMap::build_type_info(static_cast<uint32_t>(PQftype(res, i))));
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(nrows);
    for (int i = 0; i < nrows; i++) {
        std::vector<std::string> row;
        row.reserve(ncols);
        for (int j = 0; j < ncols; j++) {
            if (PQgetisnull(res, i, j)) {
                row.emplace_back();
            } else {
                row.emplace_back(PQgetvalue(res, i, j), PQgetlength(res, i, j));
            }
        }
        result.rows.push_back(std::move(row));
    }

    return result;
}

DbResultSet PgConnection::process_error(PGresult* res) const {
    const char* state_raw = PQresultErrorField(res, PG_DIAG_SQLSTATE);
    const std::string_view state = state_raw ? state_raw : "";
    std::string message = PQresultErrorMessage(res);
    if (message.empty()) message = PQerrorMessage(conn_);

    ErrorCategory category = ErrorCategory::SYNTAX_ERROR;
    if (state == kQueryCanceled) {
        category = ErrorCategory::TIMEOUT_ERROR;
    } else if (state.starts_with(kConnectionExceptionClass) ||
               state.starts_with(kOperatorInterventionClass) ||
               PQstatus(conn_) != CONNECTION_OK) {
        category = ErrorCategory::CONNECTION_ERROR;
    }
    return DbResultSet::failure(category, utils::trim(message));
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

ConnectionResult PgConnectionFactory::open(const std::string& connection_string) {
    PGconn* conn = PQconnectdb(connection_string.c_str());

    if (!conn) {
        return ConnectionResult::error(ErrorCategory::CONNECTION_ERROR, "Failed to allocate PGconn");
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        auto message = std::format("Failed to connect to {}: {}",
            redact_connection_string(connection_string), utils::trim(PQerrorMessage(conn)));
        PQfinish(conn);
        return ConnectionResult::error(ErrorCategory::CONNECTION_ERROR, std::move(message));
    }

    return ConnectionResult::ok(std::make_unique<PgConnection>(conn));
}

} // namespace nlquery
