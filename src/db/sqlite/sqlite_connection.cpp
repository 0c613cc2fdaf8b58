#include "db/sqlite/sqlite_connection.hpp"
#include "core/utils.hpp"
#include <format>
#include <memory>

namespace nlquery {

namespace {

struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const noexcept {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }
};
using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

// Progress handler granularity, in virtual machine instructions
constexpr int kProgressOps = 1000;

} // anonymous namespace

// ============================================================================
// SqliteConnection
// ============================================================================

SqliteConnection::SqliteConnection(sqlite3* db)
    : db_(db) {}

SqliteConnection::~SqliteConnection() {
    close();
}

int SqliteConnection::progress_handler(void* self) {
    const auto* conn = static_cast<SqliteConnection*>(self);
    // Non-zero return interrupts the running statement with SQLITE_INTERRUPT
    return std::chrono::steady_clock::now() >= conn->deadline_ ? 1 : 0;
}

DbResultSet SqliteConnection::execute(const std::string& sql, const std::vector<std::string>& params) {
    if (!db_) {
        return DbResultSet::failure(ErrorCategory::CONNECTION_ERROR, "Connection is null");
    }

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &raw, nullptr) != SQLITE_OK) {
        return DbResultSet::failure(ErrorCategory::SYNTAX_ERROR, sqlite3_errmsg(db_));
    }
    StmtPtr stmt(raw);

    if (static_cast<size_t>(sqlite3_bind_parameter_count(stmt.get())) != params.size()) {
        return DbResultSet::failure(ErrorCategory::SYNTAX_ERROR,
            std::format("Statement expects {} parameters, got {}",
                sqlite3_bind_parameter_count(stmt.get()), params.size()));
    }
    for (size_t i = 0; i < params.size(); ++i) {
        const int rc = sqlite3_bind_text(stmt.get(), static_cast<int>(i + 1),
            params[i].c_str(), static_cast<int>(params[i].size()), SQLITE_TRANSIENT);
        if (rc != SQLITE_OK) {
            return DbResultSet::failure(ErrorCategory::SYNTAX_ERROR, sqlite3_errmsg(db_));
        }
    }

    DbResultSet result;
    const int ncols = sqlite3_column_count(stmt.get());
    result.column_names.reserve(ncols);
    result.column_types.reserve(ncols);
    for (int i = 0; i < ncols; ++i) {
        const char* name = sqlite3_column_name(stmt.get(), i);
        const char* decl = sqlite3_column_decltype(stmt.get(), i);
        result.column_names.emplace_back(name ? name : "");
        const std::string type_name = decl ? decl : "";
        result.column_types.emplace_back(logical_type_from_type_name(type_name), type_name);
    }

    if (timeout_ms_ > 0) {
        deadline_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_);
        sqlite3_progress_handler(db_, kProgressOps, &SqliteConnection::progress_handler, this);
    }

    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        std::vector<std::string> row;
        row.reserve(ncols);
        for (int i = 0; i < ncols; ++i) {
            const auto* text = sqlite3_column_text(stmt.get(), i);
            const int len = sqlite3_column_bytes(stmt.get(), i);
            row.emplace_back(text ? std::string(reinterpret_cast<const char*>(text), len) : std::string{});
        }
        result.rows.push_back(std::move(row));
    }

    if (timeout_ms_ > 0) {
        sqlite3_progress_handler(db_, 0, nullptr, nullptr);
    }

    if (rc == SQLITE_DONE) {
        result.success = true;
        return result;
    }
    if (rc == SQLITE_INTERRUPT) {
        return DbResultSet::failure(ErrorCategory::TIMEOUT_ERROR,
            std::format("Query exceeded {} ms", timeout_ms_));
    }
    if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
        return DbResultSet::failure(ErrorCategory::TIMEOUT_ERROR, sqlite3_errmsg(db_));
    }
    if (rc == SQLITE_CANTOPEN || rc == SQLITE_IOERR || rc == SQLITE_NOTADB || rc == SQLITE_CORRUPT) {
        return DbResultSet::failure(ErrorCategory::CONNECTION_ERROR, sqlite3_errmsg(db_));
    }
    return DbResultSet::failure(ErrorCategory::SYNTAX_ERROR, sqlite3_errmsg(db_));
}

bool SqliteConnection::is_healthy(const std::string& health_check_query) {
    if (!db_) {
        return false;
    }
    return execute(health_check_query).success;
}

bool SqliteConnection::is_connected() const {
    return db_ != nullptr;
}

bool SqliteConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!db_) {
        return false;
    }
    timeout_ms_ = timeout_ms;
    return sqlite3_busy_timeout(db_, static_cast<int>(timeout_ms)) == SQLITE_OK;
}

void SqliteConnection::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// SqliteConnectionFactory
// ============================================================================

ConnectionResult SqliteConnectionFactory::open(const std::string& connection_string) {

    sqlite3* db = nullptr;
    const int flags = SQLITE_OPEN_READONLY | SQLITE_OPEN_URI | SQLITE_OPEN_NOMUTEX;
    const int rc = sqlite3_open_v2(connection_string.c_str(), &db, flags, nullptr);

    if (rc != SQLITE_OK) {
        auto message = std::format("Failed to open SQLite database '{}': {}",
            connection_string, db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
        if (db) {
            sqlite3_close_v2(db);
        }
        return ConnectionResult::error(ErrorCategory::CONNECTION_ERROR, std::move(message));
    }

    // sqlite3_open_v2 is lazy: touch the schema so a non-database file fails here
    char* err = nullptr;
    if (sqlite3_exec(db, "SELECT count(*) FROM sqlite_master", nullptr, nullptr, &err) != SQLITE_OK) {
        auto message = std::format("SQLite database '{}' is not readable: {}",
            connection_string, err ? err : "unknown error");
        sqlite3_free(err);
        sqlite3_close_v2(db);
        return ConnectionResult::error(ErrorCategory::CONNECTION_ERROR, std::move(message));
    }

    return ConnectionResult::ok(std::make_unique<SqliteConnection>(db));
}

} // namespace nlquery
