#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <sqlite3.h>
#include <chrono>
#include <string>

namespace nlquery {

/**
 * @brief SQLite connection implementing IDbConnection
 *
 * Wraps sqlite3* opened read-only. Statement timeouts are enforced with a
 * progress handler that interrupts sqlite3_step once the deadline passes.
 */
class SqliteConnection : public IDbConnection {
public:
    explicit SqliteConnection(sqlite3* db);
    ~SqliteConnection() override;

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    using IDbConnection::execute;
    DbResultSet execute(const std::string& sql, const std::vector<std::string>& params) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    bool set_query_timeout(uint32_t timeout_ms) override;
    void close() override;

private:
    static int progress_handler(void* self);

    sqlite3* db_;
    uint32_t timeout_ms_ = 0;
    std::chrono::steady_clock::time_point deadline_{};
};

/**
 * @brief SQLite connection factory
 *
 * The connection string is a file path (":memory:" is accepted).
 */
class SqliteConnectionFactory : public IConnectionFactory {
public:
    ConnectionResult open(const std::string& connection_string) override;
};

} // namespace nlquery
