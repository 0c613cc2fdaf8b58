#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <string>

namespace nlquery {

/**
 * @brief PostgreSQL connection implementing IDbConnection
 *
 * Wraps PGconn*. Parameters are sent with PQexecParams as untyped text,
 * letting the server infer each parameter's type from context.
 */
class PgConnection : public IDbConnection {
public:
    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    using IDbConnection::execute;
    DbResultSet execute(const std::string& sql, const std::vector<std::string>& params) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    bool set_query_timeout(uint32_t timeout_ms) override;
    void close() override;

private:
    /**
     * @brief Copy a PGRES_TUPLES_OK result into a DbResultSet
     */
    static DbResultSet process_tuples_result(PGresult* res);

    /**
     * @brief Map a failed result to CONNECTION/TIMEOUT/SYNTAX via SQLSTATE
     */
    DbResultSet process_error(PGresult* res) const;

    PGconn* conn_;
};

/**
 * @brief PostgreSQL connection factory
 *
 * Creates PgConnection instances using PQconnectdb. Accepts URIs and
 * keyword/value strings.
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    ConnectionResult open(const std::string& connection_string) override;
};

} // namespace nlquery
