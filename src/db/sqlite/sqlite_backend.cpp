#include "db/sqlite/sqlite_backend.hpp"
#include "db/sqlite/sqlite_connection.hpp"
#include "db/sqlite/sqlite_schema_loader.hpp"
#include "db/generic_connection_pool.hpp"

namespace nlquery {

std::shared_ptr<IConnectionPool> SqliteBackend::create_pool(
    const std::string& db_name,
    const PoolConfig& config) {

    auto factory = std::make_shared<SqliteConnectionFactory>();
    return std::make_shared<GenericConnectionPool>(db_name, config, std::move(factory));
}

std::shared_ptr<ISchemaLoader> SqliteBackend::create_schema_loader() {
    return std::make_shared<SqliteSchemaLoader>();
}

std::shared_ptr<ISqlDialect> SqliteBackend::create_dialect() {
    return std::make_shared<SqliteDialect>();
}

} // namespace nlquery
