#include "db/postgresql/pg_backend.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_schema_loader.hpp"
#include "db/generic_connection_pool.hpp"

namespace nlquery {

std::shared_ptr<IConnectionPool> PgBackend::create_pool(
    const std::string& db_name,
    const PoolConfig& config) {

    auto factory = std::make_shared<PgConnectionFactory>();
    return std::make_shared<GenericConnectionPool>(db_name, config, std::move(factory));
}

std::shared_ptr<ISchemaLoader> PgBackend::create_schema_loader() {
    return std::make_shared<PgSchemaLoader>();
}

std::shared_ptr<ISqlDialect> PgBackend::create_dialect() {
    return std::make_shared<PgDialect>();
}

} // namespace nlquery
