#include "db/mysql/mysql_backend.hpp"
#include "db/mysql/mysql_connection.hpp"
#include "db/mysql/mysql_schema_loader.hpp"
#include "db/generic_connection_pool.hpp"

namespace nlquery {

std::shared_ptr<IConnectionPool> MysqlBackend::create_pool(
    const std::string& db_name,
    const PoolConfig& config) {

    auto factory = std::make_shared<MysqlConnectionFactory>();
    return std::make_shared<GenericConnectionPool>(db_name, config, std::move(factory));
}

std::shared_ptr<ISchemaLoader> MysqlBackend::create_schema_loader() {
    return std::make_shared<MysqlSchemaLoader>();
}

std::shared_ptr<ISqlDialect> MysqlBackend::create_dialect() {
    return std::make_shared<MysqlDialect>();
}

} // namespace nlquery
