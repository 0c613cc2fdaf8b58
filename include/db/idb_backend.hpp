#pragma once

#include "core/database_type.hpp"
#include "db/iconnection_pool.hpp"
#include "db/isql_dialect.hpp"
#include "db/ischema_loader.hpp"
#include <memory>
#include <string>

namespace nlquery {

/**
 * @brief Abstract database backend: creates all DB-specific components
 *
 * Each database type (PostgreSQL, MySQL, SQLite) provides a concrete
 * implementation that creates the right pool, schema loader and dialect.
 *
 * Usage:
 *   auto backend = BackendRegistry::instance().create(DatabaseType::SQLITE);
 *   auto pool = backend->create_pool("demo", config);
 *   auto dialect = backend->create_dialect();
 */
class IDbBackend {
public:
    virtual ~IDbBackend() = default;

    [[nodiscard]] virtual DatabaseType type() const = 0;

    [[nodiscard]] virtual std::shared_ptr<IConnectionPool> create_pool(
        const std::string& db_name,
        const PoolConfig& config) = 0;

    [[nodiscard]] virtual std::shared_ptr<ISchemaLoader> create_schema_loader() = 0;

    [[nodiscard]] virtual std::shared_ptr<ISqlDialect> create_dialect() = 0;
};

} // namespace nlquery
