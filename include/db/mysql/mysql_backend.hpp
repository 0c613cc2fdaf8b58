#pragma once

#include "db/idb_backend.hpp"

namespace nlquery {

/**
 * @brief MySQL dialect: `backtick` identifiers, ? placeholders
 */
class MysqlDialect : public ISqlDialect {
public:
    [[nodiscard]] DatabaseType type() const override { return DatabaseType::MYSQL; }

    [[nodiscard]] std::string quote_identifier(std::string_view identifier) const override {
        return dialect_detail::quote_with(identifier, '`');
    }

    [[nodiscard]] std::string placeholder(size_t /*index*/) const override { return "?"; }
};

/**
 * @brief MySQL backend: creates all MySQL-specific components
 *
 * Creates:
 * - MysqlConnectionFactory → GenericConnectionPool
 * - MysqlSchemaLoader (information_schema + KEY_COLUMN_USAGE)
 * - MysqlDialect
 */
class MysqlBackend : public IDbBackend {
public:
    [[nodiscard]] DatabaseType type() const override {
        return DatabaseType::MYSQL;
    }

    [[nodiscard]] std::shared_ptr<IConnectionPool> create_pool(
        const std::string& db_name,
        const PoolConfig& config) override;

    [[nodiscard]] std::shared_ptr<ISchemaLoader> create_schema_loader() override;

    [[nodiscard]] std::shared_ptr<ISqlDialect> create_dialect() override;
};

} // namespace nlquery
