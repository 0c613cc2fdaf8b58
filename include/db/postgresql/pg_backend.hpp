#pragma once

#include "db/idb_backend.hpp"
#include <format>

namespace nlquery {

/**
 * @brief PostgreSQL dialect: "double-quoted" identifiers, $n placeholders
 */
class PgDialect : public ISqlDialect {
public:
    [[nodiscard]] DatabaseType type() const override { return DatabaseType::POSTGRESQL; }

    [[nodiscard]] std::string quote_identifier(std::string_view identifier) const override {
        return dialect_detail::quote_with(identifier, '"');
    }

    [[nodiscard]] std::string placeholder(size_t index) const override {
        return std::format("${}", index);
    }
};

/**
 * @brief PostgreSQL backend: creates all PG-specific components
 *
 * Creates:
 * - PgConnectionFactory → GenericConnectionPool
 * - PgSchemaLoader (information_schema of current_schema())
 * - PgDialect
 */
class PgBackend : public IDbBackend {
public:
    [[nodiscard]] DatabaseType type() const override {
        return DatabaseType::POSTGRESQL;
    }

    [[nodiscard]] std::shared_ptr<IConnectionPool> create_pool(
        const std::string& db_name,
        const PoolConfig& config) override;

    [[nodiscard]] std::shared_ptr<ISchemaLoader> create_schema_loader() override;

    [[nodiscard]] std::shared_ptr<ISqlDialect> create_dialect() override;
};

} // namespace nlquery
