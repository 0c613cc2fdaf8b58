#pragma once

#include "db/idb_backend.hpp"

namespace nlquery {

/**
 * @brief SQLite dialect: "double-quoted" identifiers, ? placeholders
 */
class SqliteDialect : public ISqlDialect {
public:
    [[nodiscard]] DatabaseType type() const override { return DatabaseType::SQLITE; }

    [[nodiscard]] std::string quote_identifier(std::string_view identifier) const override {
        return dialect_detail::quote_with(identifier, '"');
    }

    [[nodiscard]] std::string placeholder(size_t /*index*/) const override { return "?"; }
};

/**
 * @brief SQLite backend: creates all SQLite-specific components
 *
 * Creates:
 * - SqliteConnectionFactory → GenericConnectionPool
 * - SqliteSchemaLoader (sqlite_master + PRAGMAs)
 * - SqliteDialect
 */
class SqliteBackend : public IDbBackend {
public:
    [[nodiscard]] DatabaseType type() const override {
        return DatabaseType::SQLITE;
    }

    [[nodiscard]] std::shared_ptr<IConnectionPool> create_pool(
        const std::string& db_name,
        const PoolConfig& config) override;

    [[nodiscard]] std::shared_ptr<ISchemaLoader> create_schema_loader() override;

    [[nodiscard]] std::shared_ptr<ISqlDialect> create_dialect() override;
};

} // namespace nlquery
