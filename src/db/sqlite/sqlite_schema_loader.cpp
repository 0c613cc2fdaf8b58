#include "db/sqlite/sqlite_schema_loader.hpp"
#include "db/sqlite/sqlite_backend.hpp"
#include "core/utils.hpp"
#include <format>

namespace nlquery {

Result<DiscoveredSchema> SqliteSchemaLoader::load_schema(IDbConnection& conn) {
    static constexpr const char* TABLES_QUERY =
        "SELECT name FROM sqlite_master "
        "WHERE type = 'table' AND name NOT LIKE 'sqlite_%' "
        "ORDER BY name";

    const auto tables = conn.execute(TABLES_QUERY);
    if (!tables.success) {
        return Result<DiscoveredSchema>::error(ErrorCategory::INTROSPECTION_ERROR,
            std::format("Failed to list SQLite tables: {}", tables.error_message));
    }

    const SqliteDialect dialect;
    DiscoveredSchema schema;

    for (const auto& row : tables.rows) {
        if (row.empty() || row[0].empty()) continue;
        const std::string& table_name = row[0];
        const std::string quoted = dialect.quote_identifier(table_name);

        // PRAGMA table_info: cid, name, type, notnull, dflt_value, pk
        const auto cols = conn.execute(std::format("PRAGMA table_info({})", quoted));
        if (!cols.success || cols.rows.empty()) {
            const auto msg = std::format("Skipped table '{}': {}", table_name,
                cols.success ? "no readable columns" : cols.error_message);
            utils::log::warn(msg);
            schema.warnings.push_back(msg);
            continue;
        }

        TableInfo table;
        table.name = table_name;
        for (const auto& c : cols.rows) {
            if (c.size() < 6 || c[1].empty()) {
                schema.warnings.push_back(std::format("Skipped unreadable column in '{}'", table_name));
                continue;
            }
            ColumnInfo col;
            col.name = c[1];
            col.sql_type = c[2];
            col.nullable = c[3] != "1";
            col.is_primary_key = utils::parse_int<int>(c[5], 0) > 0;
            table.columns.push_back(std::move(col));
        }

        // PRAGMA foreign_key_list: id, seq, table, from, to, on_update, on_delete, match
        const auto fks = conn.execute(std::format("PRAGMA foreign_key_list({})", quoted));
        if (!fks.success) {
            const auto msg = std::format("Foreign keys of '{}' unavailable: {}", table_name, fks.error_message);
            utils::log::warn(msg);
            schema.warnings.push_back(msg);
        } else {
            for (const auto& f : fks.rows) {
                if (f.size() < 5) continue;
                ForeignKeyRef fk;
                fk.ref_table = f[2];
                fk.column = f[3];
                fk.ref_column = f[4];   // empty when the parent's primary key is implied
                table.foreign_keys.push_back(std::move(fk));
            }
        }

        schema.tables.push_back(std::move(table));
    }

    // "REFERENCES parent" without a column list targets the parent's primary key
    for (auto& table : schema.tables) {
        for (auto& fk : table.foreign_keys) {
            if (!fk.ref_column.empty()) continue;
            for (const auto& parent : schema.tables) {
                if (utils::to_lower(parent.name) != utils::to_lower(fk.ref_table)) continue;
                if (const auto* pk = parent.primary_key()) fk.ref_column = pk->name;
            }
        }
    }

    return Result<DiscoveredSchema>::ok(std::move(schema));
}

} // namespace nlquery
