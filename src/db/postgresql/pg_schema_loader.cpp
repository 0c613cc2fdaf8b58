#include "db/postgresql/pg_schema_loader.hpp"
#include "core/utils.hpp"
#include <format>
#include <map>

namespace nlquery {

namespace {

constexpr const char* COLUMNS_QUERY =
    "SELECT c.table_name, c.column_name, c.data_type, c.is_nullable "
    "FROM information_schema.columns c "
    "JOIN information_schema.tables t "
    "  ON t.table_schema = c.table_schema AND t.table_name = c.table_name "
    "WHERE c.table_schema = current_schema() AND t.table_type = 'BASE TABLE' "
    "ORDER BY c.table_name, c.ordinal_position";

constexpr const char* PRIMARY_KEYS_QUERY =
    "SELECT kcu.table_name, kcu.column_name "
    "FROM information_schema.table_constraints tc "
    "JOIN information_schema.key_column_usage kcu "
    "  ON kcu.constraint_name = tc.constraint_name "
    " AND kcu.constraint_schema = tc.constraint_schema "
    "WHERE tc.constraint_type = 'PRIMARY KEY' AND tc.table_schema = current_schema()";

// Only single-column keys; composite keys cannot drive a one-column join.
constexpr const char* FOREIGN_KEYS_QUERY =
    "SELECT kcu.table_name, kcu.column_name, ccu.table_name, ccu.column_name "
    "FROM information_schema.table_constraints tc "
    "JOIN information_schema.key_column_usage kcu "
    "  ON kcu.constraint_name = tc.constraint_name "
    " AND kcu.constraint_schema = tc.constraint_schema "
    "JOIN information_schema.constraint_column_usage ccu "
    "  ON ccu.constraint_name = tc.constraint_name "
    " AND ccu.constraint_schema = tc.constraint_schema "
    "WHERE tc.constraint_type = 'FOREIGN KEY' AND tc.table_schema = current_schema() "
    "  AND (SELECT count(*) FROM information_schema.key_column_usage k2 "
    "       WHERE k2.constraint_name = tc.constraint_name "
    "         AND k2.constraint_schema = tc.constraint_schema) = 1";

} // anonymous namespace

Result<DiscoveredSchema> PgSchemaLoader::load_schema(IDbConnection& conn) {
    const auto cols = conn.execute(COLUMNS_QUERY);
    if (!cols.success) {
        return Result<DiscoveredSchema>::error(ErrorCategory::INTROSPECTION_ERROR,
            std::format("Failed to read information_schema.columns: {}", cols.error_message));
    }

    // Rows arrive ordered by (table, ordinal) so columns accumulate per table
    std::map<std::string, TableInfo> by_name;
    std::vector<std::string> order;
    DiscoveredSchema schema;

    for (const auto& row : cols.rows) {
        if (row.size() < 4 || row[0].empty() || row[1].empty()) {
            schema.warnings.push_back("Skipped unreadable row in information_schema.columns");
            continue;
        }
        auto [it, inserted] = by_name.try_emplace(row[0]);
        if (inserted) {
            it->second.name = row[0];
            order.push_back(row[0]);
        }
        ColumnInfo col;
        col.name = row[1];
        col.sql_type = row[2];
        col.nullable = row[3] == "YES";
        it->second.columns.push_back(std::move(col));
    }

    const auto pks = conn.execute(PRIMARY_KEYS_QUERY);
    if (!pks.success) {
        const auto msg = std::format("Primary keys unavailable: {}", pks.error_message);
        utils::log::warn(msg);
        schema.warnings.push_back(msg);
    } else {
        for (const auto& row : pks.rows) {
            if (row.size() < 2) continue;
            const auto it = by_name.find(row[0]);
            if (it == by_name.end()) continue;
            for (auto& col : it->second.columns) {
                if (col.name == row[1]) col.is_primary_key = true;
            }
        }
    }

    const auto fks = conn.execute(FOREIGN_KEYS_QUERY);
    if (!fks.success) {
        const auto msg = std::format("Foreign keys unavailable: {}", fks.error_message);
        utils::log::warn(msg);
        schema.warnings.push_back(msg);
    } else {
        for (const auto& row : fks.rows) {
            if (row.size() < 4) continue;
            const auto it = by_name.find(row[0]);
            if (it == by_name.end()) continue;
            ForeignKeyRef fk;
            fk.column = row[1];
            fk.ref_table = row[2];
            fk.ref_column = row[3];
            it->second.foreign_keys.push_back(std::move(fk));
        }
    }

    schema.tables.reserve(order.size());
    for (const auto& name : order) {
        schema.tables.push_back(std::move(by_name[name]));
    }
    return Result<DiscoveredSchema>::ok(std::move(schema));
}

} // namespace nlquery
