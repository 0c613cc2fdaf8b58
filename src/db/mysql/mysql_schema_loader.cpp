#include "db/mysql/mysql_schema_loader.hpp"
#include "core/utils.hpp"
#include <format>
#include <map>

namespace nlquery {

namespace {

constexpr const char* COLUMNS_QUERY =
    "SELECT c.TABLE_NAME, c.COLUMN_NAME, c.COLUMN_TYPE, c.IS_NULLABLE, c.COLUMN_KEY "
    "FROM information_schema.COLUMNS c "
    "JOIN information_schema.TABLES t "
    "  ON t.TABLE_SCHEMA = c.TABLE_SCHEMA AND t.TABLE_NAME = c.TABLE_NAME "
    "WHERE c.TABLE_SCHEMA = DATABASE() AND t.TABLE_TYPE = 'BASE TABLE' "
    "ORDER BY c.TABLE_NAME, c.ORDINAL_POSITION";

constexpr const char* FOREIGN_KEYS_QUERY =
    "SELECT k.TABLE_NAME, k.COLUMN_NAME, k.REFERENCED_TABLE_NAME, k.REFERENCED_COLUMN_NAME "
    "FROM information_schema.KEY_COLUMN_USAGE k "
    "WHERE k.TABLE_SCHEMA = DATABASE() AND k.REFERENCED_TABLE_NAME IS NOT NULL "
    "  AND (SELECT COUNT(*) FROM information_schema.KEY_COLUMN_USAGE k2 "
    "       WHERE k2.TABLE_SCHEMA = k.TABLE_SCHEMA AND k2.TABLE_NAME = k.TABLE_NAME "
    "         AND k2.CONSTRAINT_NAME = k.CONSTRAINT_NAME) = 1";

} // anonymous namespace

Result<DiscoveredSchema> MysqlSchemaLoader::load_schema(IDbConnection& conn) {
    const auto cols = conn.execute(COLUMNS_QUERY);
    if (!cols.success) {
        return Result<DiscoveredSchema>::error(ErrorCategory::INTROSPECTION_ERROR,
            std::format("Failed to read information_schema.COLUMNS: {}", cols.error_message));
    }

    std::map<std::string, TableInfo> by_name;
    std::vector<std::string> order;
    DiscoveredSchema schema;

    for (const auto& row : cols.rows) {
        if (row.size() < 5 || row[0].empty() || row[1].empty()) {
            schema.warnings.push_back("Skipped unreadable row in information_schema.COLUMNS");
            continue;
        }
        auto [it, inserted] = by_name.try_emplace(row[0]);
        if (inserted) {
            it->second.name = row[0];
            order.push_back(row[0]);
        }
        ColumnInfo col;
        col.name = row[1];
        col.sql_type = row[2];      // COLUMN_TYPE keeps "tinyint(1)"
        col.nullable = row[3] == "YES";
        col.is_primary_key = row[4] == "PRI";
        it->second.columns.push_back(std::move(col));
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
