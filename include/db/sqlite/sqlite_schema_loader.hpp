#pragma once

#include "db/ischema_loader.hpp"

namespace nlquery {

/**
 * @brief SQLite schema loader
 *
 * Enumerates tables from sqlite_master, then reads PRAGMA table_info and
 * PRAGMA foreign_key_list per table. A table whose PRAGMAs fail is skipped
 * with a warning.
 */
class SqliteSchemaLoader : public ISchemaLoader {
public:
    [[nodiscard]] Result<DiscoveredSchema> load_schema(IDbConnection& conn) override;
};

} // namespace nlquery
