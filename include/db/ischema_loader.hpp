#pragma once

#include "catalog/schema_catalog.hpp"
#include "core/error.hpp"
#include "db/idb_connection.hpp"
#include <string>
#include <vector>

namespace nlquery {

/**
 * @brief Raw structure read from the engine's catalog tables
 *
 * Tables carry names, ordinal columns (declared type, nullability,
 * primary-key flag) and declared foreign keys. Semantic hints, logical
 * types, inferred relations and samples are added by SchemaDiscovery.
 */
struct DiscoveredSchema {
    std::vector<TableInfo> tables;
    std::vector<std::string> warnings;   // per-table/column failures that were skipped
};

/**
 * @brief Abstract schema loader interface
 *
 * Each backend queries its own catalog
 * (information_schema for PG/MySQL, sqlite_master + PRAGMAs for SQLite).
 */
class ISchemaLoader {
public:
    virtual ~ISchemaLoader() = default;

    /**
     * @brief Read tables, columns and declared keys over an open connection
     * @return DiscoveredSchema, or INTROSPECTION_ERROR when the catalog itself
     *         cannot be read. Failures limited to one table are reported as
     *         warnings instead.
     */
    [[nodiscard]] virtual Result<DiscoveredSchema> load_schema(IDbConnection& conn) = 0;
};

} // namespace nlquery
