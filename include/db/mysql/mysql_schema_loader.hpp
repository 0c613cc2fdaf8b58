#pragma once

#include "db/ischema_loader.hpp"

namespace nlquery {

/**
 * @brief MySQL schema loader
 *
 * Reads base tables of DATABASE() from information_schema.COLUMNS
 * (COLUMN_KEY = 'PRI' marks primary keys) and KEY_COLUMN_USAGE rows with a
 * REFERENCED_TABLE_NAME for foreign keys.
 */
class MysqlSchemaLoader : public ISchemaLoader {
public:
    ~MysqlSchemaLoader() override = default;

    [[nodiscard]] Result<DiscoveredSchema> load_schema(IDbConnection& conn) override;
};

} // namespace nlquery
