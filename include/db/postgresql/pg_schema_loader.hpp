#pragma once

#include "db/ischema_loader.hpp"

namespace nlquery {

/**
 * @brief PostgreSQL schema loader
 *
 * Reads base tables of current_schema() from information_schema: columns
 * in ordinal order, primary-key columns and single-column foreign keys.
 */
class PgSchemaLoader : public ISchemaLoader {
public:
    ~PgSchemaLoader() override = default;

    [[nodiscard]] Result<DiscoveredSchema> load_schema(IDbConnection& conn) override;
};

} // namespace nlquery
