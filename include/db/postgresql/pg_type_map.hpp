#pragma once

#include "core/column_type.hpp"
#include <cstdint>
#include <string>

namespace nlquery {

/**
 * @brief PostgreSQL type mapping utilities
 *
 * Maps result-column OIDs (PQftype) to type names and LogicalType.
 */
class PgTypeMap {
public:
    /**
     * @brief Built-in type name for an OID, "" when not a built-in scalar
     */
    [[nodiscard]] static std::string oid_to_type_name(uint32_t oid);

    [[nodiscard]] static ColumnTypeInfo build_type_info(uint32_t oid);
};

} // namespace nlquery
