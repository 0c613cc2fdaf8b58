#pragma once

#include "core/column_type.hpp"
#include <mysql/mysql.h>

namespace nlquery {

/**
 * @brief MySQL type mapping utilities
 *
 * Maps result field types (MYSQL_FIELD::type) to LogicalType.
 */
class MysqlTypeMap {
public:
    [[nodiscard]] static LogicalType field_type_to_logical(enum_field_types field_type);

    [[nodiscard]] static const char* field_type_name(enum_field_types field_type);

    [[nodiscard]] static ColumnTypeInfo build_type_info(enum_field_types field_type);
};

} // namespace nlquery
