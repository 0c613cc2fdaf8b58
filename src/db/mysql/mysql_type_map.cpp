#include "db/mysql/mysql_type_map.hpp"

namespace nlquery {

LogicalType MysqlTypeMap::field_type_to_logical(enum_field_types field_type) {
    switch (field_type) {
        case MYSQL_TYPE_TINY:
        case MYSQL_TYPE_SHORT:
        case MYSQL_TYPE_LONG:
        case MYSQL_TYPE_INT24:
        case MYSQL_TYPE_LONGLONG:
        case MYSQL_TYPE_FLOAT:
        case MYSQL_TYPE_DOUBLE:
        case MYSQL_TYPE_DECIMAL:
        case MYSQL_TYPE_NEWDECIMAL:
        case MYSQL_TYPE_YEAR:
            return LogicalType::NUMERIC;
        case MYSQL_TYPE_STRING:
        case MYSQL_TYPE_VAR_STRING:
        case MYSQL_TYPE_VARCHAR:
        case MYSQL_TYPE_ENUM:
        case MYSQL_TYPE_SET:
            return LogicalType::TEXT;
        case MYSQL_TYPE_DATE:
        case MYSQL_TYPE_NEWDATE:
        case MYSQL_TYPE_TIME:
        case MYSQL_TYPE_DATETIME:
        case MYSQL_TYPE_TIMESTAMP:
            return LogicalType::DATE;
        case MYSQL_TYPE_BIT:
            return LogicalType::BOOLEAN;
        default:
            return LogicalType::UNKNOWN;
    }
}

const char* MysqlTypeMap::field_type_name(enum_field_types field_type) {
    switch (field_type) {
        case MYSQL_TYPE_TINY: return "tinyint";
        case MYSQL_TYPE_SHORT: return "smallint";
        case MYSQL_TYPE_LONG: return "int";
        case MYSQL_TYPE_INT24: return "mediumint";
        case MYSQL_TYPE_LONGLONG: return "bigint";
        case MYSQL_TYPE_FLOAT: return "float";
        case MYSQL_TYPE_DOUBLE: return "double";
        case MYSQL_TYPE_DECIMAL:
        case MYSQL_TYPE_NEWDECIMAL: return "decimal";
        case MYSQL_TYPE_YEAR: return "year";
        case MYSQL_TYPE_STRING: return "char";
        case MYSQL_TYPE_VAR_STRING:
        case MYSQL_TYPE_VARCHAR: return "varchar";
        case MYSQL_TYPE_ENUM: return "enum";
        case MYSQL_TYPE_SET: return "set";
        case MYSQL_TYPE_DATE:
        case MYSQL_TYPE_NEWDATE: return "date";
        case MYSQL_TYPE_TIME: return "time";
        case MYSQL_TYPE_DATETIME: return "datetime";
        case MYSQL_TYPE_TIMESTAMP: return "timestamp";
        case MYSQL_TYPE_BIT: return "bit";
        case MYSQL_TYPE_BLOB: return "blob";
        case MYSQL_TYPE_JSON: return "json";
        case MYSQL_TYPE_GEOMETRY: return "geometry";
        default: return "";
    }
}

ColumnTypeInfo MysqlTypeMap::build_type_info(enum_field_types field_type) {
    return ColumnTypeInfo(field_type_to_logical(field_type), field_type_name(field_type));
}

} // namespace nlquery
