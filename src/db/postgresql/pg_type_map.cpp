#include "db/postgresql/pg_type_map.hpp"
#include <unordered_map>

namespace nlquery {

std::string PgTypeMap::oid_to_type_name(uint32_t oid) {
    static const std::unordered_map<uint32_t, const char*> OID_NAMES = {
        {16, "boolean"},
        {20, "bigint"},
        {21, "smallint"},
        {23, "integer"},
        {26, "oid"},
        {25, "text"},
        {1042, "character"},
        {1043, "character varying"},
        {19, "name"},
        {700, "real"},
        {701, "double precision"},
        {1700, "numeric"},
        {790, "money"},
        {1082, "date"},
        {1083, "time without time zone"},
        {1266, "time with time zone"},
        {1114, "timestamp without time zone"},
        {1184, "timestamp with time zone"},
        {1186, "interval"},
        {2950, "uuid"},
        {114, "json"},
        {3802, "jsonb"},
        {17, "bytea"},
    };

    const auto it = OID_NAMES.find(oid);
    return it != OID_NAMES.end() ? it->second : "";
}

ColumnTypeInfo PgTypeMap::build_type_info(uint32_t oid) {
    auto name = oid_to_type_name(oid);
    const auto logical = logical_type_from_type_name(name);
    return ColumnTypeInfo(logical, std::move(name));
}

} // namespace nlquery
