#pragma once

#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>

namespace nlquery {

/**
 * @brief Database-agnostic logical column type
 *
 * Derived from vendor type names (information_schema data_type, SQLite
 * declared types) and refined by key metadata during schema discovery.
 */
enum class LogicalType : uint8_t {
    UNKNOWN = 0,
    NUMERIC,
    TEXT,
    DATE,
    BOOLEAN,
    IDENTIFIER,
    FOREIGN_KEY,
};

/**
 * @brief Column type carried in result metadata
 */
struct ColumnTypeInfo {
    LogicalType logical_type = LogicalType::UNKNOWN;
    std::string vendor_type_name;      // "integer", "VARCHAR", ...

    ColumnTypeInfo() = default;
    ColumnTypeInfo(LogicalType lt, std::string vname)
        : logical_type(lt), vendor_type_name(std::move(vname)) {}
};

[[nodiscard]] inline const char* logical_type_to_string(LogicalType type) {
    switch (type) {
        case LogicalType::UNKNOWN: return "unknown";
        case LogicalType::NUMERIC: return "numeric";
        case LogicalType::TEXT: return "text";
        case LogicalType::DATE: return "date";
        case LogicalType::BOOLEAN: return "boolean";
        case LogicalType::IDENTIFIER: return "identifier";
        case LogicalType::FOREIGN_KEY: return "foreign_key";
        default: return "unknown";
    }
}

/**
 * @brief Map a declared SQL type name of any supported dialect to a LogicalType
 *
 * Matching is by substring, in the spirit of SQLite's type affinity rules, so
 * "character varying(64)", "VARCHAR", "INT UNSIGNED" and "timestamp with time
 * zone" all resolve without a per-vendor table.
 */
[[nodiscard]] inline LogicalType logical_type_from_type_name(std::string_view type_name) {
    std::string lower(type_name);
    for (char& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    const auto has = [&lower](std::string_view needle) {
        return lower.find(needle) != std::string::npos;
    };

    if (lower.empty()) return LogicalType::UNKNOWN;
    if (has("bool") || lower == "bit" || lower == "tinyint(1)") return LogicalType::BOOLEAN;
    if (has("date") || has("time") || lower == "year") return LogicalType::DATE;
    if (has("interval") || has("point")) return LogicalType::UNKNOWN;
    if (has("int") || has("serial") || has("numeric") || has("decimal") ||
        has("real") || has("float") || has("double") || has("money") || lower == "number") {
        return LogicalType::NUMERIC;
    }
    if (has("char") || has("text") || has("clob") || has("string") ||
        has("enum") || has("uuid") || has("citext") || has("name")) {
        return LogicalType::TEXT;
    }
    return LogicalType::UNKNOWN;
}

} // namespace nlquery
