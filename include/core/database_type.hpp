#pragma once

#include <string>
#include <string_view>
#include <algorithm>
#include <optional>
#include <unordered_map>

namespace nlquery {

namespace keys {
    inline constexpr std::string_view POSTGRES = "postgres";
    inline constexpr std::string_view POSTGRESQL = "postgresql";
    inline constexpr std::string_view PG = "pg";
    inline constexpr std::string_view MYSQL = "mysql";
    inline constexpr std::string_view MARIADB = "mariadb";
    inline constexpr std::string_view SQLITE = "sqlite";
    inline constexpr std::string_view SQLITE3 = "sqlite3";
}

enum class DatabaseType {
    POSTGRESQL,
    MYSQL,
    SQLITE,
};

[[nodiscard]] inline std::string_view database_type_to_string(DatabaseType type) {
    switch (type) {
        case DatabaseType::POSTGRESQL: return keys::POSTGRESQL;
        case DatabaseType::MYSQL: return keys::MYSQL;
        case DatabaseType::SQLITE: return keys::SQLITE;
        default: return "unknown";
    }
}

[[nodiscard]] inline std::optional<DatabaseType> try_parse_database_type(std::string_view type_str) {
    static const std::unordered_map<std::string_view, DatabaseType> lookup = {
        {keys::POSTGRESQL, DatabaseType::POSTGRESQL},
        {keys::POSTGRES,   DatabaseType::POSTGRESQL},
        {keys::PG,         DatabaseType::POSTGRESQL},
        {keys::MYSQL,      DatabaseType::MYSQL},
        {keys::MARIADB,    DatabaseType::MYSQL},
        {keys::SQLITE,     DatabaseType::SQLITE},
        {keys::SQLITE3,    DatabaseType::SQLITE}
    };

    if (const auto it = lookup.find(type_str); it != lookup.end()) {
        return it->second;
    }

    // Case-insensitive fallback, only when the direct lookup misses
    for (const auto& [key, value] : lookup) {
        if (key.size() == type_str.size()) {
            const bool match = std::equal(key.begin(), key.end(), type_str.begin(),
                [](char a, char b) { return std::tolower(a) == std::tolower(b); });
            if (match) return value;
        }
    }
    return std::nullopt;
}

} // namespace nlquery
