#pragma once

#include "core/database_type.hpp"
#include <cstddef>
#include <string>
#include <string_view>

namespace nlquery {

/**
 * @brief SQL rendering rules of one database dialect
 *
 * Each backend provides its own dialect: identifier quoting
 * ("x" for PostgreSQL/SQLite, `x` for MySQL) and bind placeholder syntax
 * ($1 for PostgreSQL, ? for MySQL/SQLite).
 */
class ISqlDialect {
public:
    virtual ~ISqlDialect() = default;

    [[nodiscard]] virtual DatabaseType type() const = 0;

    /**
     * @brief Quote an identifier, doubling any embedded quote character
     */
    [[nodiscard]] virtual std::string quote_identifier(std::string_view identifier) const = 0;

    /**
     * @brief Placeholder for the 1-based parameter index
     */
    [[nodiscard]] virtual std::string placeholder(size_t index) const = 0;
};

namespace dialect_detail {

[[nodiscard]] inline std::string quote_with(std::string_view identifier, char quote) {
    std::string out;
    out.reserve(identifier.size() + 2);
    out += quote;
    for (const char c : identifier) {
        if (c == quote) out += quote;
        out += c;
    }
    out += quote;
    return out;
}

} // namespace dialect_detail

} // namespace nlquery
