#pragma once

#include "core/database_type.hpp"
#include "core/error.hpp"
#include <string>
#include <string_view>

namespace nlquery {

/**
 * @brief A user-supplied connection string resolved to a backend
 *
 * Accepted forms:
 *   postgresql://user:pw@host:5432/db   postgres://...   host=... dbname=...
 *   mysql://user:pw@host:3306/db        mariadb://...
 *   sqlite:///relative/path.db          sqlite:////absolute/path.db
 * A "+driver" suffix on the scheme (postgresql+psycopg2://) is ignored.
 */
struct ConnectionDescriptor {
    DatabaseType type = DatabaseType::SQLITE;
    std::string native;     // what the backend's connection factory expects
    std::string redacted;   // password masked; safe for logs and cache identity
};

[[nodiscard]] Result<ConnectionDescriptor> parse_connection_descriptor(std::string_view descriptor);

/// Mask the password of a URI or libpq keyword string
[[nodiscard]] std::string redact_connection_string(std::string_view conn_str);

} // namespace nlquery
