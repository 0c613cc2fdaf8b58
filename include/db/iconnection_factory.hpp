#pragma once

#include "core/error.hpp"
#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace nlquery {

using ConnectionResult = Result<std::unique_ptr<IDbConnection>>;

/**
 * @brief Opens native connections for one backend.
 *
 * Takes the native string produced by parse_connection_descriptor
 * (a libpq conninfo URL, a MySQL URL, or a SQLite file path or URI).
 * Failure carries the driver's reason as a CONNECTION_ERROR, with any
 * password already redacted.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    [[nodiscard]] virtual ConnectionResult open(const std::string& native) = 0;
};

} // namespace nlquery
