#pragma once

#include "catalog/hint_rules.hpp"
#include "catalog/schema_catalog.hpp"
#include "core/error.hpp"
#include "db/connection_descriptor.hpp"
#include "db/iconnection_pool.hpp"
#include "db/idb_connection.hpp"
#include "db/ischema_loader.hpp"
#include "db/isql_dialect.hpp"
#include <memory>
#include <string>
#include <vector>

namespace nlquery {

struct DiscoveryConfig {
    size_t sample_limit = 20;               // distinct values per text column
    PoolConfig pool;                        // connection_string is filled per descriptor
    std::chrono::milliseconds acquire_timeout{5000};
};

/**
 * @brief Everything a successful connect produces
 *
 * The pool stays open for query execution; the catalog is immutable.
 */
struct DiscoveredConnection {
    ConnectionDescriptor descriptor;
    std::shared_ptr<const SchemaCatalog> catalog;
    std::shared_ptr<IConnectionPool> pool;
    std::shared_ptr<const ISqlDialect> dialect;
};

/**
 * @brief Builds a SchemaCatalog from a live database
 *
 * Steps: the backend's loader reads raw structure, then every table and
 * column is labeled with hints, logical types are refined from key metadata,
 * undeclared `<x>_id` relations are inferred, and text columns are sampled.
 * A failure confined to one table or column becomes a catalog warning.
 */
class SchemaDiscovery {
public:
    explicit SchemaDiscovery(HintRuleSet rules, DiscoveryConfig config = {});

    /**
     * @brief Parse the descriptor, open a pool and discover its schema
     * @return DiscoveredConnection, or CONNECTION_ERROR / INTROSPECTION_ERROR
     */
    [[nodiscard]] Result<DiscoveredConnection> connect(const std::string& descriptor) const;

    /**
     * @brief Discover over an already open connection
     */
    [[nodiscard]] Result<SchemaCatalog> discover(IDbConnection& conn,
                                                 ISchemaLoader& loader,
                                                 const ISqlDialect& dialect) const;

    /**
     * @brief Hints, logical types and inferred relations (no database access)
     */
    void annotate(std::vector<TableInfo>& tables) const;

    [[nodiscard]] const HintRuleSet& rules() const { return rules_; }

private:
    void infer_relations(std::vector<TableInfo>& tables) const;

    void sample_values(IDbConnection& conn, const ISqlDialect& dialect,
                       std::vector<TableInfo>& tables,
                       std::vector<std::string>& warnings) const;

    HintRuleSet rules_;
    DiscoveryConfig config_;
};

} // namespace nlquery
