#include "schema/schema_discovery.hpp"
#include "core/text.hpp"
#include "core/utils.hpp"
#include "db/backend_registry.hpp"
#include "db/connection_lease.hpp"
#include <algorithm>
#include <format>

namespace nlquery {

namespace {

bool is_identifier_name(const std::vector<std::string>& words) {
    return !words.empty() && words.back() == "id";
}

bool looks_like_iso_date(std::string_view v) {
    if (v.size() < 10) return false;
    for (size_t i = 0; i < 10; ++i) {
        const bool dash = i == 4 || i == 7;
        if (dash ? v[i] != '-' : !std::isdigit(static_cast<unsigned char>(v[i]))) return false;
    }
    return v.size() == 10 || v[10] == ' ' || v[10] == 'T';
}

} // anonymous namespace

SchemaDiscovery::SchemaDiscovery(HintRuleSet rules, DiscoveryConfig config)
    : rules_(std::move(rules)), config_(std::move(config)) {}

Result<DiscoveredConnection> SchemaDiscovery::connect(const std::string& descriptor) const {
    auto parsed = parse_connection_descriptor(descriptor);
    if (parsed.is_error()) {
        return Result<DiscoveredConnection>::error(parsed.error_category(), parsed.error_message());
    }
    const auto& desc = parsed.value();

    register_builtin_backends();
    auto backend = BackendRegistry::instance().create(desc.type);
    if (!backend) {
        return Result<DiscoveredConnection>::error(ErrorCategory::CONNECTION_ERROR,
            std::format("No {} backend in this build", database_type_to_string(desc.type)));
    }

    PoolConfig pool_config = config_.pool;
    pool_config.connection_string = desc.native;
    auto pool = backend->create_pool(desc.redacted, pool_config);
    auto loader = backend->create_schema_loader();
    std::shared_ptr<const ISqlDialect> dialect = backend->create_dialect();

    SchemaCatalog catalog;
    {
        auto conn = pool->acquire(config_.acquire_timeout);
        if (!conn || !conn->is_valid()) {
            auto reason = pool->last_error();
            pool->drain();
            return Result<DiscoveredConnection>::error(ErrorCategory::CONNECTION_ERROR,
                reason.empty() ? std::format("Could not connect to {}", desc.redacted)
                               : std::format("Could not connect to {}: {}", desc.redacted, reason));
        }

        auto discovered = discover(*conn->get(), *loader, *dialect);
        if (discovered.is_error()) {
            conn.reset();
            pool->drain();
            return Result<DiscoveredConnection>::error(discovered.error_category(), discovered.error_message());
        }
        catalog = std::move(discovered.value());
    }

    utils::log::info(std::format("Discovered {} tables on {} ({} warnings)",
        catalog.tables().size(), desc.redacted, catalog.warnings().size()));

    DiscoveredConnection out;
    out.descriptor = desc;
    out.catalog = std::make_shared<const SchemaCatalog>(std::move(catalog));
    out.pool = std::move(pool);
    out.dialect = std::move(dialect);
    return Result<DiscoveredConnection>::ok(std::move(out));
}

Result<SchemaCatalog> SchemaDiscovery::discover(IDbConnection& conn,
                                                ISchemaLoader& loader,
                                                const ISqlDialect& dialect) const {
    auto loaded = loader.load_schema(conn);
    if (loaded.is_error()) {
        utils::log::error(loaded.error_message());
        return Result<SchemaCatalog>::error(loaded.error_category(), loaded.error_message());
    }

    auto& schema = loaded.value();
    annotate(schema.tables);
    sample_values(conn, dialect, schema.tables, schema.warnings);

    return Result<SchemaCatalog>::ok(
        SchemaCatalog(dialect.type(), std::move(schema.tables), std::move(schema.warnings)));
}

// ============================================================================
// Annotation
// ============================================================================

void SchemaDiscovery::annotate(std::vector<TableInfo>& tables) const {
    for (auto& table : tables) {
        table.hints = rules_.hints_for(table.name, HintTarget::TABLE);

        for (auto& col : table.columns) {
            col.hints = rules_.hints_for(col.name, HintTarget::COLUMN);
            col.logical_type = logical_type_from_type_name(col.sql_type);

            const auto words = text::split_identifier(col.name);
            const bool declared_fk = std::any_of(table.foreign_keys.begin(), table.foreign_keys.end(),
                [&col](const ForeignKeyRef& fk) { return !fk.inferred && fk.column == col.name; });

            if (declared_fk && !col.is_primary_key) {
                col.logical_type = LogicalType::FOREIGN_KEY;
            } else if (col.is_primary_key || is_identifier_name(words)) {
                col.logical_type = LogicalType::IDENTIFIER;
            }
        }
    }
    infer_relations(tables);
}

void SchemaDiscovery::infer_relations(std::vector<TableInfo>& tables) const {
    for (auto& table : tables) {
        std::vector<ForeignKeyRef> inferred;
        for (const auto& col : table.columns) {
            if (col.is_primary_key) continue;
            const auto words = text::split_identifier(col.name);
            if (words.size() < 2 || !is_identifier_name(words)) continue;

            const bool declared = std::any_of(table.foreign_keys.begin(), table.foreign_keys.end(),
                [&col](const ForeignKeyRef& fk) { return fk.column == col.name; });
            if (declared) continue;

            std::string stem;
            for (size_t i = 0; i + 1 < words.size(); ++i) {
                if (!stem.empty()) stem += ' ';
                stem += text::singularize(words[i]);
            }
            const auto stem_hints = rules_.hints_for(stem, HintTarget::TABLE);

            const TableInfo* candidate = nullptr;
            size_t candidates = 0;
            for (const auto& other : tables) {
                if (&other == &table) continue;
                bool related = text::normalize_identifier(other.name) == stem;
                for (const auto& h : stem_hints) {
                    related = related || other.has_hint(h);
                }
                if (related) {
                    candidate = &other;
                    ++candidates;
                }
            }

            if (candidates != 1) continue;
            const auto* pk = candidate->primary_key();
            if (!pk) continue;

            ForeignKeyRef fk;
            fk.column = col.name;
            fk.ref_table = candidate->name;
            fk.ref_column = pk->name;
            fk.inferred = true;
            fk.confidence = 0.6;
            inferred.push_back(std::move(fk));
            utils::log::debug(std::format("Inferred relation {}.{} -> {}.{}",
                table.name, col.name, candidate->name, pk->name));
        }
        for (auto& fk : inferred) {
            table.foreign_keys.push_back(std::move(fk));
        }
    }
}

// ============================================================================
// Sampling
// ============================================================================

void SchemaDiscovery::sample_values(IDbConnection& conn, const ISqlDialect& dialect,
                                    std::vector<TableInfo>& tables,
                                    std::vector<std::string>& warnings) const {
    if (config_.sample_limit == 0) return;

    for (auto& table : tables) {
        const auto qtable = dialect.quote_identifier(table.name);
        for (auto& col : table.columns) {
            if (col.logical_type != LogicalType::TEXT) continue;

            const auto qcol = dialect.quote_identifier(col.name);
            const auto sql = std::format(
                "SELECT DISTINCT {0} FROM {1} WHERE {0} IS NOT NULL ORDER BY {0} LIMIT {2}",
                qcol, qtable, config_.sample_limit);

            const auto rs = conn.execute(sql);
            if (!rs.success) {
                const auto msg = std::format("Sampling {}.{} failed: {}", table.name, col.name, rs.error_message);
                utils::log::warn(msg);
                warnings.push_back(msg);
                continue;
            }

            col.samples.clear();
            for (const auto& row : rs.rows) {
                if (!row.empty() && !row[0].empty()) col.samples.push_back(row[0]);
            }

            // Dates stored as text (common in SQLite) compare correctly as ISO strings
            if (!col.samples.empty() &&
                std::all_of(col.samples.begin(), col.samples.end(), looks_like_iso_date)) {
                col.logical_type = LogicalType::DATE;
            }
        }
    }
}

} // namespace nlquery
