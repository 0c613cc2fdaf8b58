#pragma once

#include "cache/result_cache.hpp"
#include "catalog/hint_rules.hpp"
#include "catalog/schema_catalog.hpp"
#include "core/error.hpp"
#include "db/iquery_executor.hpp"
#include "engine/branch_executor.hpp"
#include "engine/hybrid_merger.hpp"
#include "engine/query_history.hpp"
#include "mapper/entity_mapper.hpp"
#include "planner/query_planner.hpp"
#include "schema/schema_discovery.hpp"
#include "search/idocument_search.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>

namespace nlquery {

struct EngineConfig {
    DiscoveryConfig discovery;
    PlannerConfig planner;
    ResultCache::Config cache;
    size_t history_capacity = QueryHistory::kDefaultCapacity;
    double match_threshold = EntityMapper::kDefaultThreshold;
    std::chrono::milliseconds query_timeout{10000};     // per branch
    size_t document_limit = 10;
    size_t branch_workers = BranchExecutor::kDefaultWorkers;
    size_t max_pending_branches = BranchExecutor::kDefaultMaxPending;
};

/**
 * @brief Outcome of run_query
 *
 * On success `body` is the response payload. On failure it carries
 * {"error", "category"} and, for QUERY_NOT_UNDERSTOOD, the matched entities
 * and unmatched tokens.
 */
struct QueryOutcome {
    bool success = false;
    ErrorCategory error_category = ErrorCategory::NONE;
    std::string error_message;
    nlohmann::json body;
};

/**
 * @brief Facade over discovery, mapping, planning, execution and caching
 *
 * Connection state (identity, catalog, mapper, executor) is published as one
 * immutable snapshot and swapped atomically on connect; requests in flight
 * keep the snapshot they started with. A swap invalidates the result cache.
 */
class QueryEngine {
public:
    QueryEngine(EngineConfig config, HintRuleSet rules,
                std::shared_ptr<IDocumentSearch> document_search);

    /**
     * @brief Connect, discover and make the result the active state
     * @return The new catalog, or CONNECTION_ERROR / INTROSPECTION_ERROR (the
     *         previous state stays active)
     */
    [[nodiscard]] Result<std::shared_ptr<const SchemaCatalog>> discover_schema(
        const std::string& descriptor);

    /**
     * @brief Install an already built catalog and executor
     *
     * Used by tests and by embedders that bring their own executor.
     */
    void attach(std::string connection_name,
                std::shared_ptr<const SchemaCatalog> catalog,
                std::shared_ptr<IQueryExecutor> executor);

    /// Map, classify and plan without executing anything
    [[nodiscard]] PlanResult classify_and_plan(std::string_view text,
                                               int64_t page = 1,
                                               int64_t page_size = 0) const;

    [[nodiscard]] QueryOutcome run_query(std::string_view text,
                                         int64_t page,
                                         int64_t page_size,
                                         std::stop_token stop = {});

    /// {"connection", "schema"}, or CONNECTION_ERROR before the first connect
    [[nodiscard]] Result<nlohmann::json> get_schema() const;

    /// Most recent first
    [[nodiscard]] nlohmann::json get_history() const;

    [[nodiscard]] bool is_connected() const;

    /// Redacted descriptor plus generation; empty before the first connect
    [[nodiscard]] std::string connection_identity() const;

    [[nodiscard]] ResultCache& cache() { return cache_; }
    [[nodiscard]] const QueryHistory& history() const { return history_; }
    [[nodiscard]] const EngineConfig& config() const { return config_; }

private:
    struct ConnectionState {
        std::string identity;
        std::shared_ptr<const SchemaCatalog> catalog;
        std::shared_ptr<const EntityMapper> mapper;
        std::shared_ptr<IQueryExecutor> executor;
    };

    void install(std::string connection_name,
                 std::shared_ptr<const SchemaCatalog> catalog,
                 std::shared_ptr<IQueryExecutor> executor);

    [[nodiscard]] std::shared_ptr<const ConnectionState> state() const;

    [[nodiscard]] PlanResult plan_with(const ConnectionState& state,
                                       std::string_view text,
                                       int64_t page,
                                       int64_t page_size) const;

    EngineConfig config_;
    HintRuleSet rules_;
    SchemaDiscovery discovery_;
    QueryPlanner planner_;
    BranchExecutor branches_;
    HybridMerger merger_;
    std::shared_ptr<IDocumentSearch> document_search_;
    ResultCache cache_;
    QueryHistory history_;

    std::shared_ptr<const ConnectionState> state_;     // RCU: atomic_load / atomic_store
    std::atomic<uint64_t> generation_{0};
};

/// JSON view of an intent: type, operation, entities, free text
[[nodiscard]] nlohmann::json intent_to_json(const QueryIntent& intent);

/// JSON view of executed rows: {"columns", "rows"} with one object per row
[[nodiscard]] nlohmann::json query_result_to_json(const QueryResult& result);

} // namespace nlquery
