#include "engine/query_engine.hpp"
#include "core/utils.hpp"
#include "db/generic_query_executor.hpp"
#include "planner/query_classifier.hpp"

#include <format>

namespace nlquery {

namespace {

nlohmann::json entity_to_json(const MappedEntity& e) {
    nlohmann::json j = {
        {"kind", entity_kind_to_string(e.kind)},
        {"phrase", e.phrase},
        {"table", e.table},
        {"confidence", e.confidence},
        {"position", e.position},
    };
    if (!e.column.empty()) j["column"] = e.column;
    // Sampled values are never echoed; literals are the user's own text
    if (e.kind == EntityKind::LITERAL) {
        j["value"] = e.value;
        if (!e.upper.empty()) j["upper"] = e.upper;
    }
    return j;
}

nlohmann::json documents_to_json(const std::vector<DocumentHit>& hits) {
    auto arr = nlohmann::json::array();
    for (const auto& hit : hits) {
        nlohmann::json j = {{"text", hit.text}, {"metadata", hit.metadata}};
        j["score"] = hit.score ? nlohmann::json(*hit.score) : nlohmann::json(nullptr);
        arr.push_back(std::move(j));
    }
    return arr;
}

nlohmann::json sources_of(const std::vector<DocumentHit>& hits) {
    auto arr = nlohmann::json::array();
    for (const auto& hit : hits) {
        arr.push_back(hit.metadata);
    }
    return arr;
}

QueryOutcome failure(ErrorCategory category, std::string message) {
    QueryOutcome out;
    out.success = false;
    out.error_category = category;
    out.error_message = std::move(message);
    out.body = {
        {"error", out.error_message},
        {"category", error_category_to_string(category)},
    };
    return out;
}

QueryOutcome cancelled() {
    return failure(ErrorCategory::TIMEOUT_ERROR, "Query was cancelled");
}

} // anonymous namespace

// ============================================================================
// Construction / connection state
// ============================================================================

QueryEngine::QueryEngine(EngineConfig config, HintRuleSet rules,
                         std::shared_ptr<IDocumentSearch> document_search)
    : config_(std::move(config)),
      rules_(std::move(rules)),
      discovery_(rules_, config_.discovery),
      planner_(config_.planner),
      branches_(config_.branch_workers, config_.max_pending_branches),
      merger_(branches_, config_.query_timeout),
      document_search_(std::move(document_search)),
      cache_(config_.cache),
      history_(config_.history_capacity) {}

std::shared_ptr<const QueryEngine::ConnectionState> QueryEngine::state() const {
    return std::atomic_load_explicit(&state_, std::memory_order_acquire);
}

void QueryEngine::install(std::string connection_name,
                          std::shared_ptr<const SchemaCatalog> catalog,
                          std::shared_ptr<IQueryExecutor> executor) {
    auto next = std::make_shared<ConnectionState>();
    const auto generation = generation_.fetch_add(1, std::memory_order_relaxed) + 1;
    next->identity = std::format("{}#{}", connection_name, generation);
    next->mapper = std::make_shared<const EntityMapper>(catalog, rules_, config_.match_threshold);
    next->catalog = std::move(catalog);
    next->executor = std::move(executor);

    std::atomic_store_explicit(&state_, std::shared_ptr<const ConnectionState>(std::move(next)),
                               std::memory_order_release);
    cache_.invalidate_all();
}

Result<std::shared_ptr<const SchemaCatalog>> QueryEngine::discover_schema(const std::string& descriptor) {
    using R = Result<std::shared_ptr<const SchemaCatalog>>;

    auto connected = discovery_.connect(descriptor);
    if (connected.is_error()) {
        utils::log::error(std::format("Connect failed: {}", connected.error_message()));
        return R::error(connected.error_category(), connected.error_message());
    }

    auto& conn = connected.value();
    auto executor = std::make_shared<GenericQueryExecutor>(conn.pool, conn.dialect);
    auto catalog = conn.catalog;
    install(conn.descriptor.redacted, catalog, std::move(executor));

    utils::log::info(std::format("Connected to {} ({} tables, {} warnings)",
        conn.descriptor.redacted, catalog->tables().size(), catalog->warnings().size()));
    return R::ok(std::move(catalog));
}

void QueryEngine::attach(std::string connection_name,
                         std::shared_ptr<const SchemaCatalog> catalog,
                         std::shared_ptr<IQueryExecutor> executor) {
    install(std::move(connection_name), std::move(catalog), std::move(executor));
}

bool QueryEngine::is_connected() const {
    return state() != nullptr;
}

std::string QueryEngine::connection_identity() const {
    const auto s = state();
    return s ? s->identity : std::string{};
}

// ============================================================================
// Planning
// ============================================================================

PlanResult QueryEngine::plan_with(const ConnectionState& state,
                                  std::string_view text,
                                  int64_t page,
                                  int64_t page_size) const {
    const auto mapping = state.mapper->map(text);
    auto intent = QueryClassifier::classify(mapping);
    if (intent.is_error()) {
        QueryIntent partial;
        partial.entities = mapping.entities;
        partial.free_text = mapping.free_text;
        return PlanResult::failure(std::move(partial), intent.error_message());
    }
    return planner_.plan(intent.value(), *state.catalog, page, page_size, text);
}

PlanResult QueryEngine::classify_and_plan(std::string_view text, int64_t page, int64_t page_size) const {
    const auto s = state();
    if (!s) {
        PlanResult r;
        r.error_category = ErrorCategory::CONNECTION_ERROR;
        r.error_message = "Database not connected. Connect first to initialize services.";
        return r;
    }
    return plan_with(*s, text, page, page_size);
}

// ============================================================================
// Query execution
// ============================================================================

QueryOutcome QueryEngine::run_query(std::string_view text,
                                    int64_t page,
                                    int64_t page_size,
                                    std::stop_token stop) {
    const utils::Timer timer;

    const auto s = state();
    if (!s) {
        return failure(ErrorCategory::CONNECTION_ERROR,
            "Database not connected. Connect first to initialize services.");
    }
    if (utils::trim(std::string(text)).empty()) {
        return failure(ErrorCategory::QUERY_NOT_UNDERSTOOD, "Query text is empty");
    }

    const auto pagination = planner_.paginate(page, page_size);
    const auto key = ResultCache::make_key(s->identity, text, pagination.page, pagination.page_size);

    if (auto hit = cache_.get(key)) {
        auto body = nlohmann::json::parse(hit->value, nullptr, false);
        if (!body.is_discarded() && body.is_object()) {
            const auto type = parse_query_type(body.value("query_type", ""));
            history_.record({std::string(text), type.value_or(QueryType::STRUCTURED), utils::now()});
            body["performance"] = {{"response_time_ms", timer.elapsed_ms().count()}};
            body["cache"] = {{"hit", true}, {"age_ms", hit->age.count()}};
            QueryOutcome out;
            out.success = true;
            out.body = std::move(body);
            return out;
        }
        utils::log::error("Cached payload is not valid JSON; dropping cache");
        cache_.invalidate_all();
    }

    if (stop.stop_requested()) return cancelled();

    auto planned = plan_with(*s, text, pagination.page, pagination.page_size);
    if (!planned.success) {
        auto out = failure(planned.error_category, planned.error_message);
        auto matched = nlohmann::json::array();
        for (const auto& e : planned.intent.entities) matched.push_back(entity_to_json(e));
        out.body["matched"] = std::move(matched);
        out.body["unmatched"] = planned.intent.free_text;
        return out;
    }

    const auto type = planned.intent.type;
    history_.record({std::string(text), type, utils::now()});

    if (stop.stop_requested()) return cancelled();

    nlohmann::json results;
    nlohmann::json sources = nlohmann::json::array();
    bool complete = true;

    const auto timeout = config_.query_timeout;
    const auto limit = config_.document_limit;
    auto executor = s->executor;
    auto search = document_search_;

    HybridMerger::StructuredBranch structured_branch;
    if (planned.plan) {
        structured_branch = [executor, plan = *planned.plan, timeout]() {
            if (!executor) {
                return Result<QueryResult>::error(ErrorCategory::CONNECTION_ERROR, "No query executor attached");
            }
            return executor->execute(plan, timeout);
        };
    }
    HybridMerger::DocumentBranch document_branch = [search, query = planned.document_query, limit, timeout]() {
        if (!search) {
            return Result<std::vector<DocumentHit>>::error(
                ErrorCategory::INDEX_UNAVAILABLE, "No document search service configured");
        }
        return search->search(query, limit, timeout);
    };

    const auto structured_json = [&](const QueryResult& rows) {
        auto j = query_result_to_json(rows);
        j["page"] = pagination.page;
        j["page_size"] = pagination.page_size;
        j["notes"] = planned.plan->notes;
        return j;
    };

    switch (type) {
        case QueryType::STRUCTURED: {
            const auto deadline = std::chrono::steady_clock::now() + timeout;
            auto future = branches_.submit<QueryResult>(std::move(structured_branch));
            auto rows = await_branch(future, deadline, "structured");
            if (rows.is_error()) return failure(rows.error_category(), rows.error_message());
            results = structured_json(rows.value());
            break;
        }
        case QueryType::DOCUMENT: {
            const auto deadline = std::chrono::steady_clock::now() + timeout;
            auto future = branches_.submit<std::vector<DocumentHit>>(std::move(document_branch));
            auto hits = await_branch(future, deadline, "document");
            if (hits.is_error()) return failure(hits.error_category(), hits.error_message());
            results = documents_to_json(hits.value());
            sources = sources_of(hits.value());
            break;
        }
        case QueryType::HYBRID: {
            auto merged = merger_.run(std::move(structured_branch), std::move(document_branch));
            if (merged.is_error()) return failure(merged.error_category(), merged.error_message());
            const auto& m = merged.value();
            auto errors = nlohmann::json::array();
            for (const auto& e : m.errors) {
                errors.push_back({
                    {"branch", e.branch},
                    {"category", error_category_to_string(e.category)},
                    {"error", e.message},
                });
            }
            results = {
                {"table", structured_json(m.table)},
                {"documents", documents_to_json(m.documents)},
                {"partial_failure", m.partial_failure},
                {"errors", std::move(errors)},
            };
            sources = sources_of(m.documents);
            complete = !m.partial_failure;
            break;
        }
    }

    if (stop.stop_requested()) return cancelled();

    QueryOutcome out;
    out.success = true;
    out.body = {
        {"query_type", query_type_to_string(type)},
        {"results", std::move(results)},
        {"sources", std::move(sources)},
    };

    // Only fully successful answers are cached
    if (complete) {
        cache_.put(key, out.body.dump());
    }

    out.body["performance"] = {{"response_time_ms", timer.elapsed_ms().count()}};
    out.body["cache"] = {{"hit", false}, {"age_ms", 0}};
    return out;
}

// ============================================================================
// Schema / history
// ============================================================================

Result<nlohmann::json> QueryEngine::get_schema() const {
    const auto s = state();
    if (!s) {
        return Result<nlohmann::json>::error(ErrorCategory::CONNECTION_ERROR,
            "Schema not available. Connect to a database first.");
    }
    return Result<nlohmann::json>::ok({
        {"connection", s->identity},
        {"schema", s->catalog->to_json()},
    });
}

nlohmann::json QueryEngine::get_history() const {
    auto arr = nlohmann::json::array();
    for (const auto& record : history_.snapshot()) {
        arr.push_back({
            {"query", record.query},
            {"type", query_type_to_string(record.query_type)},
            {"timestamp", utils::format_timestamp(record.timestamp)},
        });
    }
    return arr;
}

// ============================================================================
// JSON views
// ============================================================================

nlohmann::json intent_to_json(const QueryIntent& intent) {
    auto entities = nlohmann::json::array();
    for (const auto& e : intent.entities) entities.push_back(entity_to_json(e));

    nlohmann::json j = {
        {"query_type", query_type_to_string(intent.type)},
        {"operation", operation_to_string(intent.operation)},
        {"entities", std::move(entities)},
        {"free_text", intent.free_text},
    };
    if (intent.operation == Operation::AGGREGATE) {
        j["aggregate"] = utils::to_lower(aggregate_to_sql(intent.aggregate));
    }
    if (!intent.group_by_phrase.empty()) j["group_by"] = intent.group_by_phrase;
    return j;
}

nlohmann::json query_result_to_json(const QueryResult& result) {
    auto columns = nlohmann::json::array();
    for (size_t i = 0; i < result.column_names.size(); ++i) {
        const auto type = i < result.column_types.size()
            ? logical_type_to_string(result.column_types[i].logical_type)
            : logical_type_to_string(LogicalType::UNKNOWN);
        columns.push_back({{"name", result.column_names[i]}, {"type", type}});
    }

    auto rows = nlohmann::json::array();
    for (const auto& row : result.rows) {
        nlohmann::json obj = nlohmann::json::object();
        for (size_t i = 0; i < row.size() && i < result.column_names.size(); ++i) {
            obj[result.column_names[i]] = row[i];
        }
        rows.push_back(std::move(obj));
    }

    return {{"columns", std::move(columns)}, {"rows", std::move(rows)}};
}

} // namespace nlquery
