#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace nlquery {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (auto* s = val.as_string()) {
            s->get() = expand_env_vars(s->get());
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (auto* s = elem.as_string()) {
            s->get() = expand_env_vars(s->get());
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

/// Negative integers in the file become 0 so validation can reject them
size_t toml_size(const toml::node_view<const toml::node> node, size_t fallback) {
    const auto v = node.value<int64_t>();
    if (!v) return fallback;
    return *v < 0 ? 0 : static_cast<size_t>(*v);
}

} // anonymous namespace

// ============================================================================
// Section extractors
// ============================================================================

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    const auto port = s["port"].value_or(int64_t{8080});
    cfg.host = s["host"].value_or("0.0.0.0"s);
    cfg.port = (port < 0 || port > 65535) ? 0 : static_cast<uint16_t>(port);
    cfg.threads = toml_size(s["threads"], cfg.threads);
    cfg.request_timeout = std::chrono::milliseconds(s["request_timeout_ms"].value_or(int64_t{30000}));
    cfg.max_query_length = toml_size(s["max_query_length"], cfg.max_query_length);
    cfg.branch_workers = toml_size(s["branch_workers"], cfg.branch_workers);
    cfg.max_pending_branches = toml_size(s["max_pending_branches"], cfg.max_pending_branches);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

DatabaseConfig ConfigLoader::extract_database(const toml::table& root) {
    DatabaseConfig cfg;
    if (const auto* db = root["database"].as_table()) {
        const auto& d = *db;
        cfg.connection_string = d["connection_string"].value_or(""s);
        cfg.min_connections = toml_size(d["min_connections"], cfg.min_connections);
        cfg.max_connections = toml_size(d["max_connections"], cfg.max_connections);
        cfg.acquire_timeout = std::chrono::milliseconds(d["acquire_timeout_ms"].value_or(int64_t{5000}));
        cfg.query_timeout = std::chrono::milliseconds(d["query_timeout_ms"].value_or(int64_t{10000}));
        cfg.sample_limit = toml_size(d["sample_limit"], cfg.sample_limit);
    }

    // Environment wins over the file
    if (const char* url = std::getenv("DATABASE_URL"); url && *url) {
        cfg.connection_string = url;
    }
    return cfg;
}

CacheConfig ConfigLoader::extract_cache(const toml::table& root) {
    CacheConfig cfg;
    const auto* cache = root["cache"].as_table();
    if (!cache) return cfg;
    const auto& c = *cache;

    cfg.enabled = c["enabled"].value_or(true);
    cfg.max_entries = toml_size(c["max_entries"], cfg.max_entries);
    cfg.ttl = std::chrono::seconds(c["ttl_seconds"].value_or(int64_t{300}));
    cfg.max_payload_bytes = toml_size(c["max_payload_bytes"], cfg.max_payload_bytes);
    return cfg;
}

PlannerSection ConfigLoader::extract_planner(const toml::table& root) {
    PlannerSection cfg;
    const auto* planner = root["planner"].as_table();
    if (!planner) return cfg;
    const auto& p = *planner;

    cfg.default_page_size = toml_size(p["default_page_size"], cfg.default_page_size);
    cfg.max_page_size = toml_size(p["max_page_size"], cfg.max_page_size);
    cfg.match_threshold = p["match_threshold"].value_or(cfg.match_threshold);
    cfg.fuzzy_threshold = p["fuzzy_threshold"].value_or(cfg.fuzzy_threshold);
    return cfg;
}

DocumentsConfig ConfigLoader::extract_documents(const toml::table& root) {
    DocumentsConfig cfg;
    const auto* docs = root["documents"].as_table();
    if (!docs) return cfg;
    const auto& d = *docs;

    cfg.enabled = d["enabled"].value_or(false);
    cfg.endpoint = d["endpoint"].value_or(cfg.endpoint);
    cfg.path = d["path"].value_or(cfg.path);
    cfg.api_key = d["api_key"].value_or(""s);
    cfg.limit = toml_size(d["limit"], cfg.limit);
    return cfg;
}

HistoryConfig ConfigLoader::extract_history(const toml::table& root) {
    HistoryConfig cfg;
    if (const auto* history = root["history"].as_table()) {
        cfg.capacity = toml_size((*history)["capacity"], cfg.capacity);
    }
    return cfg;
}

std::vector<HintRule> ConfigLoader::extract_hint_rules(const toml::table& root,
                                                       std::vector<std::string>& errors) {
    std::vector<HintRule> result;
    const auto* arr = root["hint_rules"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (size_t i = 0; i < arr->size(); ++i) {
        const auto* rule_tbl = (*arr)[i].as_table();
        if (!rule_tbl) {
            errors.push_back(std::format("hint_rules[{}] must be a table", i));
            continue;
        }
        const auto& r = *rule_tbl;

        HintRule rule;
        rule.hint = r["hint"].value_or(""s);
        rule.synonyms = toml_string_array(r, "synonyms");
        const auto target = r["target"].value_or("any"s);

        if (rule.hint.empty()) {
            errors.push_back(std::format("hint_rules[{}].hint must not be empty", i));
            continue;
        }
        if (rule.synonyms.empty()) {
            errors.push_back(std::format("hint_rules[{}].synonyms must not be empty", i));
            continue;
        }
        if (const auto parsed = parse_hint_target(target)) {
            rule.target = *parsed;
        } else {
            errors.push_back(std::format(
                "hint_rules[{}].target must be table, column or any, got '{}'", i, target));
            continue;
        }
        result.push_back(std::move(rule));
    }
    return result;
}

// ============================================================================
// Assembly / validation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::extract_and_validate(const toml::table& root) {
    AppConfig config;
    std::vector<std::string> errors;

    config.server = extract_server(root);
    config.logging = extract_logging(root);
    config.database = extract_database(root);
    config.cache = extract_cache(root);
    config.planner = extract_planner(root);
    config.documents = extract_documents(root);
    config.history = extract_history(root);
    config.hint_rules = extract_hint_rules(root, errors);

    const auto validation = validate_config(config);
    errors.insert(errors.end(), validation.begin(), validation.end());

    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return extract_and_validate(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return extract_and_validate(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

std::vector<std::string> ConfigLoader::validate_config(const AppConfig& config) {
    std::vector<std::string> errors;

    if (config.server.port == 0) {
        errors.push_back("server.port must be 1-65535");
    }
    if (config.server.threads == 0) {
        errors.push_back("server.threads must be > 0");
    }
    if (config.server.branch_workers == 0) {
        errors.push_back("server.branch_workers must be > 0");
    }
    if (config.server.max_pending_branches == 0) {
        errors.push_back("server.max_pending_branches must be > 0");
    }

    const auto level = utils::to_lower(config.logging.level);
    if (level != "debug" && level != "info" && level != "warn" && level != "warning" && level != "error") {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
            config.logging.level));
    }

    const auto& db = config.database;
    if (db.max_connections == 0) {
        errors.push_back("database.max_connections must be > 0");
    }
    if (db.min_connections > db.max_connections) {
        errors.push_back(std::format("database.min_connections ({}) > max_connections ({})",
            db.min_connections, db.max_connections));
    }
    if (db.query_timeout.count() <= 0) {
        errors.push_back("database.query_timeout_ms must be > 0");
    }
    if (db.acquire_timeout.count() <= 0) {
        errors.push_back("database.acquire_timeout_ms must be > 0");
    }

    if (config.cache.enabled) {
        if (config.cache.max_entries == 0) {
            errors.push_back("cache.max_entries must be > 0 when enabled");
        }
        if (config.cache.ttl.count() <= 0) {
            errors.push_back("cache.ttl_seconds must be > 0 when enabled");
        }
    }

    const auto& planner = config.planner;
    if (planner.max_page_size == 0) {
        errors.push_back("planner.max_page_size must be > 0");
    }
    if (planner.default_page_size == 0 || planner.default_page_size > planner.max_page_size) {
        errors.push_back(std::format("planner.default_page_size must be 1-{}", planner.max_page_size));
    }
    if (planner.match_threshold <= 0.0 || planner.match_threshold > 1.0) {
        errors.push_back("planner.match_threshold must be in (0, 1]");
    }
    if (planner.fuzzy_threshold <= 0.0 || planner.fuzzy_threshold > 1.0) {
        errors.push_back("planner.fuzzy_threshold must be in (0, 1]");
    }

    if (config.documents.enabled && config.documents.endpoint.empty()) {
        errors.push_back("documents.endpoint required when documents are enabled");
    }
    if (config.history.capacity == 0) {
        errors.push_back("history.capacity must be > 0");
    }

    return errors;
}

// ============================================================================
// Derived settings
// ============================================================================

HintRuleSet ConfigLoader::build_hint_rules(const AppConfig& config) {
    auto rules = HintRuleSet::defaults();
    for (const auto& rule : config.hint_rules) {
        rules.add_rule(rule);
    }
    rules.set_fuzzy_threshold(config.planner.fuzzy_threshold);
    return rules;
}

EngineConfig ConfigLoader::build_engine_config(const AppConfig& config) {
    EngineConfig engine;

    engine.discovery.sample_limit = config.database.sample_limit;
    engine.discovery.acquire_timeout = config.database.acquire_timeout;
    engine.discovery.pool.min_connections = config.database.min_connections;
    engine.discovery.pool.max_connections = config.database.max_connections;

    engine.planner.default_page_size = config.planner.default_page_size;
    engine.planner.max_page_size = config.planner.max_page_size;
    engine.match_threshold = config.planner.match_threshold;

    engine.cache.enabled = config.cache.enabled;
    engine.cache.max_entries = config.cache.max_entries;
    engine.cache.ttl = std::chrono::duration_cast<std::chrono::milliseconds>(config.cache.ttl);
    engine.cache.max_payload_bytes = config.cache.max_payload_bytes;

    engine.history_capacity = config.history.capacity;
    engine.query_timeout = config.database.query_timeout;
    engine.document_limit = config.documents.limit;
    engine.branch_workers = config.server.branch_workers;
    engine.max_pending_branches = config.server.max_pending_branches;
    return engine;
}

} // namespace nlquery
