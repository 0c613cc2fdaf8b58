#pragma once

#include "catalog/hint_rules.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace nlquery {

// ============================================================================
// Section configs (mirror the TOML hierarchy)
// ============================================================================

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    size_t threads = 4;
    std::chrono::milliseconds request_timeout{30000};
    size_t max_query_length = 4096;
    size_t branch_workers = 8;              // threads running query branches
    size_t max_pending_branches = 64;
};

struct LoggingConfig {
    std::string level = "info";
};

struct DatabaseConfig {
    std::string connection_string;          // connect at startup when set
    size_t min_connections = 1;
    size_t max_connections = 10;
    std::chrono::milliseconds acquire_timeout{5000};
    std::chrono::milliseconds query_timeout{10000};
    size_t sample_limit = 20;
};

struct CacheConfig {
    bool enabled = true;
    size_t max_entries = 1000;
    std::chrono::seconds ttl{300};
    size_t max_payload_bytes = 1048576;
};

struct PlannerSection {
    size_t default_page_size = 50;
    size_t max_page_size = 200;
    double match_threshold = 0.8;
    double fuzzy_threshold = HintRuleSet::kDefaultFuzzyThreshold;
};

struct DocumentsConfig {
    bool enabled = false;
    std::string endpoint = "http://127.0.0.1:8001";
    std::string path = "/search";
    std::string api_key;
    size_t limit = 10;
};

struct HistoryConfig {
    size_t capacity = 50;
};

/**
 * @brief Whole-process configuration
 */
struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
    DatabaseConfig database;
    CacheConfig cache;
    PlannerSection planner;
    DocumentsConfig documents;
    HistoryConfig history;
    std::vector<HintRule> hint_rules;       // appended to the defaults
};

} // namespace nlquery
