#pragma once

#include "config/config_types.hpp"
#include "engine/query_engine.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace nlquery {

/**
 * @brief TOML configuration loader
 *
 * `${VAR}` in any string value is replaced by the environment variable (empty
 * when unset). DATABASE_URL, when set, overrides
 * [database].connection_string. Validation problems are collected and
 * reported together.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        AppConfig config;

        static LoadResult ok(AppConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to TOML file
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    [[nodiscard]] static std::vector<std::string> validate_config(const AppConfig& config);

    /// Default hint rules plus the configured ones, with the configured fuzzy threshold
    [[nodiscard]] static HintRuleSet build_hint_rules(const AppConfig& config);

    /// Engine settings derived from the sections
    [[nodiscard]] static EngineConfig build_engine_config(const AppConfig& config);

private:
    static ServerConfig extract_server(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static DatabaseConfig extract_database(const toml::table& root);
    static CacheConfig extract_cache(const toml::table& root);
    static PlannerSection extract_planner(const toml::table& root);
    static DocumentsConfig extract_documents(const toml::table& root);
    static HistoryConfig extract_history(const toml::table& root);
    static std::vector<HintRule> extract_hint_rules(const toml::table& root,
                                                    std::vector<std::string>& errors);

    static LoadResult extract_and_validate(const toml::table& root);
};

} // namespace nlquery
