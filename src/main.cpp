#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "db/backend_registry.hpp"
#include "engine/query_engine.hpp"
#include "search/http_document_search.hpp"
#include "server/http_server.hpp"

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <format>

using namespace nlquery;

// Global instance for signal handling
std::shared_ptr<HttpServer> g_server;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));
    if (g_server) {
        g_server->stop();
    }
}

int main(int argc, char* argv[]) {
    try {
        register_builtin_backends();

        utils::log::info("nlquery service starting...");

        // Setup signal handlers
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // Configuration
        std::string config_file = "config/nlquery.toml";
        const bool explicit_config = argc > 1;
        if (explicit_config) {
            config_file = argv[1];
        }

        AppConfig config;
        if (explicit_config || std::filesystem::exists(config_file)) {
            utils::log::info(std::format("[1/4] Loading configuration from {}", config_file));
            auto config_result = ConfigLoader::load_from_file(config_file);
            if (!config_result.success) {
                utils::log::error(config_result.error_message);
                return 1;
            }
            config = std::move(config_result.config);
        } else {
            utils::log::warn(std::format("[1/4] {} not found, using defaults", config_file));
            auto defaults = ConfigLoader::load_from_string("");
            if (!defaults.success) {
                utils::log::error(defaults.error_message);
                return 1;
            }
            config = std::move(defaults.config);
        }
        utils::log::set_level(config.logging.level);

        // Document search collaborator
        std::shared_ptr<IDocumentSearch> document_search;
        if (config.documents.enabled) {
            document_search = std::make_shared<HttpDocumentSearch>(HttpDocumentSearch::Config{
                .endpoint = config.documents.endpoint,
                .path = config.documents.path,
                .api_key = config.documents.api_key,
            });
            utils::log::info(std::format("[2/4] Document search: {}{}",
                config.documents.endpoint, config.documents.path));
        } else {
            utils::log::info("[2/4] Document search: disabled");
        }

        auto engine = std::make_shared<QueryEngine>(
            ConfigLoader::build_engine_config(config),
            ConfigLoader::build_hint_rules(config),
            std::move(document_search));

        // Optional startup connection
        if (!config.database.connection_string.empty()) {
            auto catalog = engine->discover_schema(config.database.connection_string);
            if (catalog.is_ok()) {
                utils::log::info(std::format("[3/4] Connected: {} tables discovered",
                    catalog.value()->tables().size()));
            } else {
                utils::log::warn(std::format("[3/4] Startup connection failed ({}); waiting for {}",
                    catalog.error_message(), "POST /api/connect"));
            }
        } else {
            utils::log::info("[3/4] No database configured; waiting for POST /api/connect");
        }

        g_server = std::make_shared<HttpServer>(engine, config.server);
        utils::log::info(std::format("[4/4] Server ready on http://{}:{}",
            config.server.host, config.server.port));

        // Start HTTP server (blocking)
        g_server->start();

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
