#pragma once

#include "db/idb_backend.hpp"
#include "core/database_type.hpp"
#include <memory>
#include <mutex>
#include <unordered_map>
#include <functional>

namespace nlquery {

/**
 * @brief Registry for database backends
 *
 * Compiled-in backends are added by register_builtin_backends(); the
 * engine queries it with the DatabaseType detected from a connection
 * descriptor.
 */
class BackendRegistry {
public:
    using Factory = std::function<std::unique_ptr<IDbBackend>()>;

    static BackendRegistry& instance() {
        static BackendRegistry registry;
        return registry;
    }

    void register_backend(DatabaseType type, Factory factory) {
        std::lock_guard lock(mutex_);
        factories_[type] = std::move(factory);
    }

    /// nullptr when no backend for the type was compiled in
    [[nodiscard]] std::unique_ptr<IDbBackend> create(DatabaseType type) const {
        std::lock_guard lock(mutex_);
        const auto it = factories_.find(type);
        if (it == factories_.end()) {
            return nullptr;
        }
        return it->second();
    }

    [[nodiscard]] bool has_backend(DatabaseType type) const {
        std::lock_guard lock(mutex_);
        return factories_.count(type) > 0;
    }

private:
    BackendRegistry() = default;

    struct DatabaseTypeHash {
        size_t operator()(DatabaseType t) const {
            return std::hash<int>()(static_cast<int>(t));
        }
    };

    mutable std::mutex mutex_;
    std::unordered_map<DatabaseType, Factory, DatabaseTypeHash> factories_;
};

/**
 * @brief Register every backend compiled into this build (idempotent)
 *
 * SQLite is always available; PostgreSQL and MySQL depend on the
 * NLQUERY_ENABLE_POSTGRESQL / NLQUERY_ENABLE_MYSQL build options.
 */
void register_builtin_backends();

} // namespace nlquery
