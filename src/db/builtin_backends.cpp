#include "db/backend_registry.hpp"
#include "db/sqlite/sqlite_backend.hpp"
#ifdef NLQUERY_HAS_POSTGRESQL
#include "db/postgresql/pg_backend.hpp"
#endif
#ifdef NLQUERY_HAS_MYSQL
#include "db/mysql/mysql_backend.hpp"
#endif

namespace nlquery {

void register_builtin_backends() {
    static std::once_flag once;
    std::call_once(once, [] {
        auto& registry = BackendRegistry::instance();
        registry.register_backend(DatabaseType::SQLITE,
            [] { return std::make_unique<SqliteBackend>(); });
#ifdef NLQUERY_HAS_POSTGRESQL
        registry.register_backend(DatabaseType::POSTGRESQL,
            [] { return std::make_unique<PgBackend>(); });
#endif
#ifdef NLQUERY_HAS_MYSQL
        registry.register_backend(DatabaseType::MYSQL,
            [] { return std::make_unique<MysqlBackend>(); });
#endif
    });
}

} // namespace nlquery
