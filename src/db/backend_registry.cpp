#include "db/backend_registry.hpp"
#include "db/sqlite/sqlite_connection.hpp"

#ifdef DOCANON_ENABLE_POSTGRESQL
#include "db/postgresql/pg_connection.hpp"
#endif

namespace docanon {

void register_builtin_backends() {
    auto& registry = BackendRegistry::instance();

    registry.register_backend(DatabaseType::SQLITE,
        [] { return std::make_unique<SqliteConnectionFactory>(); });

    #ifdef DOCANON_ENABLE_POSTGRESQL
    registry.register_backend(DatabaseType::POSTGRESQL,
        [] { return std::make_unique<PgConnectionFactory>(); });
    #endif
}

} // namespace docanon
