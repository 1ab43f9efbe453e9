#pragma once

#include "db/iconnection_factory.hpp"
#include "core/database_type.hpp"
#include <memory>
#include <unordered_map>
#include <functional>
#include <stdexcept>
#include <format>

namespace docanon {

/**
 * @brief Registry for registry-storage backends
 *
 * Backends are registered once at startup by register_builtin_backends().
 * The registry is queried by DatabaseType to instantiate the right factory.
 *
 * Usage:
 *   register_builtin_backends();
 *   auto conn = BackendRegistry::instance().connect(DatabaseType::SQLITE, "db/entities.db");
 */
class BackendRegistry {
public:
    using Factory = std::function<std::unique_ptr<IConnectionFactory>()>;

    static BackendRegistry& instance() {
        static BackendRegistry registry;
        return registry;
    }

    void register_backend(DatabaseType type, Factory factory) {
        factories_[type] = std::move(factory);
    }

    [[nodiscard]] std::unique_ptr<IConnectionFactory> create(DatabaseType type) const {
        const auto it = factories_.find(type);
        if (it == factories_.end()) {
            throw std::runtime_error(std::format(
                "No backend registered for database type: {}",
                database_type_to_string(type)));
        }
        return it->second();
    }

    /**
     * @brief Create the factory for `type` and open one connection
     * @throws std::runtime_error if no backend is registered or the open fails
     */
    [[nodiscard]] std::unique_ptr<IDbConnection> connect(
        DatabaseType type, const std::string& connection_string) const {
        auto conn = create(type)->create(connection_string);
        if (!conn) {
            throw std::runtime_error(std::format(
                "Failed to open {} registry", database_type_to_string(type)));
        }
        return conn;
    }

    [[nodiscard]] bool has_backend(DatabaseType type) const {
        return factories_.count(type) > 0;
    }

private:
    BackendRegistry() = default;

    struct DatabaseTypeHash {
        size_t operator()(DatabaseType t) const {
            return std::hash<int>()(static_cast<int>(t));
        }
    };

    std::unordered_map<DatabaseType, Factory, DatabaseTypeHash> factories_;
};

/**
 * @brief Register every backend compiled into this build (idempotent)
 *
 * SQLite is always available; PostgreSQL only with DOCANON_ENABLE_POSTGRESQL.
 */
void register_builtin_backends();

} // namespace docanon
