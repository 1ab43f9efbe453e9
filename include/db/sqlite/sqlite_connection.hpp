#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <sqlite3.h>
#include <string>

namespace docanon {

/**
 * @brief SQLite connection implementing IDbConnection
 *
 * Wraps sqlite3* and provides the same interface as the PostgreSQL backend.
 * All sqlite3 calls are encapsulated here.
 */
class SqliteConnection : public IDbConnection {
public:
    /**
     * @brief Construct from an open sqlite3* (takes ownership)
     */
    explicit SqliteConnection(sqlite3* db);

    ~SqliteConnection() override;

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    DbResultSet execute(const std::string& sql,
                        const std::vector<std::string>& params) override;
    bool is_connected() const override;
    DatabaseType database_type() const override { return DatabaseType::SQLITE; }
    void close() override;

private:
    DbResultSet error_result(const std::string& context) const;

    sqlite3* db_;
};

/**
 * @brief SQLite connection factory
 *
 * The connection string is a file path (parent directories are created) or
 * ":memory:". File databases are switched to WAL journaling so a reader and
 * a writer can share the registry.
 */
class SqliteConnectionFactory : public IConnectionFactory {
public:
    static constexpr int kBusyTimeoutMs = 5000;

    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;
};

} // namespace docanon
