#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <string>

namespace docanon {

/**
 * @brief PostgreSQL connection implementing IDbConnection
 *
 * Wraps PGconn* and provides database-agnostic interface.
 * All libpq calls are encapsulated here.
 */
class PgConnection : public IDbConnection {
public:
    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    DbResultSet execute(const std::string& sql,
                        const std::vector<std::string>& params) override;
    bool is_connected() const override;
    DatabaseType database_type() const override { return DatabaseType::POSTGRESQL; }
    void close() override;

private:
    /**
     * @brief Convert a PGresult into a DbResultSet and free it
     */
    DbResultSet consume_result(PGresult* res);

    DbResultSet process_tuples_result(PGresult* res);
    DbResultSet process_command_result(PGresult* res);

    PGconn* conn_;
};

/**
 * @brief PostgreSQL connection factory
 *
 * Creates PgConnection instances using PQconnectdb.
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;
};

} // namespace docanon
