#pragma once

#include "core/database_type.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <memory>

namespace docanon {

/**
 * @brief Result set from a statement execution
 *
 * Returned by IDbConnection::execute(). Owns the result data (copied out of
 * the native result handle). NULL values are returned as empty strings.
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;

    // For SELECT
    std::vector<std::string> column_names;
    std::vector<std::vector<std::string>> rows;

    // For DML
    uint64_t affected_rows = 0;

    // SELECT vs DML/DDL
    bool has_rows = false;
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (sqlite3*, PGconn*).
 * Implementations are not thread-safe; each registry owns its own connection.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a single SQL statement without parameters
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql) = 0;

    /**
     * @brief Execute a single SQL statement with text parameters
     * @param sql SQL text using the dialect's placeholders (see sql_placeholder)
     * @param params Values bound in order
     */
    [[nodiscard]] virtual DbResultSet execute(
        const std::string& sql,
        const std::vector<std::string>& params) = 0;

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief SQL dialect spoken by this connection
     */
    [[nodiscard]] virtual DatabaseType database_type() const = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace docanon
