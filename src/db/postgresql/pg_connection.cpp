#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"
#include <cstring>
#include <format>

namespace docanon {

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql) {
    if (!conn_) {
        return {false, "Connection is null", {}, {}, 0, false};
    }
    return consume_result(PQexec(conn_, sql.c_str()));
}

DbResultSet PgConnection::execute(const std::string& sql,
                                  const std::vector<std::string>& params) {
    if (!conn_) {
        return {false, "Connection is null", {}, {}, 0, false};
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p.c_str());
    }

    // Text-format parameters, server infers types
    PGresult* res = PQexecParams(conn_, sql.c_str(),
        static_cast<int>(values.size()), nullptr,
        values.empty() ? nullptr : values.data(),
        nullptr, nullptr, 0);
    return consume_result(res);
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::consume_result(PGresult* res) {
    if (!res) {
        return {false, PQerrorMessage(conn_), {}, {}, 0, false};
    }

    const ExecStatusType status = PQresultStatus(res);

    if (status == PGRES_TUPLES_OK) {
        auto result = process_tuples_result(res);
        PQclear(res);
        return result;
    }

    if (status == PGRES_COMMAND_OK) {
        auto result = process_command_result(res);
        PQclear(res);
        return result;
    }

    std::string error = PQerrorMessage(conn_);
    PQclear(res);
    return {false, error, {}, {}, 0, false};
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const int ncols = PQnfields(res);
    for (int i = 0; i < ncols; i++) {
        result.column_names.push_back(PQfname(res, i));
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(static_cast<size_t>(nrows));

    for (int i = 0; i < nrows; i++) {
        std::vector<std::string> row;
        row.reserve(static_cast<size_t>(ncols));
        for (int j = 0; j < ncols; j++) {
            if (PQgetisnull(res, i, j)) {
                row.emplace_back();
                continue;
            }
            row.emplace_back(PQgetvalue(res, i, j),
                             static_cast<size_t>(PQgetlength(res, i, j)));
        }
        result.rows.push_back(std::move(row));
    }

    return result;
}

DbResultSet PgConnection::process_command_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = false;

    const char* affected = PQcmdTuples(res);
    if (affected && std::strlen(affected) > 0) {
        result.affected_rows = std::stoull(affected);
    }

    return result;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> PgConnectionFactory::create(
    const std::string& connection_string) {

    PGconn* conn = PQconnectdb(connection_string.c_str());

    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        utils::log::error(std::format("Failed to connect to registry: {}", PQerrorMessage(conn)));
        PQfinish(conn);
        return nullptr;
    }

    return std::make_unique<PgConnection>(conn);
}

} // namespace docanon
