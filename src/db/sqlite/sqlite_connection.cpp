#include "db/sqlite/sqlite_connection.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>

namespace docanon {

// ============================================================================
// SqliteConnection
// ============================================================================

SqliteConnection::SqliteConnection(sqlite3* db)
    : db_(db) {}

SqliteConnection::~SqliteConnection() {
    close();
}

DbResultSet SqliteConnection::execute(const std::string& sql) {
    return execute(sql, {});
}

DbResultSet SqliteConnection::execute(const std::string& sql,
                                      const std::vector<std::string>& params) {
    if (!db_) {
        return {false, "Connection is null", {}, {}, 0, false};
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()),
                           &stmt, nullptr) != SQLITE_OK) {
        return error_result("prepare");
    }

    for (size_t i = 0; i < params.size(); ++i) {
        const int rc = sqlite3_bind_text(stmt, static_cast<int>(i + 1),
            params[i].data(), static_cast<int>(params[i].size()), SQLITE_TRANSIENT);
        if (rc != SQLITE_OK) {
            auto result = error_result(std::format("bind parameter {}", i + 1));
            sqlite3_finalize(stmt);
            return result;
        }
    }

    DbResultSet result;
    const int ncols = sqlite3_column_count(stmt);
    result.has_rows = ncols > 0;
    for (int i = 0; i < ncols; ++i) {
        const char* name = sqlite3_column_name(stmt, i);
        result.column_names.emplace_back(name ? name : "");
    }

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        std::vector<std::string> row;
        row.reserve(static_cast<size_t>(ncols));
        for (int j = 0; j < ncols; ++j) {
            const auto* text = sqlite3_column_text(stmt, j);
            const int len = sqlite3_column_bytes(stmt, j);
            if (text) {
                row.emplace_back(reinterpret_cast<const char*>(text), static_cast<size_t>(len));
            } else {
                row.emplace_back();
            }
        }
        result.rows.push_back(std::move(row));
    }

    if (rc != SQLITE_DONE) {
        auto failed = error_result("step");
        sqlite3_finalize(stmt);
        return failed;
    }

    result.success = true;
    if (!result.has_rows) {
        result.affected_rows = static_cast<uint64_t>(sqlite3_changes(db_));
    }
    sqlite3_finalize(stmt);
    return result;
}

bool SqliteConnection::is_connected() const {
    return db_ != nullptr;
}

void SqliteConnection::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

DbResultSet SqliteConnection::error_result(const std::string& context) const {
    DbResultSet result;
    result.success = false;
    result.error_message = std::format("sqlite {}: {}", context, sqlite3_errmsg(db_));
    return result;
}

// ============================================================================
// SqliteConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> SqliteConnectionFactory::create(
    const std::string& connection_string) {

    const bool in_memory = connection_string == ":memory:";
    if (!in_memory) {
        const auto parent = std::filesystem::path(connection_string).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                utils::log::error(std::format("Failed to create registry directory '{}': {}",
                    parent.string(), ec.message()));
                return nullptr;
            }
        }
    }

    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(connection_string.c_str(), &db,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);

    if (rc != SQLITE_OK) {
        utils::log::error(std::format("Failed to open sqlite registry '{}': {}",
            connection_string, db ? sqlite3_errmsg(db) : sqlite3_errstr(rc)));
        if (db) sqlite3_close_v2(db);
        return nullptr;
    }

    sqlite3_busy_timeout(db, kBusyTimeoutMs);

    auto conn = std::make_unique<SqliteConnection>(db);
    if (!in_memory) {
        const auto wal = conn->execute("PRAGMA journal_mode=WAL");
        if (!wal.success) {
            utils::log::warn(std::format("Could not enable WAL on '{}': {}",
                connection_string, wal.error_message));
        }
    }
    return conn;
}

} // namespace docanon
