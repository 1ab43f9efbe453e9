#pragma once

#include <string>
#include <string_view>
#include <stdexcept>
#include <algorithm>
#include <cctype>
#include <format>
#include <unordered_map>

namespace docanon {

namespace keys {
    inline constexpr std::string_view SQLITE = "sqlite";
    inline constexpr std::string_view SQLITE3 = "sqlite3";
    inline constexpr std::string_view POSTGRES = "postgres";
    inline constexpr std::string_view POSTGRESQL = "postgresql";
    inline constexpr std::string_view PG = "pg";
}

/**
 * @brief Registry storage backend
 *
 * SQLITE keeps the registry in a local file (the default); POSTGRESQL lets
 * several anonymizer processes share one registry.
 */
enum class DatabaseType {
    SQLITE,
    POSTGRESQL,
};

[[nodiscard]] inline std::string_view database_type_to_string(DatabaseType type) {
    switch (type) {
        case DatabaseType::SQLITE: return keys::SQLITE;
        case DatabaseType::POSTGRESQL: return keys::POSTGRESQL;
        default: return "unknown";
    }
}

[[nodiscard]] inline DatabaseType parse_database_type(std::string_view type_str) {
    static const std::unordered_map<std::string_view, DatabaseType> lookup = {
        {keys::SQLITE,     DatabaseType::SQLITE},
        {keys::SQLITE3,    DatabaseType::SQLITE},
        {keys::POSTGRESQL, DatabaseType::POSTGRESQL},
        {keys::POSTGRES,   DatabaseType::POSTGRESQL},
        {keys::PG,         DatabaseType::POSTGRESQL}
    };

    if (const auto it = lookup.find(type_str); it != lookup.end()) {
        return it->second;
    }

    // Case-insensitive fallback
    for (const auto& [key, value] : lookup) {
        if (key.size() == type_str.size()) {
            const bool match = std::equal(key.begin(), key.end(), type_str.begin(),
                [](char a, char b) {
                    return std::tolower(static_cast<unsigned char>(a)) ==
                           std::tolower(static_cast<unsigned char>(b));
                });
            if (match) return value;
        }
    }

    throw std::runtime_error(std::format("Unknown database type: {}", type_str));
}

/**
 * @brief Bound-parameter placeholder for the n-th (1-based) parameter
 */
[[nodiscard]] inline std::string sql_placeholder(DatabaseType type, size_t n) {
    if (type == DatabaseType::POSTGRESQL) {
        return std::format("${}", n);
    }
    return "?";
}

/**
 * @brief Statement that opens a registry write transaction
 *
 * SQLite takes the write lock at BEGIN, so reads inside the transaction see
 * the state the writes will apply to. A deferred BEGIN would fail with
 * SQLITE_BUSY when another writer commits between the read and the first
 * write.
 */
[[nodiscard]] inline std::string_view begin_write_sql(DatabaseType type) {
    if (type == DatabaseType::SQLITE) {
        return "BEGIN IMMEDIATE";
    }
    return "BEGIN";
}

} // namespace docanon
