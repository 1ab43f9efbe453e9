#include "registry/entity_registry.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <unordered_set>

namespace docanon {

namespace {

constexpr const char* kSqliteSchema =
    "CREATE TABLE IF NOT EXISTS entities ("
    "id INTEGER PRIMARY KEY AUTOINCREMENT, "
    "entity_type TEXT NOT NULL, "
    "original_name TEXT NOT NULL, "
    "slug_name TEXT NOT NULL, "
    "full_hash TEXT NOT NULL UNIQUE, "
    "first_seen TEXT NOT NULL, "
    "last_seen TEXT NOT NULL)";

constexpr const char* kPostgresSchema =
    "CREATE TABLE IF NOT EXISTS entities ("
    "id BIGSERIAL PRIMARY KEY, "
    "entity_type TEXT NOT NULL, "
    "original_name TEXT NOT NULL, "
    "slug_name TEXT NOT NULL, "
    "full_hash TEXT NOT NULL UNIQUE, "
    "first_seen TEXT NOT NULL, "
    "last_seen TEXT NOT NULL)";

constexpr const char* kFullHashIndex =
    "CREATE INDEX IF NOT EXISTS idx_full_hash ON entities(full_hash)";

constexpr const char* kSlugNameIndex =
    "CREATE INDEX IF NOT EXISTS idx_slug_name ON entities(slug_name)";

constexpr const char* kRecordColumns =
    "entity_type, original_name, slug_name, full_hash, first_seen, last_seen";

constexpr size_t kInsertColumns = 6;

EntityRecord to_record(const std::vector<std::string>& row) {
    EntityRecord rec;
    rec.entity_type = row.at(0);
    rec.original_text = row.at(1);
    rec.display_hash = row.at(2);
    rec.full_hash = row.at(3);
    rec.first_seen = row.at(4);
    rec.last_seen = row.at(5);
    return rec;
}

} // anonymous namespace

// ============================================================================
// Transaction
// ============================================================================

EntityRegistry::Transaction::Transaction(IDbConnection& conn)
    : conn_(conn) {
    const std::string begin(begin_write_sql(conn_.database_type()));
    const auto res = conn_.execute(begin);
    if (!res.success) {
        throw RegistryError(std::format("{} failed: {}", begin, res.error_message));
    }
}

EntityRegistry::Transaction::~Transaction() {
    if (done_) return;
    const auto res = conn_.execute("ROLLBACK");
    if (!res.success) {
        utils::log::error(std::format("Registry ROLLBACK failed: {}", res.error_message));
    }
}

void EntityRegistry::Transaction::commit() {
    const auto res = conn_.execute("COMMIT");
    if (!res.success) {
        throw RegistryError(std::format("COMMIT failed: {}", res.error_message));
    }
    done_ = true;
}

// ============================================================================
// EntityRegistry
// ============================================================================

EntityRegistry::EntityRegistry(std::unique_ptr<IDbConnection> conn)
    : conn_(std::move(conn)) {
    if (!conn_) {
        throw std::invalid_argument("EntityRegistry requires a connection");
    }
}

DbResultSet EntityRegistry::run(const std::string& sql, const std::vector<std::string>& params) {
    auto res = conn_->execute(sql, params);
    if (!res.success) {
        throw RegistryError(std::format("Registry statement failed: {} ({})",
            res.error_message, sql.substr(0, 120)));
    }
    return res;
}

std::string EntityRegistry::placeholders(size_t first_index, size_t count) const {
    std::string out;
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) out += ", ";
        out += sql_placeholder(conn_->database_type(), first_index + i);
    }
    return out;
}

void EntityRegistry::initialize() {
    run(conn_->database_type() == DatabaseType::POSTGRESQL ? kPostgresSchema : kSqliteSchema);
    run(kFullHashIndex);
    run(kSlugNameIndex);
    utils::log::debug(std::format("Entity registry ready ({})",
        database_type_to_string(conn_->database_type())));
}

UpsertStats EntityRegistry::bulk_upsert(const std::vector<CollectedEntity>& records) {
    UpsertStats stats;
    if (records.empty()) return stats;

    // 1. In-batch dedup, first occurrence wins
    std::vector<const CollectedEntity*> unique;
    unique.reserve(records.size());
    {
        std::unordered_set<std::string> seen;
        for (const auto& rec : records) {
            if (seen.insert(rec.full_hash).second) {
                unique.push_back(&rec);
            }
        }
    }
    stats.unique_in_batch = unique.size();

    const std::string now = utils::format_timestamp(utils::now());

    Transaction txn(*conn_);

    // 2. Partition into stored / new (chunked only to respect parameter limits)
    std::unordered_set<std::string> stored;
    for (size_t offset = 0; offset < unique.size(); offset += kMaxParamsPerStatement) {
        const size_t n = std::min(kMaxParamsPerStatement, unique.size() - offset);
        std::vector<std::string> params;
        params.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            params.push_back(unique[offset + i]->full_hash);
        }
        const auto res = run(std::format(
            "SELECT full_hash FROM entities WHERE full_hash IN ({})",
            placeholders(1, n)), params);
        for (const auto& row : res.rows) {
            if (!row.empty()) stored.insert(row[0]);
        }
    }

    std::vector<const CollectedEntity*> fresh;
    std::vector<std::string> existing;
    for (const auto* rec : unique) {
        if (stored.count(rec->full_hash)) {
            existing.push_back(rec->full_hash);
        } else {
            fresh.push_back(rec);
        }
    }

    // 3. Insert-if-absent for new hashes; a concurrent writer may win the race
    const size_t rows_per_insert = kMaxParamsPerStatement / kInsertColumns;
    for (size_t offset = 0; offset < fresh.size(); offset += rows_per_insert) {
        const size_t n = std::min(rows_per_insert, fresh.size() - offset);
        std::string values;
        std::vector<std::string> params;
        params.reserve(n * kInsertColumns);
        for (size_t i = 0; i < n; ++i) {
            const auto* rec = fresh[offset + i];
            if (i > 0) values += ", ";
            values += std::format("({})", placeholders(params.size() + 1, kInsertColumns));
            params.push_back(rec->entity_type);
            params.push_back(rec->original_text);
            params.push_back(rec->display_hash);
            params.push_back(rec->full_hash);
            params.push_back(now);
            params.push_back(now);
        }
        const auto res = run(std::format(
            "INSERT INTO entities ({}) VALUES {} ON CONFLICT (full_hash) DO NOTHING",
            kRecordColumns, values), params);
        stats.inserted += static_cast<size_t>(res.affected_rows);
    }

    // 4. Advance last_seen for stored hashes
    const size_t hashes_per_update = kMaxParamsPerStatement - 1;
    for (size_t offset = 0; offset < existing.size(); offset += hashes_per_update) {
        const size_t n = std::min(hashes_per_update, existing.size() - offset);
        std::vector<std::string> params;
        params.reserve(n + 1);
        params.push_back(now);
        for (size_t i = 0; i < n; ++i) {
            params.push_back(existing[offset + i]);
        }
        const auto res = run(std::format(
            "UPDATE entities SET last_seen = {} WHERE full_hash IN ({})",
            sql_placeholder(conn_->database_type(), 1), placeholders(2, n)), params);
        stats.touched += static_cast<size_t>(res.affected_rows);
    }

    txn.commit();

    utils::log::debug(std::format("Registry upsert: {} unique, {} inserted, {} refreshed",
        stats.unique_in_batch, stats.inserted, stats.touched));
    return stats;
}

std::optional<EntityRecord> EntityRegistry::find_one(const std::string& column,
                                                     const std::string& value) {
    const auto res = run(std::format(
        "SELECT {} FROM entities WHERE {} = {} ORDER BY id LIMIT 1",
        kRecordColumns, column, sql_placeholder(conn_->database_type(), 1)), {value});
    if (res.rows.empty()) return std::nullopt;
    return to_record(res.rows.front());
}

std::optional<EntityRecord> EntityRegistry::find_by_display_hash(const std::string& display_hash) {
    return find_one("slug_name", display_hash);
}

std::optional<EntityRecord> EntityRegistry::find_by_full_hash(const std::string& full_hash) {
    return find_one("full_hash", full_hash);
}

uint64_t EntityRegistry::count() {
    const auto res = run("SELECT COUNT(*) FROM entities");
    if (res.rows.empty() || res.rows.front().empty()) return 0;
    return utils::try_parse_int<uint64_t>(res.rows.front().front()).value_or(0);
}

} // namespace docanon
