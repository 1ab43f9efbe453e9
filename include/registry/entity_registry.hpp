#pragma once

#include "core/types.hpp"
#include "db/idb_connection.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace docanon {

/**
 * @brief Outcome of one bulk_upsert call
 */
struct UpsertStats {
    size_t unique_in_batch = 0;   // after in-batch dedup by full_hash
    size_t inserted = 0;          // rows newly created
    size_t touched = 0;           // pre-existing rows whose last_seen advanced
};

/**
 * @brief Content-addressed store of (entity, token) mappings
 *
 * Table layout (shared by every backend):
 *   entities(id, entity_type, original_name, slug_name,
 *            full_hash UNIQUE, first_seen, last_seen)
 *
 * full_hash is the identity. original_name and slug_name are fixed by the
 * first insert; later sightings only advance last_seen. Rows are never
 * deleted.
 *
 * Not thread-safe: one registry per connection, one caller at a time.
 * Concurrent processes sharing the same store rely on insert-if-absent.
 */
class EntityRegistry {
public:
    /// Upper bound on bound parameters per statement (SQLite's historical 999 limit, with headroom)
    static constexpr size_t kMaxParamsPerStatement = 900;

    explicit EntityRegistry(std::unique_ptr<IDbConnection> conn);

    /**
     * @brief Create the table and indexes if missing (idempotent)
     * @throws RegistryError
     */
    void initialize();

    /**
     * @brief Insert unseen entities and refresh last_seen of seen ones
     *
     * Runs in a single transaction: in-batch dedup (first occurrence wins),
     * one set-membership query over the batch's hashes, a batched
     * insert-if-absent for new hashes, a batched last_seen update for stored
     * ones. An empty batch performs no statements.
     *
     * @throws RegistryError (the transaction is rolled back)
     */
    UpsertStats bulk_upsert(const std::vector<CollectedEntity>& records);

    /**
     * @brief Exact match on the stored display hash
     * @return first matching record, or nullopt
     */
    [[nodiscard]] std::optional<EntityRecord> find_by_display_hash(const std::string& display_hash);

    [[nodiscard]] std::optional<EntityRecord> find_by_full_hash(const std::string& full_hash);

    [[nodiscard]] uint64_t count();

    [[nodiscard]] DatabaseType database_type() const { return conn_->database_type(); }

private:
    /**
     * @brief RAII write transaction: begin_write_sql() on construction, ROLLBACK unless committed
     */
    class Transaction {
    public:
        explicit Transaction(IDbConnection& conn);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();

    private:
        IDbConnection& conn_;
        bool done_ = false;
    };

    DbResultSet run(const std::string& sql, const std::vector<std::string>& params = {});

    std::string placeholders(size_t first_index, size_t count) const;

    std::optional<EntityRecord> find_one(const std::string& column, const std::string& value);

    std::unique_ptr<IDbConnection> conn_;
};

} // namespace docanon
