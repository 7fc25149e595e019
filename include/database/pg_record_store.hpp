#ifndef HARVESTER_PG_RECORD_STORE_HPP
#define HARVESTER_PG_RECORD_STORE_HPP

#include <atomic>
#include "connection_pool.hpp"
#include "record_store.hpp"

namespace harvester {

class PgRecordStore : public RecordStore {
public:
    static constexpr size_t kLookupChunkSize = 5000;
    static constexpr const char* kSchemaVersion = "1";

    explicit PgRecordStore(ConnectionPool& pool);

    // Creates tables and indexes if missing and rewrites legacy usernames
    bool initialize();

    bool existingIds(const std::vector<int64_t>& candidates,
                     std::unordered_set<int64_t>& found) override;
    BatchInsertOutcome insertBatch(const std::vector<IdentityRecord>& records) override;
    std::optional<BackupSnapshot> snapshot(std::string& error) override;
    std::optional<IdentityRecord> findById(int64_t user_id) override;
    std::optional<StoreStats> stats() override;
    std::optional<int64_t> lastCollectedAt() override;

private:
    bool ensurePrepared(DatabaseConnection& conn);
    std::string nextSnapshotName();

    ConnectionPool& pool_;
    std::atomic<unsigned> snapshot_seq_{0};
};

} // namespace harvester

#endif // HARVESTER_PG_RECORD_STORE_HPP
