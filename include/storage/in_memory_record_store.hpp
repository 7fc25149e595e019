#ifndef HARVESTER_IN_MEMORY_RECORD_STORE_HPP
#define HARVESTER_IN_MEMORY_RECORD_STORE_HPP

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "../database/record_store.hpp"

namespace harvester {

/**
 * In-Memory Record Store - drop-in replacement for PostgreSQL
 * Used for dry runs (HARVESTER_STORAGE=memory) and tests.
 * Batch faults are keyed by the zero-based insertBatch() call number.
 */
class InMemoryRecordStore : public RecordStore {
public:
    enum class Fault {
        ReportError,    // the batch transaction fails and is reported back
        Crash           // the writer dies mid-batch: insertBatch() throws
    };

    bool existingIds(const std::vector<int64_t>& candidates,
                     std::unordered_set<int64_t>& found) override;
    BatchInsertOutcome insertBatch(const std::vector<IdentityRecord>& records) override;
    std::optional<BackupSnapshot> snapshot(std::string& error) override;
    std::optional<IdentityRecord> findById(int64_t user_id) override;
    std::optional<StoreStats> stats() override;
    std::optional<int64_t> lastCollectedAt() override;

    // ========== TEST HOOKS ==========
    void seed(const std::vector<IdentityRecord>& records);
    void injectBatchFault(size_t call_index, Fault fault);
    void setSnapshotFailure(bool fail);
    void setLookupFailure(bool fail);

    bool contains(int64_t user_id) const;
    size_t size() const;
    std::vector<size_t> committedBatchSizes() const;
    std::vector<BackupSnapshot> snapshots() const;
    size_t snapshotRowCount(const std::string& name) const;

private:
    mutable std::mutex storage_mutex_;
    std::map<int64_t, IdentityRecord> records_;
    std::map<std::string, std::map<int64_t, IdentityRecord>> snapshot_tables_;
    std::vector<BackupSnapshot> snapshots_;
    std::map<size_t, Fault> batch_faults_;
    std::vector<size_t> committed_batches_;
    size_t insert_calls_ = 0;
    unsigned snapshot_seq_ = 0;
    bool fail_snapshot_ = false;
    bool fail_lookup_ = false;
};

} // namespace harvester

#endif // HARVESTER_IN_MEMORY_RECORD_STORE_HPP
