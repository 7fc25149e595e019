#include "../../include/storage/in_memory_record_store.hpp"
#include "../../include/utils/calendar.hpp"
#include "../../include/utils/logger.hpp"
#include <set>
#include <stdexcept>

namespace harvester {

bool InMemoryRecordStore::existingIds(const std::vector<int64_t>& candidates,
                                      std::unordered_set<int64_t>& found) {
    std::lock_guard<std::mutex> lock(storage_mutex_);
    if (fail_lookup_) {
        return false;
    }
    for (int64_t id : candidates) {
        if (records_.count(id)) {
            found.insert(id);
        }
    }
    return true;
}

BatchInsertOutcome InMemoryRecordStore::insertBatch(const std::vector<IdentityRecord>& records) {
    std::lock_guard<std::mutex> lock(storage_mutex_);
    BatchInsertOutcome outcome;
    const size_t call = insert_calls_++;

    auto fault = batch_faults_.find(call);
    if (fault != batch_faults_.end()) {
        if (fault->second == Fault::Crash) {
            throw std::runtime_error("writer terminated during batch " + std::to_string(call));
        }
        outcome.error = "injected failure for batch " + std::to_string(call);
        return outcome;
    }

    for (const auto& record : records) {
        if (records_.emplace(record.user_id, record).second) {
            outcome.inserted_ids.push_back(record.user_id);
        }
    }
    committed_batches_.push_back(records.size());
    outcome.ok = true;
    return outcome;
}

std::optional<BackupSnapshot> InMemoryRecordStore::snapshot(std::string& error) {
    std::lock_guard<std::mutex> lock(storage_mutex_);
    if (fail_snapshot_) {
        error = "injected snapshot failure";
        return std::nullopt;
    }

    BackupSnapshot backup;
    backup.created_at = calendar::nowEpochSeconds();
    backup.name = "identity_records_backup_" + std::to_string(backup.created_at) + "_" +
                  std::to_string(snapshot_seq_++);
    backup.row_count = static_cast<int64_t>(records_.size());
    snapshot_tables_[backup.name] = records_;
    snapshots_.push_back(backup);

    Logger::getInstance().info("Created backup: " + backup.name);
    return backup;
}

std::optional<StoreStats> InMemoryRecordStore::stats() {
    std::lock_guard<std::mutex> lock(storage_mutex_);
    StoreStats stats;
    std::set<int64_t> chats;
    for (const auto& entry : records_) {
        const IdentityRecord& record = entry.second;
        stats.total_users++;
        if (record.username) stats.with_username++;
        if (record.is_premium) stats.premium_users++;
        if (record.is_verified) stats.verified_users++;
        if (record.is_bot) stats.bot_accounts++;
        chats.insert(record.source_chat_id);
        if (!stats.first_collected_at || record.collected_at < *stats.first_collected_at) {
            stats.first_collected_at = record.collected_at;
        }
        if (!stats.last_collected_at || record.collected_at > *stats.last_collected_at) {
            stats.last_collected_at = record.collected_at;
        }
    }
    stats.source_chats = static_cast<int64_t>(chats.size());
    return stats;
}

std::optional<int64_t> InMemoryRecordStore::lastCollectedAt() {
    auto current = stats();
    return current ? current->last_collected_at : std::nullopt;
}

// ========== TEST HOOKS ==========

std::optional<IdentityRecord> InMemoryRecordStore::findById(int64_t user_id) {
    std::lock_guard<std::mutex> lock(storage_mutex_);
    if (fail_lookup_) {
        return std::nullopt;
    }
    auto it = records_.find(user_id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryRecordStore::seed(const std::vector<IdentityRecord>& records) {
    std::lock_guard<std::mutex> lock(storage_mutex_);
    for (const auto& record : records) {
        records_.emplace(record.user_id, record);
    }
}

void InMemoryRecordStore::injectBatchFault(size_t call_index, Fault fault) {
    std::lock_guard<std::mutex> lock(storage_mutex_);
    batch_faults_[call_index] = fault;
}

void InMemoryRecordStore::setSnapshotFailure(bool fail) {
    std::lock_guard<std::mutex> lock(storage_mutex_);
    fail_snapshot_ = fail;
}

void InMemoryRecordStore::setLookupFailure(bool fail) {
    std::lock_guard<std::mutex> lock(storage_mutex_);
    fail_lookup_ = fail;
}

bool InMemoryRecordStore::contains(int64_t user_id) const {
    std::lock_guard<std::mutex> lock(storage_mutex_);
    return records_.count(user_id) > 0;
}

size_t InMemoryRecordStore::size() const {
    std::lock_guard<std::mutex> lock(storage_mutex_);
    return records_.size();
}

std::vector<size_t> InMemoryRecordStore::committedBatchSizes() const {
    std::lock_guard<std::mutex> lock(storage_mutex_);
    return committed_batches_;
}

std::vector<BackupSnapshot> InMemoryRecordStore::snapshots() const {
    std::lock_guard<std::mutex> lock(storage_mutex_);
    return snapshots_;
}

size_t InMemoryRecordStore::snapshotRowCount(const std::string& name) const {
    std::lock_guard<std::mutex> lock(storage_mutex_);
    auto it = snapshot_tables_.find(name);
    return it == snapshot_tables_.end() ? 0 : it->second.size();
}

} // namespace harvester
