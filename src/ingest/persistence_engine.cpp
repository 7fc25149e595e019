#include "../../include/ingest/persistence_engine.hpp"
#include "../../include/utils/logger.hpp"
#include <algorithm>
#include <exception>
#include <unordered_set>

namespace harvester {

size_t PersistResult::failedRecordCount() const {
    if (!backup_error.empty()) {
        return candidate_count;
    }
    size_t failed = 0;
    for (const auto& error : batch_errors) {
        failed += error.record_count;
    }
    return failed;
}

PersistenceEngine::PersistenceEngine(RecordStore& store, size_t batch_size)
    : store_(store), batch_size_(batch_size == 0 ? 1 : batch_size) {
}

PersistResult PersistenceEngine::persist(const std::vector<IdentityRecord>& identity_set) {
    PersistResult result;
    const std::vector<IdentityRecord> candidates = collapseByUserId(identity_set);
    result.candidate_count = candidates.size();
    if (candidates.empty()) {
        Logger::getInstance().info("No users to save");
        return result;
    }

    std::string snapshot_error;
    result.backup = store_.snapshot(snapshot_error);
    if (!result.backup) {
        result.backup_error = snapshot_error.empty() ? "snapshot failed" : snapshot_error;
        Logger::getInstance().error("Backup failed, skipping save of " + std::to_string(candidates.size()) +
                                    " users: " + result.backup_error);
        return result;
    }

    std::vector<int64_t> ids;
    ids.reserve(candidates.size());
    for (const auto& record : candidates) {
        ids.push_back(record.user_id);
    }

    std::unordered_set<int64_t> existing;
    if (!store_.existingIds(ids, existing)) {
        // Conflict-ignoring inserts still keep user_id unique
        existing.clear();
        Logger::getInstance().warning("Existing user lookup failed, inserting all " +
                                      std::to_string(candidates.size()) + " candidates");
    }

    std::vector<IdentityRecord> fresh;
    fresh.reserve(candidates.size() - std::min(existing.size(), candidates.size()));
    for (const auto& record : candidates) {
        if (existing.count(record.user_id)) {
            result.duplicate_count++;
        } else {
            fresh.push_back(record);
        }
    }

    if (fresh.empty()) {
        Logger::getInstance().info("All " + std::to_string(candidates.size()) + " users already stored");
        return result;
    }

    size_t batch_index = 0;
    for (size_t offset = 0; offset < fresh.size(); offset += batch_size_, batch_index++) {
        const size_t end = std::min(offset + batch_size_, fresh.size());
        std::vector<IdentityRecord> batch(fresh.begin() + offset, fresh.begin() + end);

        BatchInsertOutcome outcome;
        try {
            outcome = store_.insertBatch(batch);
        } catch (const std::exception& e) {
            result.writer_failed = true;
            result.batch_errors.push_back({batch_index, batch.size(), std::string("writer failed: ") + e.what()});
            Logger::getInstance().error("Writer failed in batch " + std::to_string(batch_index) + ": " + e.what() +
                                        ", remaining batches skipped");
            for (size_t rest = end; rest < fresh.size(); rest += batch_size_) {
                batch_index++;
                const size_t count = std::min(batch_size_, fresh.size() - rest);
                result.batch_errors.push_back({batch_index, count, "not attempted after writer failure"});
            }
            break;
        }
        if (!outcome.ok) {
            result.batch_errors.push_back({batch_index, batch.size(), outcome.error});
            Logger::getInstance().error("Batch " + std::to_string(batch_index) + " (" +
                                        std::to_string(batch.size()) + " users) failed: " + outcome.error);
            continue;
        }

        std::unordered_set<int64_t> written(outcome.inserted_ids.begin(), outcome.inserted_ids.end());
        for (auto& record : batch) {
            if (written.count(record.user_id)) {
                result.inserted_records.push_back(std::move(record));
            } else {
                result.duplicate_count++;
            }
        }
        result.inserted_count += written.size();
        Logger::getInstance().debug("Batch " + std::to_string(batch_index) + ": inserted " +
                                    std::to_string(written.size()) + " of " + std::to_string(end - offset));
    }

    Logger::getInstance().info("Inserted " + std::to_string(result.inserted_count) + " new users (" +
                               std::to_string(result.duplicate_count) + " already known, " +
                               std::to_string(result.failedRecordCount()) + " failed)");
    return result;
}

} // namespace harvester
