#include "../../include/database/record_store.hpp"
#include "../../include/utils/calendar.hpp"
#include "../../include/utils/logger.hpp"

namespace harvester {

AddRecordResult RecordStore::addRecord(IdentityRecord record) {
    if (record.user_id <= 0) {
        Logger::getInstance().warning("Rejected user with invalid ID " + std::to_string(record.user_id));
        return AddRecordResult::Invalid;
    }

    record.username = normalizeUsername(record.username);
    if (record.collected_at <= 0) {
        record.collected_at = calendar::nowEpochSeconds();
    }

    const BatchInsertOutcome outcome = insertBatch({record});
    if (!outcome.ok) {
        Logger::getInstance().error("Error adding user " + std::to_string(record.user_id) + ": " + outcome.error);
        return AddRecordResult::Failed;
    }
    if (outcome.inserted_ids.empty()) {
        Logger::getInstance().info("User " + std::to_string(record.user_id) + " already in database");
        return AddRecordResult::AlreadyStored;
    }

    Logger::getInstance().info("Added user " + std::to_string(record.user_id) + " to database");
    return AddRecordResult::Added;
}

} // namespace harvester
