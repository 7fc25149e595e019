#ifndef HARVESTER_RECORD_STORE_HPP
#define HARVESTER_RECORD_STORE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include "../models/identity_record.hpp"

namespace harvester {

struct BackupSnapshot {
    std::string name;
    int64_t created_at = 0;     // epoch seconds
    int64_t row_count = 0;
};

struct BatchInsertOutcome {
    bool ok = false;
    std::vector<int64_t> inserted_ids;   // rows actually written; the rest hit a user_id conflict
    std::string error;
};

struct StoreStats {
    int64_t total_users = 0;
    int64_t with_username = 0;
    int64_t premium_users = 0;
    int64_t verified_users = 0;
    int64_t bot_accounts = 0;
    int64_t source_chats = 0;
    std::optional<int64_t> first_collected_at;
    std::optional<int64_t> last_collected_at;
};

enum class AddRecordResult {
    Added,
    AlreadyStored,
    Invalid,        // user_id is not a positive id
    Failed          // the insert transaction failed
};

/**
 * Identity record store.
 * Every operation is self-contained: implementations take whatever
 * connection or lock they need and release it before returning.
 */
class RecordStore {
public:
    virtual ~RecordStore() = default;

    // Fills `found` with the candidates already stored. False on lookup failure.
    virtual bool existingIds(const std::vector<int64_t>& candidates,
                             std::unordered_set<int64_t>& found) = 0;

    // One transaction; conflicting user_ids are skipped, not errors
    virtual BatchInsertOutcome insertBatch(const std::vector<IdentityRecord>& records) = 0;

    // Point-in-time copy of the record table. On failure returns nullopt and sets `error`.
    virtual std::optional<BackupSnapshot> snapshot(std::string& error) = 0;

    // nullopt when the user is not stored or the lookup failed
    virtual std::optional<IdentityRecord> findById(int64_t user_id) = 0;

    virtual std::optional<StoreStats> stats() = 0;
    virtual std::optional<int64_t> lastCollectedAt() = 0;

    // Manual single-user insert. Normalizes the username, stamps collected_at
    // when unset and goes through the conflict-ignoring batch insert.
    AddRecordResult addRecord(IdentityRecord record);
};

} // namespace harvester

#endif // HARVESTER_RECORD_STORE_HPP
