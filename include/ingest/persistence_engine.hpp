#ifndef HARVESTER_PERSISTENCE_ENGINE_HPP
#define HARVESTER_PERSISTENCE_ENGINE_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "../database/record_store.hpp"
#include "../models/identity_record.hpp"

namespace harvester {

struct BatchError {
    size_t batch_index = 0;
    size_t record_count = 0;
    std::string message;
};

struct PersistResult {
    size_t candidate_count = 0;     // after collapsing by user_id
    size_t inserted_count = 0;
    size_t duplicate_count = 0;
    std::vector<BatchError> batch_errors;
    std::optional<BackupSnapshot> backup;
    std::string backup_error;       // set when the snapshot failed and nothing was written
    std::vector<IdentityRecord> inserted_records;
    bool writer_failed = false;     // the store threw; the remaining batches were not attempted

    size_t failedRecordCount() const;
};

/**
 * Writes a collected identity set: backup, filter known users, then
 * insert the rest in fixed-size batches, one transaction per batch.
 * A failed batch is reported and skipped; committed batches stay.
 * If the store throws, writing stops: the crashed batch and every batch
 * after it are reported as errors and the committed part is returned.
 */
class PersistenceEngine {
public:
    explicit PersistenceEngine(RecordStore& store, size_t batch_size = 1000);

    PersistResult persist(const std::vector<IdentityRecord>& identity_set);

private:
    RecordStore& store_;
    size_t batch_size_;
};

} // namespace harvester

#endif // HARVESTER_PERSISTENCE_ENGINE_HPP
