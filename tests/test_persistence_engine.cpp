#include <gtest/gtest.h>
#include <set>
#include "ingest/persistence_engine.hpp"
#include "storage/in_memory_record_store.hpp"

using namespace harvester;

namespace {

std::vector<IdentityRecord> makeRecords(int64_t first_id, size_t count) {
    std::vector<IdentityRecord> records;
    records.reserve(count);
    for (size_t i = 0; i < count; i++) {
        IdentityRecord record;
        record.user_id = first_id + static_cast<int64_t>(i);
        record.username = "@user" + std::to_string(record.user_id);
        record.collected_at = 1710460800 + static_cast<int64_t>(i);
        record.source_chat_id = -1001;
        record.source_chat_title = "source";
        record.collected_by = "+15550001";
        records.push_back(record);
    }
    return records;
}

size_t accounted(const PersistResult& result) {
    return result.inserted_count + result.duplicate_count + result.failedRecordCount();
}

} // namespace

TEST(PersistenceEngineTest, SecondPersistOfSameSetIsAllDuplicates) {
    InMemoryRecordStore store;
    PersistenceEngine engine(store);
    auto records = makeRecords(1, 40);

    auto first = engine.persist(records);
    EXPECT_EQ(first.inserted_count, 40u);
    EXPECT_EQ(first.duplicate_count, 0u);
    EXPECT_TRUE(first.batch_errors.empty());
    EXPECT_EQ(first.inserted_records.size(), 40u);

    auto second = engine.persist(records);
    EXPECT_EQ(second.inserted_count, 0u);
    EXPECT_EQ(second.duplicate_count, 40u);
    EXPECT_TRUE(second.batch_errors.empty());
    EXPECT_TRUE(second.inserted_records.empty());
    EXPECT_EQ(store.size(), 40u);
}

TEST(PersistenceEngineTest, StoredSetIsUnionOfExistingAndNew) {
    InMemoryRecordStore store;
    store.seed(makeRecords(1, 30));
    PersistenceEngine engine(store);

    auto result = engine.persist(makeRecords(21, 30));
    EXPECT_EQ(result.inserted_count, 20u);
    EXPECT_EQ(result.duplicate_count, 10u);
    EXPECT_EQ(store.size(), 50u);
    for (int64_t id = 1; id <= 50; id++) {
        EXPECT_TRUE(store.contains(id)) << id;
    }
    for (const auto& record : result.inserted_records) {
        EXPECT_GT(record.user_id, 30);
    }
}

TEST(PersistenceEngineTest, CollapsesDuplicateUsersInInput) {
    InMemoryRecordStore store;
    PersistenceEngine engine(store);
    auto records = makeRecords(1, 5);
    auto repeat = records[2];
    repeat.first_name = std::string("Later");
    records.push_back(repeat);

    auto result = engine.persist(records);
    EXPECT_EQ(result.candidate_count, 5u);
    EXPECT_EQ(result.inserted_count, 5u);
    EXPECT_EQ(accounted(result), 5u);
}

TEST(PersistenceEngineTest, SplitsIntoFixedSizeBatches) {
    InMemoryRecordStore store;
    PersistenceEngine engine(store, 1000);

    auto result = engine.persist(makeRecords(1, 2500));
    EXPECT_EQ(result.inserted_count, 2500u);
    EXPECT_EQ(store.committedBatchSizes(), (std::vector<size_t>{1000, 1000, 500}));
}

TEST(PersistenceEngineTest, WriterCrashKeepsEarlierBatchesOnly) {
    InMemoryRecordStore store;
    store.injectBatchFault(1, InMemoryRecordStore::Fault::Crash);
    PersistenceEngine engine(store, 1000);
    auto records = makeRecords(1, 2500);

    PersistResult result;
    ASSERT_NO_THROW(result = engine.persist(records));
    EXPECT_TRUE(result.writer_failed);
    EXPECT_TRUE(result.backup.has_value());
    EXPECT_EQ(result.inserted_count, 1000u);
    EXPECT_EQ(result.inserted_records.size(), 1000u);
    ASSERT_EQ(result.batch_errors.size(), 2u);
    EXPECT_EQ(result.batch_errors[0].batch_index, 1u);
    EXPECT_EQ(result.batch_errors[0].record_count, 1000u);
    EXPECT_EQ(result.batch_errors[1].batch_index, 2u);
    EXPECT_EQ(result.batch_errors[1].record_count, 500u);
    EXPECT_EQ(accounted(result), 2500u);

    EXPECT_EQ(store.size(), 1000u);
    EXPECT_EQ(store.committedBatchSizes(), (std::vector<size_t>{1000}));
    for (size_t i = 0; i < 1000; i++) {
        EXPECT_TRUE(store.contains(records[i].user_id));
    }
    for (size_t i = 2000; i < 2500; i++) {
        EXPECT_FALSE(store.contains(records[i].user_id));
    }
}

TEST(PersistenceEngineTest, ReportedBatchFailureIsSkippedAndLaterBatchesCommit) {
    InMemoryRecordStore store;
    store.injectBatchFault(1, InMemoryRecordStore::Fault::ReportError);
    PersistenceEngine engine(store, 1000);
    auto records = makeRecords(1, 2500);

    auto result = engine.persist(records);
    ASSERT_EQ(result.batch_errors.size(), 1u);
    EXPECT_EQ(result.batch_errors[0].batch_index, 1u);
    EXPECT_EQ(result.batch_errors[0].record_count, 1000u);
    EXPECT_FALSE(result.batch_errors[0].message.empty());
    EXPECT_EQ(result.inserted_count, 1500u);
    EXPECT_EQ(accounted(result), 2500u);

    EXPECT_EQ(store.committedBatchSizes(), (std::vector<size_t>{1000, 500}));
    for (size_t i = 0; i < records.size(); i++) {
        const bool in_failed_batch = i >= 1000 && i < 2000;
        EXPECT_EQ(store.contains(records[i].user_id), !in_failed_batch) << i;
    }
}

TEST(PersistenceEngineTest, BackupPrecedesWritesAndCapturesPriorState) {
    InMemoryRecordStore store;
    store.seed(makeRecords(1, 7));
    PersistenceEngine engine(store);

    auto result = engine.persist(makeRecords(100, 3));
    ASSERT_TRUE(result.backup.has_value());
    EXPECT_EQ(result.backup->row_count, 7);
    EXPECT_EQ(store.snapshotRowCount(result.backup->name), 7u);
    EXPECT_EQ(store.size(), 10u);
}

TEST(PersistenceEngineTest, FailedBackupBlocksAllWrites) {
    InMemoryRecordStore store;
    store.setSnapshotFailure(true);
    PersistenceEngine engine(store);

    auto result = engine.persist(makeRecords(1, 12));
    EXPECT_FALSE(result.backup.has_value());
    EXPECT_FALSE(result.backup_error.empty());
    EXPECT_EQ(result.inserted_count, 0u);
    EXPECT_EQ(result.failedRecordCount(), 12u);
    EXPECT_EQ(accounted(result), 12u);
    EXPECT_EQ(store.size(), 0u);
    EXPECT_TRUE(store.committedBatchSizes().empty());
}

TEST(PersistenceEngineTest, LookupFailureFallsBackToConflictIgnoringInsert) {
    InMemoryRecordStore store;
    store.seed(makeRecords(1, 10));
    store.setLookupFailure(true);
    PersistenceEngine engine(store);

    auto result = engine.persist(makeRecords(1, 25));
    EXPECT_EQ(result.inserted_count, 15u);
    EXPECT_EQ(result.duplicate_count, 10u);
    EXPECT_EQ(result.inserted_records.size(), 15u);
    EXPECT_EQ(store.size(), 25u);
}

TEST(PersistenceEngineTest, EmptyInputTouchesNothing) {
    InMemoryRecordStore store;
    PersistenceEngine engine(store);
    auto result = engine.persist({});
    EXPECT_FALSE(result.backup.has_value());
    EXPECT_TRUE(store.snapshots().empty());
    EXPECT_EQ(accounted(result), 0u);
}
