#include <gtest/gtest.h>
#include "storage/in_memory_record_store.hpp"
#include "utils/calendar.hpp"

using namespace harvester;

namespace {

IdentityRecord manualRecord(int64_t user_id, const std::string& username) {
    IdentityRecord record;
    record.user_id = user_id;
    if (!username.empty()) {
        record.username = username;
    }
    record.first_name = "Manual";
    record.source_chat_title = "manual";
    return record;
}

} // namespace

TEST(RecordStoreTest, AddRecordNormalizesUsernameAndStampsTime) {
    InMemoryRecordStore store;
    const int64_t before = calendar::nowEpochSeconds();

    EXPECT_EQ(store.addRecord(manualRecord(42, "alice")), AddRecordResult::Added);

    auto stored = store.findById(42);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->username.value_or(""), "@alice");
    EXPECT_EQ(stored->first_name.value_or(""), "Manual");
    EXPECT_GE(stored->collected_at, before);
}

TEST(RecordStoreTest, AddRecordKeepsExplicitCollectionTime) {
    InMemoryRecordStore store;
    IdentityRecord record = manualRecord(7, "@bob");
    record.collected_at = 1710460800;

    ASSERT_EQ(store.addRecord(record), AddRecordResult::Added);
    EXPECT_EQ(store.findById(7)->collected_at, 1710460800);
    EXPECT_EQ(store.findById(7)->username.value_or(""), "@bob");
}

TEST(RecordStoreTest, AddRecordSkipsKnownUser) {
    InMemoryRecordStore store;
    ASSERT_EQ(store.addRecord(manualRecord(42, "alice")), AddRecordResult::Added);

    EXPECT_EQ(store.addRecord(manualRecord(42, "someone_else")), AddRecordResult::AlreadyStored);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.findById(42)->username.value_or(""), "@alice");
}

TEST(RecordStoreTest, AddRecordRejectsInvalidId) {
    InMemoryRecordStore store;
    EXPECT_EQ(store.addRecord(manualRecord(0, "alice")), AddRecordResult::Invalid);
    EXPECT_EQ(store.addRecord(manualRecord(-5, "alice")), AddRecordResult::Invalid);
    EXPECT_EQ(store.size(), 0u);
    EXPECT_TRUE(store.committedBatchSizes().empty());
}

TEST(RecordStoreTest, AddRecordReportsFailedInsert) {
    InMemoryRecordStore store;
    store.injectBatchFault(0, InMemoryRecordStore::Fault::ReportError);

    EXPECT_EQ(store.addRecord(manualRecord(42, "alice")), AddRecordResult::Failed);
    EXPECT_FALSE(store.contains(42));
}

TEST(RecordStoreTest, EmptyUsernameIsStoredAsAbsent) {
    InMemoryRecordStore store;
    ASSERT_EQ(store.addRecord(manualRecord(9, "@")), AddRecordResult::Added);
    EXPECT_FALSE(store.findById(9)->username.has_value());
}

TEST(RecordStoreTest, FindByIdOfUnknownUserIsEmpty) {
    InMemoryRecordStore store;
    EXPECT_FALSE(store.findById(12345).has_value());
}
