#include <gtest/gtest.h>
#include "models/identity_record.hpp"

using namespace harvester;

namespace {

ChatInfo chat(int64_t id) {
    ChatInfo info;
    info.id = id;
    info.title = "chat " + std::to_string(id);
    info.participant_count = 50;
    return info;
}

} // namespace

TEST(IdentityRecordTest, NormalizesUsernames) {
    EXPECT_EQ(normalizeUsername(std::string("alice")).value_or(""), "@alice");
    EXPECT_EQ(normalizeUsername(std::string("@bob")).value_or(""), "@bob");
    EXPECT_FALSE(normalizeUsername(std::string("")).has_value());
    EXPECT_FALSE(normalizeUsername(std::string("@")).has_value());
    EXPECT_FALSE(normalizeUsername(std::nullopt).has_value());
}

TEST(IdentityRecordTest, BuildsFromSender) {
    MessageSender sender;
    sender.user_id = 42;
    sender.username = "carol";
    sender.first_name = "Carol";
    sender.is_premium = true;

    auto record = IdentityRecord::fromSender(sender, chat(-100), 1700000100, 1700000500, "+15550001");
    EXPECT_EQ(record.user_id, 42);
    EXPECT_EQ(record.username.value_or(""), "@carol");
    EXPECT_EQ(record.first_name.value_or(""), "Carol");
    EXPECT_FALSE(record.last_name.has_value());
    EXPECT_TRUE(record.is_premium);
    EXPECT_EQ(record.source_chat_id, -100);
    EXPECT_EQ(record.source_chat_title, "chat -100");
    EXPECT_EQ(record.last_message_at, 1700000100);
    EXPECT_EQ(record.collected_at, 1700000500);
    EXPECT_EQ(record.collected_by, "+15550001");
}

TEST(IdentityRecordTest, MergeFillsGapsAndKeepsFirstValues) {
    MessageSender first;
    first.user_id = 7;
    first.first_name = "Dan";
    MessageSender later;
    later.user_id = 7;
    later.first_name = "Daniel";
    later.username = "dan";
    later.is_verified = true;

    auto record = IdentityRecord::fromSender(first, chat(1), 100, 1000, "a");
    record.mergeFrom(IdentityRecord::fromSender(later, chat(2), 300, 1001, "a"));

    EXPECT_EQ(record.first_name.value_or(""), "Dan");
    EXPECT_EQ(record.username.value_or(""), "@dan");
    EXPECT_TRUE(record.is_verified);
    EXPECT_EQ(record.last_message_at, 300);
    EXPECT_EQ(record.source_chat_id, 1);
}

TEST(IdentityRecordTest, CollapseKeepsOnePerUserInFirstSeenOrder) {
    std::vector<IdentityRecord> records;
    for (int64_t id : {5, 3, 5, 9, 3}) {
        IdentityRecord record;
        record.user_id = id;
        record.last_message_at = static_cast<int64_t>(records.size());
        records.push_back(record);
    }
    auto unique = collapseByUserId(records);
    ASSERT_EQ(unique.size(), 3u);
    EXPECT_EQ(unique[0].user_id, 5);
    EXPECT_EQ(unique[1].user_id, 3);
    EXPECT_EQ(unique[2].user_id, 9);
    EXPECT_EQ(unique[0].last_message_at, 2);
    EXPECT_EQ(unique[1].last_message_at, 4);
}
