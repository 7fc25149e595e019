#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <mutex>
#include <set>
#include "fakes/fake_chat_source.hpp"
#include "ingest/chat_processor.hpp"
#include "remote/remote_errors.hpp"

using namespace harvester;
using fakes::FakeChatSource;
using fakes::at;
using fakes::makeMessage;
using fakes::makeSender;

namespace {

const CalendarDate kDay{2024, 3, 15};
const CalendarDate kBefore{2024, 3, 14};

ChatInfo chatInfo(int64_t id, int participants, int64_t top) {
    ChatInfo chat;
    chat.id = id;
    chat.title = "group-" + std::to_string(id);
    chat.participant_count = participants;
    chat.top_message_id = top;
    return chat;
}

ProcessorOptions fastOptions(int concurrency = 3) {
    ProcessorOptions options;
    options.max_concurrent_chats = concurrency;
    options.fetch.transient_backoff = std::chrono::milliseconds(1);
    return options;
}

Credential credential() {
    Credential c;
    c.id = "+15550001";
    c.gateway_url = "http://gateway";
    c.session_token = "token";
    return c;
}

std::set<int64_t> userIds(const CollectResult& result) {
    std::set<int64_t> ids;
    for (const auto& record : result.records) ids.insert(record.user_id);
    return ids;
}

} // namespace

TEST(ChatProcessorTest, OnlyChatsAboveParticipantThresholdAreEligible) {
    FakeChatSource source;
    source.addBusyChat(1, 10, kDay, 5, 100);
    source.addBusyChat(2, 11, kDay, 5, 200);

    ChatProcessor processor(source, credential(), fastOptions());
    auto result = processor.collect(kDay);

    EXPECT_EQ(result.chats_listed, 2);
    EXPECT_EQ(result.chats_eligible, 1);
    EXPECT_EQ(result.chats_attempted, 1);
    EXPECT_EQ(source.historyCalls(1), 0);
    EXPECT_EQ(userIds(result), (std::set<int64_t>{200, 201, 202, 203, 204}));
}

TEST(ChatProcessorTest, MergesSendersAcrossMessagesAndChats) {
    FakeChatSource source;
    RemoteMessage early = makeMessage(1, at(kDay, 9), 0);
    early.sender = makeSender(500);
    RemoteMessage later = makeMessage(2, at(kDay, 17), 0);
    later.sender = makeSender(500, "night_owl");
    later.sender->is_premium = true;
    source.addChat(chatInfo(1, 50, 2), {early, later});
    source.addChat(chatInfo(2, 50, 1), {makeMessage(1, at(kDay, 20), 500)});

    ChatProcessor processor(source, credential(), fastOptions());
    auto result = processor.collect(kDay);

    ASSERT_EQ(result.records.size(), 1u);
    const IdentityRecord& record = result.records.front();
    EXPECT_EQ(record.username.value_or(""), "@night_owl");
    EXPECT_TRUE(record.is_premium);
    EXPECT_EQ(record.last_message_at, at(kDay, 20));
    EXPECT_EQ(record.collected_by, "+15550001");
}

TEST(ChatProcessorTest, IgnoresMessagesOutsideTheDayAndWithoutSender) {
    FakeChatSource source;
    source.addChat(chatInfo(1, 50, 5), {makeMessage(1, at(kBefore, 23), 1),
                                        makeMessage(2, at(kDay, 1), 2),
                                        makeMessage(3, at(kDay, 2), 0),
                                        makeMessage(4, at(kBefore, 12), 4),
                                        makeMessage(5, at(kDay, 3), 5)});

    ChatProcessor processor(source, credential(), fastOptions());
    auto result = processor.collect(kDay);
    EXPECT_EQ(userIds(result), (std::set<int64_t>{2, 5}));
}

TEST(ChatProcessorTest, PagesThroughLongWindows) {
    FakeChatSource source;
    source.addBusyChat(1, 500, kDay, 250, 1000);

    ProcessorOptions options = fastOptions();
    options.page_size = 100;
    ChatProcessor processor(source, credential(), options);
    auto result = processor.collect(kDay);
    EXPECT_EQ(result.records.size(), 250u);
}

TEST(ChatProcessorTest, NeverRunsMoreThanKChatsAtOnce) {
    FakeChatSource source;
    for (int i = 1; i <= 9; i++) {
        source.addBusyChat(i, 100, kDay, 20, i * 1000);
    }
    source.setLatency(std::chrono::milliseconds(3));

    std::mutex mutex;
    int active = 0;
    int peak = 0;
    ChatProcessor processor(source, credential(), fastOptions(3));
    processor.setTaskObserver([&](int64_t, bool started) {
        std::lock_guard<std::mutex> lock(mutex);
        active += started ? 1 : -1;
        peak = std::max(peak, active);
    });
    auto result = processor.collect(kDay);

    EXPECT_EQ(result.chats_attempted, 9);
    EXPECT_EQ(result.records.size(), 180u);
    EXPECT_LE(peak, 3);
    EXPECT_GE(peak, 1);
    EXPECT_LE(source.peakInFlight(), 3);
    EXPECT_EQ(active, 0);
}

TEST(ChatProcessorTest, ChatFailureDoesNotStopOtherChats) {
    FakeChatSource source;
    source.addBusyChat(1, 100, kDay, 5, 100);
    source.addBusyChat(2, 100, kDay, 5, 200);
    source.addBusyChat(3, 100, kDay, 5, 300);
    source.failChatForever(2, std::make_exception_ptr(RemoteError("CHANNEL_PRIVATE")));

    ChatProcessor processor(source, credential(), fastOptions());
    auto result = processor.collect(kDay);

    EXPECT_EQ(result.chats_attempted, 3);
    EXPECT_EQ(result.chats_failed, 1);
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].chat_id, 2);
    EXPECT_EQ(result.failures[0].title, "chat-2");
    EXPECT_NE(result.failures[0].reason.find("CHANNEL_PRIVATE"), std::string::npos);
    EXPECT_EQ(result.records.size(), 10u);
}

TEST(ChatProcessorTest, ExhaustedTransientRetriesFailTheChat) {
    FakeChatSource source;
    source.addBusyChat(1, 100, kDay, 5, 100);
    source.addBusyChat(2, 100, kDay, 5, 200);
    source.failChatForever(1, std::make_exception_ptr(TransientNetworkError("connection reset")));

    ChatProcessor processor(source, credential(), fastOptions());
    auto result = processor.collect(kDay);

    EXPECT_EQ(result.chats_failed, 1);
    EXPECT_EQ(source.historyCalls(1), 3);
    EXPECT_EQ(userIds(result).count(200), 1u);
}

TEST(ChatProcessorTest, RateLimitInsideChatIsAbsorbed) {
    FakeChatSource source;
    source.addBusyChat(1, 100, kDay, 5, 100);
    source.queueHistoryError(1, std::make_exception_ptr(
        RateLimitedError(std::chrono::milliseconds(20), "FLOOD_WAIT")), 2);

    ChatProcessor processor(source, credential(), fastOptions());
    auto result = processor.collect(kDay);

    EXPECT_EQ(result.chats_failed, 0);
    EXPECT_EQ(result.records.size(), 5u);
}

TEST(ChatProcessorTest, ResolverInconsistencyIsAnAnomalyNotAFailure) {
    FakeChatSource source;
    std::vector<RemoteMessage> history;
    history.push_back(makeMessage(1, at(kBefore, 22), 1));
    for (int i = 2; i <= 4; i++) history.push_back(makeMessage(i, at(CalendarDate{2024, 3, 16}, i), i));
    for (int i = 5; i <= 20; i++) history.push_back(makeMessage(i, at(kDay, i), i));
    history.push_back(makeMessage(21, at(CalendarDate{2024, 3, 16}, 5), 21));
    source.addChat(chatInfo(1, 100, 21), history);
    source.addBusyChat(2, 100, kDay, 3, 900);

    ChatProcessor processor(source, credential(), fastOptions());
    auto result = processor.collect(kDay);

    EXPECT_EQ(result.chats_failed, 0);
    ASSERT_EQ(result.anomalies.size(), 1u);
    EXPECT_EQ(result.anomalies[0].chat_id, 1);
    EXPECT_EQ(userIds(result), (std::set<int64_t>{900, 901, 902}));
}

TEST(ChatProcessorTest, AuthorizationErrorOnChatListIsFatal) {
    FakeChatSource source;
    source.addBusyChat(1, 100, kDay, 5, 100);
    source.queueChatListError(std::make_exception_ptr(AuthorizationError("SESSION_REVOKED")));

    ChatProcessor processor(source, credential(), fastOptions());
    EXPECT_THROW(processor.collect(kDay), AuthorizationError);
    EXPECT_EQ(source.historyCalls(1), 0);
}

TEST(ChatProcessorTest, AuthorizationErrorInsideChatStopsTheCredential) {
    FakeChatSource source;
    for (int i = 1; i <= 6; i++) source.addBusyChat(i, 100, kDay, 5, i * 100);
    source.failChatForever(1, std::make_exception_ptr(AuthorizationError("AUTH_KEY_UNREGISTERED")));

    ChatProcessor processor(source, credential(), fastOptions(1));
    EXPECT_THROW(processor.collect(kDay), AuthorizationError);
    for (int i = 2; i <= 6; i++) {
        EXPECT_EQ(source.historyCalls(i), 0);
    }
}

TEST(ChatProcessorTest, CancellationDiscardsInterruptedChat) {
    FakeChatSource source;
    source.addBusyChat(1, 100, kDay, 50, 100);
    source.addBusyChat(2, 100, kDay, 250, 1000);
    source.addBusyChat(3, 100, kDay, 50, 5000);

    CancellationToken token;
    std::atomic<int> chat2_pages{0};
    source.setHistoryHook([&](int64_t chat_id, const MessageRange& range) {
        // Cancel once chat 2 has delivered its first full page
        if (chat_id == 2 && range.limit > 1 && ++chat2_pages == 2) {
            token.cancel();
        }
    });

    ChatProcessor processor(source, credential(), fastOptions(1), &token);
    auto result = processor.collect(kDay);

    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.chats_attempted, 1);
    EXPECT_EQ(result.chats_cancelled, 2);
    auto ids = userIds(result);
    EXPECT_EQ(ids.size(), 50u);
    EXPECT_EQ(ids.count(1000), 0u);
    EXPECT_EQ(source.historyCalls(3), 0);
}

TEST(ChatProcessorTest, CancelDuringWindowSearchStopsFetching) {
    FakeChatSource source;
    source.addBusyChat(1, 100, kDay, 50, 100);

    CancellationToken token;
    std::atomic<int> fetches{0};
    std::atomic<int> after_cancel{0};
    source.setHistoryHook([&](int64_t, const MessageRange&) {
        if (token.isCancelled()) {
            after_cancel++;
        }
        if (++fetches == 1) {
            token.cancel();
        }
    });

    ChatProcessor processor(source, credential(), fastOptions(1), &token);
    auto result = processor.collect(kDay);

    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.chats_cancelled, 1);
    EXPECT_TRUE(result.records.empty());
    EXPECT_EQ(fetches.load(), 1);
    EXPECT_EQ(after_cancel.load(), 0);
}

TEST(ChatProcessorTest, CancelledBeforeStartFetchesNothing) {
    FakeChatSource source;
    source.addBusyChat(1, 100, kDay, 5, 100);
    CancellationToken token;
    token.cancel();

    ChatProcessor processor(source, credential(), fastOptions(), &token);
    auto result = processor.collect(kDay);
    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(source.chatListCalls(), 0);
    EXPECT_TRUE(result.records.empty());
}
