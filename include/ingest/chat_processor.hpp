#ifndef HARVESTER_CHAT_PROCESSOR_HPP
#define HARVESTER_CHAT_PROCESSOR_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "../models/chat.hpp"
#include "../models/identity_record.hpp"
#include "../remote/chat_source.hpp"
#include "../remote/fetch_wrapper.hpp"
#include "../utils/calendar.hpp"
#include "../utils/cancellation.hpp"

namespace harvester {

struct ProcessorOptions {
    int max_concurrent_chats = 3;
    int min_participants = 10;      // eligible iff participant_count > min_participants
    int page_size = 100;
    int tz_offset_minutes = 0;
    FetchPolicy fetch;
};

struct ChatFailure {
    int64_t chat_id = 0;
    std::string title;
    std::string reason;
};

struct CollectResult {
    std::vector<IdentityRecord> records;    // unique by user_id
    int chats_listed = 0;
    int chats_eligible = 0;
    int chats_attempted = 0;
    int chats_failed = 0;
    int chats_cancelled = 0;
    std::vector<ChatFailure> failures;
    std::vector<ChatFailure> anomalies;     // resolver inconsistencies, not counted as failures
    bool cancelled = false;
};

class ChatProcessor {
public:
    // Called with (chat_id, true) when a chat task starts and (chat_id, false) when it ends
    using TaskObserver = std::function<void(int64_t, bool)>;

    ChatProcessor(ChatSource& source,
                  const Credential& credential,
                  ProcessorOptions options,
                  const CancellationToken* cancel = nullptr);

    // Throws AuthorizationError when the credential's session is rejected
    CollectResult collect(const CalendarDate& target_date);

    void setTaskObserver(TaskObserver observer);

    bool isEligible(const ChatInfo& chat) const;

private:
    struct ChatOutcome;

    ChatOutcome processChat(const ChatInfo& chat, const DayBounds& day);
    bool stopRequested() const;

    ChatSource& source_;
    Credential credential_;
    ProcessorOptions options_;
    const CancellationToken* cancel_;
    RateLimitedFetcher fetcher_;
    TaskObserver observer_;
};

} // namespace harvester

#endif // HARVESTER_CHAT_PROCESSOR_HPP
