#ifndef HARVESTER_WINDOW_RESOLVER_HPP
#define HARVESTER_WINDOW_RESOLVER_HPP

#include <optional>
#include "../models/chat.hpp"
#include "../remote/chat_source.hpp"
#include "../remote/fetch_wrapper.hpp"
#include "../utils/calendar.hpp"

namespace harvester {

struct WindowResolution {
    std::optional<MessageWindow> window;   // empty: no messages that day
    bool inconsistent = false;             // boundaries disagreed after narrowing
    int probes = 0;
};

/**
 * Finds the identifier range [start_id, end_id] of a chat's messages posted
 * inside one day.
 *
 * Two binary searches over [1, top_message_id], each a point lookup of
 * limit 1: the first existing message dated >= day.start, and the last
 * existing message dated < day.end. Identifier gaps are skipped by jumping
 * past the probed message. Message ids are only monotone in time (remote
 * clock jitter), so both ends are probed once more and narrowed inward, never
 * widened, up to kMaxNarrowingSteps times when their date falls outside the
 * day. A boundary that still disagrees yields an empty, inconsistent result.
 */
class WindowResolver {
public:
    static constexpr int kMaxNarrowingSteps = 2;

    WindowResolver(ChatSource& source, const RateLimitedFetcher& fetcher);

    WindowResolution resolve(const ChatInfo& chat, const DayBounds& day);

private:
    std::optional<RemoteMessage> probe(int64_t chat_id, int64_t min_id, int64_t max_id,
                                       bool newest_first, WindowResolution& out);
    std::optional<RemoteMessage> firstAtOrAfter(const ChatInfo& chat, int64_t top, const DayBounds& day,
                                                WindowResolution& out);
    std::optional<RemoteMessage> lastBefore(const ChatInfo& chat, int64_t top, const DayBounds& day,
                                            WindowResolution& out);
    bool narrowStart(const ChatInfo& chat, const DayBounds& day, int64_t& start_id, int64_t end_id,
                     WindowResolution& out);
    bool narrowEnd(const ChatInfo& chat, const DayBounds& day, int64_t start_id, int64_t& end_id,
                   WindowResolution& out);

    ChatSource& source_;
    const RateLimitedFetcher& fetcher_;
};

} // namespace harvester

#endif // HARVESTER_WINDOW_RESOLVER_HPP
