#include "../../include/ingest/window_resolver.hpp"
#include "../../include/utils/logger.hpp"
#include <limits>

namespace harvester {

WindowResolver::WindowResolver(ChatSource& source, const RateLimitedFetcher& fetcher)
    : source_(source), fetcher_(fetcher) {
}

std::optional<RemoteMessage> WindowResolver::probe(int64_t chat_id, int64_t min_id, int64_t max_id,
                                                   bool newest_first, WindowResolution& out) {
    MessageRange range;
    range.min_id = min_id;
    range.max_id = max_id;
    range.limit = 1;
    range.newest_first = newest_first;

    out.probes++;
    auto page = fetcher_.call([&]() { return source_.fetchMessageWindow(chat_id, range); },
                              "probe of chat " + std::to_string(chat_id));
    if (page.empty()) {
        return std::nullopt;
    }
    return page.front();
}

// Smallest m in [1, top + 1] whose next existing message is dated >= day.start
std::optional<RemoteMessage> WindowResolver::firstAtOrAfter(const ChatInfo& chat, int64_t top,
                                                            const DayBounds& day, WindowResolution& out) {
    int64_t lo = 1;
    int64_t hi = top + 1;
    std::optional<RemoteMessage> found;
    while (lo < hi) {
        const int64_t mid = lo + (hi - lo) / 2;
        auto p = probe(chat.id, mid, top, false, out);
        if (!p || p->date >= day.start) {
            hi = mid;
            found = p;
        } else {
            lo = p->id + 1;
        }
    }
    return found;
}

// Largest m in [0, top] whose previous existing message is dated < day.end
std::optional<RemoteMessage> WindowResolver::lastBefore(const ChatInfo& chat, int64_t top,
                                                        const DayBounds& day, WindowResolution& out) {
    int64_t lo = 0;
    int64_t hi = top;
    std::optional<RemoteMessage> found;
    while (lo < hi) {
        const int64_t mid = lo + (hi - lo + 1) / 2;
        auto p = probe(chat.id, 1, mid, true, out);
        if (!p || p->date < day.end) {
            lo = mid;
            found = p;
        } else {
            hi = p->id - 1;
        }
    }
    return found;
}

bool WindowResolver::narrowStart(const ChatInfo& chat, const DayBounds& day, int64_t& start_id,
                                 int64_t end_id, WindowResolution& out) {
    for (int step = 0; step <= kMaxNarrowingSteps && start_id <= end_id; step++) {
        auto p = probe(chat.id, start_id, end_id, false, out);
        if (!p) {
            return false;
        }
        if (day.contains(p->date)) {
            start_id = p->id;
            return true;
        }
        start_id = p->id + 1;
    }
    return false;
}

bool WindowResolver::narrowEnd(const ChatInfo& chat, const DayBounds& day, int64_t start_id,
                               int64_t& end_id, WindowResolution& out) {
    for (int step = 0; step <= kMaxNarrowingSteps && start_id <= end_id; step++) {
        auto p = probe(chat.id, start_id, end_id, true, out);
        if (!p) {
            return false;
        }
        if (day.contains(p->date)) {
            end_id = p->id;
            return true;
        }
        end_id = p->id - 1;
    }
    return false;
}

WindowResolution WindowResolver::resolve(const ChatInfo& chat, const DayBounds& day) {
    WindowResolution out;

    int64_t top = chat.top_message_id;
    if (top <= 0) {
        auto newest = probe(chat.id, 1, std::numeric_limits<int64_t>::max(), true, out);
        if (!newest) {
            Logger::getInstance().info("Chat " + chat.title + " has no messages");
            return out;
        }
        top = newest->id;
    }

    auto first = firstAtOrAfter(chat, top, day, out);
    auto last = lastBefore(chat, top, day, out);
    if (!first || !last || first->id > last->id) {
        Logger::getInstance().info("No messages in " + chat.title + " for " +
                                   calendar::formatUtc(day.start) + " .. " + calendar::formatUtc(day.end));
        return out;
    }

    int64_t start_id = first->id;
    int64_t end_id = last->id;
    if (!narrowStart(chat, day, start_id, end_id, out) ||
        !narrowEnd(chat, day, start_id, end_id, out) ||
        start_id > end_id) {
        out.inconsistent = true;
        Logger::getInstance().warning("Boundary probes disagree for " + chat.title + " (ID: " +
                                      std::to_string(chat.id) + ") around " + std::to_string(first->id) +
                                      " - " + std::to_string(last->id) + ", treating window as empty");
        return out;
    }

    MessageWindow window;
    window.start_id = start_id;
    window.end_id = end_id;
    out.window = window;
    Logger::getInstance().info("Found boundaries: " + std::to_string(start_id) + " - " + std::to_string(end_id) +
                               " in " + chat.title + " after " + std::to_string(out.probes) + " probes");
    return out;
}

} // namespace harvester
