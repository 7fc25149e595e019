#ifndef HARVESTER_CHAT_HPP
#define HARVESTER_CHAT_HPP

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace harvester {

struct Credential {
    std::string id;             // account phone number or label
    std::string gateway_url;
    std::string session_token;
};

struct ChatInfo {
    int64_t id = 0;
    std::string title;
    int participant_count = 0;
    int64_t top_message_id = 0;  // 0 when the gateway does not report it
};

struct MessageSender {
    int64_t user_id = 0;
    std::optional<std::string> username;
    std::optional<std::string> first_name;
    std::optional<std::string> last_name;
    std::optional<std::string> phone;
    bool is_premium = false;
    bool is_verified = false;
    bool is_bot = false;
};

struct RemoteMessage {
    int64_t id = 0;
    int64_t date = 0;            // epoch seconds, UTC
    std::optional<MessageSender> sender;
};

// Inclusive identifier range for one history request
struct MessageRange {
    int64_t min_id = 1;
    int64_t max_id = std::numeric_limits<int64_t>::max();
    int limit = 100;
    bool newest_first = false;
};

struct MessageWindow {
    int64_t start_id = 0;
    int64_t end_id = 0;
};

} // namespace harvester

#endif // HARVESTER_CHAT_HPP
