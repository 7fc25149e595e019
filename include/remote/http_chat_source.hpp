#ifndef HARVESTER_HTTP_CHAT_SOURCE_HPP
#define HARVESTER_HTTP_CHAT_SOURCE_HPP

#include <string>
#include <vector>
#include "chat_source.hpp"

namespace harvester {

/**
 * ChatSource backed by an MTProto-to-HTTP gateway holding the credential's
 * session. Endpoints (JSON):
 *   GET {gateway}/v1/chats
 *       -> {"chats":[{"id","title","participants_count","top_message_id"}]}
 *   GET {gateway}/v1/chats/{id}/messages?min_id=&max_id=&limit=&order=asc|desc
 *       -> {"messages":[{"id","date","sender":{"id","username","first_name",
 *           "last_name","phone","premium","verified","bot"}|null}]}
 * Errors map to remote_errors.hpp: 420/429 with "retry_after" (seconds) or a
 * FLOOD_WAIT_<n> code are rate limits, 401 needs reauthorization, 408/5xx and
 * connection-level curl failures are transient, anything else is permanent.
 */
class HttpChatSource : public ChatSource {
public:
    explicit HttpChatSource(const Credential& credential, long timeout_seconds = 30);

    std::vector<ChatInfo> fetchChatMetadata() override;
    std::vector<RemoteMessage> fetchMessageWindow(int64_t chat_id, const MessageRange& range) override;

    static std::vector<ChatInfo> parseChatList(const std::string& body);
    static std::vector<RemoteMessage> parseMessages(const std::string& body);

    // Throws the matching remote error for a non-2xx reply
    static void raiseForStatus(long http_code, const std::string& body, const std::string& what);

private:
    std::string get(const std::string& path, const std::string& what);

    Credential credential_;
    long timeout_seconds_;
};

} // namespace harvester

#endif // HARVESTER_HTTP_CHAT_SOURCE_HPP
