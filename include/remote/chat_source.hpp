#ifndef HARVESTER_CHAT_SOURCE_HPP
#define HARVESTER_CHAT_SOURCE_HPP

#include <vector>
#include "../models/chat.hpp"

namespace harvester {

// Read access to one credential's chats. Implementations must be callable
// from several threads at once and report failures with the exceptions in
// remote_errors.hpp.
class ChatSource {
public:
    virtual ~ChatSource() = default;

    // Group chats visible to the credential
    virtual std::vector<ChatInfo> fetchChatMetadata() = 0;

    // Messages with min_id <= id <= max_id, at most range.limit of them,
    // ascending by id (descending when range.newest_first)
    virtual std::vector<RemoteMessage> fetchMessageWindow(int64_t chat_id, const MessageRange& range) = 0;
};

} // namespace harvester

#endif // HARVESTER_CHAT_SOURCE_HPP
