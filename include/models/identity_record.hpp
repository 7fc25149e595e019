#ifndef HARVESTER_IDENTITY_RECORD_HPP
#define HARVESTER_IDENTITY_RECORD_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "chat.hpp"

namespace harvester {

struct IdentityRecord {
    int64_t user_id = 0;
    std::optional<std::string> username;    // always carries the '@' marker
    std::optional<std::string> first_name;
    std::optional<std::string> last_name;
    std::optional<std::string> phone;
    bool is_premium = false;
    bool is_verified = false;
    bool is_bot = false;
    int64_t collected_at = 0;                // epoch seconds
    int64_t source_chat_id = 0;
    std::string source_chat_title;
    int64_t last_message_at = 0;
    std::string collected_by;                // credential id

    static IdentityRecord fromSender(const MessageSender& sender,
                                     const ChatInfo& chat,
                                     int64_t message_date,
                                     int64_t collected_at,
                                     const std::string& credential_id);

    // Folds a later sighting of the same user into this record
    void mergeFrom(const IdentityRecord& later);
};

// "@name" for "name", unchanged for "@name", absent for empty input
std::optional<std::string> normalizeUsername(const std::optional<std::string>& username);

// Keeps the first record per user_id, merging later duplicates into it
std::vector<IdentityRecord> collapseByUserId(const std::vector<IdentityRecord>& records);

} // namespace harvester

#endif // HARVESTER_IDENTITY_RECORD_HPP
