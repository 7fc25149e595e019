#include "../../include/models/identity_record.hpp"
#include <algorithm>
#include <unordered_map>

namespace harvester {

namespace {

void fillIfAbsent(std::optional<std::string>& field, const std::optional<std::string>& other) {
    if (!field && other) {
        field = other;
    }
}

} // namespace

std::optional<std::string> normalizeUsername(const std::optional<std::string>& username) {
    if (!username || username->empty() || *username == "@") {
        return std::nullopt;
    }
    if ((*username)[0] == '@') {
        return username;
    }
    return "@" + *username;
}

IdentityRecord IdentityRecord::fromSender(const MessageSender& sender,
                                          const ChatInfo& chat,
                                          int64_t message_date,
                                          int64_t collected_at,
                                          const std::string& credential_id) {
    IdentityRecord record;
    record.user_id = sender.user_id;
    record.username = normalizeUsername(sender.username);
    record.first_name = sender.first_name;
    record.last_name = sender.last_name;
    record.phone = sender.phone;
    record.is_premium = sender.is_premium;
    record.is_verified = sender.is_verified;
    record.is_bot = sender.is_bot;
    record.collected_at = collected_at;
    record.source_chat_id = chat.id;
    record.source_chat_title = chat.title;
    record.last_message_at = message_date;
    record.collected_by = credential_id;
    return record;
}

void IdentityRecord::mergeFrom(const IdentityRecord& later) {
    fillIfAbsent(username, later.username);
    fillIfAbsent(first_name, later.first_name);
    fillIfAbsent(last_name, later.last_name);
    fillIfAbsent(phone, later.phone);
    is_premium = is_premium || later.is_premium;
    is_verified = is_verified || later.is_verified;
    is_bot = is_bot || later.is_bot;
    last_message_at = std::max(last_message_at, later.last_message_at);
}

std::vector<IdentityRecord> collapseByUserId(const std::vector<IdentityRecord>& records) {
    std::vector<IdentityRecord> unique;
    unique.reserve(records.size());
    std::unordered_map<int64_t, size_t> position;
    for (const auto& record : records) {
        auto it = position.find(record.user_id);
        if (it == position.end()) {
            position.emplace(record.user_id, unique.size());
            unique.push_back(record);
        } else {
            unique[it->second].mergeFrom(record);
        }
    }
    return unique;
}

} // namespace harvester
