#include "../../include/remote/http_chat_source.hpp"
#include "../../include/remote/remote_errors.hpp"
#include "../../include/utils/json_parser.hpp"
#include "../../include/utils/logger.hpp"

#include <curl/curl.h>

#include <chrono>
#include <cstdlib>
#include <mutex>

namespace harvester {

namespace {

std::once_flag g_curl_init;

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    auto* out = static_cast<std::string*>(userp);
    out->append(static_cast<char*>(contents), total);
    return total;
}

bool isTransientCurlError(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_SSL_CONNECT_ERROR:
            return true;
        default:
            return false;
    }
}

// FLOOD_WAIT_35 -> 35 seconds
long floodWaitSeconds(const std::string& code) {
    const std::string prefix = "FLOOD_WAIT_";
    if (code.compare(0, prefix.size(), prefix) != 0) {
        return -1;
    }
    const char* digits = code.c_str() + prefix.size();
    char* end = nullptr;
    long seconds = std::strtol(digits, &end, 10);
    return end == digits ? -1 : seconds;
}

MessageSender parseSender(const std::string& raw) {
    auto obj = JsonParser::parse(raw);
    MessageSender sender;
    sender.user_id = JsonParser::getInt64(obj, "id");
    sender.username = JsonParser::getString(obj, "username");
    sender.first_name = JsonParser::getString(obj, "first_name");
    sender.last_name = JsonParser::getString(obj, "last_name");
    sender.phone = JsonParser::getString(obj, "phone");
    sender.is_premium = JsonParser::getBool(obj, "premium");
    sender.is_verified = JsonParser::getBool(obj, "verified");
    sender.is_bot = JsonParser::getBool(obj, "bot");
    return sender;
}

} // namespace

HttpChatSource::HttpChatSource(const Credential& credential, long timeout_seconds)
    : credential_(credential), timeout_seconds_(timeout_seconds) {
    std::call_once(g_curl_init, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::vector<ChatInfo> HttpChatSource::fetchChatMetadata() {
    const std::string body = get("/v1/chats", "chat list of " + credential_.id);
    return parseChatList(body);
}

std::vector<RemoteMessage> HttpChatSource::fetchMessageWindow(int64_t chat_id, const MessageRange& range) {
    const std::string path = "/v1/chats/" + std::to_string(chat_id) + "/messages" +
                             "?min_id=" + std::to_string(range.min_id) +
                             "&max_id=" + std::to_string(range.max_id) +
                             "&limit=" + std::to_string(range.limit) +
                             "&order=" + (range.newest_first ? "desc" : "asc");
    const std::string body = get(path, "history of chat " + std::to_string(chat_id));
    return parseMessages(body);
}

std::string HttpChatSource::get(const std::string& path, const std::string& what) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw TransientNetworkError("curl_easy_init failed for " + what);
    }

    const std::string url = credential_.gateway_url + path;
    std::string response;
    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    headers = curl_slist_append(headers, ("Authorization: Bearer " + credential_.session_token).c_str());

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

    CURLcode res = curl_easy_perform(curl);
    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        const std::string message = what + ": " + curl_easy_strerror(res);
        if (isTransientCurlError(res)) {
            throw TransientNetworkError(message);
        }
        throw RemoteError(message);
    }

    raiseForStatus(code, response, what);
    return response;
}

void HttpChatSource::raiseForStatus(long http_code, const std::string& body, const std::string& what) {
    if (http_code >= 200 && http_code < 300) {
        return;
    }

    auto parsed = JsonParser::parse(body);
    const std::string error_code = JsonParser::getString(parsed, "error").value_or("");
    const std::string detail = what + ": HTTP " + std::to_string(http_code) +
                               (error_code.empty() ? "" : " (" + error_code + ")");

    long wait_seconds = JsonParser::getInt64(parsed, "retry_after", -1);
    if (wait_seconds < 0) {
        wait_seconds = floodWaitSeconds(error_code);
    }
    if (http_code == 420 || http_code == 429 || wait_seconds >= 0) {
        if (wait_seconds < 0) {
            wait_seconds = 1;
        }
        throw RateLimitedError(std::chrono::seconds(wait_seconds), detail);
    }
    if (http_code == 401) {
        throw AuthorizationError(detail);
    }
    if (http_code == 408 || http_code >= 500) {
        throw TransientNetworkError(detail);
    }
    throw RemoteError(detail);
}

std::vector<ChatInfo> HttpChatSource::parseChatList(const std::string& body) {
    std::vector<ChatInfo> chats;
    for (const auto& raw : JsonParser::parseObjectArray(body, "chats")) {
        auto obj = JsonParser::parse(raw);
        ChatInfo chat;
        chat.id = JsonParser::getInt64(obj, "id");
        chat.title = JsonParser::getString(obj, "title").value_or("Unknown");
        chat.participant_count = static_cast<int>(JsonParser::getInt64(obj, "participants_count"));
        chat.top_message_id = JsonParser::getInt64(obj, "top_message_id");
        if (chat.id == 0) {
            Logger::getInstance().warning("Skipping chat entry without id");
            continue;
        }
        chats.push_back(std::move(chat));
    }
    return chats;
}

std::vector<RemoteMessage> HttpChatSource::parseMessages(const std::string& body) {
    std::vector<RemoteMessage> messages;
    for (const auto& raw : JsonParser::parseObjectArray(body, "messages")) {
        auto obj = JsonParser::parse(raw);
        RemoteMessage message;
        message.id = JsonParser::getInt64(obj, "id");
        message.date = JsonParser::getInt64(obj, "date");
        auto sender = obj.find("sender");
        if (sender != obj.end() && !sender->second.empty() && sender->second[0] == '{') {
            MessageSender parsed = parseSender(sender->second);
            if (parsed.user_id != 0) {
                message.sender = parsed;
            }
        }
        if (message.id <= 0) {
            continue;
        }
        messages.push_back(std::move(message));
    }
    return messages;
}

} // namespace harvester
