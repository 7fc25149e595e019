#include "../../include/utils/config.hpp"
#include "../../include/utils/json_parser.hpp"
#include "../../include/utils/logger.hpp"
#include "../../include/utils/token_hash.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace harvester {

namespace {

void readString(const char* name, std::string& target) {
    const char* value = std::getenv(name);
    if (value) {
        target = value;
    }
}

void readInt(const char* name, int& target) {
    const char* value = std::getenv(name);
    if (!value || !*value) {
        return;
    }
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != std::string(value).size()) {
            throw std::invalid_argument(value);
        }
        target = parsed;
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " must be an integer, got '" + value + "'");
    }
}

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

} // namespace

Config Config::fromEnv() {
    Config config;
    readString("HARVESTER_DB_HOST", config.db.host);
    readString("HARVESTER_DB_PORT", config.db.port);
    readString("HARVESTER_DB_NAME", config.db.name);
    readString("HARVESTER_DB_USER", config.db.user);
    readString("HARVESTER_DB_PASSWORD", config.db.password);
    readInt("HARVESTER_DB_POOL_SIZE", config.db.pool_size);

    readString("HARVESTER_STORAGE", config.storage_backend);
    readInt("HARVESTER_BATCH_SIZE", config.batch_size);
    readInt("HARVESTER_CHAT_CONCURRENCY", config.chat_concurrency);
    readInt("HARVESTER_MIN_PARTICIPANTS", config.min_participants);
    readInt("HARVESTER_PAGE_SIZE", config.page_size);
    readInt("HARVESTER_TZ_OFFSET_MINUTES", config.tz_offset_minutes);
    readInt("HARVESTER_TRANSIENT_RETRIES", config.transient_retries);
    readInt("HARVESTER_TRANSIENT_BACKOFF_MS", config.transient_backoff_ms);

    readString("HARVESTER_ACCOUNTS_FILE", config.accounts_file);
    readString("HARVESTER_LOG_FILE", config.log_file);
    readString("HARVESTER_LOG_LEVEL", config.log_level);
    return config;
}

void Config::validate() const {
    if (db.pool_size < 1) {
        throw std::invalid_argument("HARVESTER_DB_POOL_SIZE must be at least 1");
    }
    if (storage_backend != "postgres" && storage_backend != "memory") {
        throw std::invalid_argument("HARVESTER_STORAGE must be 'postgres' or 'memory'");
    }
    if (batch_size < 1) {
        throw std::invalid_argument("HARVESTER_BATCH_SIZE must be at least 1");
    }
    if (chat_concurrency < 1) {
        throw std::invalid_argument("HARVESTER_CHAT_CONCURRENCY must be at least 1");
    }
    if (min_participants < 0) {
        throw std::invalid_argument("HARVESTER_MIN_PARTICIPANTS must not be negative");
    }
    if (page_size < 1 || page_size > 100) {
        throw std::invalid_argument("HARVESTER_PAGE_SIZE must be between 1 and 100");
    }
    if (tz_offset_minutes < -12 * 60 || tz_offset_minutes > 14 * 60) {
        throw std::invalid_argument("HARVESTER_TZ_OFFSET_MINUTES must be within UTC-12:00..UTC+14:00");
    }
    if (transient_retries < 0 || transient_backoff_ms < 0) {
        throw std::invalid_argument("transient retry settings must not be negative");
    }
    if (transient_retries > kMaxTransientRetries) {
        throw std::invalid_argument("HARVESTER_TRANSIENT_RETRIES must be at most " +
                                    std::to_string(kMaxTransientRetries));
    }
}

std::vector<Credential> loadCredentials(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Accounts file not found: " + path);
    }

    std::vector<Credential> credentials;
    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        line_no++;
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        auto entry = JsonParser::parse(line);
        Credential credential;
        credential.id = JsonParser::getString(entry, "phone_number").value_or("");
        credential.gateway_url = JsonParser::getString(entry, "gateway_url").value_or("");
        credential.session_token = JsonParser::getString(entry, "session_token").value_or("");

        if (credential.id.empty() || credential.gateway_url.empty() || credential.session_token.empty()) {
            Logger::getInstance().error("Configuration error: account on line " + std::to_string(line_no) +
                                        " of " + path + " needs phone_number, gateway_url and session_token");
            continue;
        }
        while (!credential.gateway_url.empty() && credential.gateway_url.back() == '/') {
            credential.gateway_url.pop_back();
        }
        Logger::getInstance().debug("Account " + credential.id + " via " + credential.gateway_url +
                                    " (session " + tokenFingerprint(credential.session_token) + ")");
        credentials.push_back(std::move(credential));
    }

    Logger::getInstance().info("Loaded " + std::to_string(credentials.size()) + " account(s) from " + path);
    return credentials;
}

} // namespace harvester
