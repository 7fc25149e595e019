#ifndef HARVESTER_CONFIG_HPP
#define HARVESTER_CONFIG_HPP

#include <string>
#include <vector>
#include "../models/chat.hpp"

namespace harvester {

struct DatabaseSettings {
    std::string host = "localhost";
    std::string port = "5432";
    std::string name = "harvester";
    std::string user = "harvester";
    std::string password = "harvester";
    int pool_size = 5;
};

struct Config {
    static constexpr int kMaxTransientRetries = 10;

    DatabaseSettings db;
    std::string storage_backend = "postgres";   // "postgres" or "memory"
    int batch_size = 1000;
    int chat_concurrency = 3;
    int min_participants = 10;                  // chats need strictly more
    int page_size = 100;
    int tz_offset_minutes = 0;
    int transient_retries = 2;
    int transient_backoff_ms = 500;
    std::string accounts_file = "accounts.jsonl";
    std::string log_file;
    std::string log_level = "info";

    // Reads HARVESTER_* variables, keeping defaults for unset ones.
    // Throws std::invalid_argument for values that are not integers.
    static Config fromEnv();

    // Throws std::invalid_argument describing the first inconsistent value
    void validate() const;
};

// One flat JSON object per line: {"phone_number","gateway_url","session_token"}.
// Blank lines and lines starting with '#' are skipped; incomplete entries are
// logged and dropped. Throws std::runtime_error if the file cannot be opened.
std::vector<Credential> loadCredentials(const std::string& path);

} // namespace harvester

#endif // HARVESTER_CONFIG_HPP
