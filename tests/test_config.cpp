#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include "utils/config.hpp"
#include "utils/token_hash.hpp"

using namespace harvester;

namespace {

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        setenv(name, value, 1);
    }
    ~ScopedEnv() { unsetenv(name_); }

private:
    const char* name_;
};

std::string writeTempFile(const std::string& contents) {
    char path[] = "/tmp/harvester_accounts_XXXXXX";
    int fd = mkstemp(path);
    if (fd < 0) {
        throw std::runtime_error("mkstemp failed");
    }
    close(fd);
    std::ofstream out(path);
    out << contents;
    return path;
}

} // namespace

TEST(ConfigTest, DefaultsMatchDocumentedValues) {
    Config config = Config::fromEnv();
    EXPECT_EQ(config.db.pool_size, 5);
    EXPECT_EQ(config.batch_size, 1000);
    EXPECT_EQ(config.chat_concurrency, 3);
    EXPECT_EQ(config.min_participants, 10);
    EXPECT_EQ(config.page_size, 100);
    EXPECT_EQ(config.tz_offset_minutes, 0);
    EXPECT_EQ(config.transient_retries, 2);
    EXPECT_EQ(config.transient_backoff_ms, 500);
    EXPECT_EQ(config.storage_backend, "postgres");
    EXPECT_NO_THROW(config.validate());
}

TEST(ConfigTest, ReadsOverridesFromEnvironment) {
    ScopedEnv host("HARVESTER_DB_HOST", "db.internal");
    ScopedEnv pool("HARVESTER_DB_POOL_SIZE", "8");
    ScopedEnv batch("HARVESTER_BATCH_SIZE", "250");
    ScopedEnv tz("HARVESTER_TZ_OFFSET_MINUTES", "-300");
    ScopedEnv storage("HARVESTER_STORAGE", "memory");

    Config config = Config::fromEnv();
    EXPECT_EQ(config.db.host, "db.internal");
    EXPECT_EQ(config.db.pool_size, 8);
    EXPECT_EQ(config.batch_size, 250);
    EXPECT_EQ(config.tz_offset_minutes, -300);
    EXPECT_EQ(config.storage_backend, "memory");
    EXPECT_NO_THROW(config.validate());
}

TEST(ConfigTest, RejectsNonIntegerValues) {
    ScopedEnv batch("HARVESTER_BATCH_SIZE", "12abc");
    EXPECT_THROW(Config::fromEnv(), std::invalid_argument);
}

TEST(ConfigTest, ValidateRejectsInconsistentValues) {
    Config config;
    config.page_size = 101;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = Config();
    config.storage_backend = "sqlite";
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = Config();
    config.chat_concurrency = 0;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = Config();
    config.db.pool_size = 0;
    EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(ConfigTest, TransientRetriesAreCapped) {
    Config config;
    config.transient_retries = Config::kMaxTransientRetries;
    EXPECT_NO_THROW(config.validate());

    config.transient_retries = 40;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    ScopedEnv retries("HARVESTER_TRANSIENT_RETRIES", "31");
    Config from_env = Config::fromEnv();
    EXPECT_THROW(from_env.validate(), std::invalid_argument);
}

TEST(ConfigTest, LoadsAccountsSkippingCommentsAndIncompleteEntries) {
    const std::string path = writeTempFile(
        "# primary accounts\n"
        "{\"phone_number\":\"+15550001\",\"gateway_url\":\"http://gw1:8080/\",\"session_token\":\"t1\"}\n"
        "\n"
        "{\"phone_number\":\"+15550002\",\"gateway_url\":\"http://gw2:8080\"}\n"
        "{\"phone_number\":\"+15550003\",\"gateway_url\":\"http://gw3:8080\",\"session_token\":\"t3\"}\n");

    auto credentials = loadCredentials(path);
    std::remove(path.c_str());

    ASSERT_EQ(credentials.size(), 2u);
    EXPECT_EQ(credentials[0].id, "+15550001");
    EXPECT_EQ(credentials[0].gateway_url, "http://gw1:8080");
    EXPECT_EQ(credentials[0].session_token, "t1");
    EXPECT_EQ(credentials[1].id, "+15550003");
}

TEST(ConfigTest, MissingAccountsFileThrows) {
    EXPECT_THROW(loadCredentials("/nonexistent/accounts.jsonl"), std::runtime_error);
}

TEST(TokenHashTest, HashesWithSha256) {
    EXPECT_EQ(hashSessionToken("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(hashSessionToken(""), "");
    EXPECT_EQ(tokenFingerprint("abc"), "ba7816bf8f01");
}
