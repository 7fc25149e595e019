#include "database/connection_pool.hpp"
#include "database/pg_record_store.hpp"
#include "ingest/run_manager.hpp"
#include "remote/http_chat_source.hpp"
#include "storage/in_memory_record_store.hpp"
#include "utils/calendar.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"
#include <boost/filesystem.hpp>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

namespace fs = boost::filesystem;

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void signalHandler(int) {
    g_stop_requested = 1;
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " <YYYY-MM-DD | DD.MM.YYYY | --missed>" << std::endl;
}

// Writes the per-account summary the way operators read it in the log
class SummaryLogger : public harvester::RunObserver {
public:
    void onCredentialFinished(const std::string& run_id, const harvester::CredentialSummary& summary) override {
        auto& log = harvester::Logger::getInstance();
        log.info("[" + run_id + "] Account " + summary.credential_id + ": " +
                 std::to_string(summary.chats_attempted) + "/" + std::to_string(summary.chats_eligible) +
                 " chats, " + std::to_string(summary.collected_count) + " users collected, " +
                 std::to_string(summary.inserted_count) + " new, " +
                 std::to_string(summary.duplicate_count) + " already known");
        for (const auto& failure : summary.failures) {
            log.warning("  chat " + failure.title + " (ID: " + std::to_string(failure.chat_id) + ") failed: " +
                        failure.reason);
        }
        for (const auto& anomaly : summary.anomalies) {
            log.warning("  chat " + anomaly.title + " (ID: " + std::to_string(anomaly.chat_id) + ") skipped: " +
                        anomaly.reason);
        }
        for (const auto& error : summary.batch_errors) {
            log.error("  batch " + std::to_string(error.batch_index) + " (" + std::to_string(error.record_count) +
                      " users) not saved: " + error.message);
        }
        if (!summary.backup_error.empty()) {
            log.error("  nothing saved, backup failed: " + summary.backup_error);
        }
        if (summary.needs_reauthorization) {
            log.error("  session rejected, account needs to be authorised again");
        }
    }

    void onRunFinished(const harvester::RunReport& report) override {
        harvester::Logger::getInstance().info("Run " + report.run_id + " for " + report.target_date.toString() +
                                              " saved " + std::to_string(report.totalInserted()) + " new users in " +
                                              std::to_string(report.finished_at - report.started_at) + "s");
    }
};

void logStats(harvester::RecordStore& store) {
    auto stats = store.stats();
    if (!stats) {
        harvester::Logger::getInstance().warning("Could not read database statistics");
        return;
    }
    harvester::Logger::getInstance().info(
        "Database: " + std::to_string(stats->total_users) + " users, " +
        std::to_string(stats->with_username) + " with username, " +
        std::to_string(stats->premium_users) + " premium, " +
        std::to_string(stats->verified_users) + " verified, " +
        std::to_string(stats->bot_accounts) + " bots, from " +
        std::to_string(stats->source_chats) + " chats");
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace harvester;

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    if (argc != 2) {
        printUsage(argv[0]);
        return 1;
    }
    const std::string target = argv[1];

    Config config;
    try {
        config = Config::fromEnv();
        config.validate();
    } catch (const std::invalid_argument& e) {
        Logger::getInstance().error(std::string("Configuration error: ") + e.what());
        return 1;
    }

    Logger::getInstance().setMinLevel(Logger::parseLevel(config.log_level));
    if (!config.log_file.empty()) {
        fs::path log_dir = fs::path(config.log_file).parent_path();
        boost::system::error_code ec;
        if (!log_dir.empty() && !fs::exists(log_dir)) {
            fs::create_directories(log_dir, ec);
        }
        if (ec) {
            Logger::getInstance().warning("Could not create log directory " + log_dir.string() + ": " + ec.message());
        } else {
            Logger::getInstance().setLogFile(config.log_file);
        }
    }
    Logger::getInstance().info("Starting harvester...");

    if (!fs::exists(config.accounts_file) || !fs::is_regular_file(config.accounts_file)) {
        Logger::getInstance().error("Accounts file not found: " + config.accounts_file);
        return 1;
    }
    std::vector<Credential> credentials;
    try {
        credentials = loadCredentials(config.accounts_file);
    } catch (const std::runtime_error& e) {
        Logger::getInstance().error(e.what());
        return 1;
    }
    if (credentials.empty()) {
        Logger::getInstance().error("No usable accounts in " + config.accounts_file);
        return 1;
    }

    std::unique_ptr<ConnectionPool> pool;
    std::unique_ptr<RecordStore> store;
    if (config.storage_backend == "memory") {
        Logger::getInstance().warning("Using in-memory storage, nothing will be kept after exit");
        store = std::make_unique<InMemoryRecordStore>();
    } else {
        pool = std::make_unique<ConnectionPool>(static_cast<size_t>(config.db.pool_size),
                                                ConnectionPool::connectWith(config.db));
        if (!pool->initialize()) {
            Logger::getInstance().error("Failed to connect to database");
            return 1;
        }
        auto pg_store = std::make_unique<PgRecordStore>(*pool);
        if (!pg_store->initialize()) {
            Logger::getInstance().error("Failed to initialise database schema");
            return 1;
        }
        store = std::move(pg_store);
    }

    const CalendarDate today = calendar::today(config.tz_offset_minutes);
    std::vector<CalendarDate> dates;
    if (target == "--missed") {
        auto last = store->lastCollectedAt();
        if (!last) {
            Logger::getInstance().warning("No previous collection found, run a regular collection first");
            return 0;
        }
        dates = calendar::missedDates(calendar::dateOf(*last, config.tz_offset_minutes), today);
        if (dates.empty()) {
            Logger::getInstance().info("No missed days, database is up to date");
            return 0;
        }
        Logger::getInstance().info("Found " + std::to_string(dates.size()) + " missed day(s) from " +
                                   dates.front().toString() + " to " + dates.back().toString());
    } else {
        auto date = calendar::parseDate(target);
        if (!date) {
            Logger::getInstance().error("Invalid date: " + target);
            printUsage(argv[0]);
            return 1;
        }
        if (today < *date) {
            Logger::getInstance().error("Cannot collect for a future date: " + date->toString());
            return 1;
        }
        dates.push_back(*date);
    }

    RunOptions options;
    options.processor.max_concurrent_chats = config.chat_concurrency;
    options.processor.min_participants = config.min_participants;
    options.processor.page_size = config.page_size;
    options.processor.tz_offset_minutes = config.tz_offset_minutes;
    options.processor.fetch.max_transient_retries = config.transient_retries;
    options.processor.fetch.transient_backoff = std::chrono::milliseconds(config.transient_backoff_ms);
    options.batch_size = static_cast<size_t>(config.batch_size);

    SummaryLogger summary_logger;
    RunManager manager(*store,
                       [](const Credential& credential) -> std::unique_ptr<ChatSource> {
                           return std::make_unique<HttpChatSource>(credential);
                       },
                       options, &summary_logger);

    int exit_code = 0;
    for (const auto& date : dates) {
        RunHandle run = manager.startRun(credentials, date, "cli");
        if (!run) {
            exit_code = 1;
            break;
        }

        bool cancel_sent = false;
        while (manager.status(run).state == RunState::Running) {
            if (g_stop_requested && !cancel_sent) {
                manager.cancel(run);
                cancel_sent = true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        RunReport report = manager.wait(run);
        if (!report.allSucceeded()) {
            exit_code = 1;
        }
        if (report.cancelled || g_stop_requested) {
            Logger::getInstance().warning("Stopped before all dates were collected");
            exit_code = 1;
            break;
        }
    }

    logStats(*store);
    return exit_code;
}
