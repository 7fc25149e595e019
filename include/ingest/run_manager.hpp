#ifndef HARVESTER_RUN_MANAGER_HPP
#define HARVESTER_RUN_MANAGER_HPP

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "chat_processor.hpp"
#include "persistence_engine.hpp"
#include "../database/record_store.hpp"
#include "../models/chat.hpp"
#include "../remote/chat_source.hpp"
#include "../utils/calendar.hpp"
#include "../utils/cancellation.hpp"

namespace harvester {

struct CredentialSummary {
    std::string credential_id;
    int chats_listed = 0;
    int chats_eligible = 0;
    int chats_attempted = 0;
    int chats_failed = 0;
    int chats_cancelled = 0;
    std::vector<ChatFailure> failures;
    std::vector<ChatFailure> anomalies;
    size_t collected_count = 0;
    size_t inserted_count = 0;
    size_t duplicate_count = 0;
    std::vector<BatchError> batch_errors;
    std::string backup_name;
    std::string backup_error;
    bool needs_reauthorization = false;
    bool cancelled = false;
    std::string error;
    std::vector<IdentityRecord> inserted_records;
};

struct RunReport {
    std::string run_id;
    std::string requested_by;
    CalendarDate target_date;
    std::vector<CredentialSummary> summaries;
    bool cancelled = false;
    int64_t started_at = 0;
    int64_t finished_at = 0;

    size_t totalInserted() const;
    bool allSucceeded() const;   // every credential summarised without auth or fatal errors
};

enum class RunState { Running, Finished };

struct RunStatus {
    RunState state = RunState::Running;
    size_t credentials_total = 0;
    size_t credentials_finished = 0;
    bool cancel_requested = false;
};

// Outbound hooks for export and reporting
class RunObserver {
public:
    virtual ~RunObserver() = default;
    virtual void onCredentialFinished(const std::string& run_id, const CredentialSummary& summary) = 0;
    virtual void onRunFinished(const RunReport& report) = 0;
};

class Run {
public:
    Run(std::string id, std::string requested_by, CalendarDate target_date, size_t credential_count);

    const std::string& id() const { return id_; }
    const std::string& requestedBy() const { return requested_by_; }
    const CalendarDate& targetDate() const { return target_date_; }

    void cancel();
    RunStatus status() const;

    // Blocks until the run is terminal
    RunReport wait();

private:
    friend class RunManager;

    void credentialFinished(CredentialSummary summary);
    void finish(RunReport report);
    bool isFinished() const;

    const std::string id_;
    const std::string requested_by_;
    const CalendarDate target_date_;
    const size_t credential_count_;

    CancellationToken cancel_;
    mutable std::mutex mutex_;
    std::condition_variable done_;
    std::vector<CredentialSummary> summaries_;
    bool finished_ = false;
    RunReport report_;
    std::thread supervisor_;
};

using RunHandle = std::shared_ptr<Run>;

/**
 * Active runs keyed by run id, plus the requester index that
 * enforces one active run per requester.
 */
class RunRegistry {
public:
    // False when the requester already has an active run
    bool add(const RunHandle& run);
    void remove(const std::string& run_id);

    RunHandle find(const std::string& run_id) const;
    bool hasActiveRun(const std::string& requested_by) const;
    size_t activeCount() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, RunHandle> runs_;
    std::map<std::string, std::string> by_requester_;
};

struct RunOptions {
    ProcessorOptions processor;
    size_t batch_size = 1000;
};

class RunManager {
public:
    using SourceFactory = std::function<std::unique_ptr<ChatSource>(const Credential&)>;

    RunManager(RecordStore& store, SourceFactory source_factory, RunOptions options,
               RunObserver* observer = nullptr);
    ~RunManager();

    RunManager(const RunManager&) = delete;
    RunManager& operator=(const RunManager&) = delete;

    // nullptr when the requester already has an active run
    RunHandle startRun(const std::vector<Credential>& credentials,
                       const CalendarDate& target_date,
                       const std::string& requested_by);

    void cancel(const RunHandle& run);
    RunStatus status(const RunHandle& run) const;
    RunReport wait(const RunHandle& run);

    const RunRegistry& registry() const { return registry_; }

    // Cancels active runs and joins every run thread
    void shutdown();

private:
    void supervise(Run& run, std::vector<Credential> credentials);
    CredentialSummary runCredential(const Credential& credential, const CalendarDate& date,
                                    const CancellationToken& cancel);
    void reapFinished();

    RecordStore& store_;
    SourceFactory source_factory_;
    RunOptions options_;
    RunObserver* observer_;
    RunRegistry registry_;

    std::mutex launched_mutex_;
    std::vector<RunHandle> launched_;
    std::atomic<unsigned> run_seq_{0};
};

} // namespace harvester

#endif // HARVESTER_RUN_MANAGER_HPP
