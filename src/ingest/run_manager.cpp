#include "../../include/ingest/run_manager.hpp"
#include "../../include/remote/remote_errors.hpp"
#include "../../include/utils/logger.hpp"

namespace harvester {

// ========== RunReport ==========

size_t RunReport::totalInserted() const {
    size_t total = 0;
    for (const auto& summary : summaries) {
        total += summary.inserted_count;
    }
    return total;
}

bool RunReport::allSucceeded() const {
    for (const auto& summary : summaries) {
        if (summary.needs_reauthorization || !summary.error.empty()) {
            return false;
        }
    }
    return true;
}

// ========== Run ==========

Run::Run(std::string id, std::string requested_by, CalendarDate target_date, size_t credential_count)
    : id_(std::move(id)),
      requested_by_(std::move(requested_by)),
      target_date_(target_date),
      credential_count_(credential_count) {
}

void Run::cancel() {
    if (isFinished()) {
        return;
    }
    Logger::getInstance().warning("Cancelling run " + id_);
    cancel_.cancel();
}

RunStatus Run::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    RunStatus status;
    status.state = finished_ ? RunState::Finished : RunState::Running;
    status.credentials_total = credential_count_;
    status.credentials_finished = summaries_.size();
    status.cancel_requested = cancel_.isCancelled();
    return status;
}

RunReport Run::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    done_.wait(lock, [this]() { return finished_; });
    return report_;
}

void Run::credentialFinished(CredentialSummary summary) {
    std::lock_guard<std::mutex> lock(mutex_);
    summaries_.push_back(std::move(summary));
}

void Run::finish(RunReport report) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        report_ = std::move(report);
        finished_ = true;
    }
    done_.notify_all();
}

bool Run::isFinished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

// ========== RunRegistry ==========

bool RunRegistry::add(const RunHandle& run) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (by_requester_.count(run->requestedBy())) {
        return false;
    }
    runs_[run->id()] = run;
    by_requester_[run->requestedBy()] = run->id();
    return true;
}

void RunRegistry::remove(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return;
    }
    auto owner = by_requester_.find(it->second->requestedBy());
    if (owner != by_requester_.end() && owner->second == run_id) {
        by_requester_.erase(owner);
    }
    runs_.erase(it);
}

RunHandle RunRegistry::find(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    return it == runs_.end() ? nullptr : it->second;
}

bool RunRegistry::hasActiveRun(const std::string& requested_by) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return by_requester_.count(requested_by) > 0;
}

size_t RunRegistry::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runs_.size();
}

// ========== RunManager ==========

RunManager::RunManager(RecordStore& store, SourceFactory source_factory, RunOptions options,
                       RunObserver* observer)
    : store_(store),
      source_factory_(std::move(source_factory)),
      options_(options),
      observer_(observer) {
}

RunManager::~RunManager() {
    shutdown();
}

RunHandle RunManager::startRun(const std::vector<Credential>& credentials,
                               const CalendarDate& target_date,
                               const std::string& requested_by) {
    reapFinished();

    const std::string run_id = "run-" + std::to_string(calendar::nowEpochSeconds()) + "-" +
                               std::to_string(run_seq_.fetch_add(1) + 1);
    auto run = std::make_shared<Run>(run_id, requested_by, target_date, credentials.size());
    if (!registry_.add(run)) {
        Logger::getInstance().warning("Run request from " + requested_by + " refused: a run is already active");
        return nullptr;
    }

    Logger::getInstance().info("Starting " + run_id + " for " + target_date.toString() + " with " +
                               std::to_string(credentials.size()) + " account(s), requested by " + requested_by);

    Run* raw = run.get();
    {
        std::lock_guard<std::mutex> lock(launched_mutex_);
        raw->supervisor_ = std::thread([this, raw, credentials]() { supervise(*raw, credentials); });
        launched_.push_back(run);
    }
    return run;
}

void RunManager::cancel(const RunHandle& run) {
    if (run) run->cancel();
}

RunStatus RunManager::status(const RunHandle& run) const {
    return run ? run->status() : RunStatus{RunState::Finished, 0, 0, false};
}

RunReport RunManager::wait(const RunHandle& run) {
    if (!run) {
        return RunReport{};
    }
    return run->wait();
}

void RunManager::shutdown() {
    std::vector<RunHandle> runs;
    {
        std::lock_guard<std::mutex> lock(launched_mutex_);
        runs.swap(launched_);
    }
    for (auto& run : runs) {
        run->cancel();
    }
    for (auto& run : runs) {
        if (run->supervisor_.joinable()) {
            run->supervisor_.join();
        }
    }
}

void RunManager::reapFinished() {
    std::vector<RunHandle> done;
    {
        std::lock_guard<std::mutex> lock(launched_mutex_);
        auto it = launched_.begin();
        while (it != launched_.end()) {
            if ((*it)->isFinished()) {
                done.push_back(*it);
                it = launched_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& run : done) {
        if (run->supervisor_.joinable()) {
            run->supervisor_.join();
        }
    }
}

void RunManager::supervise(Run& run, std::vector<Credential> credentials) {
    RunReport report;
    report.run_id = run.id();
    report.requested_by = run.requestedBy();
    report.target_date = run.targetDate();
    report.started_at = calendar::nowEpochSeconds();

    std::vector<std::thread> workers;
    workers.reserve(credentials.size());
    for (const auto& credential : credentials) {
        workers.emplace_back([this, &run, credential]() {
            CredentialSummary summary = runCredential(credential, run.targetDate(), run.cancel_);
            if (observer_) {
                try {
                    observer_->onCredentialFinished(run.id(), summary);
                } catch (const std::exception& e) {
                    Logger::getInstance().error("Run observer failed for " + credential.id + ": " + e.what());
                }
            }
            run.credentialFinished(std::move(summary));
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    report.cancelled = run.cancel_.isCancelled();
    report.finished_at = calendar::nowEpochSeconds();
    {
        std::lock_guard<std::mutex> lock(run.mutex_);
        report.summaries = run.summaries_;
    }

    Logger::getInstance().banner("Run " + run.id() + (report.cancelled ? " cancelled" : " finished"));
    Logger::getInstance().info("Total new users saved: " + std::to_string(report.totalInserted()));

    if (observer_) {
        try {
            observer_->onRunFinished(report);
        } catch (const std::exception& e) {
            Logger::getInstance().error("Run observer failed for " + run.id() + ": " + e.what());
        }
    }

    registry_.remove(run.id());
    run.finish(std::move(report));
}

CredentialSummary RunManager::runCredential(const Credential& credential, const CalendarDate& date,
                                            const CancellationToken& cancel) {
    CredentialSummary summary;
    summary.credential_id = credential.id;

    try {
        std::unique_ptr<ChatSource> source = source_factory_(credential);
        if (!source) {
            throw std::runtime_error("no chat source for " + credential.id);
        }

        ChatProcessor processor(*source, credential, options_.processor, &cancel);
        CollectResult collected = processor.collect(date);
        summary.chats_listed = collected.chats_listed;
        summary.chats_eligible = collected.chats_eligible;
        summary.chats_attempted = collected.chats_attempted;
        summary.chats_failed = collected.chats_failed;
        summary.chats_cancelled = collected.chats_cancelled;
        summary.failures = std::move(collected.failures);
        summary.anomalies = std::move(collected.anomalies);
        summary.cancelled = collected.cancelled;
        summary.collected_count = collected.records.size();

        // Records from chats that completed before a cancel are still saved
        PersistenceEngine engine(store_, options_.batch_size);
        PersistResult persisted = engine.persist(collected.records);
        summary.inserted_count = persisted.inserted_count;
        summary.duplicate_count = persisted.duplicate_count;
        summary.batch_errors = std::move(persisted.batch_errors);
        summary.backup_error = persisted.backup_error;
        if (persisted.backup) {
            summary.backup_name = persisted.backup->name;
        }
        summary.inserted_records = std::move(persisted.inserted_records);
        if (persisted.writer_failed) {
            summary.error = "storage writer failed after " + std::to_string(summary.inserted_count) +
                            " new users were saved";
        }
    } catch (const AuthorizationError& e) {
        summary.needs_reauthorization = true;
        summary.error = e.what();
        Logger::getInstance().error("Account " + credential.id + " needs reauthorization: " + e.what());
    } catch (const OperationCancelled&) {
        summary.cancelled = true;
        Logger::getInstance().warning("Account " + credential.id + " cancelled before any chat completed");
    } catch (const std::exception& e) {
        summary.error = e.what();
        Logger::getInstance().error("Error processing account " + credential.id + ": " + e.what());
    }

    Logger::getInstance().info("Account " + credential.id + ": " + std::to_string(summary.inserted_count) +
                               " new, " + std::to_string(summary.duplicate_count) + " known, " +
                               std::to_string(summary.chats_failed) + " failed chats");
    return summary;
}

} // namespace harvester
