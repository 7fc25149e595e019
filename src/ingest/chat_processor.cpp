#include "../../include/ingest/chat_processor.hpp"
#include "../../include/ingest/window_resolver.hpp"
#include "../../include/remote/remote_errors.hpp"
#include "../../include/utils/logger.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace harvester {

struct ChatProcessor::ChatOutcome {
    enum class Status { Done, Failed, Inconsistent, Cancelled, Unauthorized };

    Status status = Status::Done;
    std::vector<IdentityRecord> records;
    std::string reason;
};

namespace {

void mergeInto(std::vector<IdentityRecord>& records,
               std::unordered_map<int64_t, size_t>& index,
               IdentityRecord&& record) {
    auto it = index.find(record.user_id);
    if (it == index.end()) {
        index.emplace(record.user_id, records.size());
        records.push_back(std::move(record));
    } else {
        records[it->second].mergeFrom(record);
    }
}

} // namespace

ChatProcessor::ChatProcessor(ChatSource& source,
                             const Credential& credential,
                             ProcessorOptions options,
                             const CancellationToken* cancel)
    : source_(source),
      credential_(credential),
      options_(options),
      cancel_(cancel),
      fetcher_(options.fetch, cancel) {
    if (options_.max_concurrent_chats < 1) options_.max_concurrent_chats = 1;
    if (options_.page_size < 1) options_.page_size = 1;
}

void ChatProcessor::setTaskObserver(TaskObserver observer) {
    observer_ = std::move(observer);
}

bool ChatProcessor::isEligible(const ChatInfo& chat) const {
    return chat.participant_count > options_.min_participants;
}

bool ChatProcessor::stopRequested() const {
    return cancel_ && cancel_->isCancelled();
}

CollectResult ChatProcessor::collect(const CalendarDate& target_date) {
    CollectResult result;
    const DayBounds day = calendar::dayBounds(target_date, options_.tz_offset_minutes);

    Logger::getInstance().banner("Processing Account " + credential_.id);
    if (stopRequested()) {
        result.cancelled = true;
        return result;
    }

    const auto chats = fetcher_.call([&]() { return source_.fetchChatMetadata(); },
                                     "chat list of " + credential_.id);
    result.chats_listed = static_cast<int>(chats.size());

    std::vector<ChatInfo> eligible;
    for (const auto& chat : chats) {
        if (isEligible(chat)) {
            eligible.push_back(chat);
        }
    }
    result.chats_eligible = static_cast<int>(eligible.size());
    Logger::getInstance().info("Found " + std::to_string(eligible.size()) + " active groups (filtered from " +
                               std::to_string(chats.size()) + " total) for " + credential_.id);
    if (eligible.empty()) {
        return result;
    }

    std::mutex merge_mutex;
    std::unordered_map<int64_t, size_t> index;
    std::atomic<size_t> next{0};
    std::atomic<bool> unauthorized{false};
    std::string unauthorized_reason;

    auto worker = [&]() {
        while (!stopRequested() && !unauthorized.load()) {
            const size_t i = next.fetch_add(1);
            if (i >= eligible.size()) {
                return;
            }
            const ChatInfo& chat = eligible[i];

            if (observer_) observer_(chat.id, true);
            ChatOutcome outcome = processChat(chat, day);
            if (observer_) observer_(chat.id, false);

            std::lock_guard<std::mutex> lock(merge_mutex);
            switch (outcome.status) {
                case ChatOutcome::Status::Done:
                    result.chats_attempted++;
                    for (auto& record : outcome.records) {
                        mergeInto(result.records, index, std::move(record));
                    }
                    break;
                case ChatOutcome::Status::Failed:
                    result.chats_attempted++;
                    result.chats_failed++;
                    result.failures.push_back({chat.id, chat.title, outcome.reason});
                    break;
                case ChatOutcome::Status::Inconsistent:
                    result.chats_attempted++;
                    result.anomalies.push_back({chat.id, chat.title, outcome.reason});
                    break;
                case ChatOutcome::Status::Cancelled:
                    break;
                case ChatOutcome::Status::Unauthorized:
                    if (!unauthorized.exchange(true)) {
                        unauthorized_reason = outcome.reason;
                    }
                    break;
            }
        }
    };

    const size_t worker_count = std::min<size_t>(static_cast<size_t>(options_.max_concurrent_chats), eligible.size());
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; i++) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }

    if (unauthorized) {
        throw AuthorizationError(unauthorized_reason);
    }

    if (stopRequested()) {
        result.cancelled = true;
        result.chats_cancelled = result.chats_eligible - result.chats_attempted;
        Logger::getInstance().warning("Run cancelled for " + credential_.id + ": " +
                                      std::to_string(result.chats_cancelled) + " chat(s) not completed");
    }

    Logger::getInstance().info("Total unique users collected for " + credential_.id + ": " +
                               std::to_string(result.records.size()));
    return result;
}

ChatProcessor::ChatOutcome ChatProcessor::processChat(const ChatInfo& chat, const DayBounds& day) {
    ChatOutcome outcome;
    Logger::getInstance().info("Processing group: " + chat.title + " (ID: " + std::to_string(chat.id) +
                               ", Members: " + std::to_string(chat.participant_count) + ")");
    try {
        WindowResolver resolver(source_, fetcher_);
        const WindowResolution resolution = resolver.resolve(chat, day);
        if (resolution.inconsistent) {
            outcome.status = ChatOutcome::Status::Inconsistent;
            outcome.reason = "message boundaries inconsistent after narrowing";
            return outcome;
        }
        if (!resolution.window) {
            return outcome;
        }

        const MessageWindow window = *resolution.window;
        std::vector<IdentityRecord> records;
        std::unordered_map<int64_t, size_t> seen;
        int message_count = 0;
        int64_t next_id = window.start_id;

        while (next_id <= window.end_id) {
            if (stopRequested()) {
                outcome.status = ChatOutcome::Status::Cancelled;
                return outcome;
            }

            MessageRange range;
            range.min_id = next_id;
            range.max_id = window.end_id;
            range.limit = options_.page_size;
            auto page = fetcher_.call([&]() { return source_.fetchMessageWindow(chat.id, range); },
                                      "history of " + chat.title);
            if (page.empty()) {
                break;
            }

            int64_t highest = next_id - 1;
            for (const auto& message : page) {
                if (message.id < next_id || message.id > window.end_id) {
                    continue;
                }
                highest = std::max(highest, message.id);
                if (!day.contains(message.date) || !message.sender) {
                    continue;
                }
                message_count++;
                mergeInto(records, seen,
                          IdentityRecord::fromSender(*message.sender, chat, message.date,
                                                     calendar::nowEpochSeconds(), credential_.id));
            }
            if (highest < next_id) {
                break;
            }
            next_id = highest + 1;
        }

        Logger::getInstance().info("Group " + chat.title + ": " + std::to_string(records.size()) +
                                   " unique users from " + std::to_string(message_count) + " messages");
        outcome.records = std::move(records);
    } catch (const AuthorizationError& e) {
        outcome.status = ChatOutcome::Status::Unauthorized;
        outcome.reason = e.what();
        Logger::getInstance().error("Authorization rejected while processing " + chat.title + ": " + e.what());
    } catch (const OperationCancelled&) {
        outcome.status = ChatOutcome::Status::Cancelled;
        outcome.records.clear();
    } catch (const std::exception& e) {
        outcome.status = ChatOutcome::Status::Failed;
        outcome.reason = e.what();
        outcome.records.clear();
        Logger::getInstance().error("Error processing " + chat.title + ": " + e.what());
    }
    return outcome;
}

} // namespace harvester
