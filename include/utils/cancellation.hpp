#ifndef HARVESTER_CANCELLATION_HPP
#define HARVESTER_CANCELLATION_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace harvester {

// Shared stop flag for one run. Sleepers wake up as soon as it is cancelled.
class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel();
    bool isCancelled() const;

    // Sleeps for `duration` unless cancelled first. Returns false if cancelled.
    bool waitFor(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace harvester

#endif // HARVESTER_CANCELLATION_HPP
