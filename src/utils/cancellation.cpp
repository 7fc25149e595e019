#include "../../include/utils/cancellation.hpp"

namespace harvester {

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool CancellationToken::isCancelled() const {
    return cancelled_.load();
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, duration, [this]() { return cancelled_.load(); });
}

} // namespace harvester
