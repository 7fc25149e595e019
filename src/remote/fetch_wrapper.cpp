#include "../../include/remote/fetch_wrapper.hpp"
#include "../../include/utils/logger.hpp"
#include <thread>

namespace harvester {

RateLimitedFetcher::RateLimitedFetcher(FetchPolicy policy, const CancellationToken* cancel)
    : policy_(policy), cancel_(cancel) {
}

void RateLimitedFetcher::throwIfCancelled() const {
    if (cancel_ && cancel_->isCancelled()) {
        throw OperationCancelled();
    }
}

void RateLimitedFetcher::waitOutRateLimit(const RateLimitedError& e, const std::string& what) const {
    Logger::getInstance().warning("FloodWait in " + what + ": waiting " +
                                  std::to_string(e.wait().count()) + " ms (" + e.what() + ")");
    sleepFor(e.wait());
}

void RateLimitedFetcher::backOff(const TransientNetworkError& e, const std::string& what, int attempt) const {
    const auto delay = policy_.transient_backoff * (1 << attempt);
    Logger::getInstance().warning("Attempt " + std::to_string(attempt + 1) + "/" +
                                  std::to_string(policy_.max_transient_retries + 1) + " failed for " + what +
                                  ": " + e.what() + ". Retrying in " + std::to_string(delay.count()) + " ms");
    sleepFor(delay);
}

void RateLimitedFetcher::logTransientGiveUp(const TransientNetworkError& e, const std::string& what, int attempts) const {
    Logger::getInstance().error("All " + std::to_string(attempts) + " attempts failed for " + what + ": " + e.what());
}

void RateLimitedFetcher::sleepFor(std::chrono::milliseconds duration) const {
    if (duration.count() <= 0) {
        return;
    }
    if (cancel_) {
        if (!cancel_->waitFor(duration)) {
            throw OperationCancelled();
        }
        return;
    }
    std::this_thread::sleep_for(duration);
}

} // namespace harvester
