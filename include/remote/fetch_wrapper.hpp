#ifndef HARVESTER_FETCH_WRAPPER_HPP
#define HARVESTER_FETCH_WRAPPER_HPP

#include <chrono>
#include <string>
#include "remote_errors.hpp"
#include "../utils/cancellation.hpp"

namespace harvester {

struct FetchPolicy {
    int max_transient_retries = 2;
    std::chrono::milliseconds transient_backoff{500};   // doubled after each retry
};

/**
 * Runs one remote read and hides the server's rate limiting from the caller.
 *
 * A RateLimitedError makes the fetcher sleep for exactly the requested wait
 * and try again, with no attempt cap. TransientNetworkError is retried up to
 * policy.max_transient_retries times before being rethrown. Everything else
 * propagates on first occurrence.
 *
 * The fetcher holds no mutable state, so one instance may be shared by all
 * chat tasks of a credential. When a cancellation token is attached, no
 * request is issued once it fires, waits end early and OperationCancelled is
 * thrown instead of retrying.
 */
class RateLimitedFetcher {
public:
    explicit RateLimitedFetcher(FetchPolicy policy = FetchPolicy(),
                                const CancellationToken* cancel = nullptr);

    template <typename Fn>
    auto call(Fn&& fn, const std::string& what) const -> decltype(fn()) {
        int transient_failures = 0;
        while (true) {
            throwIfCancelled();
            try {
                return fn();
            } catch (const RateLimitedError& e) {
                waitOutRateLimit(e, what);
            } catch (const TransientNetworkError& e) {
                if (transient_failures >= policy_.max_transient_retries) {
                    logTransientGiveUp(e, what, transient_failures + 1);
                    throw;
                }
                backOff(e, what, transient_failures);
                transient_failures++;
            }
        }
    }

private:
    void throwIfCancelled() const;
    void waitOutRateLimit(const RateLimitedError& e, const std::string& what) const;
    void backOff(const TransientNetworkError& e, const std::string& what, int attempt) const;
    void logTransientGiveUp(const TransientNetworkError& e, const std::string& what, int attempts) const;
    void sleepFor(std::chrono::milliseconds duration) const;

    FetchPolicy policy_;
    const CancellationToken* cancel_;
};

} // namespace harvester

#endif // HARVESTER_FETCH_WRAPPER_HPP
