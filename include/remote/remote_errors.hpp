#ifndef HARVESTER_REMOTE_ERRORS_HPP
#define HARVESTER_REMOTE_ERRORS_HPP

#include <chrono>
#include <stdexcept>
#include <string>

namespace harvester {

// Permanent remote failure (forbidden chat, malformed reply, unexpected status)
class RemoteError : public std::runtime_error {
public:
    explicit RemoteError(const std::string& message) : std::runtime_error(message) {}
};

// Server asked us to wait before the next request (Telegram FLOOD_WAIT)
class RateLimitedError : public RemoteError {
public:
    RateLimitedError(std::chrono::milliseconds wait, const std::string& message)
        : RemoteError(message), wait_(wait) {}

    std::chrono::milliseconds wait() const { return wait_; }

private:
    std::chrono::milliseconds wait_;
};

// Connection reset, timeout, 5xx: worth a few quick retries
class TransientNetworkError : public RemoteError {
public:
    explicit TransientNetworkError(const std::string& message) : RemoteError(message) {}
};

// Session invalid or expired; the credential must be re-authorized
class AuthorizationError : public RemoteError {
public:
    explicit AuthorizationError(const std::string& message) : RemoteError(message) {}
};

class OperationCancelled : public std::runtime_error {
public:
    OperationCancelled() : std::runtime_error("operation cancelled") {}
};

} // namespace harvester

#endif // HARVESTER_REMOTE_ERRORS_HPP
