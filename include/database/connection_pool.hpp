#ifndef HARVESTER_CONNECTION_POOL_HPP
#define HARVESTER_CONNECTION_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include "db_connection.hpp"

namespace harvester {

/**
 * Fixed-size pool of PostgreSQL connections.
 * acquire() blocks until a connection is idle; a leased connection
 * belongs to exactly one caller until the lease is destroyed.
 */
class ConnectionPool {
public:
    using Factory = std::function<std::unique_ptr<DatabaseConnection>()>;

    class Lease {
    public:
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        ~Lease();

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        DatabaseConnection& operator*() const { return *conn_; }
        DatabaseConnection* operator->() const { return conn_.get(); }

    private:
        friend class ConnectionPool;
        Lease(ConnectionPool* pool, std::unique_ptr<DatabaseConnection> conn);

        ConnectionPool* pool_;
        std::unique_ptr<DatabaseConnection> conn_;
    };

    ConnectionPool(size_t size, Factory factory);

    // Opens every connection. False if the factory fails for any slot.
    bool initialize();

    Lease acquire();

    size_t size() const { return size_; }
    size_t idleCount() const;

    // Factory that opens a connection with the given settings, nullptr on failure
    static Factory connectWith(const DatabaseSettings& settings);

private:
    void release(std::unique_ptr<DatabaseConnection> conn);

    size_t size_;
    Factory factory_;
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::vector<std::unique_ptr<DatabaseConnection>> idle_;
};

} // namespace harvester

#endif // HARVESTER_CONNECTION_POOL_HPP
