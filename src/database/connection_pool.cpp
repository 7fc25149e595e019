#include "../../include/database/connection_pool.hpp"
#include "../../include/utils/logger.hpp"

namespace harvester {

ConnectionPool::Lease::Lease(ConnectionPool* pool, std::unique_ptr<DatabaseConnection> conn)
    : pool_(pool), conn_(std::move(conn)) {
}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), conn_(std::move(other.conn_)) {
    other.pool_ = nullptr;
}

ConnectionPool::Lease& ConnectionPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        if (pool_ && conn_) {
            pool_->release(std::move(conn_));
        }
        pool_ = other.pool_;
        conn_ = std::move(other.conn_);
        other.pool_ = nullptr;
    }
    return *this;
}

ConnectionPool::Lease::~Lease() {
    if (pool_ && conn_) {
        pool_->release(std::move(conn_));
    }
}

ConnectionPool::ConnectionPool(size_t size, Factory factory)
    : size_(size == 0 ? 1 : size), factory_(std::move(factory)) {
}

bool ConnectionPool::initialize() {
    std::vector<std::unique_ptr<DatabaseConnection>> opened;
    opened.reserve(size_);
    for (size_t i = 0; i < size_; i++) {
        auto conn = factory_();
        if (!conn) {
            Logger::getInstance().error("Failed to open pooled connection " + std::to_string(i + 1) +
                                        " of " + std::to_string(size_));
            return false;
        }
        opened.push_back(std::move(conn));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_ = std::move(opened);
    }
    available_.notify_all();
    Logger::getInstance().info("Connection pool ready with " + std::to_string(size_) + " connections");
    return true;
}

ConnectionPool::Lease ConnectionPool::acquire() {
    std::unique_ptr<DatabaseConnection> conn;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        available_.wait(lock, [this]() { return !idle_.empty(); });
        conn = std::move(idle_.back());
        idle_.pop_back();
    }
    // A dropped server connection is reset here; a never-opened one is handed out as is
    if (conn->getConnection() != nullptr && !conn->isConnected()) {
        conn->ensureConnected();
    }
    return Lease(this, std::move(conn));
}

size_t ConnectionPool::idleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

void ConnectionPool::release(std::unique_ptr<DatabaseConnection> conn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.push_back(std::move(conn));
    }
    available_.notify_one();
}

ConnectionPool::Factory ConnectionPool::connectWith(const DatabaseSettings& settings) {
    return [settings]() -> std::unique_ptr<DatabaseConnection> {
        auto conn = std::make_unique<DatabaseConnection>(settings);
        if (!conn->connect()) {
            return nullptr;
        }
        return conn;
    };
}

} // namespace harvester
