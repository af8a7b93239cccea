#include <spdlog/spdlog.h>
#include <kgrag/storage/connection_pool.h>

namespace kgrag::storage {

PooledConnection::PooledConnection(std::unique_ptr<Database> db,
                                   std::function<void(PooledConnection*)> returnFunc)
    : db_(std::move(db)), returnFunc_(std::move(returnFunc)) {}

PooledConnection::~PooledConnection() {
    if (db_ && returnFunc_ && !returned_) {
        returned_ = true;
        returnFunc_(this);
    }
}

ConnectionPool::ConnectionPool(std::string dbPath, const ConnectionPoolConfig& config)
    : dbPath_(std::move(dbPath)), config_(config) {
    if (dbPath_ == ":memory:") {
        config_.minConnections = 1;
        config_.maxConnections = 1;
        config_.enableWAL = false;
    }
    if (config_.maxConnections == 0) {
        config_.maxConnections = 1;
    }
    if (config_.minConnections > config_.maxConnections) {
        config_.minConnections = config_.maxConnections;
    }
}

ConnectionPool::~ConnectionPool() {
    shutdown();
}

Result<void> ConnectionPool::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        return Error{ErrorCode::InvalidState, "Pool is shut down"};
    }

    for (size_t i = 0; i < config_.minConnections; ++i) {
        auto connResult = createConnection();
        if (!connResult) {
            while (!available_.empty()) {
                available_.pop();
            }
            totalConnections_ = 0;
            return connResult.error();
        }
        available_.push(std::move(connResult).value());
        totalConnections_++;
    }

    spdlog::debug("Connection pool for {} initialized with {} connections", dbPath_,
                  config_.minConnections);
    return {};
}

void ConnectionPool::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
        return;
    }
    shutdown_ = true;
    while (!available_.empty()) {
        available_.pop();
    }
    totalConnections_ = 0;
    cv_.notify_all();
}

Result<std::unique_ptr<PooledConnection>> ConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    if (shutdown_) {
        return Error{ErrorCode::InvalidState, "Pool is shut down"};
    }

    auto deadline = std::chrono::steady_clock::now() + config_.acquireTimeout;
    while (available_.empty()) {
        if (totalConnections_ < config_.maxConnections) {
            totalConnections_++;
            lock.unlock();
            auto connResult = createConnection();
            lock.lock();
            if (!connResult) {
                totalConnections_--;
                return connResult.error();
            }
            activeConnections_++;
            return wrap(std::move(connResult).value());
        }

        if (!cv_.wait_until(lock, deadline, [this] { return !available_.empty() || shutdown_; })) {
            timeoutCount_++;
            return Error{ErrorCode::ResourceExhausted, "Timeout acquiring database connection"};
        }
        if (shutdown_) {
            return Error{ErrorCode::InvalidState, "Pool is shut down"};
        }
    }

    auto db = std::move(available_.front());
    available_.pop();
    activeConnections_++;
    return wrap(std::move(db));
}

std::unique_ptr<PooledConnection> ConnectionPool::wrap(std::unique_ptr<Database> db) {
    return std::make_unique<PooledConnection>(
        std::move(db), [this](PooledConnection* conn) { returnConnection(conn); });
}

void ConnectionPool::returnConnection(PooledConnection* conn) {
    std::lock_guard<std::mutex> lock(mutex_);
    activeConnections_--;
    if (shutdown_) {
        conn->db_.reset();
        return;
    }
    available_.push(std::move(conn->db_));
    cv_.notify_one();
}

Result<std::unique_ptr<Database>> ConnectionPool::createConnection() {
    OpenOptions options;
    options.busyTimeout = config_.busyTimeout;
    options.wal = config_.enableWAL;
    options.foreignKeys = config_.enableForeignKeys;

    auto db = std::make_unique<Database>();
    auto opened = db->open(dbPath_, options);
    if (!opened) {
        return opened.error();
    }
    return db;
}

ConnectionPool::Stats ConnectionPool::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Stats{totalConnections_.load(), available_.size(), activeConnections_.load(),
                 timeoutCount_.load()};
}

} // namespace kgrag::storage
