#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <type_traits>
#include <kgrag/storage/database.h>

namespace kgrag::storage {

/**
 * @brief Configuration for connection pool
 */
struct ConnectionPoolConfig {
    size_t minConnections = 1;                  ///< Connections opened eagerly
    size_t maxConnections = 8;                  ///< Maximum connections allowed
    std::chrono::milliseconds acquireTimeout{5000};
    std::chrono::milliseconds busyTimeout{2000}; ///< SQLite busy timeout per connection
    bool enableWAL = true;
    bool enableForeignKeys = true;
};

/**
 * @brief Database connection handed out by the pool; returns itself on destruction
 */
class PooledConnection {
public:
    PooledConnection(std::unique_ptr<Database> db, std::function<void(PooledConnection*)> returnFunc);
    ~PooledConnection();

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    Database* operator->() { return db_.get(); }
    Database& operator*() { return *db_; }

    [[nodiscard]] bool isValid() const { return db_ != nullptr; }

private:
    friend class ConnectionPool;

    std::unique_ptr<Database> db_;
    std::function<void(PooledConnection*)> returnFunc_;
    bool returned_ = false;
};

/**
 * @brief Thread-safe SQLite connection pool
 *
 * A ":memory:" path is pinned to a single connection so every caller sees the same database.
 */
class ConnectionPool {
public:
    explicit ConnectionPool(std::string dbPath, const ConnectionPoolConfig& config = {});
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    Result<void> initialize();
    void shutdown();

    Result<std::unique_ptr<PooledConnection>> acquire();

    /**
     * @brief Execute a function with a pooled connection
     *
     * Exceptions escaping @p func are reported as DatabaseError results.
     */
    template <typename Func>
    auto withConnection(Func&& func) -> std::invoke_result_t<Func, Database&> {
        auto connResult = acquire();
        if (!connResult) {
            return connResult.error();
        }

        auto conn = std::move(connResult).value();
        try {
            return func(**conn);
        } catch (const std::exception& e) {
            return Error{ErrorCode::DatabaseError, e.what()};
        }
    }

    struct Stats {
        size_t totalConnections;
        size_t availableConnections;
        size_t activeConnections;
        size_t timeoutCount;
    };

    [[nodiscard]] Stats getStats() const;

    [[nodiscard]] const std::string& path() const { return dbPath_; }

private:
    std::string dbPath_;
    ConnectionPoolConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::unique_ptr<Database>> available_;
    std::atomic<size_t> totalConnections_{0};
    std::atomic<size_t> activeConnections_{0};
    std::atomic<size_t> timeoutCount_{0};
    bool shutdown_ = false;

    Result<std::unique_ptr<Database>> createConnection();
    void returnConnection(PooledConnection* conn);
    std::unique_ptr<PooledConnection> wrap(std::unique_ptr<Database> db);
};

} // namespace kgrag::storage
