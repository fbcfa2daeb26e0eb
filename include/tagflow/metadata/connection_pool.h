#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <stop_token>
#include <string>
#include <thread>
#include <tagflow/metadata/database.h>

namespace tagflow::metadata {

/**
 * @brief Configuration for connection pool
 */
struct ConnectionPoolConfig {
    size_t minConnections = 2;                   ///< Minimum connections to maintain
    size_t maxConnections = 10;                  ///< Maximum connections allowed
    std::chrono::seconds idleTimeout{300};       ///< Idle connection timeout
    std::chrono::seconds maxConnectionAge{3600}; ///< Maximum connection age before refresh
    std::chrono::milliseconds busyTimeout{2000}; ///< SQLite busy timeout
    bool enableWAL = true;                       ///< Enable WAL mode
    bool enableForeignKeys = true;               ///< Enable foreign key constraints
    bool enableMaintenance = true;               ///< Background prune/health thread
};

/**
 * @brief Database connection wrapper with metadata
 *
 * Returns itself to the owning pool on destruction.
 */
class PooledConnection {
public:
    explicit PooledConnection(std::unique_ptr<Database> db,
                              std::function<void(PooledConnection*)> returnFunc);
    ~PooledConnection();

    // Move-only
    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;
    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    Database* operator->() { return db_.get(); }
    const Database* operator->() const { return db_.get(); }
    Database& operator*() { return *db_; }
    const Database& operator*() const { return *db_; }

    [[nodiscard]] bool isValid() const { return db_ != nullptr; }

    [[nodiscard]] std::chrono::steady_clock::time_point lastAccessed() const {
        return lastAccessed_;
    }

    [[nodiscard]] std::chrono::steady_clock::time_point createdAt() const { return createdAt_; }

    void touch() { lastAccessed_ = std::chrono::steady_clock::now(); }

private:
    friend class ConnectionPool;

    std::unique_ptr<Database> db_;
    std::function<void(PooledConnection*)> returnFunc_;
    std::chrono::steady_clock::time_point lastAccessed_;
    std::chrono::steady_clock::time_point createdAt_{std::chrono::steady_clock::now()};
    bool returned_ = false;
};

/**
 * @brief Thread-safe database connection pool
 */
class ConnectionPool {
public:
    explicit ConnectionPool(const std::string& dbPath, const ConnectionPoolConfig& config = {});
    ~ConnectionPool();

    // Non-copyable, non-movable
    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;
    ConnectionPool(ConnectionPool&&) = delete;
    ConnectionPool& operator=(ConnectionPool&&) = delete;

    /**
     * @brief Open the minimum number of connections
     */
    Result<void> initialize();

    /**
     * @brief Shutdown the connection pool
     */
    void shutdown();

    /**
     * @brief Acquire a connection from the pool
     */
    Result<std::unique_ptr<PooledConnection>>
    acquire(std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    /**
     * @brief Current pool statistics
     */
    struct Stats {
        size_t totalConnections;
        size_t availableConnections;
        size_t activeConnections;
        size_t waitingRequests;
        size_t timeoutCount;
        size_t totalAcquired;
        size_t totalReleased;
        size_t failedAcquisitions;
    };

    [[nodiscard]] Stats getStats() const;

    /**
     * @brief Top the pool back up to minConnections
     */
    Result<void> healthCheck();

    /**
     * @brief Drop idle or aged connections above minConnections
     */
    void pruneIdleConnections();

    [[nodiscard]] const std::string& path() const { return dbPath_; }

private:
    std::string dbPath_;
    ConnectionPoolConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::unique_ptr<PooledConnection>> available_;
    std::atomic<size_t> totalConnections_{0};
    std::atomic<size_t> activeConnections_{0};
    std::atomic<size_t> waitingRequests_{0};
    std::atomic<size_t> timeoutCount_{0};
    std::atomic<size_t> totalAcquired_{0};
    std::atomic<size_t> totalReleased_{0};
    std::atomic<size_t> failedAcquisitions_{0};
    std::atomic<bool> shutdown_{false};

    std::jthread maintenanceThread_;

    Result<std::unique_ptr<Database>> createConnection();
    Result<void> configureConnection(Database& db);
    std::unique_ptr<PooledConnection> wrap(std::unique_ptr<Database> db);

    /**
     * @brief Return a connection to the pool
     */
    void returnConnection(PooledConnection* conn);

    bool isConnectionValid(Database& db) const;

    void startMaintenanceThread();
};

} // namespace tagflow::metadata
