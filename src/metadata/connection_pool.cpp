#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <string>
#include <vector>
#include <tagflow/metadata/connection_pool.h>

namespace tagflow::metadata {

// PooledConnection implementation
PooledConnection::PooledConnection(std::unique_ptr<Database> db,
                                   std::function<void(PooledConnection*)> returnFunc)
    : db_(std::move(db)), returnFunc_(std::move(returnFunc)),
      lastAccessed_(std::chrono::steady_clock::now()) {}

PooledConnection::~PooledConnection() {
    if (db_ && returnFunc_ && !returned_) {
        returnFunc_(this);
    }
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : db_(std::move(other.db_)), returnFunc_(std::move(other.returnFunc_)),
      lastAccessed_(other.lastAccessed_), createdAt_(other.createdAt_),
      returned_(other.returned_) {
    other.returned_ = true; // Prevent double return
}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        if (db_ && returnFunc_ && !returned_) {
            returnFunc_(this);
        }
        db_ = std::move(other.db_);
        returnFunc_ = std::move(other.returnFunc_);
        lastAccessed_ = other.lastAccessed_;
        createdAt_ = other.createdAt_;
        returned_ = other.returned_;
        other.returned_ = true;
    }
    return *this;
}

// ConnectionPool implementation
ConnectionPool::ConnectionPool(const std::string& dbPath, const ConnectionPoolConfig& config)
    : dbPath_(dbPath), config_(config) {}

ConnectionPool::~ConnectionPool() {
    shutdown();
}

std::unique_ptr<PooledConnection> ConnectionPool::wrap(std::unique_ptr<Database> db) {
    return std::make_unique<PooledConnection>(
        std::move(db), [this](PooledConnection* conn) { returnConnection(conn); });
}

Result<void> ConnectionPool::initialize() {
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (shutdown_) {
            return Error{ErrorCode::InvalidState, "Pool is shut down"};
        }

        for (size_t i = 0; i < config_.minConnections; ++i) {
            auto connResult = createConnection();
            if (!connResult) {
                // Clean up any created connections
                while (!available_.empty()) {
                    available_.front()->returned_ = true;
                    available_.pop();
                }
                totalConnections_ = 0;
                return connResult.error();
            }

            available_.push(wrap(std::move(connResult).value()));
            totalConnections_++;
        }
    }

    spdlog::debug("Connection pool for '{}' initialized with {} connections", dbPath_,
                  config_.minConnections);
    if (config_.enableMaintenance) {
        startMaintenanceThread();
    }
    return {};
}

void ConnectionPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (shutdown_) {
            return;
        }

        shutdown_ = true;
        cv_.notify_all();

        while (!available_.empty()) {
            auto conn = std::move(available_.front());
            available_.pop();
            // Mark connection as returned to prevent callback
            conn->returned_ = true;
        }

        // Active connections handle shutdown state in their destructors
        totalConnections_ = 0;
        activeConnections_ = 0;
    }

    if (maintenanceThread_.joinable()) {
        maintenanceThread_.request_stop();
        maintenanceThread_.join();
    }
    spdlog::debug("Connection pool for '{}' shut down", dbPath_);
}

Result<std::unique_ptr<PooledConnection>>
ConnectionPool::acquire(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (shutdown_) {
        failedAcquisitions_++;
        return Error{ErrorCode::InvalidState, "Pool is shut down"};
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (available_.empty()) {
        // Can we create a new connection?
        if (totalConnections_ < config_.maxConnections) {
            totalConnections_++;
            lock.unlock();
            auto connResult = createConnection();
            lock.lock();

            if (!connResult) {
                totalConnections_--;
                failedAcquisitions_++;
                return connResult.error();
            }

            activeConnections_++;
            totalAcquired_++;
            return wrap(std::move(connResult).value());
        }

        waitingRequests_++;
        const bool ready = cv_.wait_until(lock, deadline,
                                          [this] { return !available_.empty() || shutdown_; });
        waitingRequests_--;

        if (!ready) {
            timeoutCount_++;
            failedAcquisitions_++;
            return Error{ErrorCode::Timeout, "Timeout acquiring connection"};
        }

        if (shutdown_) {
            failedAcquisitions_++;
            return Error{ErrorCode::InvalidState, "Pool is shut down"};
        }
    }

    auto conn = std::move(available_.front());
    available_.pop();

    // Validate outside the lock (SQL queries should not block pool)
    lock.unlock();
    bool valid = isConnectionValid(**conn);
    lock.lock();

    if (!valid) {
        conn->returned_ = true; // Prevent destructor deadlock
        conn.reset();
        spdlog::warn("Discarded stale connection on acquire");

        lock.unlock();
        auto connResult = createConnection();
        lock.lock();
        if (!connResult) {
            totalConnections_--;
            failedAcquisitions_++;
            return connResult.error();
        }
        conn = wrap(std::move(connResult).value());
    }

    conn->touch();
    activeConnections_++;
    totalAcquired_++;
    return conn;
}

ConnectionPool::Stats ConnectionPool::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    return {totalConnections_,
            available_.size(),
            activeConnections_,
            waitingRequests_,
            timeoutCount_.load(std::memory_order_relaxed),
            totalAcquired_,
            totalReleased_,
            failedAcquisitions_};
}

Result<void> ConnectionPool::healthCheck() {
    size_t needed = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return Error{ErrorCode::InvalidState, "Pool is shut down"};
        }
        size_t current = available_.size() + activeConnections_;
        if (current < config_.minConnections && totalConnections_ < config_.maxConnections) {
            needed = std::min(config_.minConnections - current,
                              config_.maxConnections - totalConnections_);
        }
    }

    if (needed == 0) {
        return {};
    }

    std::vector<std::unique_ptr<Database>> newConns;
    newConns.reserve(needed);
    for (size_t i = 0; i < needed; ++i) {
        auto connResult = createConnection();
        if (!connResult) {
            return connResult.error();
        }
        newConns.push_back(std::move(connResult).value());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& db : newConns) {
        available_.push(wrap(std::move(db)));
        totalConnections_++;
    }
    cv_.notify_all();
    return {};
}

void ConnectionPool::pruneIdleConnections() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (available_.size() <= config_.minConnections) {
        return;
    }

    std::queue<std::unique_ptr<PooledConnection>> keep;
    auto now = std::chrono::steady_clock::now();
    size_t prunedIdle = 0;
    size_t prunedAge = 0;

    while (!available_.empty()) {
        auto conn = std::move(available_.front());
        available_.pop();

        auto age = now - conn->createdAt();
        auto idleTime = now - conn->lastAccessed();
        const bool belowMin = keep.size() + activeConnections_ < config_.minConnections;

        if (age >= config_.maxConnectionAge) {
            conn->returned_ = true; // Prevent destructor deadlock
            totalConnections_--;
            prunedAge++;
        } else if (!belowMin && idleTime >= config_.idleTimeout) {
            conn->returned_ = true;
            totalConnections_--;
            prunedIdle++;
        } else {
            keep.push(std::move(conn));
        }
    }

    available_ = std::move(keep);

    if (prunedIdle > 0 || prunedAge > 0) {
        spdlog::info("Connection pool pruned {} idle, {} aged connections", prunedIdle, prunedAge);
    }
}

Result<std::unique_ptr<Database>> ConnectionPool::createConnection() {
    auto db = std::make_unique<Database>();

    auto openResult = db->open(dbPath_, ConnectionMode::Create);
    if (!openResult) {
        return openResult.error();
    }

    auto configResult = configureConnection(*db);
    if (!configResult) {
        return configResult.error();
    }

    return db;
}

Result<void> ConnectionPool::configureConnection(Database& db) {
    auto timeoutResult = db.setBusyTimeout(config_.busyTimeout);
    if (!timeoutResult) {
        return timeoutResult.error();
    }

    if (config_.enableWAL) {
        auto walResult = db.enableWAL();
        if (!walResult) {
            spdlog::warn("WAL enable failed: {}", walResult.error().message);
        }
    }

    if (config_.enableForeignKeys) {
        auto fkResult = db.execute("PRAGMA foreign_keys = ON");
        if (!fkResult) {
            return fkResult.error();
        }
    }

    // More relaxed durability when running tests
    auto syncResult = db.execute(std::getenv("TAGFLOW_TEST_TMPDIR") ? "PRAGMA synchronous = OFF"
                                                                    : "PRAGMA synchronous = NORMAL");
    if (!syncResult) {
        spdlog::warn("Failed to set synchronous pragma: {}", syncResult.error().message);
    }

    return {};
}

void ConnectionPool::returnConnection(PooledConnection* conn) {
    if (!conn || !conn->db_)
        return;

    // A callback that escaped mid-transaction must not leak it to the next borrower
    bool valid = true;
    if (conn->db_->inTransaction()) {
        auto rollbackResult = conn->db_->rollback();
        if (!rollbackResult) {
            spdlog::warn("Failed to rollback transaction on return: {}",
                         rollbackResult.error().message);
            valid = false;
        }
    }
    if (valid) {
        valid = isConnectionValid(*conn->db_);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        spdlog::debug("Discarding connection during shutdown");
        return;
    }

    if (!valid) {
        activeConnections_--;
        totalConnections_--;
        spdlog::warn("Returned connection is invalid, discarding");
        return;
    }

    auto pooled = wrap(std::move(conn->db_));
    pooled->createdAt_ = conn->createdAt_;
    pooled->touch();
    available_.push(std::move(pooled));
    activeConnections_--;
    totalReleased_++;

    cv_.notify_one();
}

bool ConnectionPool::isConnectionValid(Database& db) const {
    if (!db.isOpen()) {
        return false;
    }

    auto stmtResult = db.prepare("SELECT 1");
    if (!stmtResult)
        return false;

    Statement stmt = std::move(stmtResult).value();
    auto result = stmt.step();
    return result.has_value() && result.value();
}

void ConnectionPool::startMaintenanceThread() {
    using namespace std::chrono_literals;
    maintenanceThread_ = std::jthread([this](std::stop_token st) {
        while (!st.stop_requested()) {
            for (int i = 0; i < 60 && !st.stop_requested(); ++i) {
                std::this_thread::sleep_for(1s);
            }
            if (st.stop_requested()) {
                break;
            }
            auto health = healthCheck();
            if (!health) {
                spdlog::warn("Connection pool health check failed: {}", health.error().message);
            }
            pruneIdleConnections();
        }
    });
}

} // namespace tagflow::metadata
