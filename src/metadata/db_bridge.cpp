#include <spdlog/spdlog.h>
#include <tagflow/core/operation_error.h>
#include <tagflow/metadata/db_bridge.h>

namespace tagflow::metadata {

DbBridge::DbBridge(ConnectionPool& pool, async::Executor& executor, DbBridgeConfig config)
    : pool_(pool), executor_(executor), config_(config) {}

DbBridge::Stats DbBridge::stats() const {
    return {handleCalls_.load(std::memory_order_relaxed),
            transactionCalls_.load(std::memory_order_relaxed)};
}

std::unique_ptr<PooledConnection> DbBridge::acquireHandle() {
    auto conn = pool_.acquire(config_.acquireTimeout);
    if (!conn) {
        spdlog::warn("DbBridge: failed to acquire connection for '{}': {}", pool_.path(),
                     conn.error().message);
        throw OperationError(conn.error());
    }
    return std::move(conn).value();
}

void DbBridge::beginTransaction(Database& db) {
    auto begun = db.beginTransaction();
    if (!begun) {
        throw OperationError(ErrorCode::TransactionFailed,
                             "Failed to begin transaction: " + begun.error().message);
    }
}

void DbBridge::commitTransaction(Database& db) {
    auto committed = db.commit();
    if (!committed) {
        throw OperationError(ErrorCode::TransactionFailed,
                             "Failed to commit transaction: " + committed.error().message);
    }
}

void DbBridge::rollbackAfterFailure(Database& db) noexcept {
    if (!db.inTransaction()) {
        return;
    }
    auto rolledBack = db.rollback();
    if (!rolledBack) {
        spdlog::error("DbBridge: rollback failed: {}", rolledBack.error().message);
    }
}

tracing::Attributes DbBridge::callerAttributes(const std::source_location& caller) {
    return {{"caller", tracing::formatCallSite(caller)}};
}

} // namespace tagflow::metadata
