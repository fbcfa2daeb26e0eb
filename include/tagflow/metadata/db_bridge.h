#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <source_location>
#include <string>
#include <type_traits>
#include <utility>

#include <tagflow/async/async_task.h>
#include <tagflow/async/executor.h>
#include <tagflow/async/tracing.h>
#include <tagflow/metadata/connection_pool.h>
#include <tagflow/metadata/database.h>
#include <tagflow/profiling.h>

namespace tagflow::metadata {

inline constexpr const char* kHandleSpan = "db.handle";
inline constexpr const char* kTransactionSpan = "db.transaction";

struct DbBridgeConfig {
    std::chrono::milliseconds acquireTimeout{30000};
};

/**
 * @brief Runs blocking database callbacks on an executor and returns AsyncTasks.
 *
 * Every entry point:
 *  - acquires a pooled connection on the worker thread and releases it before
 *    the returned task settles;
 *  - wraps the work in a span named db.handle or db.transaction with a
 *    "caller" attribute holding the file:line of the immediate caller;
 *  - lets exceptions thrown by the callback fail the task unchanged.
 *
 * Pool and executor must outlive the bridge and every task it returns.
 */
class DbBridge {
public:
    struct Stats {
        std::uint64_t handleCalls = 0;
        std::uint64_t transactionCalls = 0;
    };

    DbBridge(ConnectionPool& pool, async::Executor& executor, DbBridgeConfig config = {});

    DbBridge(const DbBridge&) = delete;
    DbBridge& operator=(const DbBridge&) = delete;

    /**
     * @brief Run callback(db) with a borrowed connection
     */
    template <typename F>
    auto withHandle(F callback,
                    const std::source_location& caller = std::source_location::current())
        -> async::AsyncTask<async::detail::ValueResult<F, Database&>> {
        handleCalls_.fetch_add(1, std::memory_order_relaxed);
        return async::traced(
            [this, callback = std::move(callback)]() mutable {
                TAGFLOW_DB_ZONE("withHandle");
                auto conn = acquireHandle();
                return callback(**conn);
            },
            kHandleSpan, callerAttributes(caller), executor_);
    }

    /**
     * @brief Run callback(db) inside a transaction.
     *
     * Commits when callback returns, rolls back when it throws. A failed
     * commit fails the task with TransactionFailed.
     */
    template <typename F>
    auto withTransaction(F callback,
                         const std::source_location& caller = std::source_location::current())
        -> async::AsyncTask<async::detail::ValueResult<F, Database&>> {
        transactionCalls_.fetch_add(1, std::memory_order_relaxed);
        return async::traced(
            [this, callback = std::move(callback)]() mutable {
                TAGFLOW_DB_ZONE("withTransaction");
                auto conn = acquireHandle();
                Database& db = **conn;
                beginTransaction(db);
                try {
                    if constexpr (std::is_void_v<std::invoke_result_t<F&, Database&>>) {
                        callback(db);
                        commitTransaction(db);
                    } else {
                        auto value = callback(db);
                        commitTransaction(db);
                        return value;
                    }
                } catch (...) {
                    rollbackAfterFailure(db);
                    throw;
                }
            },
            kTransactionSpan, callerAttributes(caller), executor_);
    }

    template <typename F>
    async::AsyncTask<async::Unit>
    useHandle(F consumer, const std::source_location& caller = std::source_location::current()) {
        return withHandle(
            [consumer = std::move(consumer)](Database& db) mutable {
                consumer(db);
                return async::Unit{};
            },
            caller);
    }

    template <typename F>
    async::AsyncTask<async::Unit>
    useTransaction(F consumer,
                   const std::source_location& caller = std::source_location::current()) {
        return withTransaction(
            [consumer = std::move(consumer)](Database& db) mutable {
                consumer(db);
                return async::Unit{};
            },
            caller);
    }

    /**
     * @brief withHandle for a callback that itself returns an AsyncTask.
     *
     * The connection is released once callback returns, so the inner task must
     * not keep using it.
     */
    template <typename F>
    auto withHandleCompose(F callback,
                           const std::source_location& caller = std::source_location::current())
        -> std::invoke_result_t<F&, Database&> {
        using Inner = std::invoke_result_t<F&, Database&>;
        static_assert(async::detail::IsAsyncTask<Inner>::value,
                      "withHandleCompose callback must return AsyncTask");
        return withHandle(std::move(callback), caller)
            .flatMap([](const Inner& inner) { return inner; }, executor_);
    }

    [[nodiscard]] Stats stats() const;

    [[nodiscard]] async::Executor& executor() const { return executor_; }

private:
    // Throws OperationError when the pool cannot hand out a connection
    std::unique_ptr<PooledConnection> acquireHandle();

    static void beginTransaction(Database& db);
    static void commitTransaction(Database& db);
    static void rollbackAfterFailure(Database& db) noexcept;

    static tracing::Attributes callerAttributes(const std::source_location& caller);

    ConnectionPool& pool_;
    async::Executor& executor_;
    DbBridgeConfig config_;
    std::atomic<std::uint64_t> handleCalls_{0};
    std::atomic<std::uint64_t> transactionCalls_{0};
};

} // namespace tagflow::metadata
