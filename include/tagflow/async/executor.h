#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>

#include <boost/asio/thread_pool.hpp>
#include <tagflow/core/types.h>

namespace tagflow::async {

/**
 * @brief Destination for scheduled work.
 *
 * Every AsyncTask continuation and every DbBridge dispatch goes through an
 * Executor. Implementations must either accept the work (and eventually run it
 * exactly once) or reject it with an error; they never drop it silently.
 */
class Executor {
public:
    virtual ~Executor() = default;

    virtual Result<void> submit(std::function<void()> work) = 0;
};

/**
 * @brief Runs submitted work immediately on the submitting thread.
 */
class InlineExecutor final : public Executor {
public:
    Result<void> submit(std::function<void()> work) override;
};

/**
 * @brief Configuration for the shared worker pool
 */
struct ThreadPoolConfig {
    std::size_t threads = 0;    ///< Worker threads (0 = hardware concurrency)
    std::size_t maxPending = 0; ///< Queued + running work limit (0 = unbounded)
};

/**
 * @brief Process-wide worker pool backed by boost::asio::thread_pool.
 *
 * Thread-safe. shutdown() rejects new submissions from outside the pool, lets
 * work already running on pool threads schedule its continuations, waits for
 * the queue to drain and joins the workers.
 */
class ThreadPoolExecutor final : public Executor {
public:
    explicit ThreadPoolExecutor(const ThreadPoolConfig& config = {});
    ~ThreadPoolExecutor() override;

    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
    ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;

    Result<void> submit(std::function<void()> work) override;

    /**
     * @brief Stop accepting work, drain and join. Idempotent.
     */
    void shutdown();

    [[nodiscard]] bool isStopping() const { return stopping_.load(std::memory_order_acquire); }
    [[nodiscard]] std::size_t pending() const { return pending_.load(std::memory_order_relaxed); }
    [[nodiscard]] std::size_t threadCount() const { return threads_; }
    [[nodiscard]] std::size_t rejectedCount() const {
        return rejected_.load(std::memory_order_relaxed);
    }

    /**
     * @brief True when called from one of this pool's worker threads
     */
    [[nodiscard]] bool runningInPool() const;

private:
    static std::size_t resolveThreadCount(std::size_t requested);

    std::size_t threads_;
    std::size_t maxPending_;
    mutable boost::asio::thread_pool pool_; // get_executor() is non-const
    std::mutex submitMutex_;
    std::atomic<bool> stopping_{false};
    std::atomic<std::size_t> pending_{0};
    std::atomic<std::size_t> rejected_{0};
    std::once_flag joinOnce_;
};

} // namespace tagflow::async
