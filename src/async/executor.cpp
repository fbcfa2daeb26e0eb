#include <spdlog/spdlog.h>
#include <boost/asio/post.hpp>
#include <tagflow/async/executor.h>
#include <tagflow/profiling.h>

#include <exception>
#include <string>

namespace tagflow::async {

Result<void> InlineExecutor::submit(std::function<void()> work) {
    if (!work) {
        return Error{ErrorCode::InvalidArgument, "Cannot submit empty work"};
    }
    work();
    return {};
}

std::size_t ThreadPoolExecutor::resolveThreadCount(std::size_t requested) {
    if (requested > 0) {
        return requested;
    }
    auto hw = static_cast<std::size_t>(std::thread::hardware_concurrency());
    return hw == 0 ? 4 : hw; // Fallback to 4 threads
}

ThreadPoolExecutor::ThreadPoolExecutor(const ThreadPoolConfig& config)
    : threads_(resolveThreadCount(config.threads)), maxPending_(config.maxPending),
      pool_(threads_) {
    spdlog::debug("Executor started with {} worker threads (max pending: {})", threads_,
                  maxPending_ == 0 ? std::string("unbounded") : std::to_string(maxPending_));
}

ThreadPoolExecutor::~ThreadPoolExecutor() {
    shutdown();
}

bool ThreadPoolExecutor::runningInPool() const {
    return pool_.get_executor().running_in_this_thread();
}

Result<void> ThreadPoolExecutor::submit(std::function<void()> work) {
    if (!work) {
        return Error{ErrorCode::InvalidArgument, "Cannot submit empty work"};
    }

    // Held through the post so shutdown() cannot join between the check and the enqueue
    std::lock_guard<std::mutex> lock(submitMutex_);

    // Continuations of chains already running on the pool may still schedule while draining
    if (stopping_.load(std::memory_order_acquire) && !runningInPool()) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        return Error{ErrorCode::SystemShutdown, "Executor is shutting down"};
    }

    const auto current = pending_.fetch_add(1, std::memory_order_relaxed) + 1;
    if (maxPending_ > 0 && current > maxPending_) {
        pending_.fetch_sub(1, std::memory_order_relaxed);
        rejected_.fetch_add(1, std::memory_order_relaxed);
        return Error{ErrorCode::ResourceExhausted,
                     "Executor saturated: " + std::to_string(maxPending_) + " tasks pending"};
    }
    TAGFLOW_EXECUTOR_QUEUE_PLOT(current);

    boost::asio::post(pool_, [this, work = std::move(work)]() {
        try {
            work();
        } catch (const std::exception& e) {
            // Work scheduled by AsyncTask captures its own failures; anything reaching
            // here escaped a raw submission.
            spdlog::error("Unhandled exception in executor work: {}", e.what());
        }
        pending_.fetch_sub(1, std::memory_order_relaxed);
    });
    return {};
}

void ThreadPoolExecutor::shutdown() {
    {
        // Any submit that passed the stopping check has already posted
        std::lock_guard<std::mutex> lock(submitMutex_);
        stopping_.store(true, std::memory_order_release);
    }

    if (runningInPool()) {
        spdlog::error("Executor shutdown requested from a worker thread; skipping join");
        return;
    }

    std::call_once(joinOnce_, [this] {
        const auto inFlight = pending_.load(std::memory_order_relaxed);
        spdlog::debug("Executor draining {} pending tasks", inFlight);
        pool_.join();
        spdlog::debug("Executor stopped (rejected {} submissions)",
                      rejected_.load(std::memory_order_relaxed));
    });
}

} // namespace tagflow::async
