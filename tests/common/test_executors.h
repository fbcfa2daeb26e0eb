#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <vector>
#include <functional>
#include <mutex>
#include <utility>
#include <tagflow/async/executor.h>
#include <tagflow/async/tracing.h>

namespace tagflow::tests {

/**
 * @brief Executor that queues work until the test runs it.
 *
 * Lets a test observe that nothing ran on the registering thread.
 */
class ManualExecutor final : public async::Executor {
public:
    Result<void> submit(std::function<void()> work) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (rejecting_) {
            return Error{ErrorCode::SystemShutdown, "Manual executor rejecting work"};
        }
        queue_.push_back(std::move(work));
        ++submitted_;
        return {};
    }

    // Run queued work, including anything it schedules, until the queue is empty
    std::size_t drain() {
        std::size_t ran = 0;
        while (runOne()) {
            ++ran;
        }
        return ran;
    }

    bool runOne() {
        std::function<void()> work;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.empty()) {
                return false;
            }
            work = std::move(queue_.front());
            queue_.pop_front();
        }
        work();
        return true;
    }

    std::size_t queued() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    std::size_t submitted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return submitted_;
    }

    void rejectAll() {
        std::lock_guard<std::mutex> lock(mutex_);
        rejecting_ = true;
    }

private:
    mutable std::mutex mutex_;
    std::deque<std::function<void()>> queue_;
    std::size_t submitted_ = 0;
    bool rejecting_ = false;
};

// Span sink that keeps every record for inspection
class RecordingSpanSink final : public tracing::SpanSink {
public:
    void record(const tracing::SpanRecord& span) override {
        std::lock_guard<std::mutex> lock(mutex_);
        spans_.push_back(span);
    }

    std::vector<tracing::SpanRecord> spans() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return spans_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<tracing::SpanRecord> spans_;
};

// Installs a RecordingSpanSink for the lifetime of the guard
class ScopedSpanRecorder {
public:
    ScopedSpanRecorder() : sink_(std::make_shared<RecordingSpanSink>()) {
        tracing::setSpanSink(sink_);
    }
    ~ScopedSpanRecorder() { tracing::setSpanSink(nullptr); }

    ScopedSpanRecorder(const ScopedSpanRecorder&) = delete;
    ScopedSpanRecorder& operator=(const ScopedSpanRecorder&) = delete;

    std::vector<tracing::SpanRecord> spans() const { return sink_->spans(); }

private:
    std::shared_ptr<RecordingSpanSink> sink_;
};

} // namespace tagflow::tests
