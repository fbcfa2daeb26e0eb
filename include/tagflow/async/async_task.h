#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <tagflow/async/executor.h>
#include <tagflow/async/tracing.h>
#include <tagflow/core/operation_error.h>
#include <tagflow/core/types.h>

namespace tagflow::async {

// Value of a task whose work produces nothing
using Unit = std::monostate;

template <typename T> class AsyncTask;

namespace detail {

void reportUnobservedFailure(const std::exception_ptr& failure,
                             const std::optional<tracing::SpanContext>& span) noexcept;

// Debug log for a failure that lost the race to settle an aggregate
void reportDiscardedFailure(const std::exception_ptr& failure, std::size_t index) noexcept;

template <typename R> struct ValueOf {
    using type = R;
};
template <> struct ValueOf<void> {
    using type = Unit;
};

// Task value type produced by invoking F with Args (void becomes Unit)
template <typename F, typename... Args>
using ValueResult = typename ValueOf<std::invoke_result_t<F&, Args...>>::type;

template <typename F, typename... Args> auto invokeToValue(F& fn, Args&&... args) {
    if constexpr (std::is_void_v<std::invoke_result_t<F&, Args...>>) {
        std::invoke(fn, std::forward<Args>(args)...);
        return Unit{};
    } else {
        return std::invoke(fn, std::forward<Args>(args)...);
    }
}

template <typename> struct IsAsyncTask : std::false_type {};
template <typename T> struct IsAsyncTask<AsyncTask<T>> : std::true_type {};

/**
 * @brief Write-once shared state behind an AsyncTask.
 *
 * Settles at most once. Continuations registered before settling are invoked
 * exactly once by the settling thread; registered afterwards, they run
 * immediately on the registering thread.
 */
template <typename T> class TaskState : public std::enable_shared_from_this<TaskState<T>> {
public:
    using Continuation = std::function<void(const std::shared_ptr<TaskState>&)>;

    TaskState() = default;
    TaskState(const TaskState&) = delete;
    TaskState& operator=(const TaskState&) = delete;

    ~TaskState() {
        if (error_ && !observed_.load(std::memory_order_acquire)) {
            reportUnobservedFailure(error_, span_);
        }
    }

    bool setValue(T value) {
        return settle([&] { value_.emplace(std::move(value)); });
    }

    bool setFailure(std::exception_ptr failure) {
        return settle([&] { error_ = std::move(failure); });
    }

    void onSettled(Continuation continuation) {
        observed_.store(true, std::memory_order_release);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!settled_) {
                continuations_.push_back(std::move(continuation));
                return;
            }
        }
        continuation(this->shared_from_this());
    }

    void wait() const {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return settled_; });
    }

    [[nodiscard]] bool isSettled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return settled_;
    }

    void markObserved() { observed_.store(true, std::memory_order_release); }

    // Only meaningful once settled; both are immutable from then on.
    [[nodiscard]] const std::optional<T>& value() const { return value_; }
    [[nodiscard]] const std::exception_ptr& error() const { return error_; }

    // Set once, before the state is shared
    void setSpan(tracing::SpanContext span) { span_ = std::move(span); }
    [[nodiscard]] const std::optional<tracing::SpanContext>& span() const { return span_; }

private:
    template <typename Assign> bool settle(Assign&& assign) {
        std::vector<Continuation> ready;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (settled_) {
                return false;
            }
            assign();
            settled_ = true;
            ready.swap(continuations_);
        }
        cv_.notify_all();
        if (!ready.empty()) {
            auto self = this->shared_from_this();
            for (auto& continuation : ready) {
                continuation(self);
            }
        }
        return true;
    }

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool settled_ = false;
    std::optional<T> value_;
    std::exception_ptr error_;
    std::vector<Continuation> continuations_;
    std::atomic<bool> observed_{false};
    std::optional<tracing::SpanContext> span_;
};

template <typename T>
void failWith(const std::shared_ptr<TaskState<T>>& target, const Error& error) {
    target->setFailure(std::make_exception_ptr(OperationError(error)));
}

// Submit work producing T; its value or thrown error settles target
template <typename T, typename Work>
void schedule(Executor& executor, const std::shared_ptr<TaskState<T>>& target, Work work) {
    auto submitted = executor.submit([target, work = std::move(work)]() mutable {
        try {
            target->setValue(work());
        } catch (...) {
            target->setFailure(std::current_exception());
        }
    });
    if (!submitted) {
        failWith(target, submitted.error());
    }
}

// Settle target with whatever source settles to
template <typename T>
void forwardTo(const std::shared_ptr<TaskState<T>>& source,
               const std::shared_ptr<TaskState<T>>& target) {
    source->onSettled([target](const std::shared_ptr<TaskState<T>>& settled) {
        if (settled->error()) {
            target->setFailure(settled->error());
        } else {
            target->setValue(*settled->value());
        }
    });
}

struct TaskAccess {
    template <typename T>
    static const std::shared_ptr<TaskState<T>>& state(const AsyncTask<T>& task) {
        return task.state_;
    }
};

} // namespace detail

/**
 * @brief Handle to a value or failure that becomes available later.
 *
 * Copies share the same underlying state. Continuations (map, flatMap,
 * recover) never block the caller: they are registered on the state and
 * scheduled on the given executor once the source settles. A failure travels
 * down a chain as the original std::exception_ptr, so its dynamic type and
 * error code survive any number of steps.
 *
 * Executors passed to continuations must outlive the chain.
 */
template <typename T> class AsyncTask {
public:
    using value_type = T;

    explicit AsyncTask(std::shared_ptr<detail::TaskState<T>> state) : state_(std::move(state)) {}

    /**
     * @brief Schedule fn(value) once this task succeeds
     */
    template <typename F>
    auto map(F fn, Executor& executor) const -> AsyncTask<detail::ValueResult<F, const T&>> {
        using U = detail::ValueResult<F, const T&>;
        auto next = std::make_shared<detail::TaskState<U>>();
        Executor* exec = &executor;
        state_->onSettled([next, exec, fn = std::move(fn)](
                              const std::shared_ptr<detail::TaskState<T>>& source) mutable {
            if (source->error()) {
                next->setFailure(source->error());
                return;
            }
            detail::schedule(*exec, next, [source, fn = std::move(fn)]() mutable -> U {
                return detail::invokeToValue(fn, *source->value());
            });
        });
        return AsyncTask<U>(next);
    }

    /**
     * @brief Schedule fn(value) returning another task; the result settles with it
     */
    template <typename F>
    auto flatMap(F fn, Executor& executor) const -> std::invoke_result_t<F&, const T&> {
        using Inner = std::invoke_result_t<F&, const T&>;
        static_assert(detail::IsAsyncTask<Inner>::value, "flatMap function must return AsyncTask");
        using U = typename Inner::value_type;

        auto next = std::make_shared<detail::TaskState<U>>();
        Executor* exec = &executor;
        state_->onSettled([next, exec, fn = std::move(fn)](
                              const std::shared_ptr<detail::TaskState<T>>& source) mutable {
            if (source->error()) {
                next->setFailure(source->error());
                return;
            }
            auto submitted = exec->submit([source, next, fn = std::move(fn)]() mutable {
                try {
                    Inner inner = fn(*source->value());
                    detail::forwardTo(detail::TaskAccess::state(inner), next);
                } catch (...) {
                    next->setFailure(std::current_exception());
                }
            });
            if (!submitted) {
                detail::failWith(next, submitted.error());
            }
        });
        return Inner(next);
    }

    /**
     * @brief Replace a failure with fn(failure); values pass through untouched
     */
    template <typename F> AsyncTask<T> recover(F fn, Executor& executor) const {
        static_assert(std::is_convertible_v<std::invoke_result_t<F&, const std::exception_ptr&>, T>,
                      "recover function must produce the task's value type");
        auto next = std::make_shared<detail::TaskState<T>>();
        Executor* exec = &executor;
        state_->onSettled([next, exec, fn = std::move(fn)](
                              const std::shared_ptr<detail::TaskState<T>>& source) mutable {
            if (!source->error()) {
                next->setValue(*source->value());
                return;
            }
            detail::schedule(*exec, next, [source, fn = std::move(fn)]() mutable -> T {
                return fn(source->error());
            });
        });
        return AsyncTask<T>(next);
    }

    [[nodiscard]] bool isReady() const { return state_->isSettled(); }

    // Blocks the calling thread; meant for tests and process edges.
    void wait() const { state_->wait(); }

    /**
     * @brief Wait, then return the value or rethrow the exact failure
     */
    T get() const {
        state_->wait();
        state_->markObserved();
        if (state_->error()) {
            std::rethrow_exception(state_->error());
        }
        return *state_->value();
    }

    /**
     * @brief Wait, then return the value or the failure converted by toError()
     */
    Result<T> result() const {
        state_->wait();
        state_->markObserved();
        if (state_->error()) {
            return toError(state_->error());
        }
        return *state_->value();
    }

    /**
     * @brief The failure once settled (null for success or while pending)
     */
    [[nodiscard]] std::exception_ptr failure() const {
        if (!state_->isSettled()) {
            return nullptr;
        }
        state_->markObserved();
        return state_->error();
    }

    [[nodiscard]] const std::optional<tracing::SpanContext>& span() const {
        return state_->span();
    }

private:
    friend struct detail::TaskAccess;

    std::shared_ptr<detail::TaskState<T>> state_;
};

template <typename T> AsyncTask<std::decay_t<T>> completed(T&& value) {
    auto state = std::make_shared<detail::TaskState<std::decay_t<T>>>();
    state->setValue(std::forward<T>(value));
    return AsyncTask<std::decay_t<T>>(state);
}

inline AsyncTask<Unit> completed() {
    return completed(Unit{});
}

template <typename T> AsyncTask<T> failed(std::exception_ptr failure) {
    auto state = std::make_shared<detail::TaskState<T>>();
    state->setFailure(std::move(failure));
    return AsyncTask<T>(state);
}

template <typename T> AsyncTask<T> failed(Error error) {
    return failed<T>(std::make_exception_ptr(OperationError(std::move(error))));
}

/**
 * @brief Run fn() on executor; the task settles to its result or thrown error
 */
template <typename F>
auto runAsync(F fn, Executor& executor) -> AsyncTask<detail::ValueResult<F>> {
    using R = detail::ValueResult<F>;
    auto state = std::make_shared<detail::TaskState<R>>();
    detail::schedule(executor, state,
                     [fn = std::move(fn)]() mutable -> R { return detail::invokeToValue(fn); });
    return AsyncTask<R>(state);
}

/**
 * @brief runAsync that records a span named label around fn's execution.
 *
 * The span context is attached to the returned task at creation. The span
 * itself starts when fn starts on the executor and records success, or the
 * failure message if fn throws.
 */
template <typename F>
auto traced(F fn, std::string label, tracing::Attributes attributes, Executor& executor)
    -> AsyncTask<detail::ValueResult<F>> {
    using R = detail::ValueResult<F>;
    auto state = std::make_shared<detail::TaskState<R>>();
    auto context = tracing::SpanContext::create(std::move(label), std::move(attributes));
    state->setSpan(context);
    detail::schedule(executor, state, [context, fn = std::move(fn)]() mutable -> R {
        tracing::ScopedSpan span(context);
        try {
            R value = detail::invokeToValue(fn);
            span.succeed();
            return value;
        } catch (const std::exception& e) {
            span.fail(e.what());
            throw;
        }
    });
    return AsyncTask<R>(state);
}

/**
 * @brief Combine tasks into one holding their values in input order.
 *
 * Fails with the first failure observed; later results are discarded and
 * later failures are logged at debug level.
 */
template <typename T> AsyncTask<std::vector<T>> whenAll(const std::vector<AsyncTask<T>>& tasks) {
    if (tasks.empty()) {
        return completed(std::vector<T>{});
    }

    struct Gather {
        std::mutex mutex;
        std::vector<std::optional<T>> slots;
        std::size_t remaining;
        bool done = false;
    };

    auto next = std::make_shared<detail::TaskState<std::vector<T>>>();
    auto gather = std::make_shared<Gather>();
    gather->slots.resize(tasks.size());
    gather->remaining = tasks.size();

    for (std::size_t i = 0; i < tasks.size(); ++i) {
        detail::TaskAccess::state(tasks[i])->onSettled(
            [next, gather, i](const std::shared_ptr<detail::TaskState<T>>& source) {
                std::vector<T> values;
                {
                    std::lock_guard<std::mutex> lock(gather->mutex);
                    if (gather->done) {
                        if (source->error()) {
                            detail::reportDiscardedFailure(source->error(), i);
                        }
                        return;
                    }
                    if (source->error()) {
                        gather->done = true;
                    } else {
                        gather->slots[i] = *source->value();
                        if (--gather->remaining > 0) {
                            return;
                        }
                        gather->done = true;
                        values.reserve(gather->slots.size());
                        for (auto& slot : gather->slots) {
                            values.push_back(std::move(*slot));
                        }
                    }
                }
                if (source->error()) {
                    next->setFailure(source->error());
                } else {
                    next->setValue(std::move(values));
                }
            });
    }
    return AsyncTask<std::vector<T>>(next);
}

/**
 * @brief Once both tasks succeed, schedule fn(a, b)
 */
template <typename A, typename B, typename F>
auto combine(const AsyncTask<A>& first, const AsyncTask<B>& second, F fn, Executor& executor)
    -> AsyncTask<detail::ValueResult<F, const A&, const B&>> {
    Executor* exec = &executor;
    return first.flatMap(
        [second, fn = std::move(fn), exec](const A& a) {
            return second.map([a, fn](const B& b) { return fn(a, b); }, *exec);
        },
        executor);
}

} // namespace tagflow::async
