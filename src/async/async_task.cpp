#include <spdlog/spdlog.h>
#include <tagflow/async/async_task.h>

#include <cstdio>

namespace tagflow::async::detail {

void reportUnobservedFailure(const std::exception_ptr& failure,
                             const std::optional<tracing::SpanContext>& span) noexcept {
    try {
        const Error error = toError(failure);
        if (span) {
            spdlog::warn("Unobserved async failure in '{}' (span #{}): [{}] {}", span->name,
                         span->id, errorToString(error.code), error.message);
        } else {
            spdlog::warn("Unobserved async failure: [{}] {}", errorToString(error.code),
                         error.message);
        }
    } catch (const std::exception& e) {
        // Called from destructors: logging failures must not escape
        std::fprintf(stderr, "tagflow: failed to report unobserved async failure: %s\n", e.what());
    }
}

void reportDiscardedFailure(const std::exception_ptr& failure, std::size_t index) noexcept {
    try {
        const Error error = toError(failure);
        spdlog::debug("whenAll discarded failure of task #{}: [{}] {}", index,
                      errorToString(error.code), error.message);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "tagflow: failed to report discarded async failure: %s\n", e.what());
    }
}

} // namespace tagflow::async::detail
