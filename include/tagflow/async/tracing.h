#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

namespace tagflow::tracing {

using Attributes = std::map<std::string, std::string>;

/**
 * @brief Identity of a span, fixed when the traced task is created
 */
struct SpanContext {
    std::uint64_t id = 0;
    std::string name;
    Attributes attributes;

    static SpanContext create(std::string name, Attributes attributes);
};

/**
 * @brief A finished span as delivered to the sink
 */
struct SpanRecord {
    SpanContext context;
    std::chrono::steady_clock::time_point start;
    std::chrono::steady_clock::time_point end;
    bool ok = false;
    std::string error;

    [[nodiscard]] std::uint64_t durationMicros() const {
        return static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::microseconds>(end - start).count());
    }
};

/**
 * @brief Receives finished spans. Implementations must be thread-safe.
 */
class SpanSink {
public:
    virtual ~SpanSink() = default;
    virtual void record(const SpanRecord& span) = 0;
};

// Default sink: one debug log line per span
class LoggingSpanSink final : public SpanSink {
public:
    void record(const SpanRecord& span) override;
};

/**
 * @brief Replace the process-wide span sink. Passing nullptr restores the logging sink.
 */
void setSpanSink(std::shared_ptr<SpanSink> sink);
std::shared_ptr<SpanSink> spanSink();

/**
 * @brief RAII span: started on construction, delivered to the sink on destruction.
 *
 * A span that is neither succeeded nor failed explicitly is recorded as failed.
 */
class ScopedSpan {
public:
    explicit ScopedSpan(SpanContext context);
    ~ScopedSpan();

    ScopedSpan(const ScopedSpan&) = delete;
    ScopedSpan& operator=(const ScopedSpan&) = delete;

    void succeed();
    void fail(std::string_view error);

private:
    void finish();

    SpanRecord record_;
    bool finished_ = false;
    bool settled_ = false;
};

// "file:line" of a call site, file reduced to its base name
std::string formatCallSite(const std::source_location& location);

} // namespace tagflow::tracing
