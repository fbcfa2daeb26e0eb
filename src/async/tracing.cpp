#include <spdlog/spdlog.h>
#include <tagflow/async/tracing.h>

#include <atomic>
#include <mutex>

namespace tagflow::tracing {

namespace {

std::atomic<std::uint64_t> g_nextSpanId{1};

std::mutex& sinkMutex() {
    static std::mutex m;
    return m;
}

std::shared_ptr<SpanSink>& sinkSlot() {
    static std::shared_ptr<SpanSink> sink = std::make_shared<LoggingSpanSink>();
    return sink;
}

std::string formatAttributes(const Attributes& attributes) {
    std::string out;
    for (const auto& [key, value] : attributes) {
        if (!out.empty()) {
            out += ' ';
        }
        out += key;
        out += '=';
        out += value;
    }
    return out;
}

} // namespace

SpanContext SpanContext::create(std::string name, Attributes attributes) {
    SpanContext ctx;
    ctx.id = g_nextSpanId.fetch_add(1, std::memory_order_relaxed);
    ctx.name = std::move(name);
    ctx.attributes = std::move(attributes);
    return ctx;
}

void LoggingSpanSink::record(const SpanRecord& span) {
    if (span.ok) {
        spdlog::debug("span #{} {} {}us [{}]", span.context.id, span.context.name,
                      span.durationMicros(), formatAttributes(span.context.attributes));
    } else {
        spdlog::debug("span #{} {} {}us failed: {} [{}]", span.context.id, span.context.name,
                      span.durationMicros(), span.error, formatAttributes(span.context.attributes));
    }
}

void setSpanSink(std::shared_ptr<SpanSink> sink) {
    std::lock_guard<std::mutex> lock(sinkMutex());
    sinkSlot() = sink ? std::move(sink) : std::make_shared<LoggingSpanSink>();
}

std::shared_ptr<SpanSink> spanSink() {
    std::lock_guard<std::mutex> lock(sinkMutex());
    return sinkSlot();
}

ScopedSpan::ScopedSpan(SpanContext context) {
    record_.context = std::move(context);
    record_.start = std::chrono::steady_clock::now();
}

ScopedSpan::~ScopedSpan() {
    if (!settled_) {
        record_.ok = false;
        record_.error = "span abandoned";
    }
    finish();
}

void ScopedSpan::succeed() {
    if (settled_) {
        return;
    }
    settled_ = true;
    record_.ok = true;
}

void ScopedSpan::fail(std::string_view error) {
    if (settled_) {
        return;
    }
    settled_ = true;
    record_.ok = false;
    record_.error = std::string(error);
}

void ScopedSpan::finish() {
    if (finished_) {
        return;
    }
    finished_ = true;
    record_.end = std::chrono::steady_clock::now();
    try {
        if (auto sink = spanSink()) {
            sink->record(record_);
        }
    } catch (const std::exception& e) {
        spdlog::warn("Span sink rejected span '{}': {}", record_.context.name, e.what());
    }
}

std::string formatCallSite(const std::source_location& location) {
    std::string_view file = location.file_name();
    if (auto slash = file.find_last_of("/\\"); slash != std::string_view::npos) {
        file.remove_prefix(slash + 1);
    }
    return std::string(file) + ":" + std::to_string(location.line());
}

} // namespace tagflow::tracing
