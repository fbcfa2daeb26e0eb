#include <spdlog/spdlog.h>
#include <string>
#include <tagflow/service/audit_sink.h>

namespace tagflow::service {

Result<void> LoggingAuditSink::record(const AuditEvent& event) {
    try {
        spdlog::info("[audit] {} {} '{}' field={} extra={}: {}", event.eventType,
                     std::string(tags::entityName(event.entityKind)), event.entityId, event.field,
                     event.extra.dump(), event.message);
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError, std::string("Failed to write audit event: ") + e.what()};
    }
    return {};
}

} // namespace tagflow::service
