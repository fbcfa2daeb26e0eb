#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <tagflow/core/types.h>
#include <tagflow/tags/entity_kind.h>

namespace tagflow::service {

inline constexpr const char* kUpdateDatasetEvent = "update_dataset";

/**
 * @brief One successful mutation, reported after it has been applied
 */
struct AuditEvent {
    tags::EntityKind entityKind = tags::EntityKind::Dataset;
    std::string entityId;
    std::string eventType;
    std::string field;   ///< Updated field, e.g. "tags"
    nlohmann::json extra = nlohmann::json::object();
    std::string message;
};

class AuditSink {
public:
    virtual ~AuditSink() = default;

    virtual Result<void> record(const AuditEvent& event) = 0;
};

// Writes each event as one info line
class LoggingAuditSink final : public AuditSink {
public:
    Result<void> record(const AuditEvent& event) override;
};

} // namespace tagflow::service
