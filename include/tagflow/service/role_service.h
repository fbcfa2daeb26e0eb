#pragma once

#include <string>
#include <tagflow/core/types.h>
#include <tagflow/tags/entity_kind.h>

namespace tagflow::service {

enum class ServiceAction { Read, Update, Delete };

/**
 * @brief Authorization check for entity-level operations
 */
class RoleService {
public:
    virtual ~RoleService() = default;

    // PermissionDenied when the current user may not perform action on the entity
    virtual Result<void> validateEntityUser(tags::EntityKind kind, const std::string& entityId,
                                            ServiceAction action) = 0;
};

// Deployment without an authorization backend: every request is allowed.
class PublicRoleService final : public RoleService {
public:
    Result<void> validateEntityUser(tags::EntityKind, const std::string&, ServiceAction) override {
        return {};
    }
};

} // namespace tagflow::service
