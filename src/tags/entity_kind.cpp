#include <string>
#include <tagflow/core/operation_error.h>
#include <tagflow/tags/entity_kind.h>

namespace tagflow::tags {

Result<EntityKind> parseEntityKind(std::string_view name) {
    for (EntityKind kind : kAllEntityKinds) {
        if (entityName(kind) == name) {
            return kind;
        }
    }
    return Error{ErrorCode::NotFound, "Unknown entity kind: " + std::string(name)};
}

EntityKind requireEntityKind(std::string_view name) {
    return unwrap(parseEntityKind(name));
}

} // namespace tagflow::tags
