#pragma once

#include <tagflow/core/types.h>
#include <tagflow/metadata/database.h>

namespace tagflow::metadata {

inline constexpr const char* kTagTable = "tag_mapping";

/**
 * @brief Create the shared tag table and its per-column unique indexes.
 *
 * Idempotent. Each entity id column gets a partial unique index on
 * (entity_name, <column>, tags) so a concurrent duplicate insert becomes a
 * no-op under INSERT OR IGNORE.
 */
Result<void> ensureTagSchema(Database& db);

} // namespace tagflow::metadata
