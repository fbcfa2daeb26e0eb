#include <spdlog/spdlog.h>
#include <array>
#include <string>
#include <tagflow/metadata/tag_schema.h>

namespace tagflow::metadata {

namespace {

constexpr std::array<const char*, 6> kIdColumns = {"project_id",         "experiment_id",
                                                   "experiment_run_id",  "dataset_id",
                                                   "dataset_version_id", "repository_id"};

} // namespace

Result<void> ensureTagSchema(Database& db) {
    auto created = db.execute(R"(
        CREATE TABLE IF NOT EXISTS tag_mapping (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            entity_name TEXT NOT NULL,
            tags TEXT NOT NULL,
            project_id TEXT,
            experiment_id TEXT,
            experiment_run_id TEXT,
            dataset_id TEXT,
            dataset_version_id TEXT,
            repository_id INTEGER
        )
    )");
    if (!created)
        return created;

    for (const char* column : kIdColumns) {
        std::string sql = "CREATE UNIQUE INDEX IF NOT EXISTS idx_tag_mapping_";
        sql += column;
        sql += " ON tag_mapping(entity_name, ";
        sql += column;
        sql += ", tags) WHERE ";
        sql += column;
        sql += " IS NOT NULL";

        auto indexed = db.execute(sql);
        if (!indexed) {
            spdlog::error("Failed to create tag index on {}: {}", column, indexed.error().message);
            return indexed;
        }
    }

    spdlog::debug("Tag schema ready in '{}'", db.path());
    return {};
}

} // namespace tagflow::metadata
