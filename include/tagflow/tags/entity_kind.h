#pragma once

#include <array>
#include <string_view>
#include <tagflow/core/types.h>

namespace tagflow::tags {

/**
 * @brief Kinds of entity that can carry tags.
 *
 * Each kind owns one id column in the shared tag table.
 */
enum class EntityKind { Project, Experiment, ExperimentRun, Dataset, DatasetVersion, Repository };

inline constexpr std::array<EntityKind, 6> kAllEntityKinds = {
    EntityKind::Project,    EntityKind::Experiment,     EntityKind::ExperimentRun,
    EntityKind::Dataset,    EntityKind::DatasetVersion, EntityKind::Repository};

// Canonical name stored in tag_mapping.entity_name, e.g. "DatasetEntity"
constexpr std::string_view entityName(EntityKind kind) noexcept {
    switch (kind) {
        case EntityKind::Project:
            return "ProjectEntity";
        case EntityKind::Experiment:
            return "ExperimentEntity";
        case EntityKind::ExperimentRun:
            return "ExperimentRunEntity";
        case EntityKind::Dataset:
            return "DatasetEntity";
        case EntityKind::DatasetVersion:
            return "DatasetVersionEntity";
        case EntityKind::Repository:
            return "RepositoryEntity";
    }
    return "UnknownEntity";
}

constexpr std::string_view idColumn(EntityKind kind) noexcept {
    switch (kind) {
        case EntityKind::Project:
            return "project_id";
        case EntityKind::Experiment:
            return "experiment_id";
        case EntityKind::ExperimentRun:
            return "experiment_run_id";
        case EntityKind::Dataset:
            return "dataset_id";
        case EntityKind::DatasetVersion:
            return "dataset_version_id";
        case EntityKind::Repository:
            return "repository_id";
    }
    return "";
}

/**
 * @brief Resolve a canonical entity name. Unknown names yield NotFound.
 */
Result<EntityKind> parseEntityKind(std::string_view name);

// parseEntityKind that throws OperationError for unknown names
EntityKind requireEntityKind(std::string_view name);

} // namespace tagflow::tags
