#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <tagflow/async/async_task.h>
#include <tagflow/async/executor.h>
#include <tagflow/core/operation_error.h>
#include <tagflow/core/types.h>
#include <tagflow/metadata/database.h>
#include <tagflow/metadata/db_bridge.h>
#include <tagflow/metadata/tag_schema.h>
#include <tagflow/tags/entity_id_traits.h>
#include <tagflow/tags/entity_kind.h>
#include <tagflow/tags/tag_validation.h>

namespace tagflow::tags {

using TagList = std::vector<std::string>;

struct TagEngineConfig {
    std::size_t maxTagLength = kDefaultMaxTagLength;
};

/**
 * @brief Tag operations for one entity kind over the shared tag_mapping table.
 *
 * Id is the entity id type (std::string or std::int64_t); EntityIdTraits<Id>
 * supplies binding and column reads. Every operation returns immediately with
 * an AsyncTask; database work runs through the DbBridge, follow-up steps on
 * the engine's executor.
 *
 * Tags per entity form a set. Reads always come back sorted ascending.
 */
template <typename Id> class TagEngine {
public:
    using IdTraits = EntityIdTraits<Id>;

    TagEngine(metadata::DbBridge& bridge, async::Executor& executor, EntityKind kind,
              TagEngineConfig config = {})
        : bridge_(bridge), executor_(executor), kind_(kind), config_(config) {}

    // Throws OperationError(NotFound) for an unknown entity name
    TagEngine(metadata::DbBridge& bridge, async::Executor& executor, std::string_view entityName,
              TagEngineConfig config = {})
        : TagEngine(bridge, executor, requireEntityKind(entityName), config) {}

    [[nodiscard]] EntityKind kind() const { return kind_; }

    // Entity id from request text; InvalidArgument when it does not parse
    static Result<Id> parseEntityId(std::string_view text) { return IdTraits::parse(text); }

    async::AsyncTask<TagList> getTags(const Id& entityId) const {
        const EntityKind kind = kind_;
        return bridge_.withHandle(
            [kind, entityId](metadata::Database& db) { return queryTags(db, kind, entityId); });
    }

    /**
     * @brief Tags of many entities in one query.
     *
     * Entities without tags are absent from the result. An empty id set
     * completes immediately without touching the database.
     */
    async::AsyncTask<std::map<Id, TagList>> getTagsBatch(const std::set<Id>& entityIds) const {
        if (entityIds.empty()) {
            return async::completed(std::map<Id, TagList>{});
        }

        const EntityKind kind = kind_;
        return bridge_.withHandle([kind, entityIds](metadata::Database& db) {
            const std::string column(idColumn(kind));
            auto sql = metadata::QueryBuilder()
                           .select({"tags", column})
                           .from(metadata::kTagTable)
                           .where("entity_name = ?")
                           .andWhere(column + " IN (" + metadata::sqlPlaceholders(entityIds.size()) +
                                     ")")
                           .orderBy("tags")
                           .build();

            auto stmt = unwrap(db.prepare(sql));
            unwrap(stmt.bind(1, entityName(kind)));
            int index = 2;
            for (const auto& id : entityIds) {
                unwrap(IdTraits::bind(stmt, index++, id));
            }

            std::map<Id, TagList> grouped;
            while (unwrap(stmt.step())) {
                grouped[IdTraits::read(stmt, 1)].push_back(stmt.getString(0));
            }
            return grouped;
        });
    }

    /**
     * @brief Add the tags the entity does not have yet.
     *
     * Fails with InvalidArgument, before any database access, when the list is
     * empty or a tag is empty or too long. Requested tags already present are
     * skipped; when nothing is left the call completes without a write.
     */
    async::AsyncTask<async::Unit> addTags(const Id& entityId, const TagList& tags) const {
        if (tags.empty()) {
            return async::failed<async::Unit>(Error{ErrorCode::InvalidArgument, "Tags not found"});
        }
        for (const auto& tag : tags) {
            if (tag.empty()) {
                return async::failed<async::Unit>(
                    Error{ErrorCode::InvalidArgument, "Tag should not be empty"});
            }
        }
        auto checked = checkEntityTagsLength(tags, config_.maxTagLength);
        if (!checked) {
            return async::failed<async::Unit>(checked.error());
        }

        const EntityKind kind = kind_;
        metadata::DbBridge* bridge = &bridge_;
        std::set<std::string> requested(tags.begin(), tags.end());

        return getTags(entityId).flatMap(
            [kind, bridge, entityId, requested = std::move(requested)](const TagList& existing) {
                const std::set<std::string> present(existing.begin(), existing.end());
                std::vector<std::string> missing;
                for (const auto& tag : requested) {
                    if (present.count(tag) == 0) {
                        missing.push_back(tag);
                    }
                }
                if (missing.empty()) {
                    return async::completed();
                }

                return bridge->useTransaction([kind, entityId,
                                               missing = std::move(missing)](metadata::Database& db) {
                    insertTags(db, kind, entityId, missing);
                });
            },
            executor_);
    }

    /**
     * @brief Delete the given tags, or every tag of the entity when none are given.
     *
     * Matching nothing is not an error. An empty list deletes nothing.
     */
    async::AsyncTask<async::Unit> deleteTags(const Id& entityId,
                                             const std::optional<TagList>& tags) const {
        if (tags && tags->empty()) {
            return async::completed();
        }

        const EntityKind kind = kind_;
        return bridge_.useHandle([kind, entityId, tags](metadata::Database& db) {
            const std::string column(idColumn(kind));
            metadata::QueryBuilder builder;
            builder.deleteFrom(metadata::kTagTable).where("entity_name = ?").andWhere(column + " = ?");
            if (tags) {
                builder.andWhere("tags IN (" + metadata::sqlPlaceholders(tags->size()) + ")");
            }

            auto stmt = unwrap(db.prepare(builder.build()));
            unwrap(stmt.bind(1, entityName(kind)));
            unwrap(IdTraits::bind(stmt, 2, entityId));
            if (tags) {
                int index = 3;
                for (const auto& tag : *tags) {
                    unwrap(stmt.bind(index++, tag));
                }
            }
            unwrap(stmt.execute());
        });
    }

private:
    static TagList queryTags(metadata::Database& db, EntityKind kind, const Id& entityId) {
        const std::string column(idColumn(kind));
        auto sql = metadata::QueryBuilder()
                       .select({"tags"})
                       .from(metadata::kTagTable)
                       .where("entity_name = ?")
                       .andWhere(column + " = ?")
                       .orderBy("tags")
                       .build();

        auto stmt = unwrap(db.prepare(sql));
        unwrap(stmt.bind(1, entityName(kind)));
        unwrap(IdTraits::bind(stmt, 2, entityId));

        TagList tags;
        while (unwrap(stmt.step())) {
            tags.push_back(stmt.getString(0));
        }
        return tags;
    }

    static void insertTags(metadata::Database& db, EntityKind kind, const Id& entityId,
                           const std::vector<std::string>& tags) {
        const std::string column(idColumn(kind));
        auto sql = metadata::QueryBuilder()
                       .insertInto(metadata::kTagTable)
                       .values({"entity_name", "tags", column})
                       .orIgnore()
                       .build();

        auto stmt = unwrap(db.prepare(sql));
        for (const auto& tag : tags) {
            unwrap(stmt.bind(1, entityName(kind)));
            unwrap(stmt.bind(2, tag));
            unwrap(IdTraits::bind(stmt, 3, entityId));
            unwrap(stmt.execute());
            unwrap(stmt.reset());
        }
    }

    metadata::DbBridge& bridge_;
    async::Executor& executor_;
    EntityKind kind_;
    TagEngineConfig config_;
};

} // namespace tagflow::tags
