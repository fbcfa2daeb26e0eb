#include <spdlog/spdlog.h>
#include <optional>
#include <utility>
#include <tagflow/core/operation_error.h>
#include <tagflow/service/dataset_tag_service.h>
#include <tagflow/tags/tag_validation.h>

namespace tagflow::service {

namespace {

constexpr const char* kDatasetIdNotFound = "Dataset ID not found in request";

template <typename T> async::AsyncTask<T> invalidRequest(std::string message) {
    spdlog::debug("Rejected dataset tag request: {}", message);
    return async::failed<T>(Error{ErrorCode::InvalidArgument, std::move(message)});
}

} // namespace

FailureClass classifyFailure(const std::exception_ptr& failure) {
    switch (errorCodeOf(failure)) {
        case ErrorCode::InvalidArgument:
        case ErrorCode::NotFound:
        case ErrorCode::PermissionDenied:
            return FailureClass::Client;
        default:
            return FailureClass::Server;
    }
}

DatasetTagService::DatasetTagService(tags::TagEngine<std::string>& engine, RoleService& roles,
                                     AuditSink& audit, async::Executor& executor,
                                     std::size_t maxTagLength)
    : engine_(engine), roles_(roles), audit_(audit), executor_(executor),
      maxTagLength_(maxTagLength) {}

async::AsyncTask<DatasetTagsResponse>
DatasetTagService::addDatasetTags(const AddDatasetTagsRequest& request) {
    if (request.id.empty() && request.tags.empty()) {
        return invalidRequest<DatasetTagsResponse>(
            "Dataset ID and Dataset tags not found in AddDatasetTags request");
    }
    if (request.id.empty()) {
        return invalidRequest<DatasetTagsResponse>(kDatasetIdNotFound);
    }
    if (request.tags.empty()) {
        return invalidRequest<DatasetTagsResponse>(
            "Dataset tags not found in AddDatasetTags request");
    }
    if (auto checked = tags::checkEntityTagsLength(request.tags, maxTagLength_); !checked) {
        return async::failed<DatasetTagsResponse>(checked.error());
    }
    if (auto allowed =
            roles_.validateEntityUser(tags::EntityKind::Dataset, request.id, ServiceAction::Update);
        !allowed) {
        return async::failed<DatasetTagsResponse>(allowed.error());
    }

    AuditEvent event;
    event.entityKind = tags::EntityKind::Dataset;
    event.entityId = request.id;
    event.eventType = kUpdateDatasetEvent;
    event.field = "tags";
    event.extra["tags"] = request.tags;
    event.message = "dataset tags added successfully";

    const std::string id = request.id;
    return engine_.addTags(request.id, request.tags)
        .flatMap([this, id, event = std::move(event)](
                     const async::Unit&) { return respondWithAudit(id, event); },
                 executor_);
}

async::AsyncTask<DatasetTagsResponse>
DatasetTagService::deleteDatasetTags(const DeleteDatasetTagsRequest& request) {
    if (request.id.empty() && request.tags.empty() && !request.deleteAll) {
        return invalidRequest<DatasetTagsResponse>(
            "Dataset ID and Dataset tags not found in DeleteDatasetTags request");
    }
    if (request.id.empty()) {
        return invalidRequest<DatasetTagsResponse>(kDatasetIdNotFound);
    }
    if (request.tags.empty() && !request.deleteAll) {
        return invalidRequest<DatasetTagsResponse>(
            "Dataset tags not found in DeleteDatasetTags request");
    }
    if (auto allowed =
            roles_.validateEntityUser(tags::EntityKind::Dataset, request.id, ServiceAction::Update);
        !allowed) {
        return async::failed<DatasetTagsResponse>(allowed.error());
    }

    AuditEvent event;
    event.entityKind = tags::EntityKind::Dataset;
    event.entityId = request.id;
    event.eventType = kUpdateDatasetEvent;
    event.field = "tags";
    if (request.deleteAll) {
        event.extra["tags_delete_all"] = true;
    } else {
        event.extra["tags"] = request.tags;
    }
    event.message = "dataset tags deleted successfully";

    std::optional<tags::TagList> selection;
    if (!request.deleteAll) {
        selection = request.tags;
    }

    const std::string id = request.id;
    return engine_.deleteTags(request.id, selection)
        .flatMap([this, id, event = std::move(event)](
                     const async::Unit&) { return respondWithAudit(id, event); },
                 executor_);
}

async::AsyncTask<DatasetTagsResponse> DatasetTagService::getDatasetTags(const std::string& id) {
    if (id.empty()) {
        return invalidRequest<DatasetTagsResponse>(kDatasetIdNotFound);
    }
    if (auto allowed = roles_.validateEntityUser(tags::EntityKind::Dataset, id, ServiceAction::Read);
        !allowed) {
        return async::failed<DatasetTagsResponse>(allowed.error());
    }

    return engine_.getTags(id).map(
        [id](const tags::TagList& current) { return DatasetTagsResponse{id, current}; }, executor_);
}

async::AsyncTask<DatasetTagsResponse> DatasetTagService::respondWithAudit(const std::string& id,
                                                                          AuditEvent event) {
    AuditSink* audit = &audit_;
    return engine_.getTags(id).map(
        [audit, id, event = std::move(event)](const tags::TagList& current) {
            unwrap(audit->record(event));
            return DatasetTagsResponse{id, current};
        },
        executor_);
}

} // namespace tagflow::service
