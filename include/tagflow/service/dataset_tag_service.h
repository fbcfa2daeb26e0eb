#pragma once

#include <cstddef>
#include <exception>
#include <string>
#include <vector>

#include <tagflow/async/async_task.h>
#include <tagflow/async/executor.h>
#include <tagflow/service/audit_sink.h>
#include <tagflow/service/role_service.h>
#include <tagflow/tags/tag_engine.h>

namespace tagflow::service {

struct AddDatasetTagsRequest {
    std::string id;
    std::vector<std::string> tags;
};

struct DeleteDatasetTagsRequest {
    std::string id;
    std::vector<std::string> tags;
    bool deleteAll = false;
};

// Dataset id with its tags after the operation, sorted ascending
struct DatasetTagsResponse {
    std::string id;
    std::vector<std::string> tags;
};

/**
 * @brief Transport-level class of a failed request
 *
 * Client: InvalidArgument, NotFound, PermissionDenied. Server: everything else.
 */
enum class FailureClass { Client, Server };

FailureClass classifyFailure(const std::exception_ptr& failure);

/**
 * @brief Request handling for dataset tags.
 *
 * Checks the request, asks the RoleService, applies the change through the
 * TagEngine, reads back the resulting tags and reports an AuditEvent. Request
 * errors come back as already-failed tasks with InvalidArgument.
 */
class DatasetTagService {
public:
    DatasetTagService(tags::TagEngine<std::string>& engine, RoleService& roles, AuditSink& audit,
                      async::Executor& executor,
                      std::size_t maxTagLength = tags::kDefaultMaxTagLength);

    async::AsyncTask<DatasetTagsResponse> addDatasetTags(const AddDatasetTagsRequest& request);
    async::AsyncTask<DatasetTagsResponse> deleteDatasetTags(const DeleteDatasetTagsRequest& request);
    async::AsyncTask<DatasetTagsResponse> getDatasetTags(const std::string& id);

private:
    // getTags(id) followed by event, with the response built from the fresh tags
    async::AsyncTask<DatasetTagsResponse> respondWithAudit(const std::string& id, AuditEvent event);

    tags::TagEngine<std::string>& engine_;
    RoleService& roles_;
    AuditSink& audit_;
    async::Executor& executor_;
    std::size_t maxTagLength_;
};

} // namespace tagflow::service
