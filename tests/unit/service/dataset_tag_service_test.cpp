#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "../../common/test_helpers.h"
#include <tagflow/metadata/tag_schema.h>
#include <tagflow/service/dataset_tag_service.h>

using namespace tagflow;
using namespace tagflow::metadata;
using namespace tagflow::service;
using ::testing::_;
using ::testing::AllOf;
using ::testing::Field;
using ::testing::Return;

namespace {

class MockAuditSink : public AuditSink {
public:
    MOCK_METHOD(Result<void>, record, (const AuditEvent& event), (override));
};

class MockRoleService : public RoleService {
public:
    MOCK_METHOD(Result<void>, validateEntityUser,
                (tags::EntityKind kind, const std::string& entityId, ServiceAction action),
                (override));
};

Result<void> allowed() {
    return {};
}

} // namespace

class DatasetTagServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        dbPath_ = tagflow::tests::make_db_path("dataset_tag_service_test");

        ConnectionPoolConfig cfg;
        cfg.minConnections = 1;
        cfg.maxConnections = 2;
        cfg.enableMaintenance = false;
        pool_ = std::make_unique<ConnectionPool>(dbPath_.string(), cfg);
        ASSERT_TRUE(pool_->initialize().has_value());
        {
            auto conn = std::move(pool_->acquire()).value();
            ASSERT_TRUE(ensureTagSchema(**conn).has_value());
        }

        executor_ = std::make_unique<async::ThreadPoolExecutor>(async::ThreadPoolConfig{2, 0});
        bridge_ = std::make_unique<DbBridge>(*pool_, *executor_);
        engine_ = std::make_unique<tags::TagEngine<std::string>>(*bridge_, *executor_,
                                                                 tags::EntityKind::Dataset);
        service_ = std::make_unique<DatasetTagService>(*engine_, roles_, audit_, *executor_);

        ON_CALL(roles_, validateEntityUser(_, _, _)).WillByDefault(Return(allowed()));
        ON_CALL(audit_, record(_)).WillByDefault(Return(allowed()));
    }

    void TearDown() override {
        service_.reset();
        engine_.reset();
        bridge_.reset();
        executor_->shutdown();
        executor_.reset();
        pool_->shutdown();
        pool_.reset();
        tagflow::tests::remove_db_files(dbPath_);
    }

    std::filesystem::path dbPath_;
    std::unique_ptr<ConnectionPool> pool_;
    std::unique_ptr<async::ThreadPoolExecutor> executor_;
    std::unique_ptr<DbBridge> bridge_;
    std::unique_ptr<tags::TagEngine<std::string>> engine_;
    ::testing::NiceMock<MockRoleService> roles_;
    ::testing::NiceMock<MockAuditSink> audit_;
    std::unique_ptr<DatasetTagService> service_;
};

TEST_F(DatasetTagServiceTest, RequestValidationMessages) {
    EXPECT_CALL(audit_, record(_)).Times(0);

    auto both = service_->addDatasetTags({"", {}}).result();
    ASSERT_FALSE(both.has_value());
    EXPECT_EQ(both.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(both.error().message,
              "Dataset ID and Dataset tags not found in AddDatasetTags request");

    auto noId = service_->addDatasetTags({"", {"a"}}).result();
    ASSERT_FALSE(noId.has_value());
    EXPECT_EQ(noId.error().message, "Dataset ID not found in request");

    auto noTags = service_->addDatasetTags({"ds-1", {}}).result();
    ASSERT_FALSE(noTags.has_value());
    EXPECT_EQ(noTags.error().message, "Dataset tags not found in AddDatasetTags request");

    auto deleteNothing = service_->deleteDatasetTags({"ds-1", {}, false}).result();
    ASSERT_FALSE(deleteNothing.has_value());
    EXPECT_EQ(deleteNothing.error().message, "Dataset tags not found in DeleteDatasetTags request");

    auto getNoId = service_->getDatasetTags("").result();
    ASSERT_FALSE(getNoId.has_value());
    EXPECT_EQ(getNoId.error().code, ErrorCode::InvalidArgument);
}

TEST_F(DatasetTagServiceTest, OverLengthTagIsClientError) {
    auto task = service_->addDatasetTags({"ds-1", {std::string(41, 't')}});
    task.wait();
    EXPECT_EQ(classifyFailure(task.failure()), FailureClass::Client);
}

TEST_F(DatasetTagServiceTest, AddReturnsSortedTagsAndAuditsOnce) {
    EXPECT_CALL(roles_, validateEntityUser(tags::EntityKind::Dataset, "ds-1", ServiceAction::Update))
        .WillOnce(Return(allowed()));
    EXPECT_CALL(audit_, record(AllOf(Field(&AuditEvent::entityId, "ds-1"),
                                     Field(&AuditEvent::eventType, kUpdateDatasetEvent),
                                     Field(&AuditEvent::field, "tags"))))
        .WillOnce([](const AuditEvent& event) -> Result<void> {
            EXPECT_EQ(event.extra.at("tags"), nlohmann::json::array({"b", "a"}));
            return {};
        });

    auto response = service_->addDatasetTags({"ds-1", {"b", "a"}}).get();
    EXPECT_EQ(response.id, "ds-1");
    EXPECT_EQ(response.tags, (std::vector<std::string>{"a", "b"}));
}

TEST_F(DatasetTagServiceTest, DeniedRequestIsNotAppliedOrAudited) {
    EXPECT_CALL(roles_, validateEntityUser(_, "ds-1", _))
        .WillRepeatedly(Return(Result<void>(Error{ErrorCode::PermissionDenied, "not a member"})));
    EXPECT_CALL(audit_, record(_)).Times(0);

    auto task = service_->addDatasetTags({"ds-1", {"a"}});
    auto result = task.result();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::PermissionDenied);
    EXPECT_EQ(classifyFailure(task.failure()), FailureClass::Client);

    EXPECT_TRUE(engine_->getTags("ds-1").get().empty());
}

TEST_F(DatasetTagServiceTest, DeleteSelectedTags) {
    engine_->addTags("ds-1", {"a", "b", "c"}).get();

    EXPECT_CALL(audit_, record(Field(&AuditEvent::field, "tags")))
        .WillOnce([](const AuditEvent& event) -> Result<void> {
            EXPECT_EQ(event.extra.at("tags"), nlohmann::json::array({"b"}));
            EXPECT_FALSE(event.extra.contains("tags_delete_all"));
            return {};
        });

    auto response = service_->deleteDatasetTags({"ds-1", {"b"}, false}).get();
    EXPECT_EQ(response.tags, (std::vector<std::string>{"a", "c"}));
}

TEST_F(DatasetTagServiceTest, DeleteAllLeavesNoTags) {
    engine_->addTags("ds-1", {"a", "b"}).get();

    EXPECT_CALL(audit_, record(_)).WillOnce([](const AuditEvent& event) -> Result<void> {
        EXPECT_EQ(event.extra.at("tags_delete_all"), true);
        return {};
    });

    auto response = service_->deleteDatasetTags({"ds-1", {}, true}).get();
    EXPECT_EQ(response.id, "ds-1");
    EXPECT_TRUE(response.tags.empty());
}

TEST_F(DatasetTagServiceTest, GetChecksReadPermission) {
    engine_->addTags("ds-1", {"x"}).get();

    EXPECT_CALL(roles_, validateEntityUser(tags::EntityKind::Dataset, "ds-1", ServiceAction::Read))
        .WillOnce(Return(allowed()));
    EXPECT_CALL(audit_, record(_)).Times(0);

    auto response = service_->getDatasetTags("ds-1").get();
    EXPECT_EQ(response.tags, (std::vector<std::string>{"x"}));
}

TEST_F(DatasetTagServiceTest, AuditFailureFailsRequestAfterWrite) {
    EXPECT_CALL(audit_, record(_))
        .WillOnce(Return(Result<void>(Error{ErrorCode::InternalError, "audit store down"})));

    auto task = service_->addDatasetTags({"ds-1", {"a"}});
    auto result = task.result();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InternalError);
    EXPECT_EQ(classifyFailure(task.failure()), FailureClass::Server);

    // The mutation itself was committed
    EXPECT_EQ(engine_->getTags("ds-1").get(), (tags::TagList{"a"}));
}

TEST(ClassifyFailureTest, StorageErrorsAreServerSide) {
    auto dbFailure = std::make_exception_ptr(OperationError(ErrorCode::DatabaseError, "locked"));
    EXPECT_EQ(classifyFailure(dbFailure), FailureClass::Server);

    auto notFound = std::make_exception_ptr(OperationError(ErrorCode::NotFound, "nope"));
    EXPECT_EQ(classifyFailure(notFound), FailureClass::Client);
}

TEST(LoggingAuditSinkTest, RecordsEvent) {
    LoggingAuditSink sink;
    AuditEvent event;
    event.entityId = "ds-9";
    event.eventType = kUpdateDatasetEvent;
    event.field = "tags";
    event.extra["tags"] = std::vector<std::string>{"a"};
    EXPECT_TRUE(sink.record(event).has_value());
}
