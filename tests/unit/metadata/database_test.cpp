#include <gtest/gtest.h>
#include <filesystem>

#include "../../common/test_helpers.h"
#include <tagflow/metadata/database.h>
#include <tagflow/metadata/tag_schema.h>

using namespace tagflow;
using namespace tagflow::metadata;

class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        dbPath_ = tagflow::tests::make_db_path("database_test");
        auto openResult = db_.open(dbPath_.string(), ConnectionMode::Create);
        ASSERT_TRUE(openResult.has_value());
    }

    void TearDown() override {
        db_.close();
        tagflow::tests::remove_db_files(dbPath_);
    }

    Database db_;
    std::filesystem::path dbPath_;
};

TEST_F(DatabaseTest, OpenClose) {
    Database db;
    ASSERT_FALSE(db.isOpen());

    auto result = db.open(dbPath_.string(), ConnectionMode::Create);
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(db.isOpen());
    EXPECT_EQ(db.path(), dbPath_.string());

    db.close();
    ASSERT_FALSE(db.isOpen());
}

TEST_F(DatabaseTest, ReadWriteModeRequiresExistingFile) {
    auto missing = dbPath_.parent_path() / (dbPath_.filename().string() + ".missing");
    Database db;
    auto result = db.open(missing.string());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::DatabaseError);
    EXPECT_FALSE(db.isOpen());
    EXPECT_FALSE(std::filesystem::exists(missing));

    // The fixture's file exists, so plain read-write opens it
    Database existing;
    EXPECT_TRUE(existing.open(dbPath_.string()).has_value());
}

TEST_F(DatabaseTest, PreparedStatements) {
    ASSERT_TRUE(db_.execute("CREATE TABLE test (id INTEGER PRIMARY KEY, name TEXT, value INTEGER)"));

    auto insertStmtResult = db_.prepare("INSERT INTO test (name, value) VALUES (?, ?)");
    ASSERT_TRUE(insertStmtResult.has_value());
    Statement insertStmt = std::move(insertStmtResult).value();

    ASSERT_TRUE(insertStmt.bindAll("Test1", 42).has_value());
    ASSERT_TRUE(insertStmt.execute().has_value());

    EXPECT_EQ(db_.lastInsertRowId(), 1);
    EXPECT_EQ(db_.changes(), 1);

    auto selectStmtResult = db_.prepare("SELECT id, name, value FROM test WHERE id = ?");
    ASSERT_TRUE(selectStmtResult.has_value());
    Statement selectStmt = std::move(selectStmtResult).value();
    ASSERT_TRUE(selectStmt.bind(1, 1).has_value());

    auto stepResult = selectStmt.step();
    ASSERT_TRUE(stepResult.has_value());
    ASSERT_TRUE(stepResult.value());

    EXPECT_EQ(selectStmt.getInt(0), 1);
    EXPECT_EQ(selectStmt.getString(1), "Test1");
    EXPECT_EQ(selectStmt.getInt(2), 42);
    EXPECT_EQ(selectStmt.columnCount(), 3);
    EXPECT_EQ(selectStmt.columnName(1), "name");
}

TEST_F(DatabaseTest, NullAndInt64Columns) {
    ASSERT_TRUE(db_.execute("CREATE TABLE t (big INTEGER, maybe TEXT)"));
    auto stmt = std::move(db_.prepare("INSERT INTO t VALUES (?, ?)")).value();
    const int64_t big = 9'000'000'000;
    ASSERT_TRUE(stmt.bind(1, big).has_value());
    ASSERT_TRUE(stmt.bind(2, nullptr).has_value());
    ASSERT_TRUE(stmt.execute().has_value());

    auto read = std::move(db_.prepare("SELECT big, maybe FROM t")).value();
    ASSERT_TRUE(read.step().value());
    EXPECT_EQ(read.getInt64(0), big);
    EXPECT_TRUE(read.isNull(1));
}

TEST_F(DatabaseTest, CommitAndRollback) {
    ASSERT_TRUE(db_.execute("CREATE TABLE test (id INTEGER PRIMARY KEY, value INTEGER)"));

    ASSERT_TRUE(db_.beginTransaction().has_value());
    EXPECT_TRUE(db_.inTransaction());
    ASSERT_TRUE(db_.execute("INSERT INTO test (value) VALUES (1)"));
    ASSERT_TRUE(db_.commit().has_value());
    EXPECT_FALSE(db_.inTransaction());

    ASSERT_TRUE(db_.beginTransaction().has_value());
    ASSERT_TRUE(db_.execute("INSERT INTO test (value) VALUES (2)"));
    ASSERT_TRUE(db_.rollback().has_value());
    EXPECT_FALSE(db_.inTransaction());

    auto count = std::move(db_.prepare("SELECT COUNT(*) FROM test")).value();
    ASSERT_TRUE(count.step().value());
    EXPECT_EQ(count.getInt(0), 1);
}

TEST_F(DatabaseTest, NestedBeginIsRejected) {
    ASSERT_TRUE(db_.beginTransaction().has_value());
    auto nested = db_.beginTransaction();
    ASSERT_FALSE(nested.has_value());
    EXPECT_EQ(nested.error().code, ErrorCode::InvalidState);
    ASSERT_TRUE(db_.rollback().has_value());

    auto stray = db_.commit();
    ASSERT_FALSE(stray.has_value());
}

TEST_F(DatabaseTest, BadSqlReportsDatabaseError) {
    auto prepared = db_.prepare("SELEC nonsense");
    ASSERT_FALSE(prepared.has_value());
    EXPECT_EQ(prepared.error().code, ErrorCode::DatabaseError);
}

TEST_F(DatabaseTest, TableExists) {
    EXPECT_FALSE(db_.tableExists("tag_mapping").value());
    ASSERT_TRUE(ensureTagSchema(db_).has_value());
    EXPECT_TRUE(db_.tableExists("tag_mapping").value());

    // Idempotent
    EXPECT_TRUE(ensureTagSchema(db_).has_value());
}

TEST_F(DatabaseTest, TagSchemaIgnoresDuplicateRows) {
    ASSERT_TRUE(ensureTagSchema(db_).has_value());

    auto insertSql = QueryBuilder()
                         .insertInto(kTagTable)
                         .values({"entity_name", "tags", "dataset_id"})
                         .orIgnore()
                         .build();
    for (int i = 0; i < 2; ++i) {
        auto stmt = std::move(db_.prepare(insertSql)).value();
        ASSERT_TRUE(stmt.bindAll("DatasetEntity", "prod", "ds-1").has_value());
        ASSERT_TRUE(stmt.execute().has_value());
    }

    auto count = std::move(db_.prepare("SELECT COUNT(*) FROM tag_mapping")).value();
    ASSERT_TRUE(count.step().value());
    EXPECT_EQ(count.getInt(0), 1);
}

TEST(QueryBuilderTest, BuildsSelect) {
    auto sql = QueryBuilder()
                   .select({"tags", "dataset_id"})
                   .from("tag_mapping")
                   .where("entity_name = ?")
                   .andWhere("dataset_id IN (" + sqlPlaceholders(3) + ")")
                   .orderBy("tags")
                   .build();
    EXPECT_EQ(sql, "SELECT tags, dataset_id FROM tag_mapping WHERE entity_name = ? AND dataset_id "
                   "IN (?, ?, ?) ORDER BY tags ASC");
}

TEST(QueryBuilderTest, BuildsInsertOrIgnore) {
    auto sql =
        QueryBuilder().insertInto("tag_mapping").values({"entity_name", "tags"}).orIgnore().build();
    EXPECT_EQ(sql, "INSERT OR IGNORE INTO tag_mapping (entity_name, tags) VALUES (?, ?)");
}

TEST(QueryBuilderTest, BuildsDelete) {
    QueryBuilder builder;
    builder.deleteFrom("tag_mapping").where("entity_name = ?").andWhere("project_id = ?");
    EXPECT_EQ(builder.build(), "DELETE FROM tag_mapping WHERE entity_name = ? AND project_id = ?");

    builder.reset();
    EXPECT_EQ(builder.build(), "");
}

TEST(QueryBuilderTest, Placeholders) {
    EXPECT_EQ(sqlPlaceholders(0), "");
    EXPECT_EQ(sqlPlaceholders(1), "?");
    EXPECT_EQ(sqlPlaceholders(2), "?, ?");
}
