#include <gtest/gtest.h>
#include <vecstore/metadata/database.h>

#include "../../support/temp_dir_scope.h"

#include <cstddef>
#include <vector>

using namespace vecstore;
using namespace vecstore::metadata;

class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        tmp_ = std::make_unique<test_support::TempDirScope>(
            test_support::TempDirScope::unique_under("vecstore-db"));
        dbPath_ = tmp_->path() / "test.db";
    }

    std::unique_ptr<test_support::TempDirScope> tmp_;
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

TEST_F(DatabaseTest, OpenMissingFileReadWriteFails) {
    Database db;
    auto result = db.open(dbPath_.string(), ConnectionMode::ReadWrite);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::DatabaseError);
}

TEST_F(DatabaseTest, PrepareBindStep) {
    Database db;
    ASSERT_TRUE(db.open(dbPath_.string(), ConnectionMode::Create).has_value());
    ASSERT_TRUE(db.execute("CREATE TABLE t (id INTEGER PRIMARY KEY, name TEXT, data BLOB)")
                    .has_value());

    auto insert = db.prepare("INSERT INTO t (name, data) VALUES (?, ?)");
    ASSERT_TRUE(insert.has_value());
    auto stmt = std::move(insert).value();
    std::vector<std::byte> blob{std::byte{1}, std::byte{2}, std::byte{3}};
    ASSERT_TRUE(stmt.bindAll("alpha", std::span<const std::byte>(blob)).has_value());
    ASSERT_TRUE(stmt.execute().has_value());
    EXPECT_EQ(db.lastInsertRowId(), 1);

    auto select = db.prepare("SELECT name, hex(data) FROM t WHERE id = ?");
    ASSERT_TRUE(select.has_value());
    auto query = std::move(select).value();
    ASSERT_TRUE(query.bind(1, int64_t{1}).has_value());
    auto row = query.step();
    ASSERT_TRUE(row.has_value());
    ASSERT_TRUE(row.value());
    EXPECT_EQ(query.getString(0), "alpha");
    EXPECT_EQ(query.getString(1), "010203");
}

TEST_F(DatabaseTest, PrepareErrorIsResult) {
    Database db;
    ASSERT_TRUE(db.open(dbPath_.string(), ConnectionMode::Create).has_value());
    auto stmt = db.prepare("SELECT * FROM no_such_table");
    ASSERT_FALSE(stmt.has_value());
    EXPECT_EQ(stmt.error().code, ErrorCode::DatabaseError);
}

TEST_F(DatabaseTest, ConstraintViolationIsIntegrityError) {
    Database db;
    ASSERT_TRUE(db.open(dbPath_.string(), ConnectionMode::Create).has_value());
    ASSERT_TRUE(db.execute("CREATE TABLE u (k TEXT UNIQUE)").has_value());
    ASSERT_TRUE(db.execute("INSERT INTO u VALUES ('a')").has_value());

    auto direct = db.execute("INSERT INTO u VALUES ('a')");
    ASSERT_FALSE(direct.has_value());
    EXPECT_EQ(direct.error().code, ErrorCode::IntegrityError);

    auto stmt = db.prepare("INSERT INTO u VALUES (?)").value();
    ASSERT_TRUE(stmt.bind(1, "a").has_value());
    auto prepared = stmt.execute();
    ASSERT_FALSE(prepared.has_value());
    EXPECT_EQ(prepared.error().code, ErrorCode::IntegrityError);
}

TEST_F(DatabaseTest, TransactionRollsBackOnError) {
    Database db;
    ASSERT_TRUE(db.open(dbPath_.string(), ConnectionMode::Create).has_value());
    ASSERT_TRUE(db.execute("CREATE TABLE t (v INTEGER)").has_value());

    auto result = db.transaction([&]() -> Result<void> {
        auto r = db.execute("INSERT INTO t VALUES (1)");
        if (!r)
            return r;
        return Error{ErrorCode::InternalError, "abort"};
    });
    ASSERT_FALSE(result.has_value());
    // The failed transaction was closed, so a new one can start
    ASSERT_TRUE(db.beginTransaction().has_value());
    ASSERT_TRUE(db.rollback().has_value());

    auto count = db.prepare("SELECT COUNT(*) FROM t").value();
    ASSERT_TRUE(count.step().value());
    EXPECT_EQ(count.getInt(0), 0);

    ASSERT_TRUE(db.transaction([&]() { return db.execute("INSERT INTO t VALUES (2)"); },
                               TransactionMode::Immediate)
                    .has_value());
    auto recount = db.prepare("SELECT COUNT(*) FROM t").value();
    ASSERT_TRUE(recount.step().value());
    EXPECT_EQ(recount.getInt(0), 1);
}

TEST_F(DatabaseTest, TableExists) {
    Database db;
    ASSERT_TRUE(db.open(dbPath_.string(), ConnectionMode::Create).has_value());
    EXPECT_FALSE(db.tableExists("t").value());
    ASSERT_TRUE(db.execute("CREATE TABLE t (v INTEGER)").has_value());
    EXPECT_TRUE(db.tableExists("t").value());
}

TEST_F(DatabaseTest, BackupAndRestore) {
    Database db;
    ASSERT_TRUE(db.open(dbPath_.string(), ConnectionMode::Create).has_value());
    ASSERT_TRUE(db.enableWAL().has_value());
    ASSERT_TRUE(db.execute("CREATE TABLE t (v INTEGER)").has_value());
    ASSERT_TRUE(db.execute("INSERT INTO t VALUES (42)").has_value());
    ASSERT_TRUE(db.checkpoint().has_value());

    auto backupPath = tmp_->path() / "backup.db";
    ASSERT_TRUE(db.backupTo(backupPath.string()).has_value());
    EXPECT_TRUE(std::filesystem::exists(backupPath));

    ASSERT_TRUE(db.execute("DELETE FROM t").has_value());
    ASSERT_TRUE(db.restoreFrom(backupPath.string()).has_value());

    auto stmt = db.prepare("SELECT v FROM t").value();
    ASSERT_TRUE(stmt.step().value());
    EXPECT_EQ(stmt.getInt(0), 42);
}

TEST_F(DatabaseTest, OptimizeRuns) {
    Database db;
    ASSERT_TRUE(db.open(dbPath_.string(), ConnectionMode::Create).has_value());
    ASSERT_TRUE(db.execute("CREATE TABLE t (v INTEGER)").has_value());
    EXPECT_TRUE(db.optimize().has_value());
}
