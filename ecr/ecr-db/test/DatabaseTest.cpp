#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <stdexcept>

#include <spdlog/sinks/null_sink.h>

#include "ecr-db/src/Database.hpp"

namespace ecr_db_test
{

class DatabaseTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    // Create a null logger that doesn't actually output anything
    // to avoid cluttering test output
    auto null_sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    test_logger = std::make_shared<spdlog::logger>("test_logger", null_sink);

    temp_db_path =
      (std::filesystem::temp_directory_path() /
       ("ecr_db_test_" +
        std::to_string(
          std::chrono::steady_clock::now().time_since_epoch().count()) +
        ".db"))
        .string();
  }

  void TearDown() override
  {
    // WAL mode leaves side files next to the database
    for (const char* suffix : {"", "-wal", "-shm"})
    {
      std::filesystem::remove(temp_db_path + suffix);
    }
  }

  int64_t countRows(ecr_db::Database& db, const std::string& table)
  {
    auto stmt = db.prepare("SELECT COUNT(*) FROM " + table);
    EXPECT_TRUE(stmt.step());
    return stmt.columnInt64(0);
  }

  std::shared_ptr<spdlog::logger> test_logger;
  std::string temp_db_path;
};

TEST_F(DatabaseTest, OpenAndCreateDatabase)
{
  auto db = ecr_db::Database(
    temp_db_path, test_logger, ecr_db::DBOpenCondition::OpenCreate);

  ASSERT_TRUE(std::filesystem::exists(temp_db_path));
  ASSERT_TRUE(db.executeQuery("SELECT 1"));
}

TEST_F(DatabaseTest, OpenMissingFileReadWrite_Throws)
{
  EXPECT_THROW((ecr_db::Database{temp_db_path, test_logger}), ecr_db::DatabaseError);
}

TEST_F(DatabaseTest, CreateTableAndInsertData)
{
  auto db = ecr_db::Database(
    temp_db_path, test_logger, ecr_db::DBOpenCondition::OpenCreate);

  ASSERT_TRUE(db.executeQuery(R"(
        CREATE TABLE test_table (
            id INTEGER PRIMARY KEY,
            name TEXT,
            value REAL
        )
    )"));

  ASSERT_TRUE(db.executeQuery(R"(
        INSERT INTO test_table (name, value) VALUES ('test1', 1.1)
    )"));

  // Verify with the raw handle, as a client without the wrapper would
  sqlite3_stmt* stmt;
  int rc = sqlite3_prepare_v2(
    db.getRawDb(), "SELECT COUNT(*) FROM test_table", -1, &stmt, nullptr);
  ASSERT_EQ(rc, SQLITE_OK);

  rc = sqlite3_step(stmt);
  ASSERT_EQ(rc, SQLITE_ROW);
  ASSERT_EQ(sqlite3_column_int(stmt, 0), 1);

  sqlite3_finalize(stmt);
}

TEST_F(DatabaseTest, TransactionCommit)
{
  auto db = ecr_db::Database(
    temp_db_path, test_logger, ecr_db::DBOpenCondition::OpenCreate);

  ASSERT_TRUE(db.executeQuery(
    "CREATE TABLE test_table (id INTEGER PRIMARY KEY, value TEXT)"));

  ASSERT_TRUE(db.beginTransaction());
  ASSERT_TRUE(db.executeQuery("INSERT INTO test_table (value) VALUES ('row1')"));
  ASSERT_TRUE(db.executeQuery("INSERT INTO test_table (value) VALUES ('row2')"));
  ASSERT_TRUE(db.executeQuery("INSERT INTO test_table (value) VALUES ('row3')"));
  ASSERT_TRUE(db.commitTransaction());

  EXPECT_EQ(countRows(db, "test_table"), 3);
}

TEST_F(DatabaseTest, TransactionRollback)
{
  auto db = ecr_db::Database(
    temp_db_path, test_logger, ecr_db::DBOpenCondition::OpenCreate);

  ASSERT_TRUE(db.executeQuery(
    "CREATE TABLE test_table (id INTEGER PRIMARY KEY, value TEXT)"));
  ASSERT_TRUE(
    db.executeQuery("INSERT INTO test_table (value) VALUES ('permanent')"));

  ASSERT_TRUE(db.beginTransaction());
  ASSERT_TRUE(db.executeQuery(
    "INSERT INTO test_table (value) VALUES ('will be rolled back 1')"));
  ASSERT_TRUE(db.executeQuery(
    "INSERT INTO test_table (value) VALUES ('will be rolled back 2')"));
  ASSERT_TRUE(db.rollbackTransaction());

  EXPECT_EQ(countRows(db, "test_table"), 1);
}

TEST_F(DatabaseTest, OpenMissingDirectory_Throws)
{
  EXPECT_THROW((ecr_db::Database{"/nonexistent/path/to/database.db",
                                 test_logger,
                                 ecr_db::DBOpenCondition::OpenCreate}),
               ecr_db::DatabaseError);
}

TEST_F(DatabaseTest, WritableConnection_UsesWalJournal)
{
  auto db = ecr_db::Database(
    temp_db_path, test_logger, ecr_db::DBOpenCondition::OpenCreate);

  auto stmt = db.prepare("PRAGMA journal_mode");
  ASSERT_TRUE(stmt.step());
  EXPECT_EQ(stmt.columnText(0), "wal");
}

TEST_F(DatabaseTest, InvalidQuery)
{
  auto db = ecr_db::Database(
    temp_db_path, test_logger, ecr_db::DBOpenCondition::OpenCreate);

  ASSERT_FALSE(db.executeQuery("CREATE TABLES invalid_syntax"));
}

// ========== Statement Tests ==========

TEST_F(DatabaseTest, Statement_BindAndReadColumns)
{
  auto db = ecr_db::Database(
    temp_db_path, test_logger, ecr_db::DBOpenCondition::OpenCreate);
  ASSERT_TRUE(db.executeQuery(
    "CREATE TABLE t (id INTEGER PRIMARY KEY, name TEXT, value REAL)"));

  auto insert = db.prepare("INSERT INTO t (id, name, value) VALUES (?, ?, ?)");
  insert.bind(1, int64_t{7}).bind(2, std::string{"seven"}).bind(3, 7.5);
  insert.execute();

  insert.reset();
  insert.bind(1, int64_t{8})
    .bind(2, std::string{"eight"})
    .bind(3, std::optional<double>{});
  insert.execute();

  auto select = db.prepare("SELECT id, name, value FROM t ORDER BY id");
  ASSERT_TRUE(select.step());
  EXPECT_EQ(select.columnInt64(0), 7);
  EXPECT_EQ(select.columnText(1), "seven");
  EXPECT_DOUBLE_EQ(select.columnDouble(2), 7.5);

  ASSERT_TRUE(select.step());
  EXPECT_EQ(select.columnInt64(0), 8);
  EXPECT_TRUE(select.columnIsNull(2));

  EXPECT_FALSE(select.step());
}

TEST_F(DatabaseTest, Statement_InvalidSql_Throws)
{
  auto db = ecr_db::Database(
    temp_db_path, test_logger, ecr_db::DBOpenCondition::OpenCreate);

  EXPECT_THROW(db.prepare("SELEKT nothing"), ecr_db::DatabaseError);
}

TEST_F(DatabaseTest, Statement_ConstraintViolation_Throws)
{
  auto db = ecr_db::Database(
    temp_db_path, test_logger, ecr_db::DBOpenCondition::OpenCreate);
  ASSERT_TRUE(db.executeQuery("CREATE TABLE t (id INTEGER PRIMARY KEY)"));
  ASSERT_TRUE(db.executeQuery("INSERT INTO t (id) VALUES (1)"));

  auto insert = db.prepare("INSERT INTO t (id) VALUES (?)");
  insert.bind(1, int64_t{1});
  EXPECT_THROW(insert.execute(), ecr_db::DatabaseError);
}

TEST_F(DatabaseTest, Changes_ReportsAffectedRows)
{
  auto db = ecr_db::Database(
    temp_db_path, test_logger, ecr_db::DBOpenCondition::OpenCreate);
  ASSERT_TRUE(db.executeQuery("CREATE TABLE t (id INTEGER PRIMARY KEY)"));
  ASSERT_TRUE(db.executeQuery("INSERT INTO t (id) VALUES (1), (2), (3)"));

  db.prepare("DELETE FROM t WHERE id > 1").execute();
  EXPECT_EQ(db.changes(), 2);

  db.prepare("INSERT OR IGNORE INTO t (id) VALUES (1)").execute();
  EXPECT_EQ(db.changes(), 0);
}

}  // namespace ecr_db_test
