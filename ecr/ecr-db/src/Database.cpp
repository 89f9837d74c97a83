// ecr/ecr-db/src/Database.cpp
#include "ecr-db/src/Database.hpp"

namespace ecr_db
{

Database::Database(std::string dbUrl,
                   std::shared_ptr<spdlog::logger> logger,
                   DBOpenCondition openCond,
                   std::chrono::milliseconds busyTimeout)
  : logger_(std::move(logger)), dbUrl_(std::move(dbUrl))
{
  logger_->debug("Opening database: {}", dbUrl_);

  sqlite3* rawDb = nullptr;
  int rc = sqlite3_open_v2(
    dbUrl_.c_str(), &rawDb, static_cast<int>(openCond), nullptr);

  if (rc != SQLITE_OK)
  {
    const char* errMsg = rawDb ? sqlite3_errmsg(rawDb) : nullptr;
    std::string errorStr = errMsg ? errMsg : "Unknown error";

    logger_->error("Failed to open database: {}", errorStr);

    // Close the database if it was partially opened
    if (rawDb)
    {
      sqlite3_close(rawDb);
    }

    throw DatabaseError("Failed to open database: " + errorStr);
  }

  // Move ownership to the smart pointer
  db_.reset(rawDb);

  logger_->info("Database opened successfully: {}", dbUrl_);

  sqlite3_busy_timeout(db_.get(), static_cast<int>(busyTimeout.count()));

  if (openCond != DBOpenCondition::OpenReadOnly)
  {
    // WAL lets readers proceed while the scheduler holds the write lock
    if (!executeQuery("PRAGMA journal_mode = WAL;") ||
        !executeQuery("PRAGMA synchronous = FULL;"))
    {
      logger_->warn("Could not switch {} to WAL; concurrent access may fail "
                    "with SQLITE_BUSY",
                    dbUrl_);
    }
  }
}

Database::~Database()
{
  if (db_)
  {
    logger_->debug("Closing database: {}", dbUrl_);
  }
}

bool Database::executeQuery(const std::string& query)
{
  logger_->debug("Executing query: {}", query);

  char* errMsg = nullptr;
  int rc = sqlite3_exec(db_.get(), query.c_str(), nullptr, nullptr, &errMsg);

  if (rc != SQLITE_OK)
  {
    if (errMsg)
    {
      logger_->error("SQL error: {}", errMsg);
      sqlite3_free(errMsg);
    }
    else
    {
      logger_->error("Unknown SQL error");
    }
    return false;
  }

  logger_->trace("Query executed successfully");
  return true;
}

Statement Database::prepare(const std::string& sql)
{
  logger_->trace("Preparing statement: {}", sql);
  return Statement{db_.get(), sql};
}

bool Database::beginTransaction(bool immediate)
{
  logger_->debug("Beginning transaction");
  return executeQuery(immediate ? "BEGIN IMMEDIATE TRANSACTION;"
                                : "BEGIN TRANSACTION;");
}

bool Database::commitTransaction()
{
  logger_->debug("Committing transaction");
  return executeQuery("COMMIT;");
}

bool Database::rollbackTransaction()
{
  logger_->debug("Rolling back transaction");
  return executeQuery("ROLLBACK;");
}

}  // namespace ecr_db
