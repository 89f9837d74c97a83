// ecr/ecr-db/src/Database.hpp
#ifndef ECR_DB_DATABASE_HPP
#define ECR_DB_DATABASE_HPP

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include <spdlog/spdlog.h>
#include <sqlite3.h>

#include "ecr-db/src/Statement.hpp"

namespace ecr_db
{

/*!
 * @brief Enum class for SQLite open conditions
 */
enum class DBOpenCondition : int
{
  OpenReadOnly = SQLITE_OPEN_READONLY,
  OpenReadWrite = SQLITE_OPEN_READWRITE,
  OpenCreate = SQLITE_OPEN_CREATE | SQLITE_OPEN_READWRITE,
};

/**
 * @brief Raised when a SQLite call fails in a way the caller cannot ignore
 */
class DatabaseError : public std::runtime_error
{
public:
  explicit DatabaseError(const std::string& message)
    : std::runtime_error(message)
  {
  }
};

/**
 * @brief Wraps a SQLite database connection with integrated logging
 */
class Database
{
public:
  /**
   * @brief Constructs a database connection
   *
   * Opens the connection in WAL mode with a busy timeout so that a second
   * connection to the same file waits for the writer instead of failing.
   *
   * @param dbUrl URL to the SQLite database
   * @param logger Shared pointer to a logger instance
   * @param openCond Condition to open the database with
   * @param busyTimeout How long a statement waits on a locked database
   * @throws DatabaseError if the database cannot be opened
   */
  Database(std::string dbUrl,
           std::shared_ptr<spdlog::logger> logger,
           DBOpenCondition openCond = DBOpenCondition::OpenReadWrite,
           std::chrono::milliseconds busyTimeout = std::chrono::seconds{5});

  /**
   * @brief Destructor automatically closes the database connection
   */
  ~Database();

  // Delete copy constructor and copy assignment
  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  // Statements and ledgers keep pointers into the connection; pin it
  Database(Database&&) = delete;
  Database& operator=(Database&&) = delete;

  /**
   * @brief Get the raw SQLite database pointer
   *
   * @return Raw SQLite database pointer
   */
  sqlite3* getRawDb() const { return db_.get(); }

  /**
   * @brief Execute a raw SQL query
   *
   * @param query SQL query to execute
   * @return true if successful, false otherwise
   */
  bool executeQuery(const std::string& query);

  /**
   * @brief Compile a statement against this connection
   *
   * @param sql SQL text with positional (?) parameters
   * @throws DatabaseError if the statement does not compile
   */
  Statement prepare(const std::string& sql);

  /**
   * @brief Begin a transaction
   *
   * @param immediate Take the write lock up front (BEGIN IMMEDIATE)
   * @return true if successful, false otherwise
   */
  bool beginTransaction(bool immediate = false);

  /**
   * @brief Commit the current transaction
   *
   * @return true if successful, false otherwise
   */
  bool commitTransaction();

  /**
   * @brief Rollback the current transaction
   *
   * @return true if successful, false otherwise
   */
  bool rollbackTransaction();

  /**
   * @brief Run a callable inside an immediate transaction
   *
   * Commits when the callable returns normally; any exception rolls the
   * transaction back and is rethrown.
   */
  template <typename Func>
  decltype(auto) withTransaction(Func&& func);

  /**
   * @brief Number of rows changed by the most recent statement
   */
  int changes() const { return sqlite3_changes(db_.get()); }

  /**
   * @brief Get the logger instance
   *
   * @return The logger instance
   */
  std::shared_ptr<spdlog::logger> getLogger() const { return logger_; }

  const std::string& getUrl() const { return dbUrl_; }

private:
  // Custom deleter for sqlite3 pointer
  struct Sqlite3Deleter
  {
    void operator()(sqlite3* db) const
    {
      if (db)
      {
        sqlite3_close(db);
      }
    }
  };

  // SQLite database smart pointer with custom deleter
  std::unique_ptr<sqlite3, Sqlite3Deleter> db_;

  // Logger instance
  std::shared_ptr<spdlog::logger> logger_;

  // Database URL (useful for logging)
  std::string dbUrl_;
};

}  // namespace ecr_db

#include "ecr-db/src/Transaction.hpp"

namespace ecr_db
{

template <typename Func>
decltype(auto) Database::withTransaction(Func&& func)
{
  Transaction transaction{*this};
  if constexpr (std::is_void_v<std::invoke_result_t<Func>>)
  {
    std::forward<Func>(func)();
    transaction.commit();
  }
  else
  {
    auto result = std::forward<Func>(func)();
    transaction.commit();
    return result;
  }
}

}  // namespace ecr_db

#endif  // ECR_DB_DATABASE_HPP
