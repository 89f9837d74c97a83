// ecr/ecr-db/src/Statement.hpp
#ifndef ECR_DB_STATEMENT_HPP
#define ECR_DB_STATEMENT_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <sqlite3.h>

namespace ecr_db
{

/**
 * @brief Owning handle to a compiled SQLite statement
 *
 * Parameter indices are 1-based (SQLite convention), column indices are
 * 0-based. Every failing call throws DatabaseError with the connection's
 * error message.
 */
class Statement
{
public:
  /**
   * @throws DatabaseError if the SQL does not compile
   */
  Statement(sqlite3* db, const std::string& sql);

  ~Statement() = default;

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  Statement(Statement&&) noexcept = default;
  Statement& operator=(Statement&&) noexcept = default;

  Statement& bind(int index, int64_t value);
  Statement& bind(int index, double value);
  Statement& bind(int index, const std::string& value);
  Statement& bind(int index, std::optional<double> value);
  Statement& bindNull(int index);

  /**
   * @brief Advance the statement
   *
   * @return true when a row is available, false when the statement is done
   */
  bool step();

  /**
   * @brief Run a statement that returns no rows
   */
  void execute();

  /**
   * @brief Reset the statement and clear its bindings for reuse
   */
  void reset();

  [[nodiscard]] int64_t columnInt64(int column) const;
  [[nodiscard]] double columnDouble(int column) const;
  [[nodiscard]] std::string columnText(int column) const;
  [[nodiscard]] bool columnIsNull(int column) const;

private:
  struct StmtDeleter
  {
    void operator()(sqlite3_stmt* stmt) const
    {
      if (stmt)
      {
        sqlite3_finalize(stmt);
      }
    }
  };

  void check(int rc, const char* what) const;

  sqlite3* db_;
  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string sql_;
};

}  // namespace ecr_db

#endif  // ECR_DB_STATEMENT_HPP
