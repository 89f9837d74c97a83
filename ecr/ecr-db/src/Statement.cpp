// ecr/ecr-db/src/Statement.cpp
#include "ecr-db/src/Statement.hpp"

#include "ecr-db/src/Database.hpp"

namespace ecr_db
{

Statement::Statement(sqlite3* db, const std::string& sql)
  : db_{db}, sql_{sql}
{
  sqlite3_stmt* rawStmt = nullptr;
  int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &rawStmt, nullptr);
  stmt_.reset(rawStmt);
  check(rc, "prepare");
}

Statement& Statement::bind(int index, int64_t value)
{
  check(sqlite3_bind_int64(stmt_.get(), index, value), "bind");
  return *this;
}

Statement& Statement::bind(int index, double value)
{
  check(sqlite3_bind_double(stmt_.get(), index, value), "bind");
  return *this;
}

Statement& Statement::bind(int index, const std::string& value)
{
  check(sqlite3_bind_text(stmt_.get(),
                          index,
                          value.c_str(),
                          static_cast<int>(value.size()),
                          SQLITE_TRANSIENT),
        "bind");
  return *this;
}

Statement& Statement::bind(int index, std::optional<double> value)
{
  if (value)
  {
    return bind(index, *value);
  }
  return bindNull(index);
}

Statement& Statement::bindNull(int index)
{
  check(sqlite3_bind_null(stmt_.get(), index), "bind");
  return *this;
}

bool Statement::step()
{
  int rc = sqlite3_step(stmt_.get());
  if (rc == SQLITE_ROW)
  {
    return true;
  }
  if (rc == SQLITE_DONE)
  {
    return false;
  }
  check(rc, "step");
  return false;
}

void Statement::execute()
{
  while (step())
  {
  }
}

void Statement::reset()
{
  check(sqlite3_reset(stmt_.get()), "reset");
  check(sqlite3_clear_bindings(stmt_.get()), "clear bindings");
}

int64_t Statement::columnInt64(int column) const
{
  return sqlite3_column_int64(stmt_.get(), column);
}

double Statement::columnDouble(int column) const
{
  return sqlite3_column_double(stmt_.get(), column);
}

std::string Statement::columnText(int column) const
{
  const auto* text =
    reinterpret_cast<const char*>(sqlite3_column_text(stmt_.get(), column));
  return text ? std::string{text} : std::string{};
}

bool Statement::columnIsNull(int column) const
{
  return sqlite3_column_type(stmt_.get(), column) == SQLITE_NULL;
}

void Statement::check(int rc, const char* what) const
{
  if (rc == SQLITE_OK)
  {
    return;
  }

  const char* errMsg = sqlite3_errmsg(db_);
  throw DatabaseError(std::string{"SQLite "} + what + " failed (" +
                      std::to_string(rc) + "): " +
                      (errMsg ? errMsg : "Unknown error") + " [" + sql_ + "]");
}

}  // namespace ecr_db
