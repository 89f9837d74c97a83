#include "ecr-core/src/Ledger/RequestLedger.hpp"

#include <cctype>
#include <stdexcept>
#include <utility>

#include "ecr-core/src/Errors.hpp"
#include "ecr-db/src/Database.hpp"

namespace ecr_core
{

namespace
{

int64_t toEpochSeconds(std::chrono::sys_seconds t)
{
  return static_cast<int64_t>(t.time_since_epoch().count());
}

std::chrono::sys_seconds fromEpochSeconds(int64_t seconds)
{
  return std::chrono::sys_seconds{std::chrono::seconds{seconds}};
}

bool isPlainIdentifier(const std::string& name)
{
  if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())))
  {
    return false;
  }
  for (char c : name)
  {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_')
    {
      return false;
    }
  }
  return true;
}

/**
 * Runs a storage operation, rethrowing SQLite failures as LedgerError
 */
template <typename Func>
decltype(auto) translateErrors(const char* operation, Func&& func)
{
  try
  {
    return std::forward<Func>(func)();
  }
  catch (const ecr_db::DatabaseError& e)
  {
    throw LedgerError(std::string{operation} + " failed: " + e.what());
  }
}

}  // namespace

RequestLedger::RequestLedger(ecr_db::Database& database,
                             Config config,
                             std::shared_ptr<spdlog::logger> logger,
                             Clock clock)
  : database_{database},
    config_{std::move(config)},
    logger_{std::move(logger)},
    clock_{std::move(clock)}
{
  if (!isPlainIdentifier(config_.tableName))
  {
    throw std::invalid_argument("Ledger table name '" + config_.tableName +
                                "' is not a plain SQL identifier");
  }
  if (config_.intervalLength <= std::chrono::seconds{0})
  {
    throw std::invalid_argument("Reporting interval must be positive, got " +
                                std::to_string(config_.intervalLength.count()) +
                                " s");
  }

  createTable();
}

void RequestLedger::createTable()
{
  const std::string sql = "CREATE TABLE IF NOT EXISTS " + config_.tableName +
                          " ("
                          "interval_start INTEGER PRIMARY KEY, "
                          "interval_end INTEGER NOT NULL, "
                          "energy_value REAL, "
                          "status TEXT NOT NULL, "
                          "attempts INTEGER NOT NULL DEFAULT 0, "
                          "last_attempt_at INTEGER)";

  if (!database_.executeQuery(sql))
  {
    throw LedgerError("Could not create ledger table '" + config_.tableName +
                      "' in " + database_.getUrl());
  }
  logger_->debug("Ledger table '{}' ready", config_.tableName);
}

std::string RequestLedger::selectColumns() const
{
  return "SELECT interval_start, interval_end, energy_value, status, "
         "attempts, last_attempt_at FROM " +
         config_.tableName;
}

ReportRequestRecord RequestLedger::readRecord(
  const ecr_db::Statement& stmt) const
{
  ReportRequestRecord record;
  record.interval.start = fromEpochSeconds(stmt.columnInt64(0));
  record.interval.end = fromEpochSeconds(stmt.columnInt64(1));
  if (!stmt.columnIsNull(2))
  {
    record.energyValue = stmt.columnDouble(2);
  }

  try
  {
    record.status = requestStatusFromString(stmt.columnText(3));
  }
  catch (const std::invalid_argument& e)
  {
    throw LedgerError("Corrupt ledger row " + record.interval.toString() +
                      ": " + e.what());
  }

  record.attempts = static_cast<uint32_t>(stmt.columnInt64(4));
  if (!stmt.columnIsNull(5))
  {
    record.lastAttemptAt = fromEpochSeconds(stmt.columnInt64(5));
  }
  return record;
}

std::optional<Interval> RequestLedger::nextDueInterval(
  std::chrono::sys_seconds now)
{
  return translateErrors(
    "nextDueInterval",
    [&]() -> std::optional<Interval>
    {
      auto unsent = database_.prepare(
        "SELECT interval_start, interval_end FROM " + config_.tableName +
        " WHERE status != ? ORDER BY interval_start ASC LIMIT 1");
      unsent.bind(1, toString(RequestStatus::Sent));
      if (unsent.step())
      {
        Interval interval{fromEpochSeconds(unsent.columnInt64(0)),
                          fromEpochSeconds(unsent.columnInt64(1))};
        if (interval.end <= now)
        {
          return interval;
        }
        return std::nullopt;
      }

      auto latest =
        database_.prepare("SELECT interval_end FROM " + config_.tableName +
                          " ORDER BY interval_start DESC LIMIT 1");

      Interval candidate;
      if (latest.step())
      {
        candidate = Interval{fromEpochSeconds(latest.columnInt64(0)),
                             fromEpochSeconds(latest.columnInt64(0)) +
                               config_.intervalLength};
      }
      else
      {
        candidate = Interval::lastCompleted(now, config_.intervalLength);
      }

      if (candidate.end <= now)
      {
        return candidate;
      }
      return std::nullopt;
    });
}

ReportRequestRecord RequestLedger::ensureRecord(const Interval& interval)
{
  return translateErrors(
    "ensureRecord",
    [&]()
    {
      return database_.withTransaction(
        [&]()
        {
          auto insert = database_.prepare(
            "INSERT OR IGNORE INTO " + config_.tableName +
            " (interval_start, interval_end, status, attempts)"
            " VALUES (?, ?, ?, 0)");
          insert.bind(1, toEpochSeconds(interval.start))
            .bind(2, toEpochSeconds(interval.end))
            .bind(3, toString(RequestStatus::Pending));
          insert.execute();

          if (database_.changes() > 0)
          {
            logger_->info("Created ledger record for {}", interval.toString());
          }

          auto select =
            database_.prepare(selectColumns() + " WHERE interval_start = ?");
          select.bind(1, toEpochSeconds(interval.start));
          if (!select.step())
          {
            throw LedgerError("Record for " + interval.toString() +
                              " vanished after insert");
          }

          ReportRequestRecord record = readRecord(select);
          if (record.interval.end != interval.end)
          {
            logger_->warn(
              "Ledger record {} does not match requested interval {}; "
              "keeping the stored bounds",
              record.interval.toString(),
              interval.toString());
          }
          return record;
        });
    });
}

bool RequestLedger::recordComputed(const Interval& interval, double energyValue)
{
  return translateErrors(
    "recordComputed",
    [&]()
    {
      return database_.withTransaction(
        [&]()
        {
          auto update = database_.prepare(
            "UPDATE " + config_.tableName +
            " SET energy_value = ?, status = ?"
            " WHERE interval_start = ? AND energy_value IS NULL"
            " AND status IN (?, ?)");
          update.bind(1, energyValue)
            .bind(2, toString(RequestStatus::Computed))
            .bind(3, toEpochSeconds(interval.start))
            .bind(4, toString(RequestStatus::Pending))
            .bind(5, toString(RequestStatus::Failed));
          update.execute();

          const bool applied = database_.changes() > 0;
          if (applied)
          {
            logger_->info("Interval {} computed: {} kWh",
                          interval.toString(),
                          energyValue);
          }
          else
          {
            logger_->warn("Interval {} not in a computable state; energy {} "
                          "kWh discarded",
                          interval.toString(),
                          energyValue);
          }
          return applied;
        });
    });
}

bool RequestLedger::recordOutcome(const Interval& interval, bool success)
{
  return translateErrors(
    "recordOutcome",
    [&]()
    {
      return database_.withTransaction(
        [&]()
        {
          std::string sql = "UPDATE " + config_.tableName +
                            " SET status = ?, attempts = attempts + 1,"
                            " last_attempt_at = ?"
                            " WHERE interval_start = ? AND status != ?";
          if (success)
          {
            sql += " AND energy_value IS NOT NULL";
          }

          const auto status =
            success ? RequestStatus::Sent : RequestStatus::Failed;
          auto update = database_.prepare(sql);
          update.bind(1, toString(status))
            .bind(2, toEpochSeconds(clock_()))
            .bind(3, toEpochSeconds(interval.start))
            .bind(4, toString(RequestStatus::Sent));
          update.execute();

          const bool applied = database_.changes() > 0;
          if (applied)
          {
            logger_->debug(
              "Interval {} marked {}", interval.toString(), toString(status));
          }
          else
          {
            logger_->warn("Outcome {} for interval {} not applied",
                          toString(status),
                          interval.toString());
          }
          return applied;
        });
    });
}

std::optional<ReportRequestRecord> RequestLedger::find(
  std::chrono::sys_seconds intervalStart)
{
  return translateErrors(
    "find",
    [&]() -> std::optional<ReportRequestRecord>
    {
      auto select =
        database_.prepare(selectColumns() + " WHERE interval_start = ?");
      select.bind(1, toEpochSeconds(intervalStart));
      if (select.step())
      {
        return readRecord(select);
      }
      return std::nullopt;
    });
}

std::vector<ReportRequestRecord> RequestLedger::records()
{
  return translateErrors(
    "records",
    [&]()
    {
      std::vector<ReportRequestRecord> result;
      auto select =
        database_.prepare(selectColumns() + " ORDER BY interval_start ASC");
      while (select.step())
      {
        result.push_back(readRecord(select));
      }
      return result;
    });
}

}  // namespace ecr_core
