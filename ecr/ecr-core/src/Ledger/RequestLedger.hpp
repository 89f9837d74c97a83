#ifndef ECR_CORE_REQUEST_LEDGER_HPP
#define ECR_CORE_REQUEST_LEDGER_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "ecr-core/src/DataTypes/Clock.hpp"
#include "ecr-core/src/DataTypes/Interval.hpp"
#include "ecr-core/src/DataTypes/ReportRequestRecord.hpp"

namespace ecr_db
{
class Database;
class Statement;
}  // namespace ecr_db

namespace ecr_core
{

/**
 * @brief Durable per-interval record of report requests
 *
 * One SQLite row per interval, keyed by the interval start. The ledger is the
 * only state the scheduler keeps: which interval is due next, whether its
 * energy was already computed and whether its request went out are all read
 * back from here, so a restarted process resumes exactly where the previous
 * one stopped.
 *
 * Every mutation runs in its own immediate transaction and is committed
 * before the call returns.
 *
 * Storage failures are raised as LedgerError.
 */
class RequestLedger
{
public:
  struct Config
  {
    std::string tableName{"report_requests"};
    std::chrono::seconds intervalLength{86400};
  };

  /**
   * @brief Attach to (and if needed create) the ledger table
   *
   * @param database Open connection; must outlive the ledger
   * @param config Table name and reporting interval length
   * @param logger Destination for ledger diagnostics
   * @param clock Time source for last_attempt_at stamps
   * @throws std::invalid_argument for a table name that is not a plain SQL
   * identifier or a non-positive interval length
   * @throws LedgerError if the table cannot be created
   */
  RequestLedger(ecr_db::Database& database,
                Config config,
                std::shared_ptr<spdlog::logger> logger,
                Clock clock = systemClock());

  /**
   * @brief Earliest interval that still needs work at `now`
   *
   * In order of preference: the oldest record that is not SENT; otherwise the
   * interval following the newest record; otherwise, for an empty ledger, the
   * latest epoch-aligned interval that has fully elapsed. An interval is only
   * returned once its end is <= now.
   */
  std::optional<Interval> nextDueInterval(std::chrono::sys_seconds now);

  /**
   * @brief Get-or-create the record for `interval`
   *
   * Creation uses INSERT OR IGNORE on the primary key, so concurrent callers
   * on separate connections end up sharing one row.
   */
  ReportRequestRecord ensureRecord(const Interval& interval);

  /**
   * @brief Store the computed energy and mark the record COMPUTED
   *
   * Applies only to records without an energy value that are PENDING or
   * FAILED.
   *
   * @return true if the transition was applied
   */
  bool recordComputed(const Interval& interval, double energyValue);

  /**
   * @brief Record the result of a send attempt
   *
   * Sets SENT or FAILED, increments attempts and stamps last_attempt_at. SENT
   * records are left untouched, and a record can only become SENT once it
   * carries an energy value.
   *
   * @return true if the transition was applied
   */
  bool recordOutcome(const Interval& interval, bool success);

  /**
   * @brief Record stored for the interval starting at `intervalStart`
   */
  std::optional<ReportRequestRecord> find(
    std::chrono::sys_seconds intervalStart);

  /**
   * @brief All records, oldest interval first
   */
  std::vector<ReportRequestRecord> records();

  [[nodiscard]] std::chrono::seconds getIntervalLength() const
  {
    return config_.intervalLength;
  }

  [[nodiscard]] const std::string& getTableName() const
  {
    return config_.tableName;
  }

private:
  void createTable();

  ReportRequestRecord readRecord(const ecr_db::Statement& stmt) const;

  std::string selectColumns() const;

  ecr_db::Database& database_;
  Config config_;
  std::shared_ptr<spdlog::logger> logger_;
  Clock clock_;
};

}  // namespace ecr_core

#endif  // ECR_CORE_REQUEST_LEDGER_HPP
