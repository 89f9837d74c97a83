#ifndef ECR_CORE_REPORT_SCHEDULER_HPP
#define ECR_CORE_REPORT_SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

#include "ecr-core/src/DataTypes/Clock.hpp"
#include "ecr-core/src/DataTypes/GpsLocation.hpp"
#include "ecr-core/src/DataTypes/Interval.hpp"
#include "ecr-core/src/DataTypes/ReportRequestRecord.hpp"

namespace ecr_core
{

class CounterSampleSource;
class EnergyAccumulator;
class ReportRequester;
class RequestLedger;

/**
 * @brief Drives the periodic compute-and-request cycle
 *
 * Each tick asks the ledger for the next due interval and moves it through
 *
 *   ENSURE_RECORD -> COMPUTE -> SEND
 *
 * skipping COMPUTE when the ledger already holds the energy value and
 * skipping everything for SENT records. After a successful send the tick
 * immediately looks for the next due interval, up to maxCatchUpPerTick
 * intervals, so a backlog left by downtime drains oldest first. Any other
 * outcome ends the tick; the interval is picked up again on the next one.
 *
 * The scheduler holds no state of its own between ticks: everything it needs
 * is re-read from the ledger, so a restart resumes from storage alone.
 *
 * Failures never escape tick(); they are logged and end the tick.
 */
class ReportScheduler
{
public:
  struct Config
  {
    std::string measurement{"emontx3"};  // Time series holding the counter
    std::string emailAddress;            // Report recipient
    GpsLocation location;
    std::chrono::seconds tickInterval{3600};
    /// How far before the interval start the source is queried for the
    /// anchor sample. Every query returns all raw samples in this window, so
    /// it should span a few collection periods rather than a whole interval.
    std::chrono::seconds anchorLookback{3600};
    std::size_t maxCatchUpPerTick{10};
  };

  /**
   * @brief How the processing of one interval ended
   */
  enum class IntervalOutcome
  {
    Sent,               // Request accepted, record SENT
    AlreadySent,        // Nothing to do
    Deferred,           // Not enough samples yet, record left as is
    Failed,             // Implausible reading or rejected request, record FAILED
    SourceUnavailable,  // Telemetry store unreachable, record left as is
  };

  struct TickSummary
  {
    bool skipped{false};  // Another tick was still running
    bool aborted{false};  // Ended by an unexpected error
    std::size_t processed{0};
    std::size_t sent{0};
    std::size_t failed{0};
    std::size_t deferred{0};
    std::size_t sourceUnavailable{0};
  };

  ReportScheduler(Config config,
                  RequestLedger& ledger,
                  const EnergyAccumulator& accumulator,
                  CounterSampleSource& source,
                  ReportRequester& requester,
                  std::shared_ptr<spdlog::logger> logger,
                  Clock clock = systemClock());

  /**
   * @brief Stops the background loop, if started, and waits for it
   */
  ~ReportScheduler();

  // Delete copy/move (thread ownership)
  ReportScheduler(const ReportScheduler&) = delete;
  ReportScheduler& operator=(const ReportScheduler&) = delete;
  ReportScheduler(ReportScheduler&&) = delete;
  ReportScheduler& operator=(ReportScheduler&&) = delete;

  /**
   * @brief Run one scheduling cycle
   *
   * Returns immediately with skipped set if another tick is in flight.
   * Never throws.
   */
  TickSummary tick();

  /**
   * @brief Tick now and then every tickInterval until stop is requested
   *
   * Sleeps in short chunks so that a stop request is honoured promptly.
   */
  void run(std::stop_token stopToken);

  /**
   * @brief Run the loop on a background thread
   */
  void start();

  /**
   * @brief Request the background loop to stop and join it
   */
  void stop();

  [[nodiscard]] const Config& getConfig() const { return config_; }

  static const char* outcomeToString(IntervalOutcome outcome);

private:
  IntervalOutcome processInterval(const Interval& due);

  /**
   * @brief Fill in the record's energy value, persisting it as COMPUTED
   *
   * @return std::nullopt on success, otherwise the outcome that ends
   * processing of this interval
   */
  std::optional<IntervalOutcome> computeEnergy(ReportRequestRecord& record);

  IntervalOutcome sendReport(const ReportRequestRecord& record);

  Config config_;
  RequestLedger& ledger_;
  const EnergyAccumulator& accumulator_;
  CounterSampleSource& source_;
  ReportRequester& requester_;
  std::shared_ptr<spdlog::logger> logger_;
  Clock clock_;
  std::atomic<bool> tickInProgress_{false};
  // IMPORTANT: worker_ must be declared LAST so it is joined before the
  // members it uses are destroyed
  std::jthread worker_;
};

}  // namespace ecr_core

#endif  // ECR_CORE_REPORT_SCHEDULER_HPP
