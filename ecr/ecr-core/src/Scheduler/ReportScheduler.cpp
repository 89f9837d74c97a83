#include "ecr-core/src/Scheduler/ReportScheduler.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

#include "ecr-core/src/Energy/EnergyAccumulator.hpp"
#include "ecr-core/src/Errors.hpp"
#include "ecr-core/src/Interfaces/CounterSampleSource.hpp"
#include "ecr-core/src/Interfaces/ReportRequester.hpp"
#include "ecr-core/src/Ledger/RequestLedger.hpp"

namespace ecr_core
{

namespace
{

// Clears the in-flight flag on every exit path of a tick
class TickGuard
{
public:
  explicit TickGuard(std::atomic<bool>& flag)
    : flag_{flag}
  {
  }

  ~TickGuard() { flag_.store(false); }

  TickGuard(const TickGuard&) = delete;
  TickGuard& operator=(const TickGuard&) = delete;

private:
  std::atomic<bool>& flag_;
};

}  // namespace

ReportScheduler::ReportScheduler(Config config,
                                 RequestLedger& ledger,
                                 const EnergyAccumulator& accumulator,
                                 CounterSampleSource& source,
                                 ReportRequester& requester,
                                 std::shared_ptr<spdlog::logger> logger,
                                 Clock clock)
  : config_{std::move(config)},
    ledger_{ledger},
    accumulator_{accumulator},
    source_{source},
    requester_{requester},
    logger_{std::move(logger)},
    clock_{std::move(clock)}
{
  if (config_.tickInterval <= std::chrono::seconds{0})
  {
    throw std::invalid_argument("Tick interval must be positive");
  }
  if (config_.maxCatchUpPerTick == 0)
  {
    throw std::invalid_argument("maxCatchUpPerTick must be at least 1");
  }
}

ReportScheduler::~ReportScheduler()
{
  stop();
}

ReportScheduler::TickSummary ReportScheduler::tick()
{
  TickSummary summary;

  bool expected = false;
  if (!tickInProgress_.compare_exchange_strong(expected, true))
  {
    logger_->warn("Previous reporting tick still running, skipping");
    summary.skipped = true;
    return summary;
  }
  TickGuard guard{tickInProgress_};

  const auto tickStart = std::chrono::steady_clock::now();
  logger_->info("Starting reporting tick...");

  try
  {
    bool keepGoing = true;
    while (keepGoing && summary.processed < config_.maxCatchUpPerTick)
    {
      auto due = ledger_.nextDueInterval(clock_());
      if (!due)
      {
        logger_->debug("No interval due");
        break;
      }

      const IntervalOutcome outcome = processInterval(*due);
      ++summary.processed;
      logger_->debug(
        "Interval {} -> {}", due->toString(), outcomeToString(outcome));

      switch (outcome)
      {
        case IntervalOutcome::Sent:
          ++summary.sent;
          break;
        case IntervalOutcome::AlreadySent:
          break;
        case IntervalOutcome::Deferred:
          ++summary.deferred;
          keepGoing = false;
          break;
        case IntervalOutcome::Failed:
          ++summary.failed;
          keepGoing = false;
          break;
        case IntervalOutcome::SourceUnavailable:
          ++summary.sourceUnavailable;
          keepGoing = false;
          break;
      }
    }

    if (keepGoing && summary.processed == config_.maxCatchUpPerTick)
    {
      logger_->info("Catch-up limit of {} intervals reached; remaining backlog "
                    "continues on the next tick",
                    config_.maxCatchUpPerTick);
    }
  }
  catch (const std::exception& e)
  {
    logger_->error("Reporting tick aborted: {}", e.what());
    summary.aborted = true;
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - tickStart);
  logger_->info("Reporting tick completed in {} ms ({} processed, {} sent)",
                elapsed.count(),
                summary.processed,
                summary.sent);
  return summary;
}

ReportScheduler::IntervalOutcome ReportScheduler::processInterval(
  const Interval& due)
{
  ReportRequestRecord record = ledger_.ensureRecord(due);

  if (record.status == RequestStatus::Sent)
  {
    logger_->info("The report for interval {} had already been sent",
                  record.interval.toString());
    return IntervalOutcome::AlreadySent;
  }

  if (record.needsComputation())
  {
    if (auto stop = computeEnergy(record))
    {
      return *stop;
    }
  }
  else
  {
    logger_->info("Resuming interval {} with stored energy {} kWh ({})",
                  record.interval.toString(),
                  record.energyValue.value_or(0.0),
                  toString(record.status));
  }

  return sendReport(record);
}

std::optional<ReportScheduler::IntervalOutcome> ReportScheduler::computeEnergy(
  ReportRequestRecord& record)
{
  const Interval& interval = record.interval;

  std::vector<CounterSample> samples;
  try
  {
    samples = source_.query(
      config_.measurement, interval.start - config_.anchorLookback, interval.end);
  }
  catch (const SourceUnavailableError& e)
  {
    logger_->warn("Counter samples for {} unavailable: {}",
                  interval.toString(),
                  e.what());
    return IntervalOutcome::SourceUnavailable;
  }
  logger_->debug("Retrieved {} samples for {}", samples.size(), interval.toString());

  double energy = 0.0;
  try
  {
    energy = accumulator_.compute(interval, samples);
  }
  catch (const InsufficientDataError& e)
  {
    logger_->warn("Deferring interval {}: {}", interval.toString(), e.what());
    return IntervalOutcome::Deferred;
  }
  catch (const ImplausibleReadingError& e)
  {
    logger_->error("Implausible reading for {}: {}", interval.toString(), e.what());
    return ledger_.recordOutcome(interval, false) ? IntervalOutcome::Failed
                                                  : IntervalOutcome::AlreadySent;
  }
  catch (const std::invalid_argument& e)
  {
    logger_->error("Invalid counter samples for {}: {}",
                   interval.toString(),
                   e.what());
    return ledger_.recordOutcome(interval, false) ? IntervalOutcome::Failed
                                                  : IntervalOutcome::AlreadySent;
  }

  if (!ledger_.recordComputed(interval, energy))
  {
    // The stored record moved on under us; continue from what is persisted
    auto stored = ledger_.find(interval.start);
    if (!stored || stored->status == RequestStatus::Sent)
    {
      return IntervalOutcome::AlreadySent;
    }
    if (!stored->energyValue)
    {
      throw LedgerError("Energy for " + interval.toString() +
                        " could not be persisted");
    }
    record = *stored;
    return std::nullopt;
  }

  record.energyValue = energy;
  record.status = RequestStatus::Computed;
  return std::nullopt;
}

ReportScheduler::IntervalOutcome ReportScheduler::sendReport(
  const ReportRequestRecord& record)
{
  ReportRequest request;
  request.energyValue = record.energyValue.value_or(0.0);
  request.interval = record.interval;
  request.emailAddress = config_.emailAddress;
  request.location = config_.location;

  logger_->debug("Sending report request for {} ({} kWh, attempt {})",
                 record.interval.toString(),
                 request.energyValue,
                 record.attempts + 1);

  RequestResult result;
  try
  {
    result = requester_.send(request);
  }
  catch (const std::exception& e)
  {
    result.success = false;
    result.retryable = true;
    result.message = e.what();
  }

  if (result.success)
  {
    if (!ledger_.recordOutcome(record.interval, true))
    {
      throw LedgerError("Delivery of " + record.interval.toString() +
                        " could not be recorded");
    }
    logger_->info("Report for {} requested (HTTP {})",
                  record.interval.toString(),
                  result.httpStatus);
    return IntervalOutcome::Sent;
  }

  if (!ledger_.recordOutcome(record.interval, false))
  {
    return IntervalOutcome::AlreadySent;
  }
  if (result.retryable)
  {
    logger_->warn("Report request for {} failed (HTTP {}): {}; retrying on "
                  "the next tick",
                  record.interval.toString(),
                  result.httpStatus,
                  result.message);
  }
  else
  {
    // Permanent rejections are still retried; they need operator attention
    logger_->error("Report request for {} rejected (HTTP {}): {}; the "
                   "interval blocks later reports until the cause is fixed",
                   record.interval.toString(),
                   result.httpStatus,
                   result.message);
  }
  return IntervalOutcome::Failed;
}

void ReportScheduler::run(std::stop_token stopToken)
{
  // Use smaller sleep intervals for responsive shutdown
  constexpr auto kSleepChunk = std::chrono::milliseconds{100};

  logger_->info("Scheduler running every {} s", config_.tickInterval.count());

  while (!stopToken.stop_requested())
  {
    tick();

    auto remaining =
      std::chrono::duration_cast<std::chrono::milliseconds>(config_.tickInterval);
    while (remaining > std::chrono::milliseconds{0} &&
           !stopToken.stop_requested())
    {
      auto sleepTime = std::min(remaining, kSleepChunk);
      std::this_thread::sleep_for(sleepTime);
      remaining -= sleepTime;
    }
  }

  logger_->info("Scheduler stopped");
}

void ReportScheduler::start()
{
  if (worker_.joinable())
  {
    return;
  }
  worker_ =
    std::jthread{[this](std::stop_token st) { run(std::move(st)); }};
}

void ReportScheduler::stop()
{
  if (worker_.joinable())
  {
    worker_.request_stop();
    worker_.join();
  }
}

const char* ReportScheduler::outcomeToString(IntervalOutcome outcome)
{
  switch (outcome)
  {
    case IntervalOutcome::Sent:
      return "SENT";
    case IntervalOutcome::AlreadySent:
      return "ALREADY_SENT";
    case IntervalOutcome::Deferred:
      return "DEFERRED";
    case IntervalOutcome::Failed:
      return "FAILED";
    case IntervalOutcome::SourceUnavailable:
      return "SOURCE_UNAVAILABLE";
  }
  return "UNKNOWN";
}

}  // namespace ecr_core
