#ifndef ECR_CORE_REPORT_REQUEST_RECORD_HPP
#define ECR_CORE_REPORT_REQUEST_RECORD_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "ecr-core/src/DataTypes/Interval.hpp"

namespace ecr_core
{

/**
 * @brief Processing state of one interval in the ledger
 *
 * PENDING -> COMPUTED -> SENT, with FAILED reachable from PENDING and
 * COMPUTED and retried until SENT. SENT is terminal.
 */
enum class RequestStatus
{
  Pending,
  Computed,
  Sent,
  Failed
};

/**
 * @brief Persisted name of a status ("PENDING", "COMPUTED", ...)
 */
std::string toString(RequestStatus status);

/**
 * @throws std::invalid_argument for an unknown name
 */
RequestStatus requestStatusFromString(const std::string& name);

/**
 * @brief One ledger row: the processing history of a single interval
 */
struct ReportRequestRecord
{
  Interval interval;
  std::optional<double> energyValue;  // [kWh], set once computed
  RequestStatus status{RequestStatus::Pending};
  uint32_t attempts{0};
  std::optional<std::chrono::sys_seconds> lastAttemptAt;

  /**
   * @brief Whether the record still needs an energy computation
   *
   * True for PENDING, and for FAILED records that failed before an energy
   * value was ever stored.
   */
  [[nodiscard]] bool needsComputation() const
  {
    return status == RequestStatus::Pending ||
           (status == RequestStatus::Failed && !energyValue.has_value());
  }
};

}  // namespace ecr_core

#endif  // ECR_CORE_REPORT_REQUEST_RECORD_HPP
