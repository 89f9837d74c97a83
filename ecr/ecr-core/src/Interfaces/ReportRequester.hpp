#ifndef ECR_CORE_REPORT_REQUESTER_HPP
#define ECR_CORE_REPORT_REQUESTER_HPP

#include <string>

#include "ecr-core/src/DataTypes/GpsLocation.hpp"
#include "ecr-core/src/DataTypes/Interval.hpp"

namespace ecr_core
{

/**
 * @brief Everything the report service needs to produce one report
 */
struct ReportRequest
{
  double energyValue{0.0};  // [kWh]
  Interval interval;
  std::string emailAddress;
  GpsLocation location;
};

/**
 * @brief Outcome of one send attempt
 *
 * `retryable` separates transient failures (5xx, timeouts, transport
 * errors) from permanent rejections (4xx).
 */
struct RequestResult
{
  bool success{false};
  bool retryable{false};
  long httpStatus{0};  // 0 when no response was received
  std::string message;
};

/**
 * @brief Client of the remote report-generation service
 */
class ReportRequester
{
public:
  virtual ~ReportRequester() = default;

  /**
   * @brief Issue one report request
   *
   * Failures are reported through the result rather than thrown.
   */
  virtual RequestResult send(const ReportRequest& request) = 0;
};

}  // namespace ecr_core

#endif  // ECR_CORE_REPORT_REQUESTER_HPP
