#ifndef ECR_IO_HTTP_REPORT_REQUESTER_HPP
#define ECR_IO_HTTP_REPORT_REQUESTER_HPP

#include <chrono>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "ecr-core/src/Interfaces/ReportRequester.hpp"
#include "ecr-io/src/HttpClient.hpp"

namespace ecr_io
{

/**
 * @brief Requests reports from the remote service with a JSON POST
 */
class HttpReportRequester : public ecr_core::ReportRequester
{
public:
  struct Config
  {
    std::string url{"https://tdm-or5.jicsardegna.it/get_report"};
    std::string measurement{"emontx3"};
    bool verifyTls{true};
    std::chrono::seconds timeout{30};
  };

  HttpReportRequester(Config config, std::shared_ptr<spdlog::logger> logger);

  ecr_core::RequestResult send(const ecr_core::ReportRequest& request) override;

private:
  Config config_;
  std::shared_ptr<spdlog::logger> logger_;
  HttpClient client_;
};

/**
 * @brief JSON body of a report request
 *
 * Members: email_address, energy_kwh, interval_start, interval_end,
 * latitude, longitude, measurement. Timestamps are ISO-8601 UTC.
 */
std::string buildRequestBody(const ecr_core::ReportRequest& request,
                             const std::string& measurement);

/**
 * @brief Map an HTTP status to a send outcome
 *
 * 2xx succeeds. 4xx is a permanent rejection, except 408 and 429 which are
 * transient like 5xx. Anything else is treated as transient.
 */
ecr_core::RequestResult classifyStatus(long httpStatus, const std::string& body);

}  // namespace ecr_io

#endif  // ECR_IO_HTTP_REPORT_REQUESTER_HPP
