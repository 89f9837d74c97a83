#include "ecr-io/src/HttpReportRequester.hpp"

#include <sstream>
#include <utility>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <spdlog/fmt/fmt.h>

#include "ecr-core/src/DataTypes/Interval.hpp"

namespace ecr_io
{

namespace
{

constexpr std::size_t kMaxBodyInMessage = 200;

}  // namespace

HttpReportRequester::HttpReportRequester(Config config,
                                         std::shared_ptr<spdlog::logger> logger)
  : config_{std::move(config)},
    logger_{std::move(logger)},
    client_{HttpClient::Options{config_.timeout, config_.verifyTls, {}, {}}}
{
  if (!config_.verifyTls)
  {
    logger_->warn("TLS certificate verification disabled for {}", config_.url);
  }
}

ecr_core::RequestResult HttpReportRequester::send(
  const ecr_core::ReportRequest& request)
{
  const std::string body = buildRequestBody(request, config_.measurement);
  logger_->debug("Sending data to {}", config_.url);

  HttpResponse response;
  try
  {
    response = client_.post(config_.url, body, "application/json");
  }
  catch (const TransportError& e)
  {
    return ecr_core::RequestResult{false, true, 0, e.what()};
  }

  logger_->debug("Response status code: {}", response.status);
  logger_->debug("Response message: {}", response.body);
  return classifyStatus(response.status, response.body);
}

std::string buildRequestBody(const ecr_core::ReportRequest& request,
                             const std::string& measurement)
{
  boost::property_tree::ptree tree;
  tree.put("email_address", request.emailAddress);
  tree.put("energy_kwh", fmt::format("{}", request.energyValue));
  tree.put("interval_start", ecr_core::formatTimestamp(request.interval.start));
  tree.put("interval_end", ecr_core::formatTimestamp(request.interval.end));
  tree.put("latitude", fmt::format("{}", request.location.latitude));
  tree.put("longitude", fmt::format("{}", request.location.longitude));
  tree.put("measurement", measurement);

  std::ostringstream out;
  boost::property_tree::write_json(out, tree, false);
  return out.str();
}

ecr_core::RequestResult classifyStatus(long httpStatus, const std::string& body)
{
  ecr_core::RequestResult result;
  result.httpStatus = httpStatus;
  result.message = body.size() <= kMaxBodyInMessage
                     ? body
                     : body.substr(0, kMaxBodyInMessage) + "...";

  if (httpStatus >= 200 && httpStatus < 300)
  {
    result.success = true;
    result.retryable = false;
  }
  else if (httpStatus >= 400 && httpStatus < 500 && httpStatus != 408 &&
           httpStatus != 429)
  {
    result.success = false;
    result.retryable = false;
  }
  else
  {
    result.success = false;
    result.retryable = true;
  }
  return result;
}

}  // namespace ecr_io
