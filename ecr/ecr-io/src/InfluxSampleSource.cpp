#include "ecr-io/src/InfluxSampleSource.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "ecr-core/src/Errors.hpp"

namespace ecr_io
{

namespace pt = boost::property_tree;

using ecr_core::SourceUnavailableError;

namespace
{

constexpr std::size_t kMaxBodyInMessage = 200;

std::string quoteIdentifier(const std::string& name)
{
  std::string quoted{"\""};
  for (char c : name)
  {
    if (c == '"' || c == '\\')
    {
      quoted += '\\';
    }
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

std::string abbreviate(const std::string& body)
{
  if (body.size() <= kMaxBodyInMessage)
  {
    return body;
  }
  return body.substr(0, kMaxBodyInMessage) + "...";
}

pt::ptree parseJson(const std::string& body)
{
  std::istringstream stream{body};
  pt::ptree root;
  try
  {
    pt::read_json(stream, root);
  }
  catch (const pt::json_parser_error& e)
  {
    throw SourceUnavailableError(std::string{"Malformed InfluxDB response: "} +
                                 e.what());
  }

  if (auto error = root.get_optional<std::string>("error"))
  {
    throw SourceUnavailableError("InfluxDB error: " + *error);
  }
  return root;
}

// Calls visit(row) for every row of every series of every statement result
template <typename Visitor>
void forEachRow(const pt::ptree& root, Visitor&& visit)
{
  auto results = root.get_child_optional("results");
  if (!results)
  {
    throw SourceUnavailableError("InfluxDB response has no 'results' member");
  }

  for (const auto& [resultKey, result] : *results)
  {
    if (auto error = result.template get_optional<std::string>("error"))
    {
      throw SourceUnavailableError("InfluxDB statement error: " + *error);
    }

    auto series = result.get_child_optional("series");
    if (!series)
    {
      continue;
    }
    for (const auto& [seriesKey, entry] : *series)
    {
      auto values = entry.get_child_optional("values");
      if (!values)
      {
        continue;
      }
      for (const auto& [rowKey, row] : *values)
      {
        visit(row);
      }
    }
  }
}

double parseNumber(const std::string& text, const char* what)
{
  std::size_t consumed = 0;
  double value = 0.0;
  try
  {
    value = std::stod(text, &consumed);
  }
  catch (const std::exception&)
  {
    consumed = 0;
  }

  if (consumed == 0 || consumed != text.size() || !std::isfinite(value))
  {
    throw SourceUnavailableError(std::string{"Invalid "} + what +
                                 " in InfluxDB response: '" + text + "'");
  }
  return value;
}

}  // namespace

InfluxSampleSource::InfluxSampleSource(Config config,
                                       std::shared_ptr<spdlog::logger> logger)
  : config_{std::move(config)},
    logger_{std::move(logger)},
    client_{HttpClient::Options{
      config_.timeout, true, config_.username, config_.password}}
{
}

std::string InfluxSampleSource::baseUrl() const
{
  if (config_.host.rfind("http://", 0) == 0 ||
      config_.host.rfind("https://", 0) == 0)
  {
    return config_.host + ":" + std::to_string(config_.port);
  }
  return "http://" + config_.host + ":" + std::to_string(config_.port);
}

std::string InfluxSampleSource::runQuery(const std::string& statement,
                                         bool withDatabase)
{
  HttpResponse response;
  try
  {
    std::string url = baseUrl() + "/query?";
    if (withDatabase)
    {
      url += "db=" + HttpClient::escape(config_.database) + "&";
    }
    url += "epoch=s&q=" + HttpClient::escape(statement);

    response = client_.get(url);
  }
  catch (const TransportError& e)
  {
    throw SourceUnavailableError(std::string{"InfluxDB unreachable: "} +
                                 e.what());
  }

  if (response.status != 200)
  {
    throw SourceUnavailableError("InfluxDB answered HTTP " +
                                 std::to_string(response.status) + ": " +
                                 abbreviate(response.body));
  }
  return response.body;
}

std::vector<ecr_core::CounterSample> InfluxSampleSource::query(
  const std::string& measurement,
  std::chrono::sys_seconds start,
  std::chrono::sys_seconds end)
{
  const auto statement =
    buildSelectStatement(config_.pulseField, measurement, start, end);
  logger_->debug("Querying InfluxDB: {}", statement);

  auto samples = parseInfluxResponse(runQuery(statement, true));
  logger_->debug("Retrieved {} measurements from '{}'", samples.size(), measurement);
  return samples;
}

bool InfluxSampleSource::databaseExists()
{
  const auto names = parseDatabaseNames(runQuery("SHOW DATABASES", false));
  for (const auto& name : names)
  {
    if (name == config_.database)
    {
      return true;
    }
  }
  return false;
}

void InfluxSampleSource::createDatabase()
{
  HttpResponse response;
  try
  {
    const std::string body = "q=" + HttpClient::escape("CREATE DATABASE " +
                                                       quoteIdentifier(config_.database));
    response = client_.post(
      baseUrl() + "/query", body, "application/x-www-form-urlencoded");
  }
  catch (const TransportError& e)
  {
    throw SourceUnavailableError(std::string{"InfluxDB unreachable: "} +
                                 e.what());
  }

  if (response.status != 200)
  {
    throw SourceUnavailableError("CREATE DATABASE answered HTTP " +
                                 std::to_string(response.status) + ": " +
                                 abbreviate(response.body));
  }
  // Raises on a statement-level "error" member; the rows themselves are empty
  forEachRow(parseJson(response.body), [](const pt::ptree&) {});
  logger_->info("Created InfluxDB database '{}'", config_.database);
}

std::string buildSelectStatement(const std::string& pulseField,
                                 const std::string& measurement,
                                 std::chrono::sys_seconds start,
                                 std::chrono::sys_seconds end)
{
  std::ostringstream statement;
  statement << "SELECT " << quoteIdentifier(pulseField) << " FROM "
            << quoteIdentifier(measurement)
            << " WHERE time >= " << start.time_since_epoch().count()
            << "s AND time < " << end.time_since_epoch().count()
            << "s ORDER BY time ASC";
  return statement.str();
}

std::vector<ecr_core::CounterSample> parseInfluxResponse(const std::string& body)
{
  std::vector<ecr_core::CounterSample> samples;

  forEachRow(
    parseJson(body),
    [&samples](const pt::ptree& row)
    {
      if (row.size() < 2)
      {
        throw SourceUnavailableError("InfluxDB row has fewer than two columns");
      }

      auto column = row.begin();
      const std::string timeText = column->second.data();
      ++column;
      const std::string valueText = column->second.data();

      if (valueText == "null")
      {
        return;
      }

      const double time = parseNumber(timeText, "timestamp");
      const double value = parseNumber(valueText, "counter value");
      if (value < 0.0 ||
          value >= static_cast<double>(std::numeric_limits<uint64_t>::max()))
      {
        throw SourceUnavailableError("Counter value out of range: " + valueText);
      }

      samples.push_back(ecr_core::CounterSample{
        std::chrono::sys_seconds{
          std::chrono::seconds{static_cast<int64_t>(std::trunc(time))}},
        static_cast<uint64_t>(std::trunc(value))});
    });

  return samples;
}

std::vector<std::string> parseDatabaseNames(const std::string& body)
{
  std::vector<std::string> names;
  forEachRow(parseJson(body),
             [&names](const pt::ptree& row)
             {
               if (!row.empty())
               {
                 names.push_back(row.begin()->second.data());
               }
             });
  return names;
}

}  // namespace ecr_io
