#ifndef ECR_IO_INFLUX_SAMPLE_SOURCE_HPP
#define ECR_IO_INFLUX_SAMPLE_SOURCE_HPP

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "ecr-core/src/DataTypes/CounterSample.hpp"
#include "ecr-core/src/Interfaces/CounterSampleSource.hpp"
#include "ecr-io/src/HttpClient.hpp"

namespace ecr_io
{

/**
 * @brief Reads pulse counter samples from an InfluxDB 1.x HTTP endpoint
 *
 * Samples are fetched with one SELECT per query window using second
 * precision timestamps (`epoch=s`).
 */
class InfluxSampleSource : public ecr_core::CounterSampleSource
{
public:
  struct Config
  {
    std::string host{"influxdb"};
    int port{8086};
    std::string database{"Emon"};
    std::string username{"root"};
    std::string password{"root"};
    std::string pulseField{"pulse"};
    std::chrono::seconds timeout{30};
  };

  InfluxSampleSource(Config config, std::shared_ptr<spdlog::logger> logger);

  /**
   * @throws ecr_core::SourceUnavailableError on transport failure, a non-200
   * status or an unparseable response
   */
  std::vector<ecr_core::CounterSample> query(
    const std::string& measurement,
    std::chrono::sys_seconds start,
    std::chrono::sys_seconds end) override;

  /**
   * @brief Whether the configured database exists on the server
   */
  bool databaseExists();

  /**
   * @brief Issue CREATE DATABASE for the configured database
   *
   * A no-op on the server if it already exists.
   */
  void createDatabase();

  [[nodiscard]] std::string baseUrl() const;

private:
  /**
   * @brief Run a read-only statement and return the response body
   */
  std::string runQuery(const std::string& statement, bool withDatabase);

  Config config_;
  std::shared_ptr<spdlog::logger> logger_;
  HttpClient client_;
};

/**
 * @brief InfluxQL statement selecting the counter field in [start, end)
 */
std::string buildSelectStatement(const std::string& pulseField,
                                 const std::string& measurement,
                                 std::chrono::sys_seconds start,
                                 std::chrono::sys_seconds end);

/**
 * @brief Turn an InfluxDB JSON query response into counter samples
 *
 * Rows with a null value are skipped and fractional values are truncated.
 * A response without series yields no samples.
 *
 * @throws ecr_core::SourceUnavailableError for malformed JSON, an "error"
 * member or a value that is not a non-negative number
 */
std::vector<ecr_core::CounterSample> parseInfluxResponse(const std::string& body);

/**
 * @brief Database names listed by a SHOW DATABASES response
 *
 * @throws ecr_core::SourceUnavailableError as parseInfluxResponse
 */
std::vector<std::string> parseDatabaseNames(const std::string& body);

}  // namespace ecr_io

#endif  // ECR_IO_INFLUX_SAMPLE_SOURCE_HPP
