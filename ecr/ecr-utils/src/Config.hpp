#ifndef ECR_UTILS_CONFIG_HPP
#define ECR_UTILS_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "ecr-core/src/DataTypes/GpsLocation.hpp"

namespace ecr_utils
{

/// INI section holding the application specific options
inline constexpr const char* kApplicationName = "Energy_Consumption_Report";

/// INI section shared by all services of the installation
inline constexpr const char* kGeneralSection = "GENERAL";

/**
 * @brief Invalid or unreadable configuration
 */
class ConfigError final : public std::runtime_error
{
public:
  explicit ConfigError(const std::string& msg)
    : std::runtime_error(msg)
  {
  }
};

/**
 * @brief Fully resolved service configuration
 *
 * Default member values are the built-in defaults.
 */
struct AppConfig
{
  // General options, shared through the [GENERAL] section
  int loggingLevel{20};
  std::string influxdbHost{"influxdb"};
  int influxdbPort{8086};
  std::string influxdbDatabase{"Emon"};
  std::string influxdbUsername{"root"};
  std::string influxdbPassword{"root"};
  ecr_core::GpsLocation gpsLocation{0.0, 0.0};

  // Application options
  std::string measurementTs{"emontx3"};
  std::string pulseField{"pulse"};
  std::string emailAddress{"username@example.com"};
  std::string webServerUrl{"https://tdm-or5.jicsardegna.it/get_report"};
  bool webServerVerifyTls{true};
  std::string sqliteDb{"/sqlite_db/reporting.db"};
  std::string sqliteDbTable{"report_requests"};
  std::chrono::seconds reportingInterval{86400};
  std::chrono::seconds anchorLookback{3600};
  double pulsesPerKwh{1000.0};
  double maxPowerW{15000.0};
  std::chrono::seconds requestTimeout{30};
  std::size_t maxCatchUpPerTick{10};
  std::chrono::seconds tickInterval{3600};

  std::optional<std::string> configFile;
  bool helpRequested{false};

  /// Keys found in the configuration file that no option uses
  std::vector<std::string> ignoredKeys;
};

/**
 * @brief Resolve the configuration from the command line
 *
 * Precedence, lowest first: built-in defaults, the general keys of the
 * [GENERAL] section, the [Energy_Consumption_Report] section, command-line
 * options. The file is named with -c/--config-file.
 *
 * @param args Command-line arguments without the program name
 * @throws ConfigError for unknown options, unreadable files or invalid values
 */
AppConfig parseConfiguration(const std::vector<std::string>& args);

/**
 * @brief Help text listing every option with its default
 */
std::string usage(const std::string& programName);

/**
 * @brief Parse "latitude,longitude"
 *
 * @throws ConfigError if malformed or out of range
 */
ecr_core::GpsLocation parseGpsLocation(const std::string& text);

/**
 * @brief Accepts true/t/1/yes/y and false/f/0/no/n, case-insensitively
 *
 * @throws ConfigError otherwise
 */
bool parseBool(const std::string& text);

}  // namespace ecr_utils

#endif  // ECR_UTILS_CONFIG_HPP
