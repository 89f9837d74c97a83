#include "ecr-utils/src/Config.hpp"

#include <getopt.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iterator>
#include <limits>
#include <map>
#include <sstream>
#include <utility>

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace ecr_utils
{

namespace
{

struct OptionSpec
{
  const char* key;           // INI key; the long option replaces '_' with '-'
  const char* defaultValue;  // As it would be written in the INI file
  bool general;              // Accepted in the [GENERAL] section
  const char* help;
};

constexpr OptionSpec kOptions[] = {
  {"logging_level", "20", true, "threshold level for log messages"},
  {"influxdb_host", "influxdb", true, "hostname or address of the influx database"},
  {"influxdb_port", "8086", true, "port of the influx database"},
  {"influxdb_database", "Emon", true, "name of the influx database"},
  {"influxdb_username", "root", true, "username of the influx database"},
  {"influxdb_password", "root", true, "password of the influx database"},
  {"gps_location", "0.0,0.0", true, "GPS coordinates of the sensor as latitude,longitude"},
  {"measurement_ts", "emontx3", false, "name of the time series containing the pulse measurements"},
  {"pulse_field", "pulse", false, "field of the time series holding the pulse counter"},
  {"email_address", "username@example.com", false, "email address where to receive the report"},
  {"web_server_url", "https://tdm-or5.jicsardegna.it/get_report", false, "URL of the report web service"},
  {"web_server_verify_tls", "true", false, "verify the TLS certificate of the report web service"},
  {"sqlite_db", "/sqlite_db/reporting.db", false, "SQLite database storing the report requests"},
  {"sqlite_db_table", "report_requests", false, "SQLite table storing the report requests"},
  {"reporting_interval", "86400", false, "length, in seconds, of each reported interval"},
  {"anchor_lookback", "3600", false, "seconds before an interval searched for the last counter sample"},
  {"pulses_per_kwh", "1000", false, "pulses emitted by the meter per kWh"},
  {"max_power_w", "15000", false, "highest plausible mean power, in watts"},
  {"request_timeout", "30", false, "timeout, in seconds, of every network request"},
  {"max_catch_up_per_tick", "10", false, "most intervals processed in one scheduling cycle"},
  {"tick_interval", "3600", false, "seconds between consecutive scheduling cycles"},
};

constexpr int kLongOptionBase = 1000;

const OptionSpec* findOption(const std::string& key)
{
  for (const auto& spec : kOptions)
  {
    if (key == spec.key)
    {
      return &spec;
    }
  }
  return nullptr;
}

std::string toLongOption(const char* key)
{
  std::string name{key};
  std::replace(name.begin(), name.end(), '_', '-');
  return name;
}

std::string toLower(std::string text)
{
  std::transform(text.begin(),
                 text.end(),
                 text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

std::string trim(const std::string& text)
{
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos)
  {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

using ValueMap = std::map<std::string, std::string>;

void applySection(const boost::property_tree::ptree& tree,
                  const char* section,
                  bool generalOnly,
                  ValueMap& values,
                  std::vector<std::string>& ignored)
{
  auto child = tree.get_child_optional(section);
  if (!child)
  {
    return;
  }

  for (const auto& [rawKey, node] : *child)
  {
    const std::string key = toLower(rawKey);
    const OptionSpec* spec = findOption(key);
    if (spec == nullptr || (generalOnly && !spec->general))
    {
      ignored.push_back(std::string{section} + "." + rawKey);
      continue;
    }
    values[key] = trim(node.data());
  }
}

void readConfigFile(const std::string& path,
                    ValueMap& values,
                    std::vector<std::string>& ignored)
{
  boost::property_tree::ptree tree;
  try
  {
    boost::property_tree::ini_parser::read_ini(path, tree);
  }
  catch (const boost::property_tree::ini_parser_error& e)
  {
    throw ConfigError("Cannot read configuration file: " + std::string{e.what()});
  }

  applySection(tree, kGeneralSection, true, values, ignored);
  applySection(tree, kApplicationName, false, values, ignored);
}

long long parseInteger(const std::string& key,
                       const std::string& text,
                       long long min,
                       long long max)
{
  std::size_t consumed = 0;
  long long value = 0;
  try
  {
    value = std::stoll(text, &consumed);
  }
  catch (const std::exception&)
  {
    consumed = 0;
  }

  if (consumed == 0 || consumed != text.size())
  {
    throw ConfigError("Invalid value '" + text + "' for " + key +
                      ": expected an integer");
  }
  if (value < min || value > max)
  {
    throw ConfigError("Invalid value " + text + " for " + key + ": must be in [" +
                      std::to_string(min) + ", " + std::to_string(max) + "]");
  }
  return value;
}

double parseDouble(const std::string& key, const std::string& text)
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
    throw ConfigError("Invalid value '" + text + "' for " + key +
                      ": expected a number");
  }
  return value;
}

double parsePositiveDouble(const std::string& key, const std::string& text)
{
  const double value = parseDouble(key, text);
  if (value <= 0.0)
  {
    throw ConfigError("Invalid value " + text + " for " + key +
                      ": must be positive");
  }
  return value;
}

std::chrono::seconds parseSeconds(const std::string& key, const std::string& text)
{
  return std::chrono::seconds{
    parseInteger(key, text, 1, std::numeric_limits<int32_t>::max())};
}

std::string requireNonEmpty(const std::string& key, const std::string& text)
{
  if (text.empty())
  {
    throw ConfigError("Missing value for " + key);
  }
  return text;
}

bool isPlainIdentifier(const std::string& name)
{
  if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())))
  {
    return false;
  }
  return std::all_of(name.begin(),
                     name.end(),
                     [](unsigned char c) { return std::isalnum(c) || c == '_'; });
}

AppConfig convert(const ValueMap& values)
{
  AppConfig config;
  const auto value = [&values](const char* key) { return values.at(key); };

  config.loggingLevel =
    static_cast<int>(parseInteger("logging_level", value("logging_level"), 0, 100));
  config.influxdbHost = requireNonEmpty("influxdb_host", value("influxdb_host"));
  config.influxdbPort =
    static_cast<int>(parseInteger("influxdb_port", value("influxdb_port"), 1, 65535));
  config.influxdbDatabase =
    requireNonEmpty("influxdb_database", value("influxdb_database"));
  config.influxdbUsername = value("influxdb_username");
  config.influxdbPassword = value("influxdb_password");
  config.gpsLocation = parseGpsLocation(value("gps_location"));

  config.measurementTs = requireNonEmpty("measurement_ts", value("measurement_ts"));
  config.pulseField = requireNonEmpty("pulse_field", value("pulse_field"));
  config.emailAddress = requireNonEmpty("email_address", value("email_address"));
  config.webServerUrl = requireNonEmpty("web_server_url", value("web_server_url"));
  config.webServerVerifyTls = parseBool(value("web_server_verify_tls"));
  config.sqliteDb = requireNonEmpty("sqlite_db", value("sqlite_db"));

  config.sqliteDbTable = value("sqlite_db_table");
  if (!isPlainIdentifier(config.sqliteDbTable))
  {
    throw ConfigError("Invalid value '" + config.sqliteDbTable +
                      "' for sqlite_db_table: expected a plain identifier");
  }

  config.reportingInterval =
    parseSeconds("reporting_interval", value("reporting_interval"));
  config.anchorLookback = parseSeconds("anchor_lookback", value("anchor_lookback"));
  config.pulsesPerKwh = parsePositiveDouble("pulses_per_kwh", value("pulses_per_kwh"));
  config.maxPowerW = parsePositiveDouble("max_power_w", value("max_power_w"));
  config.requestTimeout = parseSeconds("request_timeout", value("request_timeout"));
  config.maxCatchUpPerTick = static_cast<std::size_t>(parseInteger(
    "max_catch_up_per_tick", value("max_catch_up_per_tick"), 1, 100000));
  config.tickInterval = parseSeconds("tick_interval", value("tick_interval"));
  return config;
}

}  // namespace

AppConfig parseConfiguration(const std::vector<std::string>& args)
{
  constexpr std::size_t kOptionCount = std::size(kOptions);

  // getopt_long keeps pointers into these; both stay alive until parsing ends
  std::vector<std::string> longNames;
  longNames.reserve(kOptionCount);
  for (const auto& spec : kOptions)
  {
    longNames.push_back(toLongOption(spec.key));
  }

  std::vector<option> longOptions;
  longOptions.push_back(option{"config-file", required_argument, nullptr, 'c'});
  longOptions.push_back(option{"help", no_argument, nullptr, 'h'});
  for (std::size_t i = 0; i < kOptionCount; ++i)
  {
    const int shortName =
      longNames[i] == "logging-level" ? 'l' : kLongOptionBase + static_cast<int>(i);
    longOptions.push_back(
      option{longNames[i].c_str(), required_argument, nullptr, shortName});
  }
  longOptions.push_back(option{nullptr, 0, nullptr, 0});

  std::vector<std::string> argStorage;
  argStorage.reserve(args.size() + 1);
  argStorage.emplace_back("energy-consumption-report");
  argStorage.insert(argStorage.end(), args.begin(), args.end());

  std::vector<char*> argv;
  for (auto& arg : argStorage)
  {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  const int argc = static_cast<int>(argStorage.size());

  AppConfig result;
  ValueMap cliValues;

  // optind = 0 makes glibc reinitialise, so repeated calls start afresh
  optind = 0;
  opterr = 0;
  int opt = 0;
  while ((opt = getopt_long(argc, argv.data(), ":c:hl:", longOptions.data(), nullptr)) !=
         -1)
  {
    switch (opt)
    {
      case 'c':
        result.configFile = optarg;
        break;
      case 'h':
        result.helpRequested = true;
        break;
      case 'l':
        cliValues["logging_level"] = optarg;
        break;
      case ':':
        throw ConfigError(std::string{"Option "} + argv[optind - 1] +
                          " requires a value");
      case '?':
        throw ConfigError(std::string{"Unknown option "} + argv[optind - 1]);
      default:
        if (opt >= kLongOptionBase &&
            opt < kLongOptionBase + static_cast<int>(kOptionCount))
        {
          cliValues[kOptions[opt - kLongOptionBase].key] = optarg;
        }
        break;
    }
  }

  if (optind < argc)
  {
    throw ConfigError(std::string{"Unexpected argument "} + argv[optind]);
  }

  if (result.helpRequested)
  {
    return result;
  }

  ValueMap values;
  for (const auto& spec : kOptions)
  {
    values[spec.key] = spec.defaultValue;
  }

  std::vector<std::string> ignored;
  if (result.configFile)
  {
    readConfigFile(*result.configFile, values, ignored);
  }

  for (const auto& [key, text] : cliValues)
  {
    values[key] = text;
  }

  AppConfig config = convert(values);
  config.configFile = result.configFile;
  config.ignoredKeys = std::move(ignored);
  return config;
}

std::string usage(const std::string& programName)
{
  std::ostringstream out;
  out << "Usage: " << programName << " [-h] [-c FILE] [OPTIONS]\n\n"
      << "Read pulse measurements from InfluxDB and send them to the TDM web\n"
      << "service to receive a report about the consumption of electric "
         "energy.\n\n"
      << "Options:\n";

  const auto line = [&out](const std::string& flags, const std::string& help)
  { out << "  " << std::left << std::setw(34) << flags << help << "\n"; };

  line("-h, --help", "show this help message and exit");
  line("-c, --config-file FILE", "specify the config file");
  for (const auto& spec : kOptions)
  {
    std::string flags = "--" + toLongOption(spec.key) + " VALUE";
    if (std::string{spec.key} == "logging_level")
    {
      flags = "-l, " + flags;
    }
    line(flags, std::string{spec.help} + " (default: " + spec.defaultValue + ")");
  }
  return out.str();
}

ecr_core::GpsLocation parseGpsLocation(const std::string& text)
{
  const auto comma = text.find(',');
  if (comma == std::string::npos || text.find(',', comma + 1) != std::string::npos)
  {
    throw ConfigError("Invalid GPS location '" + text +
                      "': expected latitude,longitude");
  }

  ecr_core::GpsLocation location;
  location.latitude = parseDouble("gps_location", trim(text.substr(0, comma)));
  location.longitude = parseDouble("gps_location", trim(text.substr(comma + 1)));

  if (location.latitude < -90.0 || location.latitude > 90.0 ||
      location.longitude < -180.0 || location.longitude > 180.0)
  {
    throw ConfigError("GPS location '" + text + "' out of range");
  }
  return location;
}

bool parseBool(const std::string& text)
{
  const std::string lower = toLower(trim(text));
  if (lower == "false" || lower == "f" || lower == "0" || lower == "no" ||
      lower == "n")
  {
    return false;
  }
  if (lower == "true" || lower == "t" || lower == "1" || lower == "yes" ||
      lower == "y")
  {
    return true;
  }
  throw ConfigError("\"" + text + "\" is not a valid boolean value");
}

}  // namespace ecr_utils
