#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "ecr-utils/src/Config.hpp"

namespace ecr_utils
{
namespace test
{

class ConfigTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    configPath_ = (std::filesystem::temp_directory_path() /
                   ("ecr_config_test_" +
                    std::to_string(
                      std::chrono::steady_clock::now().time_since_epoch().count()) +
                    ".ini"))
                    .string();
  }

  void TearDown() override { std::filesystem::remove(configPath_); }

  void writeConfig(const std::string& contents)
  {
    std::ofstream out{configPath_};
    out << contents;
  }

  std::string configPath_;
};

// ========== Defaults ==========

TEST_F(ConfigTest, NoArguments_BuiltInDefaults)
{
  auto config = parseConfiguration({});

  EXPECT_EQ(config.loggingLevel, 20);
  EXPECT_EQ(config.influxdbHost, "influxdb");
  EXPECT_EQ(config.influxdbPort, 8086);
  EXPECT_EQ(config.influxdbDatabase, "Emon");
  EXPECT_EQ(config.influxdbUsername, "root");
  EXPECT_EQ(config.influxdbPassword, "root");
  EXPECT_DOUBLE_EQ(config.gpsLocation.latitude, 0.0);
  EXPECT_DOUBLE_EQ(config.gpsLocation.longitude, 0.0);
  EXPECT_EQ(config.measurementTs, "emontx3");
  EXPECT_EQ(config.emailAddress, "username@example.com");
  EXPECT_EQ(config.webServerUrl, "https://tdm-or5.jicsardegna.it/get_report");
  EXPECT_TRUE(config.webServerVerifyTls);
  EXPECT_EQ(config.sqliteDb, "/sqlite_db/reporting.db");
  EXPECT_EQ(config.sqliteDbTable, "report_requests");
  EXPECT_EQ(config.reportingInterval, std::chrono::seconds{86400});
  EXPECT_EQ(config.anchorLookback, std::chrono::seconds{3600});
  EXPECT_DOUBLE_EQ(config.pulsesPerKwh, 1000.0);
  EXPECT_DOUBLE_EQ(config.maxPowerW, 15000.0);
  EXPECT_EQ(config.requestTimeout, std::chrono::seconds{30});
  EXPECT_EQ(config.maxCatchUpPerTick, 10u);
  EXPECT_EQ(config.tickInterval, std::chrono::seconds{3600});
  EXPECT_FALSE(config.configFile.has_value());
  EXPECT_FALSE(config.helpRequested);
}

// ========== Command line ==========

TEST_F(ConfigTest, CommandLineLong_Parsed)
{
  auto config = parseConfiguration({"--influxdb-host",
                                    "influxdb_host_option",
                                    "--influxdb-port",
                                    "8096",
                                    "--logging-level",
                                    "30"});

  EXPECT_EQ(config.influxdbHost, "influxdb_host_option");
  EXPECT_EQ(config.influxdbPort, 8096);
  EXPECT_EQ(config.loggingLevel, 30);
}

TEST_F(ConfigTest, CommandLineEqualsSyntaxAndShortOptions)
{
  auto config = parseConfiguration(
    {"-l", "10", "--measurement-ts=meter1", "--web-server-verify-tls=no"});

  EXPECT_EQ(config.loggingLevel, 10);
  EXPECT_EQ(config.measurementTs, "meter1");
  EXPECT_FALSE(config.webServerVerifyTls);
}

TEST_F(ConfigTest, RepeatedCalls_ParseIndependently)
{
  auto first = parseConfiguration({"--influxdb-port", "9000"});
  auto second = parseConfiguration({"--influxdb-host", "other"});

  EXPECT_EQ(first.influxdbPort, 9000);
  EXPECT_EQ(second.influxdbPort, 8086);
  EXPECT_EQ(second.influxdbHost, "other");
}

TEST_F(ConfigTest, Help_Requested)
{
  EXPECT_TRUE(parseConfiguration({"--help"}).helpRequested);
  EXPECT_TRUE(parseConfiguration({"-h"}).helpRequested);

  const auto text = usage("energy-consumption-report");
  EXPECT_NE(text.find("--config-file"), std::string::npos);
  EXPECT_NE(text.find("--reporting-interval"), std::string::npos);
  EXPECT_NE(text.find("(default: 86400)"), std::string::npos);
}

TEST_F(ConfigTest, UnknownOption_Throws)
{
  EXPECT_THROW((void)parseConfiguration({"--no-such-option", "1"}), ConfigError);
}

TEST_F(ConfigTest, MissingOptionValue_Throws)
{
  EXPECT_THROW((void)parseConfiguration({"--influxdb-port"}), ConfigError);
}

TEST_F(ConfigTest, PositionalArgument_Throws)
{
  EXPECT_THROW((void)parseConfiguration({"extra"}), ConfigError);
}

// ========== Configuration file ==========

TEST_F(ConfigTest, GeneralSection_Applied)
{
  writeConfig(
    "[GENERAL]\n"
    "influxdb_host = influxdb_host_test\n"
    "influxdb_port = 8186\n"
    "logging_level = 30\n"
    "gps_location = 39.2238,9.1217\n");

  auto config = parseConfiguration({"--config-file", configPath_});

  EXPECT_EQ(config.influxdbHost, "influxdb_host_test");
  EXPECT_EQ(config.influxdbPort, 8186);
  EXPECT_EQ(config.loggingLevel, 30);
  EXPECT_DOUBLE_EQ(config.gpsLocation.latitude, 39.2238);
  EXPECT_DOUBLE_EQ(config.gpsLocation.longitude, 9.1217);
  ASSERT_TRUE(config.configFile.has_value());
  EXPECT_EQ(*config.configFile, configPath_);
}

TEST_F(ConfigTest, GeneralSection_IgnoresApplicationKeys)
{
  writeConfig(
    "[GENERAL]\n"
    "measurement_ts = from_general\n"
    "unrelated_key = 1\n");

  auto config = parseConfiguration({"-c", configPath_});

  EXPECT_EQ(config.measurementTs, "emontx3");
  EXPECT_EQ(config.ignoredKeys.size(), 2u);
}

TEST_F(ConfigTest, ApplicationSection_OverridesGeneral)
{
  writeConfig(
    "[GENERAL]\n"
    "influxdb_host = influxdb_host_general\n"
    "influxdb_port = 8186\n"
    "\n"
    "[Energy_Consumption_Report]\n"
    "influxdb_host = influxdb_host_specific\n"
    "measurement_ts = emontx4\n"
    "reporting_interval = 3600\n"
    "pulses_per_kwh = 800\n");

  auto config = parseConfiguration({"-c", configPath_});

  EXPECT_EQ(config.influxdbHost, "influxdb_host_specific");
  EXPECT_EQ(config.influxdbPort, 8186);
  EXPECT_EQ(config.measurementTs, "emontx4");
  EXPECT_EQ(config.reportingInterval, std::chrono::seconds{3600});
  EXPECT_DOUBLE_EQ(config.pulsesPerKwh, 800.0);
}

TEST_F(ConfigTest, KeysAreCaseInsensitive)
{
  writeConfig(
    "[Energy_Consumption_Report]\n"
    "Email_Address = someone@example.org\n");

  auto config = parseConfiguration({"-c", configPath_});

  EXPECT_EQ(config.emailAddress, "someone@example.org");
}

TEST_F(ConfigTest, CommandLine_OverridesFile)
{
  writeConfig(
    "[Energy_Consumption_Report]\n"
    "influxdb_host = influxdb_host_configuration\n"
    "influxdb_port = 8106\n"
    "logging_level = 40\n");

  auto config = parseConfiguration({"--config-file",
                                    configPath_,
                                    "--influxdb-host",
                                    "influxdb_host_option",
                                    "--influxdb-port",
                                    "8096",
                                    "--logging-level",
                                    "30"});

  EXPECT_EQ(config.influxdbHost, "influxdb_host_option");
  EXPECT_EQ(config.influxdbPort, 8096);
  EXPECT_EQ(config.loggingLevel, 30);
}

TEST_F(ConfigTest, CommandLine_PartialOverride)
{
  writeConfig(
    "[Energy_Consumption_Report]\n"
    "influxdb_host = influxdb_host_configuration\n"
    "influxdb_port = 8106\n"
    "logging_level = 40\n");

  auto hostOnly = parseConfiguration(
    {"-c", configPath_, "--influxdb-host", "influxdb_host_option"});
  EXPECT_EQ(hostOnly.influxdbHost, "influxdb_host_option");
  EXPECT_EQ(hostOnly.influxdbPort, 8106);
  EXPECT_EQ(hostOnly.loggingLevel, 40);

  auto portOnly = parseConfiguration({"-c", configPath_, "--influxdb-port", "8096"});
  EXPECT_EQ(portOnly.influxdbHost, "influxdb_host_configuration");
  EXPECT_EQ(portOnly.influxdbPort, 8096);
  EXPECT_EQ(portOnly.loggingLevel, 40);

  auto levelOnly = parseConfiguration({"-c", configPath_, "-l", "30"});
  EXPECT_EQ(levelOnly.influxdbHost, "influxdb_host_configuration");
  EXPECT_EQ(levelOnly.influxdbPort, 8106);
  EXPECT_EQ(levelOnly.loggingLevel, 30);
}

TEST_F(ConfigTest, MissingFile_Throws)
{
  EXPECT_THROW((void)parseConfiguration({"-c", configPath_ + ".missing"}),
               ConfigError);
}

// ========== Validation ==========

TEST_F(ConfigTest, InvalidPort_Throws)
{
  EXPECT_THROW((void)parseConfiguration({"--influxdb-port", "0"}), ConfigError);
  EXPECT_THROW((void)parseConfiguration({"--influxdb-port", "65536"}), ConfigError);
  EXPECT_THROW((void)parseConfiguration({"--influxdb-port", "80a"}), ConfigError);
}

TEST_F(ConfigTest, NonPositiveDurations_Throw)
{
  EXPECT_THROW((void)parseConfiguration({"--reporting-interval", "0"}), ConfigError);
  EXPECT_THROW((void)parseConfiguration({"--reporting-interval", "-60"}),
               ConfigError);
  EXPECT_THROW((void)parseConfiguration({"--tick-interval", "0"}), ConfigError);
  EXPECT_THROW((void)parseConfiguration({"--anchor-lookback", "0"}), ConfigError);
  EXPECT_THROW((void)parseConfiguration({"--request-timeout", "0"}), ConfigError);
  EXPECT_THROW((void)parseConfiguration({"--max-catch-up-per-tick", "0"}),
               ConfigError);
}

TEST_F(ConfigTest, InvalidCalibration_Throws)
{
  EXPECT_THROW((void)parseConfiguration({"--pulses-per-kwh", "0"}), ConfigError);
  EXPECT_THROW((void)parseConfiguration({"--max-power-w", "-1"}), ConfigError);
}

TEST_F(ConfigTest, UnsafeTableName_Throws)
{
  EXPECT_THROW((void)parseConfiguration({"--sqlite-db-table", "report-requests"}),
               ConfigError);
  EXPECT_THROW((void)parseConfiguration({"--sqlite-db-table", "1table"}),
               ConfigError);
}

TEST(GpsLocationTest, Parse)
{
  auto location = parseGpsLocation("39.2238, 9.1217");
  EXPECT_DOUBLE_EQ(location.latitude, 39.2238);
  EXPECT_DOUBLE_EQ(location.longitude, 9.1217);

  location = parseGpsLocation("-33.86,-151.2");
  EXPECT_DOUBLE_EQ(location.latitude, -33.86);
  EXPECT_DOUBLE_EQ(location.longitude, -151.2);
}

TEST(GpsLocationTest, Malformed_Throws)
{
  EXPECT_THROW((void)parseGpsLocation("39.2238"), ConfigError);
  EXPECT_THROW((void)parseGpsLocation("1,2,3"), ConfigError);
  EXPECT_THROW((void)parseGpsLocation("north,east"), ConfigError);
  EXPECT_THROW((void)parseGpsLocation("91,0"), ConfigError);
  EXPECT_THROW((void)parseGpsLocation("0,181"), ConfigError);
}

TEST(ParseBoolTest, AcceptedSpellings)
{
  for (const char* text : {"true", "T", "1", "yes", "Y"})
  {
    EXPECT_TRUE(parseBool(text)) << text;
  }
  for (const char* text : {"false", "F", "0", "No", "n"})
  {
    EXPECT_FALSE(parseBool(text)) << text;
  }
  EXPECT_THROW((void)parseBool("maybe"), ConfigError);
}

}  // namespace test
}  // namespace ecr_utils
