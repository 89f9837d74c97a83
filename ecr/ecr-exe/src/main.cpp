#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "ecr-core/src/Energy/EnergyAccumulator.hpp"
#include "ecr-core/src/Errors.hpp"
#include "ecr-core/src/Ledger/RequestLedger.hpp"
#include "ecr-core/src/Scheduler/ReportScheduler.hpp"
#include "ecr-db/src/Database.hpp"
#include "ecr-io/src/HttpClient.hpp"
#include "ecr-io/src/HttpReportRequester.hpp"
#include "ecr-io/src/InfluxSampleSource.hpp"
#include "ecr-utils/src/Config.hpp"
#include "ecr-utils/src/Logging.hpp"

namespace
{

volatile std::sig_atomic_t stopRequested = 0;

extern "C" void onStopSignal(int /* signal */)
{
  stopRequested = 1;
}

// A missing database is created the way the collector would; an unreachable
// server is only logged because every tick retries the source anyway
void ensureInfluxDatabase(ecr_io::InfluxSampleSource& source,
                          const ecr_utils::AppConfig& config,
                          spdlog::logger& logger)
{
  try
  {
    if (!source.databaseExists())
    {
      logger.info("InfluxDB database \"{}\" not found. Creating a new one.",
                  config.influxdbDatabase);
      source.createDatabase();
    }
  }
  catch (const ecr_core::SourceUnavailableError& e)
  {
    logger.warn("Could not check InfluxDB database \"{}\": {}",
                config.influxdbDatabase,
                e.what());
  }
}

}  // namespace

int main(int argc, char* argv[])
{
  const std::string programName = argc > 0 ? argv[0] : "energy-consumption-report";

  ecr_utils::AppConfig config;
  try
  {
    config = ecr_utils::parseConfiguration(
      std::vector<std::string>(argv + 1, argv + argc));
  }
  catch (const ecr_utils::ConfigError& e)
  {
    std::cerr << programName << ": " << e.what() << "\n\n"
              << ecr_utils::usage(programName);
    return EXIT_FAILURE;
  }

  if (config.helpRequested)
  {
    std::cout << ecr_utils::usage(programName);
    return EXIT_SUCCESS;
  }

  std::shared_ptr<spdlog::logger> logger;
  try
  {
    logger =
      ecr_utils::createLogger(ecr_utils::kApplicationName, config.loggingLevel);
  }
  catch (const spdlog::spdlog_ex& e)
  {
    std::cerr << "Logger initialization failed: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }

  logger->info("Starting application \"{}\"...", ecr_utils::kApplicationName);
  for (const auto& key : config.ignoredKeys)
  {
    logger->warn("Ignoring unknown configuration key {}", key);
  }
  logger->debug("InfluxDB {}:{} database \"{}\", measurement \"{}\"",
                config.influxdbHost,
                config.influxdbPort,
                config.influxdbDatabase,
                config.measurementTs);
  logger->debug("Ledger {} table {}, interval {} s, tick every {} s",
                config.sqliteDb,
                config.sqliteDbTable,
                config.reportingInterval.count(),
                config.tickInterval.count());

  try
  {
    ecr_io::CurlGlobal curl;

    ecr_db::Database database{
      config.sqliteDb, logger, ecr_db::DBOpenCondition::OpenCreate};
    ecr_core::RequestLedger ledger{
      database,
      ecr_core::RequestLedger::Config{config.sqliteDbTable, config.reportingInterval},
      logger};

    const ecr_core::EnergyAccumulator accumulator{
      ecr_core::EnergyAccumulator::Config{config.pulsesPerKwh, config.maxPowerW}};

    ecr_io::InfluxSampleSource::Config sourceConfig;
    sourceConfig.host = config.influxdbHost;
    sourceConfig.port = config.influxdbPort;
    sourceConfig.database = config.influxdbDatabase;
    sourceConfig.username = config.influxdbUsername;
    sourceConfig.password = config.influxdbPassword;
    sourceConfig.pulseField = config.pulseField;
    sourceConfig.timeout = config.requestTimeout;
    ecr_io::InfluxSampleSource source{sourceConfig, logger};
    ensureInfluxDatabase(source, config, *logger);

    ecr_io::HttpReportRequester::Config requesterConfig;
    requesterConfig.url = config.webServerUrl;
    requesterConfig.measurement = config.measurementTs;
    requesterConfig.verifyTls = config.webServerVerifyTls;
    requesterConfig.timeout = config.requestTimeout;
    ecr_io::HttpReportRequester requester{requesterConfig, logger};

    ecr_core::ReportScheduler::Config schedulerConfig;
    schedulerConfig.measurement = config.measurementTs;
    schedulerConfig.emailAddress = config.emailAddress;
    schedulerConfig.location = config.gpsLocation;
    schedulerConfig.tickInterval = config.tickInterval;
    schedulerConfig.anchorLookback = config.anchorLookback;
    schedulerConfig.maxCatchUpPerTick = config.maxCatchUpPerTick;
    ecr_core::ReportScheduler scheduler{
      schedulerConfig, ledger, accumulator, source, requester, logger};

    std::signal(SIGINT, onStopSignal);
    std::signal(SIGTERM, onStopSignal);

    scheduler.start();
    while (stopRequested == 0)
    {
      std::this_thread::sleep_for(std::chrono::milliseconds{200});
    }

    logger->info("Shutdown requested, waiting for the current tick");
    scheduler.stop();
  }
  catch (const std::exception& e)
  {
    logger->critical("Fatal error: {}", e.what());
    return EXIT_FAILURE;
  }

  logger->info("Application \"{}\" stopped", ecr_utils::kApplicationName);
  return EXIT_SUCCESS;
}
