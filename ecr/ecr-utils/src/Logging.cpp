#include "ecr-utils/src/Logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace ecr_utils
{

spdlog::level::level_enum levelFromNumeric(int level)
{
  if (level <= 5)
  {
    return spdlog::level::trace;
  }
  if (level <= 10)
  {
    return spdlog::level::debug;
  }
  if (level <= 20)
  {
    return spdlog::level::info;
  }
  if (level <= 30)
  {
    return spdlog::level::warn;
  }
  if (level <= 40)
  {
    return spdlog::level::err;
  }
  if (level <= 50)
  {
    return spdlog::level::critical;
  }
  return spdlog::level::off;
}

std::shared_ptr<spdlog::logger> createLogger(const std::string& name,
                                             int numericLevel)
{
  auto logger = spdlog::get(name);
  if (!logger)
  {
    logger = spdlog::stdout_color_mt(name);
  }

  logger->set_pattern(kLogPattern);
  logger->set_level(levelFromNumeric(numericLevel));
  return logger;
}

}  // namespace ecr_utils
