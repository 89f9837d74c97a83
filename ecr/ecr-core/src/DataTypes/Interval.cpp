#include "ecr-core/src/DataTypes/Interval.hpp"

#include <ctime>
#include <stdexcept>

namespace ecr_core
{

std::string Interval::toString() const
{
  return "[" + formatTimestamp(start) + ", " + formatTimestamp(end) + ")";
}

Interval Interval::lastCompleted(std::chrono::sys_seconds now,
                                 std::chrono::seconds length)
{
  if (length <= std::chrono::seconds{0})
  {
    throw std::invalid_argument("Interval length must be positive, got " +
                                std::to_string(length.count()) + " s");
  }

  const auto sinceEpoch = now.time_since_epoch();
  // Floor division so that instants before the epoch still align downwards
  auto boundaries = sinceEpoch / length;
  if (sinceEpoch % length < std::chrono::seconds{0})
  {
    --boundaries;
  }

  const std::chrono::sys_seconds end{boundaries * length};
  return Interval{end - length, end};
}

std::string formatTimestamp(std::chrono::sys_seconds t)
{
  const std::time_t raw = std::chrono::system_clock::to_time_t(t);
  std::tm utc{};
  gmtime_r(&raw, &utc);

  char buffer[32];
  const auto written =
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return std::string{buffer, written};
}

}  // namespace ecr_core
