#ifndef ECR_CORE_CLOCK_HPP
#define ECR_CORE_CLOCK_HPP

#include <chrono>
#include <functional>

namespace ecr_core
{

/**
 * @brief Source of wall-clock time, injectable for tests
 */
using Clock = std::function<std::chrono::sys_seconds()>;

inline Clock systemClock()
{
  return []()
  {
    return std::chrono::time_point_cast<std::chrono::seconds>(
      std::chrono::system_clock::now());
  };
}

}  // namespace ecr_core

#endif  // ECR_CORE_CLOCK_HPP
