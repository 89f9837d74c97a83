#ifndef ECR_CORE_COUNTER_SAMPLE_SOURCE_HPP
#define ECR_CORE_COUNTER_SAMPLE_SOURCE_HPP

#include <chrono>
#include <string>
#include <vector>

#include "ecr-core/src/DataTypes/CounterSample.hpp"

namespace ecr_core
{

/**
 * @brief Read-only access to stored pulse-counter readings
 *
 * Implementations may block on the network; they must enforce their own
 * timeout and report it as SourceUnavailableError.
 */
class CounterSampleSource
{
public:
  virtual ~CounterSampleSource() = default;

  /**
   * @brief Samples of `measurement` with start <= timestamp < end
   *
   * @return Samples ordered by increasing timestamp
   * @throws SourceUnavailableError on connection or protocol failure
   */
  virtual std::vector<CounterSample> query(const std::string& measurement,
                                           std::chrono::sys_seconds start,
                                           std::chrono::sys_seconds end) = 0;
};

}  // namespace ecr_core

#endif  // ECR_CORE_COUNTER_SAMPLE_SOURCE_HPP
