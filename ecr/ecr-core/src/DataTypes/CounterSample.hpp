#ifndef ECR_CORE_COUNTER_SAMPLE_HPP
#define ECR_CORE_COUNTER_SAMPLE_HPP

#include <chrono>
#include <cstdint>

namespace ecr_core
{

/**
 * @brief One reading of a cumulative pulse counter
 *
 * The value is the running pulse tally reported by the meter. It only grows,
 * except when the device restarts and the tally resets to zero.
 */
struct CounterSample
{
  std::chrono::sys_seconds timestamp{};
  uint64_t value{0};  // Cumulative pulse count

  bool operator==(const CounterSample&) const = default;
};

}  // namespace ecr_core

#endif  // ECR_CORE_COUNTER_SAMPLE_HPP
