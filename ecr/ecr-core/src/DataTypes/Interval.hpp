#ifndef ECR_CORE_INTERVAL_HPP
#define ECR_CORE_INTERVAL_HPP

#include <chrono>
#include <string>

namespace ecr_core
{

/**
 * @brief Half-open reporting window [start, end)
 *
 * Consecutive intervals share a boundary: the end of one is the start of the
 * next. Boundaries are whole seconds in UTC.
 */
struct Interval
{
  std::chrono::sys_seconds start{};
  std::chrono::sys_seconds end{};

  [[nodiscard]] std::chrono::seconds length() const { return end - start; }

  [[nodiscard]] bool contains(std::chrono::sys_seconds t) const
  {
    return t >= start && t < end;
  }

  /**
   * @brief The interval of the given length that starts where this one ends
   */
  [[nodiscard]] Interval next(std::chrono::seconds length) const
  {
    return Interval{end, end + length};
  }

  [[nodiscard]] std::string toString() const;

  bool operator==(const Interval&) const = default;

  /**
   * @brief Latest epoch-aligned interval that has fully elapsed at `now`
   *
   * Boundaries are multiples of `length` counted from the Unix epoch, so the
   * result is the same whenever in the following interval it is computed.
   *
   * @throws std::invalid_argument if length is not positive
   */
  static Interval lastCompleted(std::chrono::sys_seconds now,
                                std::chrono::seconds length);
};

/**
 * @brief ISO-8601 UTC rendering, e.g. "2021-03-01T00:00:00Z"
 */
std::string formatTimestamp(std::chrono::sys_seconds t);

}  // namespace ecr_core

#endif  // ECR_CORE_INTERVAL_HPP
