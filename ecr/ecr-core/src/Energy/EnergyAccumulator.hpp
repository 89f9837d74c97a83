#ifndef ECR_CORE_ENERGY_ACCUMULATOR_HPP
#define ECR_CORE_ENERGY_ACCUMULATOR_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "ecr-core/src/DataTypes/CounterSample.hpp"
#include "ecr-core/src/DataTypes/Interval.hpp"

namespace ecr_core
{

/**
 * @brief Converts cumulative pulse-counter samples into interval energy
 *
 * The pulse delta over an interval is walked pairwise from the anchor (the
 * last sample strictly before the interval start) through every sample inside
 * the interval. A decrease between two consecutive samples is read as a
 * counter reset: the counter is assumed to have restarted from zero, so the
 * later value is the whole increment.
 *
 * Known limitation: two or more resets between consecutive samples cannot be
 * told apart from one, and the pulses lost to the earlier resets are not
 * recovered.
 *
 * Samples at or after the interval end never contribute.
 */
class EnergyAccumulator
{
public:
  struct Config
  {
    double pulsesPerKwh{1000.0};  // Meter calibration [pulses/kWh]
    double maxPowerW{15000.0};    // Sanity ceiling on mean power [W]
  };

  /**
   * @brief Pulse accounting for one interval, before calibration
   */
  struct PulseDelta
  {
    uint64_t pulses{0};
    uint32_t resets{0};  // Counter decreases seen between samples
    std::size_t samplesUsed{0};
    bool anchored{false};  // Walk started from a pre-interval anchor
  };

  /**
   * @throws std::invalid_argument for a non-positive calibration factor or a
   * negative power ceiling
   */
  explicit EnergyAccumulator(Config config);

  /**
   * @brief Energy consumed during `interval` [kWh]
   *
   * @param interval Reporting window
   * @param samples Ordered samples; may start before the interval and run
   * past its end
   * @throws InsufficientDataError if no sample lies inside the interval
   * @throws ImplausibleReadingError if the result is negative, non-finite or
   * above the power ceiling
   * @throws std::invalid_argument if timestamps are not strictly increasing
   */
  [[nodiscard]] double compute(const Interval& interval,
                               std::span<const CounterSample> samples) const;

  /**
   * @brief Raw pulse delta over `interval`
   *
   * Same selection and reset handling as compute(), without calibration or
   * sanity bounds.
   */
  [[nodiscard]] PulseDelta accumulate(
    const Interval& interval,
    std::span<const CounterSample> samples) const;

  /**
   * @brief Largest plausible energy for an interval of this length [kWh]
   */
  [[nodiscard]] double ceilingKwh(const Interval& interval) const;

  [[nodiscard]] const Config& getConfig() const { return config_; }

private:
  Config config_;
};

}  // namespace ecr_core

#endif  // ECR_CORE_ENERGY_ACCUMULATOR_HPP
