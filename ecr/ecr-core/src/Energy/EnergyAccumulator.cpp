#include "ecr-core/src/Energy/EnergyAccumulator.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

#include "ecr-core/src/Errors.hpp"

namespace ecr_core
{

namespace
{

constexpr double kSecondsPerHour = 3600.0;
constexpr double kWattsPerKilowatt = 1000.0;

void validateOrdering(std::span<const CounterSample> samples)
{
  for (std::size_t i = 1; i < samples.size(); ++i)
  {
    if (samples[i].timestamp <= samples[i - 1].timestamp)
    {
      throw std::invalid_argument(
        "Counter samples must have strictly increasing timestamps; sample " +
        std::to_string(i) + " at " + formatTimestamp(samples[i].timestamp) +
        " does not follow " + formatTimestamp(samples[i - 1].timestamp));
    }
  }
}

}  // namespace

EnergyAccumulator::EnergyAccumulator(Config config)
  : config_{config}
{
  if (!(config_.pulsesPerKwh > 0.0) || !std::isfinite(config_.pulsesPerKwh))
  {
    throw std::invalid_argument("pulsesPerKwh must be positive, got " +
                                std::to_string(config_.pulsesPerKwh));
  }
  if (config_.maxPowerW < 0.0 || std::isnan(config_.maxPowerW))
  {
    throw std::invalid_argument("maxPowerW must not be negative, got " +
                                std::to_string(config_.maxPowerW));
  }
}

EnergyAccumulator::PulseDelta EnergyAccumulator::accumulate(
  const Interval& interval,
  std::span<const CounterSample> samples) const
{
  validateOrdering(samples);

  std::optional<CounterSample> anchor;
  std::size_t first = 0;
  while (first < samples.size() && samples[first].timestamp < interval.start)
  {
    anchor = samples[first];
    ++first;
  }

  std::size_t last = first;
  while (last < samples.size() && interval.contains(samples[last].timestamp))
  {
    ++last;
  }

  if (first == last)
  {
    throw InsufficientDataError("No counter samples inside " +
                                interval.toString() +
                                (anchor ? " (anchor only)" : ""));
  }

  PulseDelta delta;
  delta.anchored = anchor.has_value();
  delta.samplesUsed = last - first + (anchor ? 1 : 0);

  uint64_t previous = anchor ? anchor->value : samples[first].value;
  for (std::size_t i = first; i < last; ++i)
  {
    const uint64_t current = samples[i].value;
    if (current >= previous)
    {
      delta.pulses += current - previous;
    }
    else
    {
      // Reset: the counter restarted from zero and has since reached current
      delta.pulses += current;
      ++delta.resets;
    }
    previous = current;
  }

  return delta;
}

double EnergyAccumulator::compute(const Interval& interval,
                                  std::span<const CounterSample> samples) const
{
  const PulseDelta delta = accumulate(interval, samples);
  const double energyKwh =
    static_cast<double>(delta.pulses) / config_.pulsesPerKwh;

  if (!std::isfinite(energyKwh) || energyKwh < 0.0)
  {
    throw ImplausibleReadingError(
      "Energy for " + interval.toString() + " is not a valid quantity",
      energyKwh);
  }

  const double ceiling = ceilingKwh(interval);
  if (energyKwh > ceiling)
  {
    throw ImplausibleReadingError(
      "Energy " + std::to_string(energyKwh) + " kWh for " +
        interval.toString() + " exceeds the plausible maximum of " +
        std::to_string(ceiling) + " kWh",
      energyKwh);
  }

  return energyKwh;
}

double EnergyAccumulator::ceilingKwh(const Interval& interval) const
{
  const double hours =
    static_cast<double>(interval.length().count()) / kSecondsPerHour;
  return config_.maxPowerW * hours / kWattsPerKilowatt;
}

}  // namespace ecr_core
