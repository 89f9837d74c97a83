#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <vector>

#include "ecr-core/src/Energy/EnergyAccumulator.hpp"
#include "ecr-core/src/Errors.hpp"

namespace ecr_core
{
namespace test
{

using std::chrono::seconds;
using std::chrono::sys_seconds;

namespace
{

// 2021-03-01T00:00:00Z, a day boundary
const sys_seconds kT0{seconds{1614556800}};
const seconds kDay{86400};

Interval dayFrom(sys_seconds start)
{
  return Interval{start, start + kDay};
}

CounterSample at(seconds offset, uint64_t value)
{
  return CounterSample{kT0 + offset, value};
}

}  // namespace

class EnergyAccumulatorTest : public ::testing::Test
{
protected:
  EnergyAccumulator accumulator_{EnergyAccumulator::Config{1000.0, 15000.0}};
};

// ========== Normal accumulation ==========

TEST_F(EnergyAccumulatorTest, NoReset_EqualsLastMinusAnchor)
{
  std::vector<CounterSample> samples{
    at(seconds{-100}, 1000), at(seconds{10}, 1200), at(seconds{500}, 1500)};

  auto delta = accumulator_.accumulate(dayFrom(kT0), samples);
  EXPECT_EQ(delta.pulses, 500u);
  EXPECT_EQ(delta.resets, 0u);
  EXPECT_TRUE(delta.anchored);
  EXPECT_EQ(delta.samplesUsed, 3u);

  EXPECT_DOUBLE_EQ(accumulator_.compute(dayFrom(kT0), samples), 0.5);
}

TEST_F(EnergyAccumulatorTest, NoAnchor_StartsFromFirstSampleInside)
{
  std::vector<CounterSample> samples{at(seconds{10}, 500),
                                     at(seconds{20}, 700)};

  auto delta = accumulator_.accumulate(dayFrom(kT0), samples);
  EXPECT_EQ(delta.pulses, 200u);
  EXPECT_FALSE(delta.anchored);
}

TEST_F(EnergyAccumulatorTest, SingleSampleWithoutAnchor_ZeroEnergy)
{
  std::vector<CounterSample> samples{at(seconds{10}, 500)};

  EXPECT_DOUBLE_EQ(accumulator_.compute(dayFrom(kT0), samples), 0.0);
}

TEST_F(EnergyAccumulatorTest, CalibrationFactor_ScalesPulses)
{
  EnergyAccumulator accumulator{EnergyAccumulator::Config{800.0, 15000.0}};
  std::vector<CounterSample> samples{at(seconds{-1}, 0), at(seconds{60}, 400)};

  EXPECT_DOUBLE_EQ(accumulator.compute(dayFrom(kT0), samples), 0.5);
}

// Anchor (t0 - 1 s, 1000), then (t0 + 3600, 1050) and (t0 + 80000, 1100):
// 100 pulses at 1000 pulses/kWh
TEST_F(EnergyAccumulatorTest, DailyInterval_WithAnchor_OneTenthKwh)
{
  std::vector<CounterSample> samples{at(seconds{-1}, 1000),
                                     at(seconds{3600}, 1050),
                                     at(seconds{80000}, 1100)};

  EXPECT_NEAR(accumulator_.compute(dayFrom(kT0), samples), 0.1, 1e-12);
}

TEST_F(EnergyAccumulatorTest, DailyInterval_FirstSampleOnBoundary_OneTenthKwh)
{
  std::vector<CounterSample> samples{at(seconds{0}, 1000),
                                     at(seconds{3600}, 1050),
                                     at(seconds{80000}, 1100)};

  EXPECT_NEAR(accumulator_.compute(dayFrom(kT0), samples), 0.1, 1e-12);
}

// ========== Counter resets ==========

TEST_F(EnergyAccumulatorTest, SingleReset_AddsPostResetValue)
{
  // 995 - 990 before the reset, then 3 pulses counted from zero
  std::vector<CounterSample> samples{
    at(seconds{-10}, 990), at(seconds{10}, 995), at(seconds{20}, 3)};

  auto delta = accumulator_.accumulate(dayFrom(kT0), samples);
  EXPECT_EQ(delta.pulses, 8u);
  EXPECT_EQ(delta.resets, 1u);
  EXPECT_DOUBLE_EQ(accumulator_.compute(dayFrom(kT0), samples), 0.008);
}

TEST_F(EnergyAccumulatorTest, ResetBetweenAnchorAndFirstSample)
{
  std::vector<CounterSample> samples{
    at(seconds{-10}, 5000), at(seconds{10}, 40), at(seconds{20}, 90)};

  auto delta = accumulator_.accumulate(dayFrom(kT0), samples);
  EXPECT_EQ(delta.pulses, 90u);
  EXPECT_EQ(delta.resets, 1u);
}

TEST_F(EnergyAccumulatorTest, ResetToZero_ContributesNothing)
{
  std::vector<CounterSample> samples{
    at(seconds{-10}, 990), at(seconds{10}, 995), at(seconds{20}, 0)};

  EXPECT_EQ(accumulator_.accumulate(dayFrom(kT0), samples).pulses, 5u);
}

TEST_F(EnergyAccumulatorTest, ConsecutiveResets_EachCountedOnce)
{
  // Two separate decreases, one per pair of samples
  std::vector<CounterSample> samples{
    at(seconds{-10}, 100), at(seconds{10}, 50), at(seconds{20}, 20)};

  auto delta = accumulator_.accumulate(dayFrom(kT0), samples);
  EXPECT_EQ(delta.pulses, 70u);
  EXPECT_EQ(delta.resets, 2u);
}

// ========== Missing data ==========

TEST_F(EnergyAccumulatorTest, NoSamples_InsufficientData)
{
  std::vector<CounterSample> samples;

  EXPECT_THROW((void)accumulator_.compute(dayFrom(kT0), samples),
               InsufficientDataError);
}

TEST_F(EnergyAccumulatorTest, AnchorAndLaterSampleOnly_InsufficientData)
{
  // Nothing inside [start, end); the sample after the end is not used
  std::vector<CounterSample> samples{at(seconds{-10}, 1000),
                                     at(kDay + seconds{10}, 1500)};

  EXPECT_THROW((void)accumulator_.compute(dayFrom(kT0), samples),
               InsufficientDataError);
}

TEST_F(EnergyAccumulatorTest, SamplesAfterEnd_Ignored)
{
  std::vector<CounterSample> samples{at(seconds{-10}, 1000),
                                     at(seconds{100}, 1100),
                                     at(kDay, 9000),
                                     at(kDay + seconds{60}, 9500)};

  EXPECT_EQ(accumulator_.accumulate(dayFrom(kT0), samples).pulses, 100u);
}

// ========== Sanity bounds ==========

TEST_F(EnergyAccumulatorTest, AboveCeiling_ImplausibleReading)
{
  // One hour at 15 kW is at most 15 kWh; 20000 pulses is 20 kWh
  const Interval hour{kT0, kT0 + seconds{3600}};
  std::vector<CounterSample> samples{at(seconds{-1}, 0), at(seconds{60}, 20000)};

  EXPECT_DOUBLE_EQ(accumulator_.ceilingKwh(hour), 15.0);
  try
  {
    (void)accumulator_.compute(hour, samples);
    FAIL() << "Expected ImplausibleReadingError";
  }
  catch (const ImplausibleReadingError& e)
  {
    EXPECT_DOUBLE_EQ(e.value(), 20.0);
  }
}

TEST_F(EnergyAccumulatorTest, AtCeiling_Accepted)
{
  const Interval hour{kT0, kT0 + seconds{3600}};
  std::vector<CounterSample> samples{at(seconds{-1}, 0), at(seconds{60}, 15000)};

  EXPECT_DOUBLE_EQ(accumulator_.compute(hour, samples), 15.0);
}

// ========== Invalid input ==========

TEST_F(EnergyAccumulatorTest, DuplicateTimestamps_Throws)
{
  std::vector<CounterSample> samples{at(seconds{10}, 100), at(seconds{10}, 120)};

  EXPECT_THROW((void)accumulator_.compute(dayFrom(kT0), samples),
               std::invalid_argument);
}

TEST_F(EnergyAccumulatorTest, OutOfOrderTimestamps_Throws)
{
  std::vector<CounterSample> samples{at(seconds{20}, 100), at(seconds{10}, 120)};

  EXPECT_THROW((void)accumulator_.compute(dayFrom(kT0), samples),
               std::invalid_argument);
}

TEST_F(EnergyAccumulatorTest, Constructor_NonPositiveCalibration_Throws)
{
  EXPECT_THROW(EnergyAccumulator(EnergyAccumulator::Config{0.0, 15000.0}),
               std::invalid_argument);
  EXPECT_THROW(EnergyAccumulator(EnergyAccumulator::Config{-5.0, 15000.0}),
               std::invalid_argument);
}

}  // namespace test
}  // namespace ecr_core
