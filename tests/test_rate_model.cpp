/// @file test_rate_model.cpp
/// @brief Unit tests for rate curves and pacing conversion.

#include "load/rate_model.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using namespace loadcurve;
using namespace std::chrono_literals;

TEST(RateModelTest, ConcurrentIsUnbounded) {
  EXPECT_TRUE(std::isinf(current_rate(ConcurrentModel{}, 5.0, 60.0)));
}

TEST(RateModelTest, RpsIsConstant) {
  LoadModel m = RpsModel{.target = 250.0};
  EXPECT_DOUBLE_EQ(current_rate(m, 0.0, 60.0), 250.0);
  EXPECT_DOUBLE_EQ(current_rate(m, 59.9, 60.0), 250.0);
}

TEST(RateModelTest, RampInterpolatesThenHolds) {
  LoadModel m = RampRpsModel{.min = 10.0, .max = 110.0, .ramp_duration = 10s};
  EXPECT_DOUBLE_EQ(current_rate(m, 0.0, 60.0), 10.0);
  EXPECT_DOUBLE_EQ(current_rate(m, 5.0, 60.0), 60.0);
  EXPECT_DOUBLE_EQ(current_rate(m, 10.0, 60.0), 110.0);
  EXPECT_DOUBLE_EQ(current_rate(m, 45.0, 60.0), 110.0);
}

TEST(RateModelTest, RampWithZeroDurationJumpsToMax) {
  LoadModel m = RampRpsModel{.min = 1.0, .max = 9.0, .ramp_duration = 0s};
  EXPECT_DOUBLE_EQ(current_rate(m, 0.0, 60.0), 9.0);
}

class DailyTrafficTest : public ::testing::Test {
protected:
  // 100s cycle: morning 0-10, peak 10-30, decline 30-40, mid 40-60,
  // evening 60-70, night 70-100.
  LoadModel model = DailyTrafficModel{
      .min = 10.0, .mid = 50.0, .max = 100.0, .cycle_duration = 100s};
};

TEST_F(DailyTrafficTest, MorningRamp) {
  EXPECT_DOUBLE_EQ(current_rate(model, 0.0, 0.0), 10.0);
  EXPECT_DOUBLE_EQ(current_rate(model, 5.0, 0.0), 55.0);
}

TEST_F(DailyTrafficTest, PeakAndMidSustain) {
  EXPECT_DOUBLE_EQ(current_rate(model, 20.0, 0.0), 100.0);
  EXPECT_DOUBLE_EQ(current_rate(model, 50.0, 0.0), 50.0);
}

TEST_F(DailyTrafficTest, Declines) {
  EXPECT_DOUBLE_EQ(current_rate(model, 35.0, 0.0), 75.0);
  EXPECT_DOUBLE_EQ(current_rate(model, 65.0, 0.0), 30.0);
}

TEST_F(DailyTrafficTest, NightHoldsMin) {
  EXPECT_DOUBLE_EQ(current_rate(model, 70.0, 0.0), 10.0);
  EXPECT_DOUBLE_EQ(current_rate(model, 99.0, 0.0), 10.0);
}

TEST_F(DailyTrafficTest, RepeatsEveryCycle) {
  EXPECT_DOUBLE_EQ(current_rate(model, 120.0, 0.0),
                   current_rate(model, 20.0, 0.0));
  EXPECT_DOUBLE_EQ(current_rate(model, 305.0, 0.0),
                   current_rate(model, 5.0, 0.0));
}

TEST(RateModelTest, RampNeverDecreasesOverRun) {
  LoadModel m = RampRpsModel{.min = 5.0, .max = 500.0, .ramp_duration = 30s};
  double previous = current_rate(m, 0.0, 60.0);
  for (int step = 1; step <= 600; ++step) {
    const double rate = current_rate(m, step * 0.1, 60.0);
    EXPECT_GE(rate, previous) << "t=" << step * 0.1;
    previous = rate;
  }
  EXPECT_DOUBLE_EQ(previous, 500.0);
}

TEST(DailyTrafficDayTest, EqualRatiosOverOneDay) {
  DailyTrafficModel day{
      .min = 10.0, .mid = 40.0, .max = 90.0, .cycle_duration = 86400s};
  day.ratios = {0.2, 0.2, 0.2, 0.2, 0.2};
  const LoadModel m = day;

  EXPECT_DOUBLE_EQ(current_rate(m, 0.0, 0.0), 10.0);
  EXPECT_DOUBLE_EQ(current_rate(m, 86400.0, 0.0), 10.0);
  // Peak sustain spans 17280s..34560s.
  EXPECT_DOUBLE_EQ(current_rate(m, 25920.0, 0.0), 90.0);
  // Mid sustain spans 51840s..69120s.
  EXPECT_DOUBLE_EQ(current_rate(m, 60480.0, 0.0), 40.0);
  // The evening decline ends the day just above min.
  const double late = current_rate(m, 86399.0, 0.0);
  EXPECT_GT(late, 10.0);
  EXPECT_LT(late, 10.1);
}

TEST(DailyTrafficDayTest, OversizedRatiosTruncateAtCycleEnd) {
  // Phases would need 150s of a 100s cycle: mid sustain runs 90s..120s and
  // is cut at 100s, so neither the evening decline nor the night appears.
  DailyTrafficModel day{
      .min = 10.0, .mid = 50.0, .max = 100.0, .cycle_duration = 100s};
  day.ratios = {0.3, 0.3, 0.3, 0.3, 0.3};
  const LoadModel m = day;

  EXPECT_DOUBLE_EQ(current_rate(m, 45.0, 0.0), 100.0);
  EXPECT_DOUBLE_EQ(current_rate(m, 75.0, 0.0), 75.0);
  EXPECT_DOUBLE_EQ(current_rate(m, 95.0, 0.0), 50.0);
  EXPECT_DOUBLE_EQ(current_rate(m, 99.9, 0.0), 50.0);
  EXPECT_DOUBLE_EQ(current_rate(m, 100.0, 0.0), 10.0);
  for (int t = 30; t < 100; ++t) {
    EXPECT_GE(current_rate(m, t, 0.0), 50.0) << "t=" << t;
  }
}

TEST(RateModelValidateTest, RejectsNegativeRates) {
  EXPECT_FALSE(validate(RpsModel{.target = -1.0}).has_value());
  EXPECT_FALSE(validate(RampRpsModel{.min = -1.0, .max = 5.0}).has_value());
  EXPECT_FALSE(
      validate(DailyTrafficModel{.min = 0, .mid = -2, .max = 3}).has_value());
}

TEST(RateModelValidateTest, WarnsWhenRatiosExceedOne) {
  DailyTrafficModel m{.min = 1, .mid = 2, .max = 3, .cycle_duration = 60s};
  m.ratios = {0.3, 0.3, 0.3, 0.3, 0.3};
  auto result = validate(m);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->size(), 1u);
}

TEST(RateModelValidateTest, DefaultRatiosHaveNoWarnings) {
  auto result = validate(
      DailyTrafficModel{.min = 1, .mid = 2, .max = 3, .cycle_duration = 60s});
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->empty());
}

TEST(PacingDelayTest, SplitsAggregateRateAcrossWorkers) {
  // 10 workers at 100 rps aggregate: each fires every 100ms.
  EXPECT_EQ(pacing_delay(100.0, 10), 100ms);
  EXPECT_EQ(pacing_delay(3.0, 1), 333ms);
}

TEST(PacingDelayTest, InfiniteRateIsBurst) {
  EXPECT_EQ(pacing_delay(std::numeric_limits<double>::infinity(), 4), 0ms);
}

TEST(PacingDelayTest, ZeroRateParks) {
  EXPECT_FALSE(pacing_delay(0.0, 4).has_value());
  EXPECT_FALSE(pacing_delay(-3.0, 4).has_value());
}

TEST(PacingDelayTest, TinyRateIsCappedAtParkInterval) {
  EXPECT_EQ(pacing_delay(1e-9, 1),
            std::chrono::duration_cast<std::chrono::milliseconds>(
                kParkInterval));
}
