// Ticket: 0001_workout_summary_core

#include <gtest/gtest.h>

#include "ftk-core/src/Workout/Swimming.hpp"
#include "ftk-core/src/Workout/WorkoutErrors.hpp"

using namespace ftk_core;

TEST(SwimmingTest, SamplePackageSummary)
{
  const Swimming swimming{720.0, 1.0, 80.0, 25.0, 40.0};

  const Summary summary = swimming.buildSummary();

  EXPECT_EQ(summary.workoutKindName, "Swimming");
  EXPECT_DOUBLE_EQ(summary.durationHours, 1.0);
  // 720 strokes * 1.38 m
  EXPECT_NEAR(summary.distanceKm, 0.9936, 1e-12);
  EXPECT_DOUBLE_EQ(summary.meanSpeedKmh, 1.0);
  EXPECT_NEAR(summary.caloriesKcal, 336.0, 1e-9);
}

TEST(SwimmingTest, StrokeLengthOverridesStepLength)
{
  const Swimming swimming{1000.0, 1.0, 80.0, 25.0, 40.0};

  EXPECT_DOUBLE_EQ(swimming.getStepLengthM(), 1.38);
  EXPECT_DOUBLE_EQ(swimming.computeDistanceKm(), 1.38);
}

TEST(SwimmingTest, SpeedIgnoresStrokeCount)
{
  const Swimming fewStrokes{10.0, 0.5, 80.0, 50.0, 20.0};
  const Swimming manyStrokes{5000.0, 0.5, 80.0, 50.0, 20.0};

  // 50 * 20 / 1000 / 0.5
  EXPECT_DOUBLE_EQ(fewStrokes.computeMeanSpeedKmh(), 2.0);
  EXPECT_DOUBLE_EQ(manyStrokes.computeMeanSpeedKmh(), 2.0);
  EXPECT_NE(fewStrokes.computeDistanceKm(), manyStrokes.computeDistanceKm());
}

TEST(SwimmingTest, CaloriesFromPoolSpeed)
{
  const Swimming swimming{10.0, 0.5, 70.0, 50.0, 20.0};

  // (2.0 + 1.1) * 2 * 70
  EXPECT_NEAR(swimming.computeCaloriesKcal(), 434.0, 1e-9);
}

TEST(SwimmingTest, PoolGeometryIsStored)
{
  const Swimming swimming{720.0, 1.0, 80.0, 25.0, 40.0};

  EXPECT_DOUBLE_EQ(swimming.getPoolLengthM(), 25.0);
  EXPECT_DOUBLE_EQ(swimming.getPoolLapsCount(), 40.0);
}

TEST(SwimmingTest, ZeroDurationIsArithmeticFault)
{
  const Swimming swimming{720.0, 0.0, 80.0, 25.0, 40.0};

  EXPECT_THROW((void)swimming.computeMeanSpeedKmh(), ArithmeticFault);
  EXPECT_THROW((void)swimming.computeCaloriesKcal(), ArithmeticFault);
}
