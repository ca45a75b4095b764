// Ticket: 0001_workout_summary_core

#include <gtest/gtest.h>

#include "ftk-core/src/Workout/Running.hpp"
#include "ftk-core/src/Workout/WorkoutErrors.hpp"

using namespace ftk_core;

TEST(RunningTest, SamplePackageSummary)
{
  const Running running{15000.0, 1.0, 75.0};

  const Summary summary = running.buildSummary();

  EXPECT_EQ(summary.workoutKindName, "Running");
  EXPECT_DOUBLE_EQ(summary.durationHours, 1.0);
  EXPECT_DOUBLE_EQ(summary.distanceKm, 9.75);
  EXPECT_DOUBLE_EQ(summary.meanSpeedKmh, 9.75);
  // (18 * 9.75 - 20) * 75 / 1000 * 1 * 60
  EXPECT_NEAR(summary.caloriesKcal, 699.75, 1e-9);
}

TEST(RunningTest, CaloriesScaleWithDuration)
{
  // Same speed (9.75 km/h) over two hours
  const Running running{30000.0, 2.0, 75.0};

  EXPECT_DOUBLE_EQ(running.computeMeanSpeedKmh(), 9.75);
  EXPECT_NEAR(running.computeCaloriesKcal(), 2.0 * 699.75, 1e-9);
}

TEST(RunningTest, CaloriesGoNegativeAtLowSpeed)
{
  // 1000 steps in one hour: 0.65 km/h, below 20/18 km/h
  const Running running{1000.0, 1.0, 75.0};

  const double expected = (18.0 * 0.65 - 20.0) * 75.0 / 1000.0 * 60.0;
  EXPECT_LT(running.computeCaloriesKcal(), 0.0);
  EXPECT_NEAR(running.computeCaloriesKcal(), expected, 1e-9);
}

TEST(RunningTest, ZeroDurationIsArithmeticFault)
{
  const Running running{15000.0, 0.0, 75.0};

  EXPECT_THROW((void)running.computeCaloriesKcal(), ArithmeticFault);
  EXPECT_THROW((void)running.buildSummary(), ArithmeticFault);
}
