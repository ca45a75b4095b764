// Ticket: 0001_workout_summary_core

#include <gtest/gtest.h>

#include <stdexcept>
#include <string_view>

#include "ftk-core/src/Workout/Running.hpp"
#include "ftk-core/src/Workout/Workout.hpp"
#include "ftk-core/src/Workout/WorkoutErrors.hpp"

using namespace ftk_core;

namespace
{

// Workout kind that only inherits the base behaviour
class BareWorkout : public Workout
{
public:
  BareWorkout(double actionCount, double durationHours, double weightKg)
    : Workout{actionCount, durationHours, weightKg}
  {
  }

  [[nodiscard]] std::string_view getKindName() const override
  {
    return "BareWorkout";
  }
};

}  // namespace

// ============================================================================
// Base distance / speed
// ============================================================================

TEST(WorkoutTest, DistanceUsesDefaultStepLength)
{
  BareWorkout workout{1000.0, 1.0, 70.0};

  EXPECT_DOUBLE_EQ(workout.getStepLengthM(), 0.65);
  EXPECT_DOUBLE_EQ(workout.computeDistanceKm(), 0.65);
}

TEST(WorkoutTest, MeanSpeedDividesDistanceByDuration)
{
  BareWorkout workout{10000.0, 2.0, 70.0};

  EXPECT_DOUBLE_EQ(workout.computeDistanceKm(), 6.5);
  EXPECT_DOUBLE_EQ(workout.computeMeanSpeedKmh(), 3.25);
}

TEST(WorkoutTest, DistanceIsNonNegativeForNonNegativeActions)
{
  for (double actions : {0.0, 1.0, 42.0, 15000.0, 1e9})
  {
    BareWorkout workout{actions, 1.0, 70.0};
    EXPECT_GE(workout.computeDistanceKm(), 0.0) << "actions=" << actions;
  }
}

TEST(WorkoutTest, AccessorsReturnConstructionValues)
{
  BareWorkout workout{123.0, 0.5, 82.5};

  EXPECT_DOUBLE_EQ(workout.getActionCount(), 123.0);
  EXPECT_DOUBLE_EQ(workout.getDurationHours(), 0.5);
  EXPECT_DOUBLE_EQ(workout.getWeightKg(), 82.5);
}

// ============================================================================
// Error handling
// ============================================================================

TEST(WorkoutTest, ZeroDurationIsArithmeticFault)
{
  BareWorkout workout{1000.0, 0.0, 70.0};

  EXPECT_DOUBLE_EQ(workout.computeDistanceKm(), 0.65);
  EXPECT_THROW((void)workout.computeMeanSpeedKmh(), ArithmeticFault);
}

TEST(WorkoutTest, ArithmeticFaultIsDomainError)
{
  BareWorkout workout{1000.0, 0.0, 70.0};

  EXPECT_THROW((void)workout.computeMeanSpeedKmh(), std::domain_error);
}

TEST(WorkoutTest, BaseCaloriesThrowLogicError)
{
  BareWorkout workout{1000.0, 1.0, 70.0};

  EXPECT_THROW((void)workout.computeCaloriesKcal(), std::logic_error);
}

TEST(WorkoutTest, BuildSummaryPropagatesMissingCalorieFormula)
{
  BareWorkout workout{1000.0, 1.0, 70.0};

  EXPECT_THROW((void)workout.buildSummary(), std::logic_error);
}

// ============================================================================
// Summary
// ============================================================================

TEST(WorkoutTest, BuildSummaryIsIdempotent)
{
  const Running running{15000.0, 1.0, 75.0};

  const Summary first = running.buildSummary();
  const Summary second = running.buildSummary();

  EXPECT_EQ(first.workoutKindName, second.workoutKindName);
  EXPECT_DOUBLE_EQ(first.durationHours, second.durationHours);
  EXPECT_DOUBLE_EQ(first.distanceKm, second.distanceKm);
  EXPECT_DOUBLE_EQ(first.meanSpeedKmh, second.meanSpeedKmh);
  EXPECT_DOUBLE_EQ(first.caloriesKcal, second.caloriesKcal);
}

TEST(WorkoutTest, SummaryUsesConcreteKindThroughBaseReference)
{
  const Running running{15000.0, 1.0, 75.0};
  const Workout& workout = running;

  EXPECT_EQ(workout.buildSummary().workoutKindName, "Running");
}
