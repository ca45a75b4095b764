// Ticket: 0001_workout_summary_core

#include "ftk-core/src/Workout/Swimming.hpp"

#include "ftk-core/src/Workout/WorkoutErrors.hpp"

namespace ftk_core
{

Swimming::Swimming(double actionCount,
                   double durationHours,
                   double weightKg,
                   double poolLengthM,
                   double poolLapsCount)
  : Workout{actionCount, durationHours, weightKg},
    poolLengthM_{poolLengthM},
    poolLapsCount_{poolLapsCount}
{
}

double Swimming::computeMeanSpeedKmh() const
{
  const double duration = getDurationHours();
  if (duration == 0.0)
  {
    throw ArithmeticFault{"Swimming::computeMeanSpeedKmh() - duration is zero"};
  }
  return poolLengthM_ * poolLapsCount_ / kMetersPerKm / duration;
}

double Swimming::computeCaloriesKcal() const
{
  return (computeMeanSpeedKmh() + kCalorieCoefA) * kCalorieCoefB *
         getWeightKg();
}

std::string_view Swimming::getKindName() const
{
  return "Swimming";
}

}  // namespace ftk_core
