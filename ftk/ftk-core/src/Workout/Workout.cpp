// Ticket: 0001_workout_summary_core

#include "ftk-core/src/Workout/Workout.hpp"

#include <stdexcept>
#include <string>

#include "ftk-core/src/Workout/WorkoutErrors.hpp"

namespace ftk_core
{

Workout::Workout(double actionCount, double durationHours, double weightKg)
  : actionCount_{actionCount},
    durationHours_{durationHours},
    weightKg_{weightKg}
{
}

double Workout::computeDistanceKm() const
{
  return actionCount_ * getStepLengthM() / kMetersPerKm;
}

double Workout::computeMeanSpeedKmh() const
{
  if (durationHours_ == 0.0)
  {
    throw ArithmeticFault{"Workout::computeMeanSpeedKmh() - duration is zero"};
  }
  return computeDistanceKm() / durationHours_;
}

double Workout::computeCaloriesKcal() const
{
  throw std::logic_error(
    "Workout::computeCaloriesKcal() - not implemented for workout kind '" +
    std::string{getKindName()} + "'. This error indicates API misuse.");
}

Summary Workout::buildSummary() const
{
  Summary summary;
  summary.workoutKindName = std::string{getKindName()};
  summary.durationHours = durationHours_;
  summary.distanceKm = computeDistanceKm();
  summary.meanSpeedKmh = computeMeanSpeedKmh();
  summary.caloriesKcal = computeCaloriesKcal();
  return summary;
}

}  // namespace ftk_core
