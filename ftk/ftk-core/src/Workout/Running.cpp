// Ticket: 0001_workout_summary_core

#include "ftk-core/src/Workout/Running.hpp"

namespace ftk_core
{

Running::Running(double actionCount, double durationHours, double weightKg)
  : Workout{actionCount, durationHours, weightKg}
{
}

double Running::computeCaloriesKcal() const
{
  return (kCalorieCoefA * computeMeanSpeedKmh() - kCalorieCoefB) *
         getWeightKg() / kMetersPerKm * getDurationHours() * kMinutesPerHour;
}

std::string_view Running::getKindName() const
{
  return "Running";
}

}  // namespace ftk_core
