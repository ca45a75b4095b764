// Ticket: 0001_workout_summary_core

#include "ftk-core/src/Workout/RaceWalking.hpp"

#include "ftk-core/src/Utils/utils.hpp"

namespace ftk_core
{

RaceWalking::RaceWalking(double actionCount,
                         double durationHours,
                         double weightKg,
                         double heightCm)
  : Workout{actionCount, durationHours, weightKg}, heightCm_{heightCm}
{
}

double RaceWalking::computeCaloriesKcal() const
{
  const double speed = computeMeanSpeedKmh();
  const double weight = getWeightKg();

  return (kCalorieCoefA * weight +
          floorDivide(speed * speed, heightCm_) * kCalorieCoefB * weight) *
         getDurationHours() * kMinutesPerHour;
}

std::string_view RaceWalking::getKindName() const
{
  return "RaceWalking";
}

}  // namespace ftk_core
