// Ticket: 0001_workout_summary_core

#ifndef FTK_CORE_WORKOUT_RUNNING_HPP
#define FTK_CORE_WORKOUT_RUNNING_HPP

#include "ftk-core/src/Workout/Workout.hpp"

namespace ftk_core
{

/**
 * @brief Running workout
 *
 * Calories: (18 * v - 20) * m / 1000 * t * 60, with v the mean speed [km/h],
 * m the weight [kg] and t the duration [h]. The result is not clamped and
 * goes negative below 20/18 km/h.
 */
class Running : public Workout
{
public:
  static constexpr double kCalorieCoefA = 18.0;
  static constexpr double kCalorieCoefB = 20.0;
  static constexpr double kMinutesPerHour = 60.0;

  Running(double actionCount, double durationHours, double weightKg);

  ~Running() override = default;

  [[nodiscard]] double computeCaloriesKcal() const override;
  [[nodiscard]] std::string_view getKindName() const override;

  Running(const Running&) = default;
  Running& operator=(const Running&) = default;
  Running(Running&&) noexcept = default;
  Running& operator=(Running&&) noexcept = default;
};

}  // namespace ftk_core

#endif  // FTK_CORE_WORKOUT_RUNNING_HPP
