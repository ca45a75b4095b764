// Ticket: 0001_workout_summary_core

#ifndef FTK_CORE_WORKOUT_RACE_WALKING_HPP
#define FTK_CORE_WORKOUT_RACE_WALKING_HPP

#include "ftk-core/src/Workout/Workout.hpp"

namespace ftk_core
{

/**
 * @brief Race-walking workout
 *
 * Calories: (0.035 * m + floor(v² / h) * 0.029 * m) * t * 60, with v the
 * mean speed [km/h], h the height [cm], m the weight [kg] and t the duration
 * [h]. The v² / h term is floor-divided (toward negative infinity), so it
 * only contributes once v² reaches the height.
 */
class RaceWalking : public Workout
{
public:
  static constexpr double kCalorieCoefA = 0.035;
  static constexpr double kCalorieCoefB = 0.029;
  static constexpr double kMinutesPerHour = 60.0;

  /**
   * @param actionCount Number of steps
   * @param durationHours Workout duration [h]
   * @param weightKg Body weight [kg]
   * @param heightCm Body height [cm]
   */
  RaceWalking(double actionCount,
              double durationHours,
              double weightKg,
              double heightCm);

  ~RaceWalking() override = default;

  /**
   * @throws ArithmeticFault if the height or the duration is zero
   */
  [[nodiscard]] double computeCaloriesKcal() const override;
  [[nodiscard]] std::string_view getKindName() const override;

  [[nodiscard]] double getHeightCm() const
  {
    return heightCm_;
  }

  RaceWalking(const RaceWalking&) = default;
  RaceWalking& operator=(const RaceWalking&) = default;
  RaceWalking(RaceWalking&&) noexcept = default;
  RaceWalking& operator=(RaceWalking&&) noexcept = default;

private:
  double heightCm_;  // [cm]
};

}  // namespace ftk_core

#endif  // FTK_CORE_WORKOUT_RACE_WALKING_HPP
