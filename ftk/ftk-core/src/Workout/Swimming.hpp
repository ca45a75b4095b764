// Ticket: 0001_workout_summary_core

#ifndef FTK_CORE_WORKOUT_SWIMMING_HPP
#define FTK_CORE_WORKOUT_SWIMMING_HPP

#include "ftk-core/src/Workout/Workout.hpp"

namespace ftk_core
{

/**
 * @brief Swimming workout
 *
 * Distance still counts strokes (1.38 m each), but the mean speed is taken
 * from the pool geometry: length * laps / 1000 / t.
 *
 * Calories: (v + 1.1) * 2 * m
 */
class Swimming : public Workout
{
public:
  /// Length of one stroke [m]
  static constexpr double kStrokeLengthM = 1.38;
  static constexpr double kCalorieCoefA = 1.1;
  static constexpr double kCalorieCoefB = 2.0;

  /**
   * @param actionCount Number of strokes
   * @param durationHours Workout duration [h]
   * @param weightKg Body weight [kg]
   * @param poolLengthM Length of the pool [m]
   * @param poolLapsCount Number of pool lengths swum
   */
  Swimming(double actionCount,
           double durationHours,
           double weightKg,
           double poolLengthM,
           double poolLapsCount);

  ~Swimming() override = default;

  /**
   * @brief Mean speed from pool length and lap count [km/h]
   * @throws ArithmeticFault if the duration is zero
   */
  [[nodiscard]] double computeMeanSpeedKmh() const override;
  [[nodiscard]] double computeCaloriesKcal() const override;
  [[nodiscard]] std::string_view getKindName() const override;

  [[nodiscard]] double getStepLengthM() const override
  {
    return kStrokeLengthM;
  }

  [[nodiscard]] double getPoolLengthM() const
  {
    return poolLengthM_;
  }

  [[nodiscard]] double getPoolLapsCount() const
  {
    return poolLapsCount_;
  }

  Swimming(const Swimming&) = default;
  Swimming& operator=(const Swimming&) = default;
  Swimming(Swimming&&) noexcept = default;
  Swimming& operator=(Swimming&&) noexcept = default;

private:
  double poolLengthM_;  // [m]
  double poolLapsCount_;
};

}  // namespace ftk_core

#endif  // FTK_CORE_WORKOUT_SWIMMING_HPP
