// Ticket: 0001_workout_summary_core

#ifndef FTK_CORE_WORKOUT_WORKOUT_HPP
#define FTK_CORE_WORKOUT_WORKOUT_HPP

#include <string_view>

#include "ftk-core/src/Summary/Summary.hpp"

namespace ftk_core
{

/**
 * @brief Abstract calculation model for a single recorded workout
 *
 * Holds the raw motion counters reported by the tracker and derives distance,
 * mean speed and calories from them. Distance is the number of elementary
 * actions (steps or strokes) times the step length of the workout kind.
 *
 * Concrete kinds supply their own calorie formula and may override the step
 * length and the speed formula.
 *
 * Thread safety: Read-only after construction (thread-safe)
 * Error handling: Division faults throw ArithmeticFault. Calling the base
 * calorie computation throws std::logic_error.
 */
class Workout
{
public:
  /// Default length of one action [m]
  static constexpr double kStepLengthM = 0.65;
  static constexpr double kMetersPerKm = 1000.0;

  virtual ~Workout() = default;

  /**
   * @brief Distance covered
   * @return actionCount * stepLength / 1000 [km]
   */
  [[nodiscard]] double computeDistanceKm() const;

  /**
   * @brief Mean speed over the whole workout
   * @return distance / duration [km/h]
   * @throws ArithmeticFault if the duration is zero
   */
  [[nodiscard]] virtual double computeMeanSpeedKmh() const;

  /**
   * @brief Energy spent during the workout
   * @return Calories [kcal]
   * @throws std::logic_error Every concrete workout kind must override this
   */
  [[nodiscard]] virtual double computeCaloriesKcal() const;

  /**
   * @brief Assemble the summary of this workout
   *
   * Evaluates all formulas; the workout itself is left untouched, so repeated
   * calls yield identical summaries.
   */
  [[nodiscard]] Summary buildSummary() const;

  /**
   * @brief Name of the concrete workout kind, e.g. "Running"
   */
  [[nodiscard]] virtual std::string_view getKindName() const = 0;

  /**
   * @brief Length of one action for this workout kind [m]
   */
  [[nodiscard]] virtual double getStepLengthM() const
  {
    return kStepLengthM;
  }

  [[nodiscard]] double getActionCount() const
  {
    return actionCount_;
  }

  [[nodiscard]] double getDurationHours() const
  {
    return durationHours_;
  }

  [[nodiscard]] double getWeightKg() const
  {
    return weightKg_;
  }

protected:
  /**
   * @param actionCount Number of steps or strokes
   * @param durationHours Workout duration [h]
   * @param weightKg Body weight [kg]
   */
  Workout(double actionCount, double durationHours, double weightKg);

  Workout(const Workout&) = default;
  Workout& operator=(const Workout&) = default;
  Workout(Workout&&) noexcept = default;
  Workout& operator=(Workout&&) noexcept = default;

private:
  double actionCount_;
  double durationHours_;  // [h]
  double weightKg_;       // [kg]
};

}  // namespace ftk_core

#endif  // FTK_CORE_WORKOUT_WORKOUT_HPP
