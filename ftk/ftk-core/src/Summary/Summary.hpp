#ifndef FTK_CORE_SUMMARY_SUMMARY_HPP
#define FTK_CORE_SUMMARY_SUMMARY_HPP

#include <string>

namespace ftk_core
{

/**
 * @brief Computed result of one workout, ready for rendering
 *
 * Created per query by Workout::buildSummary(). Holds no reference to the
 * workout it was built from. See SummaryTransfer.hpp for the transfer record.
 */
struct Summary
{
  std::string workoutKindName;
  double durationHours{0.0};  // [h]
  double distanceKm{0.0};     // [km]
  double meanSpeedKmh{0.0};   // [km/h]
  double caloriesKcal{0.0};   // [kcal]
};

}  // namespace ftk_core

#endif  // FTK_CORE_SUMMARY_SUMMARY_HPP
