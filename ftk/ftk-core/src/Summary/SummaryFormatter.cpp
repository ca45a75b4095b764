#include "ftk-core/src/Summary/SummaryFormatter.hpp"

#include <fmt/format.h>

namespace ftk_core
{

std::string renderMessage(const Summary& summary)
{
  return fmt::format(kSummaryMessageTemplate,
                     fmt::arg("training_type", summary.workoutKindName),
                     fmt::arg("duration", summary.durationHours),
                     fmt::arg("distance", summary.distanceKm),
                     fmt::arg("speed", summary.meanSpeedKmh),
                     fmt::arg("calories", summary.caloriesKcal));
}

}  // namespace ftk_core
