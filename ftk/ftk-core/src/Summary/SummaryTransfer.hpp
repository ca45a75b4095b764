#ifndef FTK_CORE_SUMMARY_SUMMARY_TRANSFER_HPP
#define FTK_CORE_SUMMARY_SUMMARY_TRANSFER_HPP

#include "ftk-core/src/Summary/Summary.hpp"
#include "ftk-transfer/src/SummaryRecord.hpp"

namespace ftk_core
{

// Transfer methods

[[nodiscard]] inline ftk_transfer::SummaryRecord toRecord(
  const Summary& summary)
{
  ftk_transfer::SummaryRecord record;
  record.training_type = summary.workoutKindName;
  record.duration = summary.durationHours;
  record.distance = summary.distanceKm;
  record.speed = summary.meanSpeedKmh;
  record.calories = summary.caloriesKcal;
  return record;
}

[[nodiscard]] inline Summary fromRecord(
  const ftk_transfer::SummaryRecord& record)
{
  return Summary{record.training_type,
                 record.duration,
                 record.distance,
                 record.speed,
                 record.calories};
}

}  // namespace ftk_core

#endif  // FTK_CORE_SUMMARY_SUMMARY_TRANSFER_HPP
