#include <gtest/gtest.h>

#include "ftk-core/src/Summary/SummaryFormatter.hpp"
#include "ftk-core/src/Summary/SummaryTransfer.hpp"
#include "ftk-core/src/Workout/RaceWalking.hpp"
#include "ftk-core/src/Workout/Swimming.hpp"
#include "ftk-transfer/src/RecordFormat.hpp"

using namespace ftk_core;

TEST(SummaryTransferTest, ToRecordCopiesEveryField)
{
  const RaceWalking walking{9000, 1, 75, 180};
  const Summary summary = walking.buildSummary();

  const auto record = toRecord(summary);

  EXPECT_EQ(record.training_type, "RaceWalking");
  EXPECT_DOUBLE_EQ(record.duration, summary.durationHours);
  EXPECT_DOUBLE_EQ(record.distance, summary.distanceKm);
  EXPECT_DOUBLE_EQ(record.speed, summary.meanSpeedKmh);
  EXPECT_DOUBLE_EQ(record.calories, summary.caloriesKcal);
}

TEST(SummaryTransferTest, FromRecordKeepsMessage)
{
  const RaceWalking walking{9000, 1, 75, 180};
  const Summary summary = walking.buildSummary();

  EXPECT_EQ(renderMessage(fromRecord(toRecord(summary))),
            renderMessage(summary));
}

TEST(SummaryTransferTest, RecordFieldsOfSwimmingSample)
{
  const Swimming swimming{720, 1, 80, 25, 40};

  EXPECT_EQ(ftk_transfer::formatRecordFields(toRecord(swimming.buildSummary())),
            "training_type=Swimming duration=1.000 distance=0.994 "
            "speed=1.000 calories=336.000");
}
