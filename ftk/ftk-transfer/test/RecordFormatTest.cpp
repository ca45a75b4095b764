#include <gtest/gtest.h>

#include <cmath>
#include <string>

#include <boost/describe.hpp>

#include "ftk-transfer/src/Records.hpp"

using namespace ftk_transfer;

namespace
{

struct MixedRecord
{
  int id{0};
  std::string label;
  double ratio{0.0};
  float gain{0.0F};
};

BOOST_DESCRIBE_STRUCT(MixedRecord, (), (id, label, ratio, gain));

}  // namespace

TEST(RecordFormatTest, SummaryRecordFieldsInDeclarationOrder)
{
  SummaryRecord record;
  record.training_type = "Running";
  record.duration = 1.0;
  record.distance = 9.75;
  record.speed = 9.75;
  record.calories = 699.75;

  EXPECT_EQ(formatRecordFields(record),
            "training_type=Running duration=1.000 distance=9.750 "
            "speed=9.750 calories=699.750");
}

TEST(RecordFormatTest, DefaultSummaryRecordIsUnset)
{
  const SummaryRecord record;

  EXPECT_TRUE(record.training_type.empty());
  EXPECT_TRUE(std::isnan(record.duration));
  EXPECT_TRUE(std::isnan(record.distance));
  EXPECT_TRUE(std::isnan(record.speed));
  EXPECT_TRUE(std::isnan(record.calories));
}

TEST(RecordFormatTest, OnlyFloatingPointMembersAreRounded)
{
  MixedRecord record;
  record.id = 7;
  record.label = "lap";
  record.ratio = 0.33333;
  record.gain = 2.5F;

  EXPECT_EQ(formatRecordFields(record), "id=7 label=lap ratio=0.333 gain=2.500");
}
