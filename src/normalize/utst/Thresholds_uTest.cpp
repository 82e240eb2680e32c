/**
 * @file Thresholds_uTest.cpp
 * @brief Unit tests for gpumon::normalize threshold tables.
 */

#include "src/normalize/inc/Thresholds.hpp"

#include <gtest/gtest.h>

#include <string>

using gpumon::model::MetricType;
using gpumon::model::Status;
using gpumon::normalize::Threshold;
using gpumon::normalize::ThresholdSet;
using gpumon::normalize::ThresholdTable;

/** @test Boundaries are inclusive-lower: ties go to the hotter bucket. */
TEST(ThresholdTableTest, InclusiveLowerBounds) {
  const ThresholdTable TABLE = ThresholdTable::warmHot(60.0, 80.0);
  EXPECT_EQ(TABLE.classify(59.999), Status::Normal);
  EXPECT_EQ(TABLE.classify(60.0), Status::Warm);
  EXPECT_EQ(TABLE.classify(79.999), Status::Warm);
  EXPECT_EQ(TABLE.classify(80.0), Status::Hot);
  EXPECT_EQ(TABLE.classify(500.0), Status::Hot);
  EXPECT_EQ(TABLE.classify(-5.0), Status::Normal);
}

/** @test An empty table classifies everything as normal. */
TEST(ThresholdTableTest, EmptyTableAlwaysNormal) {
  const ThresholdTable TABLE{};
  EXPECT_EQ(TABLE.classify(1e9), Status::Normal);
  EXPECT_TRUE(TABLE.isValid());
}

/** @test Descending bounds are rejected. */
TEST(ThresholdTableTest, RejectsUnorderedBounds) {
  const ThresholdTable TABLE({Threshold{80.0, Status::Warm}, Threshold{60.0, Status::Hot}});
  std::string error;
  EXPECT_FALSE(TABLE.isValid(&error));
  EXPECT_FALSE(error.empty());
}

/** @test Severity may not decrease as bounds rise. */
TEST(ThresholdTableTest, RejectsDecreasingSeverity) {
  const ThresholdTable TABLE({Threshold{60.0, Status::Hot}, Threshold{80.0, Status::Warm}});
  EXPECT_FALSE(TABLE.isValid());
}

/** @test Defaults follow the documented bands. */
TEST(ThresholdSetTest, Defaults) {
  const ThresholdSet SET = ThresholdSet::defaults();
  EXPECT_EQ(SET.forType(MetricType::TempC).classify(60.0), Status::Warm);
  EXPECT_EQ(SET.forType(MetricType::TempC).classify(80.0), Status::Hot);
  EXPECT_EQ(SET.forType(MetricType::GpuUtil).classify(90.0), Status::Hot);
  EXPECT_EQ(SET.forType(MetricType::GpuUtil).classify(89.9), Status::Warm);
  EXPECT_EQ(SET.forType(MetricType::PowerPct).classify(94.9), Status::Warm);
  EXPECT_EQ(SET.forType(MetricType::PowerPct).classify(95.0), Status::Hot);
  EXPECT_EQ(SET.forType(MetricType::RamUtil).classify(69.9), Status::Normal);
  for (const auto& TABLE : SET.tables) {
    EXPECT_TRUE(TABLE.isValid());
  }
}

/** @test toString lists bands in order. */
TEST(ThresholdTableTest, ToString) {
  EXPECT_EQ(ThresholdTable::warmHot(60.0, 80.0).toString(), "warm>=60 hot>=80");
  EXPECT_EQ(ThresholdTable{}.toString(), "always normal");
}
