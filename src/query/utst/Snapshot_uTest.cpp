/**
 * @file Snapshot_uTest.cpp
 * @brief Unit tests for gpumon::query::Snapshot and Diagnostics.
 */

#include "src/query/inc/Snapshot.hpp"

#include <gtest/gtest.h>

#include <string>

using gpumon::model::MetricRecord;
using gpumon::model::MetricType;
using gpumon::model::SeriesKey;
using gpumon::model::Status;
using gpumon::query::Diagnostics;
using gpumon::query::Snapshot;
using gpumon::source::DeviceError;
using gpumon::source::QueryErrorKind;
using gpumon::source::SourceUnavailable;

/** @test A default snapshot is the empty pre-first-cycle view. */
TEST(SnapshotTest, DefaultIsEmpty) {
  const Snapshot SNAP{};
  EXPECT_TRUE(SNAP.empty());
  EXPECT_EQ(SNAP.cycleId, 0U);
  EXPECT_FALSE(SNAP.degraded);
  EXPECT_TRUE(SNAP.devices.empty());
  EXPECT_TRUE(SNAP.latest.empty());
}

/** @test find() returns this cycle's record or null. */
TEST(SnapshotTest, Find) {
  Snapshot snap{};
  snap.cycleId = 4;
  const SeriesKey KEY = SeriesKey::device("A", MetricType::TempC);
  snap.latest.emplace(KEY, MetricRecord(4, 1, 1, MetricType::TempC, std::string("A"), 55.0,
                                        Status::Normal));

  ASSERT_NE(snap.find(KEY), nullptr);
  EXPECT_DOUBLE_EQ(snap.find(KEY)->value(), 55.0);
  EXPECT_EQ(snap.find(SeriesKey::device("B", MetricType::TempC)), nullptr);
  EXPECT_FALSE(snap.empty());
}

/** @test Diagnostics text names unavailable sources and device errors. */
TEST(DiagnosticsTest, ToStringMentionsProblems) {
  Diagnostics diag{};
  diag.cycleId = 2;
  diag.degraded = true;
  diag.unavailable.push_back(SourceUnavailable{"nvidia-smi", "nvidia-smi not found"});
  diag.deviceErrors.push_back(DeviceError{"GPU-1", QueryErrorKind::Timeout, "no response"});

  const std::string TEXT = diag.toString();
  EXPECT_NE(TEXT.find("DEGRADED"), std::string::npos);
  EXPECT_NE(TEXT.find("nvidia-smi not found"), std::string::npos);
  EXPECT_NE(TEXT.find("GPU-1"), std::string::npos);
  EXPECT_NE(TEXT.find("timeout"), std::string::npos);
}
