/**
 * @file MetricRecord_uTest.cpp
 * @brief Unit tests for gpumon::model::MetricRecord, SeriesKey and Device.
 */

#include "src/model/inc/MetricRecord.hpp"

#include <gtest/gtest.h>

#include <map>
#include <string>

using gpumon::model::Device;
using gpumon::model::MetricRecord;
using gpumon::model::MetricType;
using gpumon::model::SeriesKey;
using gpumon::model::Status;

/* ----------------------------- SeriesKey ----------------------------- */

/** @test Host keys carry no device id and render as host/<metric>. */
TEST(SeriesKeyTest, HostKey) {
  const SeriesKey KEY = SeriesKey::host(MetricType::CpuUtil);
  EXPECT_TRUE(KEY.isHost());
  EXPECT_TRUE(KEY.deviceId.empty());
  EXPECT_EQ(KEY.toString(), "host/cpu_util");
}

/** @test Device keys render as <id>/<metric>. */
TEST(SeriesKeyTest, DeviceKey) {
  const SeriesKey KEY = SeriesKey::device("GPU-1234", MetricType::TempC);
  EXPECT_FALSE(KEY.isHost());
  EXPECT_EQ(KEY.toString(), "GPU-1234/temp_c");
}

/** @test Keys order and compare by (device, type) and work as map keys. */
TEST(SeriesKeyTest, MapKey) {
  std::map<SeriesKey, int> map;
  map[SeriesKey::device("A", MetricType::TempC)] = 1;
  map[SeriesKey::device("A", MetricType::GpuUtil)] = 2;
  map[SeriesKey::host(MetricType::RamUtil)] = 3;
  map[SeriesKey::device("A", MetricType::TempC)] = 4;

  EXPECT_EQ(map.size(), 3U);
  EXPECT_EQ(map.at(SeriesKey::device("A", MetricType::TempC)), 4);
  EXPECT_NE(SeriesKey::device("A", MetricType::TempC), SeriesKey::device("B", MetricType::TempC));
}

/* ----------------------------- MetricRecord ----------------------------- */

/** @test Constructor stores every field. */
TEST(MetricRecordTest, Fields) {
  const MetricRecord REC(7, 1000, 2000, MetricType::PowerPct, std::string("GPU-0"), 42.5,
                         Status::Warm);
  EXPECT_EQ(REC.cycleId(), 7U);
  EXPECT_EQ(REC.timestampNs(), 1000U);
  EXPECT_EQ(REC.wallTimeNs(), 2000U);
  EXPECT_EQ(REC.type(), MetricType::PowerPct);
  ASSERT_TRUE(REC.deviceId().has_value());
  EXPECT_EQ(*REC.deviceId(), "GPU-0");
  EXPECT_DOUBLE_EQ(REC.value(), 42.5);
  EXPECT_EQ(REC.status(), Status::Warm);
}

/** @test key() follows the device id. */
TEST(MetricRecordTest, KeyFromDeviceId) {
  const MetricRecord DEV(1, 1, 1, MetricType::GpuUtil, std::string("X"), 1.0, Status::Normal);
  const MetricRecord HOST(1, 1, 1, MetricType::RamUtil, std::nullopt, 1.0, Status::Normal);
  EXPECT_EQ(DEV.key(), SeriesKey::device("X", MetricType::GpuUtil));
  EXPECT_EQ(HOST.key(), SeriesKey::host(MetricType::RamUtil));
}

/** @test toString names the series and status. */
TEST(MetricRecordTest, ToString) {
  const MetricRecord REC(3, 1, 1, MetricType::TempC, std::string("G"), 81.0, Status::Hot);
  const std::string TEXT = REC.toString();
  EXPECT_NE(TEXT.find("G/temp_c"), std::string::npos);
  EXPECT_NE(TEXT.find("hot"), std::string::npos);
  EXPECT_NE(TEXT.find("cycle 3"), std::string::npos);
}

/* ----------------------------- Status / Device ----------------------------- */

/** @test Status names and severity order. */
TEST(StatusTest, NamesAndOrder) {
  EXPECT_STREQ(toString(Status::Normal), "normal");
  EXPECT_STREQ(toString(Status::Warm), "warm");
  EXPECT_STREQ(toString(Status::Hot), "hot");
  EXPECT_LT(Status::Normal, Status::Warm);
  EXPECT_LT(Status::Warm, Status::Hot);
}

/** @test Device toString mentions unknown rated power. */
TEST(DeviceTest, ToStringRatedPower) {
  Device dev{"GPU-0", "Tesla T4", 70.0, "nvml"};
  EXPECT_NE(dev.toString().find("rated 70 W"), std::string::npos);
  dev.ratedMaxPowerW.reset();
  EXPECT_NE(dev.toString().find("unknown"), std::string::npos);
}
