/**
 * @file HostSource_uTest.cpp
 * @brief Unit tests for gpumon::source::HostSource and procfs parsing.
 *
 * Notes:
 *  - Adapter tests run against a fake procfs tree in a temp directory.
 *  - One test samples the real /proc and asserts ranges only.
 */

#include "src/source/inc/HostSource.hpp"

#include <gtest/gtest.h>

#include <cstdlib> // mkdtemp
#include <filesystem>
#include <fstream>
#include <string>
#include <variant>

using gpumon::source::cpuUtilizationBetween;
using gpumon::source::CpuTimeCounters;
using gpumon::source::HOST_TARGET;
using gpumon::source::HostSource;
using gpumon::source::parseMemInfoUtilization;
using gpumon::source::parseProcStat;
using gpumon::source::RawHostReading;

/* ----------------------------- Parsing ----------------------------- */

/** @test The aggregate cpu line is parsed; per-cpu lines are ignored. */
TEST(ProcStatTest, ParsesAggregateLine) {
  const auto C = parseProcStat("cpu0 9 9 9 9 9 9 9 9 0 0\n"
                               "cpu  100 10 50 500 20 5 3 2 1 1\n"
                               "intr 12345\n");
  ASSERT_TRUE(C.has_value());
  EXPECT_EQ(C->user, 100U);
  EXPECT_EQ(C->idle, 500U);
  EXPECT_EQ(C->guestNice, 1U);
  EXPECT_EQ(C->total(), 690U);
  EXPECT_EQ(C->inactive(), 520U);
}

/** @test Missing aggregate line yields nullopt. */
TEST(ProcStatTest, MissingAggregate) {
  EXPECT_FALSE(parseProcStat("cpu0 1 2 3 4\n").has_value());
  EXPECT_FALSE(parseProcStat("").has_value());
  EXPECT_FALSE(parseProcStat(nullptr).has_value());
}

/** @test Utilization is the busy share of the delta. */
TEST(ProcStatTest, UtilizationBetween) {
  CpuTimeCounters before{};
  before.user = 100;
  before.system = 100;
  before.idle = 800;
  CpuTimeCounters after = before;
  after.user = 200;
  after.system = 200;
  after.idle = 1600;

  const auto PCT = cpuUtilizationBetween(before, after);
  ASSERT_TRUE(PCT.has_value());
  EXPECT_DOUBLE_EQ(*PCT, 20.0);
}

/** @test No elapsed time or counters going backwards yields nullopt. */
TEST(ProcStatTest, UtilizationNoDelta) {
  CpuTimeCounters c{};
  c.idle = 10;
  EXPECT_FALSE(cpuUtilizationBetween(c, c).has_value());
  CpuTimeCounters later = c;
  later.idle = 5;
  later.user = 100;
  EXPECT_FALSE(cpuUtilizationBetween(c, later).has_value());
}

/** @test RAM utilization uses MemAvailable when present. */
TEST(MemInfoTest, UsesMemAvailable) {
  const auto PCT = parseMemInfoUtilization("MemTotal:       1000 kB\n"
                                           "MemFree:         100 kB\n"
                                           "MemAvailable:    250 kB\n"
                                           "Buffers:          50 kB\n");
  ASSERT_TRUE(PCT.has_value());
  EXPECT_DOUBLE_EQ(*PCT, 75.0);
}

/** @test Without MemAvailable, free + buffers + cached is reclaimable. */
TEST(MemInfoTest, FallbackWithoutMemAvailable) {
  const auto PCT = parseMemInfoUtilization("MemTotal:       1000 kB\n"
                                           "MemFree:         100 kB\n"
                                           "Buffers:          50 kB\n"
                                           "Cached:          150 kB\n");
  ASSERT_TRUE(PCT.has_value());
  EXPECT_DOUBLE_EQ(*PCT, 70.0);
}

/** @test Missing MemTotal yields nullopt. */
TEST(MemInfoTest, MissingTotal) {
  EXPECT_FALSE(parseMemInfoUtilization("MemFree: 100 kB\n").has_value());
}

/* ----------------------------- Adapter ----------------------------- */

class HostSourceTest : public ::testing::Test {
protected:
  std::string root_;

  void SetUp() override {
    char tmpl[] = "/tmp/gpumon-proc-XXXXXX";
    ASSERT_NE(::mkdtemp(tmpl), nullptr);
    root_ = tmpl;
    std::filesystem::create_directories(root_ + "/proc");
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  void write(const std::string& rel, const std::string& text) {
    std::ofstream out(root_ + rel, std::ios::trunc);
    out << text;
  }
};

/** @test First query has RAM only; the second also has CPU from the delta. */
TEST_F(HostSourceTest, CpuNeedsTwoSamples) {
  write("/proc/stat", "cpu  100 0 100 800 0 0 0 0 0 0\n");
  write("/proc/meminfo", "MemTotal: 1000 kB\nMemAvailable: 250 kB\n");
  HostSource src(root_);

  const auto INV = src.inventory();
  ASSERT_TRUE(INV.ok());
  EXPECT_EQ(INV.targets, (std::vector<std::string>{HOST_TARGET}));

  const auto FIRST = src.query(HOST_TARGET);
  ASSERT_TRUE(FIRST.ok()) << FIRST.error;
  const auto& R1 = std::get<RawHostReading>(*FIRST.reading);
  EXPECT_FALSE(R1.cpuUtilPct.has_value());
  EXPECT_DOUBLE_EQ(*R1.ramUtilPct, 75.0);

  write("/proc/stat", "cpu  200 0 200 1600 0 0 0 0 0 0\n");
  const auto SECOND = src.query(HOST_TARGET);
  ASSERT_TRUE(SECOND.ok());
  const auto& R2 = std::get<RawHostReading>(*SECOND.reading);
  ASSERT_TRUE(R2.cpuUtilPct.has_value());
  EXPECT_DOUBLE_EQ(*R2.cpuUtilPct, 20.0);
}

/** @test A root without procfs files is unavailable. */
TEST_F(HostSourceTest, MissingFilesUnavailable) {
  HostSource src(root_);
  const auto INV = src.inventory();
  ASSERT_FALSE(INV.ok());
  EXPECT_EQ(INV.unavailable->source, "procfs");
}

/** @test Unknown targets are rejected. */
TEST_F(HostSourceTest, RejectsDeviceTarget) {
  write("/proc/meminfo", "MemTotal: 1000 kB\nMemAvailable: 500 kB\n");
  HostSource src(root_);
  EXPECT_FALSE(src.query("GPU-0").ok());
}

/** @test The real /proc yields RAM utilization within [0, 100]. */
TEST(HostSourceLiveTest, RealProcRanges) {
  HostSource src{};
  ASSERT_TRUE(src.inventory().ok());
  const auto OUT = src.query(HOST_TARGET);
  ASSERT_TRUE(OUT.ok()) << OUT.error;
  const auto& READING = std::get<RawHostReading>(*OUT.reading);
  ASSERT_TRUE(READING.ramUtilPct.has_value());
  EXPECT_GE(*READING.ramUtilPct, 0.0);
  EXPECT_LE(*READING.ramUtilPct, 100.0);
}
