/**
 * @file ScriptedSource_uTest.cpp
 * @brief Unit tests for gpumon::source::ScriptedSource.
 */

#include "src/source/inc/ScriptedSource.hpp"

#include <gtest/gtest.h>

#include <string>
#include <variant>
#include <vector>

using gpumon::source::HOST_TARGET;
using gpumon::source::RawDeviceReading;
using gpumon::source::RawHostReading;
using gpumon::source::ScriptedSource;
using gpumon::source::ScriptFrame;
using gpumon::source::simulatedFrames;

namespace {

RawDeviceReading gpu(const std::string& id, double util) {
  RawDeviceReading reading{};
  reading.id = id;
  reading.name = "Test GPU";
  reading.gpuUtilPct = util;
  return reading;
}

} // namespace

/** @test An empty script is permanently unavailable. */
TEST(ScriptedSourceTest, EmptyScriptUnavailable) {
  ScriptedSource src("empty", {});
  const auto INV = src.inventory();
  EXPECT_FALSE(INV.ok());
  EXPECT_EQ(INV.unavailable->source, "empty");
}

/** @test Inventory lists frame targets in script order. */
TEST(ScriptedSourceTest, InventoryListsTargets) {
  ScriptFrame frame{};
  frame.device(gpu("A", 1)).device(gpu("B", 2)).host(RawHostReading{});
  ScriptedSource src("s", {frame});

  const auto INV = src.inventory();
  ASSERT_TRUE(INV.ok());
  EXPECT_EQ(INV.targets, (std::vector<std::string>{"A", "B", HOST_TARGET}));
}

/** @test Queries answer from the current frame. */
TEST(ScriptedSourceTest, QueryAnswersFromFrame) {
  ScriptFrame frame{};
  frame.device(gpu("A", 42)).fail("B", "ECC error");
  ScriptedSource src("s", {frame});
  (void)src.inventory();

  const auto A = src.query("A");
  ASSERT_TRUE(A.ok());
  EXPECT_DOUBLE_EQ(*std::get<RawDeviceReading>(*A.reading).gpuUtilPct, 42.0);

  const auto B = src.query("B");
  EXPECT_FALSE(B.ok());
  EXPECT_EQ(B.error, "ECC error");

  EXPECT_FALSE(src.query("C").ok());
}

/** @test Frames advance per inventory and the last one repeats. */
TEST(ScriptedSourceTest, LastFrameRepeats) {
  ScriptFrame up{};
  up.device(gpu("A", 1));
  ScriptedSource src("s", {ScriptFrame::down("driver reload"), up});

  EXPECT_FALSE(src.inventory().ok());
  EXPECT_TRUE(src.inventory().ok());
  EXPECT_TRUE(src.inventory().ok());
  EXPECT_EQ(src.pollCount(), 3U);
}

/** @test Looping scripts wrap around. */
TEST(ScriptedSourceTest, LoopWraps) {
  ScriptFrame up{};
  up.device(gpu("A", 1));
  ScriptedSource src("s", {ScriptFrame::down("x"), up}, true);

  EXPECT_FALSE(src.inventory().ok());
  EXPECT_TRUE(src.inventory().ok());
  EXPECT_FALSE(src.inventory().ok());
}

/** @test Simulated frames carry every GPU metric plus host values in range. */
TEST(ScriptedSourceTest, SimulatedFramesWellFormed) {
  const auto FRAMES = simulatedFrames(3, 20);
  ASSERT_EQ(FRAMES.size(), 20U);
  for (const auto& FRAME : FRAMES) {
    ASSERT_EQ(FRAME.responses.size(), 4U);
    for (std::size_t d = 0; d < 3; ++d) {
      const auto& READING = std::get<RawDeviceReading>(*FRAME.responses[d].outcome.reading);
      EXPECT_EQ(READING.ratedMaxPowerW, 300.0);
      ASSERT_TRUE(READING.gpuUtilPct.has_value());
      EXPECT_GE(*READING.gpuUtilPct, 0.0);
      EXPECT_LE(*READING.gpuUtilPct, 100.0);
      ASSERT_TRUE(READING.powerDrawW.has_value());
      EXPECT_LE(*READING.powerDrawW, 300.0);
    }
    EXPECT_EQ(FRAME.responses[3].target, HOST_TARGET);
  }
}
