/**
 * @file Sampler_uTest.cpp
 * @brief Unit tests for gpumon::sampler::Sampler.
 *
 * Notes:
 *  - Sources are scripted so every cycle is deterministic.
 *  - Loop tests use short intervals and wait with generous deadlines.
 */

#include "src/sampler/inc/Sampler.hpp"

#include <gtest/gtest.h>

#include <sys/stat.h> // chmod

#include <atomic>
#include <chrono>
#include <cstdlib> // mkdtemp
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using gpumon::model::MetricType;
using gpumon::model::SeriesKey;
using gpumon::sampler::Phase;
using gpumon::sampler::Sampler;
using gpumon::sampler::SamplerOptions;
using gpumon::source::makeSource;
using gpumon::source::QueryErrorKind;
using gpumon::source::RawDeviceReading;
using gpumon::source::RawHostReading;
using gpumon::source::ScriptedSource;
using gpumon::source::ScriptFrame;
using gpumon::source::SmiGpuSource;
using gpumon::source::SourceList;

namespace {

using namespace std::chrono_literals;

RawDeviceReading gpu(const std::string& id, double util = 50.0) {
  RawDeviceReading reading{};
  reading.id = id;
  reading.name = "GPU " + id;
  reading.ratedMaxPowerW = 300.0;
  reading.gpuUtilPct = util;
  reading.powerDrawW = 150.0;
  reading.temperatureC = 55.0;
  return reading;
}

ScriptFrame devices(const std::vector<std::string>& ids) {
  ScriptFrame frame{};
  for (const auto& ID : ids) {
    frame.device(gpu(ID));
  }
  return frame;
}

SourceList scripted(std::vector<ScriptFrame> frames, bool loop = false) {
  SourceList sources;
  sources.push_back(makeSource<ScriptedSource>("script", std::move(frames), loop));
  return sources;
}

SamplerOptions fastOptions() {
  SamplerOptions options{};
  options.interval = 20ms;
  options.fanout.timeout = 200ms;
  return options;
}

/// Poll @p pred until it holds or @p limit elapses.
template <typename Pred> bool waitFor(Pred pred, std::chrono::milliseconds limit = 3000ms) {
  const auto DEADLINE = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < DEADLINE) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(2ms);
  }
  return pred();
}

} // namespace

/* ----------------------------- Single Cycle ----------------------------- */

/** @test Before any cycle the service returns the empty snapshot. */
TEST(SamplerTest, EmptyBeforeFirstCycle) {
  Sampler sampler(scripted({devices({"A"})}), fastOptions());
  EXPECT_EQ(sampler.service().currentSnapshot()->cycleId, 0U);
  EXPECT_EQ(sampler.phase(), Phase::Idle);
  EXPECT_EQ(sampler.cycleCount(), 0U);
}

/** @test One cycle publishes records for every device, all stamped with that cycle. */
TEST(SamplerTest, RunCyclePublishes) {
  ScriptFrame frame = devices({"A", "B"});
  RawHostReading host{};
  host.cpuUtilPct = 12.0;
  host.ramUtilPct = 34.0;
  frame.host(host);
  Sampler sampler(scripted({frame}), fastOptions());

  const auto SNAP = sampler.runCycle();
  ASSERT_NE(SNAP, nullptr);
  EXPECT_EQ(SNAP->cycleId, 1U);
  EXPECT_FALSE(SNAP->degraded);
  EXPECT_EQ(SNAP->devices.size(), 2U);
  // 2 devices x 4 metrics + 2 host metrics.
  EXPECT_EQ(SNAP->latest.size(), 10U);
  for (const auto& [KEY, RECORD] : SNAP->latest) {
    EXPECT_EQ(RECORD.cycleId(), 1U) << KEY.toString();
    EXPECT_EQ(RECORD.timestampNs(), SNAP->timestampNs);
  }
  EXPECT_DOUBLE_EQ(SNAP->find(SeriesKey::device("A", MetricType::PowerPct))->value(), 50.0);
  EXPECT_DOUBLE_EQ(SNAP->find(SeriesKey::host(MetricType::RamUtil))->value(), 34.0);
  EXPECT_EQ(sampler.service().currentSnapshot(), SNAP);
  EXPECT_EQ(sampler.phase(), Phase::Idle);
}

/** @test Cycle timestamps are monotonic. */
TEST(SamplerTest, TimestampsMonotonic) {
  Sampler sampler(scripted({devices({"A"})}), fastOptions());
  const auto FIRST = sampler.runCycle();
  const auto SECOND = sampler.runCycle();
  EXPECT_GT(SECOND->cycleId, FIRST->cycleId);
  EXPECT_GE(SECOND->timestampNs, FIRST->timestampNs);
}

/** @test Absolute power and memory readouts are published for devices queried this cycle. */
TEST(SamplerTest, DeviceReadouts) {
  RawDeviceReading a = gpu("A");
  a.memUsedMiB = 1024.0;
  a.memTotalMiB = 8192.0;
  RawDeviceReading b = gpu("B");
  b.powerDrawW = -3.0;
  ScriptFrame frame{};
  frame.device(a).device(b).fail("C", "GPU is lost");
  Sampler sampler(scripted({frame}), fastOptions());

  const auto SNAP = sampler.runCycle();
  const auto* READ_A = SNAP->readout("A");
  ASSERT_NE(READ_A, nullptr);
  EXPECT_DOUBLE_EQ(*READ_A->powerDrawW, 150.0);
  EXPECT_DOUBLE_EQ(*READ_A->memUsedMiB, 1024.0);
  EXPECT_DOUBLE_EQ(*READ_A->memTotalMiB, 8192.0);

  // Negative draw is not shown; with no memory values nothing remains.
  EXPECT_EQ(SNAP->readout("B"), nullptr);
  EXPECT_EQ(SNAP->readout("C"), nullptr);
  EXPECT_EQ(SNAP->readouts.size(), 1U);
}

/* ----------------------------- Failure Isolation ----------------------------- */

/** @test With B failing, A and C get fresh records and B's history is unchanged. */
TEST(SamplerTest, PartialFailureIsolation) {
  ScriptFrame second{};
  second.device(gpu("A", 61.0)).fail("B", "GPU has fallen off the bus").device(gpu("C", 63.0));
  Sampler sampler(scripted({devices({"A", "B", "C"}), second}), fastOptions());

  (void)sampler.runCycle();
  const auto B_KEY = SeriesKey::device("B", MetricType::GpuUtil);
  const auto BEFORE = sampler.service().history(B_KEY);
  ASSERT_EQ(BEFORE.size(), 1U);

  const auto SNAP = sampler.runCycle();
  EXPECT_NE(SNAP->find(SeriesKey::device("A", MetricType::GpuUtil)), nullptr);
  EXPECT_NE(SNAP->find(SeriesKey::device("C", MetricType::GpuUtil)), nullptr);
  EXPECT_EQ(SNAP->find(B_KEY), nullptr);
  EXPECT_EQ(sampler.service().history(B_KEY), BEFORE);
  EXPECT_EQ(SNAP->history.at(B_KEY), BEFORE);

  ASSERT_EQ(SNAP->diagnostics.deviceErrors.size(), 1U);
  EXPECT_EQ(SNAP->diagnostics.deviceErrors[0].deviceId, "B");
  EXPECT_EQ(SNAP->diagnostics.errorsByDevice.at("B"), 1U);
  EXPECT_FALSE(SNAP->degraded);
  EXPECT_EQ(SNAP->devices.size(), 3U);
}

/** @test Unavailable for cycles 1-3, back on 4: degraded clears and appends resume. */
TEST(SamplerTest, SourceRecovery) {
  std::vector<ScriptFrame> frames{ScriptFrame::down("nvidia-smi not found"),
                                  ScriptFrame::down("nvidia-smi not found"),
                                  ScriptFrame::down("nvidia-smi not found"), devices({"A"})};
  Sampler sampler(scripted(std::move(frames)), fastOptions());

  for (std::uint64_t c = 1; c <= 3; ++c) {
    const auto SNAP = sampler.runCycle();
    EXPECT_EQ(SNAP->cycleId, c);
    EXPECT_TRUE(SNAP->degraded);
    EXPECT_TRUE(SNAP->latest.empty());
    ASSERT_EQ(SNAP->diagnostics.unavailable.size(), 1U);
    EXPECT_EQ(SNAP->diagnostics.unavailable[0].reason, "nvidia-smi not found");
  }

  const auto RECOVERED = sampler.runCycle();
  EXPECT_EQ(RECOVERED->cycleId, 4U);
  EXPECT_FALSE(RECOVERED->degraded);
  EXPECT_NE(RECOVERED->find(SeriesKey::device("A", MetricType::TempC)), nullptr);
  EXPECT_EQ(RECOVERED->diagnostics.totals.degradedCycles, 3U);
  EXPECT_EQ(RECOVERED->diagnostics.totals.cycles, 4U);
}

/** @test A slow device times out alone, within bounded cycle latency, then reports pending. */
TEST(SamplerTest, TimeoutIsolation) {
  ScriptFrame frame = devices({"A"});
  frame.device(gpu("SLOW"), 500ms);
  SamplerOptions options = fastOptions();
  options.fanout.timeout = 50ms;
  Sampler sampler(scripted({frame}), options);

  const auto START = std::chrono::steady_clock::now();
  const auto FIRST = sampler.runCycle();
  EXPECT_LT(std::chrono::steady_clock::now() - START, 400ms);

  EXPECT_NE(FIRST->find(SeriesKey::device("A", MetricType::GpuUtil)), nullptr);
  EXPECT_EQ(FIRST->find(SeriesKey::device("SLOW", MetricType::GpuUtil)), nullptr);
  ASSERT_EQ(FIRST->diagnostics.deviceErrors.size(), 1U);
  EXPECT_EQ(FIRST->diagnostics.deviceErrors[0].kind, QueryErrorKind::Timeout);
  EXPECT_EQ(FIRST->diagnostics.pendingQueries, 1U);

  const auto SECOND = sampler.runCycle();
  ASSERT_EQ(SECOND->diagnostics.deviceErrors.size(), 1U);
  EXPECT_EQ(SECOND->diagnostics.deviceErrors[0].kind, QueryErrorKind::Pending);
  EXPECT_EQ(SECOND->diagnostics.totals.timeouts, 1U);
}

/* ----------------------------- Device Set ----------------------------- */

/** @test A device missing K polls is retired; earlier snapshots keep it. */
TEST(SamplerTest, DeviceRetirement) {
  SamplerOptions options = fastOptions();
  options.history.retireAfter = 3;
  Sampler sampler(scripted({devices({"A", "B"}), devices({"A"})}), options);

  const auto FIRST = sampler.runCycle();
  ASSERT_EQ(FIRST->devices.size(), 2U);

  (void)sampler.runCycle();
  (void)sampler.runCycle();
  EXPECT_EQ(sampler.service().currentSnapshot()->devices.size(), 2U);

  const auto RETIRED = sampler.runCycle();
  ASSERT_EQ(RETIRED->devices.size(), 1U);
  EXPECT_EQ(RETIRED->devices[0].id, "A");
  EXPECT_EQ(RETIRED->history.count(SeriesKey::device("B", MetricType::GpuUtil)), 0U);
  EXPECT_EQ(FIRST->devices.size(), 2U);
  EXPECT_EQ(sampler.service().history(SeriesKey::device("B", MetricType::GpuUtil)).size(), 1U);
}

/** @test History windows are bounded to the configured capacity. */
TEST(SamplerTest, HistoryBounded) {
  SamplerOptions options = fastOptions();
  options.history.capacity = 4;
  Sampler sampler(scripted({devices({"A"})}), options);
  for (int i = 0; i < 10; ++i) {
    (void)sampler.runCycle();
  }
  const auto WINDOW = sampler.service().history(SeriesKey::device("A", MetricType::TempC));
  ASSERT_EQ(WINDOW.size(), 4U);
  EXPECT_EQ(WINDOW.front().cycleId(), 7U);
  EXPECT_EQ(WINDOW.back().cycleId(), 10U);
}

/** @test Snapshots omit history when disabled. */
TEST(SamplerTest, HistoryOptional) {
  SamplerOptions options = fastOptions();
  options.includeHistory = false;
  Sampler sampler(scripted({devices({"A"})}), options);
  const auto SNAP = sampler.runCycle();
  EXPECT_TRUE(SNAP->history.empty());
  EXPECT_FALSE(SNAP->latest.empty());
}

/* ----------------------------- Phases ----------------------------- */

/** @test The polling phase is observable during a slow cycle. */
TEST(SamplerTest, PhaseObservable) {
  ScriptFrame frame{};
  frame.device(gpu("A"), 150ms);
  SamplerOptions options = fastOptions();
  options.fanout.timeout = 1000ms;
  Sampler sampler(scripted({frame}), options);

  std::thread cycle([&sampler] { (void)sampler.runCycle(); });
  EXPECT_TRUE(waitFor([&sampler] { return sampler.phase() == Phase::Polling; }));
  cycle.join();
  EXPECT_EQ(sampler.phase(), Phase::Idle);
  EXPECT_STREQ(toString(Phase::Normalizing), "normalizing");
}

/* ----------------------------- Background Loop ----------------------------- */

/** @test start() runs cycles; stop() returns after the in-flight cycle is published. */
TEST(SamplerTest, StartStop) {
  Sampler sampler(scripted({devices({"A"})}), fastOptions());
  ASSERT_TRUE(sampler.start());
  EXPECT_TRUE(sampler.running());
  EXPECT_TRUE(waitFor([&sampler] { return sampler.cycleCount() >= 3; }));

  sampler.stop();
  EXPECT_FALSE(sampler.running());
  const std::uint64_t AFTER_STOP = sampler.cycleCount();
  EXPECT_EQ(sampler.service().currentSnapshot()->cycleId, AFTER_STOP);
  EXPECT_EQ(sampler.phase(), Phase::Idle);

  std::this_thread::sleep_for(60ms);
  EXPECT_EQ(sampler.cycleCount(), AFTER_STOP);
  sampler.stop();
}

/** @test stop() interrupts a long interval wait. */
TEST(SamplerTest, StopWakesIntervalWait) {
  SamplerOptions options = fastOptions();
  options.interval = 10000ms;
  Sampler sampler(scripted({devices({"A"})}), options);
  ASSERT_TRUE(sampler.start());
  ASSERT_TRUE(waitFor([&sampler] { return sampler.cycleCount() >= 1; }));

  const auto START = std::chrono::steady_clock::now();
  sampler.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - START, 1000ms);
}

/** @test Readers never see a snapshot that mixes cycles while the loop runs. */
TEST(SamplerTest, CycleAtomicityUnderLoad) {
  SamplerOptions options = fastOptions();
  options.interval = 1ms;
  Sampler sampler(scripted(gpumon::source::simulatedFrames(4, 16), true), options);
  std::atomic<bool> done{false};
  std::atomic<int> mixed{0};

  std::vector<std::thread> readers;
  for (int r = 0; r < 3; ++r) {
    readers.emplace_back([&] {
      while (!done.load()) {
        const auto SNAP = sampler.service().currentSnapshot();
        for (const auto& [KEY, RECORD] : SNAP->latest) {
          if (RECORD.cycleId() != SNAP->cycleId) {
            ++mixed;
          }
        }
        for (const auto& [KEY, WINDOW] : SNAP->history) {
          if (!WINDOW.empty() && WINDOW.back().cycleId() > SNAP->cycleId) {
            ++mixed;
          }
        }
      }
    });
  }

  ASSERT_TRUE(sampler.start());
  EXPECT_TRUE(waitFor([&sampler] { return sampler.cycleCount() >= 50; }));
  sampler.stop();
  done.store(true);
  for (auto& t : readers) {
    t.join();
  }
  EXPECT_EQ(mixed.load(), 0);
}

/* ----------------------------- Hung Backend ----------------------------- */

/** @test A hung inventory completes the cycle degraded within the timeout, and stop() returns. */
TEST(SamplerTest, HungInventoryBounded) {
  char tmpl[] = "/tmp/gpumon-sampler-XXXXXX";
  ASSERT_NE(::mkdtemp(tmpl), nullptr);
  const std::string TOOL = std::string(tmpl) + "/nvidia-smi";
  {
    std::ofstream out(TOOL);
    out << "#!/bin/sh\nsleep 3\n";
  }
  ::chmod(TOOL.c_str(), 0755);

  {
    SamplerOptions options = fastOptions();
    options.fanout.timeout = 100ms;
    SourceList sources;
    sources.push_back(makeSource<SmiGpuSource>(TOOL, 400ms));
    Sampler sampler(std::move(sources), options);

    const auto START = std::chrono::steady_clock::now();
    const auto FIRST = sampler.runCycle();
    EXPECT_LT(std::chrono::steady_clock::now() - START, 1000ms);
    EXPECT_EQ(FIRST->cycleId, 1U);
    EXPECT_TRUE(FIRST->degraded);
    ASSERT_EQ(FIRST->diagnostics.unavailable.size(), 1U);
    EXPECT_NE(FIRST->diagnostics.unavailable[0].reason.find("timed out"), std::string::npos);

    const auto SECOND = sampler.runCycle();
    EXPECT_TRUE(SECOND->degraded);
    EXPECT_EQ(sampler.service().currentSnapshot(), SECOND);

    ASSERT_TRUE(sampler.start());
    const auto STOP_START = std::chrono::steady_clock::now();
    sampler.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - STOP_START, 2000ms);
  }

  std::error_code ec;
  std::filesystem::remove_all(tmpl, ec);
}

/* ----------------------------- Bounded Bookkeeping ----------------------------- */

/** @test Per-device error counts are forgotten once a churned device is dropped. */
TEST(SamplerTest, ErrorBookkeepingBoundedUnderChurn) {
  constexpr int CYCLES = 200;
  std::vector<ScriptFrame> frames;
  frames.reserve(CYCLES);
  for (int i = 0; i < CYCLES; ++i) {
    ScriptFrame frame{};
    frame.fail("GPU-" + std::to_string(i), "GPU is lost");
    frames.push_back(std::move(frame));
  }

  SamplerOptions options = fastOptions();
  options.history.retireAfter = 1;
  options.history.maxRetiredDevices = 2;
  Sampler sampler(scripted(std::move(frames)), options);

  std::shared_ptr<const gpumon::query::Snapshot> last;
  for (int i = 0; i < CYCLES; ++i) {
    last = sampler.runCycle();
  }

  // One active device plus at most maxRetiredDevices retired ones.
  EXPECT_LE(sampler.history().deviceStates().size(), 3U);
  EXPECT_LE(last->diagnostics.errorsByDevice.size(), 3U);
  EXPECT_EQ(last->diagnostics.errorsByDevice.count("GPU-0"), 0U);
  EXPECT_EQ(last->diagnostics.errorsByDevice.at("GPU-" + std::to_string(CYCLES - 1)), 1U);
  EXPECT_EQ(last->diagnostics.totals.deviceErrors, static_cast<std::uint64_t>(CYCLES));
}
