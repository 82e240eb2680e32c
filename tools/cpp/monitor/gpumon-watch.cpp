/**
 * @file gpumon-watch.cpp
 * @brief Live GPU and host telemetry watcher.
 *
 * Runs the sampler in the background and prints the current snapshot once
 * per interval: one row per GPU (power, temperature, utilization) plus host
 * CPU and RAM, followed by any degraded-source or device error diagnostics.
 */

#include "src/config/inc/MonitorConfig.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/sampler/inc/Sampler.hpp"

#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <fmt/core.h>

namespace config = gpumon::config;
namespace model = gpumon::model;
namespace query = gpumon::query;
namespace sampler = gpumon::sampler;

using gpumon::helpers::format::celsius;
using gpumon::helpers::format::durationMs;
using gpumon::helpers::format::jsonEscape;
using gpumon::helpers::format::percent;
using gpumon::helpers::format::timeOfDay;

namespace {

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_JSON = 1,
  ARG_SIMULATE = 2,
  ARG_INTERVAL = 3,
  ARG_CYCLES = 4,
  ARG_BACKEND = 5,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Sample GPU and host telemetry every interval and print the latest snapshot.\n"
    "Settings also come from GPUMON_* environment variables; flags win.";

volatile std::sig_atomic_t gStop = 0;

extern "C" void onSignal(int /*signum*/) { gStop = 1; }

/// Build argument definitions.
gpumon::helpers::args::ArgMap buildArgMap() {
  gpumon::helpers::args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, "Show this help message"};
  map[ARG_JSON] = {"--json", 0, "Print one JSON object per cycle"};
  map[ARG_SIMULATE] = {"--simulate", 0, "Use simulated GPUs instead of hardware"};
  map[ARG_INTERVAL] = {"--interval", 1, "Poll interval in milliseconds (default: 1000)", "ms"};
  map[ARG_CYCLES] = {"--cycles", 1, "Exit after this many cycles (default: run until Ctrl-C)",
                     "n"};
  map[ARG_BACKEND] = {"--backend", 1, "GPU backend: auto, nvml, smi, none (default: auto)",
                      "kind"};
  return map;
}

/* ----------------------------- Human Output ----------------------------- */

/// Colored status tag for a record, or padding when absent.
std::string statusTag(const model::MetricRecord* record) {
  if (record == nullptr) {
    return "";
  }
  switch (record->status()) {
  case model::Status::Hot:
    return " \033[31m[HOT]\033[0m";
  case model::Status::Warm:
    return " \033[33m[WARM]\033[0m";
  case model::Status::Normal:
    break;
  }
  return "";
}

std::string cell(const model::MetricRecord* record, bool isTemp = false) {
  if (record == nullptr) {
    return "--";
  }
  return isTemp ? celsius(record->value()) : percent(record->value());
}

/// " (150.0 W)" when the draw was reported.
std::string wattsSuffix(const query::DeviceReadout* readout) {
  if (readout == nullptr || !readout->powerDrawW) {
    return "";
  }
  return fmt::format(" ({:.1f} W)", *readout->powerDrawW);
}

/// " (1024 / 8192 MiB)" when both memory values were reported.
std::string memorySuffix(const query::DeviceReadout* readout) {
  if (readout == nullptr || !readout->memUsedMiB || !readout->memTotalMiB) {
    return "";
  }
  return fmt::format(" ({:.0f} / {:.0f} MiB)", *readout->memUsedMiB, *readout->memTotalMiB);
}

void printHuman(const query::Snapshot& snap) {
  fmt::print("=== cycle {} at {} ({}){} ===\n", snap.cycleId, timeOfDay(snap.wallTimeNs),
             durationMs(snap.diagnostics.cycleDurationNs),
             snap.degraded ? " \033[33m(degraded)\033[0m" : "");

  if (snap.devices.empty()) {
    fmt::print("  No GPUs detected.\n");
  }
  for (const auto& DEV : snap.devices) {
    const auto* power = snap.find(model::SeriesKey::device(DEV.id, model::MetricType::PowerPct));
    const auto* temp = snap.find(model::SeriesKey::device(DEV.id, model::MetricType::TempC));
    const auto* util = snap.find(model::SeriesKey::device(DEV.id, model::MetricType::GpuUtil));
    const auto* mem = snap.find(model::SeriesKey::device(DEV.id, model::MetricType::MemUtil));
    const query::DeviceReadout* readout = snap.readout(DEV.id);

    fmt::print("  {} ({})\n", DEV.name, DEV.id);
    fmt::print("    Power:   {}{}{}\n", cell(power), wattsSuffix(readout), statusTag(power));
    fmt::print("    Temp:    {}{}\n", cell(temp, true), statusTag(temp));
    fmt::print("    GPU:     {}{}\n", cell(util), statusTag(util));
    fmt::print("    Memory:  {}{}{}\n", cell(mem), memorySuffix(readout), statusTag(mem));
  }

  const auto* cpu = snap.find(model::SeriesKey::host(model::MetricType::CpuUtil));
  const auto* ram = snap.find(model::SeriesKey::host(model::MetricType::RamUtil));
  if (cpu != nullptr || ram != nullptr) {
    fmt::print("  Host\n");
    fmt::print("    CPU:     {}{}\n", cell(cpu), statusTag(cpu));
    fmt::print("    RAM:     {}{}\n", cell(ram), statusTag(ram));
  }

  const query::Diagnostics& DIAG = snap.diagnostics;
  for (const auto& SRC : DIAG.unavailable) {
    fmt::print("  \033[33munavailable\033[0m {}: {}\n", SRC.source, SRC.reason);
  }
  for (const auto& ERR : DIAG.deviceErrors) {
    fmt::print("  \033[31merror\033[0m {}\n", ERR.toString());
  }
  fmt::print("\n");
}

/* ----------------------------- JSON Output ----------------------------- */

void printJson(const query::Snapshot& snap) {
  fmt::print("{{\"cycle\": {}, \"timestampNs\": {}, \"wallTimeNs\": {}, \"degraded\": {}, ",
             snap.cycleId, snap.timestampNs, snap.wallTimeNs, snap.degraded);

  fmt::print("\"devices\": [");
  for (std::size_t i = 0; i < snap.devices.size(); ++i) {
    const auto& DEV = snap.devices[i];
    fmt::print("{}{{\"id\": \"{}\", \"name\": \"{}\", \"source\": \"{}\"", i > 0 ? ", " : "",
               jsonEscape(DEV.id), jsonEscape(DEV.name), jsonEscape(DEV.source));
    if (DEV.ratedMaxPowerW) {
      fmt::print(", \"ratedMaxPowerW\": {}", *DEV.ratedMaxPowerW);
    }
    if (const query::DeviceReadout* readout = snap.readout(DEV.id)) {
      if (readout->powerDrawW) {
        fmt::print(", \"powerDrawW\": {:.3f}", *readout->powerDrawW);
      }
      if (readout->memUsedMiB) {
        fmt::print(", \"memUsedMiB\": {:.1f}", *readout->memUsedMiB);
      }
      if (readout->memTotalMiB) {
        fmt::print(", \"memTotalMiB\": {:.1f}", *readout->memTotalMiB);
      }
    }
    fmt::print("}}");
  }

  fmt::print("], \"latest\": [");
  bool first = true;
  for (const auto& [KEY, RECORD] : snap.latest) {
    fmt::print("{}{{\"series\": \"{}\", \"value\": {:.3f}, \"status\": \"{}\"}}",
               first ? "" : ", ", jsonEscape(KEY.toString()), RECORD.value(),
               model::toString(RECORD.status()));
    first = false;
  }

  fmt::print("], \"errors\": [");
  for (std::size_t i = 0; i < snap.diagnostics.deviceErrors.size(); ++i) {
    const auto& ERR = snap.diagnostics.deviceErrors[i];
    fmt::print("{}{{\"device\": \"{}\", \"kind\": \"{}\", \"message\": \"{}\"}}",
               i > 0 ? ", " : "", jsonEscape(ERR.deviceId), gpumon::source::toString(ERR.kind),
               jsonEscape(ERR.message));
  }

  fmt::print("], \"unavailable\": [");
  for (std::size_t i = 0; i < snap.diagnostics.unavailable.size(); ++i) {
    const auto& SRC = snap.diagnostics.unavailable[i];
    fmt::print("{}{{\"source\": \"{}\", \"reason\": \"{}\"}}", i > 0 ? ", " : "",
               jsonEscape(SRC.source), jsonEscape(SRC.reason));
  }
  fmt::print("]}}\n");
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const gpumon::helpers::args::ArgMap ARG_MAP = buildArgMap();
  gpumon::helpers::args::ParsedArgs pargs;

  std::vector<std::string_view> args;
  args.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  std::string error;
  if (!gpumon::helpers::args::parseArgs(args, ARG_MAP, pargs, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    gpumon::helpers::args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 1;
  }
  if (gpumon::helpers::args::has(pargs, ARG_HELP)) {
    gpumon::helpers::args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 0;
  }

  config::MonitorConfig cfg{};
  if (!config::loadFromEnv(cfg, error)) {
    fmt::print(stderr, "Error: {}\n", error);
    return 1;
  }

  const bool JSON_OUTPUT = gpumon::helpers::args::has(pargs, ARG_JSON);
  cfg.simulate = gpumon::helpers::args::has(pargs, ARG_SIMULATE);

  if (gpumon::helpers::args::has(pargs, ARG_INTERVAL)) {
    const auto INTERVAL = gpumon::helpers::args::unsignedValue(pargs, ARG_INTERVAL);
    if (!INTERVAL) {
      fmt::print(stderr, "Error: --interval expects a whole number of milliseconds\n");
      return 1;
    }
    cfg.interval = std::chrono::milliseconds(static_cast<std::int64_t>(*INTERVAL));
    // Keep the query deadline inside a shortened interval.
    if (cfg.queryTimeout >= cfg.interval) {
      cfg.queryTimeout = cfg.interval * 3 / 4;
    }
  }

  std::uint64_t maxCycles = 0;
  if (gpumon::helpers::args::has(pargs, ARG_CYCLES)) {
    const auto CYCLES = gpumon::helpers::args::unsignedValue(pargs, ARG_CYCLES);
    if (!CYCLES || *CYCLES == 0) {
      fmt::print(stderr, "Error: --cycles expects a positive integer\n");
      return 1;
    }
    maxCycles = *CYCLES;
  }

  if (const auto BACKEND = gpumon::helpers::args::value(pargs, ARG_BACKEND)) {
    const auto PARSED = config::parseGpuBackend(*BACKEND);
    if (!PARSED) {
      fmt::print(stderr, "Error: unknown backend '{}'\n", *BACKEND);
      return 1;
    }
    cfg.gpuBackend = *PARSED;
  }

  if (!cfg.validate(error)) {
    fmt::print(stderr, "Error: {}\n", error);
    return 1;
  }
  if (!gpumon::helpers::log::setLevel(cfg.logLevel)) {
    fmt::print(stderr, "Warning: unknown log level '{}', keeping info\n", cfg.logLevel);
  }

  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);

  sampler::Sampler sampler(config::makeSources(cfg), cfg.samplerOptions());
  if (!sampler.start()) {
    fmt::print(stderr, "Error: cannot start sampler\n");
    return 1;
  }

  std::uint64_t lastPrinted = 0;
  while (gStop == 0) {
    const auto SNAP = sampler.service().currentSnapshot();
    if (SNAP->cycleId != lastPrinted && !SNAP->empty()) {
      lastPrinted = SNAP->cycleId;
      if (JSON_OUTPUT) {
        printJson(*SNAP);
      } else {
        printHuman(*SNAP);
      }
      std::fflush(stdout);
      if (maxCycles != 0 && lastPrinted >= maxCycles) {
        break;
      }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }

  sampler.stop();
  return 0;
}
