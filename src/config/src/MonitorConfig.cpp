/**
 * @file MonitorConfig.cpp
 * @brief Environment parsing, validation and source construction.
 */

#include "src/config/inc/MonitorConfig.hpp"

#include <cerrno>  // errno
#include <cstdlib> // std::getenv, std::strtoull
#include <memory>  // std::unique_ptr
#include <utility> // std::move

#include <fmt/core.h>

#include "src/helpers/inc/Log.hpp"
#include "src/helpers/inc/Strings.hpp"

namespace gpumon {

namespace config {

using helpers::log::logger;

namespace {

constexpr std::size_t SIMULATED_FRAME_COUNT = 240;

/// Parse a positive decimal integer; nullopt on junk, overflow or sign.
std::optional<std::uint64_t> parseUnsigned(std::string_view text) {
  const std::string FIELD(helpers::strings::trim(text));
  if (FIELD.empty() || FIELD[0] == '-' || FIELD[0] == '+') {
    return std::nullopt;
  }
  errno = 0;
  char* end = nullptr;
  const unsigned long long VALUE = std::strtoull(FIELD.c_str(), &end, 10);
  if (errno != 0 || end == FIELD.c_str() || *end != '\0') {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(VALUE);
}

/// Non-empty environment value, or null.
const char* envValue(const char* name) {
  const char* value = std::getenv(name);
  return (value != nullptr && *value != '\0') ? value : nullptr;
}

bool envUnsigned(const char* name, std::uint64_t& out, std::string& error) {
  const char* value = envValue(name);
  if (value == nullptr) {
    return true;
  }
  const std::optional<std::uint64_t> PARSED = parseUnsigned(value);
  if (!PARSED) {
    error = fmt::format("{}: '{}' is not a non-negative integer", name, value);
    return false;
  }
  out = *PARSED;
  return true;
}

bool envMillis(const char* name, std::chrono::milliseconds& out, std::string& error) {
  std::uint64_t value = static_cast<std::uint64_t>(out.count());
  if (!envUnsigned(name, value, error)) {
    return false;
  }
  out = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(value));
  return true;
}

bool envSize(const char* name, std::size_t& out, std::string& error) {
  std::uint64_t value = out;
  if (!envUnsigned(name, value, error)) {
    return false;
  }
  out = static_cast<std::size_t>(value);
  return true;
}

} // namespace

/* ----------------------------- GpuBackend ----------------------------- */

const char* toString(GpuBackend backend) noexcept {
  switch (backend) {
  case GpuBackend::Auto:
    return "auto";
  case GpuBackend::Nvml:
    return "nvml";
  case GpuBackend::Smi:
    return "smi";
  case GpuBackend::None:
    return "none";
  }
  return "unknown";
}

std::optional<GpuBackend> parseGpuBackend(std::string_view name) noexcept {
  const std::string LOWER = helpers::strings::toLower(helpers::strings::trim(name));
  if (LOWER == "auto") {
    return GpuBackend::Auto;
  }
  if (LOWER == "nvml") {
    return GpuBackend::Nvml;
  }
  if (LOWER == "smi" || LOWER == "nvidia-smi") {
    return GpuBackend::Smi;
  }
  if (LOWER == "none") {
    return GpuBackend::None;
  }
  return std::nullopt;
}

/* ----------------------------- MonitorConfig ----------------------------- */

bool MonitorConfig::validate(std::string& error) const {
  if (interval.count() <= 0) {
    error = "interval must be positive";
    return false;
  }
  if (queryTimeout.count() <= 0) {
    error = "query timeout must be positive";
    return false;
  }
  if (queryTimeout >= interval) {
    error = fmt::format("query timeout ({} ms) must be shorter than the interval ({} ms)",
                        queryTimeout.count(), interval.count());
    return false;
  }
  if (maxParallel == 0) {
    error = "max parallel queries must be at least 1";
    return false;
  }
  if (historyCapacity == 0) {
    error = "history capacity must be at least 1";
    return false;
  }
  if (retireAfter == 0) {
    error = "retire-after must be at least 1";
    return false;
  }
  if (!(validity.minTempC < validity.maxTempC)) {
    error = fmt::format("temperature bounds [{}, {}] are empty", validity.minTempC,
                        validity.maxTempC);
    return false;
  }
  for (const model::MetricType TYPE : model::ALL_METRIC_TYPES) {
    std::string why;
    if (!thresholds.forType(TYPE).isValid(&why)) {
      error = fmt::format("{} thresholds: {}", model::toString(TYPE), why);
      return false;
    }
  }
  if (gpuBackend == GpuBackend::Smi && nvidiaSmiPath.empty()) {
    error = "nvidia-smi path is empty";
    return false;
  }
  if (simulate && simulatedDevices == 0) {
    error = "simulate mode needs at least one device";
    return false;
  }
  return true;
}

sampler::SamplerOptions MonitorConfig::samplerOptions() const {
  sampler::SamplerOptions options{};
  options.interval = interval;
  options.fanout.timeout = queryTimeout;
  options.fanout.maxParallel = maxParallel;
  options.history.capacity = historyCapacity;
  options.history.retireAfter = retireAfter;
  options.history.maxRetiredDevices = maxRetiredDevices;
  options.normalizer.thresholds = thresholds;
  options.normalizer.validity = validity;
  options.includeHistory = includeHistory;
  return options;
}

std::string MonitorConfig::toString() const {
  std::string out;
  out += fmt::format("interval:        {} ms\n", interval.count());
  out += fmt::format("query timeout:   {} ms\n", queryTimeout.count());
  out += fmt::format("max parallel:    {}\n", maxParallel);
  out += fmt::format("history:         {} records/series\n", historyCapacity);
  out += fmt::format("retire after:    {} polls (keep {} retired)\n", retireAfter,
                     maxRetiredDevices);
  out += fmt::format("gpu backend:     {}{}\n", config::toString(gpuBackend),
                     simulate ? " (simulated)" : "");
  out += fmt::format("nvidia-smi:      {}\n", nvidiaSmiPath);
  out += fmt::format("proc root:       {}\n", procRoot.empty() ? "/" : procRoot);
  out += fmt::format("host metrics:    {}\n", hostMetrics ? "on" : "off");
  for (const model::MetricType TYPE : model::ALL_METRIC_TYPES) {
    out += fmt::format("  {:<9} {}\n", model::toString(TYPE), thresholds.forType(TYPE).toString());
  }
  return out;
}

/* ----------------------------- Loading ----------------------------- */

bool loadFromEnv(MonitorConfig& config, std::string& error) {
  if (!envMillis("GPUMON_INTERVAL_MS", config.interval, error) ||
      !envMillis("GPUMON_QUERY_TIMEOUT_MS", config.queryTimeout, error) ||
      !envSize("GPUMON_MAX_PARALLEL", config.maxParallel, error) ||
      !envSize("GPUMON_HISTORY", config.historyCapacity, error) ||
      !envSize("GPUMON_RETIRE_AFTER", config.retireAfter, error)) {
    return false;
  }

  if (const char* backend = envValue("GPUMON_GPU_BACKEND"); backend != nullptr) {
    const std::optional<GpuBackend> PARSED = parseGpuBackend(backend);
    if (!PARSED) {
      error = fmt::format("GPUMON_GPU_BACKEND: unknown backend '{}'", backend);
      return false;
    }
    config.gpuBackend = *PARSED;
  }
  if (const char* smi = envValue("GPUMON_NVIDIA_SMI"); smi != nullptr) {
    config.nvidiaSmiPath = smi;
  }
  if (const char* root = envValue("GPUMON_PROC_ROOT"); root != nullptr) {
    config.procRoot = root;
  }
  if (const char* level = envValue("GPUMON_LOG_LEVEL"); level != nullptr) {
    config.logLevel = level;
  }
  return true;
}

source::SourceList makeSources(const MonitorConfig& config) {
  source::SourceList sources;

  if (config.simulate) {
    sources.push_back(source::makeSource<source::ScriptedSource>(
        "simulated", source::simulatedFrames(config.simulatedDevices, SIMULATED_FRAME_COUNT),
        true));
    return sources;
  }

  switch (config.gpuBackend) {
  case GpuBackend::Nvml:
    sources.push_back(source::makeSource<source::NvmlGpuSource>());
    break;
  case GpuBackend::Smi:
    sources.push_back(
        source::makeSource<source::SmiGpuSource>(config.nvidiaSmiPath, config.interval));
    break;
  case GpuBackend::Auto: {
    std::unique_ptr<source::MetricSource> nvml;
    if (source::NvmlGpuSource::compiledIn()) {
      nvml = source::makeSource<source::NvmlGpuSource>();
      const source::Inventory DETECTED = std::get<source::NvmlGpuSource>(*nvml).inventory();
      if (DETECTED.ok()) {
        logger()->info("gpu backend: nvml ({} devices)", DETECTED.targets.size());
        sources.push_back(std::move(nvml));
        break;
      }
      logger()->info("nvml unavailable ({}), falling back to {}", DETECTED.unavailable->reason,
                     config.nvidiaSmiPath);
    }
    sources.push_back(
        source::makeSource<source::SmiGpuSource>(config.nvidiaSmiPath, config.interval));
    break;
  }
  case GpuBackend::None:
    break;
  }

  if (config.hostMetrics) {
    sources.push_back(source::makeSource<source::HostSource>(config.procRoot));
  }
  return sources;
}

} // namespace config

} // namespace gpumon
