#ifndef GPUMON_CONFIG_MONITOR_CONFIG_HPP
#define GPUMON_CONFIG_MONITOR_CONFIG_HPP
/**
 * @file MonitorConfig.hpp
 * @brief Monitor settings: compiled defaults, environment overrides, validation.
 *
 * Environment variables (all optional):
 *  - GPUMON_INTERVAL_MS       poll interval
 *  - GPUMON_QUERY_TIMEOUT_MS  per-query deadline
 *  - GPUMON_MAX_PARALLEL      concurrent queries per source
 *  - GPUMON_HISTORY           records kept per series
 *  - GPUMON_RETIRE_AFTER      absent polls before a device is retired
 *  - GPUMON_GPU_BACKEND       nvml | smi | auto | none
 *  - GPUMON_NVIDIA_SMI        nvidia-smi binary path
 *  - GPUMON_PROC_ROOT         procfs root prefix (testing)
 *  - GPUMON_LOG_LEVEL         spdlog level name
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "src/normalize/inc/Normalizer.hpp"
#include "src/sampler/inc/Sampler.hpp"
#include "src/source/inc/MetricSource.hpp"

namespace gpumon {

namespace config {

/* ----------------------------- GpuBackend ----------------------------- */

enum class GpuBackend : std::uint8_t {
  Auto = 0, ///< NVML when it initializes, else nvidia-smi
  Nvml = 1,
  Smi = 2,
  None = 3, ///< Host metrics only
};

/// Lowercase backend name ("auto", "nvml", "smi", "none").
[[nodiscard]] const char* toString(GpuBackend backend) noexcept;

/// Parse a backend name (case-insensitive).
[[nodiscard]] std::optional<GpuBackend> parseGpuBackend(std::string_view name) noexcept;

/* ----------------------------- MonitorConfig ----------------------------- */

struct MonitorConfig {
  std::chrono::milliseconds interval{1000};
  std::chrono::milliseconds queryTimeout{750};
  std::size_t maxParallel{4};
  std::size_t historyCapacity{15};  ///< N
  std::size_t retireAfter{3};       ///< K
  std::size_t maxRetiredDevices{16};
  bool includeHistory{true};

  normalize::ThresholdSet thresholds{normalize::ThresholdSet::defaults()};
  normalize::ValidityBounds validity{};

  GpuBackend gpuBackend{GpuBackend::Auto};
  std::string nvidiaSmiPath{"nvidia-smi"};
  std::string procRoot{};   ///< Empty for the real /proc
  bool hostMetrics{true};   ///< Poll procfs for cpu_util / ram_util
  bool simulate{false};     ///< Replace every source with simulated devices
  std::size_t simulatedDevices{2};

  std::string logLevel{"info"};

  /**
   * @brief Check the settings for consistency.
   * @param error Receives the first problem found.
   * @return true when the config is usable.
   */
  [[nodiscard]] bool validate(std::string& error) const;

  /// Sampler settings derived from this config.
  [[nodiscard]] sampler::SamplerOptions samplerOptions() const;

  /// @brief Multi-line human-readable dump.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Loading ----------------------------- */

/**
 * @brief Apply GPUMON_* environment variables on top of @p config.
 * @param error Receives the first malformed variable.
 * @return false if a variable is set but malformed (config left partially updated).
 */
[[nodiscard]] bool loadFromEnv(MonitorConfig& config, std::string& error);

/**
 * @brief Build the sources selected by @p config.
 *
 * GPU backend first (auto tries NVML, then falls back to nvidia-smi), then
 * the procfs host source. In simulate mode a single scripted source replays
 * generated devices and host values. An nvidia-smi process still running one
 * interval after launch is killed.
 */
[[nodiscard]] source::SourceList makeSources(const MonitorConfig& config);

} // namespace config

} // namespace gpumon

#endif // GPUMON_CONFIG_MONITOR_CONFIG_HPP
