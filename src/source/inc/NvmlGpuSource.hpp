#ifndef GPUMON_SOURCE_NVML_GPU_SOURCE_HPP
#define GPUMON_SOURCE_NVML_GPU_SOURCE_HPP
/**
 * @file NvmlGpuSource.hpp
 * @brief NVIDIA GPU telemetry through NVML.
 * @note Linux-only. Requires libnvidia-ml at build and run time; otherwise the
 *       source reports SourceUnavailable every cycle.
 * @note Thread-safe: query() may run concurrently for different devices;
 *       inventory() is called by the cycle driver only.
 *
 * Devices are identified by NVML UUID. The NVML session is opened lazily and
 * kept for the source's lifetime; a failed initialization (driver not loaded)
 * is retried on every inventory so the source recovers without a restart.
 */

#include <atomic> // std::atomic
#include <mutex>  // std::mutex
#include <string> // std::string

#include "src/source/inc/RawReading.hpp"

namespace gpumon {

namespace source {

/* ----------------------------- NvmlGpuSource ----------------------------- */

class NvmlGpuSource {
public:
  NvmlGpuSource() noexcept = default;
  ~NvmlGpuSource();

  NvmlGpuSource(const NvmlGpuSource&) = delete;
  NvmlGpuSource& operator=(const NvmlGpuSource&) = delete;

  /// Source name used in diagnostics.
  [[nodiscard]] const char* name() const noexcept { return "nvml"; }

  /// True if this build was compiled against NVML.
  [[nodiscard]] static bool compiledIn() noexcept;

  /**
   * @brief List device UUIDs.
   * @return Unavailable when NVML is missing, fails to initialize, or reports no devices.
   */
  [[nodiscard]] Inventory inventory() noexcept;

  /**
   * @brief Read one device's telemetry by UUID.
   * @return Failure when the handle cannot be resolved or no metric can be read.
   */
  [[nodiscard]] QueryOutcome query(const std::string& target) noexcept;

private:
  /// Initialize NVML if not yet done. Returns empty string on success.
  std::string ensureSession() noexcept;

  std::mutex sessionMutex_;
  std::atomic<bool> session_{false};
};

} // namespace source

} // namespace gpumon

#endif // GPUMON_SOURCE_NVML_GPU_SOURCE_HPP
