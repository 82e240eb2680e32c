#ifndef GPUMON_SOURCE_HOST_SOURCE_HPP
#define GPUMON_SOURCE_HOST_SOURCE_HPP
/**
 * @file HostSource.hpp
 * @brief Host CPU and RAM utilization from procfs.
 * @note Linux-only. Reads /proc/stat and /proc/meminfo under a configurable root.
 * @note Thread-safe: The previous CPU counter sample is guarded by a mutex.
 *
 * Design: snapshot + delta. Each query captures aggregate /proc/stat counters
 * and reports utilization over the interval since the previous query, so the
 * first query of a source yields RAM only.
 */

#include <cstdint>  // std::uint64_t
#include <mutex>    // std::mutex
#include <optional> // std::optional
#include <string>   // std::string

#include "src/source/inc/RawReading.hpp"

namespace gpumon {

namespace source {

/* ----------------------------- Raw Counters ----------------------------- */

/**
 * @brief Aggregate CPU time counters from the "cpu " line of /proc/stat (jiffies).
 *
 * Fields match /proc/stat columns:
 *   user nice system idle iowait irq softirq steal guest guest_nice
 * guest and guest_nice are already included in user and nice.
 */
struct CpuTimeCounters {
  std::uint64_t user{0};
  std::uint64_t nice{0};
  std::uint64_t system{0};
  std::uint64_t idle{0};
  std::uint64_t iowait{0};
  std::uint64_t irq{0};
  std::uint64_t softirq{0};
  std::uint64_t steal{0};
  std::uint64_t guest{0};
  std::uint64_t guestNice{0};

  /// Total time, excluding guest columns (counted in user/nice already).
  [[nodiscard]] std::uint64_t total() const noexcept;

  /// Idle time (idle + iowait).
  [[nodiscard]] std::uint64_t inactive() const noexcept;
};

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Parse the aggregate "cpu " line out of /proc/stat text.
 * @return nullopt if no aggregate line is present.
 */
[[nodiscard]] std::optional<CpuTimeCounters> parseProcStat(const char* text) noexcept;

/**
 * @brief Busy share of the interval between two samples (0-100).
 * @return nullopt if no time elapsed or counters went backwards.
 */
[[nodiscard]] std::optional<double> cpuUtilizationBetween(const CpuTimeCounters& before,
                                                          const CpuTimeCounters& after) noexcept;

/**
 * @brief RAM utilization from /proc/meminfo text.
 *
 * Uses (MemTotal - MemAvailable) / MemTotal; kernels without MemAvailable fall
 * back to MemTotal - MemFree - Buffers - Cached - SReclaimable.
 * @return nullopt if MemTotal is missing or zero.
 */
[[nodiscard]] std::optional<double> parseMemInfoUtilization(const char* text) noexcept;

/* ----------------------------- HostSource ----------------------------- */

class HostSource {
public:
  /**
   * @param procRoot Directory that contains proc/ ("" for the real filesystem).
   */
  explicit HostSource(std::string procRoot = "");

  HostSource(const HostSource&) = delete;
  HostSource& operator=(const HostSource&) = delete;

  /// Source name used in diagnostics.
  [[nodiscard]] const char* name() const noexcept { return "procfs"; }

  /**
   * @brief The single HOST_TARGET, or unavailable if neither procfs file can be read.
   */
  [[nodiscard]] Inventory inventory() noexcept;

  /**
   * @brief Sample CPU and RAM utilization.
   * @return Failure only when neither value could be produced or sampled.
   */
  [[nodiscard]] QueryOutcome query(const std::string& target) noexcept;

private:
  std::string statPath_;
  std::string meminfoPath_;
  std::mutex mutex_;
  std::optional<CpuTimeCounters> previous_;
};

} // namespace source

} // namespace gpumon

#endif // GPUMON_SOURCE_HOST_SOURCE_HPP
