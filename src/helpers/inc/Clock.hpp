#ifndef GPUMON_HELPERS_CLOCK_HPP
#define GPUMON_HELPERS_CLOCK_HPP
/**
 * @file Clock.hpp
 * @brief Monotonic and wall-clock timestamps in nanoseconds.
 */

#include <cstdint>
#include <ctime> // clock_gettime, CLOCK_MONOTONIC, CLOCK_REALTIME

namespace gpumon {
namespace helpers {
namespace clock {

/* ----------------------------- API ----------------------------- */

/**
 * @brief Get monotonic timestamp in nanoseconds.
 *
 * Uses CLOCK_MONOTONIC for consistent, non-decreasing time measurements
 * unaffected by system clock adjustments.
 */
[[nodiscard]] inline std::uint64_t getMonotonicNs() noexcept {
  struct timespec ts{};
  ::clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<std::uint64_t>(ts.tv_sec) * 1'000'000'000ULL +
         static_cast<std::uint64_t>(ts.tv_nsec);
}

/// Wall-clock (CLOCK_REALTIME) nanoseconds since the Unix epoch, for display and export.
[[nodiscard]] inline std::uint64_t getRealtimeNs() noexcept {
  struct timespec ts{};
  ::clock_gettime(CLOCK_REALTIME, &ts);
  return static_cast<std::uint64_t>(ts.tv_sec) * 1'000'000'000ULL +
         static_cast<std::uint64_t>(ts.tv_nsec);
}

} // namespace clock
} // namespace helpers
} // namespace gpumon

#endif // GPUMON_HELPERS_CLOCK_HPP
