#ifndef GPUMON_NORMALIZE_NORMALIZER_HPP
#define GPUMON_NORMALIZE_NORMALIZER_HPP
/**
 * @file Normalizer.hpp
 * @brief Raw readings to canonical metric records.
 * @note Pure and stateless. Safe to call from any thread.
 *
 * Rules applied per reading:
 *  - power_pct = draw / rated * 100, emitted only when rated power is known and > 0
 *  - percentage metrics clamped to [0, 100], each clamp counted
 *  - NaN/inf values, negative power draw and out-of-range temperatures discarded and counted
 *  - status from the per-type threshold table
 *  - every record carries the cycle id and the cycle's single timestamp
 */

#include <cstddef> // std::size_t
#include <cstdint> // std::uint64_t
#include <optional>
#include <string>
#include <vector>

#include "src/model/inc/MetricRecord.hpp"
#include "src/normalize/inc/Thresholds.hpp"
#include "src/source/inc/RawReading.hpp"

namespace gpumon {

namespace normalize {

/* ----------------------------- Config ----------------------------- */

/// Physically sensible temperature range (C); readings outside are invalid.
struct ValidityBounds {
  double minTempC{0.0};
  double maxTempC{150.0};
};

struct NormalizerConfig {
  ThresholdSet thresholds{ThresholdSet::defaults()};
  ValidityBounds validity{};
};

/// Cycle identity shared by every record it produces.
struct CycleStamp {
  std::uint64_t cycleId{0};
  std::uint64_t timestampNs{0}; ///< Monotonic
  std::uint64_t wallTimeNs{0};  ///< Realtime, for display
};

/* ----------------------------- Result ----------------------------- */

/// One discarded value.
struct InvalidValue {
  model::SeriesKey key;
  double value{0.0};
  std::string reason;

  [[nodiscard]] std::string toString() const;
};

struct NormalizeResult {
  std::vector<model::MetricRecord> records; ///< Device records (inventory order), then host
  std::vector<model::Device> devices;       ///< Devices that produced a reading
  std::size_t clampedCount{0};
  std::size_t invalidCount{0};
  std::vector<InvalidValue> invalid; ///< Details of the discarded values

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Power draw as a percentage of rated power.
 * @return nullopt when rated power is unknown or <= 0. Not clamped.
 */
[[nodiscard]] std::optional<double> powerPercent(double drawW,
                                                 std::optional<double> ratedMaxPowerW) noexcept;

/**
 * @brief Normalize one device reading, appending to @p out.
 * @param source Source name recorded on the derived Device.
 */
void normalizeDevice(const source::RawDeviceReading& reading, const std::string& source,
                     const CycleStamp& stamp, const NormalizerConfig& config,
                     NormalizeResult& out);

/// Normalize one host reading, appending to @p out.
void normalizeHost(const source::RawHostReading& reading, const CycleStamp& stamp,
                   const NormalizerConfig& config, NormalizeResult& out);

/**
 * @brief Normalize every successful reading of a cycle.
 *
 * Unavailable sources and per-device errors contribute nothing.
 */
[[nodiscard]] NormalizeResult normalize(const std::vector<source::PollResult>& polls,
                                        const CycleStamp& stamp,
                                        const NormalizerConfig& config);

} // namespace normalize

} // namespace gpumon

#endif // GPUMON_NORMALIZE_NORMALIZER_HPP
