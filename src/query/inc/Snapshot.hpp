#ifndef GPUMON_QUERY_SNAPSHOT_HPP
#define GPUMON_QUERY_SNAPSHOT_HPP
/**
 * @file Snapshot.hpp
 * @brief Immutable point-in-time view of one poll cycle.
 *
 * Every record in Snapshot::latest was produced by the snapshot's own cycle.
 * Series that were not refreshed (failed device, unavailable source) are
 * absent from latest; their bounded history stays in Snapshot::history.
 */

#include <cstddef> // std::size_t
#include <cstdint> // std::uint64_t
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "src/model/inc/MetricRecord.hpp"
#include "src/normalize/inc/Normalizer.hpp"
#include "src/source/inc/RawReading.hpp"

namespace gpumon {

namespace query {

/* ----------------------------- Diagnostics ----------------------------- */

/// Counters accumulated since the sampler was created.
struct CumulativeCounters {
  std::uint64_t cycles{0};
  std::uint64_t degradedCycles{0};
  std::uint64_t deviceErrors{0};
  std::uint64_t timeouts{0};
  std::uint64_t unavailableSources{0}; ///< Source-cycles reported unavailable
  std::uint64_t clamped{0};
  std::uint64_t invalid{0};
  std::uint64_t recordsAppended{0};
};

struct Diagnostics {
  std::uint64_t cycleId{0};
  bool degraded{false};                                  ///< Any source unavailable
  std::vector<source::DeviceError> deviceErrors;         ///< Last cycle
  std::vector<source::SourceUnavailable> unavailable;    ///< Last cycle
  std::vector<normalize::InvalidValue> invalidValues;    ///< Last cycle
  std::map<std::string, std::uint64_t> errorsByDevice;   ///< Cumulative, keyed by device id
  CumulativeCounters totals{};
  std::size_t pendingQueries{0}; ///< Timed-out workers still running
  std::uint64_t cycleDurationNs{0};

  /// @brief Multi-line human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Readouts ----------------------------- */

/**
 * @brief Absolute device values shown next to the percentage series.
 *
 * Display only: these are not metric series and carry no status or history.
 * A value is absent when the backend did not report it this cycle or it was
 * not a finite, non-negative number.
 */
struct DeviceReadout {
  std::optional<double> powerDrawW;  ///< Power draw (W)
  std::optional<double> memUsedMiB;  ///< Framebuffer in use (MiB)
  std::optional<double> memTotalMiB; ///< Framebuffer size (MiB)
};

/* ----------------------------- Snapshot ----------------------------- */

struct Snapshot {
  std::uint64_t cycleId{0}; ///< 0 before the first cycle
  std::uint64_t timestampNs{0};
  std::uint64_t wallTimeNs{0};
  bool degraded{false};
  std::vector<model::Device> devices;                          ///< Active devices
  std::map<model::SeriesKey, model::MetricRecord> latest;      ///< Refreshed this cycle
  std::map<model::SeriesKey, std::vector<model::MetricRecord>> history; ///< Optional
  std::map<std::string, DeviceReadout> readouts; ///< This cycle, keyed by device id
  Diagnostics diagnostics{};

  /// Record of @p key from this cycle, or null.
  [[nodiscard]] const model::MetricRecord* find(const model::SeriesKey& key) const noexcept;

  /// Readout for @p deviceId from this cycle, or null.
  [[nodiscard]] const DeviceReadout* readout(const std::string& deviceId) const noexcept;

  /// True before the first cycle has been published.
  [[nodiscard]] bool empty() const noexcept { return cycleId == 0; }

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

} // namespace query

} // namespace gpumon

#endif // GPUMON_QUERY_SNAPSHOT_HPP
