#ifndef GPUMON_MODEL_METRIC_RECORD_HPP
#define GPUMON_MODEL_METRIC_RECORD_HPP
/**
 * @file MetricRecord.hpp
 * @brief Canonical telemetry values: Device, Status, SeriesKey, MetricRecord.
 * @note Thread-safe: Value types; const access from many threads is safe.
 */

#include <cstdint>  // std::uint64_t
#include <optional> // std::optional
#include <string>   // std::string

#include "src/model/inc/MetricType.hpp"

namespace gpumon {

namespace model {

/* ----------------------------- Device ----------------------------- */

/**
 * @brief One monitored GPU.
 *
 * Identity is the stable id (GPU UUID where the backend has one), never the
 * enumeration index, so devices survive reordering across driver resets.
 */
struct Device {
  std::string id;                       ///< Stable identifier
  std::string name;                     ///< Display name
  std::optional<double> ratedMaxPowerW; ///< Rated maximum power (TDP), if known
  std::string source;                   ///< Name of the source that reports this device

  /// @brief Human-readable one-liner.
  [[nodiscard]] std::string toString() const;

  bool operator==(const Device& other) const = default;
};

/* ----------------------------- Status ----------------------------- */

/**
 * @brief Severity bucket assigned by the normalizer.
 */
enum class Status : std::uint8_t {
  Normal = 0,
  Warm = 1,
  Hot = 2,
};

/// Lowercase bucket name ("normal", "warm", "hot").
[[nodiscard]] const char* toString(Status status) noexcept;

/* ----------------------------- SeriesKey ----------------------------- */

/**
 * @brief Identity of one Series: (device or host, metric type).
 */
struct SeriesKey {
  std::string deviceId; ///< Empty for host-scoped series
  MetricType type{MetricType::CpuUtil};

  /// Key of a host-scoped series.
  [[nodiscard]] static SeriesKey host(MetricType type);

  /// Key of a device-scoped series.
  [[nodiscard]] static SeriesKey device(std::string deviceId, MetricType type);

  [[nodiscard]] bool isHost() const noexcept { return deviceId.empty(); }

  /// "host/cpu_util" or "<device-id>/temp_c".
  [[nodiscard]] std::string toString() const;

  bool operator==(const SeriesKey& other) const = default;
  auto operator<=>(const SeriesKey& other) const = default;
};

/* ----------------------------- MetricRecord ----------------------------- */

/**
 * @brief One normalized sample. Immutable once constructed.
 *
 * All records produced by one poll cycle share the cycle id and both timestamps.
 */
class MetricRecord {
public:
  MetricRecord() = default;
  MetricRecord(std::uint64_t cycleId, std::uint64_t timestampNs, std::uint64_t wallTimeNs,
               MetricType type, std::optional<std::string> deviceId, double value,
               Status status);

  [[nodiscard]] std::uint64_t cycleId() const noexcept { return cycleId_; }
  /// Monotonic timestamp (ns) of the producing cycle.
  [[nodiscard]] std::uint64_t timestampNs() const noexcept { return timestampNs_; }
  /// Wall-clock timestamp (ns since epoch) of the producing cycle.
  [[nodiscard]] std::uint64_t wallTimeNs() const noexcept { return wallTimeNs_; }
  [[nodiscard]] MetricType type() const noexcept { return type_; }
  [[nodiscard]] const std::optional<std::string>& deviceId() const noexcept { return deviceId_; }
  [[nodiscard]] double value() const noexcept { return value_; }
  [[nodiscard]] Status status() const noexcept { return status_; }

  /// Series this record belongs to.
  [[nodiscard]] SeriesKey key() const;

  /// @brief Human-readable one-liner.
  [[nodiscard]] std::string toString() const;

  bool operator==(const MetricRecord& other) const = default;

private:
  std::uint64_t cycleId_{0};
  std::uint64_t timestampNs_{0};
  std::uint64_t wallTimeNs_{0};
  MetricType type_{MetricType::CpuUtil};
  std::optional<std::string> deviceId_;
  double value_{0.0};
  Status status_{Status::Normal};
};

} // namespace model

} // namespace gpumon

#endif // GPUMON_MODEL_METRIC_RECORD_HPP
