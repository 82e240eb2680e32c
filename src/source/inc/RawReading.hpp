#ifndef GPUMON_SOURCE_RAW_READING_HPP
#define GPUMON_SOURCE_RAW_READING_HPP
/**
 * @file RawReading.hpp
 * @brief Backend-neutral raw readings and poll outcomes shared by all source kinds.
 *
 * Values are exactly what a backend reported (watts, percent, Celsius). Absent
 * values mean "not reported" and must never be read as zero.
 */

#include <cstdint>  // std::uint8_t
#include <optional> // std::optional
#include <string>   // std::string
#include <variant>  // std::variant
#include <vector>   // std::vector

namespace gpumon {

namespace source {

/* ----------------------------- Constants ----------------------------- */

/// Target id used by host-level sources.
inline constexpr const char* HOST_TARGET = "host";

/* ----------------------------- Raw Readings ----------------------------- */

/**
 * @brief One GPU's raw telemetry for one query.
 */
struct RawDeviceReading {
  std::string id;                       ///< Stable device id
  std::string name;                     ///< Display name
  std::optional<double> ratedMaxPowerW; ///< Rated maximum power (W)
  std::optional<double> gpuUtilPct;     ///< GPU utilization (%)
  std::optional<double> memUtilPct;     ///< Memory utilization (%)
  std::optional<double> powerDrawW;     ///< Instantaneous power draw (W)
  std::optional<double> temperatureC;   ///< GPU temperature (C)
  std::optional<double> memUsedMiB;     ///< Framebuffer memory in use (MiB)
  std::optional<double> memTotalMiB;    ///< Total framebuffer memory (MiB)

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Host raw telemetry for one query.
 */
struct RawHostReading {
  std::optional<double> cpuUtilPct; ///< Aggregate CPU utilization (%)
  std::optional<double> ramUtilPct; ///< RAM utilization (%)

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/// Reading produced by a single query target.
using RawReading = std::variant<RawDeviceReading, RawHostReading>;

/* ----------------------------- Errors ----------------------------- */

/**
 * @brief Whole-backend failure (tool absent, library not loaded, no devices, permissions).
 */
struct SourceUnavailable {
  std::string source; ///< Source name
  std::string reason; ///< Human-readable cause
};

/**
 * @brief Why a single target query failed.
 */
enum class QueryErrorKind : std::uint8_t {
  Backend = 0, ///< Backend reported an error for this target
  Timeout = 1, ///< Query exceeded its deadline
  Pending = 2, ///< Previous timed-out query for this target has not finished yet
};

/// Lowercase kind name ("backend", "timeout", "pending").
[[nodiscard]] const char* toString(QueryErrorKind kind) noexcept;

/**
 * @brief One target's failure in one cycle.
 */
struct DeviceError {
  std::string deviceId; ///< Failed target (device id or HOST_TARGET)
  QueryErrorKind kind{QueryErrorKind::Backend};
  std::string message;

  /// @brief Human-readable one-liner.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Adapter Results ----------------------------- */

/**
 * @brief Targets a source can be queried for this cycle, or why it cannot be queried at all.
 */
struct Inventory {
  std::vector<std::string> targets;
  std::optional<SourceUnavailable> unavailable;

  [[nodiscard]] bool ok() const noexcept { return !unavailable.has_value(); }

  [[nodiscard]] static Inventory of(std::vector<std::string> targets);
  [[nodiscard]] static Inventory unavailableBecause(std::string source, std::string reason);
};

/**
 * @brief Result of querying one target.
 */
struct QueryOutcome {
  std::optional<RawReading> reading;
  std::string error; ///< Set when reading is absent

  [[nodiscard]] bool ok() const noexcept { return reading.has_value(); }

  [[nodiscard]] static QueryOutcome success(RawReading reading);
  [[nodiscard]] static QueryOutcome failure(std::string error);
};

/**
 * @brief Everything one source produced in one cycle.
 *
 * Either @c unavailable is set (and all other fields are empty) or the source
 * was reachable: successful readings are listed in inventory order and every
 * failed target appears in @c errors.
 */
struct PollResult {
  std::string source;                           ///< Source name
  std::vector<std::string> inventory;           ///< Targets the source listed this cycle
  std::vector<RawDeviceReading> devices;        ///< Successful device readings
  std::optional<RawHostReading> host;           ///< Successful host reading
  std::vector<DeviceError> errors;              ///< Per-target failures
  std::optional<SourceUnavailable> unavailable; ///< Whole-source failure

  [[nodiscard]] bool ok() const noexcept { return !unavailable.has_value(); }
};

} // namespace source

} // namespace gpumon

#endif // GPUMON_SOURCE_RAW_READING_HPP
