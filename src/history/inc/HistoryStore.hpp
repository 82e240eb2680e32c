#ifndef GPUMON_HISTORY_HISTORY_STORE_HPP
#define GPUMON_HISTORY_HISTORY_STORE_HPP
/**
 * @file HistoryStore.hpp
 * @brief Bounded per-series history plus the tracked device set.
 * @note Thread-safe. One mutex guards all state; reads copy out under it.
 *
 * Each series is a RingBuffer of capacity N allocated on its first append.
 * Devices are tracked by stable id. A device missing from K consecutive
 * successful inventories of its source is retired: it leaves devices() but
 * its series are kept so a returning device resumes its history. At most
 * maxRetiredDevices retired devices are retained; beyond that the
 * longest-retired one is dropped together with its series.
 */

#include <cstddef> // std::size_t
#include <cstdint> // std::uint64_t
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "src/history/inc/RingBuffer.hpp"
#include "src/model/inc/MetricRecord.hpp"

namespace gpumon {

namespace history {

/* ----------------------------- Options ----------------------------- */

struct HistoryOptions {
  std::size_t capacity{15};         ///< N, records per series
  std::size_t retireAfter{3};       ///< K, consecutive absences before retirement
  std::size_t maxRetiredDevices{16}; ///< Retired devices whose series are kept
};

/* ----------------------------- Device Tracking ----------------------------- */

/// Tracking state of one device.
struct DeviceState {
  model::Device device;
  std::uint64_t firstSeenCycle{0};
  std::uint64_t lastSeenCycle{0};
  std::size_t absentCount{0}; ///< Consecutive successful inventories without this device
  bool retired{false};
  std::uint64_t retiredAtCycle{0};
};

/// Successful inventory of one source in one cycle.
struct SourceInventory {
  std::string source;
  std::vector<std::string> targets;
};

/// Device set changes produced by one observeDevices() call.
struct DeviceChanges {
  std::vector<std::string> added;
  std::vector<std::string> returned; ///< Previously retired, seen again
  std::vector<std::string> retired;
  std::vector<std::string> dropped; ///< Retired devices freed with their series

  [[nodiscard]] bool empty() const noexcept {
    return added.empty() && returned.empty() && retired.empty() && dropped.empty();
  }
};

/* ----------------------------- HistoryStore ----------------------------- */

class HistoryStore {
public:
  explicit HistoryStore(HistoryOptions options = {});

  HistoryStore(const HistoryStore&) = delete;
  HistoryStore& operator=(const HistoryStore&) = delete;

  /* ----------------------------- Writes ----------------------------- */

  /**
   * @brief Append @p record to its series, evicting the oldest entry when full.
   * @throws std::bad_alloc when a new series cannot be allocated (store unchanged).
   */
  void append(const model::MetricRecord& record);

  /**
   * @brief Update the device set for one cycle.
   * @param seen Devices that produced a reading this cycle
   * @param reporting Sources whose inventory succeeded this cycle
   * @param cycleId Current cycle
   *
   * Known devices listed by their source are refreshed. Known devices whose
   * source reported without listing them accumulate an absence. Devices of
   * sources missing from @p reporting are left untouched.
   */
  DeviceChanges observeDevices(const std::vector<model::Device>& seen,
                               const std::vector<SourceInventory>& reporting,
                               std::uint64_t cycleId);

  /* ----------------------------- Reads ----------------------------- */

  /// Newest record of @p key, if any.
  [[nodiscard]] std::optional<model::MetricRecord> latest(const model::SeriesKey& key) const;

  /// Records of @p key, oldest to newest (length <= capacity).
  [[nodiscard]] std::vector<model::MetricRecord> window(const model::SeriesKey& key) const;

  /// Active (non-retired) devices in first-seen order.
  [[nodiscard]] std::vector<model::Device> devices() const;

  /// Every tracked device, retired ones included.
  [[nodiscard]] std::vector<DeviceState> deviceStates() const;

  /// Windows of every series of active devices plus the host series.
  [[nodiscard]] std::map<model::SeriesKey, std::vector<model::MetricRecord>>
  activeWindows() const;

  [[nodiscard]] std::size_t seriesCount() const;
  [[nodiscard]] const HistoryOptions& options() const noexcept { return options_; }

private:
  using SeriesMap = std::map<model::SeriesKey, RingBuffer<model::MetricRecord>>;

  DeviceState* findDevice(const std::string& id) noexcept;
  bool isActiveLocked(const std::string& deviceId) const noexcept;
  void dropExcessRetired(DeviceChanges& changes);

  HistoryOptions options_;
  mutable std::mutex mutex_;
  SeriesMap series_;
  std::vector<DeviceState> devices_;
};

} // namespace history

} // namespace gpumon

#endif // GPUMON_HISTORY_HISTORY_STORE_HPP
