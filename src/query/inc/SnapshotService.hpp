#ifndef GPUMON_QUERY_SNAPSHOT_SERVICE_HPP
#define GPUMON_QUERY_SNAPSHOT_SERVICE_HPP
/**
 * @file SnapshotService.hpp
 * @brief Read-side API over published snapshots and the history store.
 * @note Thread-safe. Any number of readers alongside one publisher.
 *
 * SnapshotSlot holds the most recently published snapshot. Publication and
 * reads only swap or copy a shared pointer under a mutex, so readers never
 * wait on a cycle in progress and never observe a partially built snapshot.
 */

#include <memory> // std::shared_ptr
#include <mutex>
#include <vector>

#include "src/history/inc/HistoryStore.hpp"
#include "src/query/inc/Snapshot.hpp"

namespace gpumon {

namespace query {

/* ----------------------------- SnapshotSlot ----------------------------- */

class SnapshotSlot {
public:
  /// Starts with an empty snapshot (cycle 0).
  SnapshotSlot();

  SnapshotSlot(const SnapshotSlot&) = delete;
  SnapshotSlot& operator=(const SnapshotSlot&) = delete;

  void publish(std::shared_ptr<const Snapshot> snapshot) noexcept;

  [[nodiscard]] std::shared_ptr<const Snapshot> load() const noexcept;

private:
  mutable std::mutex mutex_;
  std::shared_ptr<const Snapshot> current_;
};

/* ----------------------------- SnapshotService ----------------------------- */

class SnapshotService {
public:
  SnapshotService(const SnapshotSlot& slot, const history::HistoryStore& store) noexcept
      : slot_(slot), store_(store) {}

  /// Most recent published snapshot (empty, cycle 0, before the first cycle).
  [[nodiscard]] std::shared_ptr<const Snapshot> currentSnapshot() const noexcept {
    return slot_.load();
  }

  /// Records of @p key, oldest to newest.
  [[nodiscard]] std::vector<model::MetricRecord> history(const model::SeriesKey& key) const {
    return store_.window(key);
  }

  /// Diagnostics of the most recent published cycle.
  [[nodiscard]] Diagnostics diagnostics() const { return slot_.load()->diagnostics; }

  /// Active devices as currently tracked.
  [[nodiscard]] std::vector<model::Device> devices() const { return store_.devices(); }

private:
  const SnapshotSlot& slot_;
  const history::HistoryStore& store_;
};

} // namespace query

} // namespace gpumon

#endif // GPUMON_QUERY_SNAPSHOT_SERVICE_HPP
