/**
 * @file SnapshotService.cpp
 * @brief Snapshot publication slot.
 */

#include "src/query/inc/SnapshotService.hpp"

#include <utility> // std::exchange, std::move

namespace gpumon {

namespace query {

SnapshotSlot::SnapshotSlot() : current_(std::make_shared<const Snapshot>()) {}

void SnapshotSlot::publish(std::shared_ptr<const Snapshot> snapshot) noexcept {
  if (!snapshot) {
    return;
  }
  std::shared_ptr<const Snapshot> previous;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    previous = std::exchange(current_, std::move(snapshot));
  }
  // previous is released outside the lock.
}

std::shared_ptr<const Snapshot> SnapshotSlot::load() const noexcept {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

} // namespace query

} // namespace gpumon
