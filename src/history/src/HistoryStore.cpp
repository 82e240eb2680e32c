/**
 * @file HistoryStore.cpp
 * @brief Series storage, device tracking and retirement.
 */

#include "src/history/inc/HistoryStore.hpp"

#include <algorithm> // std::any_of, std::count_if
#include <set>       // std::set

namespace gpumon {

namespace history {

using model::Device;
using model::MetricRecord;
using model::SeriesKey;

/* ----------------------------- Lifecycle ----------------------------- */

HistoryStore::HistoryStore(HistoryOptions options) : options_(options) {
  if (options_.capacity == 0) {
    options_.capacity = 1;
  }
  if (options_.retireAfter == 0) {
    options_.retireAfter = 1;
  }
}

/* ----------------------------- Writes ----------------------------- */

void HistoryStore::append(const MetricRecord& record) {
  const SeriesKey KEY = record.key();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = series_.find(KEY);
  if (it == series_.end()) {
    it = series_.emplace(KEY, RingBuffer<MetricRecord>(options_.capacity)).first;
  }
  it->second.push(record);
}

DeviceChanges HistoryStore::observeDevices(const std::vector<Device>& seen,
                                           const std::vector<SourceInventory>& reporting,
                                           std::uint64_t cycleId) {
  DeviceChanges changes{};
  std::lock_guard<std::mutex> lock(mutex_);

  std::set<std::string> present;
  auto markPresent = [&](const Device& device) {
    present.insert(device.id);
    DeviceState* state = findDevice(device.id);
    if (state == nullptr) {
      devices_.push_back(DeviceState{device, cycleId, cycleId, 0, false, 0});
      changes.added.push_back(device.id);
      return;
    }
    if (state->retired) {
      state->retired = false;
      state->retiredAtCycle = 0;
      changes.returned.push_back(device.id);
    }
    state->absentCount = 0;
    state->lastSeenCycle = cycleId;
  };

  for (const Device& device : seen) {
    markPresent(device);
    // A reading carries the freshest name and rated power.
    findDevice(device.id)->device = device;
  }

  // Listed but without a reading (query failed): still present.
  for (const SourceInventory& inventory : reporting) {
    for (const std::string& target : inventory.targets) {
      if (present.count(target) == 0) {
        DeviceState* state = findDevice(target);
        markPresent(state != nullptr ? state->device : Device{target, target, std::nullopt,
                                                               inventory.source});
      }
    }
  }

  for (DeviceState& state : devices_) {
    if (state.retired || present.count(state.device.id) != 0) {
      continue;
    }
    const bool SOURCE_REPORTED =
        std::any_of(reporting.begin(), reporting.end(), [&](const SourceInventory& inventory) {
          return inventory.source == state.device.source;
        });
    if (!SOURCE_REPORTED) {
      continue;
    }
    ++state.absentCount;
    if (state.absentCount >= options_.retireAfter) {
      state.retired = true;
      state.retiredAtCycle = cycleId;
      changes.retired.push_back(state.device.id);
    }
  }

  dropExcessRetired(changes);
  return changes;
}

void HistoryStore::dropExcessRetired(DeviceChanges& changes) {
  auto retiredCount = [this]() {
    return static_cast<std::size_t>(std::count_if(
        devices_.begin(), devices_.end(), [](const DeviceState& s) { return s.retired; }));
  };

  while (retiredCount() > options_.maxRetiredDevices) {
    auto oldest = devices_.end();
    for (auto it = devices_.begin(); it != devices_.end(); ++it) {
      if (it->retired && (oldest == devices_.end() || it->retiredAtCycle < oldest->retiredAtCycle)) {
        oldest = it;
      }
    }
    const std::string ID = oldest->device.id;
    for (auto it = series_.begin(); it != series_.end();) {
      if (it->first.deviceId == ID) {
        it = series_.erase(it);
      } else {
        ++it;
      }
    }
    devices_.erase(oldest);
    changes.dropped.push_back(ID);
  }
}

/* ----------------------------- Reads ----------------------------- */

std::optional<MetricRecord> HistoryStore::latest(const SeriesKey& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto IT = series_.find(key);
  if (IT == series_.end() || IT->second.empty()) {
    return std::nullopt;
  }
  return IT->second.back();
}

std::vector<MetricRecord> HistoryStore::window(const SeriesKey& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto IT = series_.find(key);
  if (IT == series_.end()) {
    return {};
  }
  return IT->second.toVector();
}

std::vector<Device> HistoryStore::devices() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Device> out;
  for (const DeviceState& state : devices_) {
    if (!state.retired) {
      out.push_back(state.device);
    }
  }
  return out;
}

std::vector<DeviceState> HistoryStore::deviceStates() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return devices_;
}

std::map<SeriesKey, std::vector<MetricRecord>> HistoryStore::activeWindows() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<SeriesKey, std::vector<MetricRecord>> out;
  for (const auto& [key, ring] : series_) {
    if (key.isHost() || isActiveLocked(key.deviceId)) {
      out.emplace(key, ring.toVector());
    }
  }
  return out;
}

std::size_t HistoryStore::seriesCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return series_.size();
}

/* ----------------------------- Internal ----------------------------- */

DeviceState* HistoryStore::findDevice(const std::string& id) noexcept {
  for (DeviceState& state : devices_) {
    if (state.device.id == id) {
      return &state;
    }
  }
  return nullptr;
}

bool HistoryStore::isActiveLocked(const std::string& deviceId) const noexcept {
  for (const DeviceState& state : devices_) {
    if (state.device.id == deviceId) {
      return !state.retired;
    }
  }
  return false;
}

} // namespace history

} // namespace gpumon
