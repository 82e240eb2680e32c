/**
 * @file MetricSource.cpp
 * @brief Variant dispatch and per-cycle poll composition.
 */

#include "src/source/inc/MetricSource.hpp"

#include <set>         // std::set
#include <utility>     // std::move
#include <type_traits> // std::decay_t, std::is_same_v

namespace gpumon {

namespace source {

std::string sourceName(const MetricSource& source) {
  return std::visit([](const auto& kind) { return std::string(kind.name()); }, source);
}

PollResult poll(MetricSource& source, QueryFanout& fanout) {
  PollResult result{};
  result.source = sourceName(source);

  Inventory inventory = fanout.runInventory(result.source, [&source]() {
    return std::visit([](auto& kind) { return kind.inventory(); }, source);
  });
  if (!inventory.ok()) {
    result.unavailable = std::move(inventory.unavailable);
    return result;
  }

  std::set<std::string> seen;
  for (auto& target : inventory.targets) {
    if (seen.insert(target).second) {
      result.inventory.push_back(std::move(target));
    }
  }

  const std::vector<TargetResult> RESULTS =
      fanout.run(result.source, result.inventory, [&source](const std::string& target) {
        return std::visit([&target](auto& kind) { return kind.query(target); }, source);
      });

  for (const auto& ONE : RESULTS) {
    if (!ONE.outcome.ok()) {
      result.errors.push_back(DeviceError{ONE.target, ONE.errorKind, ONE.outcome.error});
      continue;
    }
    std::visit(
        [&result](const auto& reading) {
          using Reading = std::decay_t<decltype(reading)>;
          if constexpr (std::is_same_v<Reading, RawDeviceReading>) {
            result.devices.push_back(reading);
          } else {
            result.host = reading;
          }
        },
        *ONE.outcome.reading);
  }
  return result;
}

} // namespace source

} // namespace gpumon
