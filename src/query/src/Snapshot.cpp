/**
 * @file Snapshot.cpp
 * @brief Snapshot lookup and formatting.
 */

#include "src/query/inc/Snapshot.hpp"

#include <fmt/core.h>

namespace gpumon {

namespace query {

std::string Diagnostics::toString() const {
  std::string out = fmt::format("cycle {}: {}, {} device errors, {} pending queries\n", cycleId,
                                degraded ? "DEGRADED" : "ok", deviceErrors.size(),
                                pendingQueries);
  for (const auto& UNAVAILABLE : unavailable) {
    out += fmt::format("  unavailable {}: {}\n", UNAVAILABLE.source, UNAVAILABLE.reason);
  }
  for (const auto& ERR : deviceErrors) {
    out += fmt::format("  {}\n", ERR.toString());
  }
  for (const auto& INVALID : invalidValues) {
    out += fmt::format("  invalid {}\n", INVALID.toString());
  }
  out += fmt::format("  totals: cycles={} degraded={} errors={} timeouts={} unavailable={} "
                     "clamped={} invalid={} appended={}\n",
                     totals.cycles, totals.degradedCycles, totals.deviceErrors, totals.timeouts,
                     totals.unavailableSources, totals.clamped, totals.invalid,
                     totals.recordsAppended);
  return out;
}

const model::MetricRecord* Snapshot::find(const model::SeriesKey& key) const noexcept {
  const auto IT = latest.find(key);
  return IT == latest.end() ? nullptr : &IT->second;
}

const DeviceReadout* Snapshot::readout(const std::string& deviceId) const noexcept {
  const auto IT = readouts.find(deviceId);
  return IT == readouts.end() ? nullptr : &IT->second;
}

std::string Snapshot::toString() const {
  return fmt::format("snapshot cycle={} devices={} latest={} history={}{}", cycleId,
                     devices.size(), latest.size(), history.size(),
                     degraded ? " degraded" : "");
}

} // namespace query

} // namespace gpumon
