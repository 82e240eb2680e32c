/**
 * @file RawReading.cpp
 * @brief Raw reading formatting and adapter result constructors.
 */

#include "src/source/inc/RawReading.hpp"

#include <utility> // std::move

#include <fmt/core.h>

namespace gpumon {

namespace source {

namespace {

/// "12.5" or "n/a".
std::string optionalValue(const std::optional<double>& value) {
  return value ? fmt::format("{:.1f}", *value) : std::string("n/a");
}

} // namespace

/* ----------------------------- Raw Readings ----------------------------- */

std::string RawDeviceReading::toString() const {
  return fmt::format(
      "[{}] {} - util {}%, mem {}% ({} / {} MiB), power {} W / {} W, temp {} C", id, name,
      optionalValue(gpuUtilPct), optionalValue(memUtilPct), optionalValue(memUsedMiB),
      optionalValue(memTotalMiB), optionalValue(powerDrawW), optionalValue(ratedMaxPowerW),
      optionalValue(temperatureC));
}

std::string RawHostReading::toString() const {
  return fmt::format("[host] cpu {}%, ram {}%", optionalValue(cpuUtilPct),
                     optionalValue(ramUtilPct));
}

/* ----------------------------- Errors ----------------------------- */

const char* toString(QueryErrorKind kind) noexcept {
  switch (kind) {
  case QueryErrorKind::Backend:
    return "backend";
  case QueryErrorKind::Timeout:
    return "timeout";
  case QueryErrorKind::Pending:
    return "pending";
  }
  return "unknown";
}

std::string DeviceError::toString() const {
  return fmt::format("{}: {} ({})", deviceId, message, source::toString(kind));
}

/* ----------------------------- Adapter Results ----------------------------- */

Inventory Inventory::of(std::vector<std::string> targets) {
  Inventory inv{};
  inv.targets = std::move(targets);
  return inv;
}

Inventory Inventory::unavailableBecause(std::string source, std::string reason) {
  Inventory inv{};
  inv.unavailable = SourceUnavailable{std::move(source), std::move(reason)};
  return inv;
}

QueryOutcome QueryOutcome::success(RawReading reading) {
  QueryOutcome out{};
  out.reading = std::move(reading);
  return out;
}

QueryOutcome QueryOutcome::failure(std::string error) {
  QueryOutcome out{};
  out.error = std::move(error);
  return out;
}

} // namespace source

} // namespace gpumon
