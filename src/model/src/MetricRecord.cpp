/**
 * @file MetricRecord.cpp
 * @brief Device, SeriesKey and MetricRecord helpers.
 */

#include "src/model/inc/MetricRecord.hpp"

#include <utility> // std::move

#include <fmt/core.h>

namespace gpumon {

namespace model {

/* ----------------------------- Device ----------------------------- */

std::string Device::toString() const {
  if (ratedMaxPowerW) {
    return fmt::format("{} ({}, rated {:.0f} W, via {})", name, id, *ratedMaxPowerW, source);
  }
  return fmt::format("{} ({}, rated power unknown, via {})", name, id, source);
}

/* ----------------------------- Status ----------------------------- */

const char* toString(Status status) noexcept {
  switch (status) {
  case Status::Normal:
    return "normal";
  case Status::Warm:
    return "warm";
  case Status::Hot:
    return "hot";
  }
  return "unknown";
}

/* ----------------------------- SeriesKey ----------------------------- */

SeriesKey SeriesKey::host(MetricType type) { return SeriesKey{std::string{}, type}; }

SeriesKey SeriesKey::device(std::string deviceId, MetricType type) {
  return SeriesKey{std::move(deviceId), type};
}

std::string SeriesKey::toString() const {
  return fmt::format("{}/{}", isHost() ? "host" : deviceId, model::toString(type));
}

/* ----------------------------- MetricRecord ----------------------------- */

MetricRecord::MetricRecord(std::uint64_t cycleId, std::uint64_t timestampNs,
                           std::uint64_t wallTimeNs, MetricType type,
                           std::optional<std::string> deviceId, double value, Status status)
    : cycleId_(cycleId), timestampNs_(timestampNs), wallTimeNs_(wallTimeNs), type_(type),
      deviceId_(std::move(deviceId)), value_(value), status_(status) {}

SeriesKey MetricRecord::key() const {
  return deviceId_ ? SeriesKey::device(*deviceId_, type_) : SeriesKey::host(type_);
}

std::string MetricRecord::toString() const {
  return fmt::format("[cycle {}] {} = {:.2f} ({})", cycleId_, key().toString(), value_,
                     model::toString(status_));
}

} // namespace model

} // namespace gpumon
