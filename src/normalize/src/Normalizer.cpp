/**
 * @file Normalizer.cpp
 * @brief Canonical record construction, clamping and validity filtering.
 */

#include "src/normalize/inc/Normalizer.hpp"

#include <cmath>   // std::isfinite
#include <utility> // std::move

#include <fmt/core.h>

namespace gpumon {

namespace normalize {

using model::MetricRecord;
using model::MetricType;
using model::SeriesKey;

namespace {

constexpr double PERCENT_MIN = 0.0;
constexpr double PERCENT_MAX = 100.0;

void reject(NormalizeResult& out, SeriesKey key, double value, std::string reason) {
  ++out.invalidCount;
  out.invalid.push_back(InvalidValue{std::move(key), value, std::move(reason)});
}

/// Validate, clamp and classify one value, then append its record.
void emit(MetricType type, std::optional<double> raw, const std::optional<std::string>& deviceId,
          const CycleStamp& stamp, const NormalizerConfig& config, NormalizeResult& out) {
  if (!raw) {
    return;
  }
  const SeriesKey KEY = deviceId ? SeriesKey::device(*deviceId, type) : SeriesKey::host(type);
  double value = *raw;

  if (!std::isfinite(value)) {
    reject(out, KEY, value, "not a finite number");
    return;
  }
  if (type == MetricType::TempC &&
      (value < config.validity.minTempC || value > config.validity.maxTempC)) {
    reject(out, KEY, value,
           fmt::format("outside [{}, {}] C", config.validity.minTempC, config.validity.maxTempC));
    return;
  }

  if (model::isPercentage(type)) {
    if (value < PERCENT_MIN) {
      value = PERCENT_MIN;
      ++out.clampedCount;
    } else if (value > PERCENT_MAX) {
      value = PERCENT_MAX;
      ++out.clampedCount;
    }
  }

  out.records.emplace_back(stamp.cycleId, stamp.timestampNs, stamp.wallTimeNs, type, deviceId,
                           value, config.thresholds.forType(type).classify(value));
}

} // namespace

/* ----------------------------- InvalidValue ----------------------------- */

std::string InvalidValue::toString() const {
  return fmt::format("{} = {} ({})", key.toString(), value, reason);
}

std::string NormalizeResult::toString() const {
  return fmt::format("{} records, {} devices, {} clamped, {} invalid", records.size(),
                     devices.size(), clampedCount, invalidCount);
}

/* ----------------------------- API ----------------------------- */

std::optional<double> powerPercent(double drawW, std::optional<double> ratedMaxPowerW) noexcept {
  if (!ratedMaxPowerW || !std::isfinite(*ratedMaxPowerW) || *ratedMaxPowerW <= 0.0) {
    return std::nullopt;
  }
  return drawW / *ratedMaxPowerW * 100.0;
}

void normalizeDevice(const source::RawDeviceReading& reading, const std::string& source,
                     const CycleStamp& stamp, const NormalizerConfig& config,
                     NormalizeResult& out) {
  const std::optional<std::string> ID{reading.id};

  out.devices.push_back(model::Device{reading.id, reading.name, reading.ratedMaxPowerW, source});

  emit(MetricType::GpuUtil, reading.gpuUtilPct, ID, stamp, config, out);
  emit(MetricType::MemUtil, reading.memUtilPct, ID, stamp, config, out);

  if (reading.powerDrawW) {
    const double DRAW = *reading.powerDrawW;
    const SeriesKey KEY = SeriesKey::device(reading.id, MetricType::PowerPct);
    if (!std::isfinite(DRAW)) {
      reject(out, KEY, DRAW, "power draw is not a finite number");
    } else if (DRAW < 0.0) {
      reject(out, KEY, DRAW, "negative power draw");
    } else {
      emit(MetricType::PowerPct, powerPercent(DRAW, reading.ratedMaxPowerW), ID, stamp, config,
           out);
    }
  }

  emit(MetricType::TempC, reading.temperatureC, ID, stamp, config, out);
}

void normalizeHost(const source::RawHostReading& reading, const CycleStamp& stamp,
                   const NormalizerConfig& config, NormalizeResult& out) {
  emit(MetricType::CpuUtil, reading.cpuUtilPct, std::nullopt, stamp, config, out);
  emit(MetricType::RamUtil, reading.ramUtilPct, std::nullopt, stamp, config, out);
}

NormalizeResult normalize(const std::vector<source::PollResult>& polls, const CycleStamp& stamp,
                          const NormalizerConfig& config) {
  NormalizeResult out{};
  for (const auto& POLL : polls) {
    if (!POLL.ok()) {
      continue;
    }
    for (const auto& DEVICE : POLL.devices) {
      normalizeDevice(DEVICE, POLL.source, stamp, config, out);
    }
  }
  // Host records follow every device record.
  for (const auto& POLL : polls) {
    if (POLL.ok() && POLL.host) {
      normalizeHost(*POLL.host, stamp, config, out);
    }
  }
  return out;
}

} // namespace normalize

} // namespace gpumon
