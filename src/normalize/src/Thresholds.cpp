/**
 * @file Thresholds.cpp
 * @brief Threshold classification and validation.
 */

#include "src/normalize/inc/Thresholds.hpp"

#include <utility> // std::move

#include <fmt/core.h>

namespace gpumon {

namespace normalize {

using model::MetricType;
using model::Status;

/* ----------------------------- ThresholdTable ----------------------------- */

ThresholdTable::ThresholdTable(std::vector<Threshold> bands) : bands_(std::move(bands)) {}

ThresholdTable ThresholdTable::warmHot(double warmAt, double hotAt) {
  return ThresholdTable({Threshold{warmAt, Status::Warm}, Threshold{hotAt, Status::Hot}});
}

Status ThresholdTable::classify(double value) const noexcept {
  Status status = Status::Normal;
  for (const auto& BAND : bands_) {
    if (value >= BAND.lowerBound) {
      status = BAND.status;
    } else {
      break;
    }
  }
  return status;
}

bool ThresholdTable::isValid(std::string* error) const {
  for (std::size_t i = 1; i < bands_.size(); ++i) {
    if (!(bands_[i].lowerBound > bands_[i - 1].lowerBound)) {
      if (error != nullptr) {
        *error = fmt::format("threshold {} ({}) is not above threshold {} ({})", i,
                             bands_[i].lowerBound, i - 1, bands_[i - 1].lowerBound);
      }
      return false;
    }
    if (bands_[i].status < bands_[i - 1].status) {
      if (error != nullptr) {
        *error = fmt::format("threshold {} lowers severity from {} to {}", i,
                             model::toString(bands_[i - 1].status),
                             model::toString(bands_[i].status));
      }
      return false;
    }
  }
  return true;
}

std::string ThresholdTable::toString() const {
  if (bands_.empty()) {
    return "always normal";
  }
  std::string out;
  for (const auto& BAND : bands_) {
    if (!out.empty()) {
      out += ' ';
    }
    out += fmt::format("{}>={}", model::toString(BAND.status), BAND.lowerBound);
  }
  return out;
}

/* ----------------------------- ThresholdSet ----------------------------- */

ThresholdSet ThresholdSet::defaults() {
  ThresholdSet set{};
  set.forType(MetricType::TempC) = ThresholdTable::warmHot(60.0, 80.0);
  set.forType(MetricType::PowerPct) = ThresholdTable::warmHot(80.0, 95.0);
  set.forType(MetricType::GpuUtil) = ThresholdTable::warmHot(70.0, 90.0);
  set.forType(MetricType::MemUtil) = ThresholdTable::warmHot(70.0, 90.0);
  set.forType(MetricType::CpuUtil) = ThresholdTable::warmHot(70.0, 90.0);
  set.forType(MetricType::RamUtil) = ThresholdTable::warmHot(70.0, 90.0);
  return set;
}

} // namespace normalize

} // namespace gpumon
