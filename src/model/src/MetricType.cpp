/**
 * @file MetricType.cpp
 * @brief MetricType names and parsing.
 */

#include "src/model/inc/MetricType.hpp"

namespace gpumon {

namespace model {

const char* toString(MetricType type) noexcept {
  switch (type) {
  case MetricType::GpuUtil:
    return "gpu_util";
  case MetricType::MemUtil:
    return "mem_util";
  case MetricType::PowerPct:
    return "power_pct";
  case MetricType::TempC:
    return "temp_c";
  case MetricType::CpuUtil:
    return "cpu_util";
  case MetricType::RamUtil:
    return "ram_util";
  }
  return "unknown";
}

std::optional<MetricType> parseMetricType(std::string_view name) noexcept {
  for (const MetricType TYPE : ALL_METRIC_TYPES) {
    if (name == toString(TYPE)) {
      return TYPE;
    }
  }
  return std::nullopt;
}

} // namespace model

} // namespace gpumon
