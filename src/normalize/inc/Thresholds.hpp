#ifndef GPUMON_NORMALIZE_THRESHOLDS_HPP
#define GPUMON_NORMALIZE_THRESHOLDS_HPP
/**
 * @file Thresholds.hpp
 * @brief Ordered threshold tables mapping metric values to status buckets.
 * @note Thread-safe: Immutable after construction.
 *
 * A table is a list of bands sorted by lower bound. A value falls into the
 * last band whose lower bound is <= value (inclusive-lower, so a value equal
 * to a boundary lands in the higher-severity band); below the first band the
 * status is Normal.
 */

#include <array>  // std::array
#include <string> // std::string
#include <vector> // std::vector

#include "src/model/inc/MetricRecord.hpp"
#include "src/model/inc/MetricType.hpp"

namespace gpumon {

namespace normalize {

/* ----------------------------- ThresholdTable ----------------------------- */

/**
 * @brief One band: values >= lowerBound get @c status.
 */
struct Threshold {
  double lowerBound{0.0};
  model::Status status{model::Status::Normal};

  bool operator==(const Threshold& other) const = default;
};

class ThresholdTable {
public:
  /// Table that classifies everything as Normal.
  ThresholdTable() = default;

  explicit ThresholdTable(std::vector<Threshold> bands);

  /// Two-band table: warm at @p warmAt, hot at @p hotAt.
  [[nodiscard]] static ThresholdTable warmHot(double warmAt, double hotAt);

  /// Status bucket for @p value.
  [[nodiscard]] model::Status classify(double value) const noexcept;

  /**
   * @brief Check ordering: strictly ascending bounds, non-decreasing severity.
   * @param error Receives the reason on failure (may be null).
   */
  [[nodiscard]] bool isValid(std::string* error = nullptr) const;

  [[nodiscard]] const std::vector<Threshold>& bands() const noexcept { return bands_; }

  /// "warm>=60 hot>=80".
  [[nodiscard]] std::string toString() const;

private:
  std::vector<Threshold> bands_;
};

/* ----------------------------- Per-Type Tables ----------------------------- */

/**
 * @brief One threshold table per metric type.
 */
struct ThresholdSet {
  std::array<ThresholdTable, model::METRIC_TYPE_COUNT> tables{};

  [[nodiscard]] const ThresholdTable& forType(model::MetricType type) const noexcept {
    return tables[model::indexOf(type)];
  }
  [[nodiscard]] ThresholdTable& forType(model::MetricType type) noexcept {
    return tables[model::indexOf(type)];
  }

  /**
   * @brief Default tables.
   *
   *  - temp_c:    warm >= 60, hot >= 80
   *  - power_pct: warm >= 80, hot >= 95
   *  - gpu_util, mem_util, cpu_util, ram_util: warm >= 70, hot >= 90
   */
  [[nodiscard]] static ThresholdSet defaults();
};

} // namespace normalize

} // namespace gpumon

#endif // GPUMON_NORMALIZE_THRESHOLDS_HPP
