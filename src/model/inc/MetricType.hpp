#ifndef GPUMON_MODEL_METRIC_TYPE_HPP
#define GPUMON_MODEL_METRIC_TYPE_HPP
/**
 * @file MetricType.hpp
 * @brief Closed set of monitored metric types and their scoping rules.
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 */

#include <array>       // std::array
#include <cstddef>     // std::size_t
#include <cstdint>     // std::uint8_t
#include <optional>    // std::optional
#include <string_view> // std::string_view

namespace gpumon {

namespace model {

/* ----------------------------- MetricType ----------------------------- */

/**
 * @brief Canonical metric types.
 *
 * GPU-class types are scoped to one device; CpuUtil and RamUtil describe the host.
 */
enum class MetricType : std::uint8_t {
  GpuUtil = 0,  ///< GPU compute utilization (%)
  MemUtil = 1,  ///< GPU memory bandwidth utilization (%)
  PowerPct = 2, ///< Power draw as a share of rated maximum power (%)
  TempC = 3,    ///< GPU temperature (Celsius)
  CpuUtil = 4,  ///< Host CPU utilization (%)
  RamUtil = 5,  ///< Host RAM utilization (%)
};

/// Number of MetricType values.
inline constexpr std::size_t METRIC_TYPE_COUNT = 6;

/// Every metric type in declaration order.
inline constexpr std::array<MetricType, METRIC_TYPE_COUNT> ALL_METRIC_TYPES{
    MetricType::GpuUtil, MetricType::MemUtil, MetricType::PowerPct,
    MetricType::TempC,   MetricType::CpuUtil, MetricType::RamUtil};

/// Device-scoped metric types.
inline constexpr std::array<MetricType, 4> GPU_METRIC_TYPES{
    MetricType::GpuUtil, MetricType::MemUtil, MetricType::PowerPct, MetricType::TempC};

/// Host-scoped metric types.
inline constexpr std::array<MetricType, 2> HOST_METRIC_TYPES{MetricType::CpuUtil,
                                                             MetricType::RamUtil};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Canonical lowercase name ("gpu_util", "temp_c", ...).
 * @note No allocation.
 */
[[nodiscard]] const char* toString(MetricType type) noexcept;

/**
 * @brief Parse a canonical name back into a MetricType.
 * @return nullopt for unknown names.
 */
[[nodiscard]] std::optional<MetricType> parseMetricType(std::string_view name) noexcept;

/// True for CpuUtil and RamUtil.
[[nodiscard]] constexpr bool isHostScoped(MetricType type) noexcept {
  return type == MetricType::CpuUtil || type == MetricType::RamUtil;
}

/// True for every type measured on a 0-100 scale (all except TempC).
[[nodiscard]] constexpr bool isPercentage(MetricType type) noexcept {
  return type != MetricType::TempC;
}

/// Index of @p type into per-type tables.
[[nodiscard]] constexpr std::size_t indexOf(MetricType type) noexcept {
  return static_cast<std::size_t>(type);
}

} // namespace model

} // namespace gpumon

#endif // GPUMON_MODEL_METRIC_TYPE_HPP
