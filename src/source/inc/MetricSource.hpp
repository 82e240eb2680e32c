#ifndef GPUMON_SOURCE_METRIC_SOURCE_HPP
#define GPUMON_SOURCE_METRIC_SOURCE_HPP
/**
 * @file MetricSource.hpp
 * @brief Closed set of telemetry backends and the uniform poll() over them.
 *
 * Backends are alternatives of one std::variant rather than a class hierarchy.
 * Every alternative provides the same capability:
 *   const char* name() const noexcept;
 *   Inventory inventory() noexcept;
 *   QueryOutcome query(const std::string& target) noexcept;
 * and poll() composes them: inventory, then a timed fan-out of query() over
 * every target.
 *
 * Alternatives are neither copyable nor movable; hold sources through
 * std::unique_ptr<MetricSource> and construct them in place.
 */

#include <memory>  // std::unique_ptr
#include <string>  // std::string
#include <utility> // std::forward
#include <variant> // std::variant
#include <vector>  // std::vector

#include "src/source/inc/HostSource.hpp"
#include "src/source/inc/NvmlGpuSource.hpp"
#include "src/source/inc/QueryFanout.hpp"
#include "src/source/inc/RawReading.hpp"
#include "src/source/inc/ScriptedSource.hpp"
#include "src/source/inc/SmiGpuSource.hpp"

namespace gpumon {

namespace source {

/* ----------------------------- MetricSource ----------------------------- */

/// Tagged union of supported backends.
using MetricSource = std::variant<NvmlGpuSource, SmiGpuSource, HostSource, ScriptedSource>;

/// Owned list of sources polled each cycle.
using SourceList = std::vector<std::unique_ptr<MetricSource>>;

/**
 * @brief Construct a source of kind @p Kind in place.
 */
template <typename Kind, typename... Args>
[[nodiscard]] std::unique_ptr<MetricSource> makeSource(Args&&... args) {
  return std::make_unique<MetricSource>(std::in_place_type<Kind>, std::forward<Args>(args)...);
}

/// Diagnostic name of the active backend.
[[nodiscard]] std::string sourceName(const MetricSource& source);

/**
 * @brief Poll one source for one cycle.
 * @param source Backend to poll.
 * @param fanout Runner for the inventory and the per-target queries (bounded
 *        parallelism, deadlines).
 * @return Readings and per-target errors, or the unavailable condition.
 *
 * A failing target never prevents the others from being reported. Duplicate
 * targets in the inventory are queried once. An inventory that misses the
 * deadline makes the source unavailable for this cycle.
 */
[[nodiscard]] PollResult poll(MetricSource& source, QueryFanout& fanout);

} // namespace source

} // namespace gpumon

#endif // GPUMON_SOURCE_METRIC_SOURCE_HPP
