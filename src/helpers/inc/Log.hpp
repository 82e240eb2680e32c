#ifndef GPUMON_HELPERS_LOG_HPP
#define GPUMON_HELPERS_LOG_HPP
/**
 * @file Log.hpp
 * @brief Shared spdlog logger for the library and tools.
 *
 * All components log through one named logger ("gpumon") writing to stderr so
 * tool output on stdout (tables, JSON) stays machine-readable.
 */

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace gpumon {
namespace helpers {
namespace log {

/// Logger name registered with spdlog.
inline constexpr const char* LOGGER_NAME = "gpumon";

/**
 * @brief Get the process-wide logger, creating it on first use.
 * @note Thread-safe: initialization of the function-local static is serialized.
 */
[[nodiscard]] inline std::shared_ptr<spdlog::logger> logger() {
  static const std::shared_ptr<spdlog::logger> INSTANCE = [] {
    std::shared_ptr<spdlog::logger> existing = spdlog::get(LOGGER_NAME);
    if (existing) {
      return existing;
    }
    std::shared_ptr<spdlog::logger> created = spdlog::stderr_color_mt(LOGGER_NAME);
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    created->set_level(spdlog::level::info);
    return created;
  }();
  return INSTANCE;
}

/**
 * @brief Set the logger level from its name ("trace", "debug", "info", "warn", "error", "off").
 * @return false if the name is not a known level (level unchanged).
 */
inline bool setLevel(std::string_view name) {
  const spdlog::level::level_enum LEVEL = spdlog::level::from_str(std::string(name));
  // from_str() maps unknown names to "off"; only accept "off" when asked for explicitly.
  if (LEVEL == spdlog::level::off && name != "off") {
    return false;
  }
  logger()->set_level(LEVEL);
  return true;
}

} // namespace log
} // namespace helpers
} // namespace gpumon

#endif // GPUMON_HELPERS_LOG_HPP
