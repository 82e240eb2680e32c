#ifndef GPUMON_HELPERS_FORMAT_HPP
#define GPUMON_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief Human-readable formatting for metric values and timestamps.
 *
 * Uses fmt for all string building. Cold path only (tool output, logging).
 * jsonEscape() covers the string escaping needed by single-line JSON output.
 */

#include <cstdint>
#include <ctime> // localtime_r, time_t
#include <string>
#include <string_view>

#include <fmt/core.h>
#include <fmt/format.h>

namespace gpumon {
namespace helpers {
namespace format {

/* ----------------------------- API ----------------------------- */

/**
 * @brief Format a wall-clock timestamp as local HH:MM:SS.
 * @param wallNs Nanoseconds since the Unix epoch.
 * @return "--:--:--" when the timestamp is zero.
 */
[[nodiscard]] inline std::string timeOfDay(std::uint64_t wallNs) {
  if (wallNs == 0) {
    return "--:--:--";
  }
  const std::time_t SECS = static_cast<std::time_t>(wallNs / 1'000'000'000ULL);
  struct tm local{};
  if (::localtime_r(&SECS, &local) == nullptr) {
    return "--:--:--";
  }
  return fmt::format("{:02}:{:02}:{:02}", local.tm_hour, local.tm_min, local.tm_sec);
}

/// Format a percentage with one decimal ("42.5%").
[[nodiscard]] inline std::string percent(double value) { return fmt::format("{:.1f}%", value); }

/// Format a temperature in Celsius with one decimal ("71.0 C").
[[nodiscard]] inline std::string celsius(double value) { return fmt::format("{:.1f} C", value); }

/// Format a nanosecond duration as milliseconds ("12.34 ms").
[[nodiscard]] inline std::string durationMs(std::uint64_t ns) {
  return fmt::format("{:.2f} ms", static_cast<double>(ns) / 1'000'000.0);
}

/**
 * @brief Escape text for use inside a JSON string literal.
 *
 * Quotes, backslashes and all control characters are escaped; other bytes
 * (UTF-8 included) pass through unchanged.
 */
[[nodiscard]] inline std::string jsonEscape(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char C : text) {
    switch (C) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(C) < 0x20) {
        out += fmt::format("\\u{:04x}", static_cast<unsigned>(static_cast<unsigned char>(C)));
      } else {
        out += C;
      }
    }
  }
  return out;
}

} // namespace format
} // namespace helpers
} // namespace gpumon

#endif // GPUMON_HELPERS_FORMAT_HPP
