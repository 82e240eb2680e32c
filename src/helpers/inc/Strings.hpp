#ifndef GPUMON_HELPERS_STRINGS_HPP
#define GPUMON_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief String helpers for parsing tool output and procfs text.
 *
 * View-based helpers never allocate. Field splitting allocates the result vector only.
 */

#include <cerrno>
#include <cmath>
#include <cstddef>
#include <cstdlib> // strtod
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gpumon {
namespace helpers {
namespace strings {

/* ----------------------------- Parsing ----------------------------- */

/// Trim spaces, tabs, CR and LF from both ends.
[[nodiscard]] inline std::string_view trim(std::string_view text) noexcept {
  auto isSpace = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
  while (!text.empty() && isSpace(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && isSpace(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

/**
 * @brief Split on a delimiter and trim each field.
 * @param line Input text (a single line).
 * @param delim Field separator.
 * @return Trimmed views into @p line; empty fields are kept.
 */
[[nodiscard]] inline std::vector<std::string_view> splitFields(std::string_view line, char delim) {
  std::vector<std::string_view> fields;
  std::size_t start = 0;
  while (true) {
    const std::size_t POS = line.find(delim, start);
    if (POS == std::string_view::npos) {
      fields.push_back(trim(line.substr(start)));
      break;
    }
    fields.push_back(trim(line.substr(start, POS - start)));
    start = POS + 1;
  }
  return fields;
}

/**
 * @brief Parse a finite decimal number occupying the whole field.
 * @param field Trimmed text, e.g. "151.32".
 * @return Value, or nullopt for "[N/A]", "[Not Supported]", empty or partial input.
 */
[[nodiscard]] inline std::optional<double> parseDouble(std::string_view field) {
  field = trim(field);
  if (field.empty()) {
    return std::nullopt;
  }
  const std::string COPY(field);
  char* end = nullptr;
  errno = 0;
  const double VAL = std::strtod(COPY.c_str(), &end);
  if (end != COPY.c_str() + COPY.size() || errno == ERANGE || !std::isfinite(VAL)) {
    return std::nullopt;
  }
  return VAL;
}

/* ----------------------------- Manipulation ----------------------------- */

/**
 * @brief Strip trailing whitespace in-place.
 * @param buf Buffer to modify (null-terminated).
 * @param len Current string length (will be updated).
 */
inline void stripTrailingWhitespace(char* buf, std::size_t& len) noexcept {
  if (buf == nullptr) {
    return;
  }

  while (len > 0) {
    const char C = buf[len - 1];
    if (C == '\n' || C == '\r' || C == ' ' || C == '\t') {
      --len;
      buf[len] = '\0';
    } else {
      break;
    }
  }
}

/// ASCII lowercase copy.
[[nodiscard]] inline std::string toLower(std::string_view text) {
  std::string out(text);
  for (char& c : out) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  return out;
}

} // namespace strings
} // namespace helpers
} // namespace gpumon

#endif // GPUMON_HELPERS_STRINGS_HPP
