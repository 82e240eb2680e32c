#ifndef GPUMON_HELPERS_ARGS_HPP
#define GPUMON_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief Command-line flag parsing for the gpumon tools.
 *
 * Flags have a fixed value count. Unknown tokens are rejected so that typos
 * surface instead of being silently ignored.
 *
 * @note Cold-path: Allocates.
 */

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "src/helpers/inc/Strings.hpp"

namespace gpumon {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition of one flag.
 */
struct ArgDef {
  std::string_view flag;               ///< e.g. "--interval"
  std::uint8_t nargs{0};               ///< Values consumed after the flag
  std::string_view desc{};             ///< Help text
  std::string_view valueName{"value"}; ///< Placeholder shown in help, e.g. "ms"
};

/// Key -> flag definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Key -> values given for that flag (last occurrence wins).
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse @p args against @p map.
 * @param args Tokens after the program name (views must outlive @p pargs)
 * @param map Accepted flags
 * @param pargs Receives the parsed values
 * @param error Receives the reason on failure
 * @return false on an unknown flag or a missing value.
 */
[[nodiscard]] inline bool parseArgs(std::span<const std::string_view> args, const ArgMap& map,
                                    ParsedArgs& pargs, std::string& error) {
  std::unordered_map<std::string_view, std::uint8_t> byFlag;
  byFlag.reserve(map.size());
  for (const auto& [KEY, DEF] : map) {
    byFlag.emplace(DEF.flag, KEY);
  }

  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto IT = byFlag.find(args[i]);
    if (IT == byFlag.end()) {
      error = fmt::format("unknown argument '{}'", args[i]);
      return false;
    }
    const ArgDef& DEF = map.at(IT->second);
    if (i + DEF.nargs >= args.size()) {
      error = fmt::format("'{}' expects {} value(s)", DEF.flag, DEF.nargs);
      return false;
    }
    std::vector<std::string_view>& values = pargs[IT->second];
    values.assign(args.begin() + static_cast<std::ptrdiff_t>(i + 1),
                  args.begin() + static_cast<std::ptrdiff_t>(i + 1 + DEF.nargs));
    i += DEF.nargs;
  }
  return true;
}

/// True when flag @p key was given.
[[nodiscard]] inline bool has(const ParsedArgs& pargs, std::uint8_t key) {
  return pargs.count(key) != 0;
}

/// First value of flag @p key, if given.
[[nodiscard]] inline std::optional<std::string_view> value(const ParsedArgs& pargs,
                                                           std::uint8_t key) {
  const auto IT = pargs.find(key);
  if (IT == pargs.end() || IT->second.empty()) {
    return std::nullopt;
  }
  return IT->second.front();
}

/// First value of flag @p key as a non-negative integer; nullopt if absent or malformed.
[[nodiscard]] inline std::optional<std::uint64_t> unsignedValue(const ParsedArgs& pargs,
                                                                std::uint8_t key) {
  const std::optional<std::string_view> TEXT = value(pargs, key);
  if (!TEXT) {
    return std::nullopt;
  }
  const std::optional<double> NUM = strings::parseDouble(*TEXT);
  if (!NUM || *NUM < 0.0 || *NUM != static_cast<double>(static_cast<std::uint64_t>(*NUM))) {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(*NUM);
}

/**
 * @brief Print usage for a tool, flags sorted alphabetically.
 */
inline void printUsage(const char* progName, std::string_view description, const ArgMap& map) {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);
  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }
  fmt::print("Options:\n");

  std::vector<std::pair<std::string, const ArgDef*>> entries;
  entries.reserve(map.size());
  for (const auto& [KEY, DEF] : map) {
    std::string label(DEF.flag);
    for (std::uint8_t k = 0; k < DEF.nargs; ++k) {
      label += fmt::format(" <{}>", DEF.valueName);
    }
    entries.emplace_back(std::move(label), &DEF);
  }
  std::sort(entries.begin(), entries.end(),
            [](const auto& a, const auto& b) { return a.second->flag < b.second->flag; });

  std::size_t width = 16;
  for (const auto& ENTRY : entries) {
    width = std::max(width, ENTRY.first.size());
  }

  for (const auto& [LABEL, DEF] : entries) {
    fmt::print("  {:<{}}  {}\n", LABEL, width, DEF->desc);
  }
}

} // namespace args
} // namespace helpers
} // namespace gpumon

#endif // GPUMON_HELPERS_ARGS_HPP
