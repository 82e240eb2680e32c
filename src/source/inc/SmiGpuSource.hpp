#ifndef GPUMON_SOURCE_SMI_GPU_SOURCE_HPP
#define GPUMON_SOURCE_SMI_GPU_SOURCE_HPP
/**
 * @file SmiGpuSource.hpp
 * @brief NVIDIA GPU telemetry by running the nvidia-smi command-line tool.
 * @note Linux-only. Spawns one nvidia-smi process for the inventory and one per
 *       device query, each killed at its deadline. Slower than NVML; used when
 *       NVML is not available.
 * @note Thread-safe: Holds no mutable state after construction.
 *
 * Output format (--format=csv,noheader,nounits), one line per GPU:
 *   inventory: uuid, name, power.max_limit
 *   query:     uuid, name, power.max_limit, utilization.gpu, utilization.memory,
 *              power.draw, temperature.gpu, memory.used, memory.total
 * Fields reading "[N/A]" or "[Not Supported]" are treated as absent.
 */

#include <chrono>      // std::chrono::milliseconds
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

#include "src/source/inc/RawReading.hpp"

namespace gpumon {

namespace source {

/* ----------------------------- Command Runner ----------------------------- */

/**
 * @brief Captured result of a shell command.
 */
struct CommandResult {
  bool launched{false}; ///< False if the process could not be spawned
  bool timedOut{false}; ///< Killed at the deadline; output may be partial
  int exitCode{-1};     ///< Exit status (127 when the shell cannot find the binary)
  std::string output;   ///< Captured stdout
};

/// Default deadline for one nvidia-smi invocation.
inline constexpr std::chrono::milliseconds DEFAULT_COMMAND_TIMEOUT{5000};

/**
 * @brief Run a command through /bin/sh and capture stdout (stderr is discarded).
 * @param command Shell command line
 * @param timeout Deadline; on expiry the command's whole process group is killed
 * @note Blocks for at most @p timeout plus the time to reap the killed process.
 */
[[nodiscard]] CommandResult runCommand(const std::string& command,
                                       std::chrono::milliseconds timeout =
                                           DEFAULT_COMMAND_TIMEOUT) noexcept;

/**
 * @brief Quote a string for safe use as one /bin/sh argument.
 */
[[nodiscard]] std::string shellQuote(std::string_view arg);

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief One line of inventory output.
 */
struct SmiInventoryEntry {
  std::string uuid;
  std::string name;
  std::optional<double> ratedMaxPowerW;
};

/**
 * @brief Parse inventory output (uuid, name, power.max_limit per line).
 * @return Entries in output order; malformed lines are skipped.
 */
[[nodiscard]] std::vector<SmiInventoryEntry> parseSmiInventory(std::string_view text);

/**
 * @brief Parse one device query line (9 fields, see file comment).
 * @return nullopt if the line has the wrong field count or no uuid.
 */
[[nodiscard]] std::optional<RawDeviceReading> parseSmiDeviceLine(std::string_view line);

/* ----------------------------- SmiGpuSource ----------------------------- */

class SmiGpuSource {
public:
  /**
   * @param binary Executable to run: a bare name resolved through PATH, or a path.
   * @param commandTimeout Each invocation is killed after this long.
   */
  explicit SmiGpuSource(std::string binary = "nvidia-smi",
                        std::chrono::milliseconds commandTimeout = DEFAULT_COMMAND_TIMEOUT);

  SmiGpuSource(const SmiGpuSource&) = delete;
  SmiGpuSource& operator=(const SmiGpuSource&) = delete;

  /// Source name used in diagnostics.
  [[nodiscard]] const char* name() const noexcept { return "nvidia-smi"; }

  [[nodiscard]] const std::string& binary() const noexcept { return binary_; }

  [[nodiscard]] std::chrono::milliseconds commandTimeout() const noexcept {
    return commandTimeout_;
  }

  /**
   * @brief List GPU UUIDs.
   * @return Unavailable when the tool is missing, fails, or lists no devices.
   */
  [[nodiscard]] Inventory inventory() noexcept;

  /**
   * @brief Query one GPU by UUID.
   */
  [[nodiscard]] QueryOutcome query(const std::string& target) noexcept;

private:
  std::string binary_;
  std::chrono::milliseconds commandTimeout_;
};

} // namespace source

} // namespace gpumon

#endif // GPUMON_SOURCE_SMI_GPU_SOURCE_HPP
