#ifndef GPUMON_SOURCE_SCRIPTED_SOURCE_HPP
#define GPUMON_SOURCE_SCRIPTED_SOURCE_HPP
/**
 * @file ScriptedSource.hpp
 * @brief Deterministic source that replays scripted frames, one per poll.
 * @note Thread-safe: Frames are immutable; the frame cursor is atomic.
 *
 * Each inventory() call advances to the next frame (the last frame repeats,
 * or the script wraps around when looping). A frame either makes the whole
 * source unavailable or lists targets with a reading or an error each, plus an
 * optional artificial delay to exercise query deadlines.
 */

#include <atomic>  // std::atomic
#include <chrono>  // std::chrono::milliseconds
#include <cstddef> // std::size_t
#include <optional>
#include <string> // std::string
#include <vector> // std::vector

#include "src/source/inc/RawReading.hpp"

namespace gpumon {

namespace source {

/* ----------------------------- Script ----------------------------- */

/**
 * @brief Scripted answer for one target.
 */
struct ScriptedResponse {
  std::string target;
  QueryOutcome outcome;
  std::chrono::milliseconds delay{0}; ///< Sleep before answering
};

/**
 * @brief One poll's worth of scripted behavior.
 */
struct ScriptFrame {
  std::optional<std::string> unavailable; ///< Set: whole source unavailable with this reason
  std::vector<ScriptedResponse> responses;

  /// Frame where the source cannot be reached.
  [[nodiscard]] static ScriptFrame down(std::string reason);

  /// Append a successful device reading (target = reading.id).
  ScriptFrame& device(RawDeviceReading reading, std::chrono::milliseconds delay = {});

  /// Append a successful host reading (target = HOST_TARGET).
  ScriptFrame& host(RawHostReading reading, std::chrono::milliseconds delay = {});

  /// Append a failing target.
  ScriptFrame& fail(std::string target, std::string error, std::chrono::milliseconds delay = {});
};

/**
 * @brief Synthesize smooth, bounded GPU and host telemetry for demos.
 * @param deviceCount Number of simulated GPUs ("SIM-GPU-0", ...), rated 300 W.
 * @param frameCount Frames to generate (one per cycle).
 */
[[nodiscard]] std::vector<ScriptFrame> simulatedFrames(std::size_t deviceCount,
                                                       std::size_t frameCount);

/* ----------------------------- ScriptedSource ----------------------------- */

class ScriptedSource {
public:
  /**
   * @param name Source name used in diagnostics.
   * @param frames Script; an empty script behaves as permanently unavailable.
   * @param loop Wrap around after the last frame instead of repeating it.
   */
  ScriptedSource(std::string name, std::vector<ScriptFrame> frames, bool loop = false);

  ScriptedSource(const ScriptedSource&) = delete;
  ScriptedSource& operator=(const ScriptedSource&) = delete;

  [[nodiscard]] const char* name() const noexcept { return name_.c_str(); }

  /// Advance to the next frame and list its targets.
  [[nodiscard]] Inventory inventory() noexcept;

  /// Answer from the current frame (sleeping for the scripted delay first).
  [[nodiscard]] QueryOutcome query(const std::string& target) noexcept;

  /// Number of inventory() calls served so far.
  [[nodiscard]] std::size_t pollCount() const noexcept { return polls_.load(); }

private:
  [[nodiscard]] const ScriptFrame* currentFrame() const noexcept;

  std::string name_;
  std::vector<ScriptFrame> frames_;
  bool loop_;
  std::atomic<std::size_t> polls_{0};
};

} // namespace source

} // namespace gpumon

#endif // GPUMON_SOURCE_SCRIPTED_SOURCE_HPP
