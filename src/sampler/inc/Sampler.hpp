#ifndef GPUMON_SAMPLER_SAMPLER_HPP
#define GPUMON_SAMPLER_SAMPLER_HPP
/**
 * @file Sampler.hpp
 * @brief Poll cycle driver: fan-out, normalize, append, publish.
 * @note Thread-safe. runCycle() calls are serialized; readers go through
 *       service() and never wait on a cycle in progress.
 *
 * One cycle walks Idle -> Polling -> Normalizing -> Publishing -> Idle:
 *  - Polling: every source is polled with a bounded-parallel, timed fan-out
 *  - Normalizing: readings become records stamped with the cycle id and time
 *  - Publishing: records are appended, the device set is updated and a new
 *    Snapshot is published
 *
 * An unavailable source degrades the cycle; it is retried on the next one.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include "src/history/inc/HistoryStore.hpp"
#include "src/normalize/inc/Normalizer.hpp"
#include "src/query/inc/SnapshotService.hpp"
#include "src/source/inc/MetricSource.hpp"
#include "src/source/inc/QueryFanout.hpp"

namespace gpumon {

namespace sampler {

/* ----------------------------- Phase ----------------------------- */

enum class Phase : std::uint8_t {
  Idle = 0,
  Polling = 1,
  Normalizing = 2,
  Publishing = 3,
};

/// Lowercase phase name.
[[nodiscard]] const char* toString(Phase phase) noexcept;

/* ----------------------------- Options ----------------------------- */

struct SamplerOptions {
  std::chrono::milliseconds interval{1000};
  source::FanoutOptions fanout{};
  history::HistoryOptions history{};
  normalize::NormalizerConfig normalizer{};
  bool includeHistory{true}; ///< Attach active series windows to each snapshot
};

/* ----------------------------- Sampler ----------------------------- */

class Sampler {
public:
  explicit Sampler(source::SourceList sources, SamplerOptions options = {});

  /// Stops the loop if running.
  ~Sampler();

  Sampler(const Sampler&) = delete;
  Sampler& operator=(const Sampler&) = delete;

  /**
   * @brief Execute exactly one cycle synchronously.
   * @return The snapshot published by this cycle.
   * @throws std::bad_alloc if the cycle cannot allocate; nothing is published and
   *         the phase returns to Idle.
   */
  std::shared_ptr<const query::Snapshot> runCycle();

  /**
   * @brief Run cycles on a background thread, one per interval.
   * @return false if the thread could not be started. Starting twice is a no-op.
   */
  bool start() noexcept;

  /// Request stop, let the in-flight cycle publish, and join. Idempotent.
  void stop() noexcept;

  [[nodiscard]] bool running() const noexcept { return running_.load(); }
  [[nodiscard]] Phase phase() const noexcept { return phase_.load(); }
  [[nodiscard]] std::uint64_t cycleCount() const noexcept { return cycle_.load(); }

  /// Read-side API.
  [[nodiscard]] const query::SnapshotService& service() const noexcept { return service_; }

  [[nodiscard]] const history::HistoryStore& history() const noexcept { return history_; }
  [[nodiscard]] const SamplerOptions& options() const noexcept { return options_; }
  [[nodiscard]] std::size_t sourceCount() const noexcept { return sources_.size(); }

private:
  void loop(std::stop_token stop) noexcept;
  /// Body of runCycle(); caller holds cycleMutex_.
  std::shared_ptr<const query::Snapshot> cycleLocked();
  void recordErrors(const std::vector<source::PollResult>& polls, query::Diagnostics& diag);
  void logDegradedTransition(const std::vector<source::SourceUnavailable>& unavailable);

  SamplerOptions options_;
  source::SourceList sources_;
  source::QueryFanout fanout_; ///< After sources_: parked workers are joined before sources go
  history::HistoryStore history_;
  query::SnapshotSlot slot_;
  query::SnapshotService service_;

  std::mutex cycleMutex_; ///< Serializes runCycle()
  std::atomic<Phase> phase_{Phase::Idle};
  std::atomic<std::uint64_t> cycle_{0};
  std::atomic<bool> running_{false};

  // Guarded by cycleMutex_.
  query::CumulativeCounters totals_{};
  std::map<std::string, std::uint64_t> errorsByDevice_;
  std::set<std::string> failingDevices_;
  bool degraded_{false};

  std::mutex controlMutex_; ///< Serializes start()/stop()
  std::mutex wakeMutex_;
  std::condition_variable_any wake_;
  std::jthread thread_;
};

} // namespace sampler

} // namespace gpumon

#endif // GPUMON_SAMPLER_SAMPLER_HPP
