#ifndef GPUMON_SOURCE_QUERY_FANOUT_HPP
#define GPUMON_SOURCE_QUERY_FANOUT_HPP
/**
 * @file QueryFanout.hpp
 * @brief Bounded-parallel, deadline-bounded execution of per-target queries.
 * @note NOT thread-safe for concurrent run() calls: one cycle driver owns it.
 *       pendingCount() may be called from any thread.
 *
 * Each target query runs on its own worker thread, at most maxParallel at a
 * time. A query that misses its deadline is reported as a Timeout error and its
 * worker is parked: the same target is reported as Pending (and not launched
 * again) until the parked worker finishes. Parked workers are joined as soon as
 * they finish, or at destruction, so no thread ever outlives the fan-out.
 *
 * A source's inventory runs the same way under the same deadline. A late
 * inventory makes the source unavailable for the cycle.
 */

#include <chrono>     // std::chrono::milliseconds
#include <cstddef>    // std::size_t
#include <functional> // std::function
#include <future>     // std::future
#include <map>        // std::map
#include <mutex>      // std::mutex
#include <string>     // std::string
#include <thread>     // std::thread
#include <vector>     // std::vector

#include "src/source/inc/RawReading.hpp"

namespace gpumon {

namespace source {

/* ----------------------------- Options ----------------------------- */

/**
 * @brief Fan-out limits.
 */
struct FanoutOptions {
  std::chrono::milliseconds timeout{750}; ///< Per-query deadline
  std::size_t maxParallel{4};             ///< Concurrent queries per batch (0 treated as 1)
};

/* ----------------------------- TargetResult ----------------------------- */

/**
 * @brief Outcome of one target, annotated with the failure kind.
 */
struct TargetResult {
  std::string target;
  QueryOutcome outcome;
  QueryErrorKind errorKind{QueryErrorKind::Backend}; ///< Meaningful only when !outcome.ok()
};

/* ----------------------------- QueryFanout ----------------------------- */

class QueryFanout {
public:
  using QueryFn = std::function<QueryOutcome(const std::string& target)>;
  using InventoryFn = std::function<Inventory()>;

  explicit QueryFanout(FanoutOptions options = {});
  ~QueryFanout();

  QueryFanout(const QueryFanout&) = delete;
  QueryFanout& operator=(const QueryFanout&) = delete;

  /**
   * @brief Query every target and wait for all of them (or their deadlines).
   * @param scope Namespace for parked-worker bookkeeping (the source name).
   * @param targets Targets in the order results should be returned.
   * @param query Query callable; copied into each worker, may throw.
   * @return One result per target, in input order.
   */
  [[nodiscard]] std::vector<TargetResult> run(const std::string& scope,
                                              const std::vector<std::string>& targets,
                                              const QueryFn& query);

  /**
   * @brief List a source's targets under the query deadline.
   * @param scope Source name; also the SourceUnavailable::source on failure.
   * @param list Inventory callable, may throw.
   * @return The inventory, or unavailable when it timed out, threw, or the
   *         previous inventory for @p scope is still running.
   */
  [[nodiscard]] Inventory runInventory(const std::string& scope, const InventoryFn& list);

  /// Number of parked workers still running past their deadline.
  [[nodiscard]] std::size_t pendingCount() const;

  [[nodiscard]] const FanoutOptions& options() const noexcept { return options_; }

private:
  struct Parked {
    std::thread worker;
    std::function<bool()> finished; ///< True once the worker's task has returned
  };

  /// Join parked workers whose query has completed.
  void reapFinished();

  /// True if a worker is parked under @p key.
  [[nodiscard]] bool isParked(const std::string& key) const;

  /// Keep a late worker until it finishes. Joins it if @p key is already taken.
  void park(const std::string& key, std::thread worker, std::function<bool()> finished);

  FanoutOptions options_;
  mutable std::mutex mutex_;
  std::map<std::string, Parked> parked_; ///< Keyed by scope + '/' + target (or inventory)
};

} // namespace source

} // namespace gpumon

#endif // GPUMON_SOURCE_QUERY_FANOUT_HPP
