/**
 * @file QueryFanout.cpp
 * @brief Worker-per-query fan-out with deadlines and parked stragglers.
 */

#include "src/source/inc/QueryFanout.hpp"

#include <algorithm> // std::min, std::max
#include <exception> // std::exception
#include <memory>    // std::make_shared
#include <system_error>
#include <utility> // std::move

#include <fmt/core.h>

namespace gpumon {

namespace source {

namespace {

/// Launched query awaiting its deadline.
struct InFlight {
  std::size_t index;
  std::thread worker;
  std::future<QueryOutcome> result;
};

/// Park key for a source's inventory; '<' never appears in device ids.
constexpr const char* INVENTORY_KEY = "<inventory>";

std::string parkKey(const std::string& scope, const std::string& target) {
  return scope + "/" + target;
}

/// Readiness check that owns @p result.
template <typename T> std::function<bool()> readiness(std::future<T> result) {
  auto shared = std::make_shared<std::future<T>>(std::move(result));
  return [shared]() {
    return shared->wait_for(std::chrono::seconds(0)) == std::future_status::ready;
  };
}

} // namespace

/* ----------------------------- Lifecycle ----------------------------- */

QueryFanout::QueryFanout(FanoutOptions options) : options_(options) {
  options_.maxParallel = std::max<std::size_t>(options_.maxParallel, 1);
}

QueryFanout::~QueryFanout() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& entry : parked_) {
    if (entry.second.worker.joinable()) {
      entry.second.worker.join();
    }
  }
  parked_.clear();
}

/* ----------------------------- API ----------------------------- */

std::size_t QueryFanout::pendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return parked_.size();
}

void QueryFanout::reapFinished() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = parked_.begin(); it != parked_.end();) {
    if (it->second.finished()) {
      it->second.worker.join();
      it = parked_.erase(it);
    } else {
      ++it;
    }
  }
}

std::vector<TargetResult> QueryFanout::run(const std::string& scope,
                                           const std::vector<std::string>& targets,
                                           const QueryFn& query) {
  reapFinished();

  std::vector<TargetResult> results(targets.size());
  for (std::size_t i = 0; i < targets.size(); ++i) {
    results[i].target = targets[i];
  }

  for (std::size_t batchStart = 0; batchStart < targets.size();
       batchStart += options_.maxParallel) {
    const std::size_t BATCH_END = std::min(targets.size(), batchStart + options_.maxParallel);
    std::vector<InFlight> inFlight;
    inFlight.reserve(BATCH_END - batchStart);

    for (std::size_t i = batchStart; i < BATCH_END; ++i) {
      const std::string& TARGET = targets[i];
      if (isParked(parkKey(scope, TARGET))) {
        results[i].outcome = QueryOutcome::failure("previous query still running");
        results[i].errorKind = QueryErrorKind::Pending;
        continue;
      }

      std::packaged_task<QueryOutcome()> task([query, TARGET]() {
        try {
          return query(TARGET);
        } catch (const std::exception& e) {
          return QueryOutcome::failure(fmt::format("query threw: {}", e.what()));
        }
      });
      std::future<QueryOutcome> result = task.get_future();
      try {
        inFlight.push_back(InFlight{i, std::thread(std::move(task)), std::move(result)});
      } catch (const std::system_error& e) {
        results[i].outcome = QueryOutcome::failure(fmt::format("cannot start query: {}", e.what()));
        results[i].errorKind = QueryErrorKind::Backend;
      }
    }

    const auto DEADLINE = std::chrono::steady_clock::now() + options_.timeout;
    for (InFlight& flight : inFlight) {
      TargetResult& out = results[flight.index];
      if (flight.result.wait_until(DEADLINE) == std::future_status::ready) {
        out.outcome = flight.result.get();
        out.errorKind = QueryErrorKind::Backend;
        flight.worker.join();
        continue;
      }

      out.outcome = QueryOutcome::failure(
          fmt::format("no response within {} ms", options_.timeout.count()));
      out.errorKind = QueryErrorKind::Timeout;
      park(parkKey(scope, out.target), std::move(flight.worker),
           readiness(std::move(flight.result)));
    }
  }

  return results;
}

Inventory QueryFanout::runInventory(const std::string& scope, const InventoryFn& list) {
  reapFinished();

  const std::string KEY = parkKey(scope, INVENTORY_KEY);
  if (isParked(KEY)) {
    return Inventory::unavailableBecause(scope, "previous inventory still running");
  }

  std::packaged_task<Inventory()> task([list, scope]() {
    try {
      return list();
    } catch (const std::exception& e) {
      return Inventory::unavailableBecause(scope, fmt::format("inventory threw: {}", e.what()));
    }
  });
  std::future<Inventory> result = task.get_future();
  std::thread worker;
  try {
    worker = std::thread(std::move(task));
  } catch (const std::system_error& e) {
    return Inventory::unavailableBecause(scope,
                                         fmt::format("cannot start inventory: {}", e.what()));
  }

  if (result.wait_for(options_.timeout) == std::future_status::ready) {
    worker.join();
    return result.get();
  }

  park(KEY, std::move(worker), readiness(std::move(result)));
  return Inventory::unavailableBecause(
      scope, fmt::format("inventory timed out after {} ms", options_.timeout.count()));
}

bool QueryFanout::isParked(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return parked_.count(key) != 0;
}

void QueryFanout::park(const std::string& key, std::thread worker,
                       std::function<bool()> finished) {
  std::unique_lock<std::mutex> lock(mutex_);
  auto [slot, inserted] = parked_.try_emplace(key);
  if (inserted) {
    slot->second.worker = std::move(worker);
    slot->second.finished = std::move(finished);
    return;
  }
  lock.unlock();
  // Duplicate target in one batch: only one worker can be parked per key.
  worker.join();
}

} // namespace source

} // namespace gpumon
