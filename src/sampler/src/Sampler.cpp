/**
 * @file Sampler.cpp
 * @brief Poll cycle implementation and background loop.
 */

#include "src/sampler/inc/Sampler.hpp"

#include <cmath>        // std::isfinite
#include <new>          // std::bad_alloc
#include <optional>
#include <system_error> // std::system_error
#include <utility>      // std::move
#include <vector>

#include <fmt/core.h>

#include "src/helpers/inc/Clock.hpp"
#include "src/helpers/inc/Log.hpp"

namespace gpumon {

namespace sampler {

using helpers::log::logger;

namespace {

/// Finite, non-negative values only.
std::optional<double> displayable(const std::optional<double>& value) {
  if (value && std::isfinite(*value) && *value >= 0.0) {
    return value;
  }
  return std::nullopt;
}

/// Absolute power and memory values of every device queried this cycle.
std::map<std::string, query::DeviceReadout>
collectReadouts(const std::vector<source::PollResult>& polls) {
  std::map<std::string, query::DeviceReadout> readouts;
  for (const auto& POLL : polls) {
    for (const auto& DEVICE : POLL.devices) {
      query::DeviceReadout readout{displayable(DEVICE.powerDrawW), displayable(DEVICE.memUsedMiB),
                                   displayable(DEVICE.memTotalMiB)};
      if (readout.powerDrawW || readout.memUsedMiB || readout.memTotalMiB) {
        readouts.emplace(DEVICE.id, readout);
      }
    }
  }
  return readouts;
}

} // namespace

/* ----------------------------- Phase ----------------------------- */

const char* toString(Phase phase) noexcept {
  switch (phase) {
  case Phase::Idle:
    return "idle";
  case Phase::Polling:
    return "polling";
  case Phase::Normalizing:
    return "normalizing";
  case Phase::Publishing:
    return "publishing";
  }
  return "unknown";
}

/* ----------------------------- Lifecycle ----------------------------- */

Sampler::Sampler(source::SourceList sources, SamplerOptions options)
    : options_(std::move(options)), sources_(std::move(sources)), fanout_(options_.fanout),
      history_(options_.history), service_(slot_, history_) {}

Sampler::~Sampler() { stop(); }

bool Sampler::start() noexcept {
  std::lock_guard<std::mutex> lock(controlMutex_);
  if (thread_.joinable()) {
    return true;
  }
  try {
    thread_ = std::jthread([this](std::stop_token stop) { loop(stop); });
  } catch (const std::system_error& e) {
    logger()->error("cannot start sampler thread: {}", e.what());
    return false;
  }
  running_.store(true);
  logger()->info("sampler started: {} sources, interval {} ms, timeout {} ms", sources_.size(),
                 options_.interval.count(), options_.fanout.timeout.count());
  return true;
}

void Sampler::stop() noexcept {
  std::lock_guard<std::mutex> lock(controlMutex_);
  if (!thread_.joinable()) {
    return;
  }
  thread_.request_stop();
  thread_.join();
  thread_ = std::jthread{};
  running_.store(false);
  logger()->info("sampler stopped after {} cycles", cycle_.load());
}

void Sampler::loop(std::stop_token stop) noexcept {
  while (!stop.stop_requested()) {
    const auto NEXT = std::chrono::steady_clock::now() + options_.interval;
    try {
      (void)runCycle();
    } catch (const std::bad_alloc& e) {
      logger()->error("cycle {} skipped: {}", cycle_.load() + 1, e.what());
    }
    std::unique_lock<std::mutex> lock(wakeMutex_);
    // Returns early only on stop request.
    (void)wake_.wait_until(lock, stop, NEXT, [] { return false; });
  }
}

/* ----------------------------- Cycle ----------------------------- */

std::shared_ptr<const query::Snapshot> Sampler::runCycle() {
  std::lock_guard<std::mutex> lock(cycleMutex_);
  try {
    return cycleLocked();
  } catch (const std::bad_alloc&) {
    phase_.store(Phase::Idle);
    throw;
  }
}

std::shared_ptr<const query::Snapshot> Sampler::cycleLocked() {
  const std::uint64_t START_NS = helpers::clock::getMonotonicNs();
  const normalize::CycleStamp STAMP{cycle_.load() + 1, START_NS,
                                    helpers::clock::getRealtimeNs()};

  /* ----- Polling ----- */
  phase_.store(Phase::Polling);
  std::vector<source::PollResult> polls;
  polls.reserve(sources_.size());
  for (auto& src : sources_) {
    polls.push_back(source::poll(*src, fanout_));
  }

  /* ----- Normalizing ----- */
  phase_.store(Phase::Normalizing);
  normalize::NormalizeResult normalized = normalize::normalize(polls, STAMP, options_.normalizer);

  /* ----- Publishing ----- */
  phase_.store(Phase::Publishing);
  auto snapshot = std::make_shared<query::Snapshot>();
  snapshot->cycleId = STAMP.cycleId;
  snapshot->timestampNs = STAMP.timestampNs;
  snapshot->wallTimeNs = STAMP.wallTimeNs;

  for (const auto& RECORD : normalized.records) {
    history_.append(RECORD);
    snapshot->latest.emplace(RECORD.key(), RECORD);
  }

  std::vector<history::SourceInventory> reporting;
  for (const auto& POLL : polls) {
    if (!POLL.ok()) {
      continue;
    }
    history::SourceInventory inventory{POLL.source, {}};
    for (const auto& TARGET : POLL.inventory) {
      if (TARGET != source::HOST_TARGET) {
        inventory.targets.push_back(TARGET);
      }
    }
    reporting.push_back(std::move(inventory));
  }
  const history::DeviceChanges CHANGES =
      history_.observeDevices(normalized.devices, reporting, STAMP.cycleId);
  for (const auto& ID : CHANGES.added) {
    logger()->info("device {} added", ID);
  }
  for (const auto& ID : CHANGES.returned) {
    logger()->info("device {} returned", ID);
  }
  for (const auto& ID : CHANGES.retired) {
    logger()->warn("device {} retired after {} absent polls", ID, options_.history.retireAfter);
  }
  for (const auto& ID : CHANGES.dropped) {
    errorsByDevice_.erase(ID);
    failingDevices_.erase(ID);
    logger()->debug("retired device {} dropped with its history", ID);
  }

  query::Diagnostics& diag = snapshot->diagnostics;
  diag.cycleId = STAMP.cycleId;
  for (const auto& POLL : polls) {
    if (POLL.unavailable) {
      diag.unavailable.push_back(*POLL.unavailable);
    }
  }
  diag.degraded = !diag.unavailable.empty();
  logDegradedTransition(diag.unavailable);
  recordErrors(polls, diag);
  diag.invalidValues = normalized.invalid;

  ++totals_.cycles;
  if (diag.degraded) {
    ++totals_.degradedCycles;
  }
  totals_.unavailableSources += diag.unavailable.size();
  totals_.clamped += normalized.clampedCount;
  totals_.invalid += normalized.invalidCount;
  totals_.recordsAppended += normalized.records.size();
  diag.totals = totals_;
  diag.errorsByDevice = errorsByDevice_;
  diag.pendingQueries = fanout_.pendingCount();
  diag.cycleDurationNs = helpers::clock::getMonotonicNs() - START_NS;

  snapshot->degraded = diag.degraded;
  snapshot->devices = history_.devices();
  snapshot->readouts = collectReadouts(polls);
  if (options_.includeHistory) {
    snapshot->history = history_.activeWindows();
  }

  std::shared_ptr<const query::Snapshot> published = std::move(snapshot);
  slot_.publish(published);
  cycle_.store(STAMP.cycleId);
  phase_.store(Phase::Idle);

  logger()->trace("cycle {} published: {} records, {} errors, {:.1f} ms", STAMP.cycleId,
                  published->latest.size(), diag.deviceErrors.size(),
                  static_cast<double>(diag.cycleDurationNs) / 1e6);
  return published;
}

void Sampler::recordErrors(const std::vector<source::PollResult>& polls,
                           query::Diagnostics& diag) {
  std::set<std::string> succeeded;
  for (const auto& POLL : polls) {
    for (const auto& DEVICE : POLL.devices) {
      succeeded.insert(DEVICE.id);
    }
    if (POLL.host) {
      succeeded.insert(source::HOST_TARGET);
    }
    for (const auto& ERR : POLL.errors) {
      diag.deviceErrors.push_back(ERR);
      ++totals_.deviceErrors;
      if (ERR.kind == source::QueryErrorKind::Timeout) {
        ++totals_.timeouts;
      }
      ++errorsByDevice_[ERR.deviceId];
      if (failingDevices_.insert(ERR.deviceId).second) {
        logger()->warn("{} query failed: {}", ERR.deviceId, ERR.message);
      } else {
        logger()->debug("{}", ERR.toString());
      }
    }
  }

  for (auto it = failingDevices_.begin(); it != failingDevices_.end();) {
    if (succeeded.count(*it) != 0) {
      logger()->info("{} recovered", *it);
      it = failingDevices_.erase(it);
    } else {
      ++it;
    }
  }
}

void Sampler::logDegradedTransition(const std::vector<source::SourceUnavailable>& unavailable) {
  const bool DEGRADED = !unavailable.empty();
  if (DEGRADED && !degraded_) {
    for (const auto& SRC : unavailable) {
      logger()->warn("source {} unavailable: {}", SRC.source, SRC.reason);
    }
  } else if (!DEGRADED && degraded_) {
    logger()->info("all sources available again");
  }
  degraded_ = DEGRADED;
}

} // namespace sampler

} // namespace gpumon
