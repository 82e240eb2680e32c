/**
 * @file ScriptedSource.cpp
 * @brief Scripted frame replay and simulated telemetry generation.
 */

#include "src/source/inc/ScriptedSource.hpp"

#include <algorithm> // std::min
#include <cmath>   // std::sin
#include <thread>  // std::this_thread::sleep_for
#include <utility> // std::move

#include <fmt/core.h>

namespace gpumon {

namespace source {

/* ----------------------------- ScriptFrame ----------------------------- */

ScriptFrame ScriptFrame::down(std::string reason) {
  ScriptFrame frame{};
  frame.unavailable = std::move(reason);
  return frame;
}

ScriptFrame& ScriptFrame::device(RawDeviceReading reading, std::chrono::milliseconds delay) {
  std::string target = reading.id;
  responses.push_back(
      ScriptedResponse{std::move(target), QueryOutcome::success(std::move(reading)), delay});
  return *this;
}

ScriptFrame& ScriptFrame::host(RawHostReading reading, std::chrono::milliseconds delay) {
  responses.push_back(ScriptedResponse{HOST_TARGET, QueryOutcome::success(reading), delay});
  return *this;
}

ScriptFrame& ScriptFrame::fail(std::string target, std::string error,
                               std::chrono::milliseconds delay) {
  responses.push_back(
      ScriptedResponse{std::move(target), QueryOutcome::failure(std::move(error)), delay});
  return *this;
}

std::vector<ScriptFrame> simulatedFrames(std::size_t deviceCount, std::size_t frameCount) {
  std::vector<ScriptFrame> frames;
  frames.reserve(frameCount);

  for (std::size_t f = 0; f < frameCount; ++f) {
    const double T = static_cast<double>(f);
    ScriptFrame frame{};
    for (std::size_t d = 0; d < deviceCount; ++d) {
      const double PHASE = static_cast<double>(d) * 1.3;
      RawDeviceReading reading{};
      reading.id = fmt::format("SIM-GPU-{}", d);
      reading.name = fmt::format("Simulated GPU {}", d);
      reading.ratedMaxPowerW = 300.0;
      reading.gpuUtilPct = 55.0 + 40.0 * std::sin(T * 0.35 + PHASE);
      reading.memUtilPct = 35.0 + 25.0 * std::sin(T * 0.2 + PHASE);
      reading.powerDrawW = 170.0 + 110.0 * std::sin(T * 0.3 + PHASE);
      reading.temperatureC = 65.0 + 18.0 * std::sin(T * 0.1 + PHASE);
      reading.memTotalMiB = 24576.0;
      reading.memUsedMiB = 24576.0 * (0.4 + 0.3 * std::sin(T * 0.15 + PHASE));
      frame.device(std::move(reading));
    }
    RawHostReading host{};
    host.cpuUtilPct = 30.0 + 25.0 * std::sin(T * 0.7);
    host.ramUtilPct = 50.0 + 10.0 * std::sin(T * 0.05);
    frame.host(host);
    frames.push_back(std::move(frame));
  }
  return frames;
}

/* ----------------------------- ScriptedSource ----------------------------- */

ScriptedSource::ScriptedSource(std::string name, std::vector<ScriptFrame> frames, bool loop)
    : name_(std::move(name)), frames_(std::move(frames)), loop_(loop) {}

const ScriptFrame* ScriptedSource::currentFrame() const noexcept {
  const std::size_t POLLS = polls_.load();
  if (frames_.empty() || POLLS == 0) {
    return nullptr;
  }
  const std::size_t INDEX = loop_ ? (POLLS - 1) % frames_.size()
                                  : std::min(POLLS - 1, frames_.size() - 1);
  return &frames_[INDEX];
}

Inventory ScriptedSource::inventory() noexcept {
  polls_.fetch_add(1);
  const ScriptFrame* frame = currentFrame();
  if (frame == nullptr) {
    return Inventory::unavailableBecause(name_, "empty script");
  }
  if (frame->unavailable) {
    return Inventory::unavailableBecause(name_, *frame->unavailable);
  }

  std::vector<std::string> targets;
  targets.reserve(frame->responses.size());
  for (const auto& RESPONSE : frame->responses) {
    targets.push_back(RESPONSE.target);
  }
  return Inventory::of(std::move(targets));
}

QueryOutcome ScriptedSource::query(const std::string& target) noexcept {
  const ScriptFrame* frame = currentFrame();
  if (frame == nullptr) {
    return QueryOutcome::failure("no frame");
  }
  for (const auto& RESPONSE : frame->responses) {
    if (RESPONSE.target == target) {
      if (RESPONSE.delay.count() > 0) {
        std::this_thread::sleep_for(RESPONSE.delay);
      }
      return RESPONSE.outcome;
    }
  }
  return QueryOutcome::failure(fmt::format("{} not in script", target));
}

} // namespace source

} // namespace gpumon
