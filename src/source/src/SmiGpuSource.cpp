/**
 * @file SmiGpuSource.cpp
 * @brief nvidia-smi invocation and CSV parsing.
 */

#include "src/source/inc/SmiGpuSource.hpp"

#include <fcntl.h>    // O_CLOEXEC
#include <poll.h>     // poll
#include <signal.h>   // kill, SIGKILL
#include <sys/wait.h> // waitpid, WIFEXITED, WEXITSTATUS
#include <unistd.h>   // fork, execl, pipe2, dup2

#include <array>   // std::array
#include <cerrno>  // errno
#include <utility> // std::move

#include <fmt/core.h>

#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

namespace gpumon {

namespace source {

using gpumon::helpers::strings::parseDouble;
using gpumon::helpers::strings::splitFields;
using gpumon::helpers::strings::trim;

namespace {

/* ----------------------------- Constants ----------------------------- */

constexpr const char* INVENTORY_FIELDS = "uuid,name,power.max_limit";
constexpr const char* QUERY_FIELDS =
    "uuid,name,power.max_limit,utilization.gpu,utilization.memory,power.draw,temperature.gpu,"
    "memory.used,memory.total";
constexpr std::size_t INVENTORY_FIELD_COUNT = 3;
constexpr std::size_t QUERY_FIELD_COUNT = 9;

/// Shell status for "command not found".
constexpr int EXIT_NOT_FOUND = 127;

/// Call fn(line) for every non-empty line of text.
template <typename Fn> void forEachLine(std::string_view text, Fn&& fn) {
  while (!text.empty()) {
    const std::size_t EOL = text.find('\n');
    const std::string_view LINE = trim(text.substr(0, EOL));
    if (!LINE.empty()) {
      fn(LINE);
    }
    if (EOL == std::string_view::npos) {
      break;
    }
    text.remove_prefix(EOL + 1);
  }
}

/// First non-empty line of output, for error messages.
std::string firstLine(const std::string& text) {
  std::string line;
  forEachLine(text, [&line](std::string_view l) {
    if (line.empty()) {
      line = std::string(l);
    }
  });
  return line;
}

} // namespace

/* ----------------------------- Command Runner ----------------------------- */

std::string shellQuote(std::string_view arg) {
  std::string out;
  out.reserve(arg.size() + 2);
  out.push_back('\'');
  for (const char C : arg) {
    if (C == '\'') {
      out.append("'\\''");
    } else {
      out.push_back(C);
    }
  }
  out.push_back('\'');
  return out;
}

CommandResult runCommand(const std::string& command, std::chrono::milliseconds timeout) noexcept {
  CommandResult result{};
  const std::string FULL = command + " 2>/dev/null";
  const char* const CMD = FULL.c_str();

  int fds[2] = {-1, -1};
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    return result;
  }

  const pid_t PID = ::fork();
  if (PID < 0) {
    ::close(fds[0]);
    ::close(fds[1]);
    return result;
  }
  if (PID == 0) {
    // Own process group so a timeout kills the shell and everything it started.
    ::setpgid(0, 0);
    ::dup2(fds[1], STDOUT_FILENO);
    ::execl("/bin/sh", "sh", "-c", CMD, static_cast<char*>(nullptr));
    ::_exit(EXIT_NOT_FOUND);
  }
  ::setpgid(PID, PID);
  ::close(fds[1]);
  result.launched = true;

  const auto DEADLINE = std::chrono::steady_clock::now() + timeout;
  std::array<char, 4096> buf{};
  bool abandon = false;
  for (;;) {
    const auto REMAINING = std::chrono::duration_cast<std::chrono::milliseconds>(
        DEADLINE - std::chrono::steady_clock::now());
    if (REMAINING.count() <= 0) {
      result.timedOut = true;
      break;
    }
    struct pollfd pfd{fds[0], POLLIN, 0};
    const int RV = ::poll(&pfd, 1, static_cast<int>(REMAINING.count()));
    if (RV < 0) {
      if (errno == EINTR) {
        continue;
      }
      abandon = true;
      break;
    }
    if (RV == 0) {
      result.timedOut = true;
      break;
    }
    const ssize_t N = ::read(fds[0], buf.data(), buf.size());
    if (N < 0 && errno == EINTR) {
      continue;
    }
    if (N <= 0) {
      break;
    }
    result.output.append(buf.data(), static_cast<std::size_t>(N));
  }
  ::close(fds[0]);

  if (result.timedOut || abandon) {
    ::kill(-PID, SIGKILL);
  }
  int status = 0;
  while (::waitpid(PID, &status, 0) < 0 && errno == EINTR) {
  }
  if (!result.timedOut && !abandon && WIFEXITED(status)) {
    result.exitCode = WEXITSTATUS(status);
  }
  return result;
}

/* ----------------------------- Parsing ----------------------------- */

std::vector<SmiInventoryEntry> parseSmiInventory(std::string_view text) {
  std::vector<SmiInventoryEntry> entries;
  forEachLine(text, [&entries](std::string_view line) {
    const std::vector<std::string_view> FIELDS = splitFields(line, ',');
    if (FIELDS.size() != INVENTORY_FIELD_COUNT || FIELDS[0].empty()) {
      return;
    }
    SmiInventoryEntry entry{};
    entry.uuid = std::string(FIELDS[0]);
    entry.name = std::string(FIELDS[1]);
    entry.ratedMaxPowerW = parseDouble(FIELDS[2]);
    entries.push_back(std::move(entry));
  });
  return entries;
}

std::optional<RawDeviceReading> parseSmiDeviceLine(std::string_view line) {
  const std::vector<std::string_view> FIELDS = splitFields(trim(line), ',');
  if (FIELDS.size() != QUERY_FIELD_COUNT || FIELDS[0].empty()) {
    return std::nullopt;
  }

  RawDeviceReading reading{};
  reading.id = std::string(FIELDS[0]);
  reading.name = std::string(FIELDS[1]);
  reading.ratedMaxPowerW = parseDouble(FIELDS[2]);
  reading.gpuUtilPct = parseDouble(FIELDS[3]);
  reading.memUtilPct = parseDouble(FIELDS[4]);
  reading.powerDrawW = parseDouble(FIELDS[5]);
  reading.temperatureC = parseDouble(FIELDS[6]);
  reading.memUsedMiB = parseDouble(FIELDS[7]);
  reading.memTotalMiB = parseDouble(FIELDS[8]);
  return reading;
}

/* ----------------------------- SmiGpuSource ----------------------------- */

SmiGpuSource::SmiGpuSource(std::string binary, std::chrono::milliseconds commandTimeout)
    : binary_(std::move(binary)), commandTimeout_(commandTimeout) {}

Inventory SmiGpuSource::inventory() noexcept {
  if (binary_.find('/') != std::string::npos &&
      !gpumon::helpers::files::isExecutableFile(binary_.c_str())) {
    return Inventory::unavailableBecause(name(), fmt::format("{} is not executable", binary_));
  }

  const CommandResult RESULT =
      runCommand(fmt::format("{} --query-gpu={} --format=csv,noheader,nounits",
                             shellQuote(binary_), INVENTORY_FIELDS),
                 commandTimeout_);
  if (!RESULT.launched) {
    return Inventory::unavailableBecause(name(), "cannot spawn shell");
  }
  if (RESULT.timedOut) {
    return Inventory::unavailableBecause(
        name(), fmt::format("{} killed after {} ms", binary_, commandTimeout_.count()));
  }
  if (RESULT.exitCode == EXIT_NOT_FOUND) {
    return Inventory::unavailableBecause(name(), fmt::format("{} not found", binary_));
  }
  if (RESULT.exitCode != 0) {
    const std::string DETAIL = firstLine(RESULT.output);
    return Inventory::unavailableBecause(
        name(), DETAIL.empty() ? fmt::format("exited with status {}", RESULT.exitCode)
                               : fmt::format("exited with status {}: {}", RESULT.exitCode,
                                             DETAIL));
  }

  const std::vector<SmiInventoryEntry> ENTRIES = parseSmiInventory(RESULT.output);
  if (ENTRIES.empty()) {
    return Inventory::unavailableBecause(name(), "no devices");
  }

  std::vector<std::string> uuids;
  uuids.reserve(ENTRIES.size());
  for (const auto& ENTRY : ENTRIES) {
    uuids.push_back(ENTRY.uuid);
  }
  return Inventory::of(std::move(uuids));
}

QueryOutcome SmiGpuSource::query(const std::string& target) noexcept {
  const CommandResult RESULT =
      runCommand(fmt::format("{} -i {} --query-gpu={} --format=csv,noheader,nounits",
                             shellQuote(binary_), shellQuote(target), QUERY_FIELDS),
                 commandTimeout_);
  if (!RESULT.launched) {
    return QueryOutcome::failure("cannot spawn shell");
  }
  if (RESULT.timedOut) {
    return QueryOutcome::failure(
        fmt::format("nvidia-smi killed after {} ms", commandTimeout_.count()));
  }
  if (RESULT.exitCode != 0) {
    const std::string DETAIL = firstLine(RESULT.output);
    return QueryOutcome::failure(
        DETAIL.empty() ? fmt::format("nvidia-smi exited with status {}", RESULT.exitCode)
                       : fmt::format("nvidia-smi exited with status {}: {}", RESULT.exitCode,
                                     DETAIL));
  }

  std::optional<RawDeviceReading> reading;
  forEachLine(RESULT.output, [&reading](std::string_view line) {
    if (!reading) {
      reading = parseSmiDeviceLine(line);
    }
  });
  if (!reading) {
    return QueryOutcome::failure(
        fmt::format("unparseable nvidia-smi output: '{}'", firstLine(RESULT.output)));
  }
  if (reading->id != target) {
    return QueryOutcome::failure(
        fmt::format("nvidia-smi answered for {} instead of {}", reading->id, target));
  }
  return QueryOutcome::success(std::move(*reading));
}

} // namespace source

} // namespace gpumon
