/**
 * @file HostSource.cpp
 * @brief Host CPU/RAM utilization collection from /proc/stat and /proc/meminfo.
 */

#include "src/source/inc/HostSource.hpp"

#include <array>   // std::array
#include <cstdlib> // strtoull
#include <cstring> // strchr, strncmp, strlen
#include <utility> // std::move

#include "src/helpers/inc/Files.hpp"

namespace gpumon {

namespace source {

using gpumon::helpers::files::PROC_READ_BUFFER_SIZE;
using gpumon::helpers::files::readFileToBuffer;

namespace {

/* ----------------------------- Line Helpers ----------------------------- */

/// Check if line starts with prefix.
inline bool lineStartsWith(const char* line, const char* prefix) noexcept {
  return std::strncmp(line, prefix, std::strlen(prefix)) == 0;
}

/// Parse "FieldName:    12345 kB" format, return kB.
inline std::uint64_t parseMemInfoKb(const char* line) noexcept {
  const char* colon = std::strchr(line, ':');
  if (colon == nullptr) {
    return 0;
  }

  const char* ptr = colon + 1;
  while (*ptr == ' ' || *ptr == '\t') {
    ++ptr;
  }

  char* end = nullptr;
  const unsigned long long KB = std::strtoull(ptr, &end, 10);
  if (end == ptr) {
    return 0;
  }
  return static_cast<std::uint64_t>(KB);
}

} // namespace

/* ----------------------------- CpuTimeCounters ----------------------------- */

std::uint64_t CpuTimeCounters::total() const noexcept {
  return user + nice + system + idle + iowait + irq + softirq + steal;
}

std::uint64_t CpuTimeCounters::inactive() const noexcept { return idle + iowait; }

/* ----------------------------- Parsing ----------------------------- */

std::optional<CpuTimeCounters> parseProcStat(const char* text) noexcept {
  if (text == nullptr) {
    return std::nullopt;
  }

  const char* line = text;
  while (*line != '\0') {
    if (lineStartsWith(line, "cpu ")) {
      const char* ptr = line + 4;
      std::array<std::uint64_t, 10> vals{};
      std::size_t parsed = 0;
      for (; parsed < vals.size(); ++parsed) {
        char* end = nullptr;
        vals[parsed] = std::strtoull(ptr, &end, 10);
        if (end == ptr) {
          // Fewer than 10 fields is OK (older kernels)
          break;
        }
        ptr = end;
      }
      if (parsed < 4) {
        return std::nullopt;
      }

      CpuTimeCounters out{};
      out.user = vals[0];
      out.nice = vals[1];
      out.system = vals[2];
      out.idle = vals[3];
      out.iowait = vals[4];
      out.irq = vals[5];
      out.softirq = vals[6];
      out.steal = vals[7];
      out.guest = vals[8];
      out.guestNice = vals[9];
      return out;
    }

    const char* eol = std::strchr(line, '\n');
    if (eol == nullptr) {
      break;
    }
    line = eol + 1;
  }
  return std::nullopt;
}

std::optional<double> cpuUtilizationBetween(const CpuTimeCounters& before,
                                            const CpuTimeCounters& after) noexcept {
  const std::uint64_t TOTAL_BEFORE = before.total();
  const std::uint64_t TOTAL_AFTER = after.total();
  if (TOTAL_AFTER <= TOTAL_BEFORE || after.inactive() < before.inactive()) {
    // No time elapsed or counter wrapped
    return std::nullopt;
  }

  const double TOTAL_DELTA = static_cast<double>(TOTAL_AFTER - TOTAL_BEFORE);
  const double IDLE_DELTA = static_cast<double>(after.inactive() - before.inactive());
  const double BUSY = (TOTAL_DELTA - IDLE_DELTA) * 100.0 / TOTAL_DELTA;
  return BUSY < 0.0 ? 0.0 : BUSY;
}

std::optional<double> parseMemInfoUtilization(const char* text) noexcept {
  if (text == nullptr) {
    return std::nullopt;
  }

  std::uint64_t totalKb = 0;
  std::uint64_t freeKb = 0;
  std::uint64_t buffersKb = 0;
  std::uint64_t cachedKb = 0;
  std::optional<std::uint64_t> availableKb;

  const char* ptr = text;
  while (*ptr != '\0') {
    if (lineStartsWith(ptr, "MemTotal:")) {
      totalKb = parseMemInfoKb(ptr);
    } else if (lineStartsWith(ptr, "MemFree:")) {
      freeKb = parseMemInfoKb(ptr);
    } else if (lineStartsWith(ptr, "MemAvailable:")) {
      availableKb = parseMemInfoKb(ptr);
    } else if (lineStartsWith(ptr, "Buffers:")) {
      buffersKb = parseMemInfoKb(ptr);
    } else if (lineStartsWith(ptr, "Cached:") || lineStartsWith(ptr, "SReclaimable:")) {
      cachedKb += parseMemInfoKb(ptr);
    }

    const char* eol = std::strchr(ptr, '\n');
    if (eol == nullptr) {
      break;
    }
    ptr = eol + 1;
  }

  if (totalKb == 0) {
    return std::nullopt;
  }

  std::uint64_t usedKb = 0;
  if (availableKb) {
    usedKb = (totalKb > *availableKb) ? (totalKb - *availableKb) : 0;
  } else {
    const std::uint64_t RECLAIMABLE = freeKb + buffersKb + cachedKb;
    usedKb = (totalKb > RECLAIMABLE) ? (totalKb - RECLAIMABLE) : 0;
  }
  return static_cast<double>(usedKb) * 100.0 / static_cast<double>(totalKb);
}

/* ----------------------------- HostSource ----------------------------- */

HostSource::HostSource(std::string procRoot)
    : statPath_(gpumon::helpers::files::underRoot(procRoot, "/proc/stat")),
      meminfoPath_(gpumon::helpers::files::underRoot(procRoot, "/proc/meminfo")) {}

Inventory HostSource::inventory() noexcept {
  if (!gpumon::helpers::files::pathExists(statPath_.c_str()) &&
      !gpumon::helpers::files::pathExists(meminfoPath_.c_str())) {
    return Inventory::unavailableBecause(name(), "neither /proc/stat nor /proc/meminfo exists");
  }
  return Inventory::of({HOST_TARGET});
}

QueryOutcome HostSource::query(const std::string& target) noexcept {
  if (target != HOST_TARGET) {
    return QueryOutcome::failure("host source only answers for the host target");
  }

  std::array<char, PROC_READ_BUFFER_SIZE> buf{};
  RawHostReading reading{};
  bool sampled = false;

  if (readFileToBuffer(statPath_.c_str(), buf.data(), buf.size()) > 0) {
    const std::optional<CpuTimeCounters> NOW = parseProcStat(buf.data());
    if (NOW) {
      sampled = true;
      std::lock_guard<std::mutex> lock(mutex_);
      if (previous_) {
        reading.cpuUtilPct = cpuUtilizationBetween(*previous_, *NOW);
      }
      previous_ = NOW;
    }
  }

  if (readFileToBuffer(meminfoPath_.c_str(), buf.data(), buf.size()) > 0) {
    reading.ramUtilPct = parseMemInfoUtilization(buf.data());
    sampled = sampled || reading.ramUtilPct.has_value();
  }

  if (!sampled) {
    return QueryOutcome::failure("cannot read /proc/stat or /proc/meminfo");
  }
  return QueryOutcome::success(std::move(reading));
}

} // namespace source

} // namespace gpumon
