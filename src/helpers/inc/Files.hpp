#ifndef GPUMON_HELPERS_FILES_HPP
#define GPUMON_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief File I/O and path utilities for procfs/sysfs readers.
 *
 * Reads go through open/read/close into caller-provided buffers so the host
 * source can sample /proc every cycle without stream allocations.
 */

#include "src/helpers/inc/Strings.hpp"

#include <fcntl.h>    // open, O_RDONLY, O_CLOEXEC
#include <sys/stat.h> // stat, S_ISREG
#include <unistd.h>   // read, close, access

#include <cstddef>
#include <string>

namespace gpumon {
namespace helpers {
namespace files {

/* ----------------------------- Constants ----------------------------- */

/// Buffer size large enough for /proc/stat and /proc/meminfo on big hosts.
inline constexpr std::size_t PROC_READ_BUFFER_SIZE = 16384;

/* ----------------------------- File Reading ----------------------------- */

/**
 * @brief Read file contents into buffer using C-style I/O.
 * @param path File path to read.
 * @param buf Output buffer.
 * @param bufSize Size of output buffer.
 * @return Number of bytes read (excluding null terminator), 0 on error.
 *
 * Strips trailing newlines and carriage returns. Always null-terminates.
 */
[[nodiscard]] inline std::size_t readFileToBuffer(const char* path, char* buf,
                                                  std::size_t bufSize) noexcept {
  if (path == nullptr || buf == nullptr || bufSize == 0) {
    if (buf != nullptr && bufSize > 0) {
      buf[0] = '\0';
    }
    return 0;
  }

  buf[0] = '\0';

  const int FD = ::open(path, O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return 0;
  }

  std::size_t total = 0;
  while (total < bufSize - 1) {
    const ssize_t N = ::read(FD, buf + total, bufSize - 1 - total);
    if (N <= 0) {
      break;
    }
    total += static_cast<std::size_t>(N);
  }

  ::close(FD);
  buf[total] = '\0';

  gpumon::helpers::strings::stripTrailingWhitespace(buf, total);

  return total;
}

/**
 * @brief Join a root directory and an absolute procfs path.
 * @param root Root prefix ("" or "/" means the real filesystem).
 * @param path Absolute path such as "/proc/stat".
 */
[[nodiscard]] inline std::string underRoot(const std::string& root, const char* path) {
  if (root.empty() || root == "/") {
    return path;
  }
  if (root.back() == '/') {
    return root.substr(0, root.size() - 1) + path;
  }
  return root + path;
}

/* ----------------------------- Path Utilities ----------------------------- */

/**
 * @brief Check if path exists (file or directory).
 * @param path Path to check.
 * @return true if path exists.
 */
[[nodiscard]] inline bool pathExists(const char* path) noexcept {
  if (path == nullptr) {
    return false;
  }
  struct stat st{};
  return ::stat(path, &st) == 0;
}

/**
 * @brief Check if path is a regular file the caller may execute.
 * @param path Path to check.
 */
[[nodiscard]] inline bool isExecutableFile(const char* path) noexcept {
  if (path == nullptr) {
    return false;
  }
  struct stat st{};
  if (::stat(path, &st) != 0) {
    return false;
  }
  return S_ISREG(st.st_mode) && ::access(path, X_OK) == 0;
}

} // namespace files
} // namespace helpers
} // namespace gpumon

#endif // GPUMON_HELPERS_FILES_HPP
