#ifndef SYSCTLGEN_HELPERS_FILES_HPP
#define SYSCTLGEN_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief Bounded procfs/sysfs readers and whole-file writer.
 *
 * Reads use C-style I/O into caller-provided fixed buffers. The writer is the
 * single place where the tool touches the filesystem for output.
 */

#include "src/helpers/inc/Strings.hpp"

#include <fcntl.h>    // open, O_RDONLY, O_WRONLY, O_CREAT, O_TRUNC, O_CLOEXEC
#include <sys/stat.h> // stat
#include <unistd.h>   // read, write, close

#include <array>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdlib> // strtoll
#include <cstring> // strstr, strerror
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace sysctlgen {
namespace helpers {
namespace files {

/* ----------------------------- Constants ----------------------------- */

/// Buffer size for small integer file reads.
inline constexpr std::size_t INT_READ_BUFFER_SIZE = 64;

/// Buffer size for multi-line pseudo files (/proc/1/cgroup, /proc/mounts excerpts).
inline constexpr std::size_t TEXT_READ_BUFFER_SIZE = 4096;

/* ----------------------------- Reading ----------------------------- */

/**
 * @brief Read file contents into buffer using C-style I/O.
 * @param path File path to read.
 * @param buf Output buffer.
 * @param bufSize Size of output buffer.
 * @return Number of bytes read (excluding null terminator), 0 on error.
 *
 * Strips trailing newlines and whitespace. Always null-terminates.
 */
[[nodiscard]] inline std::size_t readFileToBuffer(const char* path, char* buf,
                                                  std::size_t bufSize) noexcept {
  if (buf == nullptr || bufSize == 0) {
    return 0;
  }
  buf[0] = '\0';
  if (path == nullptr) {
    return 0;
  }

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

  strings::stripTrailingWhitespace(buf, total);
  return total;
}

/**
 * @brief Read signed 64-bit integer from file.
 * @param path File path to read.
 * @param defaultVal Value to return on read or parse failure.
 * @return Parsed integer or defaultVal.
 */
[[nodiscard]] inline std::int64_t readFileInt64(const char* path,
                                                std::int64_t defaultVal = -1) noexcept {
  std::array<char, INT_READ_BUFFER_SIZE> buf{};
  if (readFileToBuffer(path, buf.data(), buf.size()) == 0) {
    return defaultVal;
  }

  char* end = nullptr;
  const long long VAL = std::strtoll(buf.data(), &end, 10);
  if (end == buf.data()) {
    return defaultVal;
  }
  return static_cast<std::int64_t>(VAL);
}

/**
 * @brief Check if path exists (file or directory).
 */
[[nodiscard]] inline bool pathExists(const char* path) noexcept {
  if (path == nullptr) {
    return false;
  }
  struct stat st{};
  return ::stat(path, &st) == 0;
}

/* ----------------------------- Writing ----------------------------- */

/**
 * @brief Replace a file's contents with text (created 0644 if missing).
 * @param path Destination path.
 * @param content Bytes to write.
 * @param error Optional error message target (set on failure when provided).
 * @return true if every byte was written and the descriptor closed cleanly.
 */
[[nodiscard]] inline bool
writeTextFile(const char* path, std::string_view content,
              std::optional<std::reference_wrapper<std::string>> error = std::nullopt) noexcept {
  if (path == nullptr || path[0] == '\0') {
    if (error) {
      error->get() = "empty output path";
    }
    return false;
  }

  const int FD = ::open(path, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (FD < 0) {
    if (error) {
      error->get() = std::string("cannot open '") + path + "': " + std::strerror(errno);
    }
    return false;
  }

  std::size_t done = 0;
  while (done < content.size()) {
    const ssize_t N = ::write(FD, content.data() + done, content.size() - done);
    if (N < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (error) {
        error->get() = std::string("write to '") + path + "' failed: " + std::strerror(errno);
      }
      ::close(FD);
      return false;
    }
    done += static_cast<std::size_t>(N);
  }

  if (::close(FD) != 0) {
    if (error) {
      error->get() = std::string("close of '") + path + "' failed: " + std::strerror(errno);
    }
    return false;
  }
  return true;
}

} // namespace files
} // namespace helpers
} // namespace sysctlgen

#endif // SYSCTLGEN_HELPERS_FILES_HPP
