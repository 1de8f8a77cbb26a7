#ifndef SPINDOWN_HELPERS_FILES_HPP
#define SPINDOWN_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief sysfs-style file I/O with errno reporting.
 *
 * Uses C-style I/O (open/read/write/close) on caller-provided fixed-size
 * buffers. Read and write helpers report the failing errno so callers can
 * tell a missing entry from a permission problem.
 */

#include "src/helpers/inc/Strings.hpp"

#include <fcntl.h>    // open, O_RDONLY, O_WRONLY, O_CLOEXEC
#include <unistd.h>   // read, write, close

#include <cerrno>
#include <cstddef>
#include <cstring> // strlen

namespace spindown {
namespace helpers {
namespace files {

/* ----------------------------- File Reading ----------------------------- */

/**
 * @brief Read file contents into buffer using C-style I/O.
 * @param path File path to read.
 * @param buf Output buffer.
 * @param bufSize Size of output buffer.
 * @param err Optional errno output: 0 on success, errno of the failing call
 *            otherwise (EINVAL for bad arguments).
 * @return Number of bytes read (excluding null terminator), 0 on error or
 *         empty file.
 *
 * Strips trailing newlines and carriage returns. Always null-terminates.
 */
[[nodiscard]] inline std::size_t readFileToBuffer(const char* path, char* buf, std::size_t bufSize,
                                                  int* err = nullptr) noexcept {
  if (err != nullptr) {
    *err = 0;
  }

  if (path == nullptr || buf == nullptr || bufSize == 0) {
    if (buf != nullptr && bufSize > 0) {
      buf[0] = '\0';
    }
    if (err != nullptr) {
      *err = EINVAL;
    }
    return 0;
  }

  buf[0] = '\0';

  const int FD = ::open(path, O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    if (err != nullptr) {
      *err = errno;
    }
    return 0;
  }

  std::size_t total = 0;
  while (total < bufSize - 1) {
    const ssize_t N = ::read(FD, buf + total, bufSize - 1 - total);
    if (N < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (err != nullptr) {
        *err = errno;
      }
      ::close(FD);
      buf[0] = '\0';
      return 0;
    }
    if (N == 0) {
      break;
    }
    total += static_cast<std::size_t>(N);
  }

  ::close(FD);
  buf[total] = '\0';

  spindown::helpers::strings::stripTrailingWhitespace(buf, total);

  return total;
}

/* ----------------------------- File Writing ----------------------------- */

/**
 * @brief Write a string to an existing file (sysfs attribute style).
 * @param path File path to write.
 * @param text Null-terminated text to write.
 * @return 0 on success, errno of the failing call otherwise.
 *
 * A single write(2) call; short writes are reported as EIO. On sysfs
 * attributes such as /sys/power/state the call may block for a long time.
 */
[[nodiscard]] inline int writeStringToFile(const char* path, const char* text) noexcept {
  if (path == nullptr || text == nullptr) {
    return EINVAL;
  }

  const int FD = ::open(path, O_WRONLY | O_CLOEXEC);
  if (FD < 0) {
    return errno;
  }

  const std::size_t LEN = std::strlen(text);
  ssize_t n = -1;
  do {
    n = ::write(FD, text, LEN);
  } while (n < 0 && errno == EINTR);

  const int WRITE_ERR = (n < 0) ? errno : ((static_cast<std::size_t>(n) != LEN) ? EIO : 0);
  ::close(FD);
  return WRITE_ERR;
}

} // namespace files
} // namespace helpers
} // namespace spindown

#endif // SPINDOWN_HELPERS_FILES_HPP
