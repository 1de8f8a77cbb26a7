/**
 * @file DiskStats.cpp
 * @brief Implementation of block device counter reads.
 */

#include "src/storage/inc/DiskStats.hpp"

#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <dirent.h>

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <fmt/core.h>

namespace spindown {

namespace storage {

namespace {

/* ----------------------------- Constants ----------------------------- */

constexpr std::size_t PATH_BUF_SIZE = 256;
constexpr std::size_t STAT_BUF_SIZE = 512;

/// 0-based field positions in the stat line.
constexpr std::size_t FIELD_READ_OPS = 0;
constexpr std::size_t FIELD_WRITE_OPS = 4;

/* ----------------------------- Shared Helpers ----------------------------- */

using spindown::helpers::files::readFileToBuffer;
using spindown::helpers::strings::copyToFixedArray;
using spindown::helpers::strings::parseUint64;
using spindown::helpers::strings::skipWhitespace;
using spindown::helpers::strings::sortFixedStrings;
using spindown::helpers::strings::startsWith;

inline bool isFieldSeparator(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

/// Characters the kernel uses in block device names ('!' stands in for '/', e.g. cciss!c0d0).
inline bool isDeviceNameChar(char c) noexcept {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
         c == '-' || c == '_' || c == '.' || c == ':' || c == '!' || c == '+';
}

} // namespace

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(StatsStatus status) noexcept {
  switch (status) {
  case StatsStatus::OK:
    return "OK";
  case StatsStatus::DEVICE_NOT_FOUND:
    return "DEVICE_NOT_FOUND";
  case StatsStatus::PARSE_ERROR:
    return "PARSE_ERROR";
  case StatsStatus::IO_ERROR:
    return "IO_ERROR";
  }
  return "UNKNOWN";
}

/* ----------------------------- DiskCounters Methods ----------------------------- */

bool DiskCounters::isBehind(const DiskCounters& earlier) const noexcept {
  return readOps < earlier.readOps || writeOps < earlier.writeOps;
}

std::string DiskCounters::toString() const {
  return fmt::format("r_ops={} w_ops={}", readOps, writeOps);
}

/* ----------------------------- DiskStatsResult Methods ----------------------------- */

std::string DiskStatsResult::toString() const {
  if (ok()) {
    return counters.toString();
  }
  if (sysErrno != 0) {
    return fmt::format("{} ({})", storage::toString(status), std::strerror(sysErrno));
  }
  return storage::toString(status);
}

/* ----------------------------- API ----------------------------- */

/*
 * Format (whitespace-separated, may have leading spaces):
 * Field 1: reads completed
 * Field 2: reads merged
 * Field 3: sectors read
 * Field 4: time reading (ms)
 * Field 5: writes completed
 * Field 6..11: merges, sectors, times, in-flight, io time, weighted io time
 * Field 12..17: discard (4.18+) and flush (5.5+) counters
 */
StatsStatus parseDiskStatLine(const char* content, DiskCounters& out) noexcept {
  if (content == nullptr) {
    return StatsStatus::PARSE_ERROR;
  }

  DiskCounters parsed{};
  std::size_t fields = 0;
  const char* p = skipWhitespace(content);

  while (*p != '\0') {
    const char* start = p;
    while (*p != '\0' && !isFieldSeparator(*p)) {
      ++p;
    }

    std::uint64_t value = 0;
    if (!parseUint64(std::string_view(start, static_cast<std::size_t>(p - start)), value)) {
      return StatsStatus::PARSE_ERROR;
    }

    if (fields == FIELD_READ_OPS) {
      parsed.readOps = value;
    } else if (fields == FIELD_WRITE_OPS) {
      parsed.writeOps = value;
    }
    ++fields;

    p = skipWhitespace(p);
  }

  if (fields < STAT_MIN_FIELDS) {
    return StatsStatus::PARSE_ERROR;
  }

  out = parsed;
  return StatsStatus::OK;
}

DiskStatsResult readDiskCounters(const char* device, const char* sysBlockRoot) noexcept {
  DiskStatsResult result{};

  if (device == nullptr || !isValidDeviceName(device) || sysBlockRoot == nullptr) {
    result.status = StatsStatus::DEVICE_NOT_FOUND;
    result.sysErrno = EINVAL;
    return result;
  }

  char path[PATH_BUF_SIZE];
  const int PATH_LEN = std::snprintf(path, sizeof(path), "%s/%s/stat", sysBlockRoot, device);
  if (PATH_LEN < 0 || static_cast<std::size_t>(PATH_LEN) >= sizeof(path)) {
    result.status = StatsStatus::IO_ERROR;
    result.sysErrno = ENAMETOOLONG;
    return result;
  }

  char buf[STAT_BUF_SIZE];
  int err = 0;
  const std::size_t LEN = readFileToBuffer(path, buf, sizeof(buf), &err);
  if (err != 0) {
    result.sysErrno = err;
    const bool MISSING = (err == ENOENT || err == ENOTDIR || err == ENODEV);
    result.status = MISSING ? StatsStatus::DEVICE_NOT_FOUND : StatsStatus::IO_ERROR;
    return result;
  }

  if (LEN == 0) {
    result.status = StatsStatus::PARSE_ERROR;
    return result;
  }

  result.status = parseDiskStatLine(buf, result.counters);
  return result;
}

bool isValidDeviceName(std::string_view name) noexcept {
  if (name.empty() || name.size() >= DEVICE_NAME_SIZE) {
    return false;
  }
  if (name == "." || name == "..") {
    return false;
  }
  for (const char C : name) {
    if (!isDeviceNameChar(C)) {
      return false;
    }
  }
  return true;
}

DiskNameList listBlockDevices(const char* prefix, const char* sysBlockRoot) noexcept {
  DiskNameList list{};

  if (sysBlockRoot == nullptr) {
    return list;
  }

  DIR* dir = ::opendir(sysBlockRoot);
  if (dir == nullptr) {
    return list;
  }

  struct dirent* entry = nullptr;
  while ((entry = ::readdir(dir)) != nullptr && list.count < MAX_BLOCK_DEVICES) {
    const char* name = entry->d_name;
    if (name[0] == '.') {
      continue;
    }
    if (prefix != nullptr && !startsWith(name, prefix)) {
      continue;
    }
    if (!isValidDeviceName(name)) {
      continue;
    }
    copyToFixedArray(list.names[list.count], name);
    ++list.count;
  }

  ::closedir(dir);

  sortFixedStrings(list.names, list.count);
  return list;
}

} // namespace storage

} // namespace spindown
