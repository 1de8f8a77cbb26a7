#ifndef SPINDOWN_STORAGE_DISK_STATS_HPP
#define SPINDOWN_STORAGE_DISK_STATS_HPP
/**
 * @file DiskStats.hpp
 * @brief Cumulative read/write operation counters for a block device.
 * @note Linux-only. Reads /sys/block/\<dev\>/stat.
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 *
 * The daemon only needs to know whether a device saw I/O between two ticks,
 * so a snapshot is reduced to the completed read and write operation counts.
 * Failures are reported, never retried here.
 *
 * Usage pattern:
 *   const DiskStatsResult R = readDiskCounters("sdb");
 *   if (R.ok() && R.counters != last) { ... activity ... }
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace spindown {

namespace storage {

/* ----------------------------- Constants ----------------------------- */

/// Maximum device name length including terminator (e.g., "sdb").
inline constexpr std::size_t DEVICE_NAME_SIZE = 32;

/// Maximum number of block devices to enumerate.
inline constexpr std::size_t MAX_BLOCK_DEVICES = 64;

/// Default sysfs block directory.
inline constexpr const char* SYS_BLOCK_ROOT = "/sys/block";

/// Minimum number of numeric fields in a stat line (kernel 2.6+ layout).
inline constexpr std::size_t STAT_MIN_FIELDS = 11;

/* ----------------------------- StatsStatus ----------------------------- */

/**
 * @brief Outcome of reading a device statistics entry.
 */
enum class StatsStatus : std::uint8_t {
  OK = 0,
  DEVICE_NOT_FOUND, ///< No statistics entry for this name
  PARSE_ERROR,      ///< Entry read but not a valid stat line
  IO_ERROR,         ///< Any other read failure (permissions, ...)
};

/// @brief Human-readable status string.
[[nodiscard]] const char* toString(StatsStatus status) noexcept;

/* ----------------------------- DiskCounters ----------------------------- */

/**
 * @brief Completed I/O operation counters since boot.
 *
 * Monotonically non-decreasing while the device exists.
 */
struct DiskCounters {
  std::uint64_t readOps{0};  ///< Field 1: reads completed
  std::uint64_t writeOps{0}; ///< Field 5: writes completed

  [[nodiscard]] bool operator==(const DiskCounters& other) const noexcept = default;

  /// @brief True if either counter went backwards relative to @p earlier.
  [[nodiscard]] bool isBehind(const DiskCounters& earlier) const noexcept;

  /// @brief "r_ops=N w_ops=M".
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- DiskStatsResult ----------------------------- */

/**
 * @brief Result of a counter read.
 */
struct DiskStatsResult {
  StatsStatus status{StatsStatus::IO_ERROR};
  DiskCounters counters{}; ///< Valid only when status == OK
  int sysErrno{0};         ///< errno of the failed read, 0 otherwise

  [[nodiscard]] bool ok() const noexcept { return status == StatsStatus::OK; }

  /// @brief Status plus errno text, or counters on success.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- DiskNameList ----------------------------- */

/**
 * @brief Sorted list of block device names found under a sysfs root.
 */
struct DiskNameList {
  std::array<std::array<char, DEVICE_NAME_SIZE>, MAX_BLOCK_DEVICES> names{};
  std::size_t count{0};
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse the text of a /sys/block/\<dev\>/stat file.
 * @param content Null-terminated file content.
 * @param out Receives read/write op counts on success.
 * @return OK, or PARSE_ERROR if there are fewer than STAT_MIN_FIELDS fields or
 *         any field is not an unsigned decimal number.
 *
 * Fields after the minimum (discard and flush counters on newer kernels) are
 * validated and ignored.
 */
[[nodiscard]] StatsStatus parseDiskStatLine(const char* content, DiskCounters& out) noexcept;

/**
 * @brief Read current read/write counters for a block device.
 * @param device Device name (e.g., "sdb").
 * @param sysBlockRoot Directory holding per-device entries.
 * @return Result with counters or the failure class.
 *
 * Source: \<sysBlockRoot\>/\<dev\>/stat. Single read, so the pair is an
 * atomic snapshot of the kernel's view.
 */
[[nodiscard]] DiskStatsResult readDiskCounters(const char* device,
                                               const char* sysBlockRoot = SYS_BLOCK_ROOT) noexcept;

/**
 * @brief Check a device name is usable as a single path component.
 * @return false for empty names, "." / "..", names that do not fit
 *         DEVICE_NAME_SIZE, or names with characters outside [A-Za-z0-9._:!+-]
 *         (so names can be embedded in paths and JSON strings as-is).
 */
[[nodiscard]] bool isValidDeviceName(std::string_view name) noexcept;

/**
 * @brief List block devices whose name starts with @p prefix.
 * @param prefix Name prefix filter ("" for all).
 * @param sysBlockRoot Directory to enumerate.
 * @return Sorted names; empty if the directory cannot be read.
 */
[[nodiscard]] DiskNameList listBlockDevices(const char* prefix,
                                            const char* sysBlockRoot = SYS_BLOCK_ROOT) noexcept;

} // namespace storage

} // namespace spindown

#endif // SPINDOWN_STORAGE_DISK_STATS_HPP
