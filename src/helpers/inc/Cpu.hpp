#ifndef SPINDOWN_HELPERS_CPU_HPP
#define SPINDOWN_HELPERS_CPU_HPP
/**
 * @file Cpu.hpp
 * @brief Monotonic clock helpers used for tick timestamps.
 */

#include <cstdint>
#include <ctime> // clock_gettime, CLOCK_MONOTONIC

namespace spindown {
namespace helpers {
namespace cpu {

/* ----------------------------- Constants ----------------------------- */

/// Nanoseconds per second.
inline constexpr std::uint64_t NS_PER_SEC = 1'000'000'000ULL;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Get monotonic timestamp in nanoseconds.
 *
 * Uses CLOCK_MONOTONIC for consistent, non-decreasing time measurements
 * unaffected by system clock adjustments. Does not advance while the host
 * is suspended.
 *
 * @return Current monotonic time in nanoseconds.
 */
[[nodiscard]] inline std::uint64_t getMonotonicNs() noexcept {
  struct timespec ts{};
  ::clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<std::uint64_t>(ts.tv_sec) * NS_PER_SEC +
         static_cast<std::uint64_t>(ts.tv_nsec);
}

/// Convert whole seconds to nanoseconds.
[[nodiscard]] constexpr std::uint64_t secToNs(std::uint64_t sec) noexcept {
  return sec * NS_PER_SEC;
}

/// Convert nanoseconds to whole seconds (truncating).
[[nodiscard]] constexpr std::uint64_t nsToSec(std::uint64_t ns) noexcept { return ns / NS_PER_SEC; }

} // namespace cpu
} // namespace helpers
} // namespace spindown

#endif // SPINDOWN_HELPERS_CPU_HPP
