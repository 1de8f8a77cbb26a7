#ifndef SPINDOWN_HELPERS_LOG_HPP
#define SPINDOWN_HELPERS_LOG_HPP
/**
 * @file Log.hpp
 * @brief Leveled stderr logging on top of fmt.
 *
 * Lines look like "spindownd[WARN] sdb: standby failed ...". The threshold
 * and program tag are process-wide and set once at startup. The default
 * threshold is WARN, so routine INFO and DEBUG lines need -d.
 *
 * @note Allocates (fmt::format). Cold path only.
 */

#include <cstdint>
#include <cstdio>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace spindown {
namespace helpers {
namespace log {

/* ----------------------------- LogLevel ----------------------------- */

/**
 * @brief Message severity, ordered from most to least verbose.
 */
enum class LogLevel : std::uint8_t {
  DEBUG = 0,
  INFO,
  WARN,
  ERROR,
};

/// @brief Level name as printed in the line prefix.
[[nodiscard]] inline const char* toString(LogLevel level) noexcept {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  }
  return "UNKNOWN";
}

namespace detail {

inline LogLevel& threshold() noexcept {
  static LogLevel level = LogLevel::WARN;
  return level;
}

inline std::string_view& tag() noexcept {
  static std::string_view name = "spindown";
  return name;
}

} // namespace detail

/* ----------------------------- Configuration ----------------------------- */

/// @brief Set the minimum level that is printed.
inline void setLogLevel(LogLevel level) noexcept { detail::threshold() = level; }

/// @brief Set the program tag printed before the level (must outlive logging).
inline void setLogTag(std::string_view name) noexcept { detail::tag() = name; }

/// @brief Check if a message at this level would be printed.
[[nodiscard]] inline bool isEnabled(LogLevel level) noexcept {
  return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(detail::threshold());
}

/* ----------------------------- API ----------------------------- */

template <typename... Args>
inline void write(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
  if (!isEnabled(level)) {
    return;
  }
  fmt::print(stderr, "{}[{}] {}\n", detail::tag(), toString(level),
             fmt::format(format, std::forward<Args>(args)...));
  std::fflush(stderr);
}

template <typename... Args>
inline void debug(fmt::format_string<Args...> format, Args&&... args) {
  write(LogLevel::DEBUG, format, std::forward<Args>(args)...);
}

template <typename... Args>
inline void info(fmt::format_string<Args...> format, Args&&... args) {
  write(LogLevel::INFO, format, std::forward<Args>(args)...);
}

template <typename... Args>
inline void warn(fmt::format_string<Args...> format, Args&&... args) {
  write(LogLevel::WARN, format, std::forward<Args>(args)...);
}

template <typename... Args>
inline void error(fmt::format_string<Args...> format, Args&&... args) {
  write(LogLevel::ERROR, format, std::forward<Args>(args)...);
}

} // namespace log
} // namespace helpers
} // namespace spindown

#endif // SPINDOWN_HELPERS_LOG_HPP
