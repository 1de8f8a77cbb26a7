#ifndef SPINDOWN_POWER_READINESS_CHECK_HPP
#define SPINDOWN_POWER_READINESS_CHECK_HPP
/**
 * @file ReadinessCheck.hpp
 * @brief Run the operator's suspend readiness script and classify its outcome.
 * @note Blocks until the script exits. No timeout is imposed.
 *
 * The script is executed directly (no shell), with no arguments and stdin
 * connected to /dev/null. stdout/stderr are inherited so the script's own
 * output lands in the daemon's log.
 */

#include <cstdint>
#include <string>

namespace spindown {

namespace power {

/* ----------------------------- Constants ----------------------------- */

/// Exit code used by the child when execv() fails (shell convention).
inline constexpr int EXEC_FAILURE_EXIT = 127;

/* ----------------------------- ScriptStatus ----------------------------- */

/**
 * @brief Outcome of one readiness check.
 */
enum class ScriptStatus : std::uint8_t {
  READY = 0,    ///< Exited 0
  NOT_READY,    ///< Exited non-zero
  SPAWN_FAILED, ///< fork() or waitpid() failed
  EXEC_FAILED,  ///< execv() failed in the child (missing, not executable)
  SIGNALED,     ///< Terminated by a signal
};

/// @brief Human-readable status string.
[[nodiscard]] const char* toString(ScriptStatus status) noexcept;

/**
 * @brief Result of running the readiness script.
 */
struct ScriptResult {
  ScriptStatus status{ScriptStatus::SPAWN_FAILED};
  int exitCode{-1}; ///< Exit code when the script exited, -1 otherwise
  int signal{0};    ///< Terminating signal when SIGNALED
  int sysErrno{0};  ///< errno for SPAWN_FAILED

  [[nodiscard]] bool ready() const noexcept { return status == ScriptStatus::READY; }

  /// @brief True for failures to run the script at all (not a verdict).
  [[nodiscard]] bool isExecutionError() const noexcept {
    return status == ScriptStatus::SPAWN_FAILED || status == ScriptStatus::EXEC_FAILED ||
           status == ScriptStatus::SIGNALED;
  }

  /// @brief "READY", "NOT_READY (exit 1)", "SIGNALED (signal 9)", ...
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Execute @p path and wait for it.
 * @param path Absolute or relative path to an executable.
 * @return Classified outcome. Never throws.
 */
[[nodiscard]] ScriptResult runReadinessCheck(const char* path) noexcept;

} // namespace power

} // namespace spindown

#endif // SPINDOWN_POWER_READINESS_CHECK_HPP
