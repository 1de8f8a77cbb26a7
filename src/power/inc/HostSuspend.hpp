#ifndef SPINDOWN_POWER_HOST_SUSPEND_HPP
#define SPINDOWN_POWER_HOST_SUSPEND_HPP
/**
 * @file HostSuspend.hpp
 * @brief Trigger for whole-host suspend.
 * @note SysfsHostSuspend requires root. The write blocks until the host resumes.
 */

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace spindown {

namespace power {

/* ----------------------------- Constants ----------------------------- */

/// Kernel suspend control file.
inline constexpr const char* SYS_POWER_STATE_PATH = "/sys/power/state";

/// Default state word ("mem" = suspend-to-RAM).
inline constexpr const char* DEFAULT_SUSPEND_STATE = "mem";

/// Maximum state word length including terminator.
inline constexpr std::size_t SUSPEND_STATE_SIZE = 16;

/* ----------------------------- SuspendResult ----------------------------- */

/**
 * @brief Outcome of a suspend request.
 */
struct SuspendResult {
  int sysErrno{0}; ///< 0 if the request was accepted (and the host has since resumed)

  [[nodiscard]] bool ok() const noexcept { return sysErrno == 0; }

  /// @brief "ok" or errno text.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- HostSuspend ----------------------------- */

/**
 * @brief Puts the host to sleep.
 */
class HostSuspend {
public:
  virtual ~HostSuspend() = default;

  /// @brief Request suspend; returns after resume or on failure.
  [[nodiscard]] virtual SuspendResult suspend() noexcept = 0;
};

/**
 * @brief HostSuspend that writes a state word to /sys/power/state.
 */
class SysfsHostSuspend final : public HostSuspend {
public:
  /**
   * @param stateWord Word to write (e.g., "mem", "disk", "freeze").
   * @param path Control file, overridable for tests.
   */
  explicit SysfsHostSuspend(std::string_view stateWord = DEFAULT_SUSPEND_STATE,
                            std::string_view path = SYS_POWER_STATE_PATH);

  [[nodiscard]] SuspendResult suspend() noexcept override;

  [[nodiscard]] const char* stateWord() const noexcept { return state_.data(); }
  [[nodiscard]] const char* path() const noexcept { return path_.c_str(); }

private:
  std::array<char, SUSPEND_STATE_SIZE> state_{};
  std::string path_;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Check a state word against the kernel's accepted set.
 * @return True for "mem", "disk", "freeze" and "standby".
 */
[[nodiscard]] bool isValidSuspendState(std::string_view word) noexcept;

} // namespace power

} // namespace spindown

#endif // SPINDOWN_POWER_HOST_SUSPEND_HPP
