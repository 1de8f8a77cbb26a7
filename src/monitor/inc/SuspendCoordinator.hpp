#ifndef SPINDOWN_MONITOR_SUSPEND_COORDINATOR_HPP
#define SPINDOWN_MONITOR_SUSPEND_COORDINATOR_HPP
/**
 * @file SuspendCoordinator.hpp
 * @brief Gates host suspend on every managed drive being asleep.
 * @note Not thread-safe. Evaluated once per tick, after all monitors ran.
 *
 * Suspend is requested when all of the following hold:
 *  - suspend is enabled and at least one device is managed,
 *  - every device is in STANDBY,
 *  - they have all been in STANDBY for at least the suspend timeout,
 *  - the readiness script (if any) exited 0 on this tick,
 *  - no suspend has been requested since a device last left STANDBY.
 */

#include "src/monitor/inc/DeviceMonitor.hpp"
#include "src/power/inc/HostSuspend.hpp"
#include "src/power/inc/ReadinessCheck.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace spindown {

namespace monitor {

/* ----------------------------- SuspendDecision ----------------------------- */

/**
 * @brief What the coordinator did on a tick.
 */
enum class SuspendDecision : std::uint8_t {
  DISABLED = 0,      ///< Suspend not enabled
  NOT_ALL_ASLEEP,    ///< At least one device is not in STANDBY
  SETTLING,          ///< All asleep, suspend timeout not yet reached
  NOT_READY,         ///< Readiness script blocked suspend
  SUSPENDED,         ///< Host suspend requested this tick
  ALREADY_SUSPENDED, ///< Waiting for a device to wake before re-arming
};

/// @brief Human-readable decision string.
[[nodiscard]] const char* toString(SuspendDecision decision) noexcept;

/* ----------------------------- SuspendSettings ----------------------------- */

/**
 * @brief Coordinator configuration.
 */
struct SuspendSettings {
  bool enabled{false};
  std::uint64_t timeoutNs{0};
  std::string checkScript{}; ///< Empty: no readiness script
};

/* ----------------------------- SuspendCoordinator ----------------------------- */

/**
 * @brief Tracks the all-asleep window and requests suspend at most once per window.
 */
class SuspendCoordinator {
public:
  /**
   * @param settings Enable flag, settle time, optional script.
   * @param host Suspend trigger (may be null when suspend is disabled).
   */
  SuspendCoordinator(SuspendSettings settings, std::unique_ptr<power::HostSuspend> host);

  /**
   * @brief Evaluate the post-tick state of all monitors.
   * @param monitors Every managed device, already ticked.
   * @param nowNs Monotonic timestamp of this tick.
   * @return Decision taken; SUSPENDED means the host went down and came back.
   */
  SuspendDecision evaluate(std::span<const DeviceMonitor> monitors, std::uint64_t nowNs);

  [[nodiscard]] const std::optional<std::uint64_t>& allAsleepSinceNs() const noexcept {
    return allAsleepSince_;
  }
  [[nodiscard]] bool isArmed() const noexcept { return armed_; }
  [[nodiscard]] std::uint32_t suspendCount() const noexcept { return suspendCount_; }
  [[nodiscard]] const SuspendSettings& settings() const noexcept { return settings_; }

private:
  /// Run the readiness script, logging changes in its verdict.
  [[nodiscard]] bool scriptAllowsSuspend();

  SuspendSettings settings_{};
  std::unique_ptr<power::HostSuspend> host_;

  std::optional<std::uint64_t> allAsleepSince_{};
  bool armed_{true};
  std::uint32_t suspendCount_{0};
  std::optional<power::ScriptStatus> lastScriptStatus_{};
};

/* ----------------------------- API ----------------------------- */

/// @brief True if @p monitors is non-empty and every one is in STANDBY.
[[nodiscard]] bool allAsleep(std::span<const DeviceMonitor> monitors) noexcept;

} // namespace monitor

} // namespace spindown

#endif // SPINDOWN_MONITOR_SUSPEND_COORDINATOR_HPP
