#ifndef SPINDOWN_MONITOR_DEVICE_MONITOR_HPP
#define SPINDOWN_MONITOR_DEVICE_MONITOR_HPP
/**
 * @file DeviceMonitor.hpp
 * @brief Per-device idle detection and spin-down state machine.
 * @note Not thread-safe. Driven from the scheduler thread only.
 *
 * Each tick reads the device's I/O counters and compares them with the
 * previous snapshot:
 *
 *   counters read failed          -> ERROR, nothing else recorded
 *   first tick                    -> baseline (counts as activity), seed query
 *   counters changed              -> last activity = now; a STANDBY drive is
 *                                    re-queried before it becomes ACTIVE
 *   unchanged, idle >= timeout,   -> STANDBY IMMEDIATE, optimistic STANDBY
 *   not STANDBY, not debounced
 *   unchanged, state uncertain    -> CHECK POWER MODE, adopt reported state
 *
 * "Uncertain" covers UNKNOWN, ERROR, a STANDBY that has not been verified
 * since the spin-down command, and any state marked stale after a host
 * suspend. Timestamps are CLOCK_MONOTONIC nanoseconds supplied by the caller.
 */

#include "src/ata/inc/PowerChannel.hpp"
#include "src/storage/inc/DiskStats.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace spindown {

namespace monitor {

/* ----------------------------- Constants ----------------------------- */

/// Consecutive failed ticks before a device failure is logged as a warning.
inline constexpr std::uint32_t FAILURE_WARN_THRESHOLD = 3;

/* ----------------------------- DevicePowerState ----------------------------- */

/**
 * @brief The monitor's belief about a drive's power state.
 */
enum class DevicePowerState : std::uint8_t {
  UNKNOWN = 0, ///< Not yet established
  ACTIVE,      ///< Spinning (active or idle)
  STANDBY,     ///< Spun down
  ERROR,       ///< Last counters read or passthrough command failed
};

/// @brief Human-readable state string.
[[nodiscard]] const char* toString(DevicePowerState state) noexcept;

/* ----------------------------- MonitorSettings ----------------------------- */

/**
 * @brief Timing and environment for one monitor.
 */
struct MonitorSettings {
  std::uint64_t idleTimeoutNs{0};
  std::uint64_t checkIntervalNs{0}; ///< Spin-down debounce window
  std::uint64_t toleranceOps{0};    ///< Per-tick op deltas still counted as idle
  std::string sysBlockRoot{storage::SYS_BLOCK_ROOT};
};

/* ----------------------------- TickReport ----------------------------- */

/**
 * @brief What one tick observed and did.
 */
struct TickReport {
  bool countersOk{false};     ///< Statistics read succeeded
  bool activity{false};       ///< Counters moved (or baseline tick)
  bool queried{false};        ///< CHECK POWER MODE was sent
  bool standbyIssued{false};  ///< STANDBY IMMEDIATE was sent
  bool failed{false};         ///< Any read or passthrough failure this tick
  DevicePowerState state{DevicePowerState::UNKNOWN}; ///< State after the tick
};

/* ----------------------------- DeviceMonitor ----------------------------- */

/**
 * @brief Owns the runtime state of one managed drive.
 */
class DeviceMonitor {
public:
  /**
   * @param device Block device name (e.g., "sdb").
   * @param settings Timeouts, tolerance and statistics root.
   * @param channel Power channel for this device (must not be null).
   */
  DeviceMonitor(std::string_view device, MonitorSettings settings,
                std::unique_ptr<ata::PowerChannel> channel);

  DeviceMonitor(DeviceMonitor&&) noexcept = default;
  DeviceMonitor& operator=(DeviceMonitor&&) noexcept = default;
  DeviceMonitor(const DeviceMonitor&) = delete;
  DeviceMonitor& operator=(const DeviceMonitor&) = delete;
  ~DeviceMonitor() = default;

  /**
   * @brief Run one evaluation step.
   * @param nowNs Monotonic timestamp of this tick.
   * @return Summary of the tick. Errors are contained, never thrown.
   */
  TickReport tick(std::uint64_t nowNs);

  /// @brief Force a power-mode query on the next unchanged tick.
  void markStale() noexcept { stale_ = true; }

  [[nodiscard]] const char* name() const noexcept { return name_.data(); }
  [[nodiscard]] DevicePowerState state() const noexcept { return state_; }
  [[nodiscard]] bool isAsleep() const noexcept { return state_ == DevicePowerState::STANDBY; }
  [[nodiscard]] bool isStale() const noexcept { return stale_; }
  [[nodiscard]] const std::optional<storage::DiskCounters>& lastCounters() const noexcept {
    return lastCounters_;
  }
  [[nodiscard]] std::uint64_t lastActivityNs() const noexcept { return lastActivityNs_; }
  [[nodiscard]] const std::optional<std::uint64_t>& spindownIssuedNs() const noexcept {
    return spindownIssuedNs_;
  }
  [[nodiscard]] std::uint32_t consecutiveFailures() const noexcept { return failureStreak_; }
  [[nodiscard]] const MonitorSettings& settings() const noexcept { return settings_; }

private:
  /// True if @p fresh differs from the stored snapshot by more than the tolerance.
  [[nodiscard]] bool isActivity(const storage::DiskCounters& fresh) const noexcept;

  /// Counters changed this tick.
  void onActivity(std::uint64_t nowNs, TickReport& report);

  /// Counters unchanged this tick.
  void onUnchanged(std::uint64_t nowNs, TickReport& report);

  /// Issue STANDBY IMMEDIATE.
  void spinDown(std::uint64_t nowNs, TickReport& report);

  /// Send CHECK POWER MODE, recording the exchange in @p report.
  ata::PowerModeResult queryDrive(const char* reason, TickReport& report);

  /// Query the drive and adopt a definite answer; failures leave the state alone.
  void reconcile(const char* reason, TickReport& report);

  /// Change state, logging the transition.
  void setState(DevicePowerState next, const char* reason);

  /// Record a failure for this tick.
  void noteFailure(TickReport& report, std::string detail);

  /// Update the failure streak and emit warn/recovery lines.
  void finishTick(TickReport& report);

  std::array<char, storage::DEVICE_NAME_SIZE> name_{};
  MonitorSettings settings_{};
  std::unique_ptr<ata::PowerChannel> channel_;

  std::optional<storage::DiskCounters> lastCounters_{};
  std::uint64_t lastActivityNs_{0};
  DevicePowerState state_{DevicePowerState::UNKNOWN};
  std::optional<std::uint64_t> spindownIssuedNs_{};
  bool stale_{false};
  bool verifyPending_{false};
  std::uint32_t failureStreak_{0};
  std::string tickFailure_{};
};

} // namespace monitor

} // namespace spindown

#endif // SPINDOWN_MONITOR_DEVICE_MONITOR_HPP
