#ifndef SPINDOWN_MONITOR_SCHEDULER_HPP
#define SPINDOWN_MONITOR_SCHEDULER_HPP
/**
 * @file Scheduler.hpp
 * @brief Daemon state aggregate and the fixed-interval tick loop.
 * @note Single-threaded. Ticks never overlap.
 *
 * A tick runs every DeviceMonitor in configuration order, then the
 * SuspendCoordinator on the post-tick states. After a host suspend every
 * monitor is marked stale so the next tick re-reads drive power modes.
 */

#include "src/ata/inc/PowerChannel.hpp"
#include "src/monitor/inc/DaemonConfig.hpp"
#include "src/monitor/inc/DeviceMonitor.hpp"
#include "src/monitor/inc/SuspendCoordinator.hpp"
#include "src/power/inc/HostSuspend.hpp"

#include <csignal>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace spindown {

namespace monitor {

/* ----------------------------- Types ----------------------------- */

/// Creates the power channel for a device name.
using ChannelFactory = std::function<std::unique_ptr<ata::PowerChannel>(const char* device)>;

/**
 * @brief All mutable daemon state, owned in one place.
 */
struct Daemon {
  GlobalConfig config;
  std::vector<DeviceMonitor> monitors; ///< Configuration order
  SuspendCoordinator coordinator;
};

/**
 * @brief Outcome of one tick.
 */
struct TickSummary {
  std::size_t asleep{0};  ///< Devices in STANDBY after the tick
  std::size_t failed{0};  ///< Devices whose tick failed
  SuspendDecision decision{SuspendDecision::DISABLED};
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Build the daemon from a validated configuration.
 * @param config Parsed command line.
 * @param makeChannel Channel factory (SgPowerChannel in production).
 * @param host Suspend trigger.
 * @param dropped Receives names of devices whose statistics were unreadable.
 * @param sysBlockRoot Statistics root, overridable for tests.
 * @return Daemon, or nullptr if no configured device is readable.
 */
[[nodiscard]] std::unique_ptr<Daemon>
buildDaemon(const DaemonConfig& config, const ChannelFactory& makeChannel,
            std::unique_ptr<power::HostSuspend> host, std::vector<std::string>& dropped,
            const char* sysBlockRoot = storage::SYS_BLOCK_ROOT);

/**
 * @brief Run one tick.
 * @param daemon Daemon state.
 * @param nowNs Monotonic timestamp of this tick.
 */
TickSummary runTick(Daemon& daemon, std::uint64_t nowNs);

/**
 * @brief Tick every check interval until @p running becomes 0.
 * @param daemon Daemon state.
 * @param running Cleared by the signal handler.
 * @return Number of ticks run.
 *
 * Sleeps in slices of at most one second so a termination request is
 * noticed promptly; a tick in progress always completes.
 */
std::uint64_t runLoop(Daemon& daemon, const volatile std::sig_atomic_t& running);

} // namespace monitor

} // namespace spindown

#endif // SPINDOWN_MONITOR_SCHEDULER_HPP
