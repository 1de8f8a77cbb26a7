/**
 * @file Scheduler.cpp
 * @brief Daemon construction and the tick loop.
 */

#include "src/monitor/inc/Scheduler.hpp"

#include "src/helpers/inc/Cpu.hpp"
#include "src/helpers/inc/Log.hpp"

#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>

namespace spindown {

namespace monitor {

namespace log = spindown::helpers::log;

using spindown::helpers::cpu::getMonotonicNs;
using spindown::helpers::cpu::NS_PER_SEC;
using spindown::helpers::cpu::secToNs;

/* ----------------------------- API ----------------------------- */

std::unique_ptr<Daemon> buildDaemon(const DaemonConfig& config, const ChannelFactory& makeChannel,
                                    std::unique_ptr<power::HostSuspend> host,
                                    std::vector<std::string>& dropped, const char* sysBlockRoot) {
  const GlobalConfig& G = config.global;

  std::vector<DeviceMonitor> monitors;
  monitors.reserve(config.devices.size());

  for (const DeviceConfig& DEV : config.devices) {
    const storage::DiskStatsResult PROBE = storage::readDiskCounters(DEV.name.data(), sysBlockRoot);
    if (!PROBE.ok()) {
      log::warn("{}: statistics unavailable ({}), not monitoring", DEV.name.data(),
                PROBE.toString());
      dropped.emplace_back(DEV.name.data());
      continue;
    }

    MonitorSettings settings{};
    settings.idleTimeoutNs = secToNs(DEV.idleTimeoutSec);
    settings.checkIntervalNs = secToNs(G.checkIntervalSec);
    settings.toleranceOps = G.toleranceOps;
    settings.sysBlockRoot = sysBlockRoot;

    monitors.emplace_back(DEV.name.data(), std::move(settings), makeChannel(DEV.name.data()));
    log::debug("{}: monitoring, idle timeout {}s", DEV.name.data(), DEV.idleTimeoutSec);
  }

  if (monitors.empty()) {
    return nullptr;
  }

  SuspendSettings suspend{};
  suspend.enabled = G.suspendEnabled;
  suspend.timeoutNs = secToNs(G.suspendTimeoutSec);
  suspend.checkScript = G.suspendCheckScript;

  return std::make_unique<Daemon>(
      G, std::move(monitors), SuspendCoordinator(std::move(suspend), std::move(host)));
}

TickSummary runTick(Daemon& daemon, std::uint64_t nowNs) {
  TickSummary summary{};

  for (DeviceMonitor& mon : daemon.monitors) {
    const TickReport REPORT = mon.tick(nowNs);
    if (REPORT.failed) {
      ++summary.failed;
    }
    if (mon.isAsleep()) {
      ++summary.asleep;
    }
  }

  summary.decision = daemon.coordinator.evaluate(daemon.monitors, nowNs);

  if (summary.decision == SuspendDecision::SUSPENDED) {
    for (DeviceMonitor& mon : daemon.monitors) {
      mon.markStale();
    }
  }

  log::debug("tick: {}/{} asleep, {} failed, suspend {}", summary.asleep, daemon.monitors.size(),
             summary.failed, toString(summary.decision));
  return summary;
}

std::uint64_t runLoop(Daemon& daemon, const volatile std::sig_atomic_t& running) {
  const std::uint64_t INTERVAL_NS = secToNs(daemon.config.checkIntervalSec);
  std::uint64_t ticks = 0;

  while (running != 0) {
    const std::uint64_t START = getMonotonicNs();
    runTick(daemon, START);
    ++ticks;

    const std::uint64_t NEXT =
        (INTERVAL_NS > UINT64_MAX - START) ? UINT64_MAX : START + INTERVAL_NS;
    while (running != 0) {
      const std::uint64_t NOW = getMonotonicNs();
      if (NOW >= NEXT) {
        break;
      }
      const std::uint64_t SLICE = std::min<std::uint64_t>(NEXT - NOW, NS_PER_SEC);
      std::this_thread::sleep_for(std::chrono::nanoseconds(SLICE));
    }
  }

  return ticks;
}

} // namespace monitor

} // namespace spindown
