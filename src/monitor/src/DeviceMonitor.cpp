/**
 * @file DeviceMonitor.cpp
 * @brief Per-device spin-down state machine.
 */

#include "src/monitor/inc/DeviceMonitor.hpp"

#include "src/helpers/inc/Cpu.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <utility>

#include <fmt/core.h>

namespace spindown {

namespace monitor {

namespace log = spindown::helpers::log;

using spindown::helpers::cpu::nsToSec;
using spindown::helpers::strings::copyToFixedArray;

/* ----------------------------- Enum Helpers ----------------------------- */

const char* toString(DevicePowerState state) noexcept {
  switch (state) {
  case DevicePowerState::UNKNOWN:
    return "UNKNOWN";
  case DevicePowerState::ACTIVE:
    return "ACTIVE";
  case DevicePowerState::STANDBY:
    return "STANDBY";
  case DevicePowerState::ERROR:
    return "ERROR";
  }
  return "UNKNOWN";
}

/* ----------------------------- DeviceMonitor ----------------------------- */

DeviceMonitor::DeviceMonitor(std::string_view device, MonitorSettings settings,
                             std::unique_ptr<ata::PowerChannel> channel)
    : settings_(std::move(settings)), channel_(std::move(channel)) {
  copyToFixedArray(name_, device);
}

TickReport DeviceMonitor::tick(std::uint64_t nowNs) {
  TickReport report{};
  tickFailure_.clear();

  const storage::DiskStatsResult STATS =
      storage::readDiskCounters(name_.data(), settings_.sysBlockRoot.c_str());
  if (!STATS.ok()) {
    noteFailure(report, fmt::format("stats: {}", STATS.toString()));
    setState(DevicePowerState::ERROR, "statistics unavailable");
    finishTick(report);
    return report;
  }
  report.countersOk = true;

  // First observation: no snapshot to compare against
  if (!lastCounters_) {
    log::debug("{}: baseline {}", name_.data(), STATS.counters.toString());
    lastCounters_ = STATS.counters;
    lastActivityNs_ = nowNs;
    report.activity = true;
    if (state_ == DevicePowerState::UNKNOWN || state_ == DevicePowerState::ERROR) {
      reconcile("initial state", report);
    }
    finishTick(report);
    return report;
  }

  const bool ACTIVITY = isActivity(STATS.counters);
  if (!ACTIVITY && !(STATS.counters == *lastCounters_)) {
    log::debug("{}: {} -> {} within tolerance {}", name_.data(), lastCounters_->toString(),
               STATS.counters.toString(), settings_.toleranceOps);
  }
  lastCounters_ = STATS.counters;

  if (ACTIVITY) {
    onActivity(nowNs, report);
  } else {
    onUnchanged(nowNs, report);
  }

  finishTick(report);
  return report;
}

bool DeviceMonitor::isActivity(const storage::DiskCounters& fresh) const noexcept {
  const storage::DiskCounters& PREV = *lastCounters_;

  // Counters going backwards (wrap, device reset) are treated as activity
  if (fresh.isBehind(PREV)) {
    return true;
  }

  const std::uint64_t READ_DELTA = fresh.readOps - PREV.readOps;
  const std::uint64_t WRITE_DELTA = fresh.writeOps - PREV.writeOps;
  return READ_DELTA > settings_.toleranceOps || WRITE_DELTA > settings_.toleranceOps;
}

void DeviceMonitor::onActivity(std::uint64_t nowNs, TickReport& report) {
  report.activity = true;
  lastActivityNs_ = nowNs;
  log::debug("{}: activity {}", name_.data(), lastCounters_->toString());

  if (state_ != DevicePowerState::STANDBY) {
    if (state_ != DevicePowerState::ACTIVE) {
      setState(DevicePowerState::ACTIVE, "I/O observed");
    }
    return;
  }

  // I/O while believed asleep: confirm the wake with the drive itself
  const ata::PowerModeResult MODE = queryDrive("I/O while in standby", report);
  if (!MODE.ok()) {
    setState(DevicePowerState::ERROR, "power mode query failed");
    return;
  }

  switch (MODE.mode) {
  case ata::PowerMode::ACTIVE:
  case ata::PowerMode::IDLE:
    setState(DevicePowerState::ACTIVE, "woke up");
    break;
  case ata::PowerMode::STANDBY:
  case ata::PowerMode::UNKNOWN:
    break;
  }
}

void DeviceMonitor::onUnchanged(std::uint64_t nowNs, TickReport& report) {
  const std::uint64_t IDLE_NS = (nowNs > lastActivityNs_) ? nowNs - lastActivityNs_ : 0;
  const bool DEBOUNCED =
      spindownIssuedNs_.has_value() && (nowNs - *spindownIssuedNs_) < settings_.checkIntervalNs;

  log::debug("{}: idle {}s of {}s", name_.data(), nsToSec(IDLE_NS),
             nsToSec(settings_.idleTimeoutNs));

  if (IDLE_NS >= settings_.idleTimeoutNs && state_ != DevicePowerState::STANDBY && !DEBOUNCED) {
    spinDown(nowNs, report);
    return;
  }

  if (stale_ || verifyPending_ || state_ == DevicePowerState::UNKNOWN ||
      state_ == DevicePowerState::ERROR) {
    reconcile(stale_ ? "stale" : (verifyPending_ ? "verify standby" : "unsettled"), report);
  }
}

void DeviceMonitor::spinDown(std::uint64_t nowNs, TickReport& report) {
  report.standbyIssued = true;
  const ata::PassthroughResult RESULT = channel_->requestStandby();

  if (!RESULT.ok()) {
    log::debug("{}: STANDBY IMMEDIATE failed: {}", name_.data(), RESULT.error.toString());
    noteFailure(report, fmt::format("standby: {}", RESULT.error.toString()));
    setState(DevicePowerState::ERROR, "standby request failed");
    return;
  }

  log::info("{}: spun down after {}s idle", name_.data(), nsToSec(nowNs - lastActivityNs_));
  spindownIssuedNs_ = nowNs;
  verifyPending_ = true;
  setState(DevicePowerState::STANDBY, "standby requested");
}

ata::PowerModeResult DeviceMonitor::queryDrive(const char* reason, TickReport& report) {
  report.queried = true;
  ata::PowerModeResult mode = channel_->queryPowerMode();
  log::debug("{}: CHECK POWER MODE ({}): {}", name_.data(), reason, mode.toString());
  if (!mode.ok()) {
    noteFailure(report, fmt::format("power mode: {}", mode.error.toString()));
  }
  return mode;
}

void DeviceMonitor::reconcile(const char* reason, TickReport& report) {
  const ata::PowerModeResult MODE = queryDrive(reason, report);
  if (!MODE.ok()) {
    return;
  }

  stale_ = false;
  verifyPending_ = false;

  switch (MODE.mode) {
  case ata::PowerMode::STANDBY:
    setState(DevicePowerState::STANDBY, "drive reports standby");
    break;
  case ata::PowerMode::ACTIVE:
  case ata::PowerMode::IDLE:
    setState(DevicePowerState::ACTIVE, "drive reports spinning");
    break;
  case ata::PowerMode::UNKNOWN:
    log::debug("{}: unrecognized power mode 0x{:02x}, keeping {}", name_.data(), MODE.rawCode,
               toString(state_));
    break;
  }
}

void DeviceMonitor::setState(DevicePowerState next, const char* reason) {
  if (next == state_) {
    return;
  }
  log::debug("{}: {} -> {} ({})", name_.data(), toString(state_), toString(next), reason);
  state_ = next;
}

void DeviceMonitor::noteFailure(TickReport& report, std::string detail) {
  report.failed = true;
  if (tickFailure_.empty()) {
    tickFailure_ = std::move(detail);
  }
}

void DeviceMonitor::finishTick(TickReport& report) {
  report.state = state_;

  if (report.failed) {
    ++failureStreak_;
    if (failureStreak_ == FAILURE_WARN_THRESHOLD) {
      log::warn("{}: failing for {} consecutive checks: {}", name_.data(), failureStreak_,
                tickFailure_);
    } else {
      log::debug("{}: failure {}: {}", name_.data(), failureStreak_, tickFailure_);
    }
    return;
  }

  if (failureStreak_ >= FAILURE_WARN_THRESHOLD) {
    log::info("{}: recovered after {} failed checks", name_.data(), failureStreak_);
  }
  failureStreak_ = 0;
}

} // namespace monitor

} // namespace spindown
