/**
 * @file SuspendCoordinator.cpp
 * @brief All-asleep tracking and host suspend gating.
 */

#include "src/monitor/inc/SuspendCoordinator.hpp"

#include "src/helpers/inc/Cpu.hpp"
#include "src/helpers/inc/Log.hpp"

#include <utility>

namespace spindown {

namespace monitor {

namespace log = spindown::helpers::log;

using spindown::helpers::cpu::nsToSec;

/* ----------------------------- Enum Helpers ----------------------------- */

const char* toString(SuspendDecision decision) noexcept {
  switch (decision) {
  case SuspendDecision::DISABLED:
    return "DISABLED";
  case SuspendDecision::NOT_ALL_ASLEEP:
    return "NOT_ALL_ASLEEP";
  case SuspendDecision::SETTLING:
    return "SETTLING";
  case SuspendDecision::NOT_READY:
    return "NOT_READY";
  case SuspendDecision::SUSPENDED:
    return "SUSPENDED";
  case SuspendDecision::ALREADY_SUSPENDED:
    return "ALREADY_SUSPENDED";
  }
  return "UNKNOWN";
}

bool allAsleep(std::span<const DeviceMonitor> monitors) noexcept {
  if (monitors.empty()) {
    return false;
  }
  for (const DeviceMonitor& MON : monitors) {
    if (!MON.isAsleep()) {
      return false;
    }
  }
  return true;
}

/* ----------------------------- SuspendCoordinator ----------------------------- */

SuspendCoordinator::SuspendCoordinator(SuspendSettings settings,
                                       std::unique_ptr<power::HostSuspend> host)
    : settings_(std::move(settings)), host_(std::move(host)) {}

SuspendDecision SuspendCoordinator::evaluate(std::span<const DeviceMonitor> monitors,
                                             std::uint64_t nowNs) {
  if (!settings_.enabled || !host_) {
    return SuspendDecision::DISABLED;
  }

  if (!allAsleep(monitors)) {
    if (allAsleepSince_) {
      log::debug("suspend: a device left standby, resetting");
    }
    allAsleepSince_.reset();
    lastScriptStatus_.reset();
    armed_ = true;
    return SuspendDecision::NOT_ALL_ASLEEP;
  }

  if (!allAsleepSince_) {
    log::debug("suspend: all devices in standby");
    allAsleepSince_ = nowNs;
  }

  if (!armed_) {
    return SuspendDecision::ALREADY_SUSPENDED;
  }

  const std::uint64_t ASLEEP_NS = nowNs - *allAsleepSince_;
  if (ASLEEP_NS < settings_.timeoutNs) {
    log::debug("suspend: all asleep for {}s of {}s", nsToSec(ASLEEP_NS),
               nsToSec(settings_.timeoutNs));
    return SuspendDecision::SETTLING;
  }

  if (!settings_.checkScript.empty() && !scriptAllowsSuspend()) {
    return SuspendDecision::NOT_READY;
  }

  log::info("suspend: all devices asleep for {}s, suspending host", nsToSec(ASLEEP_NS));
  armed_ = false;
  ++suspendCount_;

  const power::SuspendResult RESULT = host_->suspend();
  if (RESULT.ok()) {
    log::info("suspend: host resumed");
  } else {
    log::warn("suspend: request failed: {}", RESULT.toString());
  }
  return SuspendDecision::SUSPENDED;
}

bool SuspendCoordinator::scriptAllowsSuspend() {
  const power::ScriptResult RESULT = power::runReadinessCheck(settings_.checkScript.c_str());
  const bool CHANGED = !lastScriptStatus_ || *lastScriptStatus_ != RESULT.status;
  lastScriptStatus_ = RESULT.status;

  if (RESULT.ready()) {
    log::debug("suspend: {} reports ready", settings_.checkScript);
    return true;
  }

  if (RESULT.isExecutionError()) {
    if (CHANGED) {
      log::warn("suspend: could not run {}: {}", settings_.checkScript, RESULT.toString());
    } else {
      log::debug("suspend: could not run {}: {}", settings_.checkScript, RESULT.toString());
    }
  } else if (CHANGED) {
    log::info("suspend: blocked by {}: {}", settings_.checkScript, RESULT.toString());
  } else {
    log::debug("suspend: blocked by {}: {}", settings_.checkScript, RESULT.toString());
  }
  return false;
}

} // namespace monitor

} // namespace spindown
