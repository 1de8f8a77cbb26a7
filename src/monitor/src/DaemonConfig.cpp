/**
 * @file DaemonConfig.cpp
 * @brief Command-line parsing and validation for spindownd.
 */

#include "src/monitor/inc/DaemonConfig.hpp"

#include "src/helpers/inc/Strings.hpp"

#include <cstring>

#include <fmt/core.h>

namespace spindown {

namespace monitor {

namespace args = spindown::helpers::args;

using spindown::helpers::strings::copyToFixedArray;
using spindown::helpers::strings::parseUint64;

namespace {

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_INTERVAL = 1,
  ARG_TOLERANCE = 2,
  ARG_DEBUG = 3,
  ARG_SUSPEND = 4,
  ARG_SUSPEND_TIMEOUT = 5,
  ARG_SUSPEND_SCRIPT = 6,
  ARG_SUSPEND_STATE = 7,
};

/// Parse a strictly positive number of seconds.
bool parsePositive(std::string_view text, std::string_view what, std::uint64_t& out,
                   std::string& error) {
  std::uint64_t value = 0;
  if (!parseUint64(text, value) || value == 0) {
    error = fmt::format("{} must be a positive integer, got '{}'", what, text);
    return false;
  }
  if (value > MAX_SECONDS) {
    error = fmt::format("{} must be at most {} seconds, got '{}'", what, MAX_SECONDS, text);
    return false;
  }
  out = value;
  return true;
}

} // namespace

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(ConfigStatus status) noexcept {
  switch (status) {
  case ConfigStatus::OK:
    return "OK";
  case ConfigStatus::HELP_REQUESTED:
    return "HELP_REQUESTED";
  case ConfigStatus::INVALID:
    return "INVALID";
  }
  return "UNKNOWN";
}

/* ----------------------------- API ----------------------------- */

args::ArgMap buildDaemonArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_INTERVAL] = {"-i", 1, false, "Check interval in seconds (default: 60)"};
  map[ARG_TOLERANCE] = {"-t", 1, false,
                        "Read/write ops per tick still counted as idle (default: 0)"};
  map[ARG_DEBUG] = {"-d", 0, false, "Debug output"};
  map[ARG_SUSPEND] = {"--suspend", 0, false, "Suspend the host once all drives are asleep"};
  map[ARG_SUSPEND_TIMEOUT] = {"--suspend-timeout", 1, false,
                              "Seconds all drives must stay asleep before suspend (default: 60)"};
  map[ARG_SUSPEND_SCRIPT] = {"--suspend-check-script", 1, false,
                             "Script that must exit 0 before suspending"};
  map[ARG_SUSPEND_STATE] = {"--suspend-state", 1, false,
                            "Word written to /sys/power/state (default: mem)"};
  return map;
}

bool parseDeviceSpec(std::string_view spec, DeviceConfig& out, std::string& error) {
  const std::size_t COLON = spec.rfind(':');
  if (COLON == std::string_view::npos) {
    error = fmt::format("Expected DEVICE:TIMEOUT, got '{}'", spec);
    return false;
  }

  const std::string_view NAME = spec.substr(0, COLON);
  const std::string_view TIMEOUT = spec.substr(COLON + 1);

  if (!storage::isValidDeviceName(NAME)) {
    error = fmt::format("Invalid device name '{}'", NAME);
    return false;
  }

  std::uint64_t timeout = 0;
  if (!parsePositive(TIMEOUT, fmt::format("Timeout for '{}'", NAME), timeout, error)) {
    return false;
  }

  copyToFixedArray(out.name, NAME);
  out.idleTimeoutSec = timeout;
  return true;
}

ConfigResult parseDaemonConfig(std::span<const std::string_view> argv) {
  ConfigResult result{};

  const args::ArgMap ARG_MAP = buildDaemonArgMap();
  args::ParsedArgs pargs;
  args::Positionals positionals;

  if (!args::parseArgs(argv, ARG_MAP, pargs, positionals, result.error)) {
    return result;
  }

  if (pargs.count(ARG_HELP) != 0) {
    result.status = ConfigStatus::HELP_REQUESTED;
    return result;
  }

  GlobalConfig& global = result.config.global;
  global.debug = (pargs.count(ARG_DEBUG) != 0);
  global.suspendEnabled = (pargs.count(ARG_SUSPEND) != 0);

  if (pargs.count(ARG_INTERVAL) != 0 &&
      !parsePositive(pargs[ARG_INTERVAL][0], "Interval", global.checkIntervalSec, result.error)) {
    return result;
  }

  if (pargs.count(ARG_TOLERANCE) != 0 &&
      !parseUint64(pargs[ARG_TOLERANCE][0], global.toleranceOps)) {
    result.error =
        fmt::format("Tolerance must be a non-negative integer, got '{}'", pargs[ARG_TOLERANCE][0]);
    return result;
  }

  if (pargs.count(ARG_SUSPEND_TIMEOUT) != 0 &&
      !parsePositive(pargs[ARG_SUSPEND_TIMEOUT][0], "Suspend timeout", global.suspendTimeoutSec,
                     result.error)) {
    return result;
  }

  if (pargs.count(ARG_SUSPEND_SCRIPT) != 0) {
    const std::string_view SCRIPT = pargs[ARG_SUSPEND_SCRIPT][0];
    if (SCRIPT.empty()) {
      result.error = "Suspend check script path is empty";
      return result;
    }
    global.suspendCheckScript.assign(SCRIPT);
  }

  if (pargs.count(ARG_SUSPEND_STATE) != 0) {
    const std::string_view STATE = pargs[ARG_SUSPEND_STATE][0];
    if (!power::isValidSuspendState(STATE)) {
      result.error = fmt::format("Unsupported suspend state '{}'", STATE);
      return result;
    }
    copyToFixedArray(global.suspendState, STATE);
  }

  if (positionals.empty()) {
    result.error = "At least one DEVICE:TIMEOUT is required";
    return result;
  }

  result.config.devices.reserve(positionals.size());
  for (const std::string_view TOKEN : positionals) {
    DeviceConfig dev{};
    if (!parseDeviceSpec(TOKEN, dev, result.error)) {
      return result;
    }
    for (const DeviceConfig& EXISTING : result.config.devices) {
      if (std::strcmp(EXISTING.name.data(), dev.name.data()) == 0) {
        result.error = fmt::format("Device '{}' listed more than once", dev.name.data());
        return result;
      }
    }
    result.config.devices.push_back(dev);
  }

  result.status = ConfigStatus::OK;
  return result;
}

} // namespace monitor

} // namespace spindown
