/**
 * @file spindownd.cpp
 * @brief Idle hard drive spin-down daemon.
 *
 * Watches the I/O counters of each listed drive, sends STANDBY IMMEDIATE
 * once a drive has been idle for its timeout, and optionally suspends the
 * host once every drive is asleep. Runs until SIGINT/SIGTERM.
 */

#include "src/ata/inc/PowerChannel.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/monitor/inc/DaemonConfig.hpp"
#include "src/monitor/inc/Scheduler.hpp"
#include "src/power/inc/HostSuspend.hpp"

#include <csignal>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace mon = spindown::monitor;
namespace logging = spindown::helpers::log;

namespace {

/* ----------------------------- Signal Handling ----------------------------- */

volatile std::sig_atomic_t g_running = 1;

void signalHandler(int /*signum*/) { g_running = 0; }

/* ----------------------------- Startup ----------------------------- */

void printUsage(const char* prog, std::FILE* out) {
  spindown::helpers::args::printUsage(prog, mon::POSITIONAL_USAGE, mon::DESCRIPTION,
                                      mon::buildDaemonArgMap(), out);
}

void logConfig(const mon::DaemonConfig& cfg) {
  const mon::GlobalConfig& G = cfg.global;
  logging::info("check interval {}s, tolerance {} ops", G.checkIntervalSec, G.toleranceOps);
  for (const mon::DeviceConfig& DEV : cfg.devices) {
    logging::info("{}: idle timeout {}s", DEV.name.data(), DEV.idleTimeoutSec);
  }
  if (G.suspendEnabled) {
    logging::info("suspend: enabled, state '{}', after {}s, check script {}",
                  G.suspendState.data(), G.suspendTimeoutSec,
                  G.suspendCheckScript.empty() ? std::string("none") : G.suspendCheckScript);
  }
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  logging::setLogTag("spindownd");

  std::vector<std::string_view> args;
  args.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  const mon::ConfigResult PARSED = mon::parseDaemonConfig(args);
  if (PARSED.status == mon::ConfigStatus::HELP_REQUESTED) {
    printUsage(argv[0], stdout);
    return 0;
  }
  if (!PARSED.ok()) {
    fmt::print(stderr, "Error: {}\n\n", PARSED.error);
    printUsage(argv[0], stderr);
    return 1;
  }

  const mon::DaemonConfig& CFG = PARSED.config;
  if (CFG.global.debug) {
    logging::setLogLevel(logging::LogLevel::DEBUG);
  }
  logConfig(CFG);

  const mon::ChannelFactory MAKE_CHANNEL = [](const char* device) {
    return std::make_unique<spindown::ata::SgPowerChannel>(device);
  };

  std::vector<std::string> dropped;
  std::unique_ptr<mon::Daemon> daemon =
      mon::buildDaemon(CFG, MAKE_CHANNEL,
                       std::make_unique<spindown::power::SysfsHostSuspend>(
                           CFG.global.suspendState.data()),
                       dropped);
  if (!daemon) {
    logging::error("none of the configured devices has readable statistics");
    return 1;
  }

  logging::info("monitoring {} device(s)", daemon->monitors.size());
  const std::uint64_t TICKS = mon::runLoop(*daemon, g_running);
  logging::info("stopping after {} check(s)", TICKS);
  return 0;
}
