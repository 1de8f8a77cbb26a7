/**
 * @file spindown-status.cpp
 * @brief One-shot report of drive I/O counters and power mode.
 *
 * Uses CHECK POWER MODE, which does not wake a sleeping drive. Requires root
 * (or CAP_SYS_RAWIO) for the power mode column.
 */

#include "src/ata/inc/PowerChannel.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/storage/inc/DiskStats.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace ata = spindown::ata;
namespace storage = spindown::storage;

namespace {

/* ----------------------------- Argument Handling ----------------------------- */

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_JSON = 1,
  ARG_DEVICE = 2,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Show read/write op counters and ATA power mode for SCSI/SATA disks.\n\n"
    "Without --device, every sd* device under /sys/block is reported.";

/// Build argument definitions.
spindown::helpers::args::ArgMap buildArgMap() {
  spindown::helpers::args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  map[ARG_DEVICE] = {"--device", 1, false, "Report a single device (e.g., sdb)"};
  return map;
}

/* ----------------------------- Collection ----------------------------- */

struct DeviceStatus {
  std::string name;
  storage::DiskStatsResult stats;
  ata::PowerModeResult power;
};

DeviceStatus collect(const char* device) {
  DeviceStatus status{};
  status.name = device;
  status.stats = storage::readDiskCounters(device);
  ata::SgPowerChannel channel(device);
  status.power = channel.queryPowerMode();
  return status;
}

/* ----------------------------- Human Output ----------------------------- */

void printHuman(const std::vector<DeviceStatus>& devices) {
  fmt::print("{:<10} {:>14} {:>14}  {}\n", "Device", "Read ops", "Write ops", "Power mode");
  fmt::print("{:-<10} {:->14} {:->14}  {:-<10}\n", "", "", "", "");

  for (const DeviceStatus& D : devices) {
    if (D.stats.ok()) {
      fmt::print("{:<10} {:>14} {:>14}  {}\n", D.name, D.stats.counters.readOps,
                 D.stats.counters.writeOps, D.power.toString());
    } else {
      fmt::print("{:<10} {:>29}  {}\n", D.name, D.stats.toString(), D.power.toString());
    }
  }
}

/* ----------------------------- JSON Output ----------------------------- */

void printJson(const std::vector<DeviceStatus>& devices) {
  fmt::print("{{\n  \"devices\": [");

  for (std::size_t i = 0; i < devices.size(); ++i) {
    const DeviceStatus& D = devices[i];
    fmt::print("{}\n    {{\n", (i == 0) ? "" : ",");
    fmt::print("      \"name\": \"{}\",\n", D.name);

    if (D.stats.ok()) {
      fmt::print("      \"readOps\": {},\n", D.stats.counters.readOps);
      fmt::print("      \"writeOps\": {},\n", D.stats.counters.writeOps);
    } else {
      fmt::print("      \"statsError\": \"{}\",\n", D.stats.toString());
    }

    if (D.power.ok()) {
      fmt::print("      \"powerMode\": \"{}\",\n", ata::toString(D.power.mode));
      fmt::print("      \"powerModeCode\": {}\n", D.power.rawCode);
    } else {
      fmt::print("      \"powerError\": \"{}\"\n", D.power.error.toString());
    }
    fmt::print("    }}");
  }

  fmt::print("\n  ]\n}}\n");
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const spindown::helpers::args::ArgMap ARG_MAP = buildArgMap();
  spindown::helpers::args::ParsedArgs pargs;
  spindown::helpers::args::Positionals positionals;

  std::vector<std::string_view> args;
  args.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  std::string error;
  if (!spindown::helpers::args::parseArgs(args, ARG_MAP, pargs, positionals, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    spindown::helpers::args::printUsage(argv[0], "", DESCRIPTION, ARG_MAP, stderr);
    return 1;
  }
  if (!positionals.empty()) {
    fmt::print(stderr, "Error: Unexpected argument '{}'\n\n", positionals.front());
    spindown::helpers::args::printUsage(argv[0], "", DESCRIPTION, ARG_MAP, stderr);
    return 1;
  }
  if (pargs.count(ARG_HELP) != 0) {
    spindown::helpers::args::printUsage(argv[0], "", DESCRIPTION, ARG_MAP);
    return 0;
  }

  const bool JSON_OUTPUT = (pargs.count(ARG_JSON) != 0);

  std::vector<DeviceStatus> devices;
  if (pargs.count(ARG_DEVICE) != 0) {
    const std::string NAME(pargs[ARG_DEVICE][0]);
    if (!storage::isValidDeviceName(NAME)) {
      fmt::print(stderr, "Error: Invalid device name '{}'\n", NAME);
      return 1;
    }
    devices.push_back(collect(NAME.c_str()));
  } else {
    const storage::DiskNameList LIST = storage::listBlockDevices("sd");
    for (std::size_t i = 0; i < LIST.count; ++i) {
      devices.push_back(collect(LIST.names[i].data()));
    }
  }

  if (JSON_OUTPUT) {
    printJson(devices);
  } else if (devices.empty()) {
    fmt::print("No sd* block devices found\n");
  } else {
    printHuman(devices);
  }

  return 0;
}
