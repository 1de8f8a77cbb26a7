#ifndef SPINDOWN_MONITOR_DAEMON_CONFIG_HPP
#define SPINDOWN_MONITOR_DAEMON_CONFIG_HPP
/**
 * @file DaemonConfig.hpp
 * @brief Command-line configuration of the spindown daemon.
 *
 * Usage: spindownd [OPTIONS] DEVICE:TIMEOUT [DEVICE:TIMEOUT ...]
 *
 * All values are validated here; a successfully parsed DaemonConfig needs no
 * further checks except the startup probe of each device's statistics.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Cpu.hpp"
#include "src/power/inc/HostSuspend.hpp"
#include "src/storage/inc/DiskStats.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace spindown {

namespace monitor {

/* ----------------------------- Defaults ----------------------------- */

inline constexpr std::uint64_t DEFAULT_CHECK_INTERVAL_SEC = 60;
inline constexpr std::uint64_t DEFAULT_SUSPEND_TIMEOUT_SEC = 60;
inline constexpr std::uint64_t DEFAULT_TOLERANCE_OPS = 0;

/// Largest interval or timeout whose nanosecond value fits in 64 bits.
inline constexpr std::uint64_t MAX_SECONDS = UINT64_MAX / helpers::cpu::NS_PER_SEC;

/* ----------------------------- Types ----------------------------- */

/**
 * @brief One managed drive.
 */
struct DeviceConfig {
  std::array<char, storage::DEVICE_NAME_SIZE> name{};
  std::uint64_t idleTimeoutSec{0};
};

/**
 * @brief Daemon-wide settings.
 */
struct GlobalConfig {
  std::uint64_t checkIntervalSec{DEFAULT_CHECK_INTERVAL_SEC};
  std::uint64_t toleranceOps{DEFAULT_TOLERANCE_OPS};
  bool suspendEnabled{false};
  std::uint64_t suspendTimeoutSec{DEFAULT_SUSPEND_TIMEOUT_SEC};
  std::string suspendCheckScript{}; ///< Empty when no script is configured
  std::array<char, power::SUSPEND_STATE_SIZE> suspendState{'m', 'e', 'm', '\0'};
  bool debug{false};
};

/**
 * @brief Complete startup configuration.
 */
struct DaemonConfig {
  GlobalConfig global{};
  std::vector<DeviceConfig> devices{}; ///< In command-line order
};

/**
 * @brief Parse outcome.
 */
enum class ConfigStatus : std::uint8_t {
  OK = 0,
  HELP_REQUESTED,
  INVALID,
};

/// @brief Human-readable status string.
[[nodiscard]] const char* toString(ConfigStatus status) noexcept;

/**
 * @brief Result of parseDaemonConfig().
 */
struct ConfigResult {
  ConfigStatus status{ConfigStatus::INVALID};
  DaemonConfig config{};
  std::string error{}; ///< Set when status == INVALID

  [[nodiscard]] bool ok() const noexcept { return status == ConfigStatus::OK; }
};

/* ----------------------------- API ----------------------------- */

/// Usage line fragment for positional arguments.
inline constexpr std::string_view POSITIONAL_USAGE = "DEVICE:TIMEOUT [DEVICE:TIMEOUT ...]";

/// Tool description for --help.
inline constexpr std::string_view DESCRIPTION =
    "Spin down idle hard drives and optionally suspend the host once all are asleep.\n\n"
    "Each DEVICE:TIMEOUT names a block device (e.g., sdb) and the seconds of\n"
    "inactivity after which it is sent to standby.";

/// @brief Flag definitions for the daemon.
[[nodiscard]] helpers::args::ArgMap buildDaemonArgMap();

/**
 * @brief Parse a "DEVICE:TIMEOUT" token.
 * @param spec Token, split at the last ':'.
 * @param out Receives name and timeout.
 * @param error Receives a message on failure.
 * @return false on an empty or invalid name, or a non-positive timeout.
 */
[[nodiscard]] bool parseDeviceSpec(std::string_view spec, DeviceConfig& out, std::string& error);

/**
 * @brief Parse and validate the daemon command line (without argv[0]).
 */
[[nodiscard]] ConfigResult parseDaemonConfig(std::span<const std::string_view> args);

} // namespace monitor

} // namespace spindown

#endif // SPINDOWN_MONITOR_DAEMON_CONFIG_HPP
