#ifndef SPINDOWN_ATA_POWER_CHANNEL_HPP
#define SPINDOWN_ATA_POWER_CHANNEL_HPP
/**
 * @file PowerChannel.hpp
 * @brief Per-device drive power control: query power mode, request standby.
 * @note Linux-only (SG_IO). Requires CAP_SYS_RAWIO or root for /dev/sdX.
 * @note Not thread-safe per instance; one channel belongs to one monitor.
 *
 * PowerChannel is the seam between the device state machine and hardware.
 * SgPowerChannel opens /dev/\<dev\> for each command and closes it again, so
 * no handle outlives a tick. Commands are synchronous and never retried.
 */

#include "src/ata/inc/AtaPassthrough.hpp"
#include "src/storage/inc/DiskStats.hpp"

#include <array>
#include <cstdint>
#include <string_view>

namespace spindown {

namespace ata {

/* ----------------------------- PowerChannel ----------------------------- */

/**
 * @brief Drive power operations for a single device.
 */
class PowerChannel {
public:
  virtual ~PowerChannel() = default;

  /// @brief Issue CHECK POWER MODE. Does not wake a sleeping drive.
  [[nodiscard]] virtual PowerModeResult queryPowerMode() = 0;

  /// @brief Issue STANDBY IMMEDIATE.
  [[nodiscard]] virtual PassthroughResult requestStandby() = 0;

  /// @brief Device name this channel talks to.
  [[nodiscard]] virtual const char* device() const noexcept = 0;
};

/* ----------------------------- SgPowerChannel ----------------------------- */

/**
 * @brief PowerChannel over SAT ATA PASS-THROUGH (16) and ioctl(SG_IO).
 */
class SgPowerChannel final : public PowerChannel {
public:
  /// Default directory holding device nodes.
  static constexpr const char* DEV_ROOT = "/dev";

  /**
   * @param device Block device name (e.g., "sdb").
   * @param devRoot Directory holding the device node.
   */
  explicit SgPowerChannel(std::string_view device, std::string_view devRoot = DEV_ROOT) noexcept;

  [[nodiscard]] PowerModeResult queryPowerMode() override;
  [[nodiscard]] PassthroughResult requestStandby() override;
  [[nodiscard]] const char* device() const noexcept override { return device_.data(); }

private:
  /**
   * Send one non-data ATA command.
   * @param ataCommand ATA opcode.
   * @param checkCondition Request output registers.
   * @param transport Receives SG_IO output fields.
   * @param sense Receives sense data.
   * @return IOCTL-stage error if the device could not be opened or SG_IO failed.
   */
  PassthroughError execute(std::uint8_t ataCommand, bool checkCondition, SgTransport& transport,
                           std::array<std::uint8_t, SENSE_BUF_LEN>& sense);

  std::array<char, storage::DEVICE_NAME_SIZE> device_{};
  std::array<char, 128> path_{};
};

} // namespace ata

} // namespace spindown

#endif // SPINDOWN_ATA_POWER_CHANNEL_HPP
