#ifndef SPINDOWN_ATA_ATA_PASSTHROUGH_HPP
#define SPINDOWN_ATA_ATA_PASSTHROUGH_HPP
/**
 * @file AtaPassthrough.hpp
 * @brief SAT ATA PASS-THROUGH (16) command building and response decoding.
 * @note Pure functions: no I/O. Only error text and toString() allocate.
 *
 * The drive is reached through the SCSI generic transport: a 16-byte SCSI
 * CDB wraps the ATA command, and the ATA output registers come back in the
 * sense buffer (ATA Return Descriptor, or fixed-format INFORMATION field).
 *
 * References:
 *  - T10 SAT-3, 12.2.2 ATA PASS-THROUGH (16)
 *  - T10 SAT-3, 12.2.2.6 ATA Status Return sense data descriptor
 *  - T13 ACS-3, 7.5 CHECK POWER MODE
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace spindown {

namespace ata {

/* ----------------------------- Constants ----------------------------- */

/// SCSI opcode for ATA PASS-THROUGH (16).
inline constexpr std::uint8_t SAT_ATA_PASSTHROUGH_16 = 0x85;

/// CDB length for ATA PASS-THROUGH (16).
inline constexpr std::size_t SAT_CDB_LEN = 16;

/// ATA CHECK POWER MODE.
inline constexpr std::uint8_t ATA_CHECK_POWER_MODE = 0xE5;

/// ATA STANDBY IMMEDIATE.
inline constexpr std::uint8_t ATA_STANDBY_IMMEDIATE = 0xE0;

/// Sense buffer size handed to the kernel.
inline constexpr std::size_t SENSE_BUF_LEN = 32;

/// Command timeout passed to SG_IO (milliseconds).
inline constexpr std::uint32_t PASSTHROUGH_TIMEOUT_MS = 15000;

/// SCSI status byte values.
inline constexpr std::uint8_t SCSI_STATUS_GOOD = 0x00;
inline constexpr std::uint8_t SCSI_STATUS_CHECK_CONDITION = 0x02;

/// SG driver_status: sense buffer valid.
inline constexpr std::uint16_t SG_DRIVER_SENSE = 0x08;

/// SG driver_status: mask for the driver byte proper.
inline constexpr std::uint16_t SG_DRIVER_MASK = 0x0F;

/// ATA status register bits.
inline constexpr std::uint8_t ATA_STATUS_ERR = 0x01;
inline constexpr std::uint8_t ATA_STATUS_DF = 0x20;
inline constexpr std::uint8_t ATA_STATUS_BSY = 0x80;

/* ----------------------------- PowerMode ----------------------------- */

/**
 * @brief Drive power mode as reported by CHECK POWER MODE.
 */
enum class PowerMode : std::uint8_t {
  UNKNOWN = 0, ///< Code not in the lookup table
  ACTIVE,      ///< Spinning, active or idle (0xFF, 0x41)
  IDLE,        ///< Spinning, one of the idle states (0x80..0x83)
  STANDBY,     ///< Spun down (0x00, 0x01, 0x40)
};

/// @brief Human-readable power mode.
[[nodiscard]] const char* toString(PowerMode mode) noexcept;

/**
 * @brief Map a CHECK POWER MODE count register value to a power mode.
 *
 * Lookup table (ACS-3 Table 42, plus obsolete NV Cache codes):
 *   0x00 Standby (PM2)                 -> STANDBY
 *   0x01 Standby_y                     -> STANDBY
 *   0x40 NV Cache, spindle spun down   -> STANDBY
 *   0x41 NV Cache, spindle spun up     -> ACTIVE
 *   0x80 Idle (PM1)                    -> IDLE
 *   0x81 Idle_a                        -> IDLE
 *   0x82 Idle_b                        -> IDLE
 *   0x83 Idle_c                        -> IDLE
 *   0xFF Active or Idle                -> ACTIVE
 *   anything else                      -> UNKNOWN
 */
[[nodiscard]] PowerMode classifyPowerMode(std::uint8_t countRegister) noexcept;

/* ----------------------------- PassthroughError ----------------------------- */

/**
 * @brief Where a passthrough exchange failed.
 */
enum class PassthroughStage : std::uint8_t {
  NONE = 0, ///< No failure
  IOCTL,    ///< Open or ioctl(SG_IO) failed (permissions, missing device, ENOTTY)
  STATUS,   ///< Transport or drive rejected the command
  RESPONSE, ///< Response short, truncated or not understood
};

/// @brief Stage name ("ioctl", "status", "response").
[[nodiscard]] const char* toString(PassthroughStage stage) noexcept;

/**
 * @brief Failure description for a passthrough exchange.
 */
struct PassthroughError {
  PassthroughStage stage{PassthroughStage::NONE};
  std::string detail{};

  [[nodiscard]] bool isError() const noexcept { return stage != PassthroughStage::NONE; }

  /// @brief "stage: detail".
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Results ----------------------------- */

/**
 * @brief Result of a command that returns no data (STANDBY IMMEDIATE).
 */
struct PassthroughResult {
  PassthroughError error{};

  [[nodiscard]] bool ok() const noexcept { return !error.isError(); }
};

/**
 * @brief Result of CHECK POWER MODE.
 */
struct PowerModeResult {
  PowerMode mode{PowerMode::UNKNOWN};
  std::uint8_t rawCode{0}; ///< Count register as returned by the drive
  PassthroughError error{};

  [[nodiscard]] bool ok() const noexcept { return !error.isError(); }

  /// @brief "STANDBY (0x00)" or the error text.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Wire Structures ----------------------------- */

/**
 * @brief ATA output registers recovered from sense data.
 */
struct AtaRegisters {
  std::uint8_t error{0};
  std::uint8_t count{0}; ///< Sector count (7:0); power mode for CHECK POWER MODE
  std::uint8_t lbaLow{0};
  std::uint8_t lbaMid{0};
  std::uint8_t lbaHigh{0};
  std::uint8_t device{0};
  std::uint8_t status{0};
};

/**
 * @brief Transport-level outcome of one SG_IO call.
 *
 * Mirrors the output fields of sg_io_hdr that matter here, so response
 * interpretation can be exercised without a device.
 */
struct SgTransport {
  std::uint8_t scsiStatus{0};    ///< sg_io_hdr.status
  std::uint16_t hostStatus{0};   ///< sg_io_hdr.host_status
  std::uint16_t driverStatus{0}; ///< sg_io_hdr.driver_status
  std::uint8_t senseLen{0};      ///< sg_io_hdr.sb_len_wr
};

/**
 * @brief Decoded SCSI sense header fields.
 */
struct SenseInfo {
  std::uint8_t responseCode{0}; ///< 0x70/0x71 fixed, 0x72/0x73 descriptor
  std::uint8_t senseKey{0};
  std::uint8_t asc{0};
  std::uint8_t ascq{0};
  bool hasAtaRegisters{false};
  AtaRegisters regs{};
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Build an ATA PASS-THROUGH (16) CDB for a 28-bit non-data command.
 * @param ataCommand ATA command opcode (e.g., ATA_CHECK_POWER_MODE).
 * @param checkCondition Ask the SATL to return output registers (CK_COND).
 * @return CDB bytes.
 *
 * Byte 1: PROTOCOL=3 (non-data), EXTEND=0.
 * Byte 2: CK_COND, T_DIR=1, BYTE_BLOCK=1, T_LENGTH=0 (no data).
 */
[[nodiscard]] std::array<std::uint8_t, SAT_CDB_LEN> buildPassthroughCdb(std::uint8_t ataCommand,
                                                                      bool checkCondition) noexcept;

/**
 * @brief Decode sense data in either fixed or descriptor format.
 * @param sense Sense buffer.
 * @param len Valid bytes in @p sense (sb_len_wr).
 * @param out Decoded header and, when present, ATA registers.
 * @return false if the buffer is too short or the response code is unknown.
 */
[[nodiscard]] bool decodeSense(const std::uint8_t* sense, std::size_t len, SenseInfo& out) noexcept;

/**
 * @brief Interpret the response to CHECK POWER MODE (sent with CK_COND=1).
 * @param transport Transport outcome of the SG_IO call.
 * @param sense Sense buffer filled by the kernel.
 * @return Classified power mode, or an error at stage STATUS/RESPONSE.
 *
 * An unrecognized power mode code is not an error: the result is UNKNOWN
 * with rawCode set.
 */
[[nodiscard]] PowerModeResult interpretPowerModeResponse(const SgTransport& transport,
                                                         const std::uint8_t* sense);

/**
 * @brief Interpret the response to STANDBY IMMEDIATE (sent with CK_COND=0).
 * @param transport Transport outcome of the SG_IO call.
 * @param sense Sense buffer filled by the kernel.
 * @return ok() if the drive acknowledged without error.
 */
[[nodiscard]] PassthroughResult interpretStandbyResponse(const SgTransport& transport,
                                                         const std::uint8_t* sense);

} // namespace ata

} // namespace spindown

#endif // SPINDOWN_ATA_ATA_PASSTHROUGH_HPP
