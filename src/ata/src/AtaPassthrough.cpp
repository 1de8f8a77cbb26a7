/**
 * @file AtaPassthrough.cpp
 * @brief SAT ATA PASS-THROUGH (16) CDB construction and response decoding.
 */

#include "src/ata/inc/AtaPassthrough.hpp"

#include <utility>

#include <fmt/core.h>

namespace spindown {

namespace ata {

namespace {

/* ----------------------------- Constants ----------------------------- */

/// CDB byte 1/2 field values.
constexpr std::uint8_t PROTOCOL_NON_DATA = 3;
constexpr std::uint8_t EXTEND = 0;
constexpr std::uint8_t T_DIR_FROM_DEVICE = 1;
constexpr std::uint8_t BYTE_BLOCK = 1;
constexpr std::uint8_t T_LENGTH_NONE = 0;

/// CDB byte 14 holds the ATA command register.
constexpr std::size_t CDB_COMMAND_OFFSET = 14;

/// Sense response codes.
constexpr std::uint8_t SENSE_FIXED_CURRENT = 0x70;
constexpr std::uint8_t SENSE_FIXED_DEFERRED = 0x71;
constexpr std::uint8_t SENSE_DESC_CURRENT = 0x72;
constexpr std::uint8_t SENSE_DESC_DEFERRED = 0x73;

/// Sense keys accepted as "command completed, registers attached".
constexpr std::uint8_t SENSE_KEY_NO_SENSE = 0x00;
constexpr std::uint8_t SENSE_KEY_RECOVERED_ERROR = 0x01;

/// ASC/ASCQ 00h/1Dh: ATA PASS THROUGH INFORMATION AVAILABLE.
constexpr std::uint8_t ASCQ_ATA_PASSTHROUGH_INFO = 0x1D;

/// ATA Status Return descriptor.
constexpr std::uint8_t ATA_RETURN_DESCRIPTOR = 0x09;
constexpr std::uint8_t ATA_RETURN_DESCRIPTOR_LEN = 0x0C;

/// Minimum bytes for a descriptor-format header / fixed-format through ASCQ.
constexpr std::size_t SENSE_DESC_HEADER_LEN = 8;
constexpr std::size_t SENSE_FIXED_MIN_LEN = 14;

inline PassthroughError makeError(PassthroughStage stage, std::string detail) {
  return PassthroughError{stage, std::move(detail)};
}

inline bool senseKeyAccepted(std::uint8_t key) noexcept {
  return key == SENSE_KEY_NO_SENSE || key == SENSE_KEY_RECOVERED_ERROR;
}

/**
 * Checks common to every passthrough response: host/driver status, SCSI
 * status, and sense buffer sanity. On success @p sense is decoded into
 * @p info and @p haveSense says whether any sense data came back.
 */
PassthroughError checkTransport(const SgTransport& transport, const std::uint8_t* sense,
                                SenseInfo& info, bool& haveSense) {
  haveSense = false;

  if (transport.hostStatus != 0) {
    return makeError(PassthroughStage::STATUS,
                     fmt::format("host_status=0x{:02x}", transport.hostStatus));
  }

  const std::uint16_t DRIVER = transport.driverStatus & SG_DRIVER_MASK;
  if (DRIVER != 0 && DRIVER != SG_DRIVER_SENSE) {
    return makeError(PassthroughStage::STATUS,
                     fmt::format("driver_status=0x{:02x}", transport.driverStatus));
  }

  if (transport.scsiStatus != SCSI_STATUS_GOOD &&
      transport.scsiStatus != SCSI_STATUS_CHECK_CONDITION) {
    return makeError(PassthroughStage::STATUS,
                     fmt::format("scsi_status=0x{:02x}", transport.scsiStatus));
  }

  if (transport.senseLen > SENSE_BUF_LEN) {
    return makeError(PassthroughStage::RESPONSE,
                     fmt::format("sense length {} exceeds buffer", transport.senseLen));
  }

  if (transport.senseLen == 0) {
    if (transport.scsiStatus == SCSI_STATUS_CHECK_CONDITION) {
      return makeError(PassthroughStage::RESPONSE, "check condition without sense data");
    }
    return {};
  }

  if (sense == nullptr || !decodeSense(sense, transport.senseLen, info)) {
    return makeError(PassthroughStage::RESPONSE,
                     fmt::format("malformed sense data (len={})", transport.senseLen));
  }
  haveSense = true;

  if (!senseKeyAccepted(info.senseKey)) {
    std::string detail = fmt::format("sense key=0x{:x} asc=0x{:02x} ascq=0x{:02x}", info.senseKey,
                                     info.asc, info.ascq);
    if (info.hasAtaRegisters) {
      detail += fmt::format(" ata_status=0x{:02x} ata_error=0x{:02x}", info.regs.status,
                            info.regs.error);
    }
    return makeError(PassthroughStage::STATUS, std::move(detail));
  }

  return {};
}

inline bool ataReportsError(const AtaRegisters& regs) noexcept {
  return (regs.status & (ATA_STATUS_ERR | ATA_STATUS_DF)) != 0;
}

inline std::string ataErrorDetail(const AtaRegisters& regs) {
  return fmt::format("ata_status=0x{:02x} ata_error=0x{:02x}", regs.status, regs.error);
}

} // namespace

/* ----------------------------- Enum Helpers ----------------------------- */

const char* toString(PowerMode mode) noexcept {
  switch (mode) {
  case PowerMode::UNKNOWN:
    return "UNKNOWN";
  case PowerMode::ACTIVE:
    return "ACTIVE";
  case PowerMode::IDLE:
    return "IDLE";
  case PowerMode::STANDBY:
    return "STANDBY";
  }
  return "UNKNOWN";
}

const char* toString(PassthroughStage stage) noexcept {
  switch (stage) {
  case PassthroughStage::NONE:
    return "none";
  case PassthroughStage::IOCTL:
    return "ioctl";
  case PassthroughStage::STATUS:
    return "status";
  case PassthroughStage::RESPONSE:
    return "response";
  }
  return "unknown";
}

PowerMode classifyPowerMode(std::uint8_t countRegister) noexcept {
  switch (countRegister) {
  case 0x00:
  case 0x01:
  case 0x40:
    return PowerMode::STANDBY;
  case 0x41:
  case 0xFF:
    return PowerMode::ACTIVE;
  case 0x80:
  case 0x81:
  case 0x82:
  case 0x83:
    return PowerMode::IDLE;
  default:
    return PowerMode::UNKNOWN;
  }
}

/* ----------------------------- Result Methods ----------------------------- */

std::string PassthroughError::toString() const {
  if (!isError()) {
    return "ok";
  }
  return fmt::format("{}: {}", ata::toString(stage), detail);
}

std::string PowerModeResult::toString() const {
  if (!ok()) {
    return error.toString();
  }
  return fmt::format("{} (0x{:02x})", ata::toString(mode), rawCode);
}

/* ----------------------------- API ----------------------------- */

std::array<std::uint8_t, SAT_CDB_LEN> buildPassthroughCdb(std::uint8_t ataCommand,
                                                        bool checkCondition) noexcept {
  std::array<std::uint8_t, SAT_CDB_LEN> cdb{};
  const std::uint8_t CK_COND = checkCondition ? 1 : 0;

  cdb[0] = SAT_ATA_PASSTHROUGH_16;
  cdb[1] = static_cast<std::uint8_t>((PROTOCOL_NON_DATA << 1) | EXTEND);
  cdb[2] = static_cast<std::uint8_t>((CK_COND << 5) | (T_DIR_FROM_DEVICE << 3) | (BYTE_BLOCK << 2) |
                                     T_LENGTH_NONE);
  cdb[CDB_COMMAND_OFFSET] = ataCommand;
  return cdb;
}

bool decodeSense(const std::uint8_t* sense, std::size_t len, SenseInfo& out) noexcept {
  out = SenseInfo{};
  if (sense == nullptr || len < SENSE_DESC_HEADER_LEN) {
    return false;
  }

  out.responseCode = sense[0] & 0x7F;

  if (out.responseCode == SENSE_DESC_CURRENT || out.responseCode == SENSE_DESC_DEFERRED) {
    out.senseKey = sense[1] & 0x0F;
    out.asc = sense[2];
    out.ascq = sense[3];

    const std::size_t ADDITIONAL = sense[7];
    const std::size_t END =
        (SENSE_DESC_HEADER_LEN + ADDITIONAL < len) ? SENSE_DESC_HEADER_LEN + ADDITIONAL : len;

    std::size_t i = SENSE_DESC_HEADER_LEN;
    while (i + 2 <= END) {
      const std::uint8_t TYPE = sense[i];
      const std::size_t DESC_LEN = sense[i + 1];

      if (TYPE == ATA_RETURN_DESCRIPTOR) {
        // A truncated or undersized ATA descriptor cannot be trusted
        if (DESC_LEN < ATA_RETURN_DESCRIPTOR_LEN || i + 2 + DESC_LEN > END) {
          return false;
        }
        out.regs.error = sense[i + 3];
        out.regs.count = sense[i + 5];
        out.regs.lbaLow = sense[i + 7];
        out.regs.lbaMid = sense[i + 9];
        out.regs.lbaHigh = sense[i + 11];
        out.regs.device = sense[i + 12];
        out.regs.status = sense[i + 13];
        out.hasAtaRegisters = true;
        break;
      }

      i += 2 + DESC_LEN;
    }
    return true;
  }

  if (out.responseCode == SENSE_FIXED_CURRENT || out.responseCode == SENSE_FIXED_DEFERRED) {
    if (len < SENSE_FIXED_MIN_LEN) {
      return false;
    }
    out.senseKey = sense[2] & 0x0F;
    out.asc = sense[12];
    out.ascq = sense[13];

    // SAT places ERROR/STATUS/DEVICE/COUNT in the INFORMATION field
    if (out.asc == 0x00 && out.ascq == ASCQ_ATA_PASSTHROUGH_INFO) {
      out.regs.error = sense[3];
      out.regs.status = sense[4];
      out.regs.device = sense[5];
      out.regs.count = sense[6];
      out.hasAtaRegisters = true;
    }
    return true;
  }

  return false;
}

PowerModeResult interpretPowerModeResponse(const SgTransport& transport,
                                           const std::uint8_t* sense) {
  PowerModeResult result{};

  SenseInfo info{};
  bool haveSense = false;
  result.error = checkTransport(transport, sense, info, haveSense);
  if (result.error.isError()) {
    return result;
  }

  if (!haveSense || !info.hasAtaRegisters) {
    result.error = makeError(PassthroughStage::RESPONSE, "no ATA registers in response");
    return result;
  }

  if ((info.regs.status & ATA_STATUS_BSY) != 0) {
    result.error = makeError(PassthroughStage::RESPONSE,
                             fmt::format("registers invalid, BSY set (ata_status=0x{:02x})",
                                         info.regs.status));
    return result;
  }

  if (ataReportsError(info.regs)) {
    result.error = makeError(PassthroughStage::STATUS, ataErrorDetail(info.regs));
    return result;
  }

  result.rawCode = info.regs.count;
  result.mode = classifyPowerMode(info.regs.count);
  return result;
}

PassthroughResult interpretStandbyResponse(const SgTransport& transport,
                                           const std::uint8_t* sense) {
  PassthroughResult result{};

  SenseInfo info{};
  bool haveSense = false;
  result.error = checkTransport(transport, sense, info, haveSense);
  if (result.error.isError()) {
    return result;
  }

  if (haveSense && info.hasAtaRegisters && ataReportsError(info.regs)) {
    result.error = makeError(PassthroughStage::STATUS, ataErrorDetail(info.regs));
  }

  return result;
}

} // namespace ata

} // namespace spindown
