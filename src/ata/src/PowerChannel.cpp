/**
 * @file PowerChannel.cpp
 * @brief SG_IO implementation of drive power control.
 */

#include "src/ata/inc/PowerChannel.hpp"

#include "src/helpers/inc/Log.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <fcntl.h>
#include <scsi/sg.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>
#include <utility>

#include <fmt/core.h>

namespace spindown {

namespace ata {

using spindown::helpers::strings::copyToFixedArray;

namespace log = spindown::helpers::log;

namespace {

/// Format CDB bytes for debug output.
std::string hexBytes(const std::uint8_t* data, std::size_t len) {
  std::string out;
  out.reserve(len * 3);
  for (std::size_t i = 0; i < len; ++i) {
    out += fmt::format("{}{:02x}", (i == 0) ? "" : " ", data[i]);
  }
  return out;
}

} // namespace

/* ----------------------------- SgPowerChannel ----------------------------- */

SgPowerChannel::SgPowerChannel(std::string_view device, std::string_view devRoot) noexcept {
  copyToFixedArray(device_, device);
  std::snprintf(path_.data(), path_.size(), "%.*s/%s", static_cast<int>(devRoot.size()),
                devRoot.data(), device_.data());
}

PassthroughError SgPowerChannel::execute(std::uint8_t ataCommand, bool checkCondition,
                                         SgTransport& transport,
                                         std::array<std::uint8_t, SENSE_BUF_LEN>& sense) {
  transport = SgTransport{};
  sense.fill(0);

  // O_NONBLOCK: do not wait for removable media, the drive is not touched by open
  const int FD = ::open(path_.data(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
  if (FD < 0) {
    const int ERR = errno;
    return PassthroughError{PassthroughStage::IOCTL,
                            fmt::format("open {}: {}", path_.data(), std::strerror(ERR))};
  }

  std::array<std::uint8_t, SAT_CDB_LEN> cdb = buildPassthroughCdb(ataCommand, checkCondition);

  sg_io_hdr_t hdr{};
  hdr.interface_id = 'S';
  hdr.dxfer_direction = SG_DXFER_NONE;
  hdr.cmd_len = static_cast<unsigned char>(cdb.size());
  hdr.cmdp = cdb.data();
  hdr.mx_sb_len = static_cast<unsigned char>(sense.size());
  hdr.sbp = sense.data();
  hdr.dxferp = nullptr;
  hdr.dxfer_len = 0;
  hdr.timeout = PASSTHROUGH_TIMEOUT_MS;

  log::debug("{}: SG_IO cdb [{}]", device_.data(), hexBytes(cdb.data(), cdb.size()));

  int rc = -1;
  do {
    rc = ::ioctl(FD, SG_IO, &hdr);
  } while (rc < 0 && errno == EINTR);
  const int IOCTL_ERR = (rc < 0) ? errno : 0;

  ::close(FD);

  if (rc < 0) {
    return PassthroughError{PassthroughStage::IOCTL,
                            fmt::format("SG_IO {}: {}", path_.data(), std::strerror(IOCTL_ERR))};
  }

  transport.scsiStatus = hdr.status;
  transport.hostStatus = hdr.host_status;
  transport.driverStatus = hdr.driver_status;
  transport.senseLen = hdr.sb_len_wr;

  log::debug("{}: SG_IO status=0x{:02x} host=0x{:02x} driver=0x{:02x} duration={}ms sense=[{}]",
             device_.data(), hdr.status, hdr.host_status, hdr.driver_status, hdr.duration,
             hexBytes(sense.data(), (hdr.sb_len_wr < sense.size()) ? hdr.sb_len_wr : sense.size()));

  return {};
}

PowerModeResult SgPowerChannel::queryPowerMode() {
  SgTransport transport{};
  std::array<std::uint8_t, SENSE_BUF_LEN> sense{};

  PassthroughError err = execute(ATA_CHECK_POWER_MODE, true, transport, sense);
  if (err.isError()) {
    PowerModeResult result{};
    result.error = std::move(err);
    return result;
  }

  return interpretPowerModeResponse(transport, sense.data());
}

PassthroughResult SgPowerChannel::requestStandby() {
  SgTransport transport{};
  std::array<std::uint8_t, SENSE_BUF_LEN> sense{};

  PassthroughError err = execute(ATA_STANDBY_IMMEDIATE, false, transport, sense);
  if (err.isError()) {
    return PassthroughResult{std::move(err)};
  }

  return interpretStandbyResponse(transport, sense.data());
}

} // namespace ata

} // namespace spindown
