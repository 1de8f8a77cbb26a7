/**
 * @file HostSuspend.cpp
 * @brief Host suspend via /sys/power/state.
 */

#include "src/power/inc/HostSuspend.hpp"

#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <cstring>

#include <fmt/core.h>

namespace spindown {

namespace power {

using spindown::helpers::files::writeStringToFile;
using spindown::helpers::strings::copyToFixedArray;

/* ----------------------------- SuspendResult ----------------------------- */

std::string SuspendResult::toString() const {
  if (ok()) {
    return "ok";
  }
  return fmt::format("errno {} ({})", sysErrno, std::strerror(sysErrno));
}

/* ----------------------------- SysfsHostSuspend ----------------------------- */

SysfsHostSuspend::SysfsHostSuspend(std::string_view stateWord, std::string_view path)
    : path_(path) {
  copyToFixedArray(state_, stateWord);
}

SuspendResult SysfsHostSuspend::suspend() noexcept {
  return SuspendResult{writeStringToFile(path_.c_str(), state_.data())};
}

/* ----------------------------- API ----------------------------- */

bool isValidSuspendState(std::string_view word) noexcept {
  return word == "mem" || word == "disk" || word == "freeze" || word == "standby";
}

} // namespace power

} // namespace spindown
