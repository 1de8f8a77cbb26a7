#ifndef SPINDOWN_MONITOR_UTST_MONITOR_FAKES_HPP
#define SPINDOWN_MONITOR_UTST_MONITOR_FAKES_HPP
/**
 * @file MonitorFakes.hpp
 * @brief Test doubles shared by the monitor unit tests.
 *
 * FakeDrive state is shared with the test through a shared_ptr so it can be
 * inspected and changed after the channel has been moved into a monitor.
 */

#include "src/ata/inc/PowerChannel.hpp"
#include "src/helpers/inc/Cpu.hpp"
#include "src/power/inc/HostSuspend.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <utility>

#include <fmt/core.h>

namespace spindown {

namespace monitor {

namespace test {

using spindown::helpers::cpu::secToNs;

/* ----------------------------- FakeDrive ----------------------------- */

/**
 * @brief Scripted drive behind a FakePowerChannel.
 */
struct FakeDrive {
  ata::PowerMode mode{ata::PowerMode::ACTIVE};
  bool queryFails{false};
  bool standbyFails{false};
  int queries{0};
  int standbys{0};
};

class FakePowerChannel final : public ata::PowerChannel {
public:
  FakePowerChannel(std::string device, std::shared_ptr<FakeDrive> drive)
      : device_(std::move(device)), drive_(std::move(drive)) {}

  ata::PowerModeResult queryPowerMode() override {
    ++drive_->queries;
    ata::PowerModeResult result{};
    if (drive_->queryFails) {
      result.error = ata::PassthroughError{ata::PassthroughStage::STATUS, "fake query failure"};
      return result;
    }
    result.mode = drive_->mode;
    return result;
  }

  ata::PassthroughResult requestStandby() override {
    ++drive_->standbys;
    if (drive_->standbyFails) {
      return ata::PassthroughResult{
          ata::PassthroughError{ata::PassthroughStage::IOCTL, "fake standby failure"}};
    }
    drive_->mode = ata::PowerMode::STANDBY;
    return {};
  }

  const char* device() const noexcept override { return device_.c_str(); }

private:
  std::string device_;
  std::shared_ptr<FakeDrive> drive_;
};

/* ----------------------------- FakeHostSuspend ----------------------------- */

struct SuspendLog {
  int calls{0};
  int sysErrno{0}; ///< Returned by every call
};

class FakeHostSuspend final : public power::HostSuspend {
public:
  explicit FakeHostSuspend(std::shared_ptr<SuspendLog> log) : log_(std::move(log)) {}

  power::SuspendResult suspend() noexcept override {
    ++log_->calls;
    return power::SuspendResult{log_->sysErrno};
  }

private:
  std::shared_ptr<SuspendLog> log_;
};

/* ----------------------------- StatTree ----------------------------- */

/**
 * @brief Temporary directory laid out like /sys/block.
 */
class StatTree {
public:
  StatTree() {
    char tmpl[] = "/tmp/spindown_monitor_XXXXXX";
    if (::mkdtemp(tmpl) != nullptr) {
      root_ = tmpl;
    }
  }

  ~StatTree() {
    std::error_code ec;
    if (!root_.empty()) {
      std::filesystem::remove_all(root_, ec);
    }
  }

  StatTree(const StatTree&) = delete;
  StatTree& operator=(const StatTree&) = delete;

  [[nodiscard]] bool ok() const noexcept { return !root_.empty(); }
  [[nodiscard]] const char* root() const noexcept { return root_.c_str(); }

  /// Write a 17-field stat line with the given read/write op counts.
  void set(const std::string& dev, std::uint64_t readOps, std::uint64_t writeOps) {
    std::filesystem::create_directories(root_ + "/" + dev);
    std::ofstream out(root_ + "/" + dev + "/stat", std::ios::trunc);
    out << fmt::format("{:>8} 0 0 0 {:>8} 0 0 0 0 0 0 0 0 0 0 0 0\n", readOps, writeOps);
  }

  /// Make the device's statistics unreadable (entry vanishes).
  void remove(const std::string& dev) {
    std::error_code ec;
    std::filesystem::remove_all(root_ + "/" + dev, ec);
  }

private:
  std::string root_;
};

} // namespace test

} // namespace monitor

} // namespace spindown

#endif // SPINDOWN_MONITOR_UTST_MONITOR_FAKES_HPP
