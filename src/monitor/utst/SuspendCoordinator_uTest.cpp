/**
 * @file SuspendCoordinator_uTest.cpp
 * @brief Unit tests for spindown::monitor::SuspendCoordinator.
 *
 * Notes:
 *  - Monitors are put to sleep by seeding them from a FakeDrive in STANDBY.
 *  - Readiness scripts are real /bin/sh scripts in the temporary tree.
 */

#include "src/monitor/inc/SuspendCoordinator.hpp"
#include "src/monitor/utst/MonitorFakes.hpp"

#include <gtest/gtest.h>

#include <sys/stat.h>

#include <cerrno>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

using spindown::ata::PowerMode;
using spindown::monitor::allAsleep;
using spindown::monitor::DeviceMonitor;
using spindown::monitor::DevicePowerState;
using spindown::monitor::MonitorSettings;
using spindown::monitor::SuspendCoordinator;
using spindown::monitor::SuspendDecision;
using spindown::monitor::SuspendSettings;
using spindown::monitor::test::FakeDrive;
using spindown::monitor::test::FakeHostSuspend;
using spindown::monitor::test::FakePowerChannel;
using spindown::monitor::test::secToNs;
using spindown::monitor::test::StatTree;
using spindown::monitor::test::SuspendLog;

namespace {

constexpr std::uint64_t at(std::uint64_t sec) { return secToNs(1000 + sec); }

} // namespace

class SuspendCoordinatorTest : public ::testing::Test {
protected:
  StatTree tree_;
  std::vector<std::shared_ptr<FakeDrive>> drives_;
  std::vector<DeviceMonitor> monitors_;
  std::shared_ptr<SuspendLog> suspends_ = std::make_shared<SuspendLog>();

  void SetUp() override {
    ASSERT_TRUE(tree_.ok());
    for (const char* dev : {"sdb", "sdc"}) {
      tree_.set(dev, 10, 10);
      auto drive = std::make_shared<FakeDrive>();
      drive->mode = PowerMode::STANDBY;
      drives_.push_back(drive);

      MonitorSettings settings{};
      settings.idleTimeoutNs = secToNs(300);
      settings.checkIntervalNs = secToNs(60);
      settings.sysBlockRoot = tree_.root();
      monitors_.emplace_back(dev, settings, std::make_unique<FakePowerChannel>(dev, drive));
    }
    tickAll(at(0));
  }

  void tickAll(std::uint64_t nowNs) {
    for (DeviceMonitor& mon : monitors_) {
      mon.tick(nowNs);
    }
  }

  SuspendCoordinator make(bool enabled, std::uint64_t timeoutSec, std::string script = "") {
    SuspendSettings settings{};
    settings.enabled = enabled;
    settings.timeoutNs = secToNs(timeoutSec);
    settings.checkScript = std::move(script);
    return SuspendCoordinator(settings, std::make_unique<FakeHostSuspend>(suspends_));
  }

  std::string writeScript(const std::string& name, int exitCode) {
    const std::string PATH = std::string(tree_.root()) + "/" + name;
    {
      std::ofstream out(PATH, std::ios::trunc);
      out << "#!/bin/sh\nexit " << exitCode << "\n";
    }
    ::chmod(PATH.c_str(), 0755);
    return PATH;
  }

  /// Wake one drive and let its monitor notice.
  void wake(std::size_t idx, std::uint64_t nowNs) {
    drives_[idx]->mode = PowerMode::ACTIVE;
    monitors_[idx].markStale();
    monitors_[idx].tick(nowNs);
  }
};

/* ----------------------------- Gating Tests ----------------------------- */

/** @test Monitors seeded from sleeping drives are all asleep. */
TEST_F(SuspendCoordinatorTest, AllAsleepHelper) {
  EXPECT_TRUE(allAsleep(monitors_));
  EXPECT_FALSE(allAsleep(std::vector<DeviceMonitor>{}));

  wake(0, at(60));
  EXPECT_FALSE(allAsleep(monitors_));
}

/** @test Disabled coordinator never suspends. */
TEST_F(SuspendCoordinatorTest, Disabled) {
  SuspendCoordinator coord = make(false, 0);

  for (std::uint64_t s = 0; s < 600; s += 60) {
    EXPECT_EQ(coord.evaluate(monitors_, at(s)), SuspendDecision::DISABLED);
  }
  EXPECT_EQ(suspends_->calls, 0);
  EXPECT_FALSE(coord.allAsleepSinceNs().has_value());
}

/** @test Suspend waits for the settle time, then fires exactly once. */
TEST_F(SuspendCoordinatorTest, SettleThenSuspendOnce) {
  SuspendCoordinator coord = make(true, 30);

  EXPECT_EQ(coord.evaluate(monitors_, at(0)), SuspendDecision::SETTLING);
  ASSERT_TRUE(coord.allAsleepSinceNs().has_value());
  EXPECT_EQ(*coord.allAsleepSinceNs(), at(0));
  EXPECT_EQ(coord.evaluate(monitors_, at(29)), SuspendDecision::SETTLING);
  EXPECT_EQ(suspends_->calls, 0);

  EXPECT_EQ(coord.evaluate(monitors_, at(30)), SuspendDecision::SUSPENDED);
  EXPECT_EQ(suspends_->calls, 1);
  EXPECT_FALSE(coord.isArmed());

  for (std::uint64_t s = 60; s < 600; s += 60) {
    EXPECT_EQ(coord.evaluate(monitors_, at(s)), SuspendDecision::ALREADY_SUSPENDED);
  }
  EXPECT_EQ(suspends_->calls, 1);
  EXPECT_EQ(coord.suspendCount(), 1U);
}

/** @test Any device awake resets the window. */
TEST_F(SuspendCoordinatorTest, AwakeDeviceResetsWindow) {
  SuspendCoordinator coord = make(true, 120);
  EXPECT_EQ(coord.evaluate(monitors_, at(0)), SuspendDecision::SETTLING);

  wake(1, at(60));
  EXPECT_EQ(coord.evaluate(monitors_, at(60)), SuspendDecision::NOT_ALL_ASLEEP);
  EXPECT_FALSE(coord.allAsleepSinceNs().has_value());

  EXPECT_EQ(coord.evaluate(monitors_, at(180)), SuspendDecision::NOT_ALL_ASLEEP);
  EXPECT_EQ(suspends_->calls, 0);
}

/** @test After a device wakes and sleeps again, suspend re-arms. */
TEST_F(SuspendCoordinatorTest, RearmsAfterWake) {
  SuspendCoordinator coord = make(true, 0);
  EXPECT_EQ(coord.evaluate(monitors_, at(0)), SuspendDecision::SUSPENDED);

  wake(0, at(60));
  EXPECT_EQ(coord.evaluate(monitors_, at(60)), SuspendDecision::NOT_ALL_ASLEEP);
  EXPECT_TRUE(coord.isArmed());

  drives_[0]->mode = PowerMode::STANDBY;
  monitors_[0].markStale();
  monitors_[0].tick(at(120));
  ASSERT_EQ(monitors_[0].state(), DevicePowerState::STANDBY);

  EXPECT_EQ(coord.evaluate(monitors_, at(120)), SuspendDecision::SUSPENDED);
  EXPECT_EQ(suspends_->calls, 2);
}

/** @test A failed suspend request still counts as requested (no re-arm). */
TEST_F(SuspendCoordinatorTest, FailedSuspendNotRetried) {
  suspends_->sysErrno = EIO;
  SuspendCoordinator coord = make(true, 0);

  EXPECT_EQ(coord.evaluate(monitors_, at(0)), SuspendDecision::SUSPENDED);
  EXPECT_EQ(coord.evaluate(monitors_, at(60)), SuspendDecision::ALREADY_SUSPENDED);
  EXPECT_EQ(suspends_->calls, 1);
}

/** @test No managed devices: never suspend. */
TEST_F(SuspendCoordinatorTest, NoDevices) {
  SuspendCoordinator coord = make(true, 0);
  const std::vector<DeviceMonitor> NONE;

  EXPECT_EQ(coord.evaluate(NONE, at(0)), SuspendDecision::NOT_ALL_ASLEEP);
  EXPECT_EQ(suspends_->calls, 0);
}

/* ----------------------------- Readiness Script Tests ----------------------------- */

/** @test Script exiting 0 allows suspend. */
TEST_F(SuspendCoordinatorTest, ScriptReady) {
  SuspendCoordinator coord = make(true, 30, writeScript("ready.sh", 0));

  EXPECT_EQ(coord.evaluate(monitors_, at(0)), SuspendDecision::SETTLING);
  EXPECT_EQ(coord.evaluate(monitors_, at(60)), SuspendDecision::SUSPENDED);
  EXPECT_EQ(suspends_->calls, 1);
}

/** @test Script exiting 1 blocks every tick without resetting the window. */
TEST_F(SuspendCoordinatorTest, ScriptBlocksIndefinitely) {
  SuspendCoordinator coord = make(true, 30, writeScript("busy.sh", 1));
  coord.evaluate(monitors_, at(0));

  for (std::uint64_t s = 60; s <= 1200; s += 60) {
    EXPECT_EQ(coord.evaluate(monitors_, at(s)), SuspendDecision::NOT_READY);
    ASSERT_TRUE(coord.allAsleepSinceNs().has_value());
    EXPECT_EQ(*coord.allAsleepSinceNs(), at(0));
  }
  EXPECT_EQ(suspends_->calls, 0);
  EXPECT_TRUE(coord.isArmed());
}

/** @test Script that cannot be executed blocks like a non-zero exit. */
TEST_F(SuspendCoordinatorTest, MissingScriptBlocks) {
  SuspendCoordinator coord = make(true, 0, std::string(tree_.root()) + "/missing.sh");

  EXPECT_EQ(coord.evaluate(monitors_, at(0)), SuspendDecision::NOT_READY);
  EXPECT_EQ(coord.evaluate(monitors_, at(60)), SuspendDecision::NOT_READY);
  EXPECT_EQ(suspends_->calls, 0);
}

/** @test Script verdict is re-evaluated each tick; suspend follows once it turns ready. */
TEST_F(SuspendCoordinatorTest, ScriptTurnsReady) {
  const std::string SCRIPT = writeScript("flip.sh", 1);
  SuspendCoordinator coord = make(true, 0, SCRIPT);

  EXPECT_EQ(coord.evaluate(monitors_, at(0)), SuspendDecision::NOT_READY);

  writeScript("flip.sh", 0);
  EXPECT_EQ(coord.evaluate(monitors_, at(60)), SuspendDecision::SUSPENDED);
}

/** @test Decision names. */
TEST(SuspendDecisionTest, ToString) {
  EXPECT_STREQ(toString(SuspendDecision::DISABLED), "DISABLED");
  EXPECT_STREQ(toString(SuspendDecision::NOT_ALL_ASLEEP), "NOT_ALL_ASLEEP");
  EXPECT_STREQ(toString(SuspendDecision::SETTLING), "SETTLING");
  EXPECT_STREQ(toString(SuspendDecision::NOT_READY), "NOT_READY");
  EXPECT_STREQ(toString(SuspendDecision::SUSPENDED), "SUSPENDED");
  EXPECT_STREQ(toString(SuspendDecision::ALREADY_SUSPENDED), "ALREADY_SUSPENDED");
}
