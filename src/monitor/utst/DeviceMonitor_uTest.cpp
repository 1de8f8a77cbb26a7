/**
 * @file DeviceMonitor_uTest.cpp
 * @brief Unit tests for spindown::monitor::DeviceMonitor.
 *
 * Notes:
 *  - Counters come from a temporary stat tree; the drive is a FakePowerChannel.
 *  - Time is synthetic: tick(at(s)) is s seconds after an arbitrary origin.
 */

#include "src/monitor/inc/DeviceMonitor.hpp"
#include "src/monitor/utst/MonitorFakes.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>

using spindown::ata::PowerMode;
using spindown::monitor::DeviceMonitor;
using spindown::monitor::DevicePowerState;
using spindown::monitor::FAILURE_WARN_THRESHOLD;
using spindown::monitor::MonitorSettings;
using spindown::monitor::TickReport;
using spindown::monitor::test::FakeDrive;
using spindown::monitor::test::FakePowerChannel;
using spindown::monitor::test::secToNs;
using spindown::monitor::test::StatTree;

namespace {

constexpr std::uint64_t CHECK_INTERVAL_SEC = 60;

/// Synthetic monotonic timestamp, offset so that no tick happens at 0.
constexpr std::uint64_t at(std::uint64_t sec) { return secToNs(1000 + sec); }

} // namespace

class DeviceMonitorTest : public ::testing::Test {
protected:
  StatTree tree_;
  std::shared_ptr<FakeDrive> drive_ = std::make_shared<FakeDrive>();

  void SetUp() override {
    ASSERT_TRUE(tree_.ok());
    tree_.set("sdb", 100, 50);
  }

  DeviceMonitor make(std::uint64_t idleSec, std::uint64_t toleranceOps = 0) {
    MonitorSettings settings{};
    settings.idleTimeoutNs = secToNs(idleSec);
    settings.checkIntervalNs = secToNs(CHECK_INTERVAL_SEC);
    settings.toleranceOps = toleranceOps;
    settings.sysBlockRoot = tree_.root();
    return DeviceMonitor("sdb", settings, std::make_unique<FakePowerChannel>("sdb", drive_));
  }

  /// Tick every CHECK_INTERVAL_SEC from @p fromSec through @p toSec inclusive.
  static void tickRange(DeviceMonitor& mon, std::uint64_t fromSec, std::uint64_t toSec) {
    for (std::uint64_t s = fromSec; s <= toSec; s += CHECK_INTERVAL_SEC) {
      mon.tick(at(s));
    }
  }

  /// Drive a monitor into a verified STANDBY (idle 300s, standby at 300, verified at 360).
  DeviceMonitor makeAsleep() {
    DeviceMonitor mon = make(300);
    tickRange(mon, 0, 360);
    return mon;
  }
};

/* ----------------------------- Baseline Tests ----------------------------- */

/** @test First tick is a baseline: activity, seed query, no spin-down. */
TEST_F(DeviceMonitorTest, BaselineTick) {
  DeviceMonitor mon = make(300);

  const TickReport R = mon.tick(at(0));
  EXPECT_TRUE(R.countersOk);
  EXPECT_TRUE(R.activity);
  EXPECT_TRUE(R.queried);
  EXPECT_FALSE(R.standbyIssued);
  EXPECT_EQ(R.state, DevicePowerState::ACTIVE);
  EXPECT_EQ(mon.lastActivityNs(), at(0));
  ASSERT_TRUE(mon.lastCounters().has_value());
  EXPECT_EQ(mon.lastCounters()->readOps, 100U);
  EXPECT_EQ(mon.lastCounters()->writeOps, 50U);
}

/** @test A timeout shorter than the interval still waits for one unchanged reading. */
TEST_F(DeviceMonitorTest, FirstTickNeverSpinsDown) {
  DeviceMonitor mon = make(1);

  EXPECT_FALSE(mon.tick(at(0)).standbyIssued);
  EXPECT_EQ(drive_->standbys, 0);

  EXPECT_TRUE(mon.tick(at(60)).standbyIssued);
  EXPECT_EQ(drive_->standbys, 1);
}

/** @test Drive already asleep at startup is adopted as STANDBY and never re-commanded. */
TEST_F(DeviceMonitorTest, SeedFromSleepingDrive) {
  drive_->mode = PowerMode::STANDBY;
  DeviceMonitor mon = make(60);

  tickRange(mon, 0, 600);
  EXPECT_EQ(mon.state(), DevicePowerState::STANDBY);
  EXPECT_EQ(drive_->standbys, 0);
}

/** @test Failed seed query leaves UNKNOWN and is retried on the next unchanged tick. */
TEST_F(DeviceMonitorTest, SeedQueryFailureLeavesUnknown) {
  drive_->queryFails = true;
  DeviceMonitor mon = make(300);

  const TickReport R = mon.tick(at(0));
  EXPECT_EQ(R.state, DevicePowerState::UNKNOWN);
  EXPECT_TRUE(R.failed);

  drive_->queryFails = false;
  mon.tick(at(60));
  EXPECT_EQ(drive_->queries, 2);
  EXPECT_EQ(mon.state(), DevicePowerState::ACTIVE);
}

/** @test Unclassified power mode does not change the state. */
TEST_F(DeviceMonitorTest, UnknownPowerModeKeepsState) {
  drive_->mode = PowerMode::UNKNOWN;
  DeviceMonitor mon = make(300);

  const TickReport R = mon.tick(at(0));
  EXPECT_FALSE(R.failed);
  EXPECT_EQ(R.state, DevicePowerState::UNKNOWN);
}

/* ----------------------------- Idle / Spin-down Tests ----------------------------- */

/** @test Idle for the full timeout: exactly one standby request across many ticks. */
TEST_F(DeviceMonitorTest, ExactlyOneStandbyRequest) {
  DeviceMonitor mon = make(300);

  tickRange(mon, 0, 240);
  EXPECT_EQ(drive_->standbys, 0);
  EXPECT_EQ(mon.state(), DevicePowerState::ACTIVE);

  const TickReport R = mon.tick(at(300));
  EXPECT_TRUE(R.standbyIssued);
  EXPECT_EQ(R.state, DevicePowerState::STANDBY);
  ASSERT_TRUE(mon.spindownIssuedNs().has_value());
  EXPECT_EQ(*mon.spindownIssuedNs(), at(300));

  tickRange(mon, 360, 1800);
  EXPECT_EQ(drive_->standbys, 1);
  EXPECT_EQ(mon.state(), DevicePowerState::STANDBY);
}

/** @test Repeated unchanged ticks never advance the last activity time. */
TEST_F(DeviceMonitorTest, UnchangedTicksAreIdempotent) {
  DeviceMonitor mon = make(3600);

  for (std::uint64_t s = 0; s <= 1200; s += 60) {
    const TickReport R = mon.tick(at(s));
    EXPECT_EQ(mon.lastActivityNs(), at(0));
    if (s > 0) {
      EXPECT_FALSE(R.activity);
    }
  }
}

/** @test Changed counters advance the last activity time and postpone spin-down. */
TEST_F(DeviceMonitorTest, ActivityResetsIdleClock) {
  DeviceMonitor mon = make(300);
  tickRange(mon, 0, 240);

  tree_.set("sdb", 101, 50);
  const TickReport R = mon.tick(at(300));
  EXPECT_TRUE(R.activity);
  EXPECT_FALSE(R.standbyIssued);
  EXPECT_EQ(mon.lastActivityNs(), at(300));

  tickRange(mon, 360, 540);
  EXPECT_EQ(drive_->standbys, 0);
  EXPECT_TRUE(mon.tick(at(600)).standbyIssued);
}

/** @test Write-only activity counts. */
TEST_F(DeviceMonitorTest, WriteActivityCounts) {
  DeviceMonitor mon = make(300);
  mon.tick(at(0));

  tree_.set("sdb", 100, 51);
  EXPECT_TRUE(mon.tick(at(60)).activity);
}

/** @test Spin-down is verified by a query on the next unchanged tick. */
TEST_F(DeviceMonitorTest, OptimisticStandbyIsVerified) {
  DeviceMonitor mon = make(300);
  tickRange(mon, 0, 300);
  const int QUERIES = drive_->queries;

  const TickReport R = mon.tick(at(360));
  EXPECT_TRUE(R.queried);
  EXPECT_EQ(drive_->queries, QUERIES + 1);
  EXPECT_EQ(R.state, DevicePowerState::STANDBY);

  // Verified: no further queries while nothing happens
  mon.tick(at(420));
  EXPECT_EQ(drive_->queries, QUERIES + 1);
}

/** @test A drive that ignored standby is caught by verification and retried after debounce. */
TEST_F(DeviceMonitorTest, NonCompliantDriveDebounced) {
  DeviceMonitor mon = make(300);
  tickRange(mon, 0, 300);
  ASSERT_EQ(drive_->standbys, 1);

  drive_->mode = PowerMode::ACTIVE;
  EXPECT_EQ(mon.tick(at(310)).state, DevicePowerState::ACTIVE);

  // Within one check interval of the last command: no re-issue
  EXPECT_FALSE(mon.tick(at(320)).standbyIssued);
  EXPECT_EQ(drive_->standbys, 1);

  EXPECT_TRUE(mon.tick(at(360)).standbyIssued);
  EXPECT_EQ(drive_->standbys, 2);
}

/** @test Standby failure sets ERROR, keeps the last issue time, and retries next tick. */
TEST_F(DeviceMonitorTest, StandbyFailureRetried) {
  drive_->standbyFails = true;
  DeviceMonitor mon = make(300);
  tickRange(mon, 0, 240);

  const TickReport R = mon.tick(at(300));
  EXPECT_TRUE(R.standbyIssued);
  EXPECT_TRUE(R.failed);
  EXPECT_EQ(R.state, DevicePowerState::ERROR);
  EXPECT_FALSE(mon.spindownIssuedNs().has_value());

  EXPECT_TRUE(mon.tick(at(360)).standbyIssued);
  EXPECT_EQ(drive_->standbys, 2);

  drive_->standbyFails = false;
  const TickReport OK = mon.tick(at(420));
  EXPECT_TRUE(OK.standbyIssued);
  EXPECT_EQ(OK.state, DevicePowerState::STANDBY);
}

/* ----------------------------- Wake Detection Tests ----------------------------- */

/** @test I/O while asleep re-queries the drive before returning to ACTIVE. */
TEST_F(DeviceMonitorTest, ActivityInStandbyRequeries) {
  DeviceMonitor mon = makeAsleep();
  ASSERT_EQ(mon.state(), DevicePowerState::STANDBY);
  const int QUERIES = drive_->queries;

  drive_->mode = PowerMode::IDLE;
  tree_.set("sdb", 200, 50);
  const TickReport R = mon.tick(at(420));

  EXPECT_TRUE(R.activity);
  EXPECT_TRUE(R.queried);
  EXPECT_EQ(drive_->queries, QUERIES + 1);
  EXPECT_EQ(R.state, DevicePowerState::ACTIVE);
}

/** @test I/O while asleep but drive still reports standby: stays STANDBY. */
TEST_F(DeviceMonitorTest, ActivityInStandbyDriveStillAsleep) {
  DeviceMonitor mon = makeAsleep();

  tree_.set("sdb", 200, 50);
  const TickReport R = mon.tick(at(420));

  EXPECT_TRUE(R.queried);
  EXPECT_EQ(R.state, DevicePowerState::STANDBY);
}

/** @test I/O while asleep and the query fails: ERROR, never assumed ACTIVE. */
TEST_F(DeviceMonitorTest, ActivityInStandbyQueryFails) {
  DeviceMonitor mon = makeAsleep();

  drive_->mode = PowerMode::ACTIVE;
  drive_->queryFails = true;
  tree_.set("sdb", 200, 50);
  const TickReport R = mon.tick(at(420));

  EXPECT_TRUE(R.failed);
  EXPECT_EQ(R.state, DevicePowerState::ERROR);
}

/** @test Activity out of ERROR marks the drive ACTIVE without a query. */
TEST_F(DeviceMonitorTest, ActivityFromErrorIsActive) {
  DeviceMonitor mon = make(300);
  mon.tick(at(0));
  tree_.remove("sdb");
  mon.tick(at(60));
  ASSERT_EQ(mon.state(), DevicePowerState::ERROR);
  const int QUERIES = drive_->queries;

  tree_.set("sdb", 500, 50);
  const TickReport R = mon.tick(at(120));
  EXPECT_TRUE(R.activity);
  EXPECT_FALSE(R.queried);
  EXPECT_EQ(drive_->queries, QUERIES);
  EXPECT_EQ(R.state, DevicePowerState::ACTIVE);
}

/* ----------------------------- Tolerance Tests ----------------------------- */

/** @test Deltas within tolerance are idle but update the snapshot. */
TEST_F(DeviceMonitorTest, ToleranceAbsorbsSmallDeltas) {
  DeviceMonitor mon = make(300, 2);
  mon.tick(at(0));

  tree_.set("sdb", 102, 52);
  const TickReport R = mon.tick(at(60));
  EXPECT_FALSE(R.activity);
  EXPECT_EQ(mon.lastActivityNs(), at(0));
  EXPECT_EQ(mon.lastCounters()->readOps, 102U);

  // Measured from the updated snapshot, not the baseline
  tree_.set("sdb", 104, 52);
  EXPECT_FALSE(mon.tick(at(120)).activity);

  tree_.set("sdb", 107, 52);
  EXPECT_TRUE(mon.tick(at(180)).activity);
  EXPECT_EQ(mon.lastActivityNs(), at(180));
}

/** @test A counter going backwards is activity, whatever the tolerance. */
TEST_F(DeviceMonitorTest, CounterDecreaseIsActivity) {
  DeviceMonitor mon = make(300, 1000);
  mon.tick(at(0));

  tree_.set("sdb", 99, 50);
  EXPECT_TRUE(mon.tick(at(60)).activity);
}

/* ----------------------------- Failure Tests ----------------------------- */

/** @test Unreadable statistics: ERROR, snapshot and activity time untouched. */
TEST_F(DeviceMonitorTest, StatsFailureContained) {
  DeviceMonitor mon = make(300);
  mon.tick(at(0));

  tree_.remove("sdb");
  const TickReport R = mon.tick(at(60));
  EXPECT_FALSE(R.countersOk);
  EXPECT_TRUE(R.failed);
  EXPECT_FALSE(R.queried);
  EXPECT_FALSE(R.standbyIssued);
  EXPECT_EQ(R.state, DevicePowerState::ERROR);
  EXPECT_EQ(mon.lastCounters()->readOps, 100U);
  EXPECT_EQ(mon.lastActivityNs(), at(0));
}

/** @test Recovery from a stats failure with unchanged counters re-queries the drive. */
TEST_F(DeviceMonitorTest, StatsRecoveryReconciles) {
  DeviceMonitor mon = make(3600);
  mon.tick(at(0));
  tree_.remove("sdb");
  mon.tick(at(60));

  tree_.set("sdb", 100, 50);
  const TickReport R = mon.tick(at(120));
  EXPECT_FALSE(R.activity);
  EXPECT_TRUE(R.queried);
  EXPECT_EQ(R.state, DevicePowerState::ACTIVE);
}

/** @test Consecutive failures are counted and reset on the first good tick. */
TEST_F(DeviceMonitorTest, FailureStreak) {
  DeviceMonitor mon = make(300);
  mon.tick(at(0));

  tree_.remove("sdb");
  for (std::uint32_t i = 1; i <= FAILURE_WARN_THRESHOLD + 1; ++i) {
    mon.tick(at(60 * i));
    EXPECT_EQ(mon.consecutiveFailures(), i);
  }

  tree_.set("sdb", 100, 50);
  mon.tick(at(600));
  EXPECT_EQ(mon.consecutiveFailures(), 0U);
}

/* ----------------------------- Stale Tests ----------------------------- */

/** @test A stale monitor adopts the drive's reported state on the next unchanged tick. */
TEST_F(DeviceMonitorTest, StaleReconcilesAfterResume) {
  DeviceMonitor mon = makeAsleep();
  ASSERT_EQ(mon.state(), DevicePowerState::STANDBY);

  mon.markStale();
  EXPECT_TRUE(mon.isStale());
  drive_->mode = PowerMode::ACTIVE;

  const TickReport R = mon.tick(at(420));
  EXPECT_TRUE(R.queried);
  EXPECT_EQ(R.state, DevicePowerState::ACTIVE);
  EXPECT_FALSE(mon.isStale());
}

/** @test A stale monitor whose drive is still asleep stays STANDBY. */
TEST_F(DeviceMonitorTest, StaleStillAsleep) {
  DeviceMonitor mon = makeAsleep();
  mon.markStale();

  const TickReport R = mon.tick(at(420));
  EXPECT_TRUE(R.queried);
  EXPECT_EQ(R.state, DevicePowerState::STANDBY);
  EXPECT_FALSE(mon.isStale());
}

/** @test State names. */
TEST(DevicePowerStateTest, ToString) {
  EXPECT_STREQ(toString(DevicePowerState::UNKNOWN), "UNKNOWN");
  EXPECT_STREQ(toString(DevicePowerState::ACTIVE), "ACTIVE");
  EXPECT_STREQ(toString(DevicePowerState::STANDBY), "STANDBY");
  EXPECT_STREQ(toString(DevicePowerState::ERROR), "ERROR");
}
