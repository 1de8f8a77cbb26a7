/**
 * @file ReadinessCheck_uTest.cpp
 * @brief Unit tests for spindown::power::ReadinessCheck.
 *
 * Notes:
 *  - Scripts are written to a temporary directory and run through /bin/sh.
 */

#include "src/power/inc/ReadinessCheck.hpp"

#include <gtest/gtest.h>

#include <sys/stat.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using spindown::power::runReadinessCheck;
using spindown::power::ScriptResult;
using spindown::power::ScriptStatus;

class ReadinessCheckTest : public ::testing::Test {
protected:
  std::string dir_;

  void SetUp() override {
    char tmpl[] = "/tmp/spindown_script_XXXXXX";
    ASSERT_NE(::mkdtemp(tmpl), nullptr);
    dir_ = tmpl;
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  /// Write an executable /bin/sh script and return its path.
  std::string writeScript(const std::string& name, const std::string& body, mode_t mode = 0755) {
    const std::string PATH = dir_ + "/" + name;
    {
      std::ofstream out(PATH, std::ios::trunc);
      out << "#!/bin/sh\n" << body << "\n";
    }
    ::chmod(PATH.c_str(), mode);
    return PATH;
  }
};

/** @test Exit 0 is READY. */
TEST_F(ReadinessCheckTest, ExitZeroIsReady) {
  const ScriptResult R = runReadinessCheck(writeScript("ok.sh", "exit 0").c_str());

  EXPECT_EQ(R.status, ScriptStatus::READY);
  EXPECT_TRUE(R.ready());
  EXPECT_EQ(R.exitCode, 0);
  EXPECT_FALSE(R.isExecutionError());
}

/** @test Non-zero exit is NOT_READY with the code preserved. */
TEST_F(ReadinessCheckTest, ExitOneIsNotReady) {
  const ScriptResult R = runReadinessCheck(writeScript("busy.sh", "exit 1").c_str());

  EXPECT_EQ(R.status, ScriptStatus::NOT_READY);
  EXPECT_FALSE(R.ready());
  EXPECT_EQ(R.exitCode, 1);
  EXPECT_FALSE(R.isExecutionError());
  EXPECT_EQ(R.toString(), "NOT_READY (exit 1)");
}

/** @test A script's own exit 127 is a verdict, not an exec failure. */
TEST_F(ReadinessCheckTest, ScriptExit127IsNotReady) {
  const ScriptResult R = runReadinessCheck(writeScript("e127.sh", "exit 127").c_str());

  EXPECT_EQ(R.status, ScriptStatus::NOT_READY);
  EXPECT_EQ(R.exitCode, 127);
}

/** @test Missing script is EXEC_FAILED with ENOENT. */
TEST_F(ReadinessCheckTest, MissingScript) {
  const ScriptResult R = runReadinessCheck((dir_ + "/nope.sh").c_str());

  EXPECT_EQ(R.status, ScriptStatus::EXEC_FAILED);
  EXPECT_EQ(R.sysErrno, ENOENT);
  EXPECT_TRUE(R.isExecutionError());
}

/** @test Script without any execute bit is EXEC_FAILED with EACCES (even for root). */
TEST_F(ReadinessCheckTest, NotExecutable) {
  const ScriptResult R = runReadinessCheck(writeScript("plain.sh", "exit 0", 0644).c_str());

  EXPECT_EQ(R.status, ScriptStatus::EXEC_FAILED);
  EXPECT_EQ(R.sysErrno, EACCES);
}

/** @test Empty or null path is EXEC_FAILED without forking. */
TEST_F(ReadinessCheckTest, EmptyPath) {
  EXPECT_EQ(runReadinessCheck("").status, ScriptStatus::EXEC_FAILED);
  EXPECT_EQ(runReadinessCheck(nullptr).status, ScriptStatus::EXEC_FAILED);
}

/** @test Script killed by a signal is SIGNALED. */
TEST_F(ReadinessCheckTest, Signaled) {
  const ScriptResult R = runReadinessCheck(writeScript("kill.sh", "kill -9 $$").c_str());

  EXPECT_EQ(R.status, ScriptStatus::SIGNALED);
  EXPECT_EQ(R.signal, SIGKILL);
  EXPECT_TRUE(R.isExecutionError());
}

/** @test stdin is /dev/null, so a reading script sees EOF instead of blocking. */
TEST_F(ReadinessCheckTest, StdinIsDevNull) {
  const ScriptResult R =
      runReadinessCheck(writeScript("read.sh", "if read line; then exit 3; fi\nexit 0").c_str());

  EXPECT_EQ(R.status, ScriptStatus::READY);
}

/** @test Status names. */
TEST(ScriptStatusTest, ToString) {
  EXPECT_STREQ(toString(ScriptStatus::READY), "READY");
  EXPECT_STREQ(toString(ScriptStatus::NOT_READY), "NOT_READY");
  EXPECT_STREQ(toString(ScriptStatus::SPAWN_FAILED), "SPAWN_FAILED");
  EXPECT_STREQ(toString(ScriptStatus::EXEC_FAILED), "EXEC_FAILED");
  EXPECT_STREQ(toString(ScriptStatus::SIGNALED), "SIGNALED");
}
