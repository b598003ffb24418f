#include "common/ProcessRunner.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>

using namespace sbu::common;
using namespace std::chrono_literals;

TEST(ProcessRunnerTest, CapturesStdout) {
  ProcessRunner pr;
  ProcessSpec ps;
  ps.vArgs = {"echo", "hello", "world"};

  const auto pres = pr.run(ps);
  EXPECT_TRUE(pres.succeeded());
  EXPECT_EQ(pres.sStdout, "hello world\n");
  EXPECT_TRUE(pres.sStderr.empty());
}

TEST(ProcessRunnerTest, CapturesStderrAndExitCode) {
  ProcessRunner pr;
  ProcessSpec ps;
  ps.vArgs = {"sh", "-c", "echo boom >&2; exit 3"};

  const auto pres = pr.run(ps);
  EXPECT_FALSE(pres.succeeded());
  EXPECT_EQ(pres.iExitCode, 3);
  EXPECT_EQ(pres.sStderr, "boom\n");
}

TEST(ProcessRunnerTest, RunsInWorkingDirectory) {
  ProcessRunner pr;
  ProcessSpec ps;
  ps.vArgs = {"pwd"};
  ps.sWorkingDir = "/";

  const auto pres = pr.run(ps);
  EXPECT_TRUE(pres.succeeded());
  EXPECT_EQ(pres.sStdout, "/\n");
}

TEST(ProcessRunnerTest, MissingProgramExits127) {
  ProcessRunner pr;
  ProcessSpec ps;
  ps.vArgs = {"sbu-no-such-program-xyz"};

  const auto pres = pr.run(ps);
  EXPECT_EQ(pres.iExitCode, 127);
  EXPECT_FALSE(pres.bTimedOut);
}

TEST(ProcessRunnerTest, TimeoutKillsChild) {
  ProcessRunner pr;
  ProcessSpec ps;
  ps.vArgs = {"sleep", "30"};
  ps.durTimeout = 1s;

  const auto tpStart = std::chrono::steady_clock::now();
  const auto pres = pr.run(ps);
  EXPECT_LT(std::chrono::steady_clock::now() - tpStart, 10s);
  EXPECT_TRUE(pres.bTimedOut);
  EXPECT_FALSE(pres.succeeded());
  EXPECT_EQ(pres.iExitCode, 137);
}

TEST(ProcessRunnerTest, EmptyCommandRejected) {
  ProcessRunner pr;
  EXPECT_THROW(pr.run(ProcessSpec{}), std::invalid_argument);
}

TEST(ProcessRunnerTest, DescribeAndSplitCommand) {
  EXPECT_EQ(describeCommand({"git", "log", "--max-count=1"}), "git log --max-count=1");
  EXPECT_EQ(splitCommand("  bin/svn-buddy   dev:phar-create "),
            (std::vector<std::string>{"bin/svn-buddy", "dev:phar-create"}));
  EXPECT_TRUE(splitCommand("   ").empty());
}
