/***
 * Name: test_command_executor
 * Purpose: Bounded waits, the grace period and exit code passthrough.
 */
#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include "agentrun/exceptions/command_timeout.h"
#include "agentrun/runner/command_executor.h"
#include "util/FakeRuntime.h"

using namespace agentrun;
using testutil::FakeRuntime;

static container::ContainerHandle handle() { return container::ContainerHandle{"c0ffee", "sandbox", container::ContainerState::Running}; }

TEST(CommandExecutor, ReturnsExitCodeAndOutput) {
  auto rt = std::make_shared<FakeRuntime>();
  rt->addRule({"false", 1, "nope\n", {}});
  const runner::CommandExecutor exec(rt, "/code");
  const auto ok = exec.run(handle(), "echo hi", std::chrono::seconds(5));
  EXPECT_EQ(ok.exit_code, 0);
  const auto bad = exec.run(handle(), "false", std::chrono::seconds(5));
  EXPECT_EQ(bad.exit_code, 1);
  EXPECT_EQ(bad.output, "nope\n");
  EXPECT_EQ(rt->lastWorkdir(), "/code");
  EXPECT_EQ(exec.workdir(), "/code");
}

TEST(CommandExecutor, SlowCommandTimesOutAfterGrace) {
  auto rt = std::make_shared<FakeRuntime>();
  rt->addRule({"sleep", 0, "", std::chrono::milliseconds(2500)});
  const runner::CommandExecutor exec(rt, "/code");
  const auto started = std::chrono::steady_clock::now();
  EXPECT_THROW((void)exec.run(handle(), "sleep 3", std::chrono::milliseconds(100)), exceptions::CommandTimeout);
  const auto elapsed = std::chrono::steady_clock::now() - started;
  EXPECT_GE(elapsed, std::chrono::milliseconds(100) + runner::CommandExecutor::kGracePeriod);
  // Returns well before the 2.5 s command would have finished.
  EXPECT_LT(elapsed, std::chrono::milliseconds(100) + runner::CommandExecutor::kGracePeriod + std::chrono::milliseconds(900));
}

TEST(CommandExecutor, FinishingInsideGraceStillTimesOut) {
  auto rt = std::make_shared<FakeRuntime>();
  rt->addRule({"sleep", 0, "", std::chrono::milliseconds(400)});
  const runner::CommandExecutor exec(rt, "/code");
  EXPECT_THROW((void)exec.run(handle(), "sleep 0.4", std::chrono::milliseconds(100)), exceptions::CommandTimeout);
}
