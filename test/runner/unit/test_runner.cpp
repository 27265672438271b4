/***
 * Name: test_runner
 * Purpose: End-to-end Runner flow against an in-memory container runtime.
 */
#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "agentrun/exceptions/config_error.h"
#include "agentrun/runner/command_executor.h"
#include "agentrun/runner/runner.h"
#include "observability/Metrics.h"
#include "util/FakeRuntime.h"

using namespace agentrun;
using testutil::FakeRuntime;

namespace {

runner::RunnerConfig baseConfig() {
  runner::RunnerConfig cfg;
  cfg.container_name = "sandbox";
  cfg.staging_dir = ::testing::TempDir();
  return cfg;
}

std::string scriptPathFrom(const FakeRuntime& rt) {
  for (const auto& cmd : rt.commands()) {
    if (cmd.rfind("python /code/", 0) == 0U) return cmd.substr(std::string("python ").size());
  }
  return {};
}

void waitCleanup(const runner::Execution& exec) {
  ASSERT_TRUE(exec.cleanup.valid());
  ASSERT_EQ(exec.cleanup.wait_for(std::chrono::seconds(10)), std::future_status::ready);
}

}  // namespace

TEST(Runner, HelloWorldRunsAndCleansUp) {
  auto rt = std::make_shared<FakeRuntime>();
  rt->addRule({"python /code/script_", 0, "Hello, World!\n", {}});
  const runner::Runner r(baseConfig(), rt);
  const auto exec = r.execute("print('Hello, World!')");
  EXPECT_EQ(exec.result.kind, runner::ErrorKind::None);
  EXPECT_EQ(exec.result.text, "Hello, World!\n");
  waitCleanup(exec);

  const std::string remote = scriptPathFrom(*rt);
  ASSERT_FALSE(remote.empty());
  EXPECT_TRUE(rt->ran("rm -f " + remote));
  EXPECT_FALSE(rt->ran("pip "));
  EXPECT_EQ(rt->lastWorkdir(), "/code");

  ASSERT_EQ(rt->uploads().size(), 1u);
  EXPECT_EQ(rt->uploads()[0].path, "/code");
  EXPECT_NE(rt->uploads()[0].tar_bytes.find("print('Hello, World!')"), std::string::npos);

  ASSERT_EQ(rt->limits().size(), 1u);
  EXPECT_EQ(rt->limits()[0].cpu_quota, 50000);
  EXPECT_EQ(rt->limits()[0].memory, "100m");
  EXPECT_EQ(rt->limits()[0].memswap, "512m");

  const std::string name = remote.substr(std::string("/code/").size());
  EXPECT_FALSE(std::filesystem::exists(std::filesystem::path(::testing::TempDir()) / name));
}

TEST(Runner, ScriptNamesAreUnique) {
  auto rt = std::make_shared<FakeRuntime>();
  const runner::Runner r(baseConfig(), rt);
  const auto first = r.execute("x = 1");
  const auto second = r.execute("x = 2");
  waitCleanup(first);
  waitCleanup(second);
  std::vector<std::string> runs;
  for (const auto& cmd : rt->commands()) {
    if (cmd.rfind("python ", 0) == 0U) runs.push_back(cmd);
  }
  ASSERT_EQ(runs.size(), 2u);
  EXPECT_NE(runs[0], runs[1]);
}

TEST(Runner, UnsafeCodeNeverTouchesContainer) {
  auto rt = std::make_shared<FakeRuntime>();
  const runner::Runner r(baseConfig(), rt);
  const auto exec = r.execute("import os\nos.system('rm -rf /')");
  EXPECT_EQ(exec.result.kind, runner::ErrorKind::InputRejected);
  EXPECT_EQ(exec.result.text, "Unsafe module import: os");
  EXPECT_EQ(exec.cleanup.wait_for(std::chrono::seconds(0)), std::future_status::ready);
  EXPECT_TRUE(rt->commands().empty());
  EXPECT_TRUE(rt->uploads().empty());
}

TEST(Runner, SyntaxErrorIsRejected) {
  auto rt = std::make_shared<FakeRuntime>();
  const runner::Runner r(baseConfig(), rt);
  EXPECT_EQ(r.executeCodeInContainer("print('x'"), "Syntax error: '(' was never closed (<unknown>, line 1)");
}

TEST(Runner, DependencyOutsideWhitelistIsRejected) {
  auto rt = std::make_shared<FakeRuntime>();
  auto cfg = baseConfig();
  cfg.dependencies_whitelist = {"pandas"};
  const runner::Runner r(cfg, rt);
  const auto exec = r.execute("import numpy as np\nprint(np.array([1, 2, 3]))");
  EXPECT_EQ(exec.result.kind, runner::ErrorKind::PolicyRejected);
  EXPECT_EQ(exec.result.text, "Dependency: numpy is not in the whitelist.");
  waitCleanup(exec);
  EXPECT_FALSE(rt->ran("pip install"));
  EXPECT_FALSE(rt->ran("pip uninstall"));
  EXPECT_FALSE(rt->ran("python "));
  EXPECT_TRUE(rt->ran("rm -f /code/script_"));
}

TEST(Runner, StdlibImportsNeedNoWhitelistEntry) {
  auto rt = std::make_shared<FakeRuntime>();
  rt->addRule({"python ", 0, "4.0\n", {}});
  auto cfg = baseConfig();
  cfg.dependencies_whitelist = {"requests"};
  const runner::Runner r(cfg, rt);
  EXPECT_EQ(r.executeCodeInContainer("import math\nprint(math.sqrt(16))"), "4.0\n");
}

TEST(Runner, InstalledDependencyIsRemovedAfterRun) {
  auto rt = std::make_shared<FakeRuntime>();
  rt->addRule({"python ", 0, "200\n", {}});
  const runner::Runner r(baseConfig(), rt);
  const auto exec = r.execute("import requests\nprint(requests.get('https://example.com').status_code)");
  EXPECT_EQ(exec.result.text, "200\n");
  waitCleanup(exec);
  EXPECT_TRUE(rt->ran("pip install --user requests"));
  EXPECT_TRUE(rt->ran("pip uninstall -y requests"));
}

TEST(Runner, FailedInstallStopsBeforeRun) {
  auto rt = std::make_shared<FakeRuntime>();
  rt->addRule({"pip install --user unknownpackage", 1, "ERROR: No matching distribution", {}});
  const runner::Runner r(baseConfig(), rt);
  const auto exec = r.execute("import unknownpackage");
  EXPECT_EQ(exec.result.kind, runner::ErrorKind::ExecutionFailed);
  EXPECT_EQ(exec.result.text, "Failed to install dependency unknownpackage");
  waitCleanup(exec);
  EXPECT_FALSE(rt->ran("python "));
  EXPECT_TRUE(rt->ran("pip uninstall -y unknownpackage"));
}

TEST(Runner, InstallErrorStillRemovesEarlierPackages) {
  auto rt = std::make_shared<FakeRuntime>();
  rt->addRule({"pip install --user requests", 0, "", {}, "exec create failed: container stopped"});
  const runner::Runner r(baseConfig(), rt);
  const auto exec = r.execute("import numpy\nimport requests\nprint(1)");
  EXPECT_EQ(exec.result.kind, runner::ErrorKind::ExecutionFailed);
  EXPECT_EQ(exec.result.text, "exec create failed: container stopped");
  waitCleanup(exec);
  EXPECT_TRUE(rt->ran("pip install --user numpy"));
  EXPECT_FALSE(rt->ran("python "));
  EXPECT_TRUE(rt->ran("pip uninstall -y numpy"));
}

TEST(Runner, CachedDependencyIsKept) {
  auto rt = std::make_shared<FakeRuntime>();
  rt->addRule({"pip list --format=freeze", 0, "requests==2.31.0\nurllib3==2.2.1\n", {}});
  auto cfg = baseConfig();
  cfg.cached_dependencies = {"requests"};
  const runner::Runner r(cfg, rt);
  const auto exec = r.execute("import requests\nprint(1)");
  EXPECT_EQ(exec.result.kind, runner::ErrorKind::None);
  waitCleanup(exec);
  EXPECT_FALSE(rt->ran("pip install"));
  EXPECT_FALSE(rt->ran("pip uninstall"));
}

TEST(Runner, CachedDependencyIsInstalledAtConstruction) {
  auto rt = std::make_shared<FakeRuntime>();
  auto cfg = baseConfig();
  cfg.cached_dependencies = {"requests"};
  const runner::Runner r(cfg, rt);
  EXPECT_TRUE(rt->ran("pip list --format=freeze"));
  EXPECT_TRUE(rt->ran("pip install --user requests"));
}

TEST(Runner, TimeoutKillsLeftoverProcess) {
  auto rt = std::make_shared<FakeRuntime>();
  rt->addRule({"python ", 0, "late\n", std::chrono::milliseconds(3000)});
  obs::Metrics metrics;
  const runner::Runner r(baseConfig(), rt, &metrics);
  const auto timeout = std::chrono::milliseconds(100);
  const auto started = std::chrono::steady_clock::now();
  const auto exec = r.execute("import time\ntime.sleep(3)", timeout);
  const auto elapsed = std::chrono::steady_clock::now() - started;
  EXPECT_GE(elapsed, timeout + runner::CommandExecutor::kGracePeriod);
  EXPECT_LT(elapsed, timeout + runner::CommandExecutor::kGracePeriod + std::chrono::milliseconds(1000));
  EXPECT_EQ(exec.result.kind, runner::ErrorKind::ExecutionFailed);
  EXPECT_EQ(exec.result.text, "Execution timed out.");
  waitCleanup(exec);
  EXPECT_TRUE(rt->ran("pkill -f '[/]code/script_"));
  EXPECT_EQ(metrics.counter("timeouts"), 1u);
}

TEST(Runner, ContainerGoneAtExecution) {
  auto rt = std::make_shared<FakeRuntime>();
  const runner::Runner r(baseConfig(), rt);
  rt->setPresent(false);
  const auto exec = r.execute("print(1)");
  EXPECT_EQ(exec.result.kind, runner::ErrorKind::InfrastructureNotFound);
  EXPECT_EQ(exec.result.text, "Container with name sandbox not found.");
  EXPECT_EQ(exec.cleanup.wait_for(std::chrono::seconds(0)), std::future_status::ready);
}

TEST(Runner, FailedUploadStillCleansUp) {
  auto rt = std::make_shared<FakeRuntime>();
  rt->setUploadResult(false);
  const runner::Runner r(baseConfig(), rt);
  const auto exec = r.execute("print(1)");
  EXPECT_EQ(exec.result.text, "Failed to copy script to container.");
  waitCleanup(exec);
  EXPECT_FALSE(rt->ran("python "));
  EXPECT_TRUE(rt->ran("rm -f /code/script_"));
}

TEST(Runner, RecordsStagesAndCounters) {
  auto rt = std::make_shared<FakeRuntime>();
  obs::Metrics metrics;
  const runner::Runner r(baseConfig(), rt, &metrics);
  waitCleanup(r.execute("print(1)"));
  (void)r.execute("import sys");
  EXPECT_EQ(metrics.counter("executions"), 2u);
  EXPECT_EQ(metrics.counter("rejected_unsafe"), 1u);
  for (const char* stage : {"safety_check", "resolve_container", "apply_limits", "upload_code",
                            "install_dependencies", "run", "cleanup"}) {
    EXPECT_GE(metrics.samples(stage), 1u) << stage;
  }
}

TEST(Runner, ConstructionFailures) {
  auto rt = std::make_shared<FakeRuntime>();
  auto cfg = baseConfig();
  cfg.container_name = "ghost";
  try {
    const runner::Runner r(cfg, rt);
    FAIL() << "expected ConfigError";
  } catch (const exceptions::ConfigError& ex) {
    EXPECT_STREQ(ex.what(), "Container with name ghost not found.");
  }

  auto stopped = std::make_shared<FakeRuntime>("sandbox", container::ContainerState::Exited);
  try {
    const runner::Runner r(baseConfig(), stopped);
    FAIL() << "expected ConfigError";
  } catch (const exceptions::ConfigError& ex) {
    EXPECT_STREQ(ex.what(), "Container sandbox is not running (state: exited).");
  }

  EXPECT_THROW({ const runner::Runner r(baseConfig(), nullptr); }, exceptions::ConfigError);
}

TEST(Runner, PrewarmFailureFailsConstruction) {
  auto rt = std::make_shared<FakeRuntime>();
  rt->addRule({"pip install --user requests", 1, "boom", {}});
  auto cfg = baseConfig();
  cfg.cached_dependencies = {"requests"};
  try {
    const runner::Runner r(cfg, rt);
    FAIL() << "expected ConfigError";
  } catch (const exceptions::ConfigError& ex) {
    EXPECT_STREQ(ex.what(), "Failed to pre-install cached dependencies: Failed to install dependency requests");
  }
}

TEST(Runner, AnalysisHelpers) {
  auto rt = std::make_shared<FakeRuntime>();
  const runner::Runner r(baseConfig(), rt);
  EXPECT_TRUE(r.safetyCheck("print(1)").safe);
  EXPECT_EQ(r.parseDependencies("import numpy\nimport os"), std::set<std::string>{"numpy"});
  EXPECT_EQ(r.config().container_name, "sandbox");
}
