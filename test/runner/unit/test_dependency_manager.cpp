/***
 * Name: test_dependency_manager
 * Purpose: Install policy, inventory parsing and package-name normalization.
 */
#include <gtest/gtest.h>
#include <memory>
#include <set>
#include <string>
#include "agentrun/runner/command_executor.h"
#include "agentrun/runner/dependency_manager.h"
#include "observability/Metrics.h"
#include "util/FakeRuntime.h"

using namespace agentrun;
using testutil::FakeRuntime;

static container::ContainerHandle handle() { return container::ContainerHandle{"c0ffee", "sandbox", container::ContainerState::Running}; }

TEST(DependencyManager, NormalizePackageName) {
  EXPECT_EQ(runner::NormalizePackageName("Requests"), "requests");
  EXPECT_EQ(runner::NormalizePackageName("zope.interface"), "zope-interface");
  EXPECT_EQ(runner::NormalizePackageName("Foo__Bar-.baz"), "foo-bar-baz");
  EXPECT_EQ(runner::NormalizePackageName("Stra\xC3\x9F" "e"), "strasse");
}

TEST(DependencyManager, ParsePipFreeze) {
  const std::string listing =
      "# editable installs\n"
      "-e git+https://example.com/repo.git#egg=local\n"
      "requests==2.31.0\n"
      "  Typing_Extensions==4.9.0  \n"
      "mypkg @ file:///src/mypkg\n"
      "\n"
      "extras[cli]>=1.0\n";
  EXPECT_EQ(runner::ParsePipFreeze(listing), (std::set<std::string>{"requests", "typing-extensions", "mypkg", "extras"}));
}

TEST(DependencyManager, WhitelistCheckedBeforeAnyInstall) {
  auto rt = std::make_shared<FakeRuntime>();
  runner::RunnerConfig cfg;
  cfg.dependencies_whitelist = {"numpy"};
  const runner::CommandExecutor exec(rt, "/code");
  const runner::DependencyManager deps(cfg, exec);
  const auto result = deps.install(handle(), {"numpy", "pandas"});
  EXPECT_EQ(result.kind, runner::ErrorKind::PolicyRejected);
  EXPECT_EQ(result.text, "Dependency: pandas is not in the whitelist.");
  EXPECT_TRUE(rt->commands().empty());
}

TEST(DependencyManager, InstallsInNameOrderAndCounts) {
  auto rt = std::make_shared<FakeRuntime>();
  obs::Metrics metrics;
  const runner::CommandExecutor exec(rt, "/code");
  const runner::DependencyManager deps(runner::RunnerConfig{}, exec, &metrics);
  const auto result = deps.install(handle(), {"pandas", "numpy"});
  EXPECT_TRUE(result.ok());
  EXPECT_EQ(result.text, "Dependencies installed successfully.");
  const auto cmds = rt->commands();
  ASSERT_EQ(cmds.size(), 2u);
  EXPECT_EQ(cmds[0], "pip install --user numpy");
  EXPECT_EQ(cmds[1], "pip install --user pandas");
  EXPECT_EQ(metrics.counter("installs"), 2u);
}

TEST(DependencyManager, NoInventoryQueryWithoutCache) {
  auto rt = std::make_shared<FakeRuntime>();
  const runner::CommandExecutor exec(rt, "/code");
  const runner::DependencyManager deps(runner::RunnerConfig{}, exec);
  EXPECT_TRUE(deps.install(handle(), {}).ok());
  (void)deps.install(handle(), {"numpy"});
  EXPECT_FALSE(rt->ran("pip list"));
}

TEST(DependencyManager, UninstallSkipsCachedAndToleratesFailures) {
  auto rt = std::make_shared<FakeRuntime>();
  rt->addRule({"pip uninstall -y broken", 1, "", {}});
  runner::RunnerConfig cfg;
  cfg.cached_dependencies = {"Requests"};
  const runner::CommandExecutor exec(rt, "/code");
  const runner::DependencyManager deps(cfg, exec);
  EXPECT_TRUE(deps.isCached("requests"));
  EXPECT_EQ(deps.uninstall(handle(), {"requests", "broken", "numpy"}), "Dependencies uninstalled successfully.");
  EXPECT_FALSE(rt->ran("pip uninstall -y requests"));
  EXPECT_TRUE(rt->ran("pip uninstall -y broken"));
  EXPECT_TRUE(rt->ran("pip uninstall -y numpy"));
}

TEST(DependencyManager, InventoryQueryFailureMeansNothingInstalled) {
  auto rt = std::make_shared<FakeRuntime>();
  rt->addRule({"pip list", 2, "", {}});
  const runner::CommandExecutor exec(rt, "/code");
  const runner::DependencyManager deps(runner::RunnerConfig{}, exec);
  EXPECT_TRUE(deps.installedPackages(handle()).empty());
}
