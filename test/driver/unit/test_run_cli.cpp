/***
 * Name: test_run_cli
 * Purpose: The agentrun command end to end with an in-memory container runtime.
 */
#include <gtest/gtest.h>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>
#include "agentrun/driver/app.h"
#include "agentrun/support/fs.h"
#include "util/FakeRuntime.h"

using namespace agentrun;
using testutil::FakeRuntime;

namespace {

struct CliRun {
  int status{-1};
  std::string out;
  std::string err;
};

CliRun runCli(std::vector<const char*> args, std::shared_ptr<container::ContainerRuntime> runtime = nullptr) {
  for (const char* name : {"AGENTRUN_CONTAINER_NAME", "CONTAINER_NAME", "AGENTRUN_WHITELIST",
                           "AGENTRUN_CACHED_DEPENDENCIES", "AGENTRUN_TIMEOUT"}) {
    ::unsetenv(name);
  }
  args.insert(args.begin(), "agentrun");
  std::ostringstream out;
  std::ostringstream err;
  CliRun run;
  run.status = driver::RunCli(static_cast<int>(args.size()), args.data(), out, err, std::move(runtime));
  run.out = out.str();
  run.err = err.str();
  return run;
}

class ScriptFile {
 public:
  explicit ScriptFile(const std::string& body)
      : path_(::testing::TempDir() + "agentrun_cli_" + std::to_string(::getpid()) + "_" +
              std::to_string(counter_++) + ".py") {
    std::string err;
    EXPECT_TRUE(support::WriteFile(path_, body, err)) << err;
  }
  ~ScriptFile() {
    std::string err;
    (void)support::RemoveFile(path_, err);
  }
  ScriptFile(const ScriptFile&) = delete;
  ScriptFile& operator=(const ScriptFile&) = delete;

  const char* path() const { return path_.c_str(); }

 private:
  static inline int counter_ = 0;
  std::string path_;
};

}  // namespace

TEST(RunCli, HelpGoesToStdout) {
  const auto run = runCli({"--help"});
  EXPECT_EQ(run.status, driver::kExitOk);
  EXPECT_EQ(run.out.rfind("Usage: agentrun", 0), 0u);
  EXPECT_TRUE(run.err.empty());
}

TEST(RunCli, UsageErrorExits2) {
  const auto run = runCli({"--nope"});
  EXPECT_EQ(run.status, driver::kExitUsage);
  EXPECT_NE(run.err.find("unknown option '--nope'"), std::string::npos);
  EXPECT_NE(run.err.find("Usage:"), std::string::npos);
}

TEST(RunCli, UnreadableInputExits2) {
  const auto run = runCli({"/nonexistent/agentrun/input.py"});
  EXPECT_EQ(run.status, driver::kExitUsage);
  EXPECT_NE(run.err.find("failed to open file"), std::string::npos);
}

TEST(RunCli, CheckSafeAndUnsafe) {
  const ScriptFile safe("print('hi')\n");
  auto run = runCli({"--check", safe.path()});
  EXPECT_EQ(run.status, driver::kExitOk);
  EXPECT_EQ(run.out, "The code is safe to execute.\n");

  const ScriptFile unsafe("import os\nos.system('ls')\n");
  run = runCli({"--check", unsafe.path()});
  EXPECT_EQ(run.status, driver::kExitRejected);
  EXPECT_EQ(run.out, "Unsafe module import: os\n");
}

TEST(RunCli, DepsListsThirdPartyModules) {
  const ScriptFile script("import requests\nimport os\nfrom numpy.linalg import norm\nimport requests.adapters\n");
  const auto run = runCli({"--deps", script.path()});
  EXPECT_EQ(run.status, driver::kExitOk);
  EXPECT_EQ(run.out, "numpy\nrequests\n");
}

TEST(RunCli, DepsOnSyntaxErrorExits1) {
  const ScriptFile script("import (\n");
  const auto run = runCli({"--deps", script.path()});
  EXPECT_EQ(run.status, driver::kExitRejected);
  EXPECT_EQ(run.err.rfind("agentrun: ", 0), 0u);
}

TEST(RunCli, FullRunPrintsOutputAndMetrics) {
  const ScriptFile script("print('Hello, World!')\n");
  auto rt = std::make_shared<FakeRuntime>();
  rt->addRule({"python /code/script_", 0, "Hello, World!\n", {}});
  const auto run = runCli({"--container", "sandbox", "--metrics=json", script.path()}, rt);
  EXPECT_EQ(run.status, driver::kExitOk);
  EXPECT_EQ(run.out, "Hello, World!\n");
  EXPECT_NE(run.err.find("\"durations_ms\""), std::string::npos);
  EXPECT_NE(run.err.find("\"cleanup\""), std::string::npos);
  // Cleanup finished before RunCli returned.
  EXPECT_TRUE(rt->ran("rm -f /code/script_"));
}

TEST(RunCli, FullRunAppliesLimitOverrides) {
  const ScriptFile script("print(1)\n");
  auto rt = std::make_shared<FakeRuntime>("box");
  rt->addRule({"python /code/script_", 0, "1", {}});
  const auto run =
      runCli({"--container", "box", "--cpu-quota", "20000", "--memory=64m", "--memswap", "128m", script.path()}, rt);
  EXPECT_EQ(run.status, driver::kExitOk);
  EXPECT_EQ(run.out, "1\n");
  ASSERT_FALSE(rt->limits().empty());
  EXPECT_EQ(rt->limits()[0].cpu_quota, 20000);
  EXPECT_EQ(rt->limits()[0].memory, "64m");
  EXPECT_EQ(rt->limits()[0].memswap, "128m");
}

TEST(RunCli, UnsafeSubmissionIsReportedNotExecuted) {
  const ScriptFile script("eval('1')\n");
  auto rt = std::make_shared<FakeRuntime>();
  const auto run = runCli({"--container", "sandbox", script.path()}, rt);
  EXPECT_EQ(run.status, driver::kExitOk);
  EXPECT_EQ(run.out, "Unsafe function call: eval\n");
  EXPECT_FALSE(rt->ran("python "));
}

TEST(RunCli, ConfigurationErrorsExit2) {
  const ScriptFile script("print(1)\n");
  auto rt = std::make_shared<FakeRuntime>();

  auto run = runCli({script.path()}, rt);
  EXPECT_EQ(run.status, driver::kExitUsage);
  EXPECT_NE(run.err.find("container name must not be empty"), std::string::npos);

  run = runCli({"--container", "ghost", script.path()}, rt);
  EXPECT_EQ(run.status, driver::kExitUsage);
  EXPECT_NE(run.err.find("Container with name ghost not found."), std::string::npos);

  run = runCli({"--container", "sandbox", "--timeout", "soon", script.path()}, rt);
  EXPECT_EQ(run.status, driver::kExitUsage);
  EXPECT_NE(run.err.find("--timeout: invalid character in integer literal 'soon'"), std::string::npos);

  run = runCli({"--container", "sandbox", "--whitelist", "[oops", script.path()}, rt);
  EXPECT_EQ(run.status, driver::kExitUsage);
  EXPECT_NE(run.err.find("malformed name list"), std::string::npos);

  run = runCli({"--container", "sandbox", "--whitelist", "requests", "--cached", "numpy", script.path()}, rt);
  EXPECT_EQ(run.status, driver::kExitUsage);
  EXPECT_NE(run.err.find("Some cached dependencies are not in the whitelist: numpy"), std::string::npos);
}
