/***
 * Name: test_runner_config
 * Purpose: Defaults, environment overlay, name lists and validation of RunnerConfig.
 */
#include <gtest/gtest.h>
#include <cstdlib>
#include <string>
#include <vector>
#include "agentrun/exceptions/config_error.h"
#include "agentrun/runner/runner_config.h"

using namespace agentrun;
using runner::RunnerConfig;

namespace {

const char* const kEnvNames[] = {"AGENTRUN_CONTAINER_NAME", "CONTAINER_NAME",        "AGENTRUN_WHITELIST",
                                 "AGENTRUN_CACHED_DEPENDENCIES", "AGENTRUN_CPU_QUOTA", "AGENTRUN_MEMORY_LIMIT",
                                 "AGENTRUN_MEMSWAP_LIMIT",   "AGENTRUN_TIMEOUT"};

void clearEnv() {
  for (const char* name : kEnvNames) ::unsetenv(name);
}

RunnerConfig valid() {
  RunnerConfig cfg;
  cfg.container_name = "sandbox";
  return cfg;
}

std::string validationMessage(const RunnerConfig& cfg) {
  try {
    runner::ValidateConfig(cfg);
  } catch (const exceptions::ConfigError& e) {
    return e.what();
  }
  return {};
}

}  // namespace

TEST(RunnerConfig, Defaults) {
  const RunnerConfig cfg;
  EXPECT_TRUE(cfg.container_name.empty());
  EXPECT_EQ(cfg.dependencies_whitelist, std::vector<std::string>{"*"});
  EXPECT_TRUE(cfg.cached_dependencies.empty());
  EXPECT_EQ(cfg.cpu_quota, 50000);
  EXPECT_EQ(cfg.memory_limit, "100m");
  EXPECT_EQ(cfg.memswap_limit, "512m");
  EXPECT_EQ(cfg.default_timeout, 20);
  EXPECT_EQ(cfg.code_dir, "/code");
  EXPECT_TRUE(runner::AllowsAll(cfg));
  EXPECT_TRUE(runner::IsWhitelisted(cfg, "anything"));
}

TEST(RunnerConfig, WhitelistMembership) {
  RunnerConfig cfg = valid();
  cfg.dependencies_whitelist = {"requests", "numpy"};
  EXPECT_FALSE(runner::AllowsAll(cfg));
  EXPECT_TRUE(runner::IsWhitelisted(cfg, "numpy"));
  EXPECT_FALSE(runner::IsWhitelisted(cfg, "pandas"));
}

TEST(ParseNameList, BracketedAndCommaForms) {
  EXPECT_EQ(runner::ParseNameList(R"(["requests", "numpy"])"), (std::vector<std::string>{"requests", "numpy"}));
  EXPECT_EQ(runner::ParseNameList("['a' , 'b',]"), (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(runner::ParseNameList("a, b ,,c"), (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(runner::ParseNameList("*"), std::vector<std::string>{"*"});
  EXPECT_TRUE(runner::ParseNameList("").empty());
  EXPECT_TRUE(runner::ParseNameList("[]").empty());
}

TEST(ParseNameList, MalformedThrows) {
  EXPECT_THROW((void)runner::ParseNameList("[requests]"), exceptions::ConfigError);
  EXPECT_THROW((void)runner::ParseNameList("[\"a\""), exceptions::ConfigError);
  EXPECT_THROW((void)runner::ParseNameList("[\"a\" \"b\"]"), exceptions::ConfigError);
  EXPECT_THROW((void)runner::ParseNameList("[\"unterminated]"), exceptions::ConfigError);
}

TEST(IsValidMemorySize, Forms) {
  EXPECT_TRUE(runner::IsValidMemorySize("100m"));
  EXPECT_TRUE(runner::IsValidMemorySize("1G"));
  EXPECT_TRUE(runner::IsValidMemorySize("1048576"));
  EXPECT_TRUE(runner::IsValidMemorySize("4k"));
  EXPECT_FALSE(runner::IsValidMemorySize(""));
  EXPECT_FALSE(runner::IsValidMemorySize("m"));
  EXPECT_FALSE(runner::IsValidMemorySize("10mb"));
  EXPECT_FALSE(runner::IsValidMemorySize("-1m"));
  EXPECT_FALSE(runner::IsValidMemorySize("10t"));
}

TEST(ValidateConfig, AcceptsDefaultsWithName) { EXPECT_EQ(validationMessage(valid()), ""); }

TEST(ValidateConfig, ReportsFirstProblem) {
  EXPECT_EQ(validationMessage(RunnerConfig{}), "container name must not be empty");

  RunnerConfig cfg = valid();
  cfg.cpu_quota = 0;
  EXPECT_EQ(validationMessage(cfg), "cpu quota must be positive, got 0");

  cfg = valid();
  cfg.default_timeout = -1;
  EXPECT_EQ(validationMessage(cfg), "default timeout must be positive, got -1");

  cfg = valid();
  cfg.memory_limit = "lots";
  EXPECT_EQ(validationMessage(cfg), "invalid memory limit: 'lots'");

  cfg = valid();
  cfg.memswap_limit = "";
  EXPECT_EQ(validationMessage(cfg), "invalid memory+swap limit: ''");

  cfg = valid();
  cfg.code_dir = "code";
  EXPECT_EQ(validationMessage(cfg), "code directory must be an absolute path: 'code'");
}

TEST(ValidateConfig, CachedMustBeWhitelisted) {
  RunnerConfig cfg = valid();
  cfg.dependencies_whitelist = {"requests"};
  cfg.cached_dependencies = {"requests", "numpy"};
  EXPECT_EQ(validationMessage(cfg), "Some cached dependencies are not in the whitelist: numpy");

  cfg.dependencies_whitelist = {"*"};
  EXPECT_EQ(validationMessage(cfg), "");
}

TEST(LoadConfigFromEnv, OverlaysVariables) {
  clearEnv();
  ::setenv("AGENTRUN_CONTAINER_NAME", "box", 1);
  ::setenv("AGENTRUN_WHITELIST", R"(["requests", "numpy"])", 1);
  ::setenv("AGENTRUN_CACHED_DEPENDENCIES", "numpy", 1);
  ::setenv("AGENTRUN_CPU_QUOTA", "25000", 1);
  ::setenv("AGENTRUN_MEMORY_LIMIT", "256m", 1);
  ::setenv("AGENTRUN_MEMSWAP_LIMIT", "1g", 1);
  ::setenv("AGENTRUN_TIMEOUT", " 5 ", 1);
  RunnerConfig cfg;
  runner::LoadConfigFromEnv(cfg);
  clearEnv();
  EXPECT_EQ(cfg.container_name, "box");
  EXPECT_EQ(cfg.dependencies_whitelist, (std::vector<std::string>{"requests", "numpy"}));
  EXPECT_EQ(cfg.cached_dependencies, std::vector<std::string>{"numpy"});
  EXPECT_EQ(cfg.cpu_quota, 25000);
  EXPECT_EQ(cfg.memory_limit, "256m");
  EXPECT_EQ(cfg.memswap_limit, "1g");
  EXPECT_EQ(cfg.default_timeout, 5);
}

TEST(LoadConfigFromEnv, ContainerNameFallbackAndUnsetFields) {
  clearEnv();
  ::setenv("CONTAINER_NAME", "legacy", 1);
  ::setenv("AGENTRUN_MEMORY_LIMIT", "", 1);
  RunnerConfig cfg;
  runner::LoadConfigFromEnv(cfg);
  clearEnv();
  EXPECT_EQ(cfg.container_name, "legacy");
  EXPECT_EQ(cfg.memory_limit, "100m");
}

TEST(LoadConfigFromEnv, BadNumbersThrow) {
  clearEnv();
  ::setenv("AGENTRUN_TIMEOUT", "soon", 1);
  RunnerConfig cfg;
  EXPECT_THROW(runner::LoadConfigFromEnv(cfg), exceptions::ConfigError);
  ::setenv("AGENTRUN_TIMEOUT", "99999999999", 1);
  EXPECT_THROW(runner::LoadConfigFromEnv(cfg), exceptions::ConfigError);
  clearEnv();
}
