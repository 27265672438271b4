/***
 * Name: test_e2e_docker
 * Purpose: Run submissions through the real docker client against a live
 *   container named by AGENTRUN_E2E_CONTAINER (python and pip installed).
 *   Skipped when the variable is unset.
 */
#include <gtest/gtest.h>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include "agentrun/container/docker_cli_runtime.h"
#include "agentrun/exceptions/config_error.h"
#include "agentrun/runner/runner.h"

using namespace agentrun;

namespace {

std::string e2eContainer() {
  const char* name = std::getenv("AGENTRUN_E2E_CONTAINER");
  return name != nullptr ? std::string(name) : std::string();
}

runner::RunnerConfig e2eConfig() {
  runner::RunnerConfig cfg;
  cfg.container_name = e2eContainer();
  cfg.default_timeout = 10;
  return cfg;
}

}  // namespace

TEST(E2EDocker, HelloWorld) {
  if (e2eContainer().empty()) GTEST_SKIP() << "AGENTRUN_E2E_CONTAINER not set";
  const runner::Runner r(e2eConfig(), std::make_shared<container::DockerCliRuntime>());
  EXPECT_EQ(r.executeCodeInContainer("print('Hello, World!')"), "Hello, World!\n");
}

TEST(E2EDocker, RuntimeErrorOutputIsReturned) {
  if (e2eContainer().empty()) GTEST_SKIP() << "AGENTRUN_E2E_CONTAINER not set";
  const runner::Runner r(e2eConfig(), std::make_shared<container::DockerCliRuntime>());
  const std::string text = r.executeCodeInContainer("raise ValueError('boom')");
  EXPECT_NE(text.find("ValueError: boom"), std::string::npos);
}

TEST(E2EDocker, TimeoutKillsScript) {
  if (e2eContainer().empty()) GTEST_SKIP() << "AGENTRUN_E2E_CONTAINER not set";
  const runner::Runner r(e2eConfig(), std::make_shared<container::DockerCliRuntime>());
  const auto exec = r.execute("while True:\n    pass\n", std::chrono::milliseconds(1000));
  EXPECT_EQ(exec.result.text, "Execution timed out.");
  exec.cleanup.wait();
}

TEST(E2EDocker, UnknownContainerFailsConstruction) {
  if (e2eContainer().empty()) GTEST_SKIP() << "AGENTRUN_E2E_CONTAINER not set";
  runner::RunnerConfig cfg = e2eConfig();
  cfg.container_name = "agentrun-e2e-no-such-container";
  EXPECT_THROW({ const runner::Runner r(cfg, std::make_shared<container::DockerCliRuntime>()); },
               exceptions::ConfigError);
}
