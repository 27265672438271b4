/***
 * Name: agentrun::runner::Runner
 * Purpose: End-to-end execution of untrusted Python source in one container.
 * Inputs: RunnerConfig, a ContainerRuntime, optional Metrics sink
 * Outputs: Execution{result, cleanup}; flat text via executeCodeInContainer
 * Theory of Operation:
 *   Per submission: safety check, resolve container, apply limits, upload the
 *   script, resolve and install dependencies, run the interpreter, then clean
 *   up. The first failing step decides the result. Cleanup (staged file,
 *   in-container script, leftover processes after a timeout, non-cached
 *   packages) runs on a detached thread; the returned shared_future becomes
 *   ready when it finishes. Construction validates the configuration,
 *   requires the container to be running and pre-installs cached packages,
 *   throwing ConfigError on any failure.
 *   A Runner may be used from several threads at once. The Metrics sink, if
 *   any, must outlive all pending cleanups.
 */
#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <set>
#include <string>

#include "agentrun/analysis/safety_analyzer.h"
#include "agentrun/container/container_runtime.h"
#include "agentrun/runner/execution_result.h"
#include "agentrun/runner/runner_config.h"
#include "observability/Metrics.h"

namespace agentrun {
namespace runner {

class Runner {
 public:
  Runner(RunnerConfig config, std::shared_ptr<container::ContainerRuntime> runtime,
         obs::Metrics* metrics = nullptr);

  [[nodiscard]] Execution execute(const std::string& source,
                                  std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

  /*** executeCodeInContainer: result text only; cleanup continues in the background. */
  [[nodiscard]] std::string executeCodeInContainer(const std::string& source,
                                                   std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

  [[nodiscard]] analysis::SafetyReport safetyCheck(const std::string& source) const;
  [[nodiscard]] std::set<std::string> parseDependencies(const std::string& source) const;
  [[nodiscard]] const RunnerConfig& config() const;

 private:
  struct Shared;
  struct CleanupPlan;

  static void cleanUp(const Shared& shared, const CleanupPlan& plan);
  [[nodiscard]] std::shared_future<void> dispatchCleanup(CleanupPlan plan) const;

  std::shared_ptr<const Shared> shared_;
};

}  // namespace runner
}  // namespace agentrun
