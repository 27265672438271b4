/***
 * Name: agentrun::runner::DependencyManager
 * Purpose: Whitelist enforcement, installation and removal of the third-party
 *   packages a submission imports.
 * Inputs: Runner configuration, a command executor, resolved dependency sets
 * Outputs: ExecutionResult for installs (kind None on success); a message for
 *   uninstalls
 * Theory of Operation:
 *   install(): an all-or-nothing whitelist pre-check, then (when the runner
 *   keeps cached packages) one inventory query, then one `pip install --user`
 *   per missing package, stopping at the first failure.
 *   uninstall(): `pip uninstall -y` for every package that is not cached;
 *   failures are logged and otherwise ignored.
 *   Package names are compared in PEP 503 normalized form.
 */
#pragma once

#include <chrono>
#include <set>
#include <string>

#include "agentrun/container/container_runtime.h"
#include "agentrun/runner/command_executor.h"
#include "agentrun/runner/execution_result.h"
#include "agentrun/runner/runner_config.h"
#include "observability/Metrics.h"

namespace agentrun {
namespace runner {

/*** NormalizePackageName: PEP 503 form, Unicode case-folded (ICU). */
std::string NormalizePackageName(const std::string& name);

/*** ParsePipFreeze: normalized package names from `pip list --format=freeze` output. */
std::set<std::string> ParsePipFreeze(const std::string& output);

class DependencyManager {
 public:
  static constexpr std::chrono::seconds kPipTimeout{120};

  DependencyManager(RunnerConfig config, const CommandExecutor& executor, obs::Metrics* metrics = nullptr);

  [[nodiscard]] ExecutionResult install(const container::ContainerHandle& handle,
                                        const std::set<std::string>& deps) const;
  std::string uninstall(const container::ContainerHandle& handle, const std::set<std::string>& deps) const;

  /*** installedPackages: normalized names present in the container; empty on query failure. */
  [[nodiscard]] std::set<std::string> installedPackages(const container::ContainerHandle& handle) const;

  [[nodiscard]] bool isCached(const std::string& dep) const;

 private:
  RunnerConfig config_;
  const CommandExecutor& executor_;
  obs::Metrics* metrics_;
  std::set<std::string> cached_;  // normalized
};

}  // namespace runner
}  // namespace agentrun
