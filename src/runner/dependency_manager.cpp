/***
 * Name: agentrun::runner::DependencyManager (impl)
 * Purpose: Install and remove per-submission packages inside the container.
 */
#include "agentrun/runner/dependency_manager.h"

#include <set>
#include <string>
#include <utility>

#include "agentrun/exceptions/agentrun_exception.h"
#include "agentrun/exceptions/command_timeout.h"
#include "agentrun/log/logger.h"

namespace agentrun {
namespace runner {

DependencyManager::DependencyManager(RunnerConfig config, const CommandExecutor& executor, obs::Metrics* metrics)
    : config_(std::move(config)), executor_(executor), metrics_(metrics) {
  for (const auto& dep : config_.cached_dependencies) { cached_.insert(NormalizePackageName(dep)); }
}

bool DependencyManager::isCached(const std::string& dep) const {
  return cached_.count(NormalizePackageName(dep)) != 0;
}

std::set<std::string> DependencyManager::installedPackages(const container::ContainerHandle& handle) const {
  const auto listing = executor_.run(handle, "pip list --format=freeze", kPipTimeout);
  if (listing.exit_code != 0) {
    log::Logger()->warn("pip list failed (rc={}), assuming no packages are installed", listing.exit_code);
    return {};
  }
  return ParsePipFreeze(listing.output);
}

ExecutionResult DependencyManager::install(const container::ContainerHandle& handle,
                                           const std::set<std::string>& deps) const {
  if (!AllowsAll(config_)) {
    for (const auto& dep : deps) {
      if (!IsWhitelisted(config_, dep)) {
        return ExecutionResult{ErrorKind::PolicyRejected, "Dependency: " + dep + " is not in the whitelist."};
      }
    }
  }

  std::set<std::string> present;
  if (!cached_.empty() && !deps.empty()) { present = installedPackages(handle); }

  for (const auto& dep : deps) {
    if (present.count(NormalizePackageName(dep)) != 0) {
      log::Logger()->debug("dependency {} already installed", dep);
      continue;
    }
    log::Logger()->info("installing dependency {}", dep);
    int exitCode = -1;
    try {
      exitCode = executor_.run(handle, "pip install --user " + dep, kPipTimeout).exit_code;
    } catch (const exceptions::CommandTimeout&) {
      log::Logger()->warn("installing {} timed out", dep);
    }
    if (exitCode != 0) {
      return ExecutionResult{ErrorKind::ExecutionFailed, "Failed to install dependency " + dep};
    }
    if (metrics_ != nullptr) metrics_->incCounter("installs");
  }
  return ExecutionResult{ErrorKind::None, "Dependencies installed successfully."};
}

std::string DependencyManager::uninstall(const container::ContainerHandle& handle,
                                         const std::set<std::string>& deps) const {
  for (const auto& dep : deps) {
    if (isCached(dep)) continue;
    log::Logger()->info("removing dependency {}", dep);
    try {
      const auto result = executor_.run(handle, "pip uninstall -y " + dep, kPipTimeout);
      if (result.exit_code != 0) {
        log::Logger()->warn("failed to uninstall {} (rc={})", dep, result.exit_code);
        continue;
      }
      if (metrics_ != nullptr) metrics_->incCounter("uninstalls");
    } catch (const exceptions::AgentrunException& err) {
      log::Logger()->warn("failed to uninstall {}: {}", dep, err.what());
    }
  }
  return "Dependencies uninstalled successfully.";
}

}  // namespace runner
}  // namespace agentrun
