/***
 * Name: agentrun::runner::AllowsAll / IsWhitelisted
 * Purpose: Whitelist queries over a RunnerConfig.
 */
#include "agentrun/runner/runner_config.h"

#include <algorithm>
#include <string>

namespace agentrun {
namespace runner {

bool AllowsAll(const RunnerConfig& config) {
  const auto& list = config.dependencies_whitelist;
  return std::find(list.begin(), list.end(), kAllowAll) != list.end();
}

bool IsWhitelisted(const RunnerConfig& config, const std::string& name) {
  if (AllowsAll(config)) return true;
  const auto& list = config.dependencies_whitelist;
  return std::find(list.begin(), list.end(), name) != list.end();
}

}  // namespace runner
}  // namespace agentrun
