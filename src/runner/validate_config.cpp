/***
 * Name: agentrun::runner::ValidateConfig
 * Purpose: Reject runner settings that would make every execution fail.
 * Inputs:
 *   - config: settings to check
 * Outputs:
 *   - throws exceptions::ConfigError naming the first problem found
 */
#include "agentrun/runner/runner_config.h"

#include <string>

#include "agentrun/exceptions/config_error.h"

namespace agentrun {
namespace runner {

void ValidateConfig(const RunnerConfig& config) {
  if (config.container_name.empty()) {
    throw exceptions::ConfigError("container name must not be empty");
  }
  if (config.cpu_quota <= 0) {
    throw exceptions::ConfigError("cpu quota must be positive, got " + std::to_string(config.cpu_quota));
  }
  if (config.default_timeout <= 0) {
    throw exceptions::ConfigError("default timeout must be positive, got " + std::to_string(config.default_timeout));
  }
  if (!IsValidMemorySize(config.memory_limit)) {
    throw exceptions::ConfigError("invalid memory limit: '" + config.memory_limit + "'");
  }
  if (!IsValidMemorySize(config.memswap_limit)) {
    throw exceptions::ConfigError("invalid memory+swap limit: '" + config.memswap_limit + "'");
  }
  if (config.code_dir.empty() || config.code_dir.front() != '/') {
    throw exceptions::ConfigError("code directory must be an absolute path: '" + config.code_dir + "'");
  }
  if (config.interpreter.empty()) {
    throw exceptions::ConfigError("interpreter must not be empty");
  }
  if (AllowsAll(config)) return;
  for (const auto& dep : config.cached_dependencies) {
    if (!IsWhitelisted(config, dep)) {
      throw exceptions::ConfigError("Some cached dependencies are not in the whitelist: " + dep);
    }
  }
}

}  // namespace runner
}  // namespace agentrun
