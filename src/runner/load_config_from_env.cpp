/***
 * Name: agentrun::runner::LoadConfigFromEnv
 * Purpose: Apply AGENTRUN_* environment variables to a RunnerConfig.
 * Inputs:
 *   - config: values to overlay (unset variables leave fields untouched)
 * Outputs:
 *   - config updated; ConfigError for unparsable numbers or lists
 * Theory of Operation: The container name falls back to CONTAINER_NAME, the
 *   variable existing deployments already set.
 */
#include "agentrun/runner/runner_config.h"

#include <cstdlib>
#include <limits>
#include <string>

#include "agentrun/exceptions/config_error.h"
#include "agentrun/support/parse.h"

namespace agentrun {
namespace runner {

namespace {

const char* env(const char* name) {
  const char* value = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
  return (value != nullptr && *value != '\0') ? value : nullptr;
}

long long envInt(const char* name, const char* value) {
  long long parsed = 0;
  std::string err;
  if (!support::ParseIntStrict(value, parsed, &err)) {
    throw exceptions::ConfigError(std::string(name) + ": " + err + " '" + value + "'");
  }
  return parsed;
}

}  // namespace

void LoadConfigFromEnv(RunnerConfig& config) {
  if (const char* value = env("AGENTRUN_CONTAINER_NAME")) {
    config.container_name = value;
  } else if (const char* fallback = env("CONTAINER_NAME")) {
    config.container_name = fallback;
  }
  if (const char* value = env("AGENTRUN_WHITELIST")) {
    config.dependencies_whitelist = ParseNameList(value);
  }
  if (const char* value = env("AGENTRUN_CACHED_DEPENDENCIES")) {
    config.cached_dependencies = ParseNameList(value);
  }
  if (const char* value = env("AGENTRUN_CPU_QUOTA")) {
    config.cpu_quota = envInt("AGENTRUN_CPU_QUOTA", value);
  }
  if (const char* value = env("AGENTRUN_MEMORY_LIMIT")) {
    config.memory_limit = value;
  }
  if (const char* value = env("AGENTRUN_MEMSWAP_LIMIT")) {
    config.memswap_limit = value;
  }
  if (const char* value = env("AGENTRUN_TIMEOUT")) {
    const long long timeout = envInt("AGENTRUN_TIMEOUT", value);
    if (timeout > std::numeric_limits<int>::max() || timeout < std::numeric_limits<int>::min()) {
      throw exceptions::ConfigError(std::string("AGENTRUN_TIMEOUT: integer overflow '") + value + "'");
    }
    config.default_timeout = static_cast<int>(timeout);
  }
}

}  // namespace runner
}  // namespace agentrun
