/***
 * Name: agentrun::driver::BuildConfig
 * Purpose: Assemble a RunnerConfig from defaults, the environment and CLI overrides.
 * Inputs:
 *   - opts: parsed CLI options
 * Outputs:
 *   - config: populated settings; bool false with a diagnostic on err
 * Theory of Operation: Environment first, then each explicitly given option.
 *   Validation against the container happens later in the Runner constructor.
 */
#include "agentrun/driver/app.h"

#include <limits>
#include <optional>
#include <ostream>
#include <string>

#include "agentrun/exceptions/config_error.h"
#include "agentrun/runner/runner_config.h"
#include "agentrun/support/parse.h"

namespace agentrun {
namespace driver {

static bool ParseOptionInt(const char* name, const std::optional<std::string>& value, long long& out,
                           std::ostream& err) {
  std::string why;
  if (!support::ParseIntStrict(*value, out, &why)) {
    err << "agentrun: error: " << name << ": " << why << " '" << *value << "'" << '\n';
    return false;
  }
  return true;
}

auto BuildConfig(const CliOptions& opts, runner::RunnerConfig& config, std::ostream& err) -> bool {
  config = runner::RunnerConfig{};
  try {
    runner::LoadConfigFromEnv(config);
    if (opts.container) { config.container_name = *opts.container; }
    if (opts.whitelist) { config.dependencies_whitelist = runner::ParseNameList(*opts.whitelist); }
    if (opts.cached) { config.cached_dependencies = runner::ParseNameList(*opts.cached); }
  } catch (const exceptions::ConfigError& ex) {
    err << "agentrun: error: " << ex.what() << '\n';
    return false;
  }
  if (opts.cpu_quota) {
    long long quota = 0;
    if (!ParseOptionInt("--cpu-quota", opts.cpu_quota, quota, err)) { return false; }
    config.cpu_quota = quota;
  }
  if (opts.memory) { config.memory_limit = *opts.memory; }
  if (opts.memswap) { config.memswap_limit = *opts.memswap; }
  if (opts.timeout) {
    long long seconds = 0;
    if (!ParseOptionInt("--timeout", opts.timeout, seconds, err)) { return false; }
    if (seconds > std::numeric_limits<int>::max() || seconds < std::numeric_limits<int>::min()) {
      err << "agentrun: error: --timeout: integer overflow '" << *opts.timeout << "'" << '\n';
      return false;
    }
    config.default_timeout = static_cast<int>(seconds);
  }
  return true;
}

}  // namespace driver
}  // namespace agentrun
