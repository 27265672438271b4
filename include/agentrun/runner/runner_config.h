/***
 * Name: agentrun::runner (configuration)
 * Purpose: Construction-time settings of a Runner and their validation.
 * Inputs: Defaults, environment variables, command-line overrides
 * Outputs: RunnerConfig values; ConfigError on invalid settings
 * Theory of Operation: A RunnerConfig is built once (defaults, then
 *   LoadConfigFromEnv, then explicit overrides), validated by ValidateConfig
 *   and never changed afterwards.
 */
#pragma once

#include <string>
#include <vector>

namespace agentrun {
namespace runner {

inline constexpr const char* kAllowAll = "*";

struct RunnerConfig {
  std::string container_name;
  std::vector<std::string> dependencies_whitelist{kAllowAll};
  std::vector<std::string> cached_dependencies{};
  long long cpu_quota{50000};  // microseconds
  std::string memory_limit{"100m"};
  std::string memswap_limit{"512m"};
  int default_timeout{20};  // seconds
  std::string code_dir{"/code"};
  std::string interpreter{"python"};
  std::string staging_dir{};  // empty: system temporary directory
};

/*** AllowsAll: true when the whitelist carries the "*" entry. */
bool AllowsAll(const RunnerConfig& config);

/*** IsWhitelisted: true when name may be installed under this config. */
bool IsWhitelisted(const RunnerConfig& config, const std::string& name);

/*** IsValidMemorySize: digits followed by an optional b/k/m/g unit (any case). */
bool IsValidMemorySize(const std::string& text);

/*** ValidateConfig: throw ConfigError describing the first invalid setting. */
void ValidateConfig(const RunnerConfig& config);

/*** ParseNameList: '["a", "b"]' or 'a,b' into names; throws ConfigError when malformed. */
std::vector<std::string> ParseNameList(const std::string& text);

/*** LoadConfigFromEnv: overlay AGENTRUN_* environment variables onto config. */
void LoadConfigFromEnv(RunnerConfig& config);

}  // namespace runner
}  // namespace agentrun
