/***
 * Name: agentrun::driver::detail::RunHandlers
 * Purpose: Execute the ordered handler list for argument at 'index'.
 * Inputs: args, index (in/out), argc, dst, err
 * Outputs: OptResult (Error halts, Handled continues)
 * Theory of Operation: Table-driven dispatch; last handler captures unknown/positional.
 */
#include "agentrun/driver/cli.h"
#include "agentrun/driver/cli_parse.h"

#include <array>
#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace agentrun {
namespace driver {
namespace detail {

auto RunHandlers(const std::vector<std::string>& args, int& index, int argc, CliOptions& dst, std::ostream& err)
    -> OptResult {
  using HandlerFn = std::function<OptResult(int&)>;

  const std::array<std::pair<std::string, std::optional<std::string>*>, 7> valueOptions{{
      {"--container", &dst.container},
      {"--whitelist", &dst.whitelist},
      {"--cached", &dst.cached},
      {"--cpu-quota", &dst.cpu_quota},
      {"--memory", &dst.memory},
      {"--memswap", &dst.memswap},
      {"--timeout", &dst.timeout},
  }};

  const std::array handlers{
      HandlerFn{[&](int& idx) { return HandleHelpArg(args[static_cast<std::size_t>(idx)], dst); }},
      HandlerFn{[&](int& idx) { return HandleMetricsArg(args[static_cast<std::size_t>(idx)], dst, err); }},
      HandlerFn{[&](int& idx) {
        const std::string& current = args[static_cast<std::size_t>(idx)];
        for (const auto& [name, slot] : valueOptions) {
          const ValueParams params{name, args, idx, argc, *slot, err};
          const OptResult result = HandleValueArg(current, params);
          if (result != OptResult::NotMatched) {
            return result;
          }
        }
        return OptResult::NotMatched;
      }},
      HandlerFn{[&](int& idx) {
        const std::string& current = args[static_cast<std::size_t>(idx)];
        const std::string dockerOpt{"--docker"};
        std::optional<std::string> docker;
        const ValueParams params{dockerOpt, args, idx, argc, docker, err};
        const OptResult result = HandleValueArg(current, params);
        if (result == OptResult::Handled) {
          dst.docker = *docker;
        }
        return result;
      }},
      HandlerFn{[&](int& idx) { return HandleSwitch(args[static_cast<std::size_t>(idx)], dst); }},
      HandlerFn{[&](int& idx) { return HandleEndOfOptions(args, idx, argc, dst, err); }},
      HandlerFn{[&](int& idx) { return HandleUnknownOrPositional(args[static_cast<std::size_t>(idx)], dst, err); }},
  };

  for (const auto& handler : handlers) {
    const OptResult result = handler(index);
    if (result != OptResult::NotMatched) {
      return result;
    }
  }
  return OptResult::NotMatched;
}

}  // namespace detail
}  // namespace driver
}  // namespace agentrun
