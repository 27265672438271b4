/***
 * Name: agentrun::driver::detail::HandleSwitch
 * Purpose: Handle simple boolean switches.
 * Inputs:
 *   - arg: current argument string
 *   - dst: CLI options destination
 * Outputs: OptResult indicating match
 * Theory of Operation: Sets flags and returns Handled when a match occurs.
 */
#include "agentrun/driver/cli.h"
#include "agentrun/driver/cli_parse.h"

#include <string>

namespace agentrun {
namespace driver {
namespace detail {

auto HandleSwitch(const std::string& arg, CliOptions& dst) -> OptResult {
  if (arg == "--check") {
    dst.check_only = true;
  } else if (arg == "--deps") {
    dst.deps_only = true;
  } else if (arg == "--verbose" || arg == "-v") {
    dst.verbose = true;
  } else if (arg == "--quiet" || arg == "-q") {
    dst.quiet = true;
  } else {
    return OptResult::NotMatched;
  }
  return OptResult::Handled;
}

}  // namespace detail
}  // namespace driver
}  // namespace agentrun
