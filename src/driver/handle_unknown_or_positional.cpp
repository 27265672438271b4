/***
 * Name: agentrun::driver::detail::HandleUnknownOrPositional
 * Purpose: Reject unknown options; record the single positional input.
 * Inputs: arg, dst, err
 * Outputs: OptResult
 * Theory of Operation: A lone "-" is the stdin input, not an option.
 */
#include "agentrun/driver/cli.h"
#include "agentrun/driver/cli_parse.h"

#include <ostream>
#include <string>

namespace agentrun {
namespace driver {
namespace detail {

auto HandleUnknownOrPositional(const std::string& arg, CliOptions& dst, std::ostream& err) -> OptResult {
  if (arg.size() > 1 && arg[0] == '-') {
    err << "agentrun: error: unknown option '" << arg << "'" << '\n';
    return OptResult::Error;
  }
  if (arg.empty()) {
    return OptResult::Handled;
  }
  if (!dst.input.empty()) {
    err << "agentrun: error: only one input file is supported" << '\n';
    return OptResult::Error;
  }
  dst.input = arg;
  return OptResult::Handled;
}

}  // namespace detail
}  // namespace driver
}  // namespace agentrun
