/***
 * Name: agentrun::driver::detail::HandleHelpArg
 * Purpose: Recognize -h/--help and set show_help flag.
 * Inputs: arg, dst
 * Outputs: OptResult
 */
#include "agentrun/driver/cli.h"
#include "agentrun/driver/cli_parse.h"

#include <string>

namespace agentrun {
namespace driver {
namespace detail {

auto HandleHelpArg(const std::string& arg, CliOptions& dst) -> OptResult {
  if (arg == "-h" || arg == "--help") {
    dst.show_help = true;
    return OptResult::Handled;
  }
  return OptResult::NotMatched;
}

}  // namespace detail
}  // namespace driver
}  // namespace agentrun
