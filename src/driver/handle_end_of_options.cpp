/***
 * Name: agentrun::driver::detail::HandleEndOfOptions
 * Purpose: Handle "--"; the following argument is the input even if it starts with '-'.
 * Inputs: args, index (in/out), argc, dst, err
 * Outputs: OptResult
 */
#include "agentrun/driver/cli.h"
#include "agentrun/driver/cli_parse.h"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace agentrun {
namespace driver {
namespace detail {

auto HandleEndOfOptions(const std::vector<std::string>& args, int& index, int argc, CliOptions& dst,
                        std::ostream& err) -> OptResult {
  if (args[static_cast<std::size_t>(index)] != "--") {
    return OptResult::NotMatched;
  }
  for (++index; index < argc; ++index) {
    if (!dst.input.empty()) {
      err << "agentrun: error: only one input file is supported" << '\n';
      return OptResult::Error;
    }
    dst.input = args[static_cast<std::size_t>(index)];
  }
  return OptResult::Handled;
}

}  // namespace detail
}  // namespace driver
}  // namespace agentrun
