/***
 * Name: agentrun::driver::detail::HandleValueArg
 * Purpose: Handle an option taking one value: "--opt value" or "--opt=value".
 * Inputs: arg (current), p (option name, args, index, argc, destination, err)
 * Outputs: OptResult and destination set; index advanced for the split form
 */
#include "agentrun/driver/cli.h"
#include "agentrun/driver/cli_parse.h"

#include <cstddef>
#include <ostream>
#include <string>

namespace agentrun {
namespace driver {
namespace detail {

auto HandleValueArg(const std::string& arg, const ValueParams& p) -> OptResult {
  if (arg == p.long_opt) {
    if (p.index + 1 >= p.argc) {
      p.err << "agentrun: error: missing value after '" << p.long_opt << "'" << '\n';
      return OptResult::Error;
    }
    p.out = p.args[static_cast<std::size_t>(++p.index)];
    return OptResult::Handled;
  }
  const std::string prefix = p.long_opt + "=";
  if (arg.rfind(prefix, 0) == 0U) {
    p.out = arg.substr(prefix.size());
    return OptResult::Handled;
  }
  return OptResult::NotMatched;
}

}  // namespace detail
}  // namespace driver
}  // namespace agentrun
