/***
 * Name: agentrun::driver::ParseCli
 * Purpose: Parse command-line arguments into a CliOptions structure.
 * Inputs:
 *   - argc: Argument count
 *   - argv: Argument vector
 *   - dst: Output options structure to populate
 *   - err: Stream for diagnostics on parse errors
 * Outputs:
 *   - bool: true on successful parse, false if an error occurs
 * Theory of Operation:
 *   Normalizes argv, then runs the handler table for each argument. Help
 *   short-circuits validation of the remaining requirements.
 */
#include "agentrun/driver/cli.h"
#include "agentrun/driver/cli_parse.h"

#include <ostream>
#include <string>
#include <vector>

namespace agentrun {
namespace driver {

auto ParseCli(int argc, const char* const* argv, CliOptions& dst, std::ostream& err) -> bool {
  dst = CliOptions{};
  std::vector<std::string> args;
  detail::NormalizeArgv(argc, argv, args);

  for (int arg_index = 1; arg_index < argc; ++arg_index) {
    if (detail::RunHandlers(args, arg_index, argc, dst, err) == detail::OptResult::Error) {
      return false;
    }
    if (dst.show_help) {
      return true;
    }
  }

  if (dst.input.empty()) {
    err << "agentrun: error: no input file (use '-' for stdin)" << '\n';
    return false;
  }
  if (dst.verbose && dst.quiet) {
    err << "agentrun: error: --verbose and --quiet are mutually exclusive" << '\n';
    return false;
  }
  if (dst.check_only && dst.deps_only) {
    err << "agentrun: error: --check and --deps are mutually exclusive" << '\n';
    return false;
  }
  return true;
}

}  // namespace driver
}  // namespace agentrun
