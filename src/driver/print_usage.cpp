/***
 * Name: agentrun::driver::PrintUsage
 * Purpose: Print CLI usage information for agentrun.
 * Inputs:
 *   - out: Destination stream
 *   - argv0: Program name used in usage examples
 * Outputs: None
 */
#include "agentrun/driver/cli.h"

#include <cstring>
#include <ostream>
#include <string_view>

namespace agentrun {
namespace driver {

static std::string_view Basename(const char* path) {
  if (path == nullptr || *path == '\0') {
    return std::string_view{"agentrun"};
  }
  const char* last_slash = std::strrchr(path, '/');
  return std::string_view(last_slash != nullptr ? last_slash + 1 : path);
}

auto PrintUsage(std::ostream& out, const char* argv0) -> void {
  const std::string_view program_name = Basename(argv0);
  out << "Usage: " << program_name << " [options] <file.py | ->" << '\n'
      << '\n'
      << "Run untrusted Python code inside an already running container." << '\n'
      << '\n'
      << "Options:" << '\n'
      << "  -h, --help              Print this help and exit" << '\n'
      << "  --container <name>      Target container (env AGENTRUN_CONTAINER_NAME)" << '\n'
      << "  --whitelist <list>      Allowed packages, '*' for all (env AGENTRUN_WHITELIST)" << '\n'
      << "  --cached <list>         Packages kept installed between runs (env AGENTRUN_CACHED_DEPENDENCIES)" << '\n'
      << "  --cpu-quota <us>        CPU quota in microseconds (default: 50000)" << '\n'
      << "  --memory <size>         Memory limit (default: 100m)" << '\n'
      << "  --memswap <size>        Memory + swap limit (default: 512m)" << '\n'
      << "  --timeout <s>           Execution timeout in seconds (default: 20)" << '\n'
      << "  --docker <path>         docker executable (default: docker)" << '\n'
      << "  --check                 Only run the safety check; exit 1 if unsafe" << '\n'
      << "  --deps                  Only print the resolved third-party dependencies" << '\n'
      << "  --metrics[=json|text]   Print stage timings and counters (default: text)" << '\n'
      << "  -v, --verbose           Debug logging" << '\n'
      << "  -q, --quiet             Errors only" << '\n'
      << "  --                      End of options" << '\n'
      << '\n'
      << "Lists accept either a,b,c or [\"a\", \"b\"]." << '\n';
}

}  // namespace driver
}  // namespace agentrun
