/***
 * Name: agentrun::driver (cli)
 * Purpose: Declarations for CLI options, parsing, and usage printing.
 * Inputs: N/A (declarations only)
 * Outputs: Types and functions for CLI handling.
 * Theory of Operation: One positional input (a file or "-" for stdin) plus
 *   options that override the environment-derived RunnerConfig. Definitions
 *   live in one small .cpp file each.
 */
#pragma once

#include <iosfwd>
#include <optional>
#include <string>

namespace agentrun {
namespace driver {

/***
 * Name: agentrun::driver::CliOptions
 * Purpose: Hold parsed command-line options for an agentrun invocation.
 * Inputs: Values are populated by ParseCli.
 * Outputs: Consumed by RunCli.
 * Theory of Operation: Runner settings stay as raw text until BuildConfig so
 *   that numeric errors are reported together with configuration errors.
 */
struct CliOptions {
  std::string input;                 // source file, or "-" for stdin
  bool show_help = false;            // -h, --help
  bool check_only = false;           // --check
  bool deps_only = false;            // --deps
  bool verbose = false;              // --verbose
  bool quiet = false;                // --quiet
  bool metrics = false;              // --metrics
  enum class MetricsFormat { Text, Json };
  MetricsFormat metrics_format = MetricsFormat::Text;  // --metrics[=json|text]
  std::string docker = "docker";     // --docker <path>
  std::optional<std::string> container;  // --container <name>
  std::optional<std::string> whitelist;  // --whitelist <list>
  std::optional<std::string> cached;     // --cached <list>
  std::optional<std::string> cpu_quota;  // --cpu-quota <us>
  std::optional<std::string> memory;     // --memory <size>
  std::optional<std::string> memswap;    // --memswap <size>
  std::optional<std::string> timeout;    // --timeout <s>
};

namespace detail {
enum class OptResult { NotMatched, Handled, Error };
}

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
 * Theory of Operation: Iterates arguments left-to-right through the handler
 *   table; exactly one input is required unless help was requested.
 */
bool ParseCli(int argc, const char* const* argv, CliOptions& dst, std::ostream& err);

/***
 * Name: agentrun::driver::PrintUsage
 * Purpose: Print CLI usage information.
 * Inputs:
 *   - out: Destination stream
 *   - argv0: Program name used in usage examples
 * Outputs: None
 */
void PrintUsage(std::ostream& out, const char* argv0);

}  // namespace driver
}  // namespace agentrun
