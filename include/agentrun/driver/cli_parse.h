/***
 * Name: agentrun::driver (cli_parse helpers)
 * Purpose: Declarations for small, single-purpose CLI option handlers used by ParseCli.
 * Inputs: Argument string(s), index into args, CLI options destination, error stream
 * Outputs: detail::OptResult (NotMatched, Handled, Error)
 * Theory of Operation: Each function recognizes one category of options, mutates state,
 *   and advances the index where necessary, keeping ParseCli simple and low complexity.
 */
#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "agentrun/driver/cli.h"

namespace agentrun {
namespace driver {
namespace detail {

/*** HandleMetricsArg: Parse --metrics and --metrics=.. variants. */
OptResult HandleMetricsArg(const std::string& arg, CliOptions& dst, std::ostream& err);

/*** HandleValueArg: Handle --opt <val> or --opt=<val> and store the value. */
struct ValueParams {
  const std::string& long_opt;
  const std::vector<std::string>& args;
  int& index;
  int argc;
  std::optional<std::string>& out;
  std::ostream& err;
};

OptResult HandleValueArg(const std::string& arg, const ValueParams& p);

/*** HandleSwitch: Handle booleans --check, --deps, --verbose and --quiet. */
OptResult HandleSwitch(const std::string& arg, CliOptions& dst);

/*** HandleEndOfOptions: Handle "--" and take the remaining argument as input. */
OptResult HandleEndOfOptions(const std::vector<std::string>& args, int& index, int argc, CliOptions& dst,
                             std::ostream& err);

/*** HandleUnknownOrPositional: Error on unknown '-' options; otherwise record input. */
OptResult HandleUnknownOrPositional(const std::string& arg, CliOptions& dst, std::ostream& err);

/*** HandleHelpArg: Recognize -h/--help and set flag. */
OptResult HandleHelpArg(const std::string& arg, CliOptions& dst);

/*** NormalizeArgv: Convert argv into vector<string> with null safety. */
void NormalizeArgv(int argc, const char* const* argv, std::vector<std::string>& out);

/*** RunHandlers: Execute ordered handlers for current arg index. */
OptResult RunHandlers(const std::vector<std::string>& args, int& index, int argc, CliOptions& dst, std::ostream& err);

}  // namespace detail
}  // namespace driver
}  // namespace agentrun
