/***
 * Name: agentrun::support (process helpers)
 * Purpose: Run a child process with captured output for the container client.
 * Inputs: argv strings, optional stdin payload
 * Outputs: Exit code and merged stdout+stderr text; success flag with error text
 * Theory of Operation: POSIX fork/execvp. The child's stdout and stderr share
 *   one pipe; the parent feeds stdin and drains output with poll() so neither
 *   side can block the other. All pipe ends are close-on-exec so concurrent
 *   spawns from other threads never inherit them.
 */
#pragma once

#include <string>
#include <vector>

namespace agentrun {
namespace support {

struct ProcessResult {
  int exit_code{-1};
  std::string output;
};

/*** RunProcess: fork/execvp, feed stdin_data, capture output, wait.
 *   Returns false (with err) only when the process could not be run at all;
 *   a non-zero exit is reported through result.exit_code. An exec failure in
 *   the child surfaces as exit code 127. */
bool RunProcess(std::vector<std::string> args, const std::string& stdin_data, ProcessResult& result,
                std::string& err);

}  // namespace support
}  // namespace agentrun
