/***
 * Name: agentrun::runner::CommandExecutor
 * Purpose: Run one shell command in the container under a wall-clock timeout.
 * Inputs: Container handle, command, timeout in seconds, working directory
 * Outputs: CommandResult{exit_code, output}; CommandTimeout when late
 * Theory of Operation:
 *   The command runs on a detached worker thread that owns its own copy of
 *   everything it touches and reports through a promise. The caller waits for
 *   the timeout; if the worker has not reported by then it waits one grace
 *   second more and raises CommandTimeout either way. The in-container process is not killed
 *   here; the worker finishes whenever the command does.
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "agentrun/container/container_runtime.h"

namespace agentrun {
namespace runner {

struct CommandResult {
  int exit_code{-1};
  std::string output;
};

class CommandExecutor {
 public:
  static constexpr std::chrono::seconds kGracePeriod{1};

  CommandExecutor(std::shared_ptr<container::ContainerRuntime> runtime, std::string workdir);

  [[nodiscard]] CommandResult run(const container::ContainerHandle& handle, const std::string& command,
                                  std::chrono::milliseconds timeout) const;

  [[nodiscard]] const std::string& workdir() const { return workdir_; }

 private:
  std::shared_ptr<container::ContainerRuntime> runtime_;
  std::string workdir_;
};

}  // namespace runner
}  // namespace agentrun
