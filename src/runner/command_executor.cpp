/***
 * Name: agentrun::runner::CommandExecutor (impl)
 * Purpose: Detached-worker command execution with a bounded wait.
 */
#include "agentrun/runner/command_executor.h"

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <utility>

#include "agentrun/exceptions/command_timeout.h"
#include "agentrun/log/logger.h"

namespace agentrun {
namespace runner {

CommandExecutor::CommandExecutor(std::shared_ptr<container::ContainerRuntime> runtime, std::string workdir)
    : runtime_(std::move(runtime)), workdir_(std::move(workdir)) {}

CommandResult CommandExecutor::run(const container::ContainerHandle& handle, const std::string& command,
                                   const std::chrono::milliseconds timeout) const {
  std::promise<CommandResult> promise;
  auto result = promise.get_future();
  // The worker may outlive this call, so it captures copies only.
  std::thread worker([runtime = runtime_, handle, command, workdir = workdir_, promise = std::move(promise)]() mutable {
    try {
      auto out = runtime->exec(handle, command, workdir);
      promise.set_value(CommandResult{out.exit_code, std::move(out.output)});
    } catch (const std::exception&) {
      promise.set_exception(std::current_exception());
    }
  });
  worker.detach();

  if (result.wait_for(timeout) != std::future_status::ready) {
    // A late finish inside the grace second still counts as a timeout.
    (void)result.wait_for(kGracePeriod);
    log::Logger()->debug("command timed out after {} ms: {}", timeout.count(), command);
    throw exceptions::CommandTimeout("Command timed out");
  }
  return result.get();
}

}  // namespace runner
}  // namespace agentrun
