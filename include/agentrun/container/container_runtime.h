/***
 * Name: agentrun::container::ContainerRuntime
 * Purpose: Capability boundary to an externally provisioned container.
 * Inputs: Container names, handles, commands and archives
 * Outputs: Handles, states, command exit codes and output
 * Theory of Operation:
 *   The runner depends only on these five operations, so any platform that
 *   provides them (the docker CLI, a test double) can back it. Implementations
 *   are called from several threads at once (executor workers, cleanup) and
 *   must tolerate concurrent calls. Infrastructure failures throw
 *   exceptions::ContainerError; ordinary command failures are exit codes.
 */
#pragma once

#include <optional>
#include <string>

namespace agentrun {
namespace container {

enum class ContainerState { Created, Running, Paused, Restarting, Removing, Exited, Dead, Unknown };

/*** ParseContainerState: Docker status word to state; unrecognized text is Unknown. */
ContainerState ParseContainerState(const std::string& text);

const char* ToString(ContainerState state);

struct ContainerHandle {
  std::string id;
  std::string name;
  ContainerState state{ContainerState::Unknown};
};

struct ResourceLimits {
  long long cpu_quota{0};  // microseconds per 100ms period
  std::string memory;      // e.g. "100m"
  std::string memswap;     // memory + swap, e.g. "512m"
};

struct ExecOutput {
  int exit_code{-1};
  std::string output;  // stdout and stderr, never null
};

class ContainerRuntime {
 public:
  virtual ~ContainerRuntime() = default;

  virtual std::optional<ContainerHandle> findByName(const std::string& name) = 0;
  virtual ContainerState status(const ContainerHandle& handle) = 0;
  virtual void updateLimits(const ContainerHandle& handle, const ResourceLimits& limits) = 0;
  virtual ExecOutput exec(const ContainerHandle& handle, const std::string& command, const std::string& workdir) = 0;

  /*** putArchive: extract a tar stream under path inside the container. */
  virtual bool putArchive(const ContainerHandle& handle, const std::string& path, const std::string& tar_bytes) = 0;
};

}  // namespace container
}  // namespace agentrun
