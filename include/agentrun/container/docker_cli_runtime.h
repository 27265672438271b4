/***
 * Name: agentrun::container::DockerCliRuntime
 * Purpose: ContainerRuntime backed by the docker command-line client.
 * Inputs: Path of the docker executable (default "docker")
 * Outputs: See ContainerRuntime
 * Theory of Operation: Every operation is one docker invocation through
 *   support::RunProcess. A docker binary that cannot be spawned or a daemon
 *   that cannot be reached raises exceptions::ContainerError.
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "agentrun/container/container_runtime.h"
#include "agentrun/support/process.h"

namespace agentrun {
namespace container {

class DockerCliRuntime : public ContainerRuntime {
 public:
  explicit DockerCliRuntime(std::string docker = "docker");

  std::optional<ContainerHandle> findByName(const std::string& name) override;
  ContainerState status(const ContainerHandle& handle) override;
  void updateLimits(const ContainerHandle& handle, const ResourceLimits& limits) override;
  ExecOutput exec(const ContainerHandle& handle, const std::string& command, const std::string& workdir) override;
  bool putArchive(const ContainerHandle& handle, const std::string& path, const std::string& tar_bytes) override;

 private:
  support::ProcessResult docker(std::vector<std::string> args, const std::string& stdin_data = {}) const;

  std::string docker_;
};

}  // namespace container
}  // namespace agentrun
