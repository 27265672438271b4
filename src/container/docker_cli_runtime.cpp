/***
 * Name: agentrun::container::DockerCliRuntime (impl)
 * Purpose: Map the container capability onto docker CLI commands.
 */
#include "agentrun/container/docker_cli_runtime.h"

#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "agentrun/exceptions/container_error.h"
#include "agentrun/log/logger.h"
#include "agentrun/support/process.h"

namespace agentrun {
namespace container {

namespace {

constexpr int kCommandNotFound = 127;

std::string firstLine(const std::string& text) {
  const auto end = text.find('\n');
  return end == std::string::npos ? text : text.substr(0, end);
}

bool isMissingObject(const std::string& output) {
  return output.find("No such container") != std::string::npos ||
         output.find("No such object") != std::string::npos;
}

}  // namespace

DockerCliRuntime::DockerCliRuntime(std::string docker) : docker_(std::move(docker)) {}

support::ProcessResult DockerCliRuntime::docker(std::vector<std::string> args, const std::string& stdin_data) const {
  args.insert(args.begin(), docker_);
  log::Logger()->trace("docker {}", args.size() > 1 ? args[1] : std::string{});
  support::ProcessResult result;
  std::string err;
  if (!support::RunProcess(std::move(args), stdin_data, result, err)) {
    throw exceptions::ContainerError("failed to run " + docker_ + ": " + err);
  }
  if (result.exit_code == kCommandNotFound && result.output.empty()) {
    throw exceptions::ContainerError("docker executable not found: " + docker_);
  }
  return result;
}

std::optional<ContainerHandle> DockerCliRuntime::findByName(const std::string& name) {
  const auto result =
      docker({"inspect", "--type", "container", "--format", "{{.Id}} {{.State.Status}}", name});
  if (result.exit_code != 0) {
    if (isMissingObject(result.output)) {
      return std::nullopt;
    }
    throw exceptions::ContainerError("docker inspect failed: " + firstLine(result.output));
  }
  std::istringstream fields(result.output);
  ContainerHandle handle;
  std::string state;
  fields >> handle.id >> state;
  if (handle.id.empty()) {
    throw exceptions::ContainerError("unexpected docker inspect output for " + name);
  }
  handle.name = name;
  handle.state = ParseContainerState(state);
  return handle;
}

ContainerState DockerCliRuntime::status(const ContainerHandle& handle) {
  const auto result = docker({"inspect", "--type", "container", "--format", "{{.State.Status}}", handle.id});
  if (result.exit_code != 0) {
    if (isMissingObject(result.output)) {
      return ContainerState::Unknown;
    }
    throw exceptions::ContainerError("docker inspect failed: " + firstLine(result.output));
  }
  return ParseContainerState(firstLine(result.output));
}

void DockerCliRuntime::updateLimits(const ContainerHandle& handle, const ResourceLimits& limits) {
  const auto result = docker({"update", "--cpu-quota", std::to_string(limits.cpu_quota), "--memory", limits.memory,
                              "--memory-swap", limits.memswap, handle.id});
  if (result.exit_code != 0) {
    throw exceptions::ContainerError("docker update failed: " + firstLine(result.output));
  }
}

ExecOutput DockerCliRuntime::exec(const ContainerHandle& handle, const std::string& command,
                                  const std::string& workdir) {
  auto result = docker({"exec", "--workdir", workdir, handle.id, "sh", "-c", command});
  return ExecOutput{result.exit_code, std::move(result.output)};
}

bool DockerCliRuntime::putArchive(const ContainerHandle& handle, const std::string& path,
                                  const std::string& tar_bytes) {
  const auto result = docker({"cp", "-", handle.id + ":" + path}, tar_bytes);
  if (result.exit_code != 0) {
    log::Logger()->warn("docker cp into {}:{} failed: {}", handle.name, path, firstLine(result.output));
    return false;
  }
  return true;
}

}  // namespace container
}  // namespace agentrun
