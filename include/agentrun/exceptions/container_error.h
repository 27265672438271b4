/***
 * Name: agentrun::exceptions::ContainerError
 * Purpose: Exception for container runtime failures (daemon unreachable,
 *   client binary missing, malformed responses).
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from AgentrunException.
 */
#pragma once

#include <string>
#include <utility>

#include "agentrun/exceptions/agentrun_exception.h"

namespace agentrun {
namespace exceptions {

class ContainerError : public AgentrunException {
 public:
  explicit ContainerError(std::string msg) noexcept : AgentrunException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace agentrun
