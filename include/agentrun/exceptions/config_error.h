/***
 * Name: agentrun::exceptions::ConfigError
 * Purpose: Exception for runner construction failures (bad configuration,
 *   missing or stopped container, allow-list/cache mismatch).
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

class ConfigError : public AgentrunException {
 public:
  explicit ConfigError(std::string msg) noexcept : AgentrunException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace agentrun
