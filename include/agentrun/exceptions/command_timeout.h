/***
 * Name: agentrun::exceptions::CommandTimeout
 * Purpose: Raised when an in-container command misses its wall-clock deadline.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type; the runner translates it to the literal
 *   result "Execution timed out." before it reaches a caller.
 */
#pragma once

#include <string>
#include <utility>

#include "agentrun/exceptions/agentrun_exception.h"

namespace agentrun {
namespace exceptions {

class CommandTimeout : public AgentrunException {
 public:
  explicit CommandTimeout(std::string msg) noexcept : AgentrunException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace agentrun
