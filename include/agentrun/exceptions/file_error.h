/***
 * Name: agentrun::exceptions::FileError
 * Purpose: Exception for local filesystem failures while staging scripts.
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

class FileError : public AgentrunException {
 public:
  explicit FileError(std::string msg) noexcept : AgentrunException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace agentrun
