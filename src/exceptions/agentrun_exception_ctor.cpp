/***
 * Name: agentrun::exceptions::AgentrunException::AgentrunException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "agentrun/exceptions/agentrun_exception.h"

#include <utility>

namespace agentrun {
namespace exceptions {

AgentrunException::AgentrunException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace agentrun
