/***
 * Name: agentrun::exceptions::AgentrunException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "agentrun/exceptions/agentrun_exception.h"

namespace agentrun::exceptions {

const char* AgentrunException::what() const noexcept { return message_.c_str(); }

}  // namespace agentrun::exceptions
