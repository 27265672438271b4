/***
 * Name: agentrun::exceptions::AgentrunException
 * Purpose: Base class for all agentrun exceptions; do not throw built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites,
 *   but every throw in agentrun uses a custom type derived from this base.
 */
#pragma once

#include <exception>
#include <string>

namespace agentrun {
namespace exceptions {

class AgentrunException : public std::exception {
 public:
  virtual ~AgentrunException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit AgentrunException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace agentrun
