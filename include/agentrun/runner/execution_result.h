/***
 * Name: agentrun::runner (execution results)
 * Purpose: Typed outcome of one submission.
 * Inputs: Produced by Runner and DependencyManager
 * Outputs: ExecutionResult{kind, text}; Execution adds a cleanup signal
 * Theory of Operation: Callers that match on text use ExecutionResult::text,
 *   which carries the same strings for every kind; the kind lets typed callers
 *   branch without string comparison.
 */
#pragma once

#include <future>
#include <string>

namespace agentrun {
namespace runner {

enum class ErrorKind {
  None,                    // program ran; text is its output
  InputRejected,           // failed the safety gate, nothing executed
  PolicyRejected,          // dependency outside the whitelist
  InfrastructureNotFound,  // container missing
  ExecutionFailed,         // upload, install, timeout or runtime failure
};

const char* ToString(ErrorKind kind);

struct ExecutionResult {
  ErrorKind kind{ErrorKind::None};
  std::string text;

  [[nodiscard]] bool ok() const { return kind == ErrorKind::None; }
};

struct Execution {
  ExecutionResult result;
  // Ready once cleanup for this submission has finished; always valid.
  std::shared_future<void> cleanup;
};

}  // namespace runner
}  // namespace agentrun
