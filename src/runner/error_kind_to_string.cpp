/***
 * Name: agentrun::runner::ToString(ErrorKind)
 * Purpose: Stable lower-case names for logs and metrics.
 */
#include "agentrun/runner/execution_result.h"

namespace agentrun {
namespace runner {

const char* ToString(const ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None: return "none";
    case ErrorKind::InputRejected: return "input_rejected";
    case ErrorKind::PolicyRejected: return "policy_rejected";
    case ErrorKind::InfrastructureNotFound: return "infrastructure_not_found";
    case ErrorKind::ExecutionFailed: return "execution_failed";
  }
  return "unknown";
}

}  // namespace runner
}  // namespace agentrun
