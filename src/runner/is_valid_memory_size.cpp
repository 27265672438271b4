/***
 * Name: agentrun::runner::IsValidMemorySize
 * Purpose: Accept the size syntax docker understands for --memory.
 * Inputs:
 *   - text: e.g. "100m", "1G", "1048576"
 * Outputs:
 *   - true when text is one or more digits with an optional unit letter
 */
#include "agentrun/runner/runner_config.h"

#include <cctype>
#include <string>

namespace agentrun {
namespace runner {

bool IsValidMemorySize(const std::string& text) {
  size_t idx = 0;
  while (idx < text.size() && std::isdigit(static_cast<unsigned char>(text[idx])) != 0) {
    ++idx;
  }
  if (idx == 0) return false;
  if (idx == text.size()) return true;
  if (idx + 1 != text.size()) return false;
  const auto unit = static_cast<char>(std::tolower(static_cast<unsigned char>(text[idx])));
  return unit == 'b' || unit == 'k' || unit == 'm' || unit == 'g';
}

}  // namespace runner
}  // namespace agentrun
