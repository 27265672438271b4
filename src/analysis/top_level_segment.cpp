/***
 * Name: agentrun::analysis::TopLevelSegment
 * Purpose: Return the first segment of a dotted module path.
 * Inputs:
 *   - dotted: module path such as "os.path"
 * Outputs:
 *   - text before the first '.', or the whole input when there is none
 */
// NOLINTNEXTLINE(misc-include-cleaner) - include interface to ensure signature stays in sync
#include "agentrun/analysis/module_names.h"

#include <string>

namespace agentrun {
namespace analysis {

std::string TopLevelSegment(const std::string& dotted) {
  const auto dot = dotted.find('.');
  return dot == std::string::npos ? dotted : dotted.substr(0, dot);
}

}  // namespace analysis
}  // namespace agentrun
