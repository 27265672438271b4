/***
 * Name: agentrun::runner::ParsePipFreeze
 * Purpose: Extract installed package names from pip's freeze listing.
 * Inputs:
 *   - output: lines such as "requests==2.31.0" or "pkg @ file:///src"
 * Outputs:
 *   - normalized names; comment and option lines ("#", "-e") are skipped
 */
#include "agentrun/runner/dependency_manager.h"

#include <set>
#include <sstream>
#include <string>
#include <string_view>

#include "agentrun/support/parse.h"

namespace agentrun {
namespace runner {

std::set<std::string> ParsePipFreeze(const std::string& output) {
  std::set<std::string> names;
  std::istringstream lines(output);
  std::string line;
  while (std::getline(lines, line)) {
    std::string_view view(line);
    support::TrimSpaces(view);
    if (view.empty() || view.front() == '#' || view.front() == '-') continue;
    const auto end = view.find_first_of("=@ ;[<>!~");
    const std::string name(view.substr(0, end));
    if (!name.empty()) names.insert(NormalizePackageName(name));
  }
  return names;
}

}  // namespace runner
}  // namespace agentrun
