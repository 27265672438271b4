/***
 * Name: agentrun::runner::NormalizePackageName
 * Purpose: Canonical package name for inventory comparisons.
 * Inputs:
 *   - name: distribution or import name, UTF-8
 * Outputs:
 *   - case-folded name with every run of '-', '_' and '.' replaced by one '-'
 * Theory of Operation: ICU full case folding, then a single pass collapsing
 *   separator runs.
 */
#include "agentrun/runner/dependency_manager.h"

#include <string>

#include <unicode/unistr.h>

namespace agentrun {
namespace runner {

std::string NormalizePackageName(const std::string& name) {
  std::string folded;
  icu::UnicodeString::fromUTF8(name).foldCase().toUTF8String(folded);
  std::string out;
  out.reserve(folded.size());
  bool inSeparator = false;
  for (const char chr : folded) {
    if (chr == '-' || chr == '_' || chr == '.') {
      if (!inSeparator) out += '-';
      inSeparator = true;
      continue;
    }
    inSeparator = false;
    out += chr;
  }
  return out;
}

}  // namespace runner
}  // namespace agentrun
