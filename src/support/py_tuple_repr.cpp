/***
 * Name: agentrun::support::PyTupleRepr
 * Purpose: Render a tuple of strings as Python's repr() does.
 */
// NOLINTNEXTLINE(misc-include-cleaner) - include interface to ensure signature stays in sync
#include "agentrun/support/py_repr.h"

#include <string>
#include <vector>

namespace agentrun {
namespace support {

std::string PyTupleRepr(const std::vector<std::string>& items) {
  std::string out = "(";
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) { out += ", "; }
    out += PyStrRepr(items[i]);
  }
  // A one-element tuple keeps its trailing comma.
  if (items.size() == 1) { out += ','; }
  out += ')';
  return out;
}

}  // namespace support
}  // namespace agentrun
