/***
 * Name: agentrun::support::TrimSpaces
 * Purpose: Remove leading and trailing ASCII whitespace from a string view.
 */
// NOLINTNEXTLINE(misc-include-cleaner) - include interface to ensure signature stays in sync
#include "agentrun/support/parse.h"

#include <cctype>
#include <string_view>

namespace agentrun {
namespace support {

void TrimSpaces(std::string_view& text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
}

}  // namespace support
}  // namespace agentrun
