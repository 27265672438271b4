/***
 * Name: agentrun::support::ConsumeSign
 * Purpose: Consume a leading '+' or '-' and report negativity.
 * Inputs: text (by ref), is_negative (out)
 * Outputs: true if a sign was consumed
 */
// NOLINTNEXTLINE(misc-include-cleaner) - include interface to ensure signature stays in sync
#include "agentrun/support/parse.h"

#include <string_view>

namespace agentrun {
namespace support {

bool ConsumeSign(std::string_view& text, bool& is_negative) {
  is_negative = false;
  if (text.empty() || (text.front() != '+' && text.front() != '-')) {
    return false;
  }
  is_negative = text.front() == '-';
  text.remove_prefix(1);
  return true;
}

}  // namespace support
}  // namespace agentrun
