/***
 * Name: agentrun::support::ParseIntStrict
 * Purpose: Parse a base-10 integer without throwing; fail on extra tokens.
 * Inputs:
 *   - text: string view of the literal
 * Outputs:
 *   - out_val: parsed integer on success
 *   - err: optional error message on failure
 */
// NOLINTNEXTLINE(misc-include-cleaner) - include interface to ensure signature stays in sync
#include "agentrun/support/parse.h"

#include <string>
#include <string_view>

namespace agentrun {
namespace support {

bool ParseIntStrict(std::string_view text, long long& out_val, std::string* err) {
  TrimSpaces(text);
  bool is_negative = false;
  (void)ConsumeSign(text, is_negative);
  long long value = 0;
  if (!ParseDigitsStrict(text, value, err)) {
    return false;
  }
  out_val = is_negative ? -value : value;
  return true;
}

}  // namespace support
}  // namespace agentrun
