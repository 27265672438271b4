/***
 * Name: agentrun::support::ParseDigitsStrict
 * Purpose: Parse a non-empty run of base-10 digits spanning the whole view.
 * Inputs: text view, out value, optional error string pointer
 * Outputs: value and status; err set on failure
 */
// NOLINTNEXTLINE(misc-include-cleaner) - include interface to ensure signature stays in sync
#include "agentrun/support/parse.h"

#include <cctype>
#include <limits>
#include <string>
#include <string_view>

namespace agentrun {
namespace support {

bool ParseDigitsStrict(std::string_view text, long long& value, std::string* err) {
  value = 0;
  constexpr long long kBase10 = 10;
  constexpr char kZeroChar = '0';
  std::string local_err;
  if (text.empty()) {
    local_err = "invalid integer literal";
  }
  for (const char digit_char : text) {
    if (!local_err.empty()) {
      break;
    }
    if (std::isdigit(static_cast<unsigned char>(digit_char)) == 0) {
      local_err = "invalid character in integer literal";
      break;
    }
    const long long digit = digit_char - kZeroChar;
    if (value > (std::numeric_limits<long long>::max() - digit) / kBase10) {
      local_err = "integer overflow";
      break;
    }
    value = (value * kBase10) + digit;
  }
  if (!local_err.empty()) {
    if (err != nullptr) {
      *err = local_err;
    }
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace agentrun
