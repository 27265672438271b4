/***
 * Name: agentrun::support::PyStrRepr
 * Purpose: Quote and escape a string the way Python's repr() of a str does.
 */
// NOLINTNEXTLINE(misc-include-cleaner) - include interface to ensure signature stays in sync
#include "agentrun/support/py_repr.h"

#include <array>
#include <string>

namespace agentrun {
namespace support {

std::string PyStrRepr(const std::string& text) {
  const bool hasSingle = text.find('\'') != std::string::npos;
  const bool hasDouble = text.find('"') != std::string::npos;
  const char quote = (hasSingle && !hasDouble) ? '"' : '\'';
  static constexpr std::array<char, 16> kHex{'0', '1', '2', '3', '4', '5', '6', '7',
                                             '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  std::string out;
  out.reserve(text.size() + 2);
  out += quote;
  for (const char chr : text) {
    const auto byte = static_cast<unsigned char>(chr);
    if (chr == '\\' || chr == quote) {
      out += '\\';
      out += chr;
    } else if (chr == '\n') {
      out += "\\n";
    } else if (chr == '\r') {
      out += "\\r";
    } else if (chr == '\t') {
      out += "\\t";
    } else if (byte < 0x20U || byte == 0x7fU) {
      out += "\\x";
      out += kHex[byte >> 4U];
      out += kHex[byte & 0x0fU];
    } else {
      out += chr;
    }
  }
  out += quote;
  return out;
}

}  // namespace support
}  // namespace agentrun
