/***
 * Name: agentrun::support::ReadStream
 * Purpose: Drain an input stream (a file or standard input) into a string.
 * Inputs:
 *   - input: stream to read until EOF
 * Outputs:
 *   - out: bytes read
 *   - err: error message when the stream fails before EOF
 */
// NOLINTNEXTLINE(misc-include-cleaner) - include interface to ensure signature stays in sync
#include "agentrun/support/fs.h"

#include <istream>
#include <iterator>
#include <string>

namespace agentrun {
namespace support {

bool ReadStream(std::istream& input, std::string& out, std::string& err) {
  out.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
  if (input.bad()) {
    err = "failed to read input";
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace agentrun
