/***
 * Name: agentrun::support::ReadFile
 * Purpose: Read the full contents of a source file into a string.
 * Inputs:
 *   - path: filesystem path to read
 * Outputs:
 *   - out: populated with file contents on success
 *   - err: error message on failure
 * Theory of Operation: Opens in binary mode and defers to ReadStream.
 */
// NOLINTNEXTLINE(misc-include-cleaner) - include interface to ensure signature stays in sync
#include "agentrun/support/fs.h"

#include <fstream>
#include <ios>
#include <string>

namespace agentrun {
namespace support {

bool ReadFile(const std::string& path, std::string& out, std::string& err) {
  std::ifstream file_stream(path, std::ios::binary);
  if (!file_stream.good()) {
    err = "failed to open file: " + path;
    return false;
  }
  if (!ReadStream(file_stream, out, err)) {
    err += ": " + path;
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace agentrun
