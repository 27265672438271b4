/***
 * Name: agentrun::support::RemoveFile
 * Purpose: Delete a staged file.
 * Inputs:
 *   - path: file to remove
 * Outputs:
 *   - err: error message on failure
 * Theory of Operation: std::filesystem::remove with an error_code; removing a
 *   path that no longer exists is not an error.
 */
// NOLINTNEXTLINE(misc-include-cleaner) - include interface to ensure signature stays in sync
#include "agentrun/support/fs.h"

#include <filesystem>
#include <string>
#include <system_error>

namespace agentrun {
namespace support {

bool RemoveFile(const std::string& path, std::string& err) {
  std::error_code ec;
  (void)std::filesystem::remove(path, ec);
  if (ec) {
    err = "failed to remove file: " + path + " (" + ec.message() + ")";
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace agentrun
