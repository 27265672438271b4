/***
 * Name: agentrun::support::WriteFile
 * Purpose: Replace a file's contents with a string.
 * Theory of Operation: Writes "<path>.part" next to the target and renames it
 *   over path, so readers see either the old file or the whole new one.
 */
#include "agentrun/support/fs.h"

#include <filesystem>
#include <fstream>
#include <ios>
#include <string>
#include <system_error>

namespace agentrun {
namespace support {

bool WriteFile(const std::string& path, const std::string& data, std::string& err) {
  const std::string partial = path + ".part";
  {
    std::ofstream out(partial, std::ios::binary | std::ios::trunc);
    if (!out) {
      err = "failed to open file for write: " + path;
      return false;
    }
    out << data;
    out.close();
    if (out.fail()) {
      err = "failed to write file: " + path;
      std::error_code ignored;
      std::filesystem::remove(partial, ignored);
      return false;
    }
  }
  std::error_code ec;
  std::filesystem::rename(partial, path, ec);
  if (ec) {
    err = "failed to write file: " + path + ": " + ec.message();
    std::filesystem::remove(partial, ec);
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace agentrun
