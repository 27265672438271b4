/***
 * Name: agentrun::container::BuildScriptArchive
 * Purpose: Package one script as an in-memory tar stream for putArchive.
 * Inputs: Entry file name and file contents
 * Outputs: POSIX ustar archive bytes holding a single 0644 regular file
 * Theory of Operation: libarchive writes through a callback that appends to a
 *   std::string. Any libarchive failure raises exceptions::ContainerError.
 */
#pragma once

#include <string>

namespace agentrun {
namespace container {

std::string BuildScriptArchive(const std::string& filename, const std::string& contents);

}  // namespace container
}  // namespace agentrun
