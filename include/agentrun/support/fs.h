/***
 * Name: agentrun::support (fs)
 * Purpose: Small file IO helpers for submissions and staged scripts.
 * Inputs: Paths, streams and string buffers
 * Outputs: File contents to/from disk; status plus error text
 * Theory of Operation: Thin wrappers over fstream/filesystem that report
 *   failures through an error string instead of throwing.
 */
#pragma once

#include <istream>
#include <string>

namespace agentrun {
namespace support {

/*** ReadFile: Read entire file into out. Return true on success. */
bool ReadFile(const std::string& path, std::string& out, std::string& err);

/*** ReadStream: Read an input stream to EOF into out. Return true on success. */
bool ReadStream(std::istream& input, std::string& out, std::string& err);

/*** WriteFile: Write entire string to path. Return true on success. */
bool WriteFile(const std::string& path, const std::string& data, std::string& err);

/*** RemoveFile: Delete path; a missing file counts as success. */
bool RemoveFile(const std::string& path, std::string& err);

}  // namespace support
}  // namespace agentrun
