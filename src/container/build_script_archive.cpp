/***
 * Name: agentrun::container::BuildScriptArchive
 * Purpose: Build a single-entry ustar archive in memory.
 * Inputs:
 *   - filename: entry path inside the archive
 *   - contents: file bytes
 * Outputs:
 *   - archive bytes
 */
#include "agentrun/container/script_archive.h"

#include <ctime>
#include <memory>
#include <string>

#include <archive.h>
#include <archive_entry.h>

#include "agentrun/exceptions/container_error.h"

namespace agentrun {
namespace container {

namespace {

constexpr int kFileMode = 0644;

struct ArchiveDeleter {
  void operator()(archive* arc) const { (void)archive_write_free(arc); }
};
struct EntryDeleter {
  void operator()(archive_entry* entry) const { archive_entry_free(entry); }
};

la_ssize_t appendToString(archive* /*arc*/, void* client_data, const void* buffer, size_t length) {
  static_cast<std::string*>(client_data)->append(static_cast<const char*>(buffer), length);
  return static_cast<la_ssize_t>(length);
}

[[noreturn]] void fail(const char* what, archive* arc) {
  const char* detail = archive_error_string(arc);
  throw exceptions::ContainerError(std::string(what) + " - " + (detail != nullptr ? detail : "unknown error"));
}

}  // namespace

std::string BuildScriptArchive(const std::string& filename, const std::string& contents) {
  std::string bytes;
  const std::unique_ptr<archive, ArchiveDeleter> out(archive_write_new());
  if (!out) {
    throw exceptions::ContainerError("archive_write_new() failed");
  }
  if (archive_write_set_format_ustar(out.get()) != ARCHIVE_OK) fail("archive_write_set_format_ustar()", out.get());
  if (archive_write_open(out.get(), &bytes, nullptr, appendToString, nullptr) != ARCHIVE_OK) {
    fail("archive_write_open()", out.get());
  }

  const std::unique_ptr<archive_entry, EntryDeleter> entry(archive_entry_new());
  archive_entry_set_pathname(entry.get(), filename.c_str());
  archive_entry_set_filetype(entry.get(), AE_IFREG);
  archive_entry_set_perm(entry.get(), kFileMode);
  archive_entry_set_size(entry.get(), static_cast<la_int64_t>(contents.size()));
  archive_entry_set_mtime(entry.get(), std::time(nullptr), 0);
  if (archive_write_header(out.get(), entry.get()) != ARCHIVE_OK) fail("archive_write_header()", out.get());
  if (!contents.empty() &&
      archive_write_data(out.get(), contents.data(), contents.size()) != static_cast<la_ssize_t>(contents.size())) {
    fail("archive_write_data()", out.get());
  }
  if (archive_write_finish_entry(out.get()) != ARCHIVE_OK) fail("archive_write_finish_entry()", out.get());
  if (archive_write_close(out.get()) != ARCHIVE_OK) fail("archive_write_close()", out.get());
  return bytes;
}

}  // namespace container
}  // namespace agentrun
