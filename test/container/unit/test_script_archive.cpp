/***
 * Name: test_script_archive
 * Purpose: BuildScriptArchive produces a readable single-entry tar stream.
 */
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include <archive.h>
#include <archive_entry.h>
#include "agentrun/container/script_archive.h"

namespace {

struct Entry {
  std::string path;
  std::string data;
  int perm{0};
  bool regular{false};
};

struct ReaderDeleter {
  void operator()(archive* arc) const { (void)archive_read_free(arc); }
};

std::vector<Entry> readAll(const std::string& bytes) {
  std::vector<Entry> entries;
  const std::unique_ptr<archive, ReaderDeleter> in(archive_read_new());
  EXPECT_EQ(archive_read_support_format_tar(in.get()), ARCHIVE_OK);
  EXPECT_EQ(archive_read_open_memory(in.get(), bytes.data(), bytes.size()), ARCHIVE_OK);
  archive_entry* header = nullptr;
  while (archive_read_next_header(in.get(), &header) == ARCHIVE_OK) {
    Entry entry;
    entry.path = archive_entry_pathname(header);
    entry.perm = static_cast<int>(archive_entry_perm(header));
    entry.regular = archive_entry_filetype(header) == AE_IFREG;
    char buf[256];
    la_ssize_t got = 0;
    while ((got = archive_read_data(in.get(), buf, sizeof(buf))) > 0) {
      entry.data.append(buf, static_cast<size_t>(got));
    }
    entries.push_back(entry);
  }
  return entries;
}

}  // namespace

TEST(ScriptArchive, SingleRegularFile) {
  const std::string body = "print('Hello, World!')\n";
  const std::string bytes = agentrun::container::BuildScriptArchive("script_abc.py", body);
  // ustar pads to 512-byte records.
  EXPECT_EQ(bytes.size() % 512, 0u);
  const auto entries = readAll(bytes);
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0].path, "script_abc.py");
  EXPECT_EQ(entries[0].data, body);
  EXPECT_EQ(entries[0].perm, 0644);
  EXPECT_TRUE(entries[0].regular);
}

TEST(ScriptArchive, EmptyAndBinaryContents) {
  const auto empty = readAll(agentrun::container::BuildScriptArchive("empty.py", ""));
  ASSERT_EQ(empty.size(), 1u);
  EXPECT_TRUE(empty[0].data.empty());

  std::string binary(2000, '\0');
  for (size_t i = 0; i < binary.size(); ++i) binary[i] = static_cast<char>(i % 251);
  const auto entries = readAll(agentrun::container::BuildScriptArchive("blob.py", binary));
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0].data, binary);
}
