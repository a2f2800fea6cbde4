#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace taptik {

struct TarEntry {
  std::string path;
  std::string data;
  bool is_directory = false;
  int64_t mtime = 0;  // seconds since epoch
  uint32_t mode = 0644;
};

// Minimal ustar writer for regular files and directories.
class TarWriter {
 public:
  void add_file(const std::string& path, std::string data, int64_t mtime);
  void add_directory(const std::string& path, int64_t mtime);

  // Entries in insertion order, then two zero blocks.
  std::string finish() const;

  size_t entry_count() const { return entries_.size(); }

 private:
  std::vector<TarEntry> entries_;
};

// Throws ValidationError on a malformed header.
std::vector<TarEntry> read_tar(const std::string& bytes);

// Packs every regular file and directory under `dir`, paths relative to it.
void create_tar(const std::filesystem::path& dir, const std::filesystem::path& archive);
void create_tar_gz(const std::filesystem::path& dir, const std::filesystem::path& archive);

// Refuses entries that would land outside `dest`. Restores mtimes.
size_t extract_tar_bytes(const std::string& bytes, const std::filesystem::path& dest);
size_t extract_tar(const std::filesystem::path& archive, const std::filesystem::path& dest);
size_t extract_tar_gz(const std::filesystem::path& archive, const std::filesystem::path& dest);

} // namespace taptik
