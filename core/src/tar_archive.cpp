#include "taptik/tar_archive.h"

#include "taptik/compression.h"
#include "taptik/errors.h"
#include "taptik/log.h"
#include "taptik/serialization.h"

#include <algorithm>
#include <cstdio>
#include <cstring>

namespace taptik {
namespace fs = std::filesystem;

namespace {
constexpr size_t kBlockSize = 512;
constexpr size_t kNameSize = 100;
constexpr size_t kPrefixSize = 155;

std::string normalize_tar_path(std::string path, bool is_dir) {
  while (!path.empty() && path.front() == '/') path.erase(path.begin());
  while (path.size() > 1 && path.back() == '/') path.pop_back();
  if (is_dir && !path.empty()) path += '/';
  return path;
}

bool split_path(const std::string& path, std::string& name, std::string& prefix) {
  if (path.size() <= kNameSize) {
    name = path;
    prefix.clear();
    return true;
  }
  for (size_t i = std::min(kPrefixSize, path.size() - 1); i > 0; --i) {
    if (path[i] != '/') continue;
    if (path.size() - i - 1 <= kNameSize) {
      prefix = path.substr(0, i);
      name = path.substr(i + 1);
      return true;
    }
  }
  return false;
}

void write_octal(char* dest, size_t size, uint64_t value) {
  char buf[24];
  std::snprintf(buf, sizeof(buf), "%0*llo", static_cast<int>(size - 1), static_cast<unsigned long long>(value));
  std::memcpy(dest, buf, size - 1);
  dest[size - 1] = '\0';
}

uint64_t read_octal(const char* src, size_t size) {
  uint64_t value = 0;
  for (size_t i = 0; i < size; ++i) {
    const char c = src[i];
    if (c == '\0' || c == ' ') {
      if (value != 0) break;
      continue;
    }
    if (c < '0' || c > '7') {
      throw ValidationError("Invalid tar header: bad octal field");
    }
    value = value * 8 + static_cast<uint64_t>(c - '0');
  }
  return value;
}

uint32_t header_checksum(const char* header) {
  uint32_t sum = 0;
  for (size_t i = 0; i < kBlockSize; ++i) {
    sum += (i >= 148 && i < 156) ? static_cast<uint32_t>(' ') : static_cast<unsigned char>(header[i]);
  }
  return sum;
}

std::string make_header(const TarEntry& entry) {
  std::string header(kBlockSize, '\0');
  const std::string tar_path = normalize_tar_path(entry.path, entry.is_directory);
  std::string name;
  std::string prefix;
  if (!split_path(tar_path, name, prefix)) {
    throw ValidationError("Path too long for ustar format: " + tar_path);
  }
  char* h = header.data();
  std::memcpy(h, name.data(), std::min(name.size(), kNameSize));
  write_octal(h + 100, 8, entry.is_directory ? 0755 : entry.mode);
  write_octal(h + 108, 8, 0);
  write_octal(h + 116, 8, 0);
  write_octal(h + 124, 12, entry.is_directory ? 0 : entry.data.size());
  write_octal(h + 136, 12, static_cast<uint64_t>(std::max<int64_t>(0, entry.mtime)));
  std::memset(h + 148, ' ', 8);
  h[156] = entry.is_directory ? '5' : '0';
  std::memcpy(h + 257, "ustar", 5);
  h[263] = '0';
  h[264] = '0';
  write_octal(h + 329, 8, 0);
  write_octal(h + 337, 8, 0);
  if (!prefix.empty()) {
    std::memcpy(h + 345, prefix.data(), std::min(prefix.size(), kPrefixSize));
  }
  std::snprintf(h + 148, 7, "%06o", header_checksum(h));
  h[154] = '\0';
  h[155] = ' ';
  return header;
}

bool is_zero_block(const char* block) {
  for (size_t i = 0; i < kBlockSize; ++i) {
    if (block[i] != '\0') return false;
  }
  return true;
}

std::string field_string(const char* src, size_t size) {
  size_t len = 0;
  while (len < size && src[len] != '\0') ++len;
  return std::string(src, len);
}

bool escapes(const fs::path& rel) {
  if (rel.is_absolute()) return true;
  for (const auto& part : rel) {
    if (part == "..") return true;
  }
  return false;
}

std::string build_tar(const fs::path& dir) {
  std::error_code ec;
  std::vector<fs::path> items;
  for (auto it = fs::recursive_directory_iterator(dir, ec); it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) break;
    items.push_back(it->path());
  }
  if (ec) {
    throw FilesystemError(ec, "scanning directory", dir);
  }
  std::sort(items.begin(), items.end());

  TarWriter writer;
  for (const auto& item : items) {
    const std::string rel = fs::relative(item, dir).generic_string();
    const int64_t mtime = file_time_to_millis(fs::last_write_time(item, ec)) / 1000;
    if (fs::is_directory(item, ec)) {
      writer.add_directory(rel, mtime);
    } else if (fs::is_regular_file(item, ec)) {
      writer.add_file(rel, read_file_or_throw(item), mtime);
    }
  }
  return writer.finish();
}
} // namespace

void TarWriter::add_file(const std::string& path, std::string data, int64_t mtime) {
  TarEntry entry;
  entry.path = path;
  entry.data = std::move(data);
  entry.mtime = mtime;
  entries_.push_back(std::move(entry));
}

void TarWriter::add_directory(const std::string& path, int64_t mtime) {
  TarEntry entry;
  entry.path = path;
  entry.is_directory = true;
  entry.mtime = mtime;
  entries_.push_back(std::move(entry));
}

std::string TarWriter::finish() const {
  std::string out;
  for (const auto& entry : entries_) {
    out += make_header(entry);
    if (entry.is_directory) continue;
    out += entry.data;
    const size_t pad = (kBlockSize - entry.data.size() % kBlockSize) % kBlockSize;
    out.append(pad, '\0');
  }
  out.append(kBlockSize * 2, '\0');
  return out;
}

std::vector<TarEntry> read_tar(const std::string& bytes) {
  std::vector<TarEntry> entries;
  size_t offset = 0;
  while (offset + kBlockSize <= bytes.size()) {
    const char* h = bytes.data() + offset;
    if (is_zero_block(h)) break;
    if (read_octal(h + 148, 8) != header_checksum(h)) {
      throw ValidationError("Invalid tar header: checksum mismatch at offset " + std::to_string(offset));
    }
    TarEntry entry;
    const std::string name = field_string(h, kNameSize);
    const std::string prefix = field_string(h + 345, kPrefixSize);
    entry.path = prefix.empty() ? name : prefix + "/" + name;
    entry.mode = static_cast<uint32_t>(read_octal(h + 100, 8));
    entry.mtime = static_cast<int64_t>(read_octal(h + 136, 12));
    const uint64_t size = read_octal(h + 124, 12);
    const char type = h[156];
    entry.is_directory = type == '5';
    offset += kBlockSize;
    if (offset + size > bytes.size()) {
      throw ValidationError("Invalid tar archive: truncated entry " + entry.path);
    }
    if (type == '0' || type == '\0') {
      entry.data = bytes.substr(offset, static_cast<size_t>(size));
      entries.push_back(std::move(entry));
    } else if (entry.is_directory) {
      entries.push_back(std::move(entry));
    }
    offset += static_cast<size_t>((size + kBlockSize - 1) / kBlockSize * kBlockSize);
  }
  return entries;
}

void create_tar(const fs::path& dir, const fs::path& archive) {
  write_file_atomic(archive, build_tar(dir));
}

void create_tar_gz(const fs::path& dir, const fs::path& archive) {
  write_file_atomic(archive, compress(build_tar(dir), CompressionAlgorithm::Gzip));
}

size_t extract_tar_bytes(const std::string& bytes, const fs::path& dest) {
  std::error_code ec;
  size_t files = 0;
  for (const auto& entry : read_tar(bytes)) {
    const fs::path rel = fs::path(normalize_tar_path(entry.path, false)).lexically_normal();
    if (rel.empty() || escapes(rel)) {
      throw ValidationError("Refusing tar entry outside destination: " + entry.path);
    }
    const fs::path out = dest / rel;
    if (entry.is_directory) {
      fs::create_directories(out, ec);
      if (ec) throw FilesystemError(ec, "creating directory", out);
      continue;
    }
    fs::create_directories(out.parent_path(), ec);
    if (ec) throw FilesystemError(ec, "creating directory", out.parent_path());
    if (!write_file(out, entry.data)) {
      throw FilesystemError(std::make_error_code(std::errc::io_error), "writing file", out);
    }
    fs::last_write_time(out, millis_to_file_time(entry.mtime * 1000), ec);
    if (ec) {
      log::debug("could not restore mtime: " + out.string());
      ec.clear();
    }
    ++files;
  }
  return files;
}

size_t extract_tar(const fs::path& archive, const fs::path& dest) {
  return extract_tar_bytes(read_file_or_throw(archive), dest);
}

size_t extract_tar_gz(const fs::path& archive, const fs::path& dest) {
  return extract_tar_bytes(decompress(read_file_or_throw(archive), CompressionAlgorithm::Gzip), dest);
}

} // namespace taptik
