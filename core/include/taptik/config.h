#pragma once

#include "taptik/compression.h"
#include "taptik/log.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace taptik {

constexpr uint64_t kDefaultMaxPackageSize = 50ull * 1024 * 1024;
constexpr size_t kDefaultChunkSize = 4u * 1024 * 1024;

std::vector<std::string> default_exclude_patterns();

struct PackageConfig {
  CompressionAlgorithm compression = CompressionAlgorithm::Gzip;
  bool optimize_size = false;
  bool validate_integrity = true;
  bool include_sha512 = false;
  uint64_t max_package_size = kDefaultMaxPackageSize;
  size_t chunk_size = kDefaultChunkSize;
  size_t compression_cache_entries = 32;
};

struct BackupConfig {
  // Empty means <workdir>/.taptik/backups.
  std::filesystem::path root;
  size_t max_backups = 0;
  bool compress = false;
  bool include_hidden = true;
  std::vector<std::string> exclude_patterns = default_exclude_patterns();
};

struct DeployConfig {
  size_t max_concurrency = 3;
  size_t batch_size = 5;
  bool backup = true;
};

struct TaptikConfig {
  PackageConfig package;
  BackupConfig backup;
  DeployConfig deploy;
  log::Level log_level = log::Level::Info;
};

// Reads .json, .yaml or .yml, optionally nested under a "taptik" key.
// A missing file yields defaults; malformed content throws ValidationError.
TaptikConfig load_taptik_config(const std::filesystem::path& path);

} // namespace taptik
