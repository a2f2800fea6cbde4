#pragma once

#include "taptik/checksum.h"
#include "taptik/chunking.h"
#include "taptik/compression.h"
#include "taptik/config.h"
#include "taptik/manifest.h"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace taptik {

struct CloudMetadata {
  std::string title;
  std::string description;
  std::vector<std::string> tags;
  std::string author;
  std::string version = "1.0.0";
  std::string created_at;
  std::string updated_at;
  std::string source_ide;
  std::vector<std::string> target_ides;
  std::string complexity_level = "basic";
  std::map<std::string, size_t> component_count;
  std::string checksum;
  uint64_t file_size = 0;
  bool is_public = false;
};

struct TaptikPackage {
  CloudMetadata metadata;
  nlohmann::json sanitized_config;
  std::string checksum;
  std::optional<std::string> checksum_sha512;
  std::string format = kPackageFormatCurrent;
  CompressionAlgorithm compression = CompressionAlgorithm::Gzip;
  Manifest manifest;
  uint64_t size = 0;
};

struct PackageOptions {
  CompressionAlgorithm compression = CompressionAlgorithm::Gzip;
  bool optimize_size = false;
  bool validate_integrity = true;
  bool include_sha512 = false;
  uint64_t max_package_size = kDefaultMaxPackageSize;
};

PackageOptions package_options_from(const PackageConfig& config);

bool is_supported_format(const std::string& format);

// Validation failures (missing title, version, sourceIde or content, or an
// oversized context) and integrity failures propagate. Any other failure
// yields a partial package whose description records the error.
TaptikPackage create_package(const CloudMetadata& metadata, const nlohmann::json& context,
                             const PackageOptions& options = {});

// Deep copy without nulls, blank strings or containers emptied by the
// removal. Whitespace runs in strings collapse to one space.
nlohmann::json optimize_context(const nlohmann::json& context);

bool validate_package_integrity(const TaptikPackage& pkg);

nlohmann::json to_json(const CloudMetadata& metadata);
CloudMetadata cloud_metadata_from_json(const nlohmann::json& j);
nlohmann::json to_json(const TaptikPackage& pkg);
// Throws ValidationError("Invalid package format") on malformed documents.
TaptikPackage package_from_json(const nlohmann::json& j);

std::string serialize_package(const TaptikPackage& pkg);
// Throws ValidationError for unreadable or unsupported data and
// IntegrityError when the checksum or manifest no longer matches.
TaptikPackage deserialize_package(const std::string& bytes);

void write_package(const TaptikPackage& pkg, const std::filesystem::path& path);
TaptikPackage read_package(const std::filesystem::path& path);

ChunkedPackage create_chunked_package(const TaptikPackage& pkg, size_t chunk_size = kDefaultChunkSize);
TaptikPackage package_from_chunks(const ChunkedPackage& chunked);

std::string compress_package(const TaptikPackage& pkg, CompressionCache& cache);

} // namespace taptik
