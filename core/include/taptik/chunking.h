#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace taptik {

struct ChunkMetadata {
  size_t total_chunks = 0;
  std::string checksum;
  uint64_t total_size = 0;
  size_t chunk_size = 0;
};

struct ChunkedPackage {
  std::vector<std::string> chunks;
  ChunkMetadata metadata;
};

// Throws ValidationError when chunk_size is zero.
ChunkedPackage split_chunks(const std::string& bytes, size_t chunk_size);

// Throws ChunkIntegrityError when the digest of the joined chunks differs.
std::string reassemble_chunks(const std::vector<std::string>& chunks, const std::string& expected_checksum);
std::string reassemble_chunks(const ChunkedPackage& chunked);

nlohmann::json to_json(const ChunkMetadata& metadata);
ChunkMetadata chunk_metadata_from_json(const nlohmann::json& j);

} // namespace taptik
