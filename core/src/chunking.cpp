#include "taptik/chunking.h"

#include "taptik/digest.h"
#include "taptik/errors.h"
#include "taptik/log.h"

namespace taptik {

ChunkedPackage split_chunks(const std::string& bytes, size_t chunk_size) {
  if (chunk_size == 0) {
    throw ValidationError("Chunk size must be greater than zero");
  }
  ChunkedPackage out;
  for (size_t offset = 0; offset < bytes.size(); offset += chunk_size) {
    out.chunks.push_back(bytes.substr(offset, chunk_size));
  }
  out.metadata.total_chunks = out.chunks.size();
  out.metadata.checksum = sha256_hex(bytes);
  out.metadata.total_size = bytes.size();
  out.metadata.chunk_size = chunk_size;
  log::debug("split " + std::to_string(bytes.size()) + " bytes into " +
             std::to_string(out.chunks.size()) + " chunks");
  return out;
}

std::string reassemble_chunks(const std::vector<std::string>& chunks, const std::string& expected_checksum) {
  std::string joined;
  size_t total = 0;
  for (const auto& chunk : chunks) total += chunk.size();
  joined.reserve(total);
  for (const auto& chunk : chunks) joined += chunk;

  const std::string actual = sha256_hex(joined);
  if (actual != expected_checksum) {
    throw ChunkIntegrityError("Chunk integrity check failed: checksum mismatch", expected_checksum, actual);
  }
  return joined;
}

std::string reassemble_chunks(const ChunkedPackage& chunked) {
  if (chunked.chunks.size() != chunked.metadata.total_chunks) {
    throw ChunkIntegrityError("Chunk integrity check failed: expected " +
                                  std::to_string(chunked.metadata.total_chunks) + " chunks, got " +
                                  std::to_string(chunked.chunks.size()),
                              chunked.metadata.checksum, {});
  }
  return reassemble_chunks(chunked.chunks, chunked.metadata.checksum);
}

nlohmann::json to_json(const ChunkMetadata& metadata) {
  return {{"totalChunks", metadata.total_chunks},
          {"checksum", metadata.checksum},
          {"totalSize", metadata.total_size},
          {"chunkSize", metadata.chunk_size}};
}

ChunkMetadata chunk_metadata_from_json(const nlohmann::json& j) {
  ChunkMetadata m;
  m.total_chunks = j.value("totalChunks", static_cast<size_t>(0));
  m.checksum = j.value("checksum", std::string());
  m.total_size = j.value("totalSize", static_cast<uint64_t>(0));
  m.chunk_size = j.value("chunkSize", static_cast<size_t>(0));
  return m;
}

} // namespace taptik
