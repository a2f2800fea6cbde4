#pragma once

#include <cstddef>
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace taptik {

enum class CompressionAlgorithm { None, Gzip, Brotli };

const char* to_string(CompressionAlgorithm algorithm);
// Throws ValidationError for anything other than "none", "gzip" or "brotli".
CompressionAlgorithm compression_from_string(const std::string& text);

constexpr int kDefaultGzipLevel = 9;
constexpr int kDefaultBrotliQuality = 11;

// level < 0 picks the algorithm default.
std::string compress(std::string_view bytes, CompressionAlgorithm algorithm, int level = -1);

// Gzip is recognised by its magic, plain JSON by a leading '{' or '['.
// Everything else is tried as brotli. Throws CompressionError.
std::string decompress(std::string_view bytes);
std::string decompress(std::string_view bytes, CompressionAlgorithm algorithm);

CompressionAlgorithm detect_compression(std::string_view bytes);

// Memoizes compression results for the lifetime of one run. Entries are
// never evicted; once `capacity` is reached new results are not stored.
class CompressionCache {
 public:
  explicit CompressionCache(size_t capacity = 32) : capacity_(capacity) {}

  std::string compress(std::string_view bytes, CompressionAlgorithm algorithm, int level = -1);

  size_t size() const;
  size_t capacity() const { return capacity_; }
  uint64_t hits() const;
  uint64_t misses() const;

 private:
  size_t capacity_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::string> entries_;
  uint64_t hits_ = 0;
  uint64_t misses_ = 0;
};

} // namespace taptik
