#include "taptik/compression.h"

#include "taptik/digest.h"
#include "taptik/errors.h"
#include "taptik/log.h"

#include <brotli/decode.h>
#include <brotli/encode.h>
#include <zlib.h>

#include <cctype>
#include <mutex>

namespace taptik {

namespace {
constexpr size_t kBlock = 64 * 1024;

bool has_gzip_magic(std::string_view bytes) {
  return bytes.size() >= 2 && static_cast<unsigned char>(bytes[0]) == 0x1f &&
         static_cast<unsigned char>(bytes[1]) == 0x8b;
}

bool looks_like_json(std::string_view bytes) {
  for (const char c : bytes) {
    if (std::isspace(static_cast<unsigned char>(c))) continue;
    return c == '{' || c == '[';
  }
  return false;
}

std::string gzip_compress(std::string_view bytes, int level) {
  z_stream zs{};
  // 15 window bits + 16 selects the gzip wrapper.
  if (deflateInit2(&zs, level, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
    throw CompressionError("gzip: deflateInit2 failed");
  }
  zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(bytes.data()));
  zs.avail_in = static_cast<uInt>(bytes.size());

  std::string out;
  char buffer[kBlock];
  int ret = Z_OK;
  do {
    zs.next_out = reinterpret_cast<Bytef*>(buffer);
    zs.avail_out = sizeof(buffer);
    ret = deflate(&zs, Z_FINISH);
    if (ret == Z_STREAM_ERROR) {
      deflateEnd(&zs);
      throw CompressionError("gzip: deflate failed");
    }
    out.append(buffer, sizeof(buffer) - zs.avail_out);
  } while (ret != Z_STREAM_END);
  deflateEnd(&zs);
  return out;
}

std::string gzip_decompress(std::string_view bytes) {
  z_stream zs{};
  if (inflateInit2(&zs, 15 + 16) != Z_OK) {
    throw CompressionError("gzip: inflateInit2 failed");
  }
  zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(bytes.data()));
  zs.avail_in = static_cast<uInt>(bytes.size());

  std::string out;
  char buffer[kBlock];
  int ret = Z_OK;
  do {
    zs.next_out = reinterpret_cast<Bytef*>(buffer);
    zs.avail_out = sizeof(buffer);
    ret = inflate(&zs, Z_NO_FLUSH);
    if (ret != Z_OK && ret != Z_STREAM_END) {
      const std::string msg = zs.msg ? zs.msg : "corrupt stream";
      inflateEnd(&zs);
      throw CompressionError("gzip: " + msg);
    }
    out.append(buffer, sizeof(buffer) - zs.avail_out);
    if (ret != Z_STREAM_END && zs.avail_in == 0 && zs.avail_out != 0) {
      inflateEnd(&zs);
      throw CompressionError("gzip: truncated stream");
    }
  } while (ret != Z_STREAM_END);
  inflateEnd(&zs);
  return out;
}

std::string brotli_compress(std::string_view bytes, int quality) {
  BrotliEncoderState* state = BrotliEncoderCreateInstance(nullptr, nullptr, nullptr);
  if (!state) {
    throw CompressionError("brotli: cannot create encoder");
  }
  BrotliEncoderSetParameter(state, BROTLI_PARAM_QUALITY, static_cast<uint32_t>(quality));
  BrotliEncoderSetParameter(state, BROTLI_PARAM_SIZE_HINT, static_cast<uint32_t>(bytes.size()));

  size_t avail_in = bytes.size();
  const uint8_t* next_in = reinterpret_cast<const uint8_t*>(bytes.data());
  std::string out;
  uint8_t buffer[kBlock];
  do {
    size_t avail_out = sizeof(buffer);
    uint8_t* next_out = buffer;
    if (!BrotliEncoderCompressStream(state, BROTLI_OPERATION_FINISH, &avail_in, &next_in,
                                     &avail_out, &next_out, nullptr)) {
      BrotliEncoderDestroyInstance(state);
      throw CompressionError("brotli: compression failed");
    }
    out.append(reinterpret_cast<const char*>(buffer), sizeof(buffer) - avail_out);
  } while (!BrotliEncoderIsFinished(state));
  BrotliEncoderDestroyInstance(state);
  return out;
}

std::string brotli_decompress(std::string_view bytes) {
  BrotliDecoderState* state = BrotliDecoderCreateInstance(nullptr, nullptr, nullptr);
  if (!state) {
    throw CompressionError("brotli: cannot create decoder");
  }
  size_t avail_in = bytes.size();
  const uint8_t* next_in = reinterpret_cast<const uint8_t*>(bytes.data());
  std::string out;
  uint8_t buffer[kBlock];
  BrotliDecoderResult ret = BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT;
  while (ret == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT) {
    size_t avail_out = sizeof(buffer);
    uint8_t* next_out = buffer;
    ret = BrotliDecoderDecompressStream(state, &avail_in, &next_in, &avail_out, &next_out, nullptr);
    out.append(reinterpret_cast<const char*>(buffer), sizeof(buffer) - avail_out);
  }
  BrotliDecoderDestroyInstance(state);
  if (ret != BROTLI_DECODER_RESULT_SUCCESS || avail_in != 0) {
    throw CompressionError("brotli: malformed stream");
  }
  return out;
}

std::string cache_key(std::string_view bytes, CompressionAlgorithm algorithm, int level) {
  return sha256_hex(bytes) + ":" + to_string(algorithm) + ":" + std::to_string(level);
}
} // namespace

const char* to_string(CompressionAlgorithm algorithm) {
  switch (algorithm) {
    case CompressionAlgorithm::None: return "none";
    case CompressionAlgorithm::Gzip: return "gzip";
    case CompressionAlgorithm::Brotli: return "brotli";
  }
  return "none";
}

CompressionAlgorithm compression_from_string(const std::string& text) {
  if (text == "none") return CompressionAlgorithm::None;
  if (text == "gzip") return CompressionAlgorithm::Gzip;
  if (text == "brotli") return CompressionAlgorithm::Brotli;
  throw ValidationError("Unknown compression algorithm: " + text, {"Use one of: gzip, brotli, none"});
}

std::string compress(std::string_view bytes, CompressionAlgorithm algorithm, int level) {
  switch (algorithm) {
    case CompressionAlgorithm::None:
      return std::string(bytes);
    case CompressionAlgorithm::Gzip:
      return gzip_compress(bytes, level < 0 ? kDefaultGzipLevel : level);
    case CompressionAlgorithm::Brotli:
      return brotli_compress(bytes, level < 0 ? kDefaultBrotliQuality : level);
  }
  return std::string(bytes);
}

CompressionAlgorithm detect_compression(std::string_view bytes) {
  if (has_gzip_magic(bytes)) return CompressionAlgorithm::Gzip;
  if (looks_like_json(bytes)) return CompressionAlgorithm::None;
  return CompressionAlgorithm::Brotli;
}

std::string decompress(std::string_view bytes) {
  return decompress(bytes, detect_compression(bytes));
}

std::string decompress(std::string_view bytes, CompressionAlgorithm algorithm) {
  switch (algorithm) {
    case CompressionAlgorithm::None:
      return std::string(bytes);
    case CompressionAlgorithm::Gzip:
      return gzip_decompress(bytes);
    case CompressionAlgorithm::Brotli:
      return brotli_decompress(bytes);
  }
  return std::string(bytes);
}

std::string CompressionCache::compress(std::string_view bytes, CompressionAlgorithm algorithm, int level) {
  const std::string key = cache_key(bytes, algorithm, level);
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = entries_.find(key);
    if (it != entries_.end()) {
      // Counters are only written under the unique lock below.
      lock.unlock();
      std::unique_lock<std::shared_mutex> write(mutex_);
      ++hits_;
      return entries_.at(key);
    }
  }

  std::string out = taptik::compress(bytes, algorithm, level);
  std::unique_lock<std::shared_mutex> lock(mutex_);
  ++misses_;
  if (entries_.size() < capacity_) {
    entries_.emplace(key, out);
  } else {
    log::debug("compression cache full, result not stored");
  }
  return out;
}

size_t CompressionCache::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}

uint64_t CompressionCache::hits() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return hits_;
}

uint64_t CompressionCache::misses() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return misses_;
}

} // namespace taptik
