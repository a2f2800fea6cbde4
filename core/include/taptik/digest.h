#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

// Byte buffers are carried as std::string throughout the engine.
namespace taptik {

enum class HashAlgorithm { Sha256, Sha512 };

const char* to_string(HashAlgorithm algorithm);

// Streaming message digest over OpenSSL EVP.
class Hasher {
 public:
  explicit Hasher(HashAlgorithm algorithm);
  ~Hasher();
  Hasher(const Hasher&) = delete;
  Hasher& operator=(const Hasher&) = delete;

  void update(std::string_view bytes);
  std::string final_hex();
  std::string final_raw();

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

std::string digest_hex(HashAlgorithm algorithm, std::string_view bytes);
std::string sha256_hex(std::string_view bytes);
std::string sha512_hex(std::string_view bytes);
std::string sha256_raw(std::string_view bytes);

// Reads the file in 64 KiB blocks. Throws FilesystemError.
std::string sha256_file_hex(const std::filesystem::path& path);

std::string to_hex(std::string_view bytes);

// Throws CryptoError when the system RNG fails.
std::string random_bytes(size_t count);

constexpr size_t kAesKeySize = 32;
constexpr size_t kAesIvSize = 16;

// AES-256-CBC with PKCS#7 padding. `key` must be 32 bytes and `iv` 16.
std::string aes256_cbc_encrypt(std::string_view plaintext, std::string_view key, std::string_view iv);
std::string aes256_cbc_decrypt(std::string_view ciphertext, std::string_view key, std::string_view iv);

} // namespace taptik
