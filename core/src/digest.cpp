#include "taptik/digest.h"

#include "taptik/errors.h"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <fstream>
#include <vector>

namespace taptik {

namespace {
struct EvpDeleter {
  void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
  void operator()(EVP_CIPHER_CTX* ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpDeleter>;
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, EvpDeleter>;

std::string openssl_message(const char* context) {
  const unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }
  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  return std::string(context) + ": " + buf;
}

const EVP_MD* md_for(HashAlgorithm algorithm) {
  return algorithm == HashAlgorithm::Sha512 ? EVP_sha512() : EVP_sha256();
}

const unsigned char* as_uchar(std::string_view bytes) {
  return reinterpret_cast<const unsigned char*>(bytes.data());
}

std::string run_cipher(std::string_view input, std::string_view key, std::string_view iv, bool encrypt) {
  if (key.size() != kAesKeySize || iv.size() != kAesIvSize) {
    throw CryptoError("AES-256-CBC requires a 32-byte key and a 16-byte IV");
  }
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    throw CryptoError(openssl_message("EVP_CIPHER_CTX_new"));
  }
  if (EVP_CipherInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, as_uchar(key), as_uchar(iv), encrypt ? 1 : 0) != 1) {
    throw CryptoError(openssl_message("EVP_CipherInit_ex"));
  }
  std::string out(input.size() + EVP_MAX_BLOCK_LENGTH, '\0');
  int written = 0;
  if (EVP_CipherUpdate(ctx.get(), reinterpret_cast<unsigned char*>(out.data()), &written,
                       as_uchar(input), static_cast<int>(input.size())) != 1) {
    throw CryptoError(openssl_message("EVP_CipherUpdate"));
  }
  int tail = 0;
  if (EVP_CipherFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(out.data()) + written, &tail) != 1) {
    throw CryptoError(encrypt ? openssl_message("EVP_CipherFinal_ex")
                              : std::string("Decryption failed: wrong key or corrupted data"));
  }
  out.resize(static_cast<size_t>(written + tail));
  return out;
}
} // namespace

const char* to_string(HashAlgorithm algorithm) {
  return algorithm == HashAlgorithm::Sha512 ? "sha512" : "sha256";
}

struct Hasher::Impl {
  MdCtxPtr ctx;
};

Hasher::Hasher(HashAlgorithm algorithm) : impl_(std::make_unique<Impl>()) {
  impl_->ctx.reset(EVP_MD_CTX_new());
  if (!impl_->ctx) {
    throw CryptoError(openssl_message("EVP_MD_CTX_new"));
  }
  if (EVP_DigestInit_ex(impl_->ctx.get(), md_for(algorithm), nullptr) != 1) {
    throw CryptoError(openssl_message("EVP_DigestInit_ex"));
  }
}

Hasher::~Hasher() = default;

void Hasher::update(std::string_view bytes) {
  if (bytes.empty()) return;
  if (EVP_DigestUpdate(impl_->ctx.get(), bytes.data(), bytes.size()) != 1) {
    throw CryptoError(openssl_message("EVP_DigestUpdate"));
  }
}

std::string Hasher::final_raw() {
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(impl_->ctx.get(), md, &len) != 1) {
    throw CryptoError(openssl_message("EVP_DigestFinal_ex"));
  }
  return std::string(reinterpret_cast<const char*>(md), len);
}

std::string Hasher::final_hex() {
  return to_hex(final_raw());
}

std::string to_hex(std::string_view bytes) {
  static const char* kDigits = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (const char c : bytes) {
    const auto b = static_cast<unsigned char>(c);
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0f]);
  }
  return out;
}

std::string digest_hex(HashAlgorithm algorithm, std::string_view bytes) {
  Hasher hasher(algorithm);
  hasher.update(bytes);
  return hasher.final_hex();
}

std::string sha256_hex(std::string_view bytes) {
  return digest_hex(HashAlgorithm::Sha256, bytes);
}

std::string sha512_hex(std::string_view bytes) {
  return digest_hex(HashAlgorithm::Sha512, bytes);
}

std::string sha256_raw(std::string_view bytes) {
  Hasher hasher(HashAlgorithm::Sha256);
  hasher.update(bytes);
  return hasher.final_raw();
}

std::string sha256_file_hex(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw FilesystemError(std::make_error_code(std::errc::no_such_file_or_directory), "hashing file", path);
  }
  Hasher hasher(HashAlgorithm::Sha256);
  std::vector<char> block(64 * 1024);
  while (in) {
    in.read(block.data(), static_cast<std::streamsize>(block.size()));
    const auto got = in.gcount();
    if (got > 0) {
      hasher.update(std::string_view(block.data(), static_cast<size_t>(got)));
    }
  }
  if (in.bad()) {
    throw FilesystemError(std::make_error_code(std::errc::io_error), "hashing file", path);
  }
  return hasher.final_hex();
}

std::string random_bytes(size_t count) {
  std::string out(count, '\0');
  if (count > 0 && RAND_bytes(reinterpret_cast<unsigned char*>(out.data()), static_cast<int>(count)) != 1) {
    throw CryptoError(openssl_message("RAND_bytes"));
  }
  return out;
}

std::string aes256_cbc_encrypt(std::string_view plaintext, std::string_view key, std::string_view iv) {
  return run_cipher(plaintext, key, iv, true);
}

std::string aes256_cbc_decrypt(std::string_view ciphertext, std::string_view key, std::string_view iv) {
  return run_cipher(ciphertext, key, iv, false);
}

} // namespace taptik
