#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace taptik {

enum class ErrorKind {
  Validation,
  Integrity,
  Filesystem,
  Migration,
  Conflict,
  Compression,
  Crypto,
  NotFound
};

const char* to_string(ErrorKind kind);

// Base for everything the engine throws. `code` is stable across releases,
// `suggestions` are user facing remediation steps.
class Error : public std::runtime_error {
 public:
  Error(ErrorKind kind, std::string code, const std::string& message,
        std::vector<std::string> suggestions = {});

  ErrorKind kind() const { return kind_; }
  const std::string& code() const { return code_; }
  const std::vector<std::string>& suggestions() const { return suggestions_; }

 private:
  ErrorKind kind_;
  std::string code_;
  std::vector<std::string> suggestions_;
};

class ValidationError : public Error {
 public:
  explicit ValidationError(const std::string& message, std::vector<std::string> suggestions = {});

 protected:
  ValidationError(std::string code, const std::string& message, std::vector<std::string> suggestions);
};

class PackageSizeError : public ValidationError {
 public:
  PackageSizeError(uint64_t size, uint64_t limit);

  uint64_t size() const { return size_; }
  uint64_t limit() const { return limit_; }

 private:
  uint64_t size_;
  uint64_t limit_;
};

class ChecksumError : public Error {
 public:
  explicit ChecksumError(const std::string& message);
};

class ChunkIntegrityError : public Error {
 public:
  ChunkIntegrityError(const std::string& message, std::string expected, std::string actual);

  const std::string& expected() const { return expected_; }
  const std::string& actual() const { return actual_; }

 private:
  std::string expected_;
  std::string actual_;
};

class IntegrityError : public Error {
 public:
  explicit IntegrityError(const std::string& message, std::vector<std::string> suggestions = {});
};

class MigrationError : public Error {
 public:
  MigrationError(const std::string& message, std::string cause = {});

  const std::string& cause() const { return cause_; }

 private:
  std::string cause_;
};

class CompressionError : public Error {
 public:
  explicit CompressionError(const std::string& message);
};

class CryptoError : public Error {
 public:
  explicit CryptoError(const std::string& message);
};

class NotFoundError : public Error {
 public:
  explicit NotFoundError(const std::string& message);
};

struct FilesystemErrorInfo {
  bool should_continue = false;
  bool is_critical = true;
  std::string user_message;
  std::vector<std::string> suggestions;
};

// Maps an OS error to a plain-language message and remediation steps.
// "Not found" is the only non-critical class; callers may keep going with
// partial results.
FilesystemErrorInfo classify_filesystem_error(const std::error_code& ec,
                                              const std::string& operation,
                                              const std::filesystem::path& path);

class FilesystemError : public Error {
 public:
  FilesystemError(const std::error_code& ec, const std::string& operation,
                  const std::filesystem::path& path);

  const std::error_code& error_code() const { return ec_; }
  bool is_critical() const { return critical_; }

 private:
  FilesystemError(const std::error_code& ec, FilesystemErrorInfo info);

  std::error_code ec_;
  bool critical_;
};

// Logs the message and the numbered suggestions at the matching level.
void log_error_info(const FilesystemErrorInfo& info);

} // namespace taptik
