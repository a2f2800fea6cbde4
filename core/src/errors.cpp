#include "taptik/errors.h"

#include "taptik/log.h"

#include <utility>

namespace taptik {

namespace {
FilesystemErrorInfo make_info(bool critical, std::string message, std::vector<std::string> suggestions) {
  FilesystemErrorInfo info;
  info.is_critical = critical;
  info.should_continue = !critical;
  info.user_message = std::move(message);
  info.suggestions = std::move(suggestions);
  return info;
}
} // namespace

const char* to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Validation: return "validation";
    case ErrorKind::Integrity: return "integrity";
    case ErrorKind::Filesystem: return "filesystem";
    case ErrorKind::Migration: return "migration";
    case ErrorKind::Conflict: return "conflict";
    case ErrorKind::Compression: return "compression";
    case ErrorKind::Crypto: return "crypto";
    case ErrorKind::NotFound: return "not_found";
  }
  return "unknown";
}

Error::Error(ErrorKind kind, std::string code, const std::string& message,
             std::vector<std::string> suggestions)
    : std::runtime_error(message),
      kind_(kind),
      code_(std::move(code)),
      suggestions_(std::move(suggestions)) {}

ValidationError::ValidationError(const std::string& message, std::vector<std::string> suggestions)
    : Error(ErrorKind::Validation, "validation_failed", message, std::move(suggestions)) {}

ValidationError::ValidationError(std::string code, const std::string& message,
                                 std::vector<std::string> suggestions)
    : Error(ErrorKind::Validation, std::move(code), message, std::move(suggestions)) {}

PackageSizeError::PackageSizeError(uint64_t size, uint64_t limit)
    : ValidationError("package_too_large",
                      "Package size " + std::to_string(size) + " bytes exceeds maximum of " +
                          std::to_string(limit) + " bytes",
                      {"Remove large prompts or instruction files from the context",
                       "Enable size optimization to strip empty values",
                       "Raise package.max_package_size in the configuration"}),
      size_(size),
      limit_(limit) {}

ChecksumError::ChecksumError(const std::string& message)
    : Error(ErrorKind::Integrity, "checksum_failed", message) {}

ChunkIntegrityError::ChunkIntegrityError(const std::string& message, std::string expected, std::string actual)
    : Error(ErrorKind::Integrity, "chunk_checksum_mismatch", message,
            {"Transfer the package again", "Check the transport for truncated payloads"}),
      expected_(std::move(expected)),
      actual_(std::move(actual)) {}

IntegrityError::IntegrityError(const std::string& message, std::vector<std::string> suggestions)
    : Error(ErrorKind::Integrity, "integrity_check_failed", message, std::move(suggestions)) {}

MigrationError::MigrationError(const std::string& message, std::string cause)
    : Error(ErrorKind::Migration, "migration_failed",
            cause.empty() ? "Migration failed: " + message : "Migration failed: " + message + ": " + cause,
            {"Check that the context metadata and content are JSON objects",
             "Re-export the configuration with the current tool version"}),
      cause_(std::move(cause)) {}

CompressionError::CompressionError(const std::string& message)
    : Error(ErrorKind::Compression, "compression_failed", message) {}

CryptoError::CryptoError(const std::string& message)
    : Error(ErrorKind::Crypto, "crypto_failed", message,
            {"Verify the encryption key", "Check that the backup archive is complete"}) {}

NotFoundError::NotFoundError(const std::string& message)
    : Error(ErrorKind::NotFound, "not_found", message) {}

FilesystemErrorInfo classify_filesystem_error(const std::error_code& ec,
                                              const std::string& operation,
                                              const std::filesystem::path& path) {
  const std::string where = operation + ": " + path.string();
  if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
    return make_info(true, "Permission denied when " + where,
                     {"Check file/directory permissions with: ls -la",
                      "Run with appropriate permissions or as administrator",
                      "Ensure the user has read/write access to the directory",
                      "Consider changing file ownership with: chown"});
  }
  if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
    return make_info(false, "File or directory not found when " + where,
                     {"Verify the file path is correct",
                      "Check if the file was moved or deleted",
                      "Ensure the parent directory exists",
                      "Consider creating the file/directory if needed"});
  }
  if (ec == std::errc::no_space_on_device) {
    return make_info(true, "No space left on device when " + where,
                     {"Free up disk space by deleting unnecessary files",
                      "Check disk usage with: df -h",
                      "Clean temporary files and caches",
                      "Consider moving to a different location with more space"});
  }
  if (ec == std::errc::read_only_file_system) {
    return make_info(true, "Cannot write to read-only file system when " + where,
                     {"Check if the file system is mounted read-only",
                      "Remount the file system with write permissions",
                      "Choose a different writable location",
                      "Check file system status with: mount | grep ro"});
  }
  if (ec == std::errc::too_many_files_open || ec == std::errc::too_many_files_open_in_system) {
    return make_info(true, "Too many open files when " + where,
                     {"Close unnecessary file handles in the application",
                      "Increase system file descriptor limit: ulimit -n",
                      "Check currently open files with: lsof",
                      "Restart the application to reset file handles"});
  }
  if (ec == std::errc::invalid_argument || ec == std::errc::filename_too_long) {
    return make_info(true, "Invalid path when " + where,
                     {"Check for invalid characters in the path",
                      "Ensure path length is within system limits",
                      "Verify path format is correct for the operating system",
                      "Use absolute paths to avoid confusion"});
  }
  return make_info(true, "File system error when " + where + " - " + ec.message(),
                   {"Check the error message for specific details",
                    "Verify file/directory exists and is accessible",
                    "Try the operation again after a brief wait",
                    "Contact system administrator if the error persists"});
}

FilesystemError::FilesystemError(const std::error_code& ec, const std::string& operation,
                                 const std::filesystem::path& path)
    : FilesystemError(ec, classify_filesystem_error(ec, operation, path)) {}

FilesystemError::FilesystemError(const std::error_code& ec, FilesystemErrorInfo info)
    : Error(ErrorKind::Filesystem, "filesystem_" + std::to_string(ec.value()), info.user_message,
            std::move(info.suggestions)),
      ec_(ec),
      critical_(info.is_critical) {}

void log_error_info(const FilesystemErrorInfo& info) {
  if (info.is_critical) {
    log::error("Critical error: " + info.user_message);
  } else {
    log::warn("Warning: " + info.user_message);
  }
  if (info.suggestions.empty()) return;
  log::info("Suggested resolutions:");
  for (size_t i = 0; i < info.suggestions.size(); ++i) {
    log::info("  " + std::to_string(i + 1) + ". " + info.suggestions[i]);
  }
}

} // namespace taptik
