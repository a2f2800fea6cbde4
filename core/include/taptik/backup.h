#pragma once

#include "taptik/config.h"

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace taptik {

enum class ConflictStrategy { Overwrite, Skip, Merge, Interactive };
enum class ConflictType { Exists, Modified, Newer };

const char* to_string(ConflictStrategy strategy);
const char* to_string(ConflictType type);
// Throws ValidationError for unknown names.
ConflictStrategy conflict_strategy_from_string(const std::string& text);

constexpr const char* kBackupFormatVersion = "1.0.0";

struct BackupMetadata {
  std::string id;
  std::string timestamp;
  int64_t timestamp_ms = 0;
  std::string platform;
  std::filesystem::path source_path;
  std::filesystem::path backup_path;
  // "files", "archive.tar.gz", "archive.tar.gz.enc" or "archive.tar.enc".
  std::string artifact = "files";
  uint64_t size = 0;
  bool compressed = false;
  bool encrypted = false;
  std::vector<std::string> files;
  std::map<std::string, uint64_t> file_sizes;
  std::string checksum;
  std::string version = kBackupFormatVersion;
};

nlohmann::json to_json(const BackupMetadata& metadata);
BackupMetadata backup_metadata_from_json(const nlohmann::json& j);

struct BackupOptions {
  bool include_hidden = true;
  std::vector<std::string> exclude_patterns = default_exclude_patterns();
  // Relative files or directories under the source. Empty backs up the
  // whole source; missing entries are ignored.
  std::vector<std::string> include_paths;
  bool compress = false;
  bool encrypt = false;
  std::string encryption_key;
  size_t max_backups = 0;
};

BackupOptions backup_options_from(const BackupConfig& config);

struct RestoreOptions {
  // Same as ConflictStrategy::Overwrite.
  bool overwrite = false;
  bool dry_run = false;
  std::string decryption_key;
  ConflictStrategy conflict_strategy = ConflictStrategy::Skip;
};

struct BackupConflict {
  std::string file;
  ConflictType type = ConflictType::Exists;
  std::string resolution;
};

struct RestoreConflictRecord {
  std::string file;
  std::string reason;
  std::string resolution;
};

struct RestoreResult {
  bool success = false;
  std::vector<std::string> restored_files;
  std::vector<std::string> skipped_files;
  std::vector<RestoreConflictRecord> conflicts;
  std::vector<std::string> errors;
};

nlohmann::json to_json(const RestoreResult& result);

struct BackupComparison {
  bool identical = true;
  std::vector<std::string> added;
  std::vector<std::string> removed;
  std::vector<std::string> modified;
};

nlohmann::json to_json(const BackupComparison& comparison);

// Index of backups under <root>/<platform>/<id>/metadata.json. Owned by
// the caller and shared by reference.
class BackupRegistry {
 public:
  explicit BackupRegistry(std::filesystem::path root);

  const std::filesystem::path& root() const { return root_; }

  // Creates the root directory and loads every metadata file.
  void initialize();
  void reload();

  // Falls back to a disk scan for ids not loaded yet.
  std::optional<BackupMetadata> find(const std::string& id);
  void put(const BackupMetadata& metadata);
  bool erase(const std::string& id);

  // Newest first. An empty platform lists everything.
  std::vector<BackupMetadata> list(const std::string& platform = {}) const;

 private:
  std::optional<BackupMetadata> scan_for(const std::string& id) const;

  std::filesystem::path root_;
  mutable std::mutex mutex_;
  std::map<std::string, BackupMetadata> entries_;
};

class BackupManager {
 public:
  explicit BackupManager(BackupRegistry& registry);

  // Throws ValidationError when nothing matches or encryption lacks a key.
  BackupMetadata create_backup(const std::filesystem::path& source, const std::string& platform,
                               const BackupOptions& options = {});

  // Throws NotFoundError, IntegrityError, or ValidationError for an
  // encrypted backup without key. Per-file failures land in `errors`.
  RestoreResult restore_backup(const std::string& id, const std::filesystem::path& target,
                               const RestoreOptions& options = {});

  std::vector<BackupMetadata> list_backups(const std::string& platform = {}, size_t limit = 0) const;
  bool delete_backup(const std::string& id);
  bool verify_backup(const BackupMetadata& metadata) const;
  BackupComparison compare_with_current(const std::string& id, const std::filesystem::path& current);

 private:
  std::string next_backup_id(int64_t& timestamp_ms);
  void clean_old_backups(const std::string& platform, size_t max_backups);

  BackupRegistry& registry_;
  std::mutex id_mutex_;
  int64_t last_timestamp_ms_ = 0;
};

} // namespace taptik
