#include "taptik/backup.h"

#include "taptik/compression.h"
#include "taptik/digest.h"
#include "taptik/errors.h"
#include "taptik/glob.h"
#include "taptik/log.h"
#include "taptik/serialization.h"
#include "taptik/tar_archive.h"

#include <algorithm>
#include <fstream>
#include <set>

namespace taptik {
namespace fs = std::filesystem;

namespace {
constexpr const char* kMetadataFile = "metadata.json";
constexpr const char* kFilesDir = "files";
constexpr const char* kScratchDir = "temp";

// Removes the scratch directory when the restore leaves scope.
struct ScratchDir {
  fs::path path;
  ~ScratchDir() {
    if (path.empty()) return;
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) log::warn("could not remove scratch directory: " + path.string());
  }
};

bool is_hidden(const fs::path& rel) {
  for (const auto& part : rel) {
    const std::string name = part.string();
    if (name.size() > 1 && name[0] == '.' && name != "..") return true;
  }
  return false;
}

void collect_tree(const fs::path& source, const fs::path& start, const BackupOptions& options, const fs::path& skip,
                  std::vector<std::string>& files) {
  std::error_code ec;
  auto it = fs::recursive_directory_iterator(start, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    const auto info = classify_filesystem_error(ec, "scanning backup source", start);
    log_error_info(info);
    throw FilesystemError(ec, "scanning backup source", start);
  }
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      log_error_info(classify_filesystem_error(ec, "scanning backup source", source));
      break;
    }
    const fs::path rel = it->path().lexically_relative(source);
    const std::string rel_str = rel.generic_string();
    if (it->is_directory(ec)) {
      const bool excluded = matches_any(options.exclude_patterns, rel_str + "/") ||
                            (!options.include_hidden && is_hidden(rel)) ||
                            (!skip.empty() && fs::weakly_canonical(it->path(), ec) == skip);
      if (excluded) it.disable_recursion_pending();
      continue;
    }
    if (!it->is_regular_file(ec)) continue;
    if (!options.include_hidden && is_hidden(rel)) continue;
    if (matches_any(options.exclude_patterns, rel_str)) continue;
    files.push_back(rel_str);
  }
}

std::vector<std::string> collect_files(const fs::path& source, const BackupOptions& options,
                                       const fs::path& skip_root) {
  std::vector<std::string> files;
  std::error_code ec;
  const fs::path skip = fs::weakly_canonical(skip_root, ec);
  if (options.include_paths.empty()) {
    collect_tree(source, source, options, skip, files);
  }
  for (const auto& include : options.include_paths) {
    const fs::path path = source / include;
    if (fs::is_directory(path, ec)) {
      collect_tree(source, path, options, skip, files);
    } else if (fs::is_regular_file(path, ec)) {
      const fs::path rel = path.lexically_relative(source);
      if (!options.include_hidden && is_hidden(rel)) continue;
      if (matches_any(options.exclude_patterns, rel.generic_string())) continue;
      files.push_back(rel.generic_string());
    }
  }
  std::sort(files.begin(), files.end());
  files.erase(std::unique(files.begin(), files.end()), files.end());
  return files;
}

void copy_preserving_time(const fs::path& from, const fs::path& to) {
  std::error_code ec;
  fs::create_directories(to.parent_path(), ec);
  if (ec) throw FilesystemError(ec, "creating directory", to.parent_path());
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  if (ec) throw FilesystemError(ec, "copying file", from);
  const auto mtime = fs::last_write_time(from, ec);
  if (!ec) fs::last_write_time(to, mtime, ec);
  if (ec) log::debug("could not preserve mtime: " + to.string());
}

// Digest over sorted relative paths and contents of a files/ tree.
std::string tree_checksum(const fs::path& dir, const std::vector<std::string>& files) {
  Hasher hasher(HashAlgorithm::Sha256);
  std::vector<char> block(64 * 1024);
  for (const auto& rel : files) {
    hasher.update(rel);
    hasher.update(std::string_view("\0", 1));
    std::ifstream in(dir / rel, std::ios::binary);
    if (!in) {
      throw FilesystemError(std::make_error_code(std::errc::no_such_file_or_directory), "hashing backup file",
                            dir / rel);
    }
    while (in) {
      in.read(block.data(), static_cast<std::streamsize>(block.size()));
      if (in.gcount() > 0) hasher.update(std::string_view(block.data(), static_cast<size_t>(in.gcount())));
    }
  }
  return hasher.final_hex();
}

std::string artifact_checksum(const BackupMetadata& metadata) {
  if (metadata.artifact == kFilesDir) {
    return tree_checksum(metadata.backup_path / kFilesDir, metadata.files);
  }
  return sha256_file_hex(metadata.backup_path / metadata.artifact);
}

std::string derive_key(const std::string& key) {
  return sha256_raw(key);
}

std::string encrypt_bytes(const std::string& plain, const std::string& key) {
  const std::string iv = random_bytes(kAesIvSize);
  return iv + aes256_cbc_encrypt(plain, derive_key(key), iv);
}

std::string decrypt_bytes(const std::string& sealed, const std::string& key) {
  if (sealed.size() < kAesIvSize) {
    throw CryptoError("Encrypted backup is truncated");
  }
  const std::string iv = sealed.substr(0, kAesIvSize);
  return aes256_cbc_decrypt(std::string_view(sealed).substr(kAesIvSize), derive_key(key), iv);
}

void remove_tree(const fs::path& path) {
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) throw FilesystemError(ec, "removing directory", path);
}

ConflictType classify_conflict(const fs::path& backup_file, const fs::path& target_file) {
  std::error_code ec;
  const auto target_time = fs::last_write_time(target_file, ec);
  const auto backup_time = ec ? fs::file_time_type{} : fs::last_write_time(backup_file, ec);
  if (!ec && target_time > backup_time) return ConflictType::Newer;
  const auto target_size = fs::file_size(target_file, ec);
  const auto backup_size = ec ? 0 : fs::file_size(backup_file, ec);
  if (!ec && target_size != backup_size) return ConflictType::Modified;
  return ConflictType::Exists;
}
} // namespace

const char* to_string(ConflictStrategy strategy) {
  switch (strategy) {
    case ConflictStrategy::Overwrite: return "overwrite";
    case ConflictStrategy::Skip: return "skip";
    case ConflictStrategy::Merge: return "merge";
    case ConflictStrategy::Interactive: return "interactive";
  }
  return "skip";
}

const char* to_string(ConflictType type) {
  switch (type) {
    case ConflictType::Exists: return "exists";
    case ConflictType::Modified: return "modified";
    case ConflictType::Newer: return "newer";
  }
  return "exists";
}

ConflictStrategy conflict_strategy_from_string(const std::string& text) {
  if (text == "overwrite") return ConflictStrategy::Overwrite;
  if (text == "skip") return ConflictStrategy::Skip;
  if (text == "merge") return ConflictStrategy::Merge;
  if (text == "interactive") return ConflictStrategy::Interactive;
  throw ValidationError("Unknown conflict strategy: " + text, {"Use one of: overwrite, skip, merge, interactive"});
}

nlohmann::json to_json(const BackupMetadata& m) {
  return {{"id", m.id},
          {"timestamp", m.timestamp},
          {"timestampMs", m.timestamp_ms},
          {"platform", m.platform},
          {"sourcePath", m.source_path.string()},
          {"backupPath", m.backup_path.string()},
          {"artifact", m.artifact},
          {"size", m.size},
          {"compressed", m.compressed},
          {"encrypted", m.encrypted},
          {"files", m.files},
          {"fileSizes", m.file_sizes},
          {"checksum", m.checksum},
          {"version", m.version}};
}

BackupMetadata backup_metadata_from_json(const nlohmann::json& j) {
  BackupMetadata m;
  m.id = j.value("id", std::string());
  m.timestamp = j.value("timestamp", std::string());
  m.timestamp_ms = j.value("timestampMs", static_cast<int64_t>(0));
  m.platform = j.value("platform", std::string());
  m.source_path = j.value("sourcePath", std::string());
  m.backup_path = j.value("backupPath", std::string());
  m.artifact = j.value("artifact", std::string(kFilesDir));
  m.size = j.value("size", static_cast<uint64_t>(0));
  m.compressed = j.value("compressed", false);
  m.encrypted = j.value("encrypted", false);
  m.files = j.value("files", std::vector<std::string>{});
  m.file_sizes = j.value("fileSizes", std::map<std::string, uint64_t>{});
  m.checksum = j.value("checksum", std::string());
  m.version = j.value("version", std::string(kBackupFormatVersion));
  return m;
}

nlohmann::json to_json(const RestoreResult& result) {
  nlohmann::json conflicts = nlohmann::json::array();
  for (const auto& c : result.conflicts) {
    conflicts.push_back({{"file", c.file}, {"reason", c.reason}, {"resolution", c.resolution}});
  }
  return {{"success", result.success},
          {"restoredFiles", result.restored_files},
          {"skippedFiles", result.skipped_files},
          {"conflicts", conflicts},
          {"errors", result.errors}};
}

nlohmann::json to_json(const BackupComparison& comparison) {
  return {{"identical", comparison.identical},
          {"added", comparison.added},
          {"removed", comparison.removed},
          {"modified", comparison.modified}};
}

BackupOptions backup_options_from(const BackupConfig& config) {
  BackupOptions options;
  options.include_hidden = config.include_hidden;
  options.exclude_patterns = config.exclude_patterns;
  options.compress = config.compress;
  options.max_backups = config.max_backups;
  return options;
}

BackupRegistry::BackupRegistry(fs::path root) : root_(std::move(root)) {}

void BackupRegistry::initialize() {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec) throw FilesystemError(ec, "creating backup directory", root_);
  reload();
}

void BackupRegistry::reload() {
  std::map<std::string, BackupMetadata> loaded;
  std::error_code ec;
  for (auto platform = fs::directory_iterator(root_, ec); !ec && platform != fs::directory_iterator();
       platform.increment(ec)) {
    if (!platform->is_directory(ec) || platform->path().filename() == kScratchDir) continue;
    for (auto entry = fs::directory_iterator(platform->path(), ec); !ec && entry != fs::directory_iterator();
         entry.increment(ec)) {
      const fs::path meta_path = entry->path() / kMetadataFile;
      if (!fs::exists(meta_path, ec)) continue;
      try {
        BackupMetadata m = backup_metadata_from_json(read_json_file(meta_path));
        loaded[m.id] = m;
      } catch (const Error& e) {
        log::warn(std::string("Failed to load backup metadata: ") + e.what());
      }
    }
    ec.clear();
  }
  std::lock_guard<std::mutex> lock(mutex_);
  entries_ = std::move(loaded);
  log::debug("backup registry loaded " + std::to_string(entries_.size()) + " entries");
}

std::optional<BackupMetadata> BackupRegistry::scan_for(const std::string& id) const {
  std::error_code ec;
  for (auto platform = fs::directory_iterator(root_, ec); !ec && platform != fs::directory_iterator();
       platform.increment(ec)) {
    const fs::path meta_path = platform->path() / id / kMetadataFile;
    if (!fs::exists(meta_path, ec)) continue;
    try {
      return backup_metadata_from_json(read_json_file(meta_path));
    } catch (const Error& e) {
      log::error("Failed to load metadata for " + id + ": " + e.what());
    }
  }
  return std::nullopt;
}

std::optional<BackupMetadata> BackupRegistry::find(const std::string& id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(id);
    if (it != entries_.end()) return it->second;
  }
  auto found = scan_for(id);
  if (found) put(*found);
  return found;
}

void BackupRegistry::put(const BackupMetadata& metadata) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_[metadata.id] = metadata;
}

bool BackupRegistry::erase(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.erase(id) > 0;
}

std::vector<BackupMetadata> BackupRegistry::list(const std::string& platform) const {
  std::vector<BackupMetadata> out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, m] : entries_) {
      if (platform.empty() || m.platform == platform) out.push_back(m);
    }
  }
  std::sort(out.begin(), out.end(), [](const BackupMetadata& a, const BackupMetadata& b) {
    if (a.timestamp_ms != b.timestamp_ms) return a.timestamp_ms > b.timestamp_ms;
    return a.id > b.id;
  });
  return out;
}

BackupManager::BackupManager(BackupRegistry& registry) : registry_(registry) {}

std::string BackupManager::next_backup_id(int64_t& timestamp_ms) {
  std::lock_guard<std::mutex> lock(id_mutex_);
  timestamp_ms = std::max(now_millis(), last_timestamp_ms_ + 1);
  last_timestamp_ms_ = timestamp_ms;
  return "backup_" + std::to_string(timestamp_ms) + "_" + to_hex(random_bytes(4));
}

BackupMetadata BackupManager::create_backup(const fs::path& source, const std::string& platform,
                                            const BackupOptions& options) {
  log::info("Creating backup for " + platform + " from " + source.string());
  if (options.encrypt && options.encryption_key.empty()) {
    throw ValidationError("Encryption requested but no encryption key provided");
  }
  std::error_code ec;
  if (!fs::is_directory(source, ec)) {
    throw ValidationError("No files found to backup", {"Check that " + source.string() + " is a directory"});
  }

  const std::vector<std::string> files = collect_files(source, options, registry_.root());
  if (files.empty()) {
    throw ValidationError("No files found to backup");
  }

  BackupMetadata m;
  m.id = next_backup_id(m.timestamp_ms);
  m.timestamp = millis_to_iso(m.timestamp_ms);
  m.platform = platform;
  m.source_path = fs::absolute(source);
  m.backup_path = registry_.root() / platform / m.id;
  m.files = files;
  m.compressed = options.compress;
  m.encrypted = options.encrypt;

  const fs::path files_dir = m.backup_path / kFilesDir;
  try {
    for (const auto& rel : files) {
      copy_preserving_time(source / rel, files_dir / rel);
      const auto size = fs::file_size(files_dir / rel, ec);
      if (ec) throw FilesystemError(ec, "reading file size", files_dir / rel);
      m.file_sizes[rel] = size;
    }

    if (options.compress || options.encrypt) {
      const std::string archive_name = options.compress ? "archive.tar.gz" : "archive.tar";
      const fs::path archive = m.backup_path / archive_name;
      if (options.compress) {
        create_tar_gz(files_dir, archive);
      } else {
        create_tar(files_dir, archive);
      }
      remove_tree(files_dir);
      m.artifact = archive_name;

      if (options.encrypt) {
        const fs::path sealed = m.backup_path / (archive_name + ".enc");
        write_file_atomic(sealed, encrypt_bytes(read_file_or_throw(archive), options.encryption_key));
        fs::remove(archive, ec);
        if (ec) throw FilesystemError(ec, "removing archive", archive);
        m.artifact = archive_name + ".enc";
      }
      m.size = fs::file_size(m.backup_path / m.artifact, ec);
      if (ec) throw FilesystemError(ec, "reading file size", m.backup_path / m.artifact);
    } else {
      for (const auto& [rel, size] : m.file_sizes) m.size += size;
    }

    m.checksum = artifact_checksum(m);
    write_json_file(m.backup_path / kMetadataFile, to_json(m));
  } catch (const Error&) {
    std::error_code cleanup_ec;
    fs::remove_all(m.backup_path, cleanup_ec);
    throw;
  }

  registry_.put(m);
  log::info("Backup created: " + m.id + " (" + std::to_string(m.files.size()) + " files, " +
            std::to_string(m.size) + " bytes)");

  if (options.max_backups > 0) {
    clean_old_backups(platform, options.max_backups);
  }
  return m;
}

RestoreResult BackupManager::restore_backup(const std::string& id, const fs::path& target,
                                            const RestoreOptions& options) {
  log::info("Restoring backup " + id + " to " + target.string());
  const auto found = registry_.find(id);
  if (!found) {
    throw NotFoundError("Backup not found: " + id);
  }
  const BackupMetadata& m = *found;
  if (!verify_backup(m)) {
    throw IntegrityError("Backup integrity check failed",
                         {"Run backup verify " + id, "Restore from an older backup of the same platform"});
  }
  if (m.encrypted && options.decryption_key.empty()) {
    throw ValidationError("Backup is encrypted but no decryption key provided");
  }

  ScratchDir scratch;
  fs::path source_dir = m.backup_path / kFilesDir;
  if (m.artifact != kFilesDir) {
    scratch.path = registry_.root() / kScratchDir / m.id;
    remove_tree(scratch.path);
    std::string bytes = read_file_or_throw(m.backup_path / m.artifact);
    if (m.encrypted) bytes = decrypt_bytes(bytes, options.decryption_key);
    if (m.compressed) bytes = decompress(bytes, CompressionAlgorithm::Gzip);
    extract_tar_bytes(bytes, scratch.path);
    source_dir = scratch.path;
  }

  const ConflictStrategy strategy = options.overwrite ? ConflictStrategy::Overwrite : options.conflict_strategy;
  std::vector<BackupConflict> conflicts;
  std::set<std::string> skip;
  std::error_code ec;
  for (const auto& file : m.files) {
    if (!fs::exists(target / file, ec)) continue;
    BackupConflict conflict;
    conflict.file = file;
    conflict.type = classify_conflict(source_dir / file, target / file);
    // merge and interactive have no resolver yet and leave the target alone.
    conflict.resolution = strategy == ConflictStrategy::Overwrite ? "overwrite" : "skip";
    if (conflict.resolution == "skip") skip.insert(file);
    conflicts.push_back(conflict);
  }
  if (strategy == ConflictStrategy::Merge || strategy == ConflictStrategy::Interactive) {
    log::warn(std::string("conflict strategy ") + to_string(strategy) + " is not supported, conflicts are skipped");
  }

  RestoreResult result;
  for (const auto& c : conflicts) {
    result.conflicts.push_back({c.file, to_string(c.type), c.resolution});
  }
  if (!conflicts.empty()) {
    log::info(std::to_string(conflicts.size()) + " restore conflicts resolved with " + to_string(strategy));
  }

  if (options.dry_run) {
    log::info("Dry run mode - no files will be modified");
    for (const auto& file : m.files) {
      (skip.count(file) ? result.skipped_files : result.restored_files).push_back(file);
    }
    result.success = true;
    return result;
  }

  for (const auto& file : m.files) {
    if (skip.count(file)) {
      result.skipped_files.push_back(file);
      continue;
    }
    try {
      copy_preserving_time(source_dir / file, target / file);
      result.restored_files.push_back(file);
    } catch (const Error& e) {
      result.errors.push_back("Failed to restore " + file + ": " + e.what());
    }
  }

  result.success = result.errors.empty();
  log::info("Restore completed: " + std::to_string(result.restored_files.size()) + " files restored, " +
            std::to_string(result.skipped_files.size()) + " skipped");
  return result;
}

std::vector<BackupMetadata> BackupManager::list_backups(const std::string& platform, size_t limit) const {
  auto out = registry_.list(platform);
  if (limit > 0 && out.size() > limit) out.resize(limit);
  return out;
}

bool BackupManager::delete_backup(const std::string& id) {
  const auto found = registry_.find(id);
  if (!found) {
    log::warn("Backup not found: " + id);
    return false;
  }
  std::error_code ec;
  fs::remove_all(found->backup_path, ec);
  if (ec) {
    log_error_info(classify_filesystem_error(ec, "deleting backup", found->backup_path));
    return false;
  }
  registry_.erase(id);
  log::info("Backup deleted: " + id);
  return true;
}

bool BackupManager::verify_backup(const BackupMetadata& metadata) const {
  try {
    const bool ok = artifact_checksum(metadata) == metadata.checksum;
    if (!ok) log::warn("Backup checksum mismatch: " + metadata.id);
    return ok;
  } catch (const Error& e) {
    log::error("Failed to verify backup " + metadata.id + ": " + e.what());
    return false;
  }
}

BackupComparison BackupManager::compare_with_current(const std::string& id, const fs::path& current) {
  const auto found = registry_.find(id);
  if (!found) {
    throw NotFoundError("Backup not found: " + id);
  }
  BackupComparison out;
  std::error_code ec;
  const std::set<std::string> backed_up(found->files.begin(), found->files.end());
  for (const auto& file : found->files) {
    const fs::path path = current / file;
    if (!fs::exists(path, ec)) {
      out.removed.push_back(file);
      continue;
    }
    const auto it = found->file_sizes.find(file);
    if (it != found->file_sizes.end() && fs::file_size(path, ec) != it->second) {
      out.modified.push_back(file);
    }
  }
  if (fs::is_directory(current, ec)) {
    BackupOptions scan;
    for (const auto& file : collect_files(current, scan, registry_.root())) {
      if (!backed_up.count(file)) out.added.push_back(file);
    }
  }
  out.identical = out.added.empty() && out.removed.empty() && out.modified.empty();
  return out;
}

void BackupManager::clean_old_backups(const std::string& platform, size_t max_backups) {
  const auto backups = registry_.list(platform);
  if (backups.size() <= max_backups) return;
  size_t removed = 0;
  for (size_t i = max_backups; i < backups.size(); ++i) {
    if (delete_backup(backups[i].id)) ++removed;
  }
  log::info("Cleaned " + std::to_string(removed) + " old backups");
}

} // namespace taptik
