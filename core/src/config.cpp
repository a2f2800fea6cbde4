#include "taptik/config.h"

#include "taptik/errors.h"

#include <fstream>
#include <optional>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace taptik {

namespace {
bool file_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

// Values collected from either document format before being applied.
struct ConfigFields {
  std::optional<std::string> compression;
  std::optional<bool> optimize_size;
  std::optional<bool> validate_integrity;
  std::optional<bool> include_sha512;
  std::optional<uint64_t> max_package_size;
  std::optional<uint64_t> chunk_size;
  std::optional<uint64_t> cache_entries;
  std::optional<std::string> backup_root;
  std::optional<uint64_t> max_backups;
  std::optional<bool> backup_compress;
  std::optional<bool> include_hidden;
  std::optional<std::vector<std::string>> exclude_patterns;
  std::optional<uint64_t> max_concurrency;
  std::optional<uint64_t> batch_size;
  std::optional<bool> deploy_backup;
  std::optional<std::string> log_level;
};

void apply_fields(TaptikConfig& cfg, const ConfigFields& f) {
  if (f.compression) {
    try {
      cfg.package.compression = compression_from_string(*f.compression);
    } catch (const ValidationError& e) {
      log::warn(std::string("config: ") + e.what() + ", keeping gzip");
    }
  }
  if (f.optimize_size) cfg.package.optimize_size = *f.optimize_size;
  if (f.validate_integrity) cfg.package.validate_integrity = *f.validate_integrity;
  if (f.include_sha512) cfg.package.include_sha512 = *f.include_sha512;
  if (f.max_package_size) cfg.package.max_package_size = *f.max_package_size;
  if (f.chunk_size && *f.chunk_size > 0) cfg.package.chunk_size = static_cast<size_t>(*f.chunk_size);
  if (f.cache_entries) cfg.package.compression_cache_entries = static_cast<size_t>(*f.cache_entries);
  if (f.backup_root && !f.backup_root->empty()) cfg.backup.root = *f.backup_root;
  if (f.max_backups) cfg.backup.max_backups = static_cast<size_t>(*f.max_backups);
  if (f.backup_compress) cfg.backup.compress = *f.backup_compress;
  if (f.include_hidden) cfg.backup.include_hidden = *f.include_hidden;
  if (f.exclude_patterns) cfg.backup.exclude_patterns = *f.exclude_patterns;
  if (f.max_concurrency && *f.max_concurrency > 0) cfg.deploy.max_concurrency = static_cast<size_t>(*f.max_concurrency);
  if (f.batch_size && *f.batch_size > 0) cfg.deploy.batch_size = static_cast<size_t>(*f.batch_size);
  if (f.deploy_backup) cfg.deploy.backup = *f.deploy_backup;
  if (f.log_level) {
    log::Level level = log::Level::Info;
    if (log::parse_level(*f.log_level, level)) {
      cfg.log_level = level;
    } else {
      log::warn("config: unknown log level " + *f.log_level);
    }
  }
}

ConfigFields read_json_fields(const nlohmann::json& j) {
  const auto& root = j.contains("taptik") ? j["taptik"] : j;
  ConfigFields f;
  if (root.contains("package")) {
    const auto& pkg = root["package"];
    if (pkg.contains("compression")) f.compression = pkg["compression"].get<std::string>();
    if (pkg.contains("optimize_size")) f.optimize_size = pkg["optimize_size"].get<bool>();
    if (pkg.contains("validate_integrity")) f.validate_integrity = pkg["validate_integrity"].get<bool>();
    if (pkg.contains("include_sha512")) f.include_sha512 = pkg["include_sha512"].get<bool>();
    if (pkg.contains("max_package_size")) f.max_package_size = pkg["max_package_size"].get<uint64_t>();
    if (pkg.contains("chunk_size")) f.chunk_size = pkg["chunk_size"].get<uint64_t>();
    if (pkg.contains("compression_cache_entries")) f.cache_entries = pkg["compression_cache_entries"].get<uint64_t>();
  }
  if (root.contains("backup")) {
    const auto& backup = root["backup"];
    if (backup.contains("root")) f.backup_root = backup["root"].get<std::string>();
    if (backup.contains("max_backups")) f.max_backups = backup["max_backups"].get<uint64_t>();
    if (backup.contains("compress")) f.backup_compress = backup["compress"].get<bool>();
    if (backup.contains("include_hidden")) f.include_hidden = backup["include_hidden"].get<bool>();
    if (backup.contains("exclude_patterns") && backup["exclude_patterns"].is_array()) {
      std::vector<std::string> patterns;
      for (const auto& v : backup["exclude_patterns"]) {
        patterns.push_back(v.get<std::string>());
      }
      f.exclude_patterns = patterns;
    }
  }
  if (root.contains("deploy")) {
    const auto& deploy = root["deploy"];
    if (deploy.contains("max_concurrency")) f.max_concurrency = deploy["max_concurrency"].get<uint64_t>();
    if (deploy.contains("batch_size")) f.batch_size = deploy["batch_size"].get<uint64_t>();
    if (deploy.contains("backup")) f.deploy_backup = deploy["backup"].get<bool>();
  }
  if (root.contains("log") && root["log"].contains("level")) {
    f.log_level = root["log"]["level"].get<std::string>();
  }
  return f;
}

ConfigFields read_yaml_fields(const YAML::Node& doc) {
  const YAML::Node root = doc["taptik"] ? doc["taptik"] : doc;
  ConfigFields f;
  if (const YAML::Node pkg = root["package"]) {
    if (pkg["compression"]) f.compression = pkg["compression"].as<std::string>();
    if (pkg["optimize_size"]) f.optimize_size = pkg["optimize_size"].as<bool>();
    if (pkg["validate_integrity"]) f.validate_integrity = pkg["validate_integrity"].as<bool>();
    if (pkg["include_sha512"]) f.include_sha512 = pkg["include_sha512"].as<bool>();
    if (pkg["max_package_size"]) f.max_package_size = pkg["max_package_size"].as<uint64_t>();
    if (pkg["chunk_size"]) f.chunk_size = pkg["chunk_size"].as<uint64_t>();
    if (pkg["compression_cache_entries"]) f.cache_entries = pkg["compression_cache_entries"].as<uint64_t>();
  }
  if (const YAML::Node backup = root["backup"]) {
    if (backup["root"]) f.backup_root = backup["root"].as<std::string>();
    if (backup["max_backups"]) f.max_backups = backup["max_backups"].as<uint64_t>();
    if (backup["compress"]) f.backup_compress = backup["compress"].as<bool>();
    if (backup["include_hidden"]) f.include_hidden = backup["include_hidden"].as<bool>();
    if (backup["exclude_patterns"]) {
      std::vector<std::string> patterns;
      for (const auto& v : backup["exclude_patterns"]) {
        patterns.push_back(v.as<std::string>());
      }
      f.exclude_patterns = patterns;
    }
  }
  if (const YAML::Node deploy = root["deploy"]) {
    if (deploy["max_concurrency"]) f.max_concurrency = deploy["max_concurrency"].as<uint64_t>();
    if (deploy["batch_size"]) f.batch_size = deploy["batch_size"].as<uint64_t>();
    if (deploy["backup"]) f.deploy_backup = deploy["backup"].as<bool>();
  }
  if (root["log"] && root["log"]["level"]) {
    f.log_level = root["log"]["level"].as<std::string>();
  }
  return f;
}
} // namespace

std::vector<std::string> default_exclude_patterns() {
  return {"**/node_modules/**", "**/.git/**", "**/dist/**", "**/build/**", "**/*.log"};
}

TaptikConfig load_taptik_config(const std::filesystem::path& path) {
  TaptikConfig cfg;

  if (!file_exists(path)) {
    log::warn(std::string("config not found: ") + path.string());
    return cfg;
  }

  const auto ext = path.extension().string();
  if (ext == ".json") {
    try {
      std::ifstream in(path);
      nlohmann::json j;
      in >> j;
      apply_fields(cfg, read_json_fields(j));
    } catch (const nlohmann::json::exception& e) {
      throw ValidationError("Invalid configuration " + path.string() + ": " + e.what());
    }
    return cfg;
  }

  if (ext == ".yaml" || ext == ".yml") {
    try {
      apply_fields(cfg, read_yaml_fields(YAML::LoadFile(path.string())));
    } catch (const YAML::Exception& e) {
      throw ValidationError("Invalid configuration " + path.string() + ": " + e.what());
    }
    return cfg;
  }

  log::warn(std::string("unknown config extension: ") + ext);
  return cfg;
}

} // namespace taptik
