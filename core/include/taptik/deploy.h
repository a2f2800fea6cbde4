#pragma once

#include "taptik/backup.h"
#include "taptik/parallel.h"

#include <filesystem>
#include <initializer_list>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace taptik {

enum class Platform { Kiro, ClaudeCode };

const char* to_string(Platform platform);
// Accepts "kiro", "claude-code" and "claudeCode". Throws ValidationError.
Platform platform_from_string(const std::string& text);

struct CompatibilityReport {
  bool compatible = true;
  std::vector<std::string> issues;
};

nlohmann::json to_json(const CompatibilityReport& report);

// One file the deployer wants on disk. `type` is file, setting, command or hook.
struct WriteUnit {
  std::string type;
  std::filesystem::path path;
  std::string contents;
};

struct DeployerStrategy {
  Platform platform;
  const char* name;
  // Directory under the target owned by this platform, e.g. ".kiro".
  const char* config_root;
  // Files directly under the target that the platform also writes.
  std::vector<std::string> root_files;
  bool (*can_deploy)(const std::filesystem::path& target);
  bool (*has_platform_data)(const nlohmann::json& context);
  CompatibilityReport (*validate_compatibility)(const nlohmann::json& context,
                                                const std::filesystem::path& target);
  std::vector<WriteUnit> (*plan)(const nlohmann::json& context, const std::filesystem::path& target);
  bool (*undeploy)(const std::filesystem::path& target);
};

const DeployerStrategy& deployer_for(Platform platform);
const DeployerStrategy& kiro_deployer();
const DeployerStrategy& claude_code_deployer();

// Shared by the strategies: existing directory the process may write into.
bool is_writable_directory(const std::filesystem::path& target);
// Removes <target>/<config_root>. False when absent or on failure.
bool remove_config_root(const std::filesystem::path& target, const char* config_root);
// Removes the named files under the target. True when any was removed.
// Throws FilesystemError.
bool remove_root_files(const std::filesystem::path& target, const std::vector<std::string>& names);
// A single path segment without separators or dot-dot.
bool is_safe_entry_name(const std::string& name);
// Walks nested object keys; null when a key is missing or the value is null.
const nlohmann::json* find_section(const nlohmann::json& root, std::initializer_list<const char*> keys);
// Strings verbatim, anything else as indented JSON.
std::string entry_text(const nlohmann::json& value);

// Existing files are kept unless `overwrite` is set, which wins over
// `preserve_existing`. `preserve_existing` states the default explicitly.
struct DeployOptions {
  bool dry_run = false;
  bool backup = true;
  bool overwrite = false;
  bool preserve_existing = false;
};

DeployOptions deploy_options_from(const DeployConfig& config);

// Collaborators handed to deploy. A null backup manager disables backups.
struct DeployServices {
  BackupManager* backups = nullptr;
  ParallelOptions parallel;
};

struct DeployedItem {
  std::string type;
  std::string path;
  // created or updated. Skipped files show up as warnings instead.
  std::string status;
};

struct DeployError {
  std::string item;
  std::string error;
  bool recoverable = true;
};

struct DeploymentResult {
  bool success = false;
  std::vector<DeployedItem> deployed_items;
  std::vector<std::string> warnings;
  std::vector<DeployError> errors;
  bool rollback_available = false;
  std::string backup_id;
};

nlohmann::json to_json(const DeploymentResult& result);

// Bad targets and contexts without platform data come back as unrecoverable
// errors in the result, before anything is written. With backups enabled the
// config root, the platform's root files and any planned path that already
// exists are snapshotted relative to the target first. Planned units that
// share a path collapse to the last one, with a warning.
DeploymentResult deploy(Platform platform, const nlohmann::json& context, const std::filesystem::path& target,
                        const DeployOptions& options = {}, const DeployServices& services = {});

bool undeploy(Platform platform, const std::filesystem::path& target);

// Removes the platform config root and root files, then restores the
// pre-deploy snapshot into the target. Throws ValidationError without a
// backup manager, NotFoundError for an id outside the platform.
RestoreResult rollback_deployment(Platform platform, const std::filesystem::path& target,
                                  const std::string& backup_id, const DeployServices& services);

} // namespace taptik
