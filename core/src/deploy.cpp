#include "taptik/deploy.h"

#include "taptik/errors.h"
#include "taptik/log.h"
#include "taptik/serialization.h"

#include <map>
#include <mutex>
#include <set>
#include <unistd.h>

namespace taptik {

namespace fs = std::filesystem;

namespace {

enum class WriteDecision { Create, Update, Skip };

WriteDecision decide_write(const fs::path& path, const DeployOptions& options) {
  std::error_code ec;
  if (!fs::exists(path, ec)) return WriteDecision::Create;
  if (options.overwrite) return WriteDecision::Update;
  // preserve_existing and the default agree here.
  return WriteDecision::Skip;
}

bool has_regular_file(const fs::path& dir) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return false;
  for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file(ec)) return true;
  }
  return false;
}

// Paths relative to the target that a rollback has to bring back.
std::vector<std::string> snapshot_paths(const DeployerStrategy& strategy, const fs::path& target,
                                        const std::vector<WriteUnit>& units) {
  std::set<std::string> paths;
  if (has_regular_file(target / strategy.config_root)) {
    paths.insert(strategy.config_root);
  }
  std::error_code ec;
  for (const auto& name : strategy.root_files) {
    if (fs::is_regular_file(target / name, ec)) paths.insert(name);
  }
  const fs::path config_root = fs::path(strategy.config_root);
  for (const auto& unit : units) {
    if (!fs::is_regular_file(unit.path, ec)) continue;
    const fs::path rel = unit.path.lexically_relative(target);
    if (rel.empty() || *rel.begin() == config_root || *rel.begin() == fs::path("..")) continue;
    paths.insert(rel.generic_string());
  }
  return {paths.begin(), paths.end()};
}

// Keeps the last unit for each path, in plan order.
std::vector<WriteUnit> unique_by_path(const std::vector<WriteUnit>& units, std::vector<std::string>& warnings) {
  std::map<fs::path, size_t> last;
  for (size_t i = 0; i < units.size(); ++i) {
    last[units[i].path.lexically_normal()] = i;
  }
  std::vector<WriteUnit> out;
  out.reserve(last.size());
  for (size_t i = 0; i < units.size(); ++i) {
    if (last[units[i].path.lexically_normal()] == i) {
      out.push_back(units[i]);
    } else {
      warnings.push_back("Duplicate entry for " + units[i].path.string() + ", keeping the last definition");
    }
  }
  return out;
}

DeployError hard_error(const std::string& item, const std::string& message) {
  log::error(message);
  return {item, message, false};
}

} // namespace

const char* to_string(Platform platform) {
  switch (platform) {
    case Platform::Kiro: return "kiro";
    case Platform::ClaudeCode: return "claude-code";
  }
  return "unknown";
}

Platform platform_from_string(const std::string& text) {
  if (text == "kiro") return Platform::Kiro;
  if (text == "claude-code" || text == "claudeCode" || text == "claude") return Platform::ClaudeCode;
  throw ValidationError("Unsupported platform: " + text, {"Use one of: kiro, claude-code"});
}

nlohmann::json to_json(const CompatibilityReport& report) {
  return {{"compatible", report.compatible}, {"issues", report.issues}};
}

const DeployerStrategy& deployer_for(Platform platform) {
  switch (platform) {
    case Platform::Kiro: return kiro_deployer();
    case Platform::ClaudeCode: return claude_code_deployer();
  }
  throw ValidationError("Unsupported platform");
}

bool is_writable_directory(const fs::path& target) {
  std::error_code ec;
  if (target.empty() || !fs::is_directory(target, ec) || ec) {
    log::warn("Deploy target is not a directory: " + target.string());
    return false;
  }
  if (::access(target.c_str(), W_OK) != 0) {
    log::warn("Deploy target is not writable: " + target.string());
    return false;
  }
  return true;
}

bool remove_config_root(const fs::path& target, const char* config_root) {
  const fs::path root = target / config_root;
  std::error_code ec;
  if (!fs::exists(root, ec)) {
    log::info("Nothing to undeploy at " + root.string());
    return false;
  }
  fs::remove_all(root, ec);
  if (ec) {
    log_error_info(classify_filesystem_error(ec, "removing configuration", root));
    return false;
  }
  log::info("Removed " + root.string());
  return true;
}

bool remove_root_files(const fs::path& target, const std::vector<std::string>& names) {
  bool removed = false;
  for (const auto& name : names) {
    const fs::path path = target / name;
    std::error_code ec;
    if (!fs::exists(path, ec)) continue;
    fs::remove(path, ec);
    if (ec) {
      log_error_info(classify_filesystem_error(ec, "removing configuration", path));
      throw FilesystemError(ec, "removing configuration", path);
    }
    log::info("Removed " + path.string());
    removed = true;
  }
  return removed;
}

bool is_safe_entry_name(const std::string& name) {
  if (name.empty() || name == "." || name == "..") return false;
  return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

const nlohmann::json* find_section(const nlohmann::json& root, std::initializer_list<const char*> keys) {
  const nlohmann::json* node = &root;
  for (const char* key : keys) {
    if (!node->is_object()) return nullptr;
    auto it = node->find(key);
    if (it == node->end()) return nullptr;
    node = &*it;
  }
  return node->is_null() ? nullptr : node;
}

std::string entry_text(const nlohmann::json& value) {
  if (value.is_string()) return value.get<std::string>();
  return value.dump(2);
}

DeployOptions deploy_options_from(const DeployConfig& config) {
  DeployOptions options;
  options.backup = config.backup;
  return options;
}

nlohmann::json to_json(const DeploymentResult& result) {
  nlohmann::json items = nlohmann::json::array();
  for (const auto& item : result.deployed_items) {
    items.push_back({{"type", item.type}, {"path", item.path}, {"status", item.status}});
  }
  nlohmann::json errors = nlohmann::json::array();
  for (const auto& e : result.errors) {
    errors.push_back({{"item", e.item}, {"error", e.error}, {"recoverable", e.recoverable}});
  }
  nlohmann::json out = {{"success", result.success},
                        {"deployedItems", items},
                        {"warnings", result.warnings},
                        {"errors", errors},
                        {"rollbackAvailable", result.rollback_available}};
  if (!result.backup_id.empty()) out["backupId"] = result.backup_id;
  return out;
}

DeploymentResult deploy(Platform platform, const nlohmann::json& context, const fs::path& target,
                        const DeployOptions& options, const DeployServices& services) {
  const DeployerStrategy& strategy = deployer_for(platform);
  DeploymentResult result;
  log::info(std::string("Deploying to ") + strategy.name + " at " + target.string() +
            (options.dry_run ? " (dry run)" : ""));

  if (!strategy.can_deploy(target)) {
    result.errors.push_back(hard_error("target", "Target path is not valid or writable"));
    return result;
  }
  if (!strategy.has_platform_data(context)) {
    result.errors.push_back(
        hard_error("context", std::string("No ") + strategy.name + " configuration found in context"));
    return result;
  }

  const CompatibilityReport report = strategy.validate_compatibility(context, target);
  for (const auto& issue : report.issues) {
    result.warnings.push_back(issue);
  }

  const std::vector<WriteUnit> units = unique_by_path(strategy.plan(context, target), result.warnings);

  const std::vector<std::string> snapshot =
      options.backup && !options.dry_run && services.backups ? snapshot_paths(strategy, target, units)
                                                              : std::vector<std::string>{};
  if (!snapshot.empty()) {
    BackupOptions backup_options;
    backup_options.include_paths = snapshot;
    try {
      const BackupMetadata backup = services.backups->create_backup(target, to_string(platform), backup_options);
      result.backup_id = backup.id;
      result.rollback_available = true;
    } catch (const Error& e) {
      result.errors.push_back(hard_error("backup", std::string("Failed to create backup: ") + e.what()));
      return result;
    }
  }

  std::mutex result_mutex;
  std::vector<ParallelOperation> operations;
  operations.reserve(units.size());
  for (const auto& unit : units) {
    ParallelOperation op;
    op.id = unit.path.string();
    op.type = unit.type;
    op.run = [&result, &result_mutex, &options, &unit]() {
      const WriteDecision decision = decide_write(unit.path, options);
      if (decision == WriteDecision::Skip) {
        std::lock_guard<std::mutex> lock(result_mutex);
        result.warnings.push_back("Skipped existing file: " + unit.path.string());
        return;
      }
      if (!options.dry_run) {
        write_file_atomic(unit.path, unit.contents);
      }
      std::lock_guard<std::mutex> lock(result_mutex);
      result.deployed_items.push_back(
          {unit.type, unit.path.string(), decision == WriteDecision::Create ? "created" : "updated"});
    };
    operations.push_back(std::move(op));
  }

  ParallelOptions parallel = services.parallel;
  parallel.dry_run = false;
  const ParallelResult run = ParallelBatchProcessor(parallel).run(operations);
  for (const auto& e : run.errors) {
    result.errors.push_back({e.id, "Failed to deploy " + e.id + ": " + e.message, true});
  }

  result.success = result.errors.empty();
  log::info("Deployment " + std::string(result.success ? "completed" : "finished with errors") + ": " +
            std::to_string(result.deployed_items.size()) + " items, " + std::to_string(result.warnings.size()) +
            " warnings, " + std::to_string(result.errors.size()) + " errors");
  return result;
}

bool undeploy(Platform platform, const fs::path& target) {
  return deployer_for(platform).undeploy(target);
}

RestoreResult rollback_deployment(Platform platform, const fs::path& target, const std::string& backup_id,
                                  const DeployServices& services) {
  if (!services.backups) {
    throw ValidationError("Rollback requires a backup manager");
  }
  const DeployerStrategy& strategy = deployer_for(platform);
  bool known = false;
  for (const auto& m : services.backups->list_backups(to_string(platform))) {
    known = known || m.id == backup_id;
  }
  if (!known) {
    throw NotFoundError("Backup not found: " + backup_id);
  }
  log::info(std::string("Rolling back ") + strategy.name + " deployment at " + target.string() + " from " +
            backup_id);
  remove_config_root(target, strategy.config_root);
  remove_root_files(target, strategy.root_files);
  RestoreOptions options;
  options.overwrite = true;
  options.conflict_strategy = ConflictStrategy::Overwrite;
  return services.backups->restore_backup(backup_id, target, options);
}

} // namespace taptik
