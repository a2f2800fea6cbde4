#include "taptik/backup.h"
#include "taptik/config.h"
#include "taptik/deploy.h"
#include "taptik/errors.h"
#include "taptik/log.h"
#include "taptik/migration.h"
#include "taptik/package.h"
#include "taptik/paths.h"
#include "taptik/serialization.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

struct Session {
  taptik::ResolvedPaths paths;
  taptik::TaptikConfig config;
};

struct UsageError {
  std::string message;
};

fs::path backups_root(const Session& session) {
  return session.config.backup.root.empty() ? session.paths.backups_dir : session.config.backup.root;
}

void print_usage() {
  std::cerr << "Usage:\n"
            << "  taptikctl package --context <ctx.json> --title <t> --out <file> [--compression gzip|brotli|none]"
               " [--optimize] [--sha512] [--chunk-size <n>]\n"
            << "  taptikctl inspect <file>\n"
            << "  taptikctl migrate --context <in> --out <out>\n"
            << "  taptikctl schema-info <version>\n"
            << "  taptikctl backup create --source <dir> --platform <p> [--compress] [--encrypt-key <k>]"
               " [--max-backups <n>]\n"
            << "  taptikctl backup list [--platform <p>]\n"
            << "  taptikctl backup restore <id> --target <dir> [--strategy <s>] [--dry-run] [--overwrite] [--key <k>]\n"
            << "  taptikctl backup verify <id>\n"
            << "  taptikctl backup delete <id>\n"
            << "  taptikctl backup compare <id> --current <dir>\n"
            << "  taptikctl deploy --platform <p> (--package <file> | --context <ctx.json>) --target <dir>"
               " [--dry-run] [--no-backup] [--overwrite] [--preserve]\n"
            << "  taptikctl undeploy --platform <p> --target <dir>\n"
            << "  taptikctl rollback --platform <p> --target <dir> --backup <id>\n"
            << "Global options: --config <file> --workdir <dir> --verbose\n";
}

void emit(const json& doc) {
  std::cout << doc.dump(2) << "\n";
}

// Pulls `--name value` pairs and bare flags out of the argument list.
class Args {
 public:
  explicit Args(std::vector<std::string> args) : args_(std::move(args)) {}

  std::optional<std::string> value(const std::string& name) {
    for (size_t i = 0; i < args_.size(); ++i) {
      if (args_[i] != name) continue;
      if (i + 1 >= args_.size()) throw UsageError{name + " requires a value"};
      std::string out = args_[i + 1];
      args_.erase(args_.begin() + static_cast<std::ptrdiff_t>(i), args_.begin() + static_cast<std::ptrdiff_t>(i) + 2);
      return out;
    }
    return std::nullopt;
  }

  std::string required(const std::string& name) {
    auto out = value(name);
    if (!out) throw UsageError{"missing " + name};
    return *out;
  }

  bool flag(const std::string& name) {
    for (size_t i = 0; i < args_.size(); ++i) {
      if (args_[i] == name) {
        args_.erase(args_.begin() + static_cast<std::ptrdiff_t>(i));
        return true;
      }
    }
    return false;
  }

  std::string positional(const std::string& what) {
    for (size_t i = 0; i < args_.size(); ++i) {
      if (args_[i].rfind("--", 0) == 0) continue;
      std::string out = args_[i];
      args_.erase(args_.begin() + static_cast<std::ptrdiff_t>(i));
      return out;
    }
    throw UsageError{"missing " + what};
  }

 private:
  std::vector<std::string> args_;
};

size_t parse_count(const std::string& text, const std::string& name) {
  char* end = nullptr;
  const unsigned long long value = std::strtoull(text.c_str(), &end, 10);
  if (text.empty() || *end != '\0') throw UsageError{name + " expects a number"};
  return static_cast<size_t>(value);
}

int cmd_package(Session& session, Args& args) {
  const fs::path context_path = args.required("--context");
  taptik::CloudMetadata metadata;
  metadata.title = args.required("--title");
  const fs::path out = args.required("--out");

  taptik::PackageOptions options = taptik::package_options_from(session.config.package);
  if (auto compression = args.value("--compression")) {
    options.compression = taptik::compression_from_string(*compression);
  }
  options.optimize_size = options.optimize_size || args.flag("--optimize");
  options.include_sha512 = options.include_sha512 || args.flag("--sha512");
  const auto chunk_size = args.value("--chunk-size");

  const json context = taptik::read_json_file(context_path);
  const taptik::TaptikPackage pkg = taptik::create_package(metadata, context, options);
  taptik::write_package(pkg, out);

  json report = {{"package", out.string()},
                 {"format", pkg.format},
                 {"compression", taptik::to_string(pkg.compression)},
                 {"checksum", pkg.checksum},
                 {"size", pkg.size},
                 {"files", pkg.manifest.files.size()}};
  if (!pkg.metadata.description.empty()) report["description"] = pkg.metadata.description;

  if (chunk_size) {
    const taptik::ChunkedPackage chunked =
        taptik::create_chunked_package(pkg, parse_count(*chunk_size, "--chunk-size"));
    for (size_t i = 0; i < chunked.chunks.size(); ++i) {
      taptik::write_file_atomic(out.string() + ".part" + std::to_string(i), chunked.chunks[i]);
    }
    taptik::write_json_file(out.string() + ".chunks.json", taptik::to_json(chunked.metadata));
    report["chunks"] = taptik::to_json(chunked.metadata);
  }
  emit(report);
  return 0;
}

int cmd_inspect(Session&, Args& args) {
  const fs::path file = args.positional("<file>");
  const taptik::TaptikPackage pkg = taptik::read_package(file);
  const taptik::SchemaMigrator migrator;
  const std::string version = migrator.detect_version(pkg.sanitized_config);
  json report = taptik::to_json(pkg);
  report.erase("sanitizedConfig");
  report["schemaVersion"] = version;
  report["compatibility"] = taptik::to_json(migrator.is_compatible(version));
  report["integrity"] = taptik::validate_package_integrity(pkg);
  emit(report);
  return 0;
}

int cmd_migrate(Session&, Args& args) {
  const fs::path in = args.required("--context");
  const fs::path out = args.required("--out");
  const json context = taptik::read_json_file(in);
  const taptik::SchemaMigrator migrator;
  const std::string from = migrator.detect_version(context);
  const json migrated = migrator.migrate_to_latest(context);
  const taptik::MigrationValidationResult validation = migrator.validate_migration(context, migrated);
  taptik::write_json_file(out, migrated);
  emit({{"from", from},
        {"to", migrator.current_version()},
        {"path", migrator.get_migration_path(from, migrator.current_version())},
        {"validation", taptik::to_json(validation)},
        {"out", out.string()}});
  return validation.passed ? 0 : 2;
}

int cmd_schema_info(Session&, Args& args) {
  const std::string version = args.positional("<version>");
  emit(taptik::to_json(taptik::SchemaMigrator().get_schema_info(version)));
  return 0;
}

int cmd_backup(Session& session, Args& args) {
  const std::string sub = args.positional("backup subcommand");
  taptik::BackupRegistry registry(backups_root(session));
  registry.initialize();
  taptik::BackupManager manager(registry);

  if (sub == "create") {
    const fs::path source = args.required("--source");
    const std::string platform = args.required("--platform");
    taptik::BackupOptions options = taptik::backup_options_from(session.config.backup);
    options.compress = options.compress || args.flag("--compress");
    if (auto key = args.value("--encrypt-key")) {
      options.encrypt = true;
      options.encryption_key = *key;
    }
    if (auto max = args.value("--max-backups")) {
      options.max_backups = parse_count(*max, "--max-backups");
    }
    emit(taptik::to_json(manager.create_backup(source, platform, options)));
    return 0;
  }
  if (sub == "list") {
    json out = json::array();
    for (const auto& m : manager.list_backups(args.value("--platform").value_or(""))) {
      out.push_back(taptik::to_json(m));
    }
    emit(out);
    return 0;
  }
  if (sub == "restore") {
    const std::string id = args.positional("<id>");
    const fs::path target = args.required("--target");
    taptik::RestoreOptions options;
    if (auto strategy = args.value("--strategy")) {
      options.conflict_strategy = taptik::conflict_strategy_from_string(*strategy);
    }
    options.dry_run = args.flag("--dry-run");
    options.overwrite = args.flag("--overwrite");
    options.decryption_key = args.value("--key").value_or("");
    const taptik::RestoreResult result = manager.restore_backup(id, target, options);
    emit(taptik::to_json(result));
    return result.success ? 0 : 2;
  }
  if (sub == "verify") {
    const std::string id = args.positional("<id>");
    const auto found = registry.find(id);
    if (!found) throw taptik::NotFoundError("Backup not found: " + id);
    const bool valid = manager.verify_backup(*found);
    emit({{"id", id}, {"valid", valid}});
    return valid ? 0 : 2;
  }
  if (sub == "delete") {
    const std::string id = args.positional("<id>");
    const bool deleted = manager.delete_backup(id);
    emit({{"id", id}, {"deleted", deleted}});
    return deleted ? 0 : 2;
  }
  if (sub == "compare") {
    const std::string id = args.positional("<id>");
    const fs::path current = args.required("--current");
    emit(taptik::to_json(manager.compare_with_current(id, current)));
    return 0;
  }
  throw UsageError{"unknown backup subcommand: " + sub};
}

json load_deploy_context(Args& args) {
  const auto package = args.value("--package");
  const auto context = args.value("--context");
  if (package.has_value() == context.has_value()) {
    throw UsageError{"deploy needs exactly one of --package or --context"};
  }
  const json raw = package ? taptik::read_package(*package).sanitized_config : taptik::read_json_file(*context);
  const taptik::SchemaMigrator migrator;
  const taptik::CompatibilityResult compat = migrator.is_compatible(migrator.detect_version(raw));
  if (!compat.migration_required) return raw;
  taptik::log::info("Migrating context to schema " + migrator.current_version());
  return migrator.migrate_to_latest(raw);
}

int cmd_deploy(Session& session, Args& args) {
  const taptik::Platform platform = taptik::platform_from_string(args.required("--platform"));
  const fs::path target = args.required("--target");
  const json context = load_deploy_context(args);

  taptik::DeployOptions options = taptik::deploy_options_from(session.config.deploy);
  options.dry_run = args.flag("--dry-run");
  if (args.flag("--no-backup")) options.backup = false;
  options.overwrite = args.flag("--overwrite");
  options.preserve_existing = args.flag("--preserve");

  taptik::BackupRegistry registry(backups_root(session));
  registry.initialize();
  taptik::BackupManager manager(registry);

  taptik::DeployServices services;
  services.backups = &manager;
  services.parallel.max_concurrency = session.config.deploy.max_concurrency;
  services.parallel.batch_size = session.config.deploy.batch_size;

  const taptik::DeploymentResult result = taptik::deploy(platform, context, target, options, services);
  emit(taptik::to_json(result));
  return result.success ? 0 : 2;
}

int cmd_undeploy(Session&, Args& args) {
  const taptik::Platform platform = taptik::platform_from_string(args.required("--platform"));
  const fs::path target = args.required("--target");
  const bool removed = taptik::undeploy(platform, target);
  emit({{"platform", taptik::to_string(platform)}, {"target", target.string()}, {"removed", removed}});
  return removed ? 0 : 2;
}

int cmd_rollback(Session& session, Args& args) {
  const taptik::Platform platform = taptik::platform_from_string(args.required("--platform"));
  const fs::path target = args.required("--target");
  const std::string backup_id = args.required("--backup");

  taptik::BackupRegistry registry(backups_root(session));
  registry.initialize();
  taptik::BackupManager manager(registry);
  taptik::DeployServices services;
  services.backups = &manager;

  const taptik::RestoreResult result = taptik::rollback_deployment(platform, target, backup_id, services);
  emit(taptik::to_json(result));
  return result.success ? 0 : 2;
}

json error_json(const taptik::Error& e) {
  return {{"error",
           {{"kind", taptik::to_string(e.kind())},
            {"code", e.code()},
            {"message", e.what()},
            {"suggestions", e.suggestions()}}}};
}

int main(int argc, char** argv) {
  Session session;
  int rc = 0;
  try {
    Args args(std::vector<std::string>(argv + 1, argv + argc));
    const auto config_path = args.value("--config");
    const auto workdir = args.value("--workdir");
    const bool verbose = args.flag("--verbose");
    const std::string command = args.positional("command");

    session.paths = taptik::resolve_paths(workdir ? std::optional<fs::path>(*workdir) : std::nullopt);
    taptik::log::init("taptikctl", session.paths.workdir);
    session.config = taptik::load_taptik_config(config_path ? fs::path(*config_path) : session.paths.config_file);
    taptik::log::set_level(verbose ? taptik::log::Level::Debug : session.config.log_level);

    if (command == "package") {
      rc = cmd_package(session, args);
    } else if (command == "inspect") {
      rc = cmd_inspect(session, args);
    } else if (command == "migrate") {
      rc = cmd_migrate(session, args);
    } else if (command == "schema-info") {
      rc = cmd_schema_info(session, args);
    } else if (command == "backup") {
      rc = cmd_backup(session, args);
    } else if (command == "deploy") {
      rc = cmd_deploy(session, args);
    } else if (command == "undeploy") {
      rc = cmd_undeploy(session, args);
    } else if (command == "rollback") {
      rc = cmd_rollback(session, args);
    } else {
      throw UsageError{"unknown command: " + command};
    }
  } catch (const UsageError& e) {
    std::cerr << "taptikctl: " << e.message << "\n";
    print_usage();
    rc = 1;
  } catch (const taptik::Error& e) {
    taptik::log::error(e.what());
    emit(error_json(e));
    rc = 2;
  } catch (const std::exception& e) {
    taptik::log::error(e.what());
    emit({{"error", {{"kind", "internal"}, {"message", e.what()}}}});
    rc = 2;
  }
  taptik::log::shutdown();
  return rc;
}
