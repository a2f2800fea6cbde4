#include "taptik/backup.h"
#include "taptik/deploy.h"
#include "taptik/errors.h"
#include "taptik/log.h"

#include "test_util.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <set>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;
using taptik_test::check;
using taptik_test::read_text;
using taptik_test::write_text;

namespace {

json kiro_context() {
  json ctx;
  ctx["metadata"] = {{"version", "1.2.0"}};
  ctx["content"]["project"]["kiro_specs"] = json::array(
      {{{"name", "auth"}, {"requirements", "# Requirements"}, {"design", "# Design"}, {"tasks", "- [ ] login"}}});
  ctx["content"]["ide"]["kiro"] = {
      {"steering_rules", json::array({{{"name", "style"}, {"rules", json::array({"Use tabs", "Be terse"})}}})},
      {"hooks", json::array({{{"name", "on-save"}, {"trigger", "save"}}})},
      {"mcp_settings", {{"servers", json::object()}}},
      {"project_settings", {{"language", "cpp"}}}};
  return ctx;
}

json claude_context() {
  json ctx;
  ctx["metadata"] = {{"version", "1.2.0"}};
  ctx["content"]["ide"]["claude-code"] = {
      {"settings", {{"theme", "dark"}}},
      {"agents", json::array({{{"name", "reviewer"}, {"content", "Review carefully."}}})},
      {"commands", {{"ship", "Run the release checklist."}}},
      {"mcp_servers", {{"mcpServers", {{"fs", {{"command", "mcp-fs"}}}}}}},
      {"claude_md", "# Project rules"}};
  return ctx;
}

std::set<std::string> item_paths(const taptik::DeploymentResult& result, const fs::path& base) {
  std::set<std::string> out;
  for (const auto& item : result.deployed_items) {
    out.insert(fs::path(item.path).lexically_relative(base).generic_string());
  }
  return out;
}

bool all_status(const taptik::DeploymentResult& result, const std::string& status) {
  return std::all_of(result.deployed_items.begin(), result.deployed_items.end(),
                     [&](const taptik::DeployedItem& item) { return item.status == status; });
}

} // namespace

int main() {
  taptik::log::set_level(taptik::log::Level::Warn);
  int failures = 0;

  // Test: platform names and table lookup.
  {
    check(failures, std::string(taptik::to_string(taptik::Platform::ClaudeCode)) == "claude-code", "platform name");
    check(failures, taptik::platform_from_string("kiro") == taptik::Platform::Kiro, "kiro parses");
    check(failures, std::string(taptik::deployer_for(taptik::Platform::Kiro).config_root) == ".kiro",
          "kiro config root");
    bool threw = false;
    try {
      taptik::platform_from_string("vim");
    } catch (const taptik::ValidationError&) {
      threw = true;
    }
    check(failures, threw, "unknown platform rejected");
  }

  // Test: Kiro deploy writes one item per spec file, rule, hook and setting.
  {
    taptik_test::TempDir dir("deploy_kiro");
    taptik::DeployServices services;
    services.parallel.max_concurrency = 2;
    services.parallel.batch_size = 2;
    const auto result = taptik::deploy(taptik::Platform::Kiro, kiro_context(), dir.path, {}, services);
    check(failures, result.success && result.errors.empty(), "kiro deploy succeeds");
    const std::set<std::string> expected = {
        ".kiro/specs/auth/requirements.md", ".kiro/specs/auth/design.md", ".kiro/specs/auth/tasks.md",
        ".kiro/steering/style.md",          ".kiro/hooks/on-save.json",   ".kiro/settings/mcp.json",
        ".kiro/settings/project.json"};
    check(failures, item_paths(result, dir.path) == expected, "kiro deployed item set");
    check(failures, all_status(result, "created"), "fresh files are created");
    check(failures, read_text(dir.path / ".kiro/steering/style.md") == "Use tabs\nBe terse", "rules joined");
    check(failures, json::parse(read_text(dir.path / ".kiro/hooks/on-save.json"))["trigger"] == "save",
          "hook json written");
    check(failures, !result.rollback_available, "no backup without manager");

    // Second run without overwrite skips everything with a warning per file.
    const auto again = taptik::deploy(taptik::Platform::Kiro, kiro_context(), dir.path);
    check(failures, again.success && again.deployed_items.empty(), "existing files skipped");
    check(failures, again.warnings.size() == expected.size(), "one warning per skipped file");
    check(failures, again.warnings.empty() || again.warnings.front().rfind("Skipped existing file: ", 0) == 0,
          "skip warning text");

    taptik::DeployOptions keep;
    keep.preserve_existing = true;
    const auto kept = taptik::deploy(taptik::Platform::Kiro, kiro_context(), dir.path, keep);
    check(failures, kept.deployed_items.empty() && kept.warnings.size() == expected.size(),
          "preserve_existing keeps existing files");

    taptik::DeployOptions preserve;
    preserve.preserve_existing = true;
    preserve.overwrite = true;
    const auto forced = taptik::deploy(taptik::Platform::Kiro, kiro_context(), dir.path, preserve);
    check(failures, forced.deployed_items.size() == expected.size() && all_status(forced, "updated"),
          "overwrite wins over preserve");
  }

  // Test: dry run accounts for every item and writes nothing.
  {
    taptik_test::TempDir dir("deploy_dry");
    taptik::DeployOptions options;
    options.dry_run = true;
    const auto result = taptik::deploy(taptik::Platform::Kiro, kiro_context(), dir.path, options);
    check(failures, result.success && result.deployed_items.size() == 7, "dry run item count");
    check(failures, !fs::exists(dir.path / ".kiro"), "dry run leaves target untouched");
  }

  // Test: hard errors come back in the result.
  {
    taptik_test::TempDir dir("deploy_errors");
    const auto missing_target =
        taptik::deploy(taptik::Platform::Kiro, kiro_context(), dir.path / "does-not-exist");
    check(failures, !missing_target.success && missing_target.errors.size() == 1 &&
                        missing_target.errors[0].error == "Target path is not valid or writable" &&
                        !missing_target.errors[0].recoverable,
          "invalid target reported");

    const auto no_kiro = taptik::deploy(taptik::Platform::Kiro, claude_context(), dir.path);
    check(failures, !no_kiro.success && no_kiro.errors.size() == 1 &&
                        no_kiro.errors[0].error == "No Kiro configuration found in context",
          "missing kiro data reported");
    const auto no_claude = taptik::deploy(taptik::Platform::ClaudeCode, kiro_context(), dir.path);
    check(failures, !no_claude.success && no_claude.errors[0].error == "No Claude Code configuration found in context",
          "missing claude data reported");
    check(failures, fs::is_empty(dir.path), "hard errors write nothing");
  }

  // Test: compatibility issues accumulate.
  {
    taptik_test::TempDir dir("deploy_compat");
    write_text(dir.path / ".kiro" / "custom" / "notes.txt", "mine");
    const auto& kiro = taptik::kiro_deployer();
    const auto report = kiro.validate_compatibility(json::object(), dir.path / "missing");
    check(failures, !report.compatible && report.issues.size() == 2, "missing data and bad target both reported");
    const auto custom = kiro.validate_compatibility(kiro_context(), dir.path);
    check(failures, !custom.compatible && custom.issues.size() == 1 &&
                        custom.issues[0] == "Existing Kiro configuration has customizations that may be overwritten",
          "customizations detected");
    check(failures, kiro.can_deploy(dir.path) && !kiro.can_deploy(dir.path / "missing"), "can_deploy");
  }

  // Test: Claude Code layout and undeploy.
  {
    taptik_test::TempDir dir("deploy_claude");
    const auto result = taptik::deploy(taptik::Platform::ClaudeCode, claude_context(), dir.path);
    check(failures, result.success, "claude deploy succeeds");
    const std::set<std::string> expected = {".claude/settings.json", ".claude/agents/reviewer.md",
                                            ".claude/commands/ship.md", ".mcp.json", "CLAUDE.md"};
    check(failures, item_paths(result, dir.path) == expected, "claude deployed item set");
    check(failures, read_text(dir.path / "CLAUDE.md") == "# Project rules", "CLAUDE.md written verbatim");
    check(failures, read_text(dir.path / ".claude/agents/reviewer.md") == "Review carefully.", "agent written");

    json legacy;
    legacy["content"]["ide"]["claudeCode"] = {{"settings", {{"model", "opus"}}}};
    taptik_test::TempDir other("deploy_claude_legacy");
    const auto fallback = taptik::deploy(taptik::Platform::ClaudeCode, legacy, other.path);
    check(failures, fallback.success && fallback.deployed_items.size() == 1, "claudeCode key accepted");

    check(failures, taptik::undeploy(taptik::Platform::ClaudeCode, dir.path), "claude undeploy");
    check(failures, !fs::exists(dir.path / ".claude") && !fs::exists(dir.path / "CLAUDE.md") &&
                        !fs::exists(dir.path / ".mcp.json"),
          "claude files removed");
    check(failures, !taptik::undeploy(taptik::Platform::ClaudeCode, dir.path), "second undeploy is false");
    check(failures, !taptik::undeploy(taptik::Platform::Kiro, dir.path), "undeploy without deployment is false");
  }

  // Test: entries sharing a path collapse to the last definition.
  {
    json ctx;
    ctx["content"]["ide"]["claude-code"]["agents"] = json::array();
    for (int i = 0; i < 6; ++i) {
      ctx["content"]["ide"]["claude-code"]["agents"].push_back(
          {{"name", "reviewer"}, {"content", "version " + std::to_string(i)}});
    }
    taptik::DeployServices services;
    services.parallel.max_concurrency = 6;
    services.parallel.batch_size = 1;
    bool stable = true;
    for (int run = 0; run < 20 && stable; ++run) {
      taptik_test::TempDir dir("deploy_duplicates");
      const auto result = taptik::deploy(taptik::Platform::ClaudeCode, ctx, dir.path, {}, services);
      stable = result.success && result.errors.empty() && result.deployed_items.size() == 1 &&
               result.warnings.size() == 5 &&
               read_text(dir.path / ".claude/agents/reviewer.md") == "version 5";
    }
    check(failures, stable, "duplicate agents deploy one file deterministically");

    json hooks = kiro_context();
    hooks["content"]["ide"]["kiro"]["hooks"] = {{"lint", {{"trigger", "a"}}}, {"lint.json", {{"trigger", "b"}}}};
    taptik_test::TempDir dir("deploy_duplicate_hooks");
    const auto result = taptik::deploy(taptik::Platform::Kiro, hooks, dir.path);
    check(failures, result.success && result.deployed_items.size() == 7, "suffixed hook names merge");
    check(failures, result.warnings.size() == 1 &&
                        result.warnings[0].find("Duplicate entry for ") == 0,
          "duplicate warning");
  }

  // Test: Claude Code rollback restores the instruction and MCP files.
  {
    taptik_test::TempDir dir("deploy_claude_rollback");
    const fs::path target = dir.path / "workspace";
    write_text(target / ".claude" / "settings.json", "{\"old\":1}");
    write_text(target / "CLAUDE.md", "hand written rules");
    write_text(target / ".mcp.json", "{\"user\":true}");
    taptik::BackupRegistry registry(dir.path / "backups");
    registry.initialize();
    taptik::BackupManager manager(registry);
    taptik::DeployServices services;
    services.backups = &manager;

    taptik::DeployOptions options;
    options.overwrite = true;
    const auto result = taptik::deploy(taptik::Platform::ClaudeCode, claude_context(), target, options, services);
    check(failures, result.success && result.rollback_available, "claude backup taken");
    check(failures, read_text(target / "CLAUDE.md") == "# Project rules", "CLAUDE.md overwritten");

    const auto restored =
        taptik::rollback_deployment(taptik::Platform::ClaudeCode, target, result.backup_id, services);
    check(failures, restored.success, "claude rollback succeeds");
    check(failures, read_text(target / "CLAUDE.md") == "hand written rules", "CLAUDE.md restored");
    check(failures, read_text(target / ".mcp.json") == "{\"user\":true}", ".mcp.json restored");
    check(failures, read_text(target / ".claude" / "settings.json") == "{\"old\":1}", "settings restored");
    check(failures, !fs::exists(target / ".claude" / "agents"), "deployed agents removed");

    // A lone CLAUDE.md still gets a backup before it is replaced.
    const fs::path lone = dir.path / "lone";
    write_text(lone / "CLAUDE.md", "only file");
    const auto second = taptik::deploy(taptik::Platform::ClaudeCode, claude_context(), lone, options, services);
    check(failures, second.success && second.rollback_available && !second.backup_id.empty(),
          "backup taken for root files alone");
    taptik::rollback_deployment(taptik::Platform::ClaudeCode, lone, second.backup_id, services);
    check(failures, read_text(lone / "CLAUDE.md") == "only file", "lone CLAUDE.md restored");
    check(failures, !fs::exists(lone / ".claude") && !fs::exists(lone / ".mcp.json"),
          "files created by the deploy removed");
  }

  // Test: backup before overwrite and rollback.
  {
    taptik_test::TempDir dir("deploy_rollback");
    const fs::path target = dir.path / "workspace";
    write_text(target / ".kiro" / "steering" / "style.md", "hand written");
    taptik::BackupRegistry registry(dir.path / "backups");
    registry.initialize();
    taptik::BackupManager manager(registry);
    taptik::DeployServices services;
    services.backups = &manager;

    taptik::DeployOptions options;
    options.overwrite = true;
    const auto result = taptik::deploy(taptik::Platform::Kiro, kiro_context(), target, options, services);
    check(failures, result.success && result.rollback_available && !result.backup_id.empty(), "backup taken");
    check(failures, read_text(target / ".kiro/steering/style.md") == "Use tabs\nBe terse", "file overwritten");
    const auto json_result = taptik::to_json(result);
    check(failures, json_result["rollbackAvailable"] == true && json_result["deployedItems"].size() == 7,
          "result json");

    const auto restored = taptik::rollback_deployment(taptik::Platform::Kiro, target, result.backup_id, services);
    check(failures, restored.success, "rollback succeeds");
    check(failures, read_text(target / ".kiro/steering/style.md") == "hand written", "original file back");
    check(failures, !fs::exists(target / ".kiro/specs"), "deployed files gone after rollback");

    bool threw = false;
    try {
      taptik::rollback_deployment(taptik::Platform::Kiro, target, "backup_unknown", services);
    } catch (const taptik::NotFoundError&) {
      threw = true;
    }
    check(failures, threw && fs::exists(target / ".kiro"), "unknown backup leaves target alone");

    taptik_test::TempDir empty("deploy_nobackup");
    const auto fresh = taptik::deploy(taptik::Platform::Kiro, kiro_context(), empty.path, {}, services);
    check(failures, fresh.success && !fresh.rollback_available, "nothing to back up on a fresh target");
  }

  if (failures == 0) {
    std::cout << "test_deploy: ok\n";
  }
  return failures == 0 ? 0 : 1;
}
