#include "taptik/deploy.h"

#include "taptik/errors.h"
#include "taptik/log.h"

#include <set>

namespace taptik {

namespace fs = std::filesystem;

namespace {

constexpr const char* kClaudeRoot = ".claude";

const nlohmann::json* claude_section(const nlohmann::json& context) {
  if (const auto* section = find_section(context, {"content", "ide", "claude-code"})) return section;
  return find_section(context, {"content", "ide", "claudeCode"});
}

const nlohmann::json* first_of(const nlohmann::json& section, std::initializer_list<const char*> keys) {
  for (const char* key : keys) {
    if (const auto* value = find_section(section, {key})) return value;
  }
  return nullptr;
}

// Agents and commands come as [{name, content}] or as {name: content}.
void plan_markdown_entries(const nlohmann::json& entries, const char* type, const fs::path& dir,
                           std::vector<WriteUnit>& out) {
  auto add = [&](const std::string& name, std::string text) {
    if (!is_safe_entry_name(name)) {
      log::warn(std::string("Skipping ") + type + " with invalid name: " + name);
      return;
    }
    out.push_back({type, dir / (name + ".md"), std::move(text)});
  };
  if (entries.is_array()) {
    for (const auto& entry : entries) {
      if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) continue;
      const auto content = entry.find("content");
      add(entry["name"].get<std::string>(), content != entry.end() ? entry_text(*content) : entry.dump(2));
    }
  } else if (entries.is_object()) {
    for (auto it = entries.begin(); it != entries.end(); ++it) {
      add(it.key(), entry_text(it.value()));
    }
  }
}

bool has_customizations(const fs::path& root) {
  static const std::set<std::string> kStandard = {"settings.json", "settings.local.json", "agents", "commands"};
  std::error_code ec;
  bool custom = false;
  for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
    custom = custom || !kStandard.count(it->path().filename().string());
  }
  if (ec) log::warn("Failed to analyze existing structure: " + ec.message());
  return custom;
}

bool claude_can_deploy(const fs::path& target) {
  return is_writable_directory(target);
}

bool claude_has_data(const nlohmann::json& context) {
  return claude_section(context) != nullptr;
}

CompatibilityReport claude_validate(const nlohmann::json& context, const fs::path& target) {
  CompatibilityReport report;
  if (!claude_has_data(context)) {
    report.issues.push_back("No Claude Code configuration found in context");
  }
  if (!claude_can_deploy(target)) {
    report.issues.push_back("Target path is not valid or writable");
  }
  std::error_code ec;
  if (fs::is_directory(target / kClaudeRoot, ec) && has_customizations(target / kClaudeRoot)) {
    report.issues.push_back("Existing Claude Code configuration has customizations that may be overwritten");
  }
  if (fs::exists(target / "CLAUDE.md", ec)) {
    report.issues.push_back("CLAUDE.md already exists and may be overwritten");
  }
  report.compatible = report.issues.empty();
  return report;
}

std::vector<WriteUnit> claude_plan(const nlohmann::json& context, const fs::path& target) {
  std::vector<WriteUnit> units;
  const nlohmann::json* claude = claude_section(context);
  if (!claude || !claude->is_object()) return units;
  const fs::path root = target / kClaudeRoot;

  if (const auto* settings = first_of(*claude, {"settings"})) {
    units.push_back({"setting", root / "settings.json", settings->dump(2)});
  }
  if (const auto* agents = first_of(*claude, {"agents"})) {
    plan_markdown_entries(*agents, "file", root / "agents", units);
  }
  if (const auto* commands = first_of(*claude, {"commands"})) {
    plan_markdown_entries(*commands, "command", root / "commands", units);
  }
  if (const auto* servers = first_of(*claude, {"mcp_servers", "mcpServers"})) {
    units.push_back({"setting", target / ".mcp.json", servers->dump(2)});
  }
  if (const auto* md = first_of(*claude, {"claude_md"})) {
    units.push_back({"file", target / "CLAUDE.md", entry_text(*md)});
  }
  if (const auto* md = first_of(*claude, {"claude_local_md"})) {
    units.push_back({"file", target / "CLAUDE.local.md", entry_text(*md)});
  }
  return units;
}

// Removes .claude and the instruction and MCP files beside it.
bool claude_undeploy(const fs::path& target) {
  const bool removed = remove_config_root(target, kClaudeRoot);
  try {
    return remove_root_files(target, claude_code_deployer().root_files) || removed;
  } catch (const FilesystemError&) {
    return false;
  }
}

} // namespace

const DeployerStrategy& claude_code_deployer() {
  static const DeployerStrategy strategy = {
      Platform::ClaudeCode,
      "Claude Code",
      kClaudeRoot,
      {"CLAUDE.md", "CLAUDE.local.md", ".mcp.json"},
      claude_can_deploy,
      claude_has_data,
      claude_validate,
      claude_plan,
      claude_undeploy,
  };
  return strategy;
}

} // namespace taptik
