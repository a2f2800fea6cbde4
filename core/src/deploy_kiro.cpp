#include "taptik/deploy.h"

#include "taptik/log.h"

#include <set>

namespace taptik {

namespace fs = std::filesystem;

namespace {

constexpr const char* kKiroRoot = ".kiro";

const nlohmann::json* kiro_section(const nlohmann::json& context) {
  return find_section(context, {"content", "ide", "kiro"});
}

bool ends_with(const std::string& text, const std::string& suffix) {
  return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Steering rules arrive either as [{name, rules: [...]}] or as {name: text}.
void plan_steering(const nlohmann::json& rules, const fs::path& dir, std::vector<WriteUnit>& out) {
  auto add = [&](const std::string& name, std::string text) {
    if (!is_safe_entry_name(name)) {
      log::warn("Skipping steering rule with invalid name: " + name);
      return;
    }
    out.push_back({"file", dir / (name + ".md"), std::move(text)});
  };
  if (rules.is_array()) {
    for (const auto& rule : rules) {
      if (!rule.is_object() || !rule.contains("name") || !rule["name"].is_string()) continue;
      std::string text;
      const auto it = rule.find("rules");
      if (it != rule.end() && it->is_array()) {
        for (size_t i = 0; i < it->size(); ++i) {
          if (i > 0) text += "\n";
          text += entry_text((*it)[i]);
        }
      } else if (it != rule.end()) {
        text = entry_text(*it);
      }
      add(rule["name"].get<std::string>(), std::move(text));
    }
  } else if (rules.is_object()) {
    for (auto it = rules.begin(); it != rules.end(); ++it) {
      add(it.key(), entry_text(it.value()));
    }
  }
}

void plan_hooks(const nlohmann::json& hooks, const fs::path& dir, std::vector<WriteUnit>& out) {
  auto add = [&](std::string name, const nlohmann::json& hook) {
    if (ends_with(name, ".json")) name.resize(name.size() - 5);
    if (!is_safe_entry_name(name)) {
      log::warn("Skipping hook with invalid name: " + name);
      return;
    }
    out.push_back({"hook", dir / (name + ".json"), hook.dump(2)});
  };
  if (hooks.is_array()) {
    for (const auto& hook : hooks) {
      if (hook.is_object() && hook.contains("name") && hook["name"].is_string()) {
        add(hook["name"].get<std::string>(), hook);
      }
    }
  } else if (hooks.is_object()) {
    for (auto it = hooks.begin(); it != hooks.end(); ++it) {
      add(it.key(), it.value());
    }
  }
}

void plan_specs(const nlohmann::json& context, const fs::path& dir, std::vector<WriteUnit>& out) {
  const nlohmann::json* specs = find_section(context, {"content", "project", "kiro_specs"});
  if (!specs || !specs->is_array()) return;
  for (const auto& spec : *specs) {
    if (!spec.is_object() || !spec.contains("name") || !spec["name"].is_string()) continue;
    const std::string name = spec["name"].get<std::string>();
    if (!is_safe_entry_name(name)) {
      log::warn("Skipping spec with invalid name: " + name);
      continue;
    }
    for (const char* part : {"requirements", "design", "tasks"}) {
      const auto it = spec.find(part);
      if (it == spec.end() || it->is_null()) continue;
      out.push_back({"file", dir / name / (std::string(part) + ".md"), entry_text(*it)});
    }
  }
}

bool has_customizations(const fs::path& root) {
  static const std::set<std::string> kStandardDirs = {"specs", "steering", "hooks", "settings"};
  std::error_code ec;
  bool custom = false;
  for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
    const std::string entry = it->path().filename().string();
    std::error_code type_ec;
    if (it->is_directory(type_ec)) {
      custom = custom || !kStandardDirs.count(entry);
    } else if (it->is_regular_file(type_ec)) {
      custom = custom || !(ends_with(entry, ".md") || ends_with(entry, ".json"));
    }
  }
  if (ec) log::warn("Failed to analyze existing structure: " + ec.message());
  return custom;
}

bool kiro_can_deploy(const fs::path& target) {
  return is_writable_directory(target);
}

bool kiro_has_data(const nlohmann::json& context) {
  return kiro_section(context) != nullptr;
}

CompatibilityReport kiro_validate(const nlohmann::json& context, const fs::path& target) {
  CompatibilityReport report;
  if (!kiro_has_data(context)) {
    report.issues.push_back("No Kiro configuration found in context");
  }
  if (!kiro_can_deploy(target)) {
    report.issues.push_back("Target path is not valid or writable");
  }
  const fs::path root = target / kKiroRoot;
  std::error_code ec;
  if (fs::is_directory(root, ec) && has_customizations(root)) {
    report.issues.push_back("Existing Kiro configuration has customizations that may be overwritten");
  }
  report.compatible = report.issues.empty();
  return report;
}

std::vector<WriteUnit> kiro_plan(const nlohmann::json& context, const fs::path& target) {
  std::vector<WriteUnit> units;
  const fs::path root = target / kKiroRoot;
  plan_specs(context, root / "specs", units);

  const nlohmann::json* kiro = kiro_section(context);
  if (!kiro || !kiro->is_object()) return units;

  if (auto it = kiro->find("steering_rules"); it != kiro->end()) {
    plan_steering(*it, root / "steering", units);
  }
  if (auto it = kiro->find("hooks"); it != kiro->end()) {
    plan_hooks(*it, root / "hooks", units);
  }
  if (auto it = kiro->find("mcp_settings"); it != kiro->end() && !it->is_null()) {
    units.push_back({"setting", root / "settings" / "mcp.json", it->dump(2)});
  }
  if (auto it = kiro->find("project_settings"); it != kiro->end() && !it->is_null()) {
    units.push_back({"setting", root / "settings" / "project.json", it->dump(2)});
  }
  return units;
}

bool kiro_undeploy(const fs::path& target) {
  return remove_config_root(target, kKiroRoot);
}

} // namespace

const DeployerStrategy& kiro_deployer() {
  static const DeployerStrategy strategy = {
      Platform::Kiro, "Kiro", kKiroRoot, {}, kiro_can_deploy, kiro_has_data, kiro_validate, kiro_plan, kiro_undeploy,
  };
  return strategy;
}

} // namespace taptik
