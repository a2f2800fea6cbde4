#include "taptik/manifest.h"

#include <algorithm>
#include <set>

namespace taptik {

namespace {
struct ManifestBuilder {
  Manifest out;
  std::set<std::string> files;
  std::set<std::string> directories;

  void add(const std::string& component, const std::string& raw_path, uint64_t size) {
    const std::string path = normalize(raw_path);
    if (!files.insert(path).second) return;
    for (size_t pos = path.find('/'); pos != std::string::npos; pos = path.find('/', pos + 1)) {
      directories.insert(path.substr(0, pos));
    }
    auto& stats = out.components[component];
    ++stats.count;
    stats.size += size;
    stats.paths.push_back(path);
    out.total_size += size;
  }

  void add_json(const std::string& component, const std::string& path, const nlohmann::json& value) {
    add(component, path, value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace).size());
  }

  static std::string normalize(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
      if (c == '\\') c = '/';
      if (c == '/' && (out.empty() || out.back() == '/')) continue;
      out.push_back(c);
    }
    while (!out.empty() && out.back() == '/') out.pop_back();
    return out;
  }

  Manifest finish() {
    out.files.assign(files.begin(), files.end());
    out.directories.assign(directories.begin(), directories.end());
    out.statistics.total_files = out.files.size();
    out.statistics.total_directories = out.directories.size();
    out.statistics.component_count = out.components.size();
    uint64_t largest = 0;
    for (const auto& [name, stats] : out.components) {
      if (stats.size > largest || out.statistics.largest_component.empty()) {
        largest = stats.size;
        out.statistics.largest_component = name;
      }
    }
    return out;
  }
};

bool has_content(const nlohmann::json& value) {
  if (value.is_null()) return false;
  if (value.is_string()) return !value.get_ref<const std::string&>().empty();
  if (value.is_structured()) return !value.empty();
  return true;
}

void add_each(ManifestBuilder& builder, const std::string& component, const nlohmann::json& list,
              const std::string& prefix, const std::string& stem) {
  if (!list.is_array()) return;
  for (size_t i = 0; i < list.size(); ++i) {
    builder.add_json(component, prefix + stem + "_" + std::to_string(i) + ".json", list[i]);
  }
}

void walk_legacy_scope(ManifestBuilder& builder, const nlohmann::json& scope, const std::string& name) {
  if (!scope.is_object()) return;
  const std::string base = "claude-code/" + name + "/";
  if (scope.contains("settings") && has_content(scope["settings"])) {
    builder.add_json("settings", base + "settings.json", scope["settings"]);
  }
  if (scope.contains("agents")) {
    add_each(builder, "agents", scope["agents"], base + "agents/", "agent");
  }
  if (scope.contains("commands")) {
    add_each(builder, "commands", scope["commands"], base + "commands/", "command");
  }
  if (scope.contains("mcpServers") && has_content(scope["mcpServers"])) {
    const auto& mcp = scope["mcpServers"];
    if (mcp.is_object() && mcp.contains("servers") && mcp["servers"].is_array()) {
      add_each(builder, "mcpServers", mcp["servers"], base + "mcp/", "server");
    } else {
      builder.add_json("mcpServers", base + "mcp/servers.json", mcp);
    }
  }
  if (scope.contains("steeringRules")) {
    add_each(builder, "steeringRules", scope["steeringRules"], base + "steering/", "rule");
  }
  if (scope.contains("instructions") && scope["instructions"].is_object()) {
    const auto& instructions = scope["instructions"];
    for (const char* key : {"global", "local"}) {
      if (!instructions.contains(key) || !instructions[key].is_string()) continue;
      const std::string text = instructions[key].get<std::string>();
      if (text.empty()) continue;
      const std::string file = std::string(key) == "global" ? "CLAUDE.md" : "CLAUDE.local.md";
      builder.add("instructions", base + "instructions/" + file, text.size());
    }
  }
}

void walk_buckets(ManifestBuilder& builder, const nlohmann::json& section, const std::string& component) {
  if (!section.is_object()) return;
  for (auto it = section.begin(); it != section.end(); ++it) {
    add_each(builder, component, it.value(), component + "/" + it.key() + "/", it.key());
  }
}
} // namespace

Manifest build_manifest(const nlohmann::json& context) {
  ManifestBuilder builder;

  if (context.contains("data") && context["data"].is_object()) {
    const auto& data = context["data"];
    if (data.contains("claudeCode") && data["claudeCode"].is_object()) {
      const auto& claude = data["claudeCode"];
      if (claude.contains("local")) walk_legacy_scope(builder, claude["local"], "local");
      if (claude.contains("global")) walk_legacy_scope(builder, claude["global"], "global");
    }
  }

  if (context.contains("content") && context["content"].is_object()) {
    const auto& content = context["content"];
    if (content.contains("personal") && has_content(content["personal"])) {
      builder.add_json("personal", "content/personal.json", content["personal"]);
    }
    if (content.contains("project") && has_content(content["project"])) {
      builder.add_json("project", "content/project.json", content["project"]);
    }
    if (content.contains("prompts")) walk_buckets(builder, content["prompts"], "prompts");
    if (content.contains("tools")) walk_buckets(builder, content["tools"], "tools");
    if (content.contains("ide") && content["ide"].is_object()) {
      const auto& ide = content["ide"];
      for (auto it = ide.begin(); it != ide.end(); ++it) {
        if (!has_content(it.value())) continue;
        builder.add_json("ide", "ide/" + it.key() + ".json", it.value());
      }
    }
  }

  return builder.finish();
}

bool manifests_equal(const Manifest& a, const Manifest& b) {
  auto sorted = [](std::vector<std::string> v) {
    std::sort(v.begin(), v.end());
    return v;
  };
  return a.total_size == b.total_size && sorted(a.files) == sorted(b.files) &&
         sorted(a.directories) == sorted(b.directories);
}

nlohmann::json to_json(const Manifest& manifest) {
  nlohmann::json components = nlohmann::json::object();
  for (const auto& [name, stats] : manifest.components) {
    components[name] = {{"count", stats.count}, {"size", stats.size}, {"paths", stats.paths}};
  }
  return {{"files", manifest.files},
          {"directories", manifest.directories},
          {"totalSize", manifest.total_size},
          {"components", components},
          {"statistics",
           {{"totalFiles", manifest.statistics.total_files},
            {"totalDirectories", manifest.statistics.total_directories},
            {"componentCount", manifest.statistics.component_count},
            {"largestComponent", manifest.statistics.largest_component}}}};
}

Manifest manifest_from_json(const nlohmann::json& j) {
  Manifest m;
  if (!j.is_object()) return m;
  m.files = j.value("files", std::vector<std::string>{});
  m.directories = j.value("directories", std::vector<std::string>{});
  m.total_size = j.value("totalSize", static_cast<uint64_t>(0));
  if (j.contains("components") && j["components"].is_object()) {
    for (auto it = j["components"].begin(); it != j["components"].end(); ++it) {
      ComponentStats stats;
      stats.count = it.value().value("count", static_cast<size_t>(0));
      stats.size = it.value().value("size", static_cast<uint64_t>(0));
      stats.paths = it.value().value("paths", std::vector<std::string>{});
      m.components[it.key()] = stats;
    }
  }
  if (j.contains("statistics") && j["statistics"].is_object()) {
    const auto& s = j["statistics"];
    m.statistics.total_files = s.value("totalFiles", static_cast<size_t>(0));
    m.statistics.total_directories = s.value("totalDirectories", static_cast<size_t>(0));
    m.statistics.component_count = s.value("componentCount", static_cast<size_t>(0));
    m.statistics.largest_component = s.value("largestComponent", std::string());
  }
  return m;
}

} // namespace taptik
