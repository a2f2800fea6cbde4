#include "taptik/migration.h"

#include "taptik/errors.h"
#include "taptik/log.h"
#include "taptik/serialization.h"

#include <cctype>
#include <tuple>

namespace taptik {

namespace {
nlohmann::json* child(nlohmann::json& parent, const char* key) {
  if (!parent.is_object() || !parent.contains(key)) return nullptr;
  return &parent[key];
}

const nlohmann::json* child(const nlohmann::json& parent, const char* key) {
  if (!parent.is_object() || !parent.contains(key)) return nullptr;
  return &parent[key];
}

bool truthy(const nlohmann::json* node) {
  if (!node || node->is_null()) return false;
  if (node->is_boolean()) return node->get<bool>();
  if (node->is_string()) return !node->get_ref<const std::string&>().empty();
  return true;
}

const nlohmann::json* at_path(const nlohmann::json& root, std::initializer_list<const char*> keys) {
  const nlohmann::json* node = &root;
  for (const char* key : keys) {
    node = child(*node, key);
    if (!node) return nullptr;
  }
  return node;
}

void set_default(nlohmann::json& object, const char* key, nlohmann::json value) {
  if (!object.contains(key)) object[key] = std::move(value);
}

void upgrade_1_0_to_1_1(nlohmann::json& context) {
  nlohmann::json& content = context["content"];
  if (nlohmann::json* personal = child(content, "personal"); personal && personal->is_object()) {
    nlohmann::json profile = {{"experience_years", 0}, {"primary_role", "developer"}};
    if (personal->contains("name")) profile["name"] = (*personal)["name"];
    if (personal->contains("email")) profile["email"] = (*personal)["email"];
    set_default(*personal, "profile", profile);
    set_default(*personal, "preferences", {{"theme", "dark"}});
    set_default(*personal, "communication", {{"explanation_level", "standard"}});
  }
  if (nlohmann::json* project = child(content, "project"); project && project->is_object()) {
    set_default(*project, "architecture", {{"pattern", "monolith"}});
    set_default(*project, "tech_stack", {{"language", "javascript"}});
  }
  set_default(content, "tools", {{"custom_tools", nlohmann::json::array()}});
  if (nlohmann::json* ide = child(content, "ide"); ide && ide->is_object()) {
    if (nlohmann::json* claude = child(*ide, "claudeCode"); claude && claude->is_object()) {
      set_default(*claude, "mcp_config", nlohmann::json::object());
    }
  }
}

void upgrade_1_1_to_1_2(nlohmann::json& context) {
  nlohmann::json& content = context["content"];
  set_default(content, "prompts",
              {{"system_prompts", nlohmann::json::array()},
               {"templates", nlohmann::json::array()},
               {"examples", nlohmann::json::array()}});
  if (nlohmann::json* tools = child(content, "tools"); tools && tools->is_object()) {
    set_default(*tools, "mcp_servers", nlohmann::json::array());
    set_default(*tools, "agents", nlohmann::json::array());
    set_default(*tools, "commands", nlohmann::json::array());
  }
  set_default(content, "ide", nlohmann::json::object());
  nlohmann::json& ide = content["ide"];
  if (ide.is_object() && ide.contains("claudeCode") && !ide.contains("claude-code")) {
    nlohmann::json claude = ide["claudeCode"];
    ide.erase("claudeCode");
    if (claude.is_object()) set_default(claude, "claude_md", "");
    ide["claude-code"] = std::move(claude);
  }
  set_default(context, "security", nlohmann::json::object());
  if (context["security"].is_object()) {
    set_default(context["security"], "detectedPatterns", nlohmann::json::array());
  }
}

bool has_v12_features(const nlohmann::json& context) {
  return truthy(at_path(context, {"content", "prompts", "system_prompts"})) ||
         truthy(at_path(context, {"content", "tools", "agents"})) ||
         truthy(at_path(context, {"content", "ide", "claude-code"})) ||
         at_path(context, {"security", "detectedPatterns"}) != nullptr;
}

bool has_v11_features(const nlohmann::json& context) {
  return truthy(at_path(context, {"content", "personal", "profile"})) ||
         truthy(at_path(context, {"content", "project", "architecture"})) ||
         truthy(at_path(context, {"content", "tools", "custom_tools"})) ||
         truthy(at_path(context, {"content", "ide", "claudeCode", "mcp_config"}));
}

// Object-shaped context with object metadata and content, both created
// when absent.
nlohmann::json checked_copy(const nlohmann::json& context) {
  if (!context.is_object()) {
    throw MigrationError("context is not an object");
  }
  nlohmann::json copy = context;
  if (copy.contains("metadata") && !copy["metadata"].is_object()) {
    throw MigrationError("malformed context", "metadata is not an object");
  }
  if (copy.contains("content") && !copy["content"].is_object()) {
    throw MigrationError("malformed context", "content is not an object");
  }
  set_default(copy, "metadata", nlohmann::json::object());
  set_default(copy, "content", nlohmann::json::object());
  return copy;
}
} // namespace

std::optional<SchemaVersion> SchemaVersion::parse(const std::string& text) {
  SchemaVersion out;
  int* parts[] = {&out.major, &out.minor, &out.patch};
  size_t pos = 0;
  for (int i = 0; i < 3; ++i) {
    const size_t start = pos;
    long value = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      value = value * 10 + (text[pos] - '0');
      if (value > 1000000) return std::nullopt;
      ++pos;
    }
    if (pos == start) return std::nullopt;
    *parts[i] = static_cast<int>(value);
    if (i < 2) {
      if (pos >= text.size() || text[pos] != '.') return std::nullopt;
      ++pos;
    }
  }
  if (pos != text.size()) return std::nullopt;
  return out;
}

std::string SchemaVersion::to_string() const {
  return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
}

bool operator==(const SchemaVersion& a, const SchemaVersion& b) {
  return std::tie(a.major, a.minor, a.patch) == std::tie(b.major, b.minor, b.patch);
}
bool operator!=(const SchemaVersion& a, const SchemaVersion& b) { return !(a == b); }
bool operator<(const SchemaVersion& a, const SchemaVersion& b) {
  return std::tie(a.major, a.minor, a.patch) < std::tie(b.major, b.minor, b.patch);
}
bool operator>(const SchemaVersion& a, const SchemaVersion& b) { return b < a; }
bool operator<=(const SchemaVersion& a, const SchemaVersion& b) { return !(b < a); }

SchemaMigrator::SchemaMigrator() {
  steps_.push_back({{1, 0, 0}, {1, 1, 0}, &upgrade_1_0_to_1_1});
  steps_.push_back({{1, 1, 0}, {1, 2, 0}, &upgrade_1_1_to_1_2});
}

std::vector<std::string> SchemaMigrator::known_versions() const {
  std::vector<std::string> out;
  if (steps_.empty()) return out;
  out.push_back(steps_.front().from.to_string());
  for (const auto& step : steps_) out.push_back(step.to.to_string());
  return out;
}

std::string SchemaMigrator::current_version() const {
  return steps_.empty() ? std::string(kCurrentSchemaVersion) : steps_.back().to.to_string();
}

bool SchemaMigrator::is_known(const std::string& version) const {
  for (const auto& v : known_versions()) {
    if (v == version) return true;
  }
  return false;
}

std::string SchemaMigrator::detect_version(const nlohmann::json& context) const {
  const std::string oldest = known_versions().empty() ? std::string("1.0.0") : known_versions().front();
  if (!context.is_object()) {
    log::warn("Failed to detect schema version: context is not an object");
    return oldest;
  }
  if (const auto* version = at_path(context, {"metadata", "version"}); version && version->is_string()) {
    const std::string text = version->get<std::string>();
    if (SchemaVersion::parse(text)) return text;
  }
  if (has_v12_features(context)) return "1.2.0";
  if (has_v11_features(context)) return "1.1.0";
  return oldest;
}

CompatibilityResult SchemaMigrator::is_compatible(const std::string& context_version,
                                                  const std::string& current) const {
  CompatibilityResult result;
  const auto config = SchemaVersion::parse(context_version);
  const auto target = SchemaVersion::parse(current);
  if (!config || !target) {
    result.warnings.push_back("Invalid version format: " + (config ? current : context_version));
    return result;
  }
  if (*config == *target) {
    result.compatible = true;
    return result;
  }
  if (*config > *target) {
    result.warnings.push_back("Configuration version " + context_version + " is newer than supported version " +
                              current);
    result.suggested_actions = {"Update taptik to the latest version", "Use a newer IDE version"};
    return result;
  }
  result.compatible = true;
  result.migration_required = true;
  if (config->major < target->major) {
    result.warnings.push_back("Major version difference: " + context_version + " → " + current +
                              " may require significant migration");
  } else if (config->minor < target->minor) {
    result.warnings.push_back("Configuration version " + context_version +
                              " may have reduced functionality with current version " + current);
  }
  if (!result.warnings.empty()) {
    result.suggested_actions.push_back("Review migration changes before deployment");
  }
  return result;
}

std::vector<std::string> SchemaMigrator::get_migration_path(const std::string& from, const std::string& to) const {
  std::vector<std::string> path;
  if (from == to) return path;
  const auto source = SchemaVersion::parse(from);
  const auto target = SchemaVersion::parse(to);
  if (!source || !target) return path;
  if (*source > *target) {
    path.push_back("Downgrade not supported: " + from + " → " + to);
    return path;
  }
  for (const auto& step : steps_) {
    if (*source <= step.from && step.to <= *target) {
      path.push_back(step.from.to_string() + " → " + step.to.to_string());
    }
  }
  return path;
}

nlohmann::json SchemaMigrator::migrate_to_latest(const nlohmann::json& context) const {
  return migrate(context, current_version());
}

nlohmann::json SchemaMigrator::migrate(const nlohmann::json& context, const std::string& target) const {
  nlohmann::json migrated = checked_copy(context);
  const std::string detected = detect_version(migrated);
  if (detected == target) {
    return context;
  }
  const auto source = SchemaVersion::parse(detected);
  const auto goal = SchemaVersion::parse(target);
  if (!goal || !is_known(target)) {
    throw MigrationError("unknown target schema version " + target);
  }
  if (!is_known(detected)) {
    throw MigrationError("unknown source schema version " + detected);
  }
  if (*source > *goal) {
    throw MigrationError("Downgrade not supported: " + detected + " → " + target);
  }

  log::info("Migrating configuration from " + detected + " to " + target);
  for (const auto& step : steps_) {
    if (step.from < *source || *goal < step.to) continue;
    try {
      step.transform(migrated);
    } catch (const nlohmann::json::exception& e) {
      throw MigrationError("step " + step.from.to_string() + " → " + step.to.to_string(), e.what());
    }
    log::debug("applied migration " + step.from.to_string() + " → " + step.to.to_string());
  }
  migrated["metadata"]["version"] = target;
  migrated["metadata"]["migratedAt"] = now_iso();
  log::info("Successfully migrated configuration to " + target);
  return migrated;
}

MigrationValidationResult SchemaMigrator::validate_migration(const nlohmann::json& original,
                                                             const nlohmann::json& migrated) const {
  MigrationValidationResult result;
  const auto* before = at_path(original, {"content"});
  const auto* after = at_path(migrated, {"content"});
  if (before && before->is_object()) {
    for (auto it = before->begin(); it != before->end(); ++it) {
      if (!after || !after->is_object() || !after->contains(it.key())) {
        result.errors.push_back("Data loss detected: " + it.key() + " missing after migration");
      }
    }
  }

  const auto* version = at_path(migrated, {"metadata", "version"});
  const std::string migrated_version = version && version->is_string() ? version->get<std::string>() : "";
  if (!is_known(migrated_version)) {
    result.errors.push_back("Invalid target schema version: " + migrated_version);
  }
  if (!at_path(migrated, {"metadata"}) || !after) {
    result.errors.push_back("Migration resulted in invalid context structure");
  }
  if (!at_path(migrated, {"security", "scanResults"})) {
    result.warnings.push_back("Security scan results missing after migration");
  }
  result.passed = result.errors.empty();
  return result;
}

SchemaInfo SchemaMigrator::get_schema_info(const std::string& version) const {
  if (version == "1.0.0") {
    return {"1.0.0",
            {"Basic context structure", "Personal and project settings", "Simple IDE configuration",
             "Basic security scanning"},
            {},
            {},
            "low"};
  }
  if (version == "1.1.0") {
    return {"1.1.0",
            {"Enhanced personal profiles", "Project architecture settings", "Custom tools and scripts",
             "Improved IDE support", "MCP server configuration"},
            {"Basic IDE settings format"},
            {"1.0.0"},
            "medium"};
  }
  if (version == "1.2.0") {
    return {"1.2.0",
            {"Enhanced security patterns", "Advanced prompt templates", "Multi-platform IDE support",
             "Agent and command management", "Comprehensive MCP integration", "Detailed security auditing"},
            {"Legacy tool format", "Simple IDE configuration"},
            {"1.0.0", "1.1.0"},
            "high"};
  }
  return {"unknown", {}, {}, {}, ""};
}

nlohmann::json to_json(const CompatibilityResult& result) {
  return {{"compatible", result.compatible},
          {"migrationRequired", result.migration_required},
          {"warnings", result.warnings},
          {"suggestedActions", result.suggested_actions}};
}

nlohmann::json to_json(const MigrationValidationResult& result) {
  return {{"passed", result.passed}, {"errors", result.errors}, {"warnings", result.warnings}};
}

nlohmann::json to_json(const SchemaInfo& info) {
  nlohmann::json j = {{"version", info.version},
                      {"features", info.features},
                      {"deprecatedFeatures", info.deprecated_features},
                      {"compatibleWith", info.compatible_with}};
  if (!info.migration_complexity.empty()) j["migrationComplexity"] = info.migration_complexity;
  return j;
}

} // namespace taptik
