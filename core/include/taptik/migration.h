#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace taptik {

constexpr const char* kCurrentSchemaVersion = "1.2.0";

struct SchemaVersion {
  int major = 0;
  int minor = 0;
  int patch = 0;

  // Strict "N.N.N".
  static std::optional<SchemaVersion> parse(const std::string& text);
  std::string to_string() const;
};

bool operator==(const SchemaVersion& a, const SchemaVersion& b);
bool operator!=(const SchemaVersion& a, const SchemaVersion& b);
bool operator<(const SchemaVersion& a, const SchemaVersion& b);
bool operator>(const SchemaVersion& a, const SchemaVersion& b);
bool operator<=(const SchemaVersion& a, const SchemaVersion& b);

struct CompatibilityResult {
  bool compatible = false;
  bool migration_required = false;
  std::vector<std::string> warnings;
  std::vector<std::string> suggested_actions;
};

struct MigrationValidationResult {
  bool passed = false;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

struct SchemaInfo {
  std::string version;
  std::vector<std::string> features;
  std::vector<std::string> deprecated_features;
  std::vector<std::string> compatible_with;
  std::string migration_complexity;
};

// One upgrade between adjacent versions. The transform only adds what the
// target version introduces and never overwrites existing keys.
struct MigrationStep {
  SchemaVersion from;
  SchemaVersion to;
  void (*transform)(nlohmann::json& context);
};

class SchemaMigrator {
 public:
  SchemaMigrator();

  const std::vector<MigrationStep>& steps() const { return steps_; }
  std::vector<std::string> known_versions() const;
  std::string current_version() const;

  // metadata.version when parseable, then structural fingerprints, then
  // the oldest known version. Never throws.
  std::string detect_version(const nlohmann::json& context) const;

  CompatibilityResult is_compatible(const std::string& context_version,
                                    const std::string& current = kCurrentSchemaVersion) const;

  std::vector<std::string> get_migration_path(const std::string& from, const std::string& to) const;

  // Throws MigrationError for malformed input and for versions the step
  // chain cannot reach.
  nlohmann::json migrate_to_latest(const nlohmann::json& context) const;
  nlohmann::json migrate(const nlohmann::json& context, const std::string& target) const;

  MigrationValidationResult validate_migration(const nlohmann::json& original,
                                               const nlohmann::json& migrated) const;

  SchemaInfo get_schema_info(const std::string& version) const;

 private:
  bool is_known(const std::string& version) const;

  std::vector<MigrationStep> steps_;
};

nlohmann::json to_json(const CompatibilityResult& result);
nlohmann::json to_json(const MigrationValidationResult& result);
nlohmann::json to_json(const SchemaInfo& info);

} // namespace taptik
