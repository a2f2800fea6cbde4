#include "taptik/errors.h"
#include "taptik/log.h"
#include "taptik/migration.h"

#include "test_util.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

using json = nlohmann::json;
using taptik_test::check;

namespace {

json v100_context() {
  json ctx;
  ctx["metadata"] = {{"version", "1.0.0"}, {"exportedAt", "2024-01-01T00:00:00.000Z"}};
  ctx["content"]["personal"] = {{"name", "Ada"}, {"email", "ada@example.com"}};
  ctx["content"]["project"] = {{"name", "engine"}};
  ctx["content"]["ide"]["claudeCode"] = {{"settings", {{"theme", "dark"}}}};
  return ctx;
}

} // namespace

int main() {
  taptik::log::set_level(taptik::log::Level::Warn);
  int failures = 0;
  const taptik::SchemaMigrator migrator;

  // Test: version parsing and ordering.
  {
    const auto v = taptik::SchemaVersion::parse("1.2.0");
    check(failures, v && v->major == 1 && v->minor == 2 && v->patch == 0, "parse 1.2.0");
    check(failures, !taptik::SchemaVersion::parse("1.2").has_value(), "two parts rejected");
    check(failures, !taptik::SchemaVersion::parse("1.2.0-beta").has_value(), "suffix rejected");
    check(failures, *taptik::SchemaVersion::parse("1.1.0") < *taptik::SchemaVersion::parse("1.2.0"), "ordering");
    check(failures, migrator.current_version() == "1.2.0", "current version");
    check(failures, migrator.known_versions() == std::vector<std::string>{"1.0.0", "1.1.0", "1.2.0"},
          "known versions");
  }

  // Test: detection by metadata and by structure.
  {
    check(failures, migrator.detect_version(v100_context()) == "1.0.0", "metadata version wins");
    json fingerprint11 = {{"content", {{"project", {{"architecture", {{"pattern", "layered"}}}}}}}};
    check(failures, migrator.detect_version(fingerprint11) == "1.1.0", "1.1 fingerprint");
    json fingerprint12 = {{"content", {{"ide", {{"claude-code", {{"settings", json::object()}}}}}}}};
    check(failures, migrator.detect_version(fingerprint12) == "1.2.0", "1.2 fingerprint");
    check(failures, migrator.detect_version(json::array()) == "1.0.0", "non-object falls back to oldest");
  }

  // Test: compatibility report.
  {
    const auto same = migrator.is_compatible("1.2.0");
    check(failures, same.compatible && !same.migration_required, "same version compatible");
    const auto older = migrator.is_compatible("1.0.0");
    check(failures, older.compatible && older.migration_required && !older.warnings.empty(), "older needs migration");
    const auto newer = migrator.is_compatible("2.0.0");
    check(failures, !newer.compatible && !newer.suggested_actions.empty() &&
                        newer.suggested_actions.front() == "Update taptik to the latest version",
          "newer version incompatible");
    const auto invalid = migrator.is_compatible("banana");
    check(failures, !invalid.compatible && !invalid.warnings.empty(), "invalid version reported");
  }

  // Test: migration path labels.
  {
    check(failures,
          migrator.get_migration_path("1.0.0", "1.2.0") == std::vector<std::string>{"1.0.0 → 1.1.0", "1.1.0 → 1.2.0"},
          "full path");
    check(failures, migrator.get_migration_path("1.1.0", "1.2.0") == std::vector<std::string>{"1.1.0 → 1.2.0"},
          "single step path");
    check(failures, migrator.get_migration_path("1.2.0", "1.2.0").empty(), "no path for same version");
    const auto down = migrator.get_migration_path("1.2.0", "1.0.0");
    check(failures, down.size() == 1 && down.front().rfind("Downgrade not supported", 0) == 0, "downgrade path");
  }

  // Test: 1.0.0 upgrades to latest without losing data.
  {
    const json original = v100_context();
    const json migrated = migrator.migrate_to_latest(original);
    check(failures, migrated["metadata"]["version"] == "1.2.0", "version stamped");
    check(failures, migrated["metadata"].contains("migratedAt"), "migratedAt stamped");
    check(failures, migrated["metadata"]["exportedAt"] == original["metadata"]["exportedAt"], "metadata kept");
    check(failures, migrated["content"]["personal"]["name"] == "Ada", "personal name kept");
    check(failures, migrated["content"]["personal"]["profile"]["email"] == "ada@example.com", "profile seeded");
    check(failures, !migrated["content"]["tools"].is_null(), "tools added");
    check(failures, !migrated["content"]["ide"].is_null(), "ide kept");
    check(failures, migrated["content"]["ide"].contains("claude-code") &&
                        !migrated["content"]["ide"].contains("claudeCode"),
          "claudeCode renamed");
    check(failures, migrated["content"]["ide"]["claude-code"]["settings"]["theme"] == "dark",
          "claude settings carried over");
    check(failures, migrated["security"]["detectedPatterns"].is_array(), "security patterns added");

    const auto validation = migrator.validate_migration(original, migrated);
    check(failures, validation.passed && validation.errors.empty(), "validation passes");
    check(failures, !validation.warnings.empty(), "missing scan results warned");

    const json again = migrator.migrate_to_latest(migrated);
    check(failures, again == migrated, "migration idempotent at latest");
  }

  // Test: existing values are never overwritten.
  {
    json ctx = v100_context();
    ctx["content"]["personal"]["preferences"] = {{"theme", "light"}};
    const json migrated = migrator.migrate(ctx, "1.1.0");
    check(failures, migrated["metadata"]["version"] == "1.1.0", "partial migration stamps target");
    check(failures, migrated["content"]["personal"]["preferences"]["theme"] == "light", "preferences preserved");
    check(failures, migrated["content"]["ide"].contains("claudeCode"), "1.1 keeps claudeCode key");
  }

  // Test: validation reports data loss.
  {
    const json original = v100_context();
    json broken = migrator.migrate_to_latest(original);
    broken["content"].erase("project");
    const auto validation = migrator.validate_migration(original, broken);
    check(failures, !validation.passed, "data loss fails validation");
    bool found = false;
    for (const auto& e : validation.errors) {
      found = found || e == "Data loss detected: project missing after migration";
    }
    check(failures, found, "data loss message names the section");
  }

  // Test: failure modes.
  {
    bool threw = false;
    try {
      json downgrade = v100_context();
      downgrade["metadata"]["version"] = "1.2.0";
      migrator.migrate(downgrade, "1.0.0");
    } catch (const taptik::MigrationError& e) {
      threw = std::string(e.what()).find("Downgrade not supported") != std::string::npos;
    }
    check(failures, threw, "downgrade rejected");

    threw = false;
    try {
      json future = v100_context();
      future["metadata"]["version"] = "3.0.0";
      migrator.migrate_to_latest(future);
    } catch (const taptik::MigrationError&) {
      threw = true;
    }
    check(failures, threw, "unknown source version rejected");

    threw = false;
    try {
      migrator.migrate_to_latest(json::parse(R"({"metadata":{"version":"1.0.0"},"content":"text"})"));
    } catch (const taptik::MigrationError& e) {
      threw = std::string(e.what()).rfind("Migration failed: ", 0) == 0;
    }
    check(failures, threw, "non-object content rejected");

    const json bare = migrator.migrate_to_latest(json::object());
    check(failures, bare["content"].is_object() && bare["metadata"]["version"] == "1.2.0",
          "missing sections created");
  }

  // Test: schema info.
  {
    const auto info = migrator.get_schema_info("1.2.0");
    check(failures, info.version == "1.2.0" && info.migration_complexity == "high", "1.2.0 info");
    check(failures, info.compatible_with == std::vector<std::string>{"1.0.0", "1.1.0"}, "1.2.0 compatibility list");
    const json j = taptik::to_json(info);
    check(failures, j.contains("features") && j["features"].size() == info.features.size(), "schema info json");
  }

  if (failures == 0) {
    std::cout << "test_migration: ok\n";
  }
  return failures == 0 ? 0 : 1;
}
