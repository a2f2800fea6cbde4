#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace taptik {

struct ComponentStats {
  size_t count = 0;
  uint64_t size = 0;
  std::vector<std::string> paths;
};

struct ManifestStatistics {
  size_t total_files = 0;
  size_t total_directories = 0;
  size_t component_count = 0;
  std::string largest_component;
};

struct Manifest {
  std::vector<std::string> files;
  std::vector<std::string> directories;
  uint64_t total_size = 0;
  std::map<std::string, ComponentStats> components;
  ManifestStatistics statistics;
};

// Walks the legacy data.claudeCode scopes, then the content sections, in a
// fixed order. Building twice from the same context yields equal manifests.
Manifest build_manifest(const nlohmann::json& context);

// Compares sorted files, sorted directories and total size.
bool manifests_equal(const Manifest& a, const Manifest& b);

nlohmann::json to_json(const Manifest& manifest);
Manifest manifest_from_json(const nlohmann::json& j);

} // namespace taptik
