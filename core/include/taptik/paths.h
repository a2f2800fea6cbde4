#pragma once

#include <filesystem>
#include <optional>

namespace taptik {

struct ResolvedPaths {
  std::filesystem::path workdir;
  std::filesystem::path state_dir;
  std::filesystem::path backups_dir;
  std::filesystem::path logs_dir;
  std::filesystem::path config_file;
};

// TAPTIK_HOME wins over the override, which wins over the current directory.
ResolvedPaths resolve_paths(const std::optional<std::filesystem::path>& workdir_override = std::nullopt);

} // namespace taptik
