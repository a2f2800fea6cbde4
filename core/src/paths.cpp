#include "taptik/paths.h"

#include "taptik/log.h"

#include <cstdlib>

namespace taptik {

ResolvedPaths resolve_paths(const std::optional<std::filesystem::path>& workdir_override) {
  ResolvedPaths out;
  if (const char* env_home = std::getenv("TAPTIK_HOME"); env_home && *env_home) {
    out.workdir = std::filesystem::path(env_home);
  } else if (workdir_override.has_value()) {
    out.workdir = std::filesystem::absolute(*workdir_override);
  } else {
    out.workdir = std::filesystem::current_path();
  }

  out.state_dir = out.workdir / ".taptik";
  out.backups_dir = out.state_dir / "backups";
  out.logs_dir = out.state_dir / "logs";
  out.config_file = out.state_dir / "config.yaml";

  std::error_code ec;
  if (!std::filesystem::exists(out.workdir, ec)) {
    log::warn(std::string("working directory not found: ") + out.workdir.string());
  }
  return out;
}

} // namespace taptik
