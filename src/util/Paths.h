#pragma once

#include <SDL3/SDL_filesystem.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace Paths {

inline bool pathExists(const std::filesystem::path& p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec) && !ec;
}

// Resolves an asset named inside a config file: absolute paths stay as they
// are, relative ones are looked up next to the config file first.
inline std::string resolveNextTo(std::string_view configPath, std::string_view assetPath) {
  namespace fs = std::filesystem;
  const fs::path asset(assetPath);
  if (asset.is_absolute()) {
    return asset.string();
  }
  const fs::path candidate = fs::path(configPath).parent_path() / asset;
  if (pathExists(candidate)) {
    return candidate.lexically_normal().string();
  }
  return asset.string();
}

inline std::string resolveAssetPath(std::string_view relativePath, const char* argv0 = nullptr) {
  namespace fs = std::filesystem;

  fs::path rel(relativePath);
  if (pathExists(rel)) {
    return rel.string();
  }

  if ((argv0 != nullptr) && (*argv0 != 0)) {
    std::error_code ec;
    fs::path exe = fs::absolute(fs::path(argv0), ec);
    if (!ec) {
      fs::path base = exe.parent_path();

      fs::path candidate = base / rel;
      if (pathExists(candidate)) {
        return candidate.lexically_normal().string();
      }

      candidate = base / ".." / rel;
      if (pathExists(candidate)) {
        return candidate.lexically_normal().string();
      }
    }
  }

  const char* basePathC = SDL_GetBasePath();
  if ((basePathC != nullptr) && (*basePathC != 0)) {
    fs::path candidate = fs::path(basePathC) / rel;
    if (pathExists(candidate)) {
      return candidate.lexically_normal().string();
    }
  }

  return rel.string();
}

}  // namespace Paths
