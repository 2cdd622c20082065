#pragma once

#include "twig/config.h"
#include "twig/git.h"

#include <filesystem>
#include <string>

namespace twig {

struct ResolvedPaths {
  std::filesystem::path main_root;
  std::filesystem::path common_dir;
  std::filesystem::path locks_dir;
  std::filesystem::path worktrees_root;
  std::filesystem::path logs_dir;
};

// TWIG_REPO overrides start_dir when set.
bool resolve_paths(const std::filesystem::path& start_dir,
                   const Git& git,
                   ResolvedPaths& out,
                   std::string& error);

void apply_config_paths(ResolvedPaths& paths, const EngineConfig& cfg);

// Canonical form for existing paths, lexically normalized absolute form otherwise.
std::filesystem::path normalize_path(const std::filesystem::path& path,
                                     const std::filesystem::path& base);

// True when child equals parent or lies beneath it. Both must be normalized.
bool path_within(const std::filesystem::path& child, const std::filesystem::path& parent);

} // namespace twig
