#include "twig/paths.h"

#include "twig/log.h"

#include <cstdlib>

namespace twig {

namespace fs = std::filesystem;

fs::path normalize_path(const fs::path& path, const fs::path& base) {
  fs::path abs = path.is_absolute() ? path : base / path;
  std::error_code ec;
  const auto canonical = fs::weakly_canonical(abs, ec);
  fs::path out = ec ? abs.lexically_normal() : canonical;
  // Drop a trailing separator so "a/b/" and "a/b" compare equal.
  if (!out.has_filename() && out.has_parent_path() && out != out.root_path()) {
    out = out.parent_path();
  }
  return out;
}

bool path_within(const fs::path& child, const fs::path& parent) {
  auto c = child.begin();
  auto p = parent.begin();
  for (; p != parent.end(); ++p, ++c) {
    if (c == child.end() || *c != *p) {
      return false;
    }
  }
  return true;
}

bool resolve_paths(const fs::path& start_dir, const Git& git, ResolvedPaths& out, std::string& error) {
  fs::path start = start_dir;
  if (const char* env = std::getenv("TWIG_REPO")) {
    if (*env != '\0') {
      start = fs::path(env);
    }
  }
  if (start.empty()) {
    start = fs::current_path();
  }
  start = normalize_path(start, fs::current_path());

  if (!git.common_dir(start, out.common_dir, error)) {
    error = "not inside a git repository: " + start.string() + " (" + error + ")";
    return false;
  }

  std::vector<GitWorktreeEntry> worktrees;
  std::string list_error;
  if (git.list_worktrees(start, worktrees, list_error) && !worktrees.empty() && !worktrees.front().bare) {
    out.main_root = normalize_path(worktrees.front().path, start);
  } else {
    out.main_root = out.common_dir.parent_path();
    if (!list_error.empty()) {
      log::warn("worktree list failed; using parent of common dir: " + list_error);
    }
  }

  out.locks_dir = out.common_dir / "locks";
  out.logs_dir = out.common_dir / "twig" / "logs";
  out.worktrees_root = out.main_root.parent_path() / (out.main_root.filename().string() + ".worktrees");
  return true;
}

void apply_config_paths(ResolvedPaths& paths, const EngineConfig& cfg) {
  if (!cfg.worktrees_root.empty()) {
    paths.worktrees_root = normalize_path(fs::path(cfg.worktrees_root), paths.main_root);
  }
}

} // namespace twig
