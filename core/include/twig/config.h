#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace twig {

struct EngineConfig {
  std::string git_binary = "git";
  int64_t stale_after_seconds = 600;
  int64_t lock_wait_timeout_ms = 0;
  int64_t lock_retry_initial_ms = 50;
  int64_t lock_retry_max_ms = 2000;
  // Empty means <repo>.worktrees beside the main worktree.
  std::string worktrees_root;
  std::string default_target_branch = "main";
  bool log_to_file = true;
};

// Missing, unreadable or invalid files log a warning and yield defaults.
EngineConfig load_engine_config(const std::filesystem::path& path);
// Reports the same failures instead; out is untouched on failure.
bool load_engine_config(const std::filesystem::path& path, EngineConfig& out, std::string& error);

// TWIG_CONFIG, then <repo_root>/.twig.yaml, then <repo_root>/.twig.json.
std::filesystem::path find_engine_config(const std::filesystem::path& repo_root);

} // namespace twig
