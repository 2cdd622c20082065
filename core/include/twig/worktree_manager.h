#pragma once

#include "twig/git.h"
#include "twig/lock_manager.h"
#include "twig/paths.h"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace twig {

struct WorktreeRecord {
  std::string issue_id;
  std::string branch;
  std::filesystem::path path;
  // Pinned at creation; never re-resolved.
  std::string fork_point;
  std::string target_branch;
  // The worktree's private administrative directory.
  std::filesystem::path git_dir;
};

struct WorktreeResult {
  bool success = false;
  bool busy = false;
  WorktreeRecord record;
  std::optional<LockInfo> holder;
  std::string error_code;
  std::string error_message;
};

struct WorktreeListResult {
  bool success = false;
  std::vector<WorktreeRecord> records;
  std::string error_code;
  std::string error_message;
};

struct DestroyResult {
  bool success = false;
  bool worktree_removed = false;
  bool branch_deleted = false;
  std::string error_code;
  std::string error_message;
};

class WorktreeManager {
 public:
  WorktreeManager(const Git& git, LockManager& locks, ResolvedPaths paths);

  WorktreeResult create(const std::string& issue_id,
                        const std::string& target_branch,
                        const std::string& session,
                        std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(0));

  WorktreeResult load(const std::filesystem::path& worktree_path) const;
  WorktreeResult find(const std::string& issue_id) const;
  WorktreeListResult list() const;

  // Removes the worktree and deletes its branch. Performs no safety checks.
  DestroyResult destroy(const WorktreeRecord& record, bool force = false) const;

  std::filesystem::path path_for(const std::string& issue_id) const;
  const ResolvedPaths& paths() const { return paths_; }

  static bool write_target_ref(const WorktreeRecord& record, const std::string& target_branch, std::string& error);

 private:
  const Git& git_;
  LockManager& locks_;
  ResolvedPaths paths_;
};

} // namespace twig
