#pragma once

#include "twig/git.h"
#include "twig/lock_manager.h"
#include "twig/worktree_manager.h"

#include <filesystem>
#include <string>

namespace twig {

struct MergeResult {
  bool success = false;
  std::string merged_commit;
  std::string target_branch;
  std::string previous_target_tip;
  std::filesystem::path target_worktree;
  bool ref_updated = false;
  bool tree_synced = false;
  bool worktree_removed = false;
  bool lock_released = false;
  // Step that failed: verify, preflight, update_ref, sync, destroy, release.
  std::string stage;
  std::string error_code;
  std::string error_message;
};

// Fast-forwards the target to a verified issue head, syncs whichever worktree has
// the target checked out, then destroys the issue worktree and releases its lock.
MergeResult merge_and_cleanup(const Git& git,
                              WorktreeManager& worktrees,
                              LockManager& locks,
                              const WorktreeRecord& record,
                              const std::string& session);

} // namespace twig
