#pragma once

#include "twig/git.h"
#include "twig/lock_manager.h"
#include "twig/worktree_manager.h"

#include <string>

namespace twig {

enum class SquashStatus { Squashed, ContentChanged, Error };

const char* to_string(SquashStatus status);

struct SquashResult {
  SquashStatus status = SquashStatus::Error;
  std::string new_commit;
  std::string previous_tip;
  std::string backup_ref;
  int commits_squashed = 0;
  std::string error_code;
  std::string error_message;

  bool success() const { return status == SquashStatus::Squashed; }
};

// Collapses fork_point..HEAD into a single commit whose parent is the fork point
// and whose author and committer dates are the fork point's.
// Requires session to hold the issue's lock.
SquashResult squash_branch(const Git& git,
                           const LockManager& locks,
                           const WorktreeRecord& record,
                           const std::string& session,
                           const std::string& message);

} // namespace twig
