#pragma once

#include "twig/git.h"
#include "twig/lock_manager.h"
#include "twig/worktree_manager.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace twig {

enum class RebaseStatus { Verified, ContentChanged, Conflict, Error };

const char* to_string(RebaseStatus status);

struct RebaseResult {
  RebaseStatus status = RebaseStatus::Error;
  std::string new_head;
  std::string previous_head;
  std::string base_branch;
  std::string base_tip;
  // Commit the issue's changes were measured from: the fork point, or the last verified base.
  std::string anchor;
  std::string backup_ref;
  int commits_rebased = 0;
  std::vector<std::string> conflict_files;
  // Files whose change differs between the original and the replayed branch.
  std::vector<std::string> changed_files;
  std::string diff_summary;
  std::string error_code;
  std::string error_message;

  bool success() const { return status == RebaseStatus::Verified; }
};

// Proof that head carries exactly the issue's changes on top of base.
struct VerificationRecord {
  std::string head;
  std::string base;
  std::string base_branch;
  int64_t verified_at = 0;
};

bool write_verification(const std::filesystem::path& git_dir, const VerificationRecord& rec, std::string& error);
bool read_verification(const std::filesystem::path& git_dir, VerificationRecord& out, std::string& error);

// Files touched by a patch whose sections differ between before and after.
std::vector<std::string> differing_patch_files(const std::string& before, const std::string& after);

// Replays anchor..HEAD onto the current tip of new_base (the record's target
// when empty) and verifies diff(anchor, old) == diff(new_base_tip, new). The
// anchor is the fork point until a rebase verifies, then the verified base.
// Requires session to hold the issue's lock.
RebaseResult rebase_branch(const Git& git,
                           const LockManager& locks,
                           const WorktreeRecord& record,
                           const std::string& session,
                           const std::string& new_base);

} // namespace twig
