#include "twig/merge.h"

#include "twig/file_io.h"
#include "twig/log.h"
#include "twig/rebase.h"

#include <chrono>
#include <thread>

namespace twig {

namespace fs = std::filesystem;

namespace {
constexpr int kSyncAttempts = 3;
constexpr auto kSyncRetryDelay = std::chrono::seconds(1);

MergeResult merge_error(MergeResult result, const std::string& stage, const std::string& code,
                        const std::string& message) {
  result.success = false;
  result.stage = stage;
  result.error_code = code;
  result.error_message = message;
  log::error("merge: " + message);
  return result;
}

bool index_locked(const ProcessResult& r) {
  return r.err.find("index.lock") != std::string::npos;
}
} // namespace

MergeResult merge_and_cleanup(const Git& git,
                              WorktreeManager& worktrees,
                              LockManager& locks,
                              const WorktreeRecord& record,
                              const std::string& session) {
  MergeResult result;
  result.target_branch = record.target_branch;
  const auto& wt = record.path;
  const fs::path& main_root = worktrees.paths().main_root;
  std::string error;
  std::string out;

  if (!LockManager::validate_session(session, error)) {
    return merge_error(result, "preflight", "invalid_session", error);
  }

  VerificationRecord verified;
  if (!read_verification(record.git_dir, verified, error)) {
    return merge_error(result, "verify", "not_verified", error + "; run rebase first");
  }
  std::string head;
  if (!git.resolve_commit(wt, "refs/heads/" + record.branch, head, error)) {
    return merge_error(result, "verify", "fatal", error);
  }
  std::string target_tip;
  if (!git.resolve_commit(main_root, "refs/heads/" + record.target_branch, target_tip, error)) {
    return merge_error(result, "verify", "target_unresolved", error);
  }
  result.previous_target_tip = target_tip;
  if (verified.head != head) {
    return merge_error(result, "verify", "verification_stale",
                       "branch head " + head + " differs from verified head " + verified.head);
  }
  if (verified.base != target_tip) {
    return merge_error(result, "verify", "verification_stale",
                       record.target_branch + " is at " + target_tip + " but verification was against " +
                           verified.base);
  }

  // Claim the issue: refreshes our own lock, reclaims a stale one, Busy for a live foreign one.
  const LockCheckResult before = locks.check(record.issue_id);
  const bool held_before =
      before.success && before.locked && !before.info.stale && before.info.owner_session == session;
  const LockResult claim = locks.acquire(record.issue_id, session, wt.string());
  if (claim.status == LockStatus::Busy) {
    const std::string owner = claim.holder.has_value() ? claim.holder->owner_session : std::string("another session");
    return merge_error(result, "preflight", "not_owner", "issue " + record.issue_id + " is locked by session " + owner);
  }
  if (claim.status != LockStatus::Acquired) {
    return merge_error(result, "preflight", claim.error_code, claim.error_message);
  }
  if (claim.reclaimed_stale) {
    log::warn("merge: reclaimed stale lock on " + record.issue_id);
  }
  auto preflight_fail = [&](const std::string& stage, const std::string& code, const std::string& message) {
    if (!held_before) {
      const LockResult released = locks.release(record.issue_id, session);
      if (!released.success()) {
        log::error("merge: " + released.error_message);
      }
    }
    return merge_error(result, stage, code, message);
  };

  if (!git.run_checked(wt, {"status", "--porcelain"}, out, error)) {
    return preflight_fail("preflight", "fatal", error);
  }
  if (!trim(out).empty()) {
    return preflight_fail("preflight", "worktree_dirty",
                          "worktree " + wt.string() + " has uncommitted or untracked files");
  }
  bool fast_forward = false;
  if (!git.is_ancestor(main_root, target_tip, head, fast_forward, error)) {
    return preflight_fail("preflight", "fatal", error);
  }
  if (!fast_forward) {
    return preflight_fail("preflight", "not_fast_forward",
                          record.target_branch + " is not an ancestor of " + record.branch);
  }

  std::vector<GitWorktreeEntry> entries;
  if (!git.list_worktrees(main_root, entries, error)) {
    return preflight_fail("preflight", "fatal", error);
  }
  for (const auto& entry : entries) {
    if (entry.branch == "refs/heads/" + record.target_branch) {
      result.target_worktree = entry.path;
      break;
    }
  }
  if (!result.target_worktree.empty()) {
    bool dirty = false;
    if (!git.has_tracked_changes(result.target_worktree, dirty, error)) {
      return preflight_fail("preflight", "fatal", error);
    }
    if (dirty) {
      return preflight_fail("preflight", "target_worktree_dirty",
                            "worktree " + result.target_worktree.string() + " with " + record.target_branch +
                                " checked out has uncommitted changes");
    }
    // Dry run: refuses when untracked files would be overwritten.
    if (!git.run_checked(result.target_worktree, {"read-tree", "-n", "-m", "-u", target_tip, head}, out, error)) {
      return preflight_fail("preflight", "would_overwrite", error);
    }
  }

  if (!git.update_ref(main_root, "refs/heads/" + record.target_branch, head, target_tip,
                      "twig: fast-forward " + record.target_branch + " to " + record.branch, error)) {
    return preflight_fail("update_ref", "concurrent_update", error);
  }
  result.ref_updated = true;
  result.merged_commit = head;
  log::info("merge: " + record.target_branch + " " + target_tip + " -> " + head);

  if (!result.target_worktree.empty()) {
    const std::vector<std::string> sync_args = {"reset", "--hard", "--quiet", head};
    ProcessResult sync;
    for (int attempt = 1; attempt <= kSyncAttempts; ++attempt) {
      sync = git.run(result.target_worktree, sync_args);
      if (sync.ok() || !index_locked(sync) || attempt == kSyncAttempts) {
        break;
      }
      log::warn("merge: index.lock busy in " + result.target_worktree.string() + "; retry " +
                std::to_string(attempt));
      std::this_thread::sleep_for(kSyncRetryDelay);
    }
    if (!sync.ok()) {
      return merge_error(result, "sync", "sync_failed",
                         "ref updated but working tree not synced: " + describe_failure(sync_args, sync));
    }
    bool dirty = false;
    if (!git.has_tracked_changes(result.target_worktree, dirty, error) || dirty) {
      return merge_error(result, "sync", "sync_failed",
                         "working tree " + result.target_worktree.string() + " does not match " + head +
                             (error.empty() ? std::string() : ": " + error));
    }
    result.tree_synced = true;
  }

  const DestroyResult destroyed = worktrees.destroy(record, false);
  if (!destroyed.success) {
    return merge_error(result, "destroy", destroyed.error_code, destroyed.error_message);
  }
  result.worktree_removed = true;

  const LockResult released = locks.release(record.issue_id, session);
  if (!released.success()) {
    return merge_error(result, "release", released.error_code, released.error_message);
  }
  result.lock_released = true;
  result.success = true;
  result.stage = "done";
  return result;
}

} // namespace twig
