#include "twig/squash.h"

#include "twig/backup_ref.h"
#include "twig/file_io.h"
#include "twig/log.h"

#include <sstream>

namespace twig {

namespace {
SquashResult squash_error(const std::string& code, const std::string& message) {
  SquashResult result;
  result.status = SquashStatus::Error;
  result.error_code = code;
  result.error_message = message;
  log::error("squash: " + message);
  return result;
}
} // namespace

const char* to_string(SquashStatus status) {
  switch (status) {
    case SquashStatus::Squashed: return "squashed";
    case SquashStatus::ContentChanged: return "content_changed";
    case SquashStatus::Error: return "error";
  }
  return "error";
}

SquashResult squash_branch(const Git& git,
                           const LockManager& locks,
                           const WorktreeRecord& record,
                           const std::string& session,
                           const std::string& message) {
  if (trim(message).empty()) {
    return squash_error("invalid_message", "commit message is empty");
  }
  const auto& wt = record.path;
  std::string error;
  std::string out;
  std::string code;
  if (!locks.require_owner(record.issue_id, session, code, error)) {
    return squash_error(code, error);
  }

  bool dirty = false;
  if (!git.has_tracked_changes(wt, dirty, error)) {
    return squash_error("fatal", error);
  }
  if (dirty) {
    return squash_error("worktree_dirty", "worktree " + wt.string() + " has uncommitted changes");
  }

  std::string tip;
  if (!git.resolve_commit(wt, "refs/heads/" + record.branch, tip, error)) {
    return squash_error("fatal", error);
  }
  bool contains_fork = false;
  if (!git.is_ancestor(wt, record.fork_point, tip, contains_fork, error)) {
    return squash_error("fatal", error);
  }
  if (!contains_fork) {
    return squash_error("fork_point_not_ancestor",
                        "branch " + record.branch + " does not contain fork point " + record.fork_point);
  }
  if (tip == record.fork_point) {
    return squash_error("nothing_to_squash", "branch " + record.branch + " has no commits since the fork point");
  }

  // Refuse when the branch already carries target commits newer than the fork point.
  std::string target_tip;
  if (git.resolve_commit(wt, record.target_branch, target_tip, error)) {
    std::string merge_base;
    if (!git.run_checked(wt, {"merge-base", tip, target_tip}, merge_base, error)) {
      return squash_error("fatal", error);
    }
    merge_base = trim(merge_base);
    if (merge_base != record.fork_point) {
      bool past_fork = false;
      if (!git.is_ancestor(wt, record.fork_point, merge_base, past_fork, error)) {
        return squash_error("fatal", error);
      }
      if (past_fork) {
        return squash_error("rebased_past_fork_point",
                            "branch " + record.branch + " contains " + record.target_branch +
                                " commits newer than fork point " + record.fork_point +
                                "; squashing would fold them into the issue commit");
      }
    }
  } else {
    log::warn("squash: target " + record.target_branch + " not resolvable; skipping upstream check");
  }

  std::string count_text;
  if (!git.run_checked(wt, {"rev-list", "--count", record.fork_point + ".." + tip}, count_text, error)) {
    return squash_error("fatal", error);
  }
  const int commit_count = std::stoi(trim(count_text));

  std::string dates;
  if (!git.run_checked(wt, {"log", "-1", "--date=raw", "--format=%ad%n%cd", record.fork_point}, dates, error)) {
    return squash_error("fatal", error);
  }
  std::istringstream date_lines(dates);
  std::string author_date;
  std::string committer_date;
  std::getline(date_lines, author_date);
  std::getline(date_lines, committer_date);
  if (trim(author_date).empty() || trim(committer_date).empty()) {
    return squash_error("fatal", "cannot read dates of fork point " + record.fork_point);
  }

  std::string tree;
  if (!git.run_checked(wt, {"rev-parse", "--verify", tip + "^{tree}"}, tree, error)) {
    return squash_error("fatal", error);
  }
  tree = trim(tree);

  SquashResult result;
  result.previous_tip = tip;
  result.commits_squashed = commit_count;
  if (!create_backup_ref(git, wt, record.branch, "squash", tip, result.backup_ref, error)) {
    return squash_error("backup_failed", error);
  }

  const EnvOverrides env = {{"GIT_AUTHOR_DATE", trim(author_date)}, {"GIT_COMMITTER_DATE", trim(committer_date)}};
  std::string new_commit;
  if (!git.run_checked(wt, {"commit-tree", tree, "-p", record.fork_point, "-m", message}, new_commit, error, env)) {
    SquashResult failed = squash_error("commit_failed", error);
    failed.backup_ref = result.backup_ref;
    failed.previous_tip = tip;
    return failed;
  }
  new_commit = trim(new_commit);

  if (!git.update_ref(wt, "refs/heads/" + record.branch, new_commit, tip, "twig: squash", error)) {
    SquashResult failed = squash_error("concurrent_update",
                                       "branch " + record.branch + " moved during squash: " + error);
    failed.backup_ref = result.backup_ref;
    failed.previous_tip = tip;
    return failed;
  }

  bool same = false;
  const bool compared = git.trees_equal(wt, result.backup_ref, new_commit, same, error);
  if (!compared || !same) {
    const std::string reason = compared ? "squashed tree differs from " + result.backup_ref : error;
    std::string restore_error;
    if (!restore_from_backup(git, wt, result.backup_ref, tip, restore_error)) {
      log::error("squash: " + restore_error);
    }
    result.status = SquashStatus::ContentChanged;
    result.error_code = "content_changed";
    result.error_message = reason + "; branch reset to " + tip + ", backup kept at " + result.backup_ref;
    log::error("squash: " + result.error_message);
    return result;
  }

  if (!git.delete_ref(wt, result.backup_ref, tip, error)) {
    log::warn("squash: could not delete backup " + result.backup_ref + ": " + error);
  } else {
    result.backup_ref.clear();
  }

  result.status = SquashStatus::Squashed;
  result.new_commit = new_commit;
  log::info("squash: " + record.branch + " " + std::to_string(commit_count) + " commit(s) -> " + new_commit);
  return result;
}

} // namespace twig
