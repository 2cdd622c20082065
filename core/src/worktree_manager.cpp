#include "twig/worktree_manager.h"

#include "twig/file_io.h"
#include "twig/log.h"

namespace twig {

namespace fs = std::filesystem;

namespace {
constexpr const char* kForkPointFile = "fork-point";
constexpr const char* kTargetRefFile = "target-ref";

WorktreeResult fail(const std::string& code, const std::string& message) {
  WorktreeResult result;
  result.error_code = code;
  result.error_message = message;
  log::error(message);
  return result;
}
} // namespace

WorktreeManager::WorktreeManager(const Git& git, LockManager& locks, ResolvedPaths paths)
    : git_(git), locks_(locks), paths_(std::move(paths)) {}

fs::path WorktreeManager::path_for(const std::string& issue_id) const {
  return paths_.worktrees_root / LockManager::sanitize_name(issue_id);
}

bool WorktreeManager::write_target_ref(const WorktreeRecord& record,
                                       const std::string& target_branch,
                                       std::string& error) {
  return write_text_file_atomic(record.git_dir / kTargetRefFile, target_branch + "\n", error);
}

WorktreeResult WorktreeManager::create(const std::string& issue_id,
                                       const std::string& target_branch,
                                       const std::string& session,
                                       std::chrono::milliseconds lock_timeout) {
  if (issue_id.empty()) {
    return fail("invalid_issue", "issue id is empty");
  }
  if (target_branch.empty()) {
    return fail("invalid_target", "target branch is empty");
  }
  std::string out;
  std::string error;
  if (!git_.run_checked(paths_.main_root, {"check-ref-format", "--branch", issue_id}, out, error)) {
    return fail("invalid_issue", "issue id '" + issue_id + "' is not a valid branch name");
  }

  const fs::path wt_path = path_for(issue_id);
  const LockCheckResult before = locks_.check(issue_id);
  const bool held_before = before.success && before.locked && !before.info.stale &&
                           before.info.owner_session == session;

  LockResult lock = locks_.acquire_with_retry(issue_id, session, wt_path.string(), lock_timeout);
  if (lock.status == LockStatus::Busy) {
    WorktreeResult result;
    result.busy = true;
    result.holder = lock.holder;
    result.error_code = "busy";
    result.error_message = "issue " + issue_id + " is locked by another session";
    log::info(result.error_message);
    return result;
  }
  if (lock.status != LockStatus::Acquired) {
    WorktreeResult result = fail(lock.error_code.empty() ? "lock_failed" : lock.error_code, lock.error_message);
    result.holder = lock.holder;
    return result;
  }

  bool worktree_added = false;
  bool branch_created = false;
  auto rollback = [&](const std::string& code, const std::string& message) {
    std::string rb_out;
    std::string rb_error;
    if (worktree_added &&
        !git_.run_checked(paths_.main_root, {"worktree", "remove", "--force", wt_path.string()}, rb_out, rb_error)) {
      log::error("rollback: " + rb_error);
    }
    if (branch_created &&
        !git_.run_checked(paths_.main_root, {"branch", "-D", issue_id}, rb_out, rb_error)) {
      log::error("rollback: " + rb_error);
    }
    if (!held_before) {
      const LockResult released = locks_.release(issue_id, session);
      if (!released.success()) {
        log::error("rollback: " + released.error_message);
      }
    }
    return fail(code, message);
  };

  std::string fork_point;
  if (!git_.resolve_commit(paths_.main_root, target_branch, fork_point, error)) {
    return rollback("target_unresolved", error);
  }

  std::vector<GitWorktreeEntry> existing;
  if (!git_.list_worktrees(paths_.main_root, existing, error)) {
    return rollback("fatal", error);
  }
  const std::string branch_ref = "refs/heads/" + issue_id;
  for (const auto& entry : existing) {
    if (entry.branch == branch_ref) {
      return rollback("worktree_exists",
                      "branch " + issue_id + " is already checked out at " + entry.path.string());
    }
  }
  std::error_code ec;
  if (fs::exists(wt_path, ec)) {
    return rollback("path_exists", "worktree path already exists: " + wt_path.string());
  }
  if (git_.ref_exists(paths_.main_root, branch_ref)) {
    log::warn("deleting leftover branch " + issue_id + " with no worktree");
    if (!git_.run_checked(paths_.main_root, {"branch", "-D", issue_id}, out, error)) {
      return rollback("stale_branch", error);
    }
  }

  fs::create_directories(wt_path.parent_path(), ec);
  if (ec) {
    return rollback("fatal", "cannot create " + wt_path.parent_path().string() + ": " + ec.message());
  }
  const auto add = git_.run(paths_.main_root, {"worktree", "add", "-b", issue_id, wt_path.string(), fork_point});
  if (!add.ok()) {
    // A failed add may still have created the branch.
    branch_created = git_.ref_exists(paths_.main_root, branch_ref);
    worktree_added = fs::exists(wt_path, ec);
    return rollback("worktree_add_failed",
                    describe_failure({"worktree", "add", "-b", issue_id, wt_path.string(), fork_point}, add));
  }
  worktree_added = true;
  branch_created = true;

  WorktreeRecord record;
  record.issue_id = issue_id;
  record.branch = issue_id;
  record.path = normalize_path(wt_path, paths_.main_root);
  record.fork_point = fork_point;
  record.target_branch = target_branch;
  if (!git_.absolute_git_dir(record.path, record.git_dir, error)) {
    return rollback("fatal", error);
  }
  if (!write_text_file_atomic(record.git_dir / kForkPointFile, fork_point + "\n", error) ||
      !write_target_ref(record, target_branch, error)) {
    return rollback("fatal", error);
  }
  if (record.path.string() != wt_path.string()) {
    const LockResult updated = locks_.update(issue_id, session, record.path.string());
    if (updated.status != LockStatus::Updated) {
      return rollback(updated.error_code, updated.error_message);
    }
  }

  log::info("worktree created: " + record.path.string() + " branch=" + issue_id + " fork=" + fork_point);
  WorktreeResult result;
  result.success = true;
  result.record = record;
  return result;
}

WorktreeResult WorktreeManager::load(const fs::path& worktree_path) const {
  const fs::path path = normalize_path(worktree_path, fs::current_path());
  std::error_code ec;
  if (!fs::is_directory(path, ec)) {
    return fail("not_found", "worktree not found: " + path.string());
  }
  WorktreeRecord record;
  record.path = path;
  std::string error;
  if (!git_.absolute_git_dir(path, record.git_dir, error)) {
    return fail("not_a_worktree", error);
  }

  const fs::path fork_file = record.git_dir / kForkPointFile;
  if (!fs::exists(fork_file, ec)) {
    return fail("not_managed", "no fork-point recorded for " + path.string() + " (expected " + fork_file.string() + ")");
  }
  record.fork_point = trim(read_text_file(fork_file));
  if (!Git::is_full_hash(record.fork_point)) {
    return fail("malformed_fork_point",
                "malformed fork-point in " + fork_file.string() + ": expected 40 or 64 hex digits, got '" +
                    record.fork_point + "'");
  }
  record.target_branch = trim(read_text_file(record.git_dir / kTargetRefFile));
  if (record.target_branch.empty()) {
    return fail("malformed_target_ref", "missing target-ref in " + record.git_dir.string());
  }

  std::string head;
  if (!git_.run_checked(path, {"symbolic-ref", "--quiet", "HEAD"}, head, error)) {
    return fail("detached_head", "worktree " + path.string() + " has no branch checked out");
  }
  head = trim(head);
  const std::string prefix = "refs/heads/";
  record.branch = head.rfind(prefix, 0) == 0 ? head.substr(prefix.size()) : head;
  record.issue_id = record.branch;

  WorktreeResult result;
  result.success = true;
  result.record = record;
  return result;
}

WorktreeResult WorktreeManager::find(const std::string& issue_id) const {
  const fs::path expected = path_for(issue_id);
  std::error_code ec;
  if (fs::is_directory(expected, ec)) {
    return load(expected);
  }
  std::vector<GitWorktreeEntry> entries;
  std::string error;
  if (!git_.list_worktrees(paths_.main_root, entries, error)) {
    return fail("fatal", error);
  }
  for (const auto& entry : entries) {
    if (entry.branch == "refs/heads/" + issue_id) {
      return load(entry.path);
    }
  }
  WorktreeResult result;
  result.error_code = "not_found";
  result.error_message = "no worktree for issue " + issue_id;
  return result;
}

WorktreeListResult WorktreeManager::list() const {
  WorktreeListResult result;
  std::vector<GitWorktreeEntry> entries;
  std::string error;
  if (!git_.list_worktrees(paths_.main_root, entries, error)) {
    result.error_code = "fatal";
    result.error_message = error;
    return result;
  }
  for (const auto& entry : entries) {
    if (entry.bare || normalize_path(entry.path, paths_.main_root) == paths_.main_root) {
      continue;
    }
    std::error_code ec;
    if (!fs::is_directory(entry.path, ec)) {
      continue;
    }
    WorktreeResult loaded = load(entry.path);
    if (loaded.success) {
      result.records.push_back(loaded.record);
    } else if (loaded.error_code != "not_managed") {
      log::warn("skipping worktree " + entry.path.string() + ": " + loaded.error_message);
    }
  }
  result.success = true;
  return result;
}

DestroyResult WorktreeManager::destroy(const WorktreeRecord& record, bool force) const {
  DestroyResult result;
  std::string out;
  std::string error;
  std::error_code ec;
  if (fs::exists(record.path, ec)) {
    std::vector<std::string> args = {"worktree", "remove"};
    if (force) {
      args.push_back("--force");
    }
    args.push_back(record.path.string());
    if (!git_.run_checked(paths_.main_root, args, out, error)) {
      result.error_code = "worktree_remove_failed";
      result.error_message = error;
      log::error(error);
      return result;
    }
  } else if (!git_.run_checked(paths_.main_root, {"worktree", "prune"}, out, error)) {
    log::warn(error);
  }
  result.worktree_removed = true;

  if (!record.branch.empty() && git_.ref_exists(paths_.main_root, "refs/heads/" + record.branch)) {
    if (!git_.run_checked(paths_.main_root, {"branch", "-D", record.branch}, out, error)) {
      result.error_code = "branch_delete_failed";
      result.error_message = error;
      log::error(error);
      return result;
    }
  }
  result.branch_deleted = true;
  result.success = true;
  log::info("worktree destroyed: " + record.path.string());
  return result;
}

} // namespace twig
