#include "twig/rebase.h"

#include "twig/backup_ref.h"
#include "twig/file_io.h"
#include "twig/log.h"

#include <map>
#include <set>
#include <sstream>

#include <nlohmann/json.hpp>

namespace twig {

namespace fs = std::filesystem;

namespace {
constexpr const char* kVerifiedFile = "verified";

RebaseResult rebase_error(const std::string& code, const std::string& message) {
  RebaseResult result;
  result.status = RebaseStatus::Error;
  result.error_code = code;
  result.error_message = message;
  log::error("rebase: " + message);
  return result;
}

// "diff --git a/x b/x" section text keyed by path.
std::map<std::string, std::string> split_patch(const std::string& patch) {
  std::map<std::string, std::string> sections;
  std::istringstream in(patch);
  std::string line;
  std::string current;
  while (std::getline(in, line)) {
    if (line.rfind("diff --git ", 0) == 0) {
      const auto b = line.rfind(" b/");
      current = b == std::string::npos ? line.substr(11) : line.substr(b + 3);
      sections[current];
    }
    if (!current.empty()) {
      sections[current] += line;
      sections[current] += '\n';
    }
  }
  return sections;
}

bool rebase_in_progress(const fs::path& git_dir) {
  std::error_code ec;
  return fs::exists(git_dir / "rebase-merge", ec) || fs::exists(git_dir / "rebase-apply", ec);
}
} // namespace

const char* to_string(RebaseStatus status) {
  switch (status) {
    case RebaseStatus::Verified: return "verified";
    case RebaseStatus::ContentChanged: return "content_changed";
    case RebaseStatus::Conflict: return "conflict";
    case RebaseStatus::Error: return "error";
  }
  return "error";
}

bool write_verification(const fs::path& git_dir, const VerificationRecord& rec, std::string& error) {
  nlohmann::json j;
  j["head"] = rec.head;
  j["base"] = rec.base;
  j["base_branch"] = rec.base_branch;
  j["verified_at"] = rec.verified_at;
  j["verified_iso"] = iso_utc(rec.verified_at);
  return write_text_file_atomic(git_dir / kVerifiedFile, j.dump(2) + "\n", error);
}

bool read_verification(const fs::path& git_dir, VerificationRecord& out, std::string& error) {
  const fs::path path = git_dir / kVerifiedFile;
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    error = "no verified rebase recorded for this worktree";
    return false;
  }
  nlohmann::json j;
  if (!load_json_file(path, j, error)) {
    return false;
  }
  if (!j.is_object() || !j.contains("head") || !j.contains("base") || !j["head"].is_string() ||
      !j["base"].is_string()) {
    error = "malformed verification record " + path.string();
    return false;
  }
  out.head = j["head"].get<std::string>();
  out.base = j["base"].get<std::string>();
  out.base_branch = j.value("base_branch", "");
  out.verified_at = j.value("verified_at", int64_t{0});
  return true;
}

std::vector<std::string> differing_patch_files(const std::string& before, const std::string& after) {
  const auto a = split_patch(before);
  const auto b = split_patch(after);
  std::set<std::string> files;
  for (const auto& kv : a) {
    const auto it = b.find(kv.first);
    if (it == b.end() || it->second != kv.second) {
      files.insert(kv.first);
    }
  }
  for (const auto& kv : b) {
    if (a.find(kv.first) == a.end()) {
      files.insert(kv.first);
    }
  }
  return std::vector<std::string>(files.begin(), files.end());
}

RebaseResult rebase_branch(const Git& git,
                           const LockManager& locks,
                           const WorktreeRecord& record,
                           const std::string& session,
                           const std::string& new_base) {
  const auto& wt = record.path;
  const std::string base_branch = new_base.empty() ? record.target_branch : new_base;
  std::string error;
  std::string out;
  std::string code;

  if (!locks.require_owner(record.issue_id, session, code, error)) {
    return rebase_error(code, error);
  }
  if (rebase_in_progress(record.git_dir)) {
    return rebase_error("rebase_in_progress", "a rebase is already in progress in " + wt.string());
  }
  bool dirty = false;
  if (!git.has_tracked_changes(wt, dirty, error)) {
    return rebase_error("fatal", error);
  }
  if (dirty) {
    return rebase_error("worktree_dirty", "worktree " + wt.string() + " has uncommitted changes");
  }

  std::string base_tip;
  if (!git.resolve_commit(wt, base_branch, base_tip, error)) {
    return rebase_error("base_unresolved", error);
  }
  std::string tip;
  if (!git.resolve_commit(wt, "refs/heads/" + record.branch, tip, error)) {
    return rebase_error("fatal", error);
  }
  bool contains_fork = false;
  if (!git.is_ancestor(wt, record.fork_point, tip, contains_fork, error)) {
    return rebase_error("fatal", error);
  }
  if (!contains_fork) {
    return rebase_error("fork_point_not_ancestor",
                        "branch " + record.branch + " does not contain fork point " + record.fork_point);
  }

  // After a verified rebase the issue's commits sit on the verified base, not the fork point.
  std::string anchor = record.fork_point;
  VerificationRecord previous;
  std::string previous_error;
  if (read_verification(record.git_dir, previous, previous_error) && Git::is_full_hash(previous.base) &&
      previous.base != record.fork_point) {
    bool on_previous = false;
    if (git.is_ancestor(wt, previous.base, tip, on_previous, previous_error) && on_previous) {
      anchor = previous.base;
    } else if (!previous_error.empty()) {
      log::warn("rebase: ignoring verified base " + previous.base + ": " + previous_error);
    }
  }

  RebaseResult result;
  result.previous_head = tip;
  result.base_branch = base_branch;
  result.base_tip = base_tip;
  result.anchor = anchor;
  if (!create_backup_ref(git, wt, record.branch, "rebase", tip, result.backup_ref, error)) {
    return rebase_error("backup_failed", error);
  }

  std::string patch_before;
  if (!git.diff_patch(wt, anchor, result.backup_ref, patch_before, error)) {
    result.error_code = "fatal";
    result.error_message = error;
    log::error("rebase: " + error);
    return result;
  }

  auto restore_and_fail = [&](RebaseStatus status, const std::string& fail_code, const std::string& message) {
    std::string restore_error;
    if (!restore_from_backup(git, wt, result.backup_ref, tip, restore_error)) {
      log::error("rebase: " + restore_error);
    }
    result.status = status;
    result.error_code = fail_code;
    result.error_message = message + "; branch reset to " + tip + ", backup kept at " + result.backup_ref;
    log::error("rebase: " + result.error_message);
    return result;
  };

  const std::vector<std::string> rebase_args = {"rebase", "--no-autostash", "--onto", base_tip, anchor,
                                                record.branch};
  const auto replay = git.run(wt, rebase_args, {{"GIT_EDITOR", "true"}});
  if (!replay.ok()) {
    std::string unmerged;
    std::string list_error;
    if (git.run_checked(wt, {"diff", "--name-only", "--diff-filter=U"}, unmerged, list_error)) {
      std::istringstream lines(unmerged);
      std::string line;
      while (std::getline(lines, line)) {
        if (!trim(line).empty()) {
          result.conflict_files.push_back(trim(line));
        }
      }
    }
    if (rebase_in_progress(record.git_dir)) {
      std::string abort_error;
      if (!git.run_checked(wt, {"rebase", "--abort"}, out, abort_error)) {
        log::error("rebase: abort failed: " + abort_error);
      }
    }
    if (!result.conflict_files.empty()) {
      return restore_and_fail(RebaseStatus::Conflict, "conflict",
                              "rebase onto " + base_branch + " conflicts in " +
                                  std::to_string(result.conflict_files.size()) + " file(s)");
    }
    return restore_and_fail(RebaseStatus::Error, "rebase_failed", describe_failure(rebase_args, replay));
  }

  std::string new_head;
  if (!git.resolve_commit(wt, "HEAD", new_head, error)) {
    return restore_and_fail(RebaseStatus::Error, "fatal", error);
  }
  std::string patch_after;
  if (!git.diff_patch(wt, base_tip, new_head, patch_after, error)) {
    return restore_and_fail(RebaseStatus::Error, "fatal", error);
  }

  if (patch_before != patch_after) {
    result.changed_files = differing_patch_files(patch_before, patch_after);
    std::string stat_before;
    std::string stat_after;
    if (!git.diff_stat(wt, anchor, result.backup_ref, stat_before, error)) {
      stat_before = "  (stat unavailable: " + error + ")\n";
    }
    if (!git.diff_stat(wt, base_tip, new_head, stat_after, error)) {
      stat_after = "  (stat unavailable: " + error + ")\n";
    }
    std::ostringstream summary;
    summary << "before (" << anchor.substr(0, 12) << ".." << tip.substr(0, 12) << "):\n"
            << stat_before << "after (" << base_tip.substr(0, 12) << ".." << new_head.substr(0, 12) << "):\n"
            << stat_after;
    result.diff_summary = summary.str();
    return restore_and_fail(RebaseStatus::ContentChanged, "content_changed",
                            "rebased branch changes differ in " + std::to_string(result.changed_files.size()) +
                                " file(s)");
  }

  std::string count_text;
  if (git.run_checked(wt, {"rev-list", "--count", base_tip + ".." + new_head}, count_text, error)) {
    result.commits_rebased = std::stoi(trim(count_text));
  }

  VerificationRecord rec;
  rec.head = new_head;
  rec.base = base_tip;
  rec.base_branch = base_branch;
  rec.verified_at = epoch_seconds_now();
  if (!write_verification(record.git_dir, rec, error)) {
    return restore_and_fail(RebaseStatus::Error, "fatal", error);
  }

  if (!git.delete_ref(wt, result.backup_ref, tip, error)) {
    log::warn("rebase: could not delete backup " + result.backup_ref + ": " + error);
  } else {
    result.backup_ref.clear();
  }
  result.status = RebaseStatus::Verified;
  result.new_head = new_head;
  log::info("rebase: " + record.branch + " verified on " + base_branch + " at " + base_tip);
  return result;
}

} // namespace twig
