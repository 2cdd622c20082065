#include "twig/config.h"
#include "twig/git.h"
#include "twig/log.h"
#include "twig/paths.h"
#include "twigctl/cli_api.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {
void print_json(const json& value) {
  std::cout << value.dump(2) << "\n";
}

json error_json(const std::string& code, const std::string& message) {
  json j;
  j["status"] = "error";
  j["error_code"] = code;
  j["error_message"] = message;
  return j;
}

int fail(const std::string& code, const std::string& message) {
  twig::log::error(message);
  print_json(error_json(code, message));
  return 1;
}

std::chrono::milliseconds lock_timeout(const CliContext& ctx, const std::optional<int64_t>& timeout_ms) {
  const int64_t ms = timeout_ms.has_value() ? *timeout_ms : ctx.config.lock_wait_timeout_ms;
  return std::chrono::milliseconds(ms < 0 ? 0 : ms);
}

bool load_record(const CliContext& ctx, const fs::path& path, twig::WorktreeRecord& out, json& error_out) {
  const twig::Git git(ctx.config.git_binary);
  twig::LockManager locks(ctx.paths.locks_dir, lock_options(ctx.config));
  twig::WorktreeManager worktrees(git, locks, ctx.paths);
  const auto loaded = worktrees.load(path);
  if (!loaded.success) {
    error_out = error_json(loaded.error_code, loaded.error_message);
    return false;
  }
  out = loaded.record;
  return true;
}
} // namespace

twig::LockManagerOptions lock_options(const twig::EngineConfig& cfg) {
  twig::LockManagerOptions opts;
  opts.stale_after_seconds = cfg.stale_after_seconds;
  opts.retry_initial_ms = cfg.lock_retry_initial_ms;
  opts.retry_max_ms = cfg.lock_retry_max_ms;
  return opts;
}

bool load_cli_context(const fs::path& start_dir, CliContext& ctx, std::string& error_code, std::string& error) {
  const twig::Git default_git("git");
  if (!twig::resolve_paths(start_dir, default_git, ctx.paths, error)) {
    error_code = "not_a_repository";
    return false;
  }
  const fs::path cfg_path = twig::find_engine_config(ctx.paths.main_root);
  if (!cfg_path.empty() && !twig::load_engine_config(cfg_path, ctx.config, error)) {
    error_code = "invalid_config";
    return false;
  }
  // The config lives in the main root, so the default git finds it first.
  if (ctx.config.git_binary != default_git.binary()) {
    const twig::Git git(ctx.config.git_binary);
    if (!twig::resolve_paths(start_dir, git, ctx.paths, error)) {
      error_code = "invalid_config";
      error = "git_binary " + ctx.config.git_binary + ": " + error;
      return false;
    }
  }
  twig::apply_config_paths(ctx.paths, ctx.config);
  return true;
}

json lock_info_json(const twig::LockInfo& info) {
  json j;
  j["issue"] = info.name;
  j["session_id"] = info.owner_session;
  j["created_at"] = info.acquired_at;
  j["created_iso"] = info.acquired_iso;
  j["age_seconds"] = info.age_seconds;
  j["stale"] = info.stale;
  j["worktree"] = info.worktree;
  return j;
}

json lock_result_json(const twig::LockResult& result) {
  json j;
  j["status"] = twig::to_string(result.status);
  j["issue"] = result.name;
  if (!result.message.empty()) {
    j["message"] = result.message;
  }
  if (result.holder.has_value()) {
    j[result.status == twig::LockStatus::Busy ? "owner" : "lock"] = lock_info_json(*result.holder);
  }
  if (result.reclaimed_stale) {
    j["reclaimed_stale"] = true;
  }
  if (result.timed_out) {
    j["timed_out"] = true;
  }
  if (result.status == twig::LockStatus::Error) {
    j["error_code"] = result.error_code;
    j["error_message"] = result.error_message;
  }
  return j;
}

json worktree_record_json(const twig::WorktreeRecord& record) {
  json j;
  j["issue"] = record.issue_id;
  j["branch"] = record.branch;
  j["path"] = record.path.string();
  j["fork_point"] = record.fork_point;
  j["target_branch"] = record.target_branch;
  return j;
}

json squash_result_json(const twig::SquashResult& result) {
  json j;
  j["status"] = twig::to_string(result.status);
  if (!result.new_commit.empty()) j["commit"] = result.new_commit;
  if (!result.previous_tip.empty()) j["previous_tip"] = result.previous_tip;
  if (!result.backup_ref.empty()) j["backup_ref"] = result.backup_ref;
  j["commits_squashed"] = result.commits_squashed;
  if (!result.success()) {
    j["error_code"] = result.error_code;
    j["error_message"] = result.error_message;
  }
  return j;
}

json rebase_result_json(const twig::RebaseResult& result) {
  json j;
  j["status"] = twig::to_string(result.status);
  j["base_branch"] = result.base_branch;
  j["base_tip"] = result.base_tip;
  if (!result.new_head.empty()) j["head"] = result.new_head;
  if (!result.anchor.empty()) j["anchor"] = result.anchor;
  if (!result.previous_head.empty()) j["previous_head"] = result.previous_head;
  if (!result.backup_ref.empty()) j["backup_ref"] = result.backup_ref;
  j["commits_rebased"] = result.commits_rebased;
  if (!result.conflict_files.empty()) j["conflicting_files"] = result.conflict_files;
  if (!result.changed_files.empty()) j["changed_files"] = result.changed_files;
  if (!result.diff_summary.empty()) j["diff_summary"] = result.diff_summary;
  if (!result.success()) {
    j["error_code"] = result.error_code;
    j["error_message"] = result.error_message;
  }
  return j;
}

json guard_result_json(const twig::GuardResult& result) {
  json j;
  j["decision"] = twig::to_string(result.decision);
  j["kind"] = twig::to_string(result.kind);
  j["target"] = result.target;
  if (!result.resolved_target.empty()) j["resolved_target"] = result.resolved_target.string();
  if (!result.allowed()) {
    if (!result.blocked_by.path.empty()) {
      j["protected_path"] = result.blocked_by.path.string();
      j["reason"] = twig::to_string(result.blocked_by.reason);
      if (!result.blocked_by.owner.empty()) j["owner"] = result.blocked_by.owner;
      if (!result.blocked_by.issue.empty()) j["issue"] = result.blocked_by.issue;
    }
    j["message"] = result.message;
  }
  if (!result.error_code.empty()) {
    j["error_code"] = result.error_code;
    j["error_message"] = result.error_message;
  }
  return j;
}

json merge_result_json(const twig::MergeResult& result) {
  json j;
  j["status"] = result.success ? "merged" : "error";
  j["target_branch"] = result.target_branch;
  if (!result.merged_commit.empty()) j["commit"] = result.merged_commit;
  if (!result.previous_target_tip.empty()) j["previous_target_tip"] = result.previous_target_tip;
  if (!result.target_worktree.empty()) j["target_worktree"] = result.target_worktree.string();
  j["ref_updated"] = result.ref_updated;
  j["tree_synced"] = result.tree_synced;
  j["worktree_removed"] = result.worktree_removed;
  j["lock_released"] = result.lock_released;
  if (!result.success) {
    j["stage"] = result.stage;
    j["error_code"] = result.error_code;
    j["error_message"] = result.error_message;
  }
  return j;
}

int lock_acquire(const CliContext& ctx,
                 const std::string& issue,
                 const std::string& session,
                 const std::string& worktree,
                 const std::optional<int64_t>& timeout_ms) {
  twig::LockManager locks(ctx.paths.locks_dir, lock_options(ctx.config));
  const auto result = locks.acquire_with_retry(issue, session, worktree, lock_timeout(ctx, timeout_ms));
  print_json(lock_result_json(result));
  return result.status == twig::LockStatus::Acquired ? 0 : 1;
}

int lock_release(const CliContext& ctx, const std::string& issue, const std::string& session) {
  twig::LockManager locks(ctx.paths.locks_dir, lock_options(ctx.config));
  const auto result = locks.release(issue, session);
  print_json(lock_result_json(result));
  return result.success() ? 0 : 1;
}

int lock_update(const CliContext& ctx, const std::string& issue, const std::string& session, const std::string& worktree) {
  twig::LockManager locks(ctx.paths.locks_dir, lock_options(ctx.config));
  const auto result = locks.update(issue, session, worktree);
  print_json(lock_result_json(result));
  return result.success() ? 0 : 1;
}

int lock_force_release(const CliContext& ctx, const std::string& issue) {
  twig::LockManager locks(ctx.paths.locks_dir, lock_options(ctx.config));
  const auto result = locks.force_release(issue);
  print_json(lock_result_json(result));
  return result.success() ? 0 : 1;
}

int lock_check(const CliContext& ctx, const std::string& issue) {
  const twig::LockManager locks(ctx.paths.locks_dir, lock_options(ctx.config));
  const auto result = locks.check(issue);
  if (!result.success) {
    return fail(result.error_code, result.error_message);
  }
  json j;
  j["issue"] = twig::LockManager::sanitize_name(issue);
  j["locked"] = result.locked;
  if (result.locked) {
    j["lock"] = lock_info_json(result.info);
  }
  print_json(j);
  return 0;
}

int lock_list(const CliContext& ctx) {
  const twig::LockManager locks(ctx.paths.locks_dir, lock_options(ctx.config));
  const auto result = locks.list();
  if (!result.success) {
    return fail(result.error_code, result.error_message);
  }
  json j;
  j["locks"] = json::array();
  for (const auto& info : result.locks) {
    j["locks"].push_back(lock_info_json(info));
  }
  j["malformed"] = json::array();
  for (const auto& bad : result.malformed) {
    j["malformed"].push_back({{"issue", bad.name}, {"path", bad.path.string()}, {"error", bad.error}});
  }
  if (result.truncated) {
    j["truncated"] = true;
  }
  print_json(j);
  return 0;
}

int worktree_create(const CliContext& ctx,
                    const std::string& issue,
                    const std::string& target,
                    const std::string& session,
                    const std::optional<int64_t>& timeout_ms) {
  const twig::Git git(ctx.config.git_binary);
  twig::LockManager locks(ctx.paths.locks_dir, lock_options(ctx.config));
  twig::WorktreeManager worktrees(git, locks, ctx.paths);
  const std::string branch = target.empty() ? ctx.config.default_target_branch : target;
  const auto result = worktrees.create(issue, branch, session, lock_timeout(ctx, timeout_ms));
  if (result.busy) {
    json j;
    j["status"] = "busy";
    j["issue"] = issue;
    if (result.holder.has_value()) {
      j["owner"] = lock_info_json(*result.holder);
    }
    print_json(j);
    return 1;
  }
  if (!result.success) {
    print_json(error_json(result.error_code, result.error_message));
    return 1;
  }
  json j = worktree_record_json(result.record);
  j["status"] = "created";
  print_json(j);
  return 0;
}

int worktree_show(const CliContext& ctx, const fs::path& path) {
  twig::WorktreeRecord record;
  json err;
  if (!load_record(ctx, path, record, err)) {
    print_json(err);
    return 1;
  }
  const twig::LockManager locks(ctx.paths.locks_dir, lock_options(ctx.config));
  json j = worktree_record_json(record);
  const auto lock = locks.check(record.issue_id);
  if (lock.success && lock.locked) {
    j["lock"] = lock_info_json(lock.info);
  }
  twig::VerificationRecord verified;
  std::string verify_error;
  if (twig::read_verification(record.git_dir, verified, verify_error)) {
    j["verified"] = {{"head", verified.head}, {"base", verified.base}, {"base_branch", verified.base_branch}};
  }
  print_json(j);
  return 0;
}

int worktree_list(const CliContext& ctx) {
  const twig::Git git(ctx.config.git_binary);
  twig::LockManager locks(ctx.paths.locks_dir, lock_options(ctx.config));
  twig::WorktreeManager worktrees(git, locks, ctx.paths);
  const auto result = worktrees.list();
  if (!result.success) {
    return fail(result.error_code, result.error_message);
  }
  json j;
  j["worktrees"] = json::array();
  for (const auto& record : result.records) {
    j["worktrees"].push_back(worktree_record_json(record));
  }
  print_json(j);
  return 0;
}

int worktree_destroy(const CliContext& ctx, const fs::path& path, bool force) {
  const twig::Git git(ctx.config.git_binary);
  twig::LockManager locks(ctx.paths.locks_dir, lock_options(ctx.config));
  twig::WorktreeManager worktrees(git, locks, ctx.paths);
  const auto loaded = worktrees.load(path);
  if (!loaded.success) {
    print_json(error_json(loaded.error_code, loaded.error_message));
    return 1;
  }
  const auto result = worktrees.destroy(loaded.record, force);
  if (!result.success) {
    print_json(error_json(result.error_code, result.error_message));
    return 1;
  }
  json j = worktree_record_json(loaded.record);
  j["status"] = "removed";
  print_json(j);
  return 0;
}

int squash_command(const CliContext& ctx,
                   const fs::path& path,
                   const std::string& session,
                   const std::string& message) {
  twig::WorktreeRecord record;
  json err;
  if (!load_record(ctx, path, record, err)) {
    print_json(err);
    return 1;
  }
  const twig::Git git(ctx.config.git_binary);
  const twig::LockManager locks(ctx.paths.locks_dir, lock_options(ctx.config));
  const auto result = twig::squash_branch(git, locks, record, session, message);
  print_json(squash_result_json(result));
  return result.success() ? 0 : 1;
}

int rebase_command(const CliContext& ctx,
                   const fs::path& path,
                   const std::string& session,
                   const std::string& onto) {
  twig::WorktreeRecord record;
  json err;
  if (!load_record(ctx, path, record, err)) {
    print_json(err);
    return 1;
  }
  const twig::Git git(ctx.config.git_binary);
  const twig::LockManager locks(ctx.paths.locks_dir, lock_options(ctx.config));
  const auto result = twig::rebase_branch(git, locks, record, session, onto);
  print_json(rebase_result_json(result));
  return result.success() ? 0 : 1;
}

int guard_check_command(const CliContext& ctx,
                        const std::string& command,
                        const std::string& kind,
                        const std::string& target,
                        const fs::path& cwd,
                        const std::string& session) {
  const twig::LockManager locks(ctx.paths.locks_dir, lock_options(ctx.config));
  const twig::RemovalGuard guard(locks, ctx.paths);
  const fs::path where = cwd.empty() ? fs::current_path() : cwd;
  twig::GuardResult result;
  if (!command.empty()) {
    result = guard.check_command(command, where, session);
  } else if (kind == "rm" || kind == "recursive-delete") {
    result = guard.check(twig::RemovalKind::RecursiveDelete, target, where, session);
  } else if (kind == "worktree-remove") {
    result = guard.check(twig::RemovalKind::WorktreeRemove, target, where, session);
  } else {
    return fail("invalid_args", "unknown removal kind: " + kind);
  }
  print_json(guard_result_json(result));
  if (!result.allowed()) {
    std::cerr << result.message;
    return 1;
  }
  return 0;
}

int merge_command(const CliContext& ctx, const fs::path& path, const std::string& session) {
  twig::WorktreeRecord record;
  json err;
  if (!load_record(ctx, path, record, err)) {
    print_json(err);
    return 1;
  }
  const twig::Git git(ctx.config.git_binary);
  twig::LockManager locks(ctx.paths.locks_dir, lock_options(ctx.config));
  twig::WorktreeManager worktrees(git, locks, ctx.paths);
  const auto result = twig::merge_and_cleanup(git, worktrees, locks, record, session);
  print_json(merge_result_json(result));
  return result.success ? 0 : 1;
}

int config_show(const CliContext& ctx) {
  json j;
  j["main_root"] = ctx.paths.main_root.string();
  j["common_dir"] = ctx.paths.common_dir.string();
  j["locks_dir"] = ctx.paths.locks_dir.string();
  j["worktrees_root"] = ctx.paths.worktrees_root.string();
  j["logs_dir"] = ctx.paths.logs_dir.string();
  j["git_binary"] = ctx.config.git_binary;
  j["stale_after_seconds"] = ctx.config.stale_after_seconds;
  j["lock_wait_timeout_ms"] = ctx.config.lock_wait_timeout_ms;
  j["lock_retry_initial_ms"] = ctx.config.lock_retry_initial_ms;
  j["lock_retry_max_ms"] = ctx.config.lock_retry_max_ms;
  j["default_target_branch"] = ctx.config.default_target_branch;
  j["log_to_file"] = ctx.config.log_to_file;
  const auto log_file = twig::log::current_file();
  if (!log_file.empty()) j["log_file"] = log_file.string();
  print_json(j);
  return 0;
}

void print_usage() {
  std::cerr << "Usage:\n"
            << "  twigctl lock acquire <issue> --session <id> [--worktree <path>] [--timeout-ms <n>]\n"
            << "  twigctl lock release <issue> --session <id>\n"
            << "  twigctl lock update <issue> --session <id> --worktree <path>\n"
            << "  twigctl lock force-release <issue>\n"
            << "  twigctl lock check <issue>\n"
            << "  twigctl lock list\n"
            << "  twigctl worktree create <issue> [--target <branch>] --session <id> [--timeout-ms <n>]\n"
            << "  twigctl worktree show <path>\n"
            << "  twigctl worktree list\n"
            << "  twigctl worktree destroy <path> [--force]\n"
            << "  twigctl squash <worktree> --session <id> --message <text>\n"
            << "  twigctl rebase <worktree> --session <id> [--onto <branch>]\n"
            << "  twigctl guard check (--command <text> | --kind <rm|worktree-remove> --target <path>) [--cwd <dir>] --session <id>\n"
            << "  twigctl merge <worktree> --session <id>\n"
            << "  twigctl config show\n"
            << "Global: [--repo <dir>]; --session defaults to $TWIG_SESSION_ID\n";
}

#ifndef TWIGCTL_LIB
int main(int argc, char** argv) {
  twig::log::install_crash_handlers();
  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::vector<std::string> positional;
  std::string session;
  std::string worktree_arg;
  std::string target;
  std::string message;
  std::string onto;
  std::string command_text;
  std::string kind;
  std::string cwd_arg;
  std::string repo_arg;
  std::optional<int64_t> timeout_ms;
  bool force = false;
  if (const char* env = std::getenv("TWIG_SESSION_ID")) {
    session = env;
  }

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--session" && i + 1 < argc) {
      session = argv[++i];
    } else if (arg == "--worktree" && i + 1 < argc) {
      worktree_arg = argv[++i];
    } else if (arg == "--target" && i + 1 < argc) {
      target = argv[++i];
    } else if (arg == "--message" && i + 1 < argc) {
      message = argv[++i];
    } else if (arg == "--onto" && i + 1 < argc) {
      onto = argv[++i];
    } else if (arg == "--command" && i + 1 < argc) {
      command_text = argv[++i];
    } else if (arg == "--kind" && i + 1 < argc) {
      kind = argv[++i];
    } else if (arg == "--cwd" && i + 1 < argc) {
      cwd_arg = argv[++i];
    } else if (arg == "--repo" && i + 1 < argc) {
      repo_arg = argv[++i];
    } else if (arg == "--timeout-ms" && i + 1 < argc) {
      int64_t value = 0;
      const std::string text = argv[++i];
      try {
        value = std::stoll(text);
      } catch (const std::exception&) {
        std::cerr << "invalid --timeout-ms: " << text << "\n";
        return 1;
      }
      timeout_ms = value;
    } else if (arg == "--force") {
      force = true;
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.empty()) {
    print_usage();
    return 1;
  }

  CliContext ctx;
  std::string error;
  const fs::path start = repo_arg.empty() ? fs::current_path() : fs::path(repo_arg);
  std::string error_code;
  if (!load_cli_context(start, ctx, error_code, error)) {
    twig::log::init();
    return fail(error_code, error);
  }
  twig::log::init("twigctl", ctx.config.log_to_file ? ctx.paths.logs_dir : fs::path());

  const std::string command = positional[0];
  const std::string sub = positional.size() > 1 ? positional[1] : std::string();
  int rc = 1;

  if (command == "lock" && !sub.empty()) {
    const std::string issue = positional.size() > 2 ? positional[2] : std::string();
    if (sub == "list") {
      rc = lock_list(ctx);
    } else if (issue.empty()) {
      print_usage();
    } else if (sub == "acquire") {
      rc = lock_acquire(ctx, issue, session, worktree_arg, timeout_ms);
    } else if (sub == "release") {
      rc = lock_release(ctx, issue, session);
    } else if (sub == "update") {
      rc = lock_update(ctx, issue, session, worktree_arg);
    } else if (sub == "force-release") {
      rc = lock_force_release(ctx, issue);
    } else if (sub == "check") {
      rc = lock_check(ctx, issue);
    } else {
      print_usage();
    }
  } else if (command == "worktree" && !sub.empty()) {
    const std::string arg = positional.size() > 2 ? positional[2] : std::string();
    if (sub == "list") {
      rc = worktree_list(ctx);
    } else if (arg.empty()) {
      print_usage();
    } else if (sub == "create") {
      rc = worktree_create(ctx, arg, target, session, timeout_ms);
    } else if (sub == "show") {
      rc = worktree_show(ctx, arg);
    } else if (sub == "destroy") {
      rc = worktree_destroy(ctx, arg, force);
    } else {
      print_usage();
    }
  } else if (command == "squash" && !sub.empty()) {
    rc = squash_command(ctx, sub, session, message);
  } else if (command == "rebase" && !sub.empty()) {
    rc = rebase_command(ctx, sub, session, onto);
  } else if (command == "guard" && sub == "check") {
    if (command_text.empty() && (kind.empty() || target.empty())) {
      print_usage();
    } else {
      rc = guard_check_command(ctx, command_text, kind, target, cwd_arg, session);
    }
  } else if (command == "merge" && !sub.empty()) {
    rc = merge_command(ctx, sub, session);
  } else if (command == "config" && sub == "show") {
    rc = config_show(ctx);
  } else {
    print_usage();
  }

  twig::log::shutdown();
  return rc;
}
#endif
