#include "twig/config.h"
#include "twig/file_io.h"
#include "twig/lock_manager.h"
#include "twig/log.h"
#include "twig/paths.h"
#include "twig/rebase.h"
#include "twig/removal_guard.h"
#include "twigctl/cli_api.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

bool write_text(const fs::path& path, const std::string& contents) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path);
  if (!out) return false;
  out << contents;
  return true;
}

std::string read_text(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return {};
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

bool write_lock(const fs::path& path, const std::string& session, int64_t created_at, const std::string& worktree) {
  json j;
  j["issue"] = path.stem().string();
  j["session_id"] = session;
  j["created_at"] = created_at;
  j["created_iso"] = twig::iso_utc(created_at);
  j["worktree"] = worktree;
  return write_text(path, j.dump(2));
}

int main(int, char**) {
  twig::log::init("twig_tests", fs::path());
  const fs::path temp_root = fs::temp_directory_path() / ("twig_smoke_" + std::to_string(::getpid()));
  fs::remove_all(temp_root);
  fs::create_directories(temp_root);

  int failures = 0;

  // Test: lock names are sanitized into a single path component.
  {
    if (twig::LockManager::sanitize_name("feature/a\\b") != "feature-a-b") {
      std::cerr << "slash sanitize failed: " << twig::LockManager::sanitize_name("feature/a\\b") << "\n";
      ++failures;
    }
    if (twig::LockManager::sanitize_name("../etc") != "--etc") {
      std::cerr << "dotdot sanitize failed: " << twig::LockManager::sanitize_name("../etc") << "\n";
      ++failures;
    }
    std::string error;
    if (twig::LockManager::validate_session("has space", error) || twig::LockManager::validate_session("", error)) {
      std::cerr << "invalid session ids accepted\n";
      ++failures;
    }
  }

  // Test: mutual exclusion between sessions, idempotent release.
  {
    twig::LockManager locks(temp_root / "locks_basic", twig::LockManagerOptions{});
    const auto a = locks.acquire("issue-1", "session-a", "/tmp/wt1");
    if (a.status != twig::LockStatus::Acquired) {
      std::cerr << "first acquire failed: " << a.error_message << "\n";
      ++failures;
    }
    const auto b = locks.acquire("issue-1", "session-b");
    if (b.status != twig::LockStatus::Busy || !b.holder.has_value() || b.holder->owner_session != "session-a") {
      std::cerr << "second session should be busy\n";
      ++failures;
    }
    const auto again = locks.acquire("issue-1", "session-a");
    if (again.status != twig::LockStatus::Acquired || !again.holder || again.holder->worktree != "/tmp/wt1") {
      std::cerr << "owner re-acquire should succeed and keep worktree\n";
      ++failures;
    }
    const auto wrong = locks.release("issue-1", "session-b");
    if (wrong.status != twig::LockStatus::Error || wrong.error_code != "not_owner") {
      std::cerr << "release by non-owner should fail\n";
      ++failures;
    }
    if (!fs::exists(locks.lock_path("issue-1"))) {
      std::cerr << "lock removed by non-owner\n";
      ++failures;
    }
    const auto released = locks.release("issue-1", "session-a");
    if (released.status != twig::LockStatus::Released || fs::exists(locks.lock_path("issue-1"))) {
      std::cerr << "owner release failed\n";
      ++failures;
    }
    const auto absent = locks.release("issue-1", "session-a");
    if (absent.status != twig::LockStatus::Released) {
      std::cerr << "releasing an absent lock should be a no-op\n";
      ++failures;
    }
  }

  // Test: stale locks are reclaimed regardless of owner.
  {
    twig::LockManagerOptions opts;
    opts.stale_after_seconds = 60;
    twig::LockManager locks(temp_root / "locks_stale", opts);
    fs::create_directories(locks.dir());
    write_lock(locks.lock_path("old"), "crashed-session", twig::epoch_seconds_now() - 3600, "");
    const auto check = locks.check("old");
    if (!check.success || !check.locked || !check.info.stale) {
      std::cerr << "old lock should report stale\n";
      ++failures;
    }
    const auto res = locks.acquire("old", "session-new");
    if (res.status != twig::LockStatus::Acquired || !res.reclaimed_stale) {
      std::cerr << "stale lock was not reclaimed\n";
      ++failures;
    }
    const auto after = locks.check("old");
    if (!after.locked || after.info.owner_session != "session-new" || after.info.stale) {
      std::cerr << "reclaimed lock has wrong owner\n";
      ++failures;
    }
    if (fs::exists(locks.dir() / "old.lock.reclaim")) {
      std::cerr << "reclaim guard left behind\n";
      ++failures;
    }
  }

  // Test: an abandoned reclaim guard is cleared without leaving debris.
  {
    twig::LockManagerOptions opts;
    opts.stale_after_seconds = 60;
    twig::LockManager locks(temp_root / "locks_guard", opts);
    fs::create_directories(locks.dir());
    write_lock(locks.lock_path("held"), "crashed-session", twig::epoch_seconds_now() - 3600, "");
    const fs::path guard = locks.dir() / "held.lock.reclaim";
    fs::create_directories(guard);
    fs::last_write_time(guard, fs::file_time_type::clock::now() - std::chrono::hours(1));
    const auto res = locks.acquire("held", "session-new");
    if (res.status != twig::LockStatus::Acquired || !res.reclaimed_stale) {
      std::cerr << "stale lock behind an abandoned guard was not reclaimed\n";
      ++failures;
    }
    size_t debris = 0;
    for (const auto& entry : fs::directory_iterator(locks.dir())) {
      if (entry.path().filename().string().find(".reclaim") != std::string::npos) {
        ++debris;
      }
    }
    if (debris != 0) {
      std::cerr << "abandoned guard or its tombstone left behind\n";
      ++failures;
    }

    // A fresh guard is left alone and makes the caller wait.
    fs::create_directories(guard);
    const auto rel = locks.release("held", "session-new");
    if (rel.status != twig::LockStatus::Error || rel.error_code != "guard_busy" || !fs::exists(guard)) {
      std::cerr << "live guard should not be removed\n";
      ++failures;
    }
    fs::remove(guard);
    if (locks.release("held", "session-new").status != twig::LockStatus::Released) {
      std::cerr << "release after guard cleared failed\n";
      ++failures;
    }
  }

  // Test: malformed lock files are fatal, never reclaimed.
  {
    twig::LockManager locks(temp_root / "locks_bad", twig::LockManagerOptions{});
    write_text(locks.lock_path("broken"), "{not json");
    const auto res = locks.acquire("broken", "session-a");
    if (res.status != twig::LockStatus::Error || res.error_code != "malformed_lock" ||
        res.error_message.find("broken.lock") == std::string::npos) {
      std::cerr << "malformed lock should be a fatal error naming the file\n";
      ++failures;
    }
    if (read_text(locks.lock_path("broken")) != "{not json") {
      std::cerr << "malformed lock was modified\n";
      ++failures;
    }
    const auto listed = locks.list();
    if (!listed.success || listed.malformed.size() != 1 || !listed.locks.empty()) {
      std::cerr << "list should report one malformed lock\n";
      ++failures;
    }
  }

  // Test: update, list and force-release.
  {
    twig::LockManager locks(temp_root / "locks_ops", twig::LockManagerOptions{});
    locks.acquire("a", "s1");
    locks.acquire("b", "s2");
    const auto up = locks.update("a", "s1", "/work/a");
    if (up.status != twig::LockStatus::Updated || !up.holder || up.holder->worktree != "/work/a") {
      std::cerr << "update failed\n";
      ++failures;
    }
    const auto denied = locks.update("b", "s1", "/work/b");
    if (denied.status != twig::LockStatus::Error) {
      std::cerr << "update by non-owner should fail\n";
      ++failures;
    }
    const auto listed = locks.list();
    if (!listed.success || listed.locks.size() != 2 || listed.locks[0].name != "a" ||
        listed.locks[0].worktree != "/work/a") {
      std::cerr << "list returned unexpected locks\n";
      ++failures;
    }
    const auto forced = locks.force_release("b");
    if (forced.status != twig::LockStatus::Released || locks.check("b").locked) {
      std::cerr << "force release failed\n";
      ++failures;
    }
  }

  // Test: acquire with retry times out while another session holds the lock.
  {
    twig::LockManagerOptions opts;
    opts.retry_initial_ms = 10;
    opts.retry_max_ms = 40;
    twig::LockManager locks(temp_root / "locks_retry", opts);
    locks.acquire("held", "owner");
    const auto start = std::chrono::steady_clock::now();
    const auto res = locks.acquire_with_retry("held", "waiter", "", std::chrono::milliseconds(150));
    const auto elapsed = std::chrono::steady_clock::now() - start;
    if (res.status != twig::LockStatus::Busy || !res.timed_out) {
      std::cerr << "retry should time out busy\n";
      ++failures;
    }
    if (elapsed < std::chrono::milliseconds(100)) {
      std::cerr << "retry gave up too early\n";
      ++failures;
    }
  }

  // Test: concurrent acquirers, exactly one wins.
  {
    const fs::path dir = temp_root / "locks_race";
    std::atomic<int> acquired{0};
    std::atomic<int> busy{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
      threads.emplace_back([&, i]() {
        twig::LockManager locks(dir, twig::LockManagerOptions{});
        const auto res = locks.acquire("contended", "session-" + std::to_string(i));
        if (res.status == twig::LockStatus::Acquired) {
          ++acquired;
        } else if (res.status == twig::LockStatus::Busy) {
          ++busy;
        }
      });
    }
    for (auto& t : threads) {
      t.join();
    }
    if (acquired.load() != 1 || busy.load() != 7) {
      std::cerr << "race: acquired=" << acquired.load() << " busy=" << busy.load() << "\n";
      ++failures;
    }
  }

  // Test: engine config from JSON with defaults for missing keys.
  {
    const fs::path cfg_path = temp_root / "cfg" / "twig.json";
    write_text(cfg_path, R"({"engine":{"stale_after_seconds":120,"default_target_branch":"develop","log_to_file":false}})");
    const auto cfg = twig::load_engine_config(cfg_path);
    if (cfg.stale_after_seconds != 120 || cfg.default_target_branch != "develop" || cfg.log_to_file) {
      std::cerr << "json config fields not applied\n";
      ++failures;
    }
    if (cfg.git_binary != "git" || cfg.lock_retry_initial_ms != 50) {
      std::cerr << "json config defaults lost\n";
      ++failures;
    }
    const auto missing = twig::load_engine_config(temp_root / "cfg" / "absent.json");
    if (missing.stale_after_seconds != 600) {
      std::cerr << "missing config should yield defaults\n";
      ++failures;
    }
    const auto opts = lock_options(cfg);
    if (opts.stale_after_seconds != 120) {
      std::cerr << "lock options not derived from config\n";
      ++failures;
    }
  }

  // Test: strict config load reports broken files instead of using defaults.
  {
    const fs::path bad = temp_root / "cfg" / "broken.json";
    write_text(bad, "{\"engine\": {\"stale_after_seconds\": ");
    twig::EngineConfig cfg;
    cfg.stale_after_seconds = 42;
    std::string error;
    if (twig::load_engine_config(bad, cfg, error) || error.find("broken.json") == std::string::npos) {
      std::cerr << "malformed config should fail naming the file\n";
      ++failures;
    }
    if (cfg.stale_after_seconds != 42) {
      std::cerr << "failed config load should leave output untouched\n";
      ++failures;
    }
    const fs::path wrong_type = temp_root / "cfg" / "wrong_type.json";
    write_text(wrong_type, R"({"stale_after_seconds":"ten"})");
    error.clear();
    if (twig::load_engine_config(wrong_type, cfg, error) || error.empty()) {
      std::cerr << "mistyped config field should fail\n";
      ++failures;
    }
    error.clear();
    if (twig::load_engine_config(temp_root / "cfg" / "absent.json", cfg, error) || error.empty()) {
      std::cerr << "explicit missing config should fail\n";
      ++failures;
    }
    const fs::path good = temp_root / "cfg" / "twig.json";
    if (!twig::load_engine_config(good, cfg, error) || cfg.stale_after_seconds != 120) {
      std::cerr << "strict load of a valid config failed: " << error << "\n";
      ++failures;
    }
  }

#if TWIG_ENABLE_DATA_YAML
  // Test: engine config from YAML.
  {
    const fs::path cfg_path = temp_root / "cfg" / "twig.yaml";
    write_text(cfg_path,
               "engine:\n"
               "  stale_after_seconds: 90\n"
               "  lock_wait_timeout_ms: 2500\n"
               "  worktrees_root: ../trees\n");
    const auto cfg = twig::load_engine_config(cfg_path);
    if (cfg.stale_after_seconds != 90 || cfg.lock_wait_timeout_ms != 2500 || cfg.worktrees_root != "../trees") {
      std::cerr << "yaml config fields not applied\n";
      ++failures;
    }
    if (cfg.default_target_branch != "main") {
      std::cerr << "yaml config defaults lost\n";
      ++failures;
    }
  }
#endif

  // Test: shell command parsing for removal commands.
  {
    const fs::path cwd = "/work";
    auto parsed = twig::parse_removal_command("cd /tmp && rm -rf 'my dir' other", cwd);
    if (parsed.requests.size() != 2 || parsed.requests[0].target != "my dir" ||
        parsed.requests[0].kind != twig::RemovalKind::RecursiveDelete) {
      std::cerr << "quoted rm targets not parsed\n";
      ++failures;
    }
    parsed = twig::parse_removal_command("rm -v file.txt", cwd);
    if (!parsed.requests.empty()) {
      std::cerr << "non-recursive rm should be ignored\n";
      ++failures;
    }
    parsed = twig::parse_removal_command("rm --recursive -- -odd > log.txt", cwd);
    if (parsed.requests.size() != 1 || parsed.requests[0].target != "-odd") {
      std::cerr << "-- or redirection handling wrong\n";
      ++failures;
    }
    parsed = twig::parse_removal_command("/bin/rm -fR a; echo done", cwd);
    if (parsed.requests.size() != 1 || parsed.requests[0].target != "a") {
      std::cerr << "combined flags or operator handling wrong\n";
      ++failures;
    }
    parsed = twig::parse_removal_command("TWIG_SESSION_ID=abc git -C /repo worktree remove --force ../wt", cwd);
    if (parsed.requests.size() != 1 || parsed.requests[0].kind != twig::RemovalKind::WorktreeRemove ||
        parsed.requests[0].target != "../wt" || parsed.requests[0].base_dir != fs::path("/repo")) {
      std::cerr << "git worktree remove parsing wrong\n";
      ++failures;
    }
    parsed = twig::parse_removal_command("git worktree list", cwd);
    if (!parsed.requests.empty()) {
      std::cerr << "git worktree list is not a removal\n";
      ++failures;
    }
    parsed = twig::parse_removal_command("rm -rf a > log b 2>&1", cwd);
    if (parsed.requests.size() != 2 || parsed.requests[0].target != "a" || parsed.requests[1].target != "b") {
      std::cerr << "words after a redirection should stay targets\n";
      ++failures;
    }
    parsed = twig::parse_removal_command("env -u HOME A=1 rm -rf x", cwd);
    if (parsed.requests.size() != 1 || parsed.requests[0].target != "x") {
      std::cerr << "env wrapper should be seen through\n";
      ++failures;
    }
    parsed = twig::parse_removal_command("sudo -u root timeout -s KILL 5 nice -n 10 rm -r x", cwd);
    if (parsed.requests.size() != 1 || parsed.requests[0].target != "x") {
      std::cerr << "wrapper options with values should be skipped\n";
      ++failures;
    }
    parsed = twig::parse_removal_command("xargs rm -rf <<< 'x y'", cwd);
    if (parsed.requests.size() != 2 || parsed.requests[0].target != "x" || parsed.requests[1].target != "y") {
      std::cerr << "xargs here-string targets not parsed\n";
      ++failures;
    }
    parsed = twig::parse_removal_command("echo x | xargs -n 1 rm -rf", cwd);
    if (parsed.requests.size() != 1 || !parsed.requests[0].target.empty()) {
      std::cerr << "piped xargs should yield an unresolved target\n";
      ++failures;
    }
    parsed = twig::parse_removal_command("bash --norc -c 'cd / && rm -rf \"x\"'", cwd);
    if (parsed.requests.size() != 1 || parsed.requests[0].target != "x") {
      std::cerr << "sh -c script should be parsed\n";
      ++failures;
    }
    parsed = twig::parse_removal_command("find x y -name '*.o' -exec rm -rf {} +", cwd);
    if (parsed.requests.size() != 2 || parsed.requests[0].target != "x" || parsed.requests[1].target != "y") {
      std::cerr << "find -exec rm -r roots not parsed\n";
      ++failures;
    }
    parsed = twig::parse_removal_command("find . -name '*.o' -exec rm {} ;", cwd);
    if (!parsed.requests.empty()) {
      std::cerr << "find -exec of a plain rm is not a recursive delete\n";
      ++failures;
    }
  }

  // Test: guard truth table for recursive delete vs worktree removal.
  {
    const fs::path base = fs::canonical(temp_root);
    twig::ResolvedPaths paths;
    paths.main_root = base / "repo";
    paths.common_dir = paths.main_root / ".git";
    paths.locks_dir = paths.common_dir / "locks";
    paths.worktrees_root = base / "repo.worktrees";
    const fs::path own_wt = paths.worktrees_root / "own";
    const fs::path other_wt = paths.worktrees_root / "other";
    const fs::path stale_wt = paths.worktrees_root / "stale";
    fs::create_directories(paths.locks_dir);
    fs::create_directories(own_wt / "src");
    fs::create_directories(other_wt);
    fs::create_directories(stale_wt);

    twig::LockManager locks(paths.locks_dir, twig::LockManagerOptions{});
    locks.acquire("own", "me", own_wt.string());
    locks.acquire("other", "them", other_wt.string());
    write_lock(locks.lock_path("stale"), "gone", twig::epoch_seconds_now() - 7200, stale_wt.string());
    const twig::RemovalGuard guard(locks, paths);
    const fs::path cwd = paths.main_root;
    fs::create_directories(cwd);

    auto r = guard.check(twig::RemovalKind::RecursiveDelete, own_wt.string(), cwd, "me");
    if (!r.allowed()) {
      std::cerr << "rm of own worktree should be allowed: " << r.message << "\n";
      ++failures;
    }
    r = guard.check(twig::RemovalKind::RecursiveDelete, other_wt.string(), cwd, "me");
    if (r.allowed() || r.blocked_by.reason != twig::ProtectionReason::LockedByOtherSession ||
        r.blocked_by.owner != "them") {
      std::cerr << "rm of other session's worktree should be blocked\n";
      ++failures;
    }
    r = guard.check(twig::RemovalKind::WorktreeRemove, own_wt.string(), cwd, "me");
    if (r.allowed() || r.blocked_by.reason != twig::ProtectionReason::LockedBySameSession) {
      std::cerr << "worktree remove of own locked worktree should be blocked\n";
      ++failures;
    }
    r = guard.check(twig::RemovalKind::WorktreeRemove, other_wt.string(), cwd, "me");
    if (!r.allowed()) {
      std::cerr << "worktree remove of other session's worktree should be allowed: " << r.message << "\n";
      ++failures;
    }
    r = guard.check(twig::RemovalKind::RecursiveDelete, paths.worktrees_root.string(), cwd, "me");
    if (r.allowed()) {
      std::cerr << "rm of a parent of a locked worktree should be blocked\n";
      ++failures;
    }
    r = guard.check(twig::RemovalKind::RecursiveDelete, stale_wt.string(), cwd, "me");
    if (!r.allowed()) {
      std::cerr << "stale lock should not protect\n";
      ++failures;
    }
    r = guard.check(twig::RemovalKind::RecursiveDelete, paths.main_root.string(), base, "me");
    if (r.allowed() || r.blocked_by.reason != twig::ProtectionReason::MainWorktree) {
      std::cerr << "main worktree should always be protected\n";
      ++failures;
    }
    r = guard.check(twig::RemovalKind::RecursiveDelete, own_wt.string(), own_wt / "src", "me");
    if (r.allowed() || r.blocked_by.reason != twig::ProtectionReason::WorkingDirectory) {
      std::cerr << "cwd inside target should be protected\n";
      ++failures;
    }
    if (r.message.find("UNSAFE DIRECTORY REMOVAL BLOCKED") == std::string::npos) {
      std::cerr << "block message missing header\n";
      ++failures;
    }
    r = guard.check(twig::RemovalKind::RecursiveDelete, "../repo.worktrees/other", cwd, "me");
    if (r.allowed()) {
      std::cerr << "relative target should resolve against cwd\n";
      ++failures;
    }
    r = guard.check_command("rm -rf " + other_wt.string(), cwd, "me");
    if (r.allowed()) {
      std::cerr << "command check should block rm of other worktree\n";
      ++failures;
    }
    r = guard.check_command("TWIG_SESSION_ID=them rm -rf " + other_wt.string(), cwd, "me");
    if (r.allowed() || r.blocked_by.reason != twig::ProtectionReason::LockedByOtherSession) {
      std::cerr << "an environment assignment must not change the caller's session\n";
      ++failures;
    }
    const std::vector<std::string> wrapped = {
        "env rm -rf " + other_wt.string(),
        "sudo -u root rm -rf " + other_wt.string(),
        "xargs rm -rf <<< " + other_wt.string(),
        "bash -c 'rm -rf " + other_wt.string() + "'",
        "find " + other_wt.string() + " -exec rm -rf {} +",
    };
    for (const auto& command : wrapped) {
      r = guard.check_command(command, cwd, "me");
      if (r.allowed() || r.blocked_by.reason != twig::ProtectionReason::LockedByOtherSession) {
        std::cerr << "wrapped delete of another session's worktree allowed: " << command << "\n";
        ++failures;
      }
    }
    r = guard.check_command("echo " + other_wt.string() + " | xargs rm -rf", cwd, "me");
    if (r.allowed() || r.error_code != "unresolved_target") {
      std::cerr << "delete with piped targets should be refused\n";
      ++failures;
    }
    r = guard.check_command("ls -la && echo ok", cwd, "me");
    if (!r.allowed()) {
      std::cerr << "harmless command should be allowed\n";
      ++failures;
    }

    // Protection is recomputed per call.
    locks.release("other", "them");
    r = guard.check(twig::RemovalKind::RecursiveDelete, other_wt.string(), cwd, "me");
    if (!r.allowed()) {
      std::cerr << "released lock should no longer protect\n";
      ++failures;
    }

    write_text(locks.lock_path("mystery"), "garbage");
    fs::create_directories(paths.worktrees_root / "mystery");
    r = guard.check(twig::RemovalKind::WorktreeRemove, (paths.worktrees_root / "mystery").string(), cwd, "me");
    if (r.allowed() || r.blocked_by.reason != twig::ProtectionReason::UnknownOwner) {
      std::cerr << "malformed lock should protect under worktree removal\n";
      ++failures;
    }
    r = guard.check(twig::RemovalKind::RecursiveDelete, (paths.worktrees_root / "mystery").string(), cwd, "me");
    if (r.allowed()) {
      std::cerr << "malformed lock should protect under recursive delete\n";
      ++failures;
    }
    const auto j = guard_result_json(r);
    if (j.value("decision", "") != "block" || j.value("reason", "") != "unknown_owner") {
      std::cerr << "guard json wrong\n";
      ++failures;
    }
  }

  // Test: rebase patch comparison names the differing files.
  {
    const std::string before =
        "diff --git a/a.txt b/a.txt\n+one\n"
        "diff --git a/b.txt b/b.txt\n+two\n";
    const std::string after =
        "diff --git a/a.txt b/a.txt\n+one\n"
        "diff --git a/c.txt b/c.txt\n+three\n";
    const auto files = twig::differing_patch_files(before, after);
    if (files != std::vector<std::string>{"b.txt", "c.txt"}) {
      std::cerr << "differing patch files wrong\n";
      ++failures;
    }
    if (!twig::differing_patch_files(before, before).empty()) {
      std::cerr << "identical patches reported different\n";
      ++failures;
    }
  }

  // Test: log ring keeps recent lines.
  {
    twig::log::warn("ring marker");
    const auto lines = twig::log::recent(5);
    if (lines.empty() || lines.back().find("ring marker") == std::string::npos ||
        lines.back().find("[WARN]") == std::string::npos) {
      std::cerr << "log ring missing last line\n";
      ++failures;
    }
    if (!twig::log::current_file().empty()) {
      std::cerr << "log without a directory should not open a file\n";
      ++failures;
    }
  }

  // Test: path containment.
  {
    if (!twig::path_within("/a/b/c", "/a/b") || !twig::path_within("/a/b", "/a/b") ||
        twig::path_within("/a/bc", "/a/b") || twig::path_within("/a", "/a/b")) {
      std::cerr << "path_within wrong\n";
      ++failures;
    }
  }

  std::error_code ec;
  fs::remove_all(temp_root, ec);
  twig::log::shutdown();
  return failures == 0 ? 0 : 1;
}
