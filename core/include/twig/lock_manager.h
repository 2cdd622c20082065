#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace twig {

enum class LockStatus { Acquired, Busy, Released, Updated, Error };

const char* to_string(LockStatus status);

struct LockInfo {
  std::string name;
  std::string owner_session;
  int64_t acquired_at = 0;
  std::string acquired_iso;
  std::string worktree;
  int64_t age_seconds = 0;
  bool stale = false;
};

struct LockResult {
  LockStatus status = LockStatus::Error;
  std::string name;
  std::string message;
  // Current holder for Busy, the new lock for Acquired/Updated.
  std::optional<LockInfo> holder;
  bool reclaimed_stale = false;
  bool timed_out = false;
  std::string error_code;
  std::string error_message;

  bool success() const { return status != LockStatus::Busy && status != LockStatus::Error; }
};

struct LockCheckResult {
  bool success = false;
  bool locked = false;
  LockInfo info;
  std::string error_code;
  std::string error_message;
};

struct MalformedLock {
  std::string name;
  std::filesystem::path path;
  std::string error;
};

struct LockListResult {
  bool success = false;
  std::vector<LockInfo> locks;
  std::vector<MalformedLock> malformed;
  bool truncated = false;
  std::string error_code;
  std::string error_message;
};

struct LockManagerOptions {
  int64_t stale_after_seconds = 600;
  int64_t retry_initial_ms = 50;
  int64_t retry_max_ms = 2000;
};

// One JSON file per issue under locks_dir. Creation is link(2) of a fully written
// temp file, so a lock is either absent or complete. Reclaiming, rewriting and
// releasing run under a mkdir(2) guard directory next to the lock.
class LockManager {
 public:
  LockManager(std::filesystem::path locks_dir, LockManagerOptions options);

  LockResult acquire(const std::string& name,
                     const std::string& session,
                     const std::string& worktree = std::string());
  LockResult acquire_with_retry(const std::string& name,
                                const std::string& session,
                                const std::string& worktree,
                                std::chrono::milliseconds timeout);
  LockResult release(const std::string& name, const std::string& session);
  LockResult force_release(const std::string& name);
  LockResult update(const std::string& name, const std::string& session, const std::string& worktree);

  LockCheckResult check(const std::string& name) const;
  // True when session holds a live lock on name; otherwise sets error_code to
  // invalid_session, not_locked, lock_stale, not_owner or malformed_lock.
  bool require_owner(const std::string& name,
                     const std::string& session,
                     std::string& error_code,
                     std::string& error) const;
  LockListResult list() const;

  std::filesystem::path lock_path(const std::string& name) const;
  const std::filesystem::path& dir() const { return locks_dir_; }
  const LockManagerOptions& options() const { return options_; }

  static std::string sanitize_name(const std::string& name);
  static bool validate_session(const std::string& session, std::string& error);

  bool read_lock(const std::filesystem::path& path, LockInfo& out, std::string& error) const;

 private:
  bool acquire_guard(const std::string& name, std::string& error) const;
  void release_guard(const std::string& name) const;
  std::string render(const LockInfo& info) const;
  // Returns 0 on success, EEXIST when a lock is present, another errno on failure.
  int link_new_lock(const std::filesystem::path& path, const std::string& contents, std::string& error) const;

  std::filesystem::path locks_dir_;
  LockManagerOptions options_;
};

} // namespace twig
