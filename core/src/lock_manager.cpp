#include "twig/lock_manager.h"

#include "twig/file_io.h"
#include "twig/log.h"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <thread>

#include <nlohmann/json.hpp>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace twig {

namespace fs = std::filesystem;

namespace {
constexpr size_t kMaxLockFiles = 1000;
constexpr int64_t kGuardStaleSeconds = 30;
constexpr int kGuardWaitSteps = 100;
constexpr auto kGuardWaitStep = std::chrono::milliseconds(20);
constexpr int kAcquireAttempts = 3;

std::atomic<uint64_t> g_temp_counter{0};

std::string temp_suffix() {
  const auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
  return std::to_string(::getpid()) + "." + std::to_string(g_temp_counter.fetch_add(1)) + "." +
         std::to_string(ticks);
}

LockResult make_error(const std::string& name, const std::string& code, const std::string& message) {
  LockResult result;
  result.status = LockStatus::Error;
  result.name = name;
  result.error_code = code;
  result.error_message = message;
  return result;
}

bool same_lock(const LockInfo& a, const LockInfo& b) {
  return a.owner_session == b.owner_session && a.acquired_at == b.acquired_at;
}

// Renames the guard aside and deletes it only if it is still the inode seen stale.
void remove_abandoned_guard(const fs::path& guard, const struct stat& seen) {
  const fs::path tomb = guard.string() + ".stale." + temp_suffix();
  if (::rename(guard.c_str(), tomb.c_str()) != 0) {
    if (errno != ENOENT) {
      log::warn("cannot move abandoned lock guard " + guard.string() + ": " + std::strerror(errno));
    }
    return;
  }
  struct stat moved {};
  if (::stat(tomb.c_str(), &moved) != 0) {
    log::warn("abandoned lock guard vanished: " + tomb.string());
    return;
  }
  if (moved.st_ino == seen.st_ino && moved.st_dev == seen.st_dev) {
    log::warn("removed abandoned lock guard " + guard.string());
    if (::rmdir(tomb.c_str()) != 0) {
      log::warn("cannot remove " + tomb.string() + ": " + std::strerror(errno));
    }
    return;
  }
  // A reclaimer already replaced it with a live guard.
  if (::renameat2(AT_FDCWD, tomb.c_str(), AT_FDCWD, guard.c_str(), RENAME_NOREPLACE) != 0) {
    log::error("cannot restore live lock guard " + guard.string() + " from " + tomb.string() + ": " +
               std::strerror(errno));
  }
}
} // namespace

const char* to_string(LockStatus status) {
  switch (status) {
    case LockStatus::Acquired: return "acquired";
    case LockStatus::Busy: return "busy";
    case LockStatus::Released: return "released";
    case LockStatus::Updated: return "updated";
    case LockStatus::Error: return "error";
  }
  return "error";
}

LockManager::LockManager(fs::path locks_dir, LockManagerOptions options)
    : locks_dir_(std::move(locks_dir)), options_(options) {}

std::string LockManager::sanitize_name(const std::string& name) {
  std::string out;
  out.reserve(name.size());
  for (size_t i = 0; i < name.size(); ++i) {
    const char c = name[i];
    if (c == '/' || c == '\\') {
      out.push_back('-');
    } else if (c == '.' && i + 1 < name.size() && name[i + 1] == '.') {
      out.push_back('-');
      ++i;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

bool LockManager::validate_session(const std::string& session, std::string& error) {
  if (session.empty()) {
    error = "session id is empty";
    return false;
  }
  for (unsigned char c : session) {
    if (c <= 0x20 || c == 0x7f) {
      error = "session id contains whitespace or control characters: '" + session + "'";
      return false;
    }
  }
  return true;
}

fs::path LockManager::lock_path(const std::string& name) const {
  return locks_dir_ / (sanitize_name(name) + ".lock");
}

std::string LockManager::render(const LockInfo& info) const {
  nlohmann::json j;
  j["issue"] = info.name;
  j["session_id"] = info.owner_session;
  j["created_at"] = info.acquired_at;
  j["created_iso"] = info.acquired_iso;
  j["worktree"] = info.worktree;
  return j.dump(2) + "\n";
}

bool LockManager::read_lock(const fs::path& path, LockInfo& out, std::string& error) const {
  nlohmann::json j;
  if (!load_json_file(path, j, error)) {
    return false;
  }
  if (!j.is_object() || !j.contains("session_id") || !j["session_id"].is_string() ||
      !j.contains("created_at") || !j["created_at"].is_number_integer()) {
    error = "malformed lock file " + path.string() + ": expected session_id and created_at";
    return false;
  }
  out = LockInfo{};
  out.name = j.value("issue", path.stem().string());
  out.owner_session = j["session_id"].get<std::string>();
  out.acquired_at = j["created_at"].get<int64_t>();
  out.acquired_iso = j.value("created_iso", iso_utc(out.acquired_at));
  out.worktree = j.value("worktree", "");
  if (out.owner_session.empty()) {
    error = "malformed lock file " + path.string() + ": empty session_id";
    return false;
  }
  out.age_seconds = std::max<int64_t>(0, epoch_seconds_now() - out.acquired_at);
  out.stale = out.age_seconds > options_.stale_after_seconds;
  return true;
}

int LockManager::link_new_lock(const fs::path& path, const std::string& contents, std::string& error) const {
  const fs::path tmp = locks_dir_ / (path.filename().string() + "." + temp_suffix() + ".tmp");
  if (!write_text_file(tmp, contents)) {
    error = "cannot write temp lock file " + tmp.string();
    return EIO;
  }
  int rc = 0;
  if (::link(tmp.c_str(), path.c_str()) != 0) {
    rc = errno;
    if (rc != EEXIST) {
      error = "link " + tmp.string() + " -> " + path.string() + " failed: " + std::strerror(rc);
    }
  }
  std::error_code ec;
  fs::remove(tmp, ec);
  return rc;
}

bool LockManager::acquire_guard(const std::string& name, std::string& error) const {
  const fs::path guard = locks_dir_ / (sanitize_name(name) + ".lock.reclaim");
  for (int step = 0; step < kGuardWaitSteps; ++step) {
    if (::mkdir(guard.c_str(), 0700) == 0) {
      return true;
    }
    if (errno != EEXIST) {
      error = "mkdir " + guard.string() + " failed: " + std::strerror(errno);
      return false;
    }
    struct stat st {};
    if (::stat(guard.c_str(), &st) == 0) {
      const int64_t age = epoch_seconds_now() - static_cast<int64_t>(st.st_mtime);
      if (age > kGuardStaleSeconds) {
        remove_abandoned_guard(guard, st);
        continue;
      }
    }
    std::this_thread::sleep_for(kGuardWaitStep);
  }
  error = "lock guard " + guard.string() + " held by another process";
  return false;
}

void LockManager::release_guard(const std::string& name) const {
  const fs::path guard = locks_dir_ / (sanitize_name(name) + ".lock.reclaim");
  if (::rmdir(guard.c_str()) != 0 && errno != ENOENT) {
    log::warn("cannot remove lock guard " + guard.string() + ": " + std::strerror(errno));
  }
}

LockResult LockManager::acquire(const std::string& name, const std::string& session, const std::string& worktree) {
  const std::string key = sanitize_name(name);
  if (key.empty()) {
    return make_error(name, "invalid_name", "lock name is empty");
  }
  std::string error;
  if (!validate_session(session, error)) {
    return make_error(key, "invalid_session", error);
  }
  std::error_code ec;
  fs::create_directories(locks_dir_, ec);
  if (ec) {
    return make_error(key, "fatal", "cannot create lock directory " + locks_dir_.string() + ": " + ec.message());
  }

  const fs::path path = lock_path(key);
  bool reclaimed = false;
  for (int attempt = 0; attempt < kAcquireAttempts; ++attempt) {
    LockInfo fresh;
    fresh.name = key;
    fresh.owner_session = session;
    fresh.acquired_at = epoch_seconds_now();
    fresh.acquired_iso = iso_utc(fresh.acquired_at);
    fresh.worktree = worktree;

    const int rc = link_new_lock(path, render(fresh), error);
    if (rc == 0) {
      LockResult result;
      result.status = LockStatus::Acquired;
      result.name = key;
      result.message = reclaimed ? "lock acquired after reclaiming stale lock" : "lock acquired";
      result.holder = fresh;
      result.reclaimed_stale = reclaimed;
      log::info("lock acquired: " + key + " session=" + session);
      return result;
    }
    if (rc != EEXIST) {
      return make_error(key, "fatal", error);
    }

    LockInfo existing;
    if (!read_lock(path, existing, error)) {
      if (!fs::exists(path, ec)) {
        continue;
      }
      log::error(error);
      return make_error(key, "malformed_lock", error);
    }

    if (existing.owner_session == session) {
      // Re-acquire by the owner refreshes the timestamp.
      if (!acquire_guard(key, error)) {
        LockResult busy;
        busy.status = LockStatus::Busy;
        busy.name = key;
        busy.message = error;
        busy.holder = existing;
        return busy;
      }
      LockInfo current;
      std::string read_error;
      const bool still_ours = read_lock(path, current, read_error) && current.owner_session == session;
      if (!still_ours) {
        release_guard(key);
        continue;
      }
      fresh.worktree = worktree.empty() ? current.worktree : worktree;
      const bool written = write_text_file_atomic(path, render(fresh), error);
      release_guard(key);
      if (!written) {
        return make_error(key, "fatal", error);
      }
      LockResult result;
      result.status = LockStatus::Acquired;
      result.name = key;
      result.message = "lock already held by this session";
      result.holder = fresh;
      return result;
    }

    if (!existing.stale) {
      LockResult busy;
      busy.status = LockStatus::Busy;
      busy.name = key;
      busy.message = "issue locked by another session";
      busy.holder = existing;
      log::info("lock busy: " + key + " held by " + existing.owner_session + " for " +
                std::to_string(existing.age_seconds) + "s");
      return busy;
    }

    if (!acquire_guard(key, error)) {
      LockResult busy;
      busy.status = LockStatus::Busy;
      busy.name = key;
      busy.message = error;
      busy.holder = existing;
      return busy;
    }
    LockInfo current;
    std::string read_error;
    if (read_lock(path, current, read_error) && same_lock(current, existing) && current.stale) {
      log::warn("reclaiming stale lock " + key + " from session " + current.owner_session + " (age " +
                std::to_string(current.age_seconds) + "s)");
      fs::remove(path, ec);
      if (ec) {
        release_guard(key);
        return make_error(key, "fatal", "cannot remove stale lock " + path.string() + ": " + ec.message());
      }
      reclaimed = true;
      fresh.acquired_at = epoch_seconds_now();
      fresh.acquired_iso = iso_utc(fresh.acquired_at);
      const int relink = link_new_lock(path, render(fresh), error);
      release_guard(key);
      if (relink == 0) {
        LockResult result;
        result.status = LockStatus::Acquired;
        result.name = key;
        result.message = "lock acquired after reclaiming stale lock";
        result.holder = fresh;
        result.reclaimed_stale = true;
        log::info("lock acquired: " + key + " session=" + session);
        return result;
      }
      if (relink != EEXIST) {
        return make_error(key, "fatal", error);
      }
      continue;
    }
    release_guard(key);
  }

  LockCheckResult state = check(key);
  LockResult busy;
  busy.status = LockStatus::Busy;
  busy.name = key;
  busy.message = "lock contended";
  if (state.success && state.locked) {
    busy.holder = state.info;
  }
  return busy;
}

LockResult LockManager::acquire_with_retry(const std::string& name,
                                           const std::string& session,
                                           const std::string& worktree,
                                           std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  auto delay = std::chrono::milliseconds(std::max<int64_t>(1, options_.retry_initial_ms));
  const auto max_delay = std::chrono::milliseconds(std::max<int64_t>(delay.count(), options_.retry_max_ms));
  for (;;) {
    LockResult result = acquire(name, session, worktree);
    if (result.status != LockStatus::Busy) {
      return result;
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      result.timed_out = timeout.count() > 0;
      return result;
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(delay, remaining));
    delay = std::min(delay * 2, max_delay);
  }
}

LockResult LockManager::release(const std::string& name, const std::string& session) {
  const std::string key = sanitize_name(name);
  std::string error;
  if (!validate_session(session, error)) {
    return make_error(key, "invalid_session", error);
  }
  const fs::path path = lock_path(key);
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    LockResult result;
    result.status = LockStatus::Released;
    result.name = key;
    result.message = "no lock held";
    return result;
  }

  if (!acquire_guard(key, error)) {
    return make_error(key, "guard_busy", error);
  }
  LockInfo current;
  if (!read_lock(path, current, error)) {
    release_guard(key);
    if (!fs::exists(path, ec)) {
      LockResult result;
      result.status = LockStatus::Released;
      result.name = key;
      result.message = "no lock held";
      return result;
    }
    log::error(error);
    return make_error(key, "malformed_lock", error);
  }
  if (current.owner_session != session) {
    release_guard(key);
    LockResult result = make_error(key, "not_owner",
                                   "lock " + key + " is owned by session " + current.owner_session +
                                       ", not " + session);
    result.holder = current;
    return result;
  }
  fs::remove(path, ec);
  release_guard(key);
  if (ec) {
    return make_error(key, "fatal", "cannot remove lock " + path.string() + ": " + ec.message());
  }
  log::info("lock released: " + key + " session=" + session);
  LockResult result;
  result.status = LockStatus::Released;
  result.name = key;
  result.message = "lock released";
  return result;
}

LockResult LockManager::force_release(const std::string& name) {
  const std::string key = sanitize_name(name);
  const fs::path path = lock_path(key);
  std::error_code ec;
  LockResult result;
  result.name = key;
  if (!fs::exists(path, ec)) {
    result.status = LockStatus::Released;
    result.message = "no lock held";
    return result;
  }
  LockInfo previous;
  std::string error;
  if (read_lock(path, previous, error)) {
    result.holder = previous;
    log::warn("force-releasing lock " + key + " held by " + previous.owner_session);
  } else {
    log::warn("force-releasing unreadable lock " + key + ": " + error);
  }
  fs::remove(path, ec);
  if (ec) {
    return make_error(key, "fatal", "cannot remove lock " + path.string() + ": " + ec.message());
  }
  result.status = LockStatus::Released;
  result.message = "lock force-released";
  return result;
}

LockResult LockManager::update(const std::string& name, const std::string& session, const std::string& worktree) {
  const std::string key = sanitize_name(name);
  std::string error;
  if (!validate_session(session, error)) {
    return make_error(key, "invalid_session", error);
  }
  const fs::path path = lock_path(key);
  if (!acquire_guard(key, error)) {
    return make_error(key, "guard_busy", error);
  }
  LockInfo current;
  if (!read_lock(path, current, error)) {
    release_guard(key);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
      return make_error(key, "not_locked", "no lock held for " + key);
    }
    return make_error(key, "malformed_lock", error);
  }
  if (current.owner_session != session) {
    release_guard(key);
    LockResult result = make_error(key, "not_owner",
                                   "lock " + key + " is owned by session " + current.owner_session);
    result.holder = current;
    return result;
  }
  current.worktree = worktree;
  current.acquired_at = epoch_seconds_now();
  current.acquired_iso = iso_utc(current.acquired_at);
  current.age_seconds = 0;
  current.stale = false;
  const bool written = write_text_file_atomic(path, render(current), error);
  release_guard(key);
  if (!written) {
    return make_error(key, "fatal", error);
  }
  LockResult result;
  result.status = LockStatus::Updated;
  result.name = key;
  result.message = "lock updated";
  result.holder = current;
  return result;
}

LockCheckResult LockManager::check(const std::string& name) const {
  LockCheckResult result;
  const std::string key = sanitize_name(name);
  const fs::path path = lock_path(key);
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    result.success = true;
    result.locked = false;
    result.info.name = key;
    return result;
  }
  std::string error;
  if (!read_lock(path, result.info, error)) {
    if (!fs::exists(path, ec)) {
      result.success = true;
      result.info = LockInfo{};
      result.info.name = key;
      return result;
    }
    result.error_code = "malformed_lock";
    result.error_message = error;
    return result;
  }
  result.success = true;
  result.locked = true;
  return result;
}

bool LockManager::require_owner(const std::string& name,
                                const std::string& session,
                                std::string& error_code,
                                std::string& error) const {
  if (!validate_session(session, error)) {
    error_code = "invalid_session";
    return false;
  }
  const LockCheckResult state = check(name);
  if (!state.success) {
    error_code = state.error_code;
    error = state.error_message;
    return false;
  }
  const std::string key = sanitize_name(name);
  if (!state.locked) {
    error_code = "not_locked";
    error = "session " + session + " does not hold the lock for " + key;
    return false;
  }
  if (state.info.owner_session != session) {
    error_code = "not_owner";
    error = "lock " + key + " is owned by session " + state.info.owner_session + ", not " + session;
    return false;
  }
  if (state.info.stale) {
    error_code = "lock_stale";
    error = "lock " + key + " went stale (" + std::to_string(state.info.age_seconds) + "s); acquire it again";
    return false;
  }
  return true;
}

LockListResult LockManager::list() const {
  LockListResult result;
  std::error_code ec;
  if (!fs::exists(locks_dir_, ec)) {
    result.success = true;
    return result;
  }
  std::vector<fs::path> files;
  for (auto it = fs::directory_iterator(locks_dir_, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
    if (!it->is_regular_file(ec) || it->path().extension() != ".lock") {
      continue;
    }
    files.push_back(it->path());
  }
  if (ec) {
    result.error_code = "fatal";
    result.error_message = "cannot list " + locks_dir_.string() + ": " + ec.message();
    return result;
  }
  std::sort(files.begin(), files.end());
  if (files.size() > kMaxLockFiles) {
    log::warn("lock directory holds " + std::to_string(files.size()) + " files; listing the first " +
              std::to_string(kMaxLockFiles));
    files.resize(kMaxLockFiles);
    result.truncated = true;
  }
  for (const auto& file : files) {
    LockInfo info;
    std::string error;
    if (read_lock(file, info, error)) {
      info.name = file.stem().string();
      result.locks.push_back(info);
    } else if (fs::exists(file, ec)) {
      log::warn("skipping malformed lock: " + error);
      result.malformed.push_back(MalformedLock{file.stem().string(), file, error});
    }
  }
  result.success = true;
  return result;
}

} // namespace twig
