#include "twig/backup_ref.h"

#include "twig/file_io.h"
#include "twig/log.h"

namespace twig {

namespace fs = std::filesystem;

bool create_backup_ref(const Git& git,
                       const fs::path& cwd,
                       const std::string& branch,
                       const std::string& op,
                       const std::string& commit,
                       std::string& ref,
                       std::string& error) {
  const std::string base = "refs/twig/backup/" + branch + "/" + op + "-" + compact_utc_stamp(epoch_seconds_now());
  for (int n = 0; n < 100; ++n) {
    const std::string candidate = n == 0 ? base : base + "-" + std::to_string(n);
    if (git.ref_exists(cwd, candidate)) {
      continue;
    }
    if (git.update_ref(cwd, candidate, commit, "", "twig: backup before " + op, error)) {
      std::string resolved;
      if (!git.resolve_commit(cwd, candidate, resolved, error) || resolved != commit) {
        error = "backup ref " + candidate + " did not verify: " + error;
        return false;
      }
      ref = candidate;
      log::info("backup created: " + ref + " -> " + commit);
      return true;
    }
  }
  error = "cannot create backup ref under " + base + ": " + error;
  return false;
}

bool restore_from_backup(const Git& git,
                         const fs::path& worktree,
                         const std::string& backup_ref,
                         const std::string& expected_commit,
                         std::string& error) {
  std::string out;
  if (!git.run_checked(worktree, {"reset", "--hard", "--quiet", backup_ref}, out, error)) {
    error = "restore to " + backup_ref + " failed: " + error;
    return false;
  }
  std::string head;
  if (!git.resolve_commit(worktree, "HEAD", head, error)) {
    return false;
  }
  if (head != expected_commit) {
    error = "after restore HEAD is " + head + ", expected " + expected_commit;
    return false;
  }
  log::warn("branch restored from " + backup_ref);
  return true;
}

} // namespace twig
