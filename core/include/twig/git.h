#pragma once

#include "twig/process.h"

#include <filesystem>
#include <string>
#include <vector>

namespace twig {

struct GitWorktreeEntry {
  std::filesystem::path path;
  std::string head;
  // Full ref name, e.g. refs/heads/main; empty when detached.
  std::string branch;
  bool bare = false;
  bool detached = false;
};

class Git {
 public:
  explicit Git(std::string binary = "git");

  const std::string& binary() const { return binary_; }

  ProcessResult run(const std::filesystem::path& cwd,
                    const std::vector<std::string>& args,
                    const EnvOverrides& env = {}) const;

  // Runs and requires exit 0; on failure error carries the command and stderr.
  bool run_checked(const std::filesystem::path& cwd,
                   const std::vector<std::string>& args,
                   std::string& out,
                   std::string& error,
                   const EnvOverrides& env = {}) const;

  bool resolve_commit(const std::filesystem::path& cwd,
                      const std::string& rev,
                      std::string& hash,
                      std::string& error) const;
  bool common_dir(const std::filesystem::path& cwd, std::filesystem::path& out, std::string& error) const;
  bool absolute_git_dir(const std::filesystem::path& cwd, std::filesystem::path& out, std::string& error) const;
  bool is_ancestor(const std::filesystem::path& cwd,
                   const std::string& ancestor,
                   const std::string& descendant,
                   bool& out,
                   std::string& error) const;
  // Tracked changes only; untracked files never affect a commit's tree.
  bool has_tracked_changes(const std::filesystem::path& cwd, bool& dirty, std::string& error) const;
  bool trees_equal(const std::filesystem::path& cwd,
                   const std::string& a,
                   const std::string& b,
                   bool& equal,
                   std::string& error) const;
  bool diff_patch(const std::filesystem::path& cwd,
                  const std::string& from,
                  const std::string& to,
                  std::string& patch,
                  std::string& error) const;
  bool diff_stat(const std::filesystem::path& cwd,
                 const std::string& from,
                 const std::string& to,
                 std::string& stat,
                 std::string& error) const;

  // Compare-and-swap: an empty old_value requires the ref to be absent.
  bool update_ref(const std::filesystem::path& cwd,
                  const std::string& ref,
                  const std::string& new_value,
                  const std::string& old_value,
                  const std::string& reason,
                  std::string& error) const;
  bool delete_ref(const std::filesystem::path& cwd,
                  const std::string& ref,
                  const std::string& old_value,
                  std::string& error) const;
  bool ref_exists(const std::filesystem::path& cwd, const std::string& ref) const;

  bool list_worktrees(const std::filesystem::path& cwd,
                      std::vector<GitWorktreeEntry>& out,
                      std::string& error) const;

  static bool is_full_hash(const std::string& text);

 private:
  std::string binary_;
  ProcessRunner runner_;
};

std::string describe_failure(const std::vector<std::string>& args, const ProcessResult& result);

} // namespace twig
