#include "twig/git.h"

#include "twig/file_io.h"

#include <sstream>

namespace twig {

namespace fs = std::filesystem;

std::string describe_failure(const std::vector<std::string>& args, const ProcessResult& result) {
  std::string cmd = "git";
  for (const auto& a : args) {
    cmd += " " + a;
  }
  if (!result.started) {
    return cmd + ": " + result.error_message;
  }
  std::string msg = cmd + " exited " + std::to_string(result.exit_code);
  const auto err = trim(result.err);
  if (!err.empty()) {
    msg += ": " + err;
  }
  return msg;
}

Git::Git(std::string binary) : binary_(std::move(binary)) {}

ProcessResult Git::run(const fs::path& cwd,
                       const std::vector<std::string>& args,
                       const EnvOverrides& env) const {
  std::vector<std::string> full;
  full.reserve(args.size() + 1);
  full.push_back(binary_);
  full.insert(full.end(), args.begin(), args.end());
  return runner_.run(full, cwd, env);
}

bool Git::run_checked(const fs::path& cwd,
                      const std::vector<std::string>& args,
                      std::string& out,
                      std::string& error,
                      const EnvOverrides& env) const {
  const auto result = run(cwd, args, env);
  if (!result.ok()) {
    error = describe_failure(args, result);
    return false;
  }
  out = result.out;
  return true;
}

bool Git::resolve_commit(const fs::path& cwd,
                         const std::string& rev,
                         std::string& hash,
                         std::string& error) const {
  std::string out;
  if (!run_checked(cwd, {"rev-parse", "--verify", "--quiet", rev + "^{commit}"}, out, error)) {
    error = "cannot resolve '" + rev + "' to a commit";
    return false;
  }
  hash = trim(out);
  if (!is_full_hash(hash)) {
    error = "unexpected rev-parse output for '" + rev + "': " + hash;
    return false;
  }
  return true;
}

bool Git::common_dir(const fs::path& cwd, fs::path& out, std::string& error) const {
  std::string text;
  if (!run_checked(cwd, {"rev-parse", "--git-common-dir"}, text, error)) {
    return false;
  }
  fs::path dir = trim(text);
  if (dir.is_relative()) {
    dir = cwd / dir;
  }
  std::error_code ec;
  const auto canonical = fs::weakly_canonical(dir, ec);
  out = ec ? dir.lexically_normal() : canonical;
  return true;
}

bool Git::absolute_git_dir(const fs::path& cwd, fs::path& out, std::string& error) const {
  std::string text;
  if (!run_checked(cwd, {"rev-parse", "--absolute-git-dir"}, text, error)) {
    return false;
  }
  out = fs::path(trim(text));
  return true;
}

bool Git::is_ancestor(const fs::path& cwd,
                      const std::string& ancestor,
                      const std::string& descendant,
                      bool& out,
                      std::string& error) const {
  const std::vector<std::string> args = {"merge-base", "--is-ancestor", ancestor, descendant};
  const auto result = run(cwd, args);
  if (result.started && result.exit_code == 0) {
    out = true;
    return true;
  }
  if (result.started && result.exit_code == 1) {
    out = false;
    return true;
  }
  error = describe_failure(args, result);
  return false;
}

bool Git::has_tracked_changes(const fs::path& cwd, bool& dirty, std::string& error) const {
  std::string out;
  if (!run_checked(cwd, {"status", "--porcelain", "--untracked-files=no"}, out, error)) {
    return false;
  }
  dirty = !trim(out).empty();
  return true;
}

bool Git::trees_equal(const fs::path& cwd,
                      const std::string& a,
                      const std::string& b,
                      bool& equal,
                      std::string& error) const {
  const std::vector<std::string> args = {"diff", "--quiet", "--no-ext-diff", a, b, "--"};
  const auto result = run(cwd, args);
  if (result.started && (result.exit_code == 0 || result.exit_code == 1)) {
    equal = result.exit_code == 0;
    return true;
  }
  error = describe_failure(args, result);
  return false;
}

bool Git::diff_patch(const fs::path& cwd,
                     const std::string& from,
                     const std::string& to,
                     std::string& patch,
                     std::string& error) const {
  return run_checked(cwd,
                     {"-c", "core.quotePath=false", "diff", "--binary", "--full-index", "--no-color",
                      "--no-ext-diff", "--no-renames", from, to, "--"},
                     patch, error);
}

bool Git::diff_stat(const fs::path& cwd,
                    const std::string& from,
                    const std::string& to,
                    std::string& stat,
                    std::string& error) const {
  return run_checked(cwd, {"diff", "--stat", "--no-color", from, to, "--"}, stat, error);
}

bool Git::update_ref(const fs::path& cwd,
                     const std::string& ref,
                     const std::string& new_value,
                     const std::string& old_value,
                     const std::string& reason,
                     std::string& error) const {
  std::string out;
  return run_checked(cwd, {"update-ref", "-m", reason, ref, new_value, old_value}, out, error);
}

bool Git::delete_ref(const fs::path& cwd,
                     const std::string& ref,
                     const std::string& old_value,
                     std::string& error) const {
  std::string out;
  std::vector<std::string> args = {"update-ref", "-d", ref};
  if (!old_value.empty()) {
    args.push_back(old_value);
  }
  return run_checked(cwd, args, out, error);
}

bool Git::ref_exists(const fs::path& cwd, const std::string& ref) const {
  return run(cwd, {"show-ref", "--verify", "--quiet", ref}).ok();
}

bool Git::list_worktrees(const fs::path& cwd,
                         std::vector<GitWorktreeEntry>& out,
                         std::string& error) const {
  std::string text;
  if (!run_checked(cwd, {"worktree", "list", "--porcelain"}, text, error)) {
    return false;
  }
  out.clear();
  std::istringstream in(text);
  std::string line;
  GitWorktreeEntry current;
  bool have = false;
  auto flush = [&]() {
    if (have) {
      out.push_back(current);
    }
    current = GitWorktreeEntry{};
    have = false;
  };
  while (std::getline(in, line)) {
    if (line.empty()) {
      flush();
      continue;
    }
    if (line.rfind("worktree ", 0) == 0) {
      flush();
      current.path = fs::path(line.substr(9));
      have = true;
    } else if (line.rfind("HEAD ", 0) == 0) {
      current.head = line.substr(5);
    } else if (line.rfind("branch ", 0) == 0) {
      current.branch = line.substr(7);
    } else if (line == "bare") {
      current.bare = true;
    } else if (line == "detached") {
      current.detached = true;
    }
  }
  flush();
  return true;
}

bool Git::is_full_hash(const std::string& text) {
  if (text.size() != 40 && text.size() != 64) {
    return false;
  }
  for (char c : text) {
    const bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    if (!hex) {
      return false;
    }
  }
  return true;
}

} // namespace twig
