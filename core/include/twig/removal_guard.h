#pragma once

#include "twig/lock_manager.h"
#include "twig/paths.h"

#include <filesystem>
#include <string>
#include <vector>

namespace twig {

enum class RemovalKind { RecursiveDelete, WorktreeRemove };
enum class GuardDecision { Allow, Block };
enum class ProtectionReason { WorkingDirectory, MainWorktree, LockedByOtherSession, LockedBySameSession, UnknownOwner };

const char* to_string(RemovalKind kind);
const char* to_string(GuardDecision decision);
const char* to_string(ProtectionReason reason);

struct ProtectedPath {
  std::filesystem::path path;
  ProtectionReason reason = ProtectionReason::UnknownOwner;
  std::string issue;
  std::string owner;
};

struct GuardResult {
  GuardDecision decision = GuardDecision::Block;
  RemovalKind kind = RemovalKind::RecursiveDelete;
  std::string target;
  std::filesystem::path resolved_target;
  ProtectedPath blocked_by;
  // Human-readable explanation for a block.
  std::string message;
  std::string error_code;
  std::string error_message;

  bool allowed() const { return decision == GuardDecision::Allow; }
};

struct RemovalRequest {
  RemovalKind kind = RemovalKind::RecursiveDelete;
  // Empty when the targets only exist at run time (xargs fed by a pipe).
  std::string target;
  // Directory relative targets resolve against (cwd, or git -C).
  std::filesystem::path base_dir;
};

struct ParsedCommand {
  std::vector<RemovalRequest> requests;
};

struct ShellCommand {
  std::vector<std::string> words;
  // Words of a <<< here-string.
  std::vector<std::string> stdin_words;
};

// Quote-aware split into simple commands on ; & | and newlines. Redirection
// targets are dropped from the words.
std::vector<ShellCommand> split_shell_commands(const std::string& text);

// Finds recursive rm (also under env, xargs, sudo and sh -c), find -exec rm -r
// and git worktree remove invocations.
ParsedCommand parse_removal_command(const std::string& text, const std::filesystem::path& cwd);

// Protection depends on the command: a recursive delete spares only the caller's
// own locked worktrees; a worktree removal spares only other sessions' worktrees.
// The main worktree and the caller's cwd are always protected.
class RemovalGuard {
 public:
  RemovalGuard(const LockManager& locks, ResolvedPaths paths);

  GuardResult check(RemovalKind kind,
                    const std::string& target,
                    const std::filesystem::path& cwd,
                    const std::string& session) const;

  GuardResult check_command(const std::string& command,
                            const std::filesystem::path& cwd,
                            const std::string& session) const;

  bool protected_paths(RemovalKind kind,
                       const std::filesystem::path& cwd,
                       const std::string& session,
                       std::vector<ProtectedPath>& out,
                       std::string& error) const;

 private:
  GuardResult check_request(const RemovalRequest& request,
                            const std::filesystem::path& cwd,
                            const std::string& session) const;

  const LockManager& locks_;
  ResolvedPaths paths_;
};

} // namespace twig
