#include "twig/removal_guard.h"

#include "twig/log.h"

#include <cstdlib>
#include <sstream>

namespace twig {

namespace fs = std::filesystem;

namespace {
constexpr int kMaxShellDepth = 4;

bool is_assignment(const std::string& token) {
  const auto eq = token.find('=');
  if (eq == std::string::npos || eq == 0) {
    return false;
  }
  for (size_t i = 0; i < eq; ++i) {
    const char c = token[i];
    const bool ok = c == '_' || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (i > 0 && c >= '0' && c <= '9');
    if (!ok) {
      return false;
    }
  }
  return true;
}

std::string command_name(const std::string& token) {
  const auto slash = token.rfind('/');
  return slash == std::string::npos ? token : token.substr(slash + 1);
}

// Options of a wrapper command that consume the following word.
bool wrapper_option_takes_value(const std::string& wrapper, const std::string& opt) {
  if (opt.size() != 2) {
    return false;
  }
  const char o = opt[1];
  if (wrapper == "sudo") {
    return o == 'u' || o == 'g' || o == 'C' || o == 'D' || o == 'p' || o == 'r' || o == 't' || o == 'U' || o == 'h';
  }
  if (wrapper == "env") {
    return o == 'u' || o == 'C';
  }
  if (wrapper == "xargs") {
    return o == 'a' || o == 'd' || o == 'E' || o == 'I' || o == 'L' || o == 'n' || o == 'P' || o == 's';
  }
  if (wrapper == "nice") {
    return o == 'n';
  }
  if (wrapper == "timeout") {
    return o == 's' || o == 'k';
  }
  return false;
}

bool is_wrapper(const std::string& cmd) {
  return cmd == "sudo" || cmd == "command" || cmd == "exec" || cmd == "nohup" || cmd == "time" || cmd == "env" ||
         cmd == "xargs" || cmd == "nice" || cmd == "timeout";
}

bool is_shell(const std::string& cmd) {
  return cmd == "sh" || cmd == "bash" || cmd == "zsh" || cmd == "dash" || cmd == "ksh";
}

bool is_recursive_flag(const std::string& token) {
  if (token == "--recursive") {
    return true;
  }
  return token.size() > 1 && token[0] == '-' && token[1] != '-' && token.find_first_of("rR") != std::string::npos;
}

// An empty target stands for targets only known when the command runs.
void parse_rm(const std::vector<std::string>& args, size_t start, const fs::path& base, bool from_stdin,
              const std::vector<std::string>& stdin_words, std::vector<RemovalRequest>& out) {
  bool recursive = false;
  bool end_of_options = false;
  std::vector<std::string> targets;
  for (size_t i = start; i < args.size(); ++i) {
    const auto& token = args[i];
    if (!end_of_options && token == "--") {
      end_of_options = true;
      continue;
    }
    if (!end_of_options && token.size() > 1 && token[0] == '-') {
      recursive = recursive || is_recursive_flag(token);
      continue;
    }
    targets.push_back(token);
  }
  if (!recursive) {
    return;
  }
  if (from_stdin) {
    if (stdin_words.empty()) {
      targets.push_back(std::string());
    } else {
      targets.insert(targets.end(), stdin_words.begin(), stdin_words.end());
    }
  }
  for (const auto& t : targets) {
    out.push_back(RemovalRequest{RemovalKind::RecursiveDelete, t, base});
  }
}

// find <start>... -exec rm -r ... deletes anything below its start points.
void parse_find(const std::vector<std::string>& args, size_t start, const fs::path& base,
                std::vector<RemovalRequest>& out) {
  std::vector<std::string> roots;
  size_t i = start;
  while (i < args.size() && !args[i].empty() && args[i][0] != '-' && args[i] != "(" && args[i] != "!") {
    roots.push_back(args[i]);
    ++i;
  }
  bool deletes = false;
  for (; i < args.size(); ++i) {
    if ((args[i] == "-exec" || args[i] == "-execdir" || args[i] == "-ok") && i + 1 < args.size() &&
        command_name(args[i + 1]) == "rm") {
      for (size_t j = i + 2; j < args.size() && args[j] != ";" && args[j] != "+"; ++j) {
        if (is_recursive_flag(args[j])) {
          deletes = true;
        }
      }
    }
  }
  if (!deletes) {
    return;
  }
  if (roots.empty()) {
    roots.push_back(".");
  }
  for (const auto& r : roots) {
    out.push_back(RemovalRequest{RemovalKind::RecursiveDelete, r, base});
  }
}


void parse_git(const std::vector<std::string>& args, size_t start, const fs::path& base,
               std::vector<RemovalRequest>& out) {
  fs::path dir = base;
  size_t i = start;
  while (i < args.size() && args[i].size() > 1 && args[i][0] == '-') {
    const auto& opt = args[i];
    if (opt == "-C" && i + 1 < args.size()) {
      const fs::path next = args[i + 1];
      dir = next.is_absolute() ? next : dir / next;
      i += 2;
    } else if ((opt == "-c" || opt == "--git-dir" || opt == "--work-tree" || opt == "--namespace") &&
               i + 1 < args.size()) {
      i += 2;
    } else {
      ++i;
    }
  }
  if (i + 1 >= args.size() || args[i] != "worktree" || args[i + 1] != "remove") {
    return;
  }
  for (size_t j = i + 2; j < args.size(); ++j) {
    const auto& token = args[j];
    if (token == "--") {
      if (j + 1 < args.size()) {
        out.push_back(RemovalRequest{RemovalKind::WorktreeRemove, args[j + 1], dir});
      }
      return;
    }
    if (token.size() > 1 && token[0] == '-') {
      continue;
    }
    out.push_back(RemovalRequest{RemovalKind::WorktreeRemove, token, dir});
    return;
  }
}

fs::path resolve_target(const std::string& target, const fs::path& base) {
  std::string text = target;
  if (text == "~" || text.rfind("~/", 0) == 0) {
    if (const char* home = std::getenv("HOME")) {
      text = std::string(home) + text.substr(1);
    }
  }
  return normalize_path(fs::path(text), base);
}

std::string block_message(const GuardResult& r, const fs::path& cwd) {
  const std::string attempted = std::string(r.kind == RemovalKind::RecursiveDelete ? "rm (recursive) " : "git worktree remove ") + r.target;
  std::ostringstream out;
  out << "UNSAFE DIRECTORY REMOVAL BLOCKED\n\n"
      << "Attempted: " << attempted << "\n";
  switch (r.blocked_by.reason) {
    case ProtectionReason::WorkingDirectory:
      out << "Problem:   The working directory is inside the removal target\n"
          << "Working directory: " << cwd.string() << "\n"
          << "Target:    " << r.resolved_target.string() << "\n\n"
          << "WHAT TO DO:\n"
          << "1. Change to a directory outside the target\n"
          << "2. Then retry: " << attempted << "\n";
      break;
    case ProtectionReason::MainWorktree:
      out << "Problem:   The target contains the main worktree\n"
          << "Main worktree: " << r.blocked_by.path.string() << "\n"
          << "Target:    " << r.resolved_target.string() << "\n\n"
          << "WHAT TO DO:\n"
          << "- Use a more specific target path\n";
      break;
    case ProtectionReason::LockedByOtherSession:
      out << "Problem:   The target contains a worktree locked by another session\n"
          << "Worktree:  " << r.blocked_by.path.string() << "\n"
          << "Lock owner: " << r.blocked_by.owner << "\n"
          << "Target:    " << r.resolved_target.string() << "\n\n"
          << "WHAT TO DO:\n"
          << "1. Leave the worktree to its owner, or wait for the lock to go stale\n"
          << "2. If the owner crashed: twigctl lock force-release " << r.blocked_by.issue << "\n";
      break;
    case ProtectionReason::LockedBySameSession:
      out << "Problem:   The target is a worktree this session still holds a lock on\n"
          << "Worktree:  " << r.blocked_by.path.string() << "\n"
          << "Lock owner: " << r.blocked_by.owner << " (this session)\n\n"
          << "WHAT TO DO:\n"
          << "1. Merge it: twigctl merge " << r.blocked_by.path.string() << "\n"
          << "2. Or release the lock first: twigctl lock release " << r.blocked_by.issue << "\n";
      break;
    case ProtectionReason::UnknownOwner:
      out << "Problem:   The target contains a worktree whose lock cannot be read\n"
          << "Worktree:  " << r.blocked_by.path.string() << "\n"
          << "Target:    " << r.resolved_target.string() << "\n\n"
          << "WHAT TO DO:\n"
          << "- Inspect the lock: twigctl lock check " << r.blocked_by.issue << "\n";
      break;
  }
  return out.str();
}

std::string unresolved_message(RemovalKind kind) {
  std::ostringstream out;
  out << "UNSAFE DIRECTORY REMOVAL BLOCKED\n\n"
      << "Attempted: " << (kind == RemovalKind::RecursiveDelete ? "rm (recursive)" : "git worktree remove")
      << " with targets read from standard input\n"
      << "Problem:   The directories to delete cannot be checked before the command runs\n\n"
      << "WHAT TO DO:\n"
      << "- Name each directory explicitly: rm -rf <path>\n";
  return out.str();
}
} // namespace

const char* to_string(RemovalKind kind) {
  switch (kind) {
    case RemovalKind::RecursiveDelete: return "recursive_delete";
    case RemovalKind::WorktreeRemove: return "worktree_remove";
  }
  return "recursive_delete";
}

const char* to_string(GuardDecision decision) {
  return decision == GuardDecision::Allow ? "allow" : "block";
}

const char* to_string(ProtectionReason reason) {
  switch (reason) {
    case ProtectionReason::WorkingDirectory: return "working_directory";
    case ProtectionReason::MainWorktree: return "main_worktree";
    case ProtectionReason::LockedByOtherSession: return "locked_by_other_session";
    case ProtectionReason::LockedBySameSession: return "locked_by_same_session";
    case ProtectionReason::UnknownOwner: return "unknown_owner";
  }
  return "unknown_owner";
}

std::vector<ShellCommand> split_shell_commands(const std::string& text) {
  enum class Pending { None, Redirect, HereString };
  std::vector<ShellCommand> commands;
  ShellCommand command;
  std::string current;
  bool has_token = false;
  bool in_single = false;
  bool in_double = false;
  Pending pending = Pending::None;

  auto end_token = [&]() {
    if (has_token) {
      if (pending == Pending::HereString) {
        std::istringstream words(current);
        std::string word;
        while (words >> word) {
          command.stdin_words.push_back(word);
        }
      } else if (pending == Pending::None) {
        command.words.push_back(current);
      }
      pending = Pending::None;
    }
    current.clear();
    has_token = false;
  };
  auto end_command = [&]() {
    end_token();
    if (!command.words.empty()) {
      commands.push_back(command);
    }
    command = ShellCommand{};
    pending = Pending::None;
  };

  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (in_single) {
      if (c == '\'') {
        in_single = false;
      } else {
        current.push_back(c);
      }
      continue;
    }
    if (in_double) {
      if (c == '"') {
        in_double = false;
      } else if (c == '\\' && i + 1 < text.size() &&
                 (text[i + 1] == '"' || text[i + 1] == '\\' || text[i + 1] == '$')) {
        current.push_back(text[++i]);
      } else {
        current.push_back(c);
      }
      continue;
    }
    if (c == '\'') {
      in_single = true;
      has_token = true;
    } else if (c == '"') {
      in_double = true;
      has_token = true;
    } else if (c == '\\' && i + 1 < text.size()) {
      current.push_back(text[++i]);
      has_token = true;
    } else if (c == ';' || c == '&' || c == '|' || c == '\n' || c == '(' || c == ')') {
      end_command();
    } else if (c == '>' || c == '<') {
      // A bare number before the operator is a file descriptor, not a word.
      if (has_token && !current.empty() && current.find_first_not_of("0123456789") == std::string::npos) {
        current.clear();
        has_token = false;
      } else {
        end_token();
      }
      if (text.compare(i, 3, "<<<") == 0) {
        i += 2;
        pending = Pending::HereString;
        continue;
      }
      if (i + 1 < text.size() && (text[i + 1] == c || text[i + 1] == '&')) {
        ++i;
      }
      pending = Pending::Redirect;
    } else if (c == ' ' || c == '\t' || c == '\r') {
      end_token();
    } else {
      current.push_back(c);
      has_token = true;
    }
  }
  end_command();
  return commands;
}

namespace {
void parse_simple_command(const ShellCommand& command, const fs::path& cwd, int depth,
                          std::vector<RemovalRequest>& out) {
  const auto& words = command.words;
  size_t i = 0;
  bool from_stdin = false;
  while (i < words.size() && is_assignment(words[i])) {
    ++i;
  }
  while (i < words.size() && is_wrapper(command_name(words[i]))) {
    const std::string wrapper = command_name(words[i]);
    from_stdin = from_stdin || wrapper == "xargs";
    ++i;
    while (i < words.size() && words[i].size() > 1 && words[i][0] == '-') {
      if (words[i] == "--") {
        ++i;
        break;
      }
      i += wrapper_option_takes_value(wrapper, words[i]) ? 2 : 1;
    }
    if (wrapper == "env") {
      while (i < words.size() && is_assignment(words[i])) {
        ++i;
      }
    } else if (wrapper == "timeout" && i < words.size()) {
      ++i;
    }
  }
  if (i >= words.size()) {
    return;
  }
  const std::string cmd = command_name(words[i]);
  if (cmd == "rm") {
    parse_rm(words, i + 1, cwd, from_stdin, command.stdin_words, out);
  } else if (cmd == "git") {
    parse_git(words, i + 1, cwd, out);
  } else if (cmd == "find") {
    parse_find(words, i + 1, cwd, out);
  } else if (is_shell(cmd) && depth < kMaxShellDepth) {
    for (size_t j = i + 1; j < words.size(); ++j) {
      const auto& opt = words[j];
      if (opt.size() < 2 || opt[0] != '-' || opt == "--") {
        break;
      }
      if (opt[1] != '-' && opt.find('c') != std::string::npos && j + 1 < words.size()) {
        for (const auto& inner : split_shell_commands(words[j + 1])) {
          parse_simple_command(inner, cwd, depth + 1, out);
        }
        break;
      }
    }
  }
}
} // namespace

ParsedCommand parse_removal_command(const std::string& text, const fs::path& cwd) {
  ParsedCommand parsed;
  for (const auto& command : split_shell_commands(text)) {
    parse_simple_command(command, cwd, 0, parsed.requests);
  }
  return parsed;
}

RemovalGuard::RemovalGuard(const LockManager& locks, ResolvedPaths paths)
    : locks_(locks), paths_(std::move(paths)) {}

bool RemovalGuard::protected_paths(RemovalKind kind,
                                   const fs::path& cwd,
                                   const std::string& session,
                                   std::vector<ProtectedPath>& out,
                                   std::string& error) const {
  out.clear();
  if (!cwd.empty()) {
    out.push_back(ProtectedPath{normalize_path(cwd, fs::current_path()), ProtectionReason::WorkingDirectory, "", ""});
  }
  out.push_back(ProtectedPath{paths_.main_root, ProtectionReason::MainWorktree, "", ""});

  const LockListResult listed = locks_.list();
  if (!listed.success) {
    error = listed.error_message;
    return false;
  }
  for (const auto& lock : listed.locks) {
    if (lock.stale) {
      continue;
    }
    const bool own = lock.owner_session == session;
    // Recursive delete spares the caller's worktrees; worktree removal spares everyone else's.
    const bool protect = kind == RemovalKind::RecursiveDelete ? !own : own;
    if (!protect) {
      continue;
    }
    const fs::path wt = lock.worktree.empty() ? paths_.worktrees_root / lock.name : fs::path(lock.worktree);
    out.push_back(ProtectedPath{normalize_path(wt, paths_.main_root),
                                own ? ProtectionReason::LockedBySameSession : ProtectionReason::LockedByOtherSession,
                                lock.name, lock.owner_session});
  }
  for (const auto& bad : listed.malformed) {
    out.push_back(ProtectedPath{normalize_path(paths_.worktrees_root / bad.name, paths_.main_root),
                                ProtectionReason::UnknownOwner, bad.name, "(unknown)"});
  }
  return true;
}

GuardResult RemovalGuard::check_request(const RemovalRequest& request,
                                        const fs::path& cwd,
                                        const std::string& session) const {
  GuardResult result;
  result.kind = request.kind;
  result.target = request.target;
  std::string error;
  if (!LockManager::validate_session(session, error)) {
    result.decision = GuardDecision::Block;
    result.error_code = "invalid_session";
    result.error_message = error;
    result.message = "removal refused: " + error;
    return result;
  }
  if (request.target.empty()) {
    result.decision = GuardDecision::Block;
    result.error_code = "unresolved_target";
    result.error_message = "recursive delete whose targets are only known at run time";
    result.message = unresolved_message(request.kind);
    log::warn("guard blocked " + std::string(to_string(request.kind)) + " with unresolved targets");
    return result;
  }
  const fs::path base = request.base_dir.empty() ? normalize_path(cwd, fs::current_path()) : request.base_dir;
  result.resolved_target = resolve_target(request.target, base);

  std::vector<ProtectedPath> protected_set;
  if (!protected_paths(request.kind, cwd, session, protected_set, error)) {
    result.decision = GuardDecision::Block;
    result.error_code = "fatal";
    result.error_message = error;
    result.message = "removal refused: lock state unreadable: " + error;
    log::error(result.message);
    return result;
  }

  for (const auto& p : protected_set) {
    if (path_within(p.path, result.resolved_target)) {
      result.decision = GuardDecision::Block;
      result.blocked_by = p;
      result.message = block_message(result, cwd);
      log::warn(std::string("guard blocked ") + to_string(request.kind) + " of " +
                result.resolved_target.string() + ": " + to_string(p.reason) + " " + p.path.string());
      return result;
    }
  }
  result.decision = GuardDecision::Allow;
  return result;
}

GuardResult RemovalGuard::check(RemovalKind kind,
                                const std::string& target,
                                const fs::path& cwd,
                                const std::string& session) const {
  return check_request(RemovalRequest{kind, target, fs::path()}, cwd, session);
}

GuardResult RemovalGuard::check_command(const std::string& command,
                                        const fs::path& cwd,
                                        const std::string& session) const {
  const fs::path base = normalize_path(cwd, fs::current_path());
  const ParsedCommand parsed = parse_removal_command(command, base);
  for (const auto& request : parsed.requests) {
    GuardResult result = check_request(request, cwd, session);
    if (!result.allowed()) {
      return result;
    }
  }
  GuardResult allowed;
  allowed.decision = GuardDecision::Allow;
  allowed.target = command;
  if (!parsed.requests.empty()) {
    allowed.kind = parsed.requests.front().kind;
  }
  return allowed;
}

} // namespace twig
