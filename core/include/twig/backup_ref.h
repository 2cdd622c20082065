#pragma once

#include "twig/git.h"

#include <filesystem>
#include <string>

namespace twig {

// refs/twig/backup/<branch>/<op>-<YYYYmmdd-HHMMSS>[-N], created only if absent.
bool create_backup_ref(const Git& git,
                       const std::filesystem::path& cwd,
                       const std::string& branch,
                       const std::string& op,
                       const std::string& commit,
                       std::string& ref,
                       std::string& error);

// Points the worktree's branch, index and files back at the backup.
bool restore_from_backup(const Git& git,
                         const std::filesystem::path& worktree,
                         const std::string& backup_ref,
                         const std::string& expected_commit,
                         std::string& error);

} // namespace twig
