#pragma once

#include "twig/config.h"
#include "twig/lock_manager.h"
#include "twig/merge.h"
#include "twig/paths.h"
#include "twig/rebase.h"
#include "twig/removal_guard.h"
#include "twig/squash.h"
#include "twig/worktree_manager.h"

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

struct CliContext {
  twig::ResolvedPaths paths;
  twig::EngineConfig config;
};

bool load_cli_context(const std::filesystem::path& start_dir,
                      CliContext& ctx,
                      std::string& error_code,
                      std::string& error);
twig::LockManagerOptions lock_options(const twig::EngineConfig& cfg);

nlohmann::json lock_info_json(const twig::LockInfo& info);
nlohmann::json lock_result_json(const twig::LockResult& result);
nlohmann::json worktree_record_json(const twig::WorktreeRecord& record);
nlohmann::json squash_result_json(const twig::SquashResult& result);
nlohmann::json rebase_result_json(const twig::RebaseResult& result);
nlohmann::json guard_result_json(const twig::GuardResult& result);
nlohmann::json merge_result_json(const twig::MergeResult& result);

int lock_acquire(const CliContext& ctx,
                 const std::string& issue,
                 const std::string& session,
                 const std::string& worktree,
                 const std::optional<int64_t>& timeout_ms);
int lock_release(const CliContext& ctx, const std::string& issue, const std::string& session);
int lock_update(const CliContext& ctx, const std::string& issue, const std::string& session, const std::string& worktree);
int lock_force_release(const CliContext& ctx, const std::string& issue);
int lock_check(const CliContext& ctx, const std::string& issue);
int lock_list(const CliContext& ctx);

int worktree_create(const CliContext& ctx,
                    const std::string& issue,
                    const std::string& target,
                    const std::string& session,
                    const std::optional<int64_t>& timeout_ms);
int worktree_show(const CliContext& ctx, const std::filesystem::path& path);
int worktree_list(const CliContext& ctx);
int worktree_destroy(const CliContext& ctx, const std::filesystem::path& path, bool force);

int squash_command(const CliContext& ctx,
                   const std::filesystem::path& path,
                   const std::string& session,
                   const std::string& message);
int rebase_command(const CliContext& ctx,
                   const std::filesystem::path& path,
                   const std::string& session,
                   const std::string& onto);
int guard_check_command(const CliContext& ctx,
                        const std::string& command,
                        const std::string& kind,
                        const std::string& target,
                        const std::filesystem::path& cwd,
                        const std::string& session);
int merge_command(const CliContext& ctx, const std::filesystem::path& path, const std::string& session);
int config_show(const CliContext& ctx);
