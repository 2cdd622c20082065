#include "twig/config.h"

#include "twig/log.h"

#include <cstdlib>
#include <fstream>
#include <optional>

#include <nlohmann/json.hpp>

#if TWIG_ENABLE_DATA_YAML
#include <yaml-cpp/yaml.h>
#endif

namespace twig {

namespace {
bool file_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

struct ConfigFields {
  std::string git_binary;
  std::optional<int64_t> stale_after_seconds;
  std::optional<int64_t> lock_wait_timeout_ms;
  std::optional<int64_t> lock_retry_initial_ms;
  std::optional<int64_t> lock_retry_max_ms;
  std::optional<std::string> worktrees_root;
  std::string default_target_branch;
  std::optional<bool> log_to_file;
};

void apply_common_fields(EngineConfig& cfg, const ConfigFields& f) {
  if (!f.git_binary.empty()) {
    cfg.git_binary = f.git_binary;
  }
  if (f.stale_after_seconds.has_value()) {
    if (*f.stale_after_seconds > 0) {
      cfg.stale_after_seconds = *f.stale_after_seconds;
    } else {
      log::warn("stale_after_seconds must be positive; keeping default");
    }
  }
  if (f.lock_wait_timeout_ms.has_value() && *f.lock_wait_timeout_ms >= 0) {
    cfg.lock_wait_timeout_ms = *f.lock_wait_timeout_ms;
  }
  if (f.lock_retry_initial_ms.has_value() && *f.lock_retry_initial_ms > 0) {
    cfg.lock_retry_initial_ms = *f.lock_retry_initial_ms;
  }
  if (f.lock_retry_max_ms.has_value() && *f.lock_retry_max_ms > 0) {
    cfg.lock_retry_max_ms = *f.lock_retry_max_ms;
  }
  if (cfg.lock_retry_max_ms < cfg.lock_retry_initial_ms) {
    cfg.lock_retry_max_ms = cfg.lock_retry_initial_ms;
  }
  if (f.worktrees_root.has_value()) {
    cfg.worktrees_root = *f.worktrees_root;
  }
  if (!f.default_target_branch.empty()) {
    cfg.default_target_branch = f.default_target_branch;
  }
  if (f.log_to_file.has_value()) {
    cfg.log_to_file = *f.log_to_file;
  }
}
} // namespace

bool load_engine_config(const std::filesystem::path& path, EngineConfig& out, std::string& error) {
  EngineConfig cfg;

  if (!file_exists(path)) {
    error = "config not found: " + path.string();
    return false;
  }

  const auto ext = path.extension().string();
  if (ext == ".json") {
    std::ifstream in(path);
    nlohmann::json j;
    try {
      in >> j;
    } catch (const std::exception& e) {
      error = "config parse failed: " + path.string() + ": " + e.what();
      return false;
    }
    const auto& root = j.contains("engine") ? j["engine"] : j;

    ConfigFields f;
    try {
      if (root.contains("git_binary")) f.git_binary = root["git_binary"].get<std::string>();
      if (root.contains("stale_after_seconds")) {
        f.stale_after_seconds = root["stale_after_seconds"].get<int64_t>();
      }
      if (root.contains("lock_wait_timeout_ms")) {
        f.lock_wait_timeout_ms = root["lock_wait_timeout_ms"].get<int64_t>();
      }
      if (root.contains("lock_retry_initial_ms")) {
        f.lock_retry_initial_ms = root["lock_retry_initial_ms"].get<int64_t>();
      }
      if (root.contains("lock_retry_max_ms")) {
        f.lock_retry_max_ms = root["lock_retry_max_ms"].get<int64_t>();
      }
      if (root.contains("worktrees_root")) {
        f.worktrees_root = root["worktrees_root"].get<std::string>();
      }
      if (root.contains("default_target_branch")) {
        f.default_target_branch = root["default_target_branch"].get<std::string>();
      }
      if (root.contains("log_to_file")) f.log_to_file = root["log_to_file"].get<bool>();
    } catch (const std::exception& e) {
      error = "config field invalid: " + path.string() + ": " + e.what();
      return false;
    }

    apply_common_fields(cfg, f);
    out = cfg;
    return true;
  }

  if (ext == ".yaml" || ext == ".yml") {
#if TWIG_ENABLE_DATA_YAML
    ConfigFields f;
    try {
      YAML::Node doc = YAML::LoadFile(path.string());
      YAML::Node root = doc["engine"] ? doc["engine"] : doc;

      if (root["git_binary"]) f.git_binary = root["git_binary"].as<std::string>();
      if (root["stale_after_seconds"]) {
        f.stale_after_seconds = root["stale_after_seconds"].as<int64_t>();
      }
      if (root["lock_wait_timeout_ms"]) {
        f.lock_wait_timeout_ms = root["lock_wait_timeout_ms"].as<int64_t>();
      }
      if (root["lock_retry_initial_ms"]) {
        f.lock_retry_initial_ms = root["lock_retry_initial_ms"].as<int64_t>();
      }
      if (root["lock_retry_max_ms"]) {
        f.lock_retry_max_ms = root["lock_retry_max_ms"].as<int64_t>();
      }
      if (root["worktrees_root"]) f.worktrees_root = root["worktrees_root"].as<std::string>();
      if (root["default_target_branch"]) {
        f.default_target_branch = root["default_target_branch"].as<std::string>();
      }
      if (root["log_to_file"]) f.log_to_file = root["log_to_file"].as<bool>();
    } catch (const YAML::Exception& e) {
      error = "config parse failed: " + path.string() + ": " + e.what();
      return false;
    }

    apply_common_fields(cfg, f);
    out = cfg;
    return true;
#else
    error = "YAML config requested but YAML support is disabled: " + path.string();
    return false;
#endif
  }

  error = "unknown config extension: " + path.string();
  return false;
}

EngineConfig load_engine_config(const std::filesystem::path& path) {
  EngineConfig cfg;
  std::string error;
  if (!load_engine_config(path, cfg, error)) {
    log::warn(error + "; using defaults");
  }
  return cfg;
}

std::filesystem::path find_engine_config(const std::filesystem::path& repo_root) {
  if (const char* env = std::getenv("TWIG_CONFIG")) {
    if (*env != '\0') {
      return std::filesystem::path(env);
    }
  }
  const auto yaml_path = repo_root / ".twig.yaml";
  if (file_exists(yaml_path)) {
    return yaml_path;
  }
  const auto json_path = repo_root / ".twig.json";
  if (file_exists(json_path)) {
    return json_path;
  }
  return {};
}

} // namespace twig
