#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace twig {

struct ProcessResult {
  bool started = false;
  int exit_code = -1;
  std::string out;
  std::string err;
  std::string error_message;

  bool ok() const { return started && exit_code == 0; }
};

using EnvOverrides = std::vector<std::pair<std::string, std::string>>;

// Runs a child to completion with stdin on /dev/null, capturing stdout and stderr.
class ProcessRunner {
 public:
  ProcessRunner() = default;

  ProcessResult run(const std::vector<std::string>& args,
                    const std::filesystem::path& cwd,
                    const EnvOverrides& env = {}) const;
};

} // namespace twig
