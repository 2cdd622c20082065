#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace twig::log {

void init();
// An empty log_dir keeps logging on stderr and the ring buffer only.
void init(const std::string& app_name, const std::filesystem::path& log_dir);
void shutdown();
void install_crash_handlers();

void info(std::string_view msg);
void warn(std::string_view msg);
void error(std::string_view msg);

std::vector<std::string> recent(size_t max_entries = 200);
std::filesystem::path current_file();

} // namespace twig::log
