#include "twig/log.h"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

#include <unistd.h>

namespace twig::log {

namespace {
std::mutex g_log_mutex;
std::ofstream g_log_file;
std::filesystem::path g_log_path;
std::deque<std::string> g_ring;
constexpr size_t kRingMax = 200;
std::string g_app_name = "twig";

std::string timestamp_now() {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const auto tt = system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

std::string timestamp_for_filename() {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const auto tt = system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
  return oss.str();
}

void log_line(const char* level, std::string_view msg) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const std::string line = "[" + timestamp_now() + "][" + level + "] " + std::string(msg);
  // stdout carries command results.
  std::cerr << line << "\n";
  if (g_log_file.is_open()) {
    g_log_file << line << "\n";
    g_log_file.flush();
  }
  g_ring.push_back(line);
  if (g_ring.size() > kRingMax) {
    g_ring.pop_front();
  }
}
} // namespace

void init() {
  init("twig", std::filesystem::path());
}

void init(const std::string& app_name, const std::filesystem::path& log_dir) {
  {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_app_name = app_name;
    if (g_log_file.is_open()) {
      g_log_file.close();
    }
    g_log_path.clear();
    if (!log_dir.empty()) {
      std::error_code ec;
      std::filesystem::create_directories(log_dir, ec);
      const std::string file_name =
          g_app_name + "_" + timestamp_for_filename() + "_" + std::to_string(::getpid()) + ".log";
      g_log_path = log_dir / file_name;
      g_log_file.open(g_log_path, std::ios::out | std::ios::app);
      if (!g_log_file.is_open()) {
        g_log_path.clear();
      }
    }
  }
  log_line("INFO", "log init");
#ifdef TWIG_DEBUG
  log_line("INFO", "build: debug");
#endif
#ifdef TWIG_GIT_HASH
  log_line("INFO", std::string("git: ") + TWIG_GIT_HASH);
#endif
}

void shutdown() {
  log_line("INFO", "log shutdown");
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (g_log_file.is_open()) {
    g_log_file.close();
  }
}

void info(std::string_view msg) {
  log_line("INFO", msg);
}

void warn(std::string_view msg) {
  log_line("WARN", msg);
}

void error(std::string_view msg) {
  log_line("ERROR", msg);
}

std::vector<std::string> recent(size_t max_entries) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const size_t count = std::min(max_entries, g_ring.size());
  return std::vector<std::string>(g_ring.end() - count, g_ring.end());
}

std::filesystem::path current_file() {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  return g_log_path;
}

namespace {
void signal_handler(int sig) {
  log_line("ERROR", std::string("crash signal: ") + std::to_string(sig));
  std::_Exit(1);
}
} // namespace

void install_crash_handlers() {
  std::signal(SIGSEGV, signal_handler);
  std::signal(SIGABRT, signal_handler);
  std::signal(SIGFPE, signal_handler);
  std::signal(SIGILL, signal_handler);
}

} // namespace twig::log
