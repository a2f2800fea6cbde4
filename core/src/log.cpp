#include "taptik/log.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <ctime>
#include <deque>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace taptik::log {

namespace {
std::mutex g_log_mutex;
std::ofstream g_log_file;
std::deque<std::string> g_ring;
constexpr size_t kRingMax = 200;
std::string g_app_name = "taptik";
std::atomic<Level> g_level{Level::Info};

std::string format_now(const char* pattern) {
  using namespace std::chrono;
  const auto tt = system_clock::to_time_t(system_clock::now());
  std::tm tm{};
  localtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, pattern);
  return oss.str();
}

void log_line(Level lvl, const char* tag, std::string_view msg) {
  if (lvl < g_level.load()) return;
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const std::string line = "[" + format_now("%Y-%m-%d %H:%M:%S") + "][" + tag + "] " + std::string(msg);
  std::clog << line << "\n";
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
  g_app_name = "taptik";
  log_line(Level::Debug, "DEBUG", "log init (stderr only)");
}

void init(const std::string& app_name, const std::filesystem::path& root) {
  g_app_name = app_name;
  const std::filesystem::path log_dir = root / ".taptik" / "logs";
  std::error_code ec;
  std::filesystem::create_directories(log_dir, ec);
  if (ec) {
    log_line(Level::Warn, "WARN", "log directory unavailable: " + log_dir.string());
  } else {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    const std::string file_name = g_app_name + "_" + format_now("%Y%m%d_%H%M%S") + ".log";
    g_log_file.open(log_dir / file_name, std::ios::out | std::ios::app);
  }
  log_line(Level::Debug, "DEBUG", "log init");
#ifdef TAPTIK_DEBUG
  log_line(Level::Debug, "DEBUG", "build: debug");
#endif
}

void shutdown() {
  log_line(Level::Debug, "DEBUG", "log shutdown");
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (g_log_file.is_open()) {
    g_log_file.close();
  }
}

void set_level(Level lvl) {
  g_level.store(lvl);
}

Level level() {
  return g_level.load();
}

bool parse_level(const std::string& text, Level& out) {
  if (text == "debug") out = Level::Debug;
  else if (text == "info") out = Level::Info;
  else if (text == "warn" || text == "warning") out = Level::Warn;
  else if (text == "error") out = Level::Error;
  else return false;
  return true;
}

void debug(std::string_view msg) {
  log_line(Level::Debug, "DEBUG", msg);
}

void info(std::string_view msg) {
  log_line(Level::Info, "INFO", msg);
}

void warn(std::string_view msg) {
  log_line(Level::Warn, "WARN", msg);
}

void error(std::string_view msg) {
  log_line(Level::Error, "ERROR", msg);
}

std::vector<std::string> recent(size_t max_entries) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const size_t count = std::min(max_entries, g_ring.size());
  return std::vector<std::string>(g_ring.end() - static_cast<std::ptrdiff_t>(count), g_ring.end());
}

} // namespace taptik::log
