#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace taptik::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

void init();
void init(const std::string& app_name, const std::filesystem::path& root);
void shutdown();

void set_level(Level level);
Level level();
bool parse_level(const std::string& text, Level& out);

void debug(std::string_view msg);
void info(std::string_view msg);
void warn(std::string_view msg);
void error(std::string_view msg);

std::vector<std::string> recent(size_t max_entries = 200);

} // namespace taptik::log
