#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace taptik {

// Returns false when the file cannot be opened.
bool read_file(const std::filesystem::path& path, std::string& out);
// Throws NotFoundError when missing, FilesystemError on read failure.
std::string read_file_or_throw(const std::filesystem::path& path);

bool write_file(const std::filesystem::path& path, const std::string& contents);
// Writes through a sibling temp file and renames it into place, creating
// parent directories. Throws FilesystemError.
void write_file_atomic(const std::filesystem::path& path, const std::string& contents);

// Throws NotFoundError, or ValidationError when the text is not JSON.
nlohmann::json read_json_file(const std::filesystem::path& path);
void write_json_file(const std::filesystem::path& path, const nlohmann::json& doc);

// UTC, millisecond precision, e.g. 2024-01-01T00:00:00.000Z.
std::string now_iso();
std::string millis_to_iso(int64_t millis);
int64_t now_millis();

int64_t file_time_to_millis(std::filesystem::file_time_type time);
std::filesystem::file_time_type millis_to_file_time(int64_t millis);

} // namespace taptik
