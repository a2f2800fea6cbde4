#include "taptik/serialization.h"

#include "taptik/errors.h"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace taptik {
namespace fs = std::filesystem;

bool read_file(const fs::path& path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return !in.bad();
}

std::string read_file_or_throw(const fs::path& path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    throw NotFoundError("File not found: " + path.string());
  }
  std::string out;
  if (!read_file(path, out)) {
    throw FilesystemError(std::make_error_code(std::errc::permission_denied), "reading file", path);
  }
  return out;
}

bool write_file(const fs::path& path, const std::string& contents) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) return false;
  out << contents;
  return static_cast<bool>(out);
}

void write_file_atomic(const fs::path& path, const std::string& contents) {
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      throw FilesystemError(ec, "creating directory", path.parent_path());
    }
  }
  fs::path tmp = path;
  tmp += ".tmp";
  if (!write_file(tmp, contents)) {
    fs::remove(tmp, ec);
    throw FilesystemError(std::make_error_code(std::errc::io_error), "writing file", tmp);
  }
  fs::rename(tmp, path, ec);
  if (ec) {
    const std::error_code rename_ec = ec;
    fs::remove(tmp, ec);
    throw FilesystemError(rename_ec, "renaming file", path);
  }
}

nlohmann::json read_json_file(const fs::path& path) {
  const std::string text = read_file_or_throw(path);
  nlohmann::json doc = nlohmann::json::parse(text, nullptr, false);
  if (doc.is_discarded()) {
    throw ValidationError("Invalid JSON in " + path.string());
  }
  return doc;
}

void write_json_file(const fs::path& path, const nlohmann::json& doc) {
  write_file_atomic(path, doc.dump(2));
}

int64_t now_millis() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string millis_to_iso(int64_t millis) {
  const std::time_t secs = static_cast<std::time_t>(millis / 1000);
  const int ms = static_cast<int>(millis % 1000);
  std::tm tm{};
  gmtime_r(&secs, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(3) << std::setfill('0') << ms << "Z";
  return out.str();
}

std::string now_iso() {
  return millis_to_iso(now_millis());
}

int64_t file_time_to_millis(fs::file_time_type time) {
  using namespace std::chrono;
  const auto sys = time_point_cast<system_clock::duration>(time - fs::file_time_type::clock::now() +
                                                           system_clock::now());
  return duration_cast<milliseconds>(sys.time_since_epoch()).count();
}

fs::file_time_type millis_to_file_time(int64_t millis) {
  using namespace std::chrono;
  const auto sys = system_clock::time_point(milliseconds(millis));
  return time_point_cast<fs::file_time_type::duration>(sys - system_clock::now() +
                                                       fs::file_time_type::clock::now());
}

} // namespace taptik
