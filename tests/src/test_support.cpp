#include "taptik/config.h"
#include "taptik/errors.h"
#include "taptik/glob.h"
#include "taptik/log.h"
#include "taptik/parallel.h"
#include "taptik/paths.h"
#include "taptik/serialization.h"
#include "taptik/tar_archive.h"

#include "test_util.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;
using json = nlohmann::json;
using taptik_test::check;
using taptik_test::read_text;
using taptik_test::write_text;

int main() {
  taptik::log::set_level(taptik::log::Level::Warn);
  int failures = 0;

  // Test: config defaults, yaml and json.
  {
    taptik_test::TempDir dir("config");
    const taptik::TaptikConfig defaults = taptik::load_taptik_config(dir.path / "missing.yaml");
    check(failures, defaults.package.compression == taptik::CompressionAlgorithm::Gzip, "default compression");
    check(failures, defaults.package.max_package_size == 50ull * 1024 * 1024, "default size limit");
    check(failures, defaults.deploy.max_concurrency == 3 && defaults.deploy.batch_size == 5, "deploy defaults");

    write_text(dir.path / "config.yaml",
               "taptik:\n"
               "  package:\n"
               "    compression: brotli\n"
               "    include_sha512: true\n"
               "  backup:\n"
               "    max_backups: 4\n"
               "    exclude_patterns: [\"**/*.tmp\"]\n"
               "  deploy:\n"
               "    max_concurrency: 8\n"
               "  log:\n"
               "    level: debug\n");
    const auto yaml = taptik::load_taptik_config(dir.path / "config.yaml");
    check(failures, yaml.package.compression == taptik::CompressionAlgorithm::Brotli, "yaml compression");
    check(failures, yaml.package.include_sha512, "yaml sha512");
    check(failures, yaml.backup.max_backups == 4, "yaml max backups");
    check(failures, yaml.backup.exclude_patterns == std::vector<std::string>{"**/*.tmp"}, "yaml patterns");
    check(failures, yaml.deploy.max_concurrency == 8 && yaml.deploy.batch_size == 5, "yaml deploy");
    check(failures, yaml.log_level == taptik::log::Level::Debug, "yaml log level");

    write_text(dir.path / "config.json", R"({"package":{"compression":"lz4","optimize_size":true},"deploy":{"backup":false}})");
    const auto j = taptik::load_taptik_config(dir.path / "config.json");
    check(failures, j.package.compression == taptik::CompressionAlgorithm::Gzip, "unknown compression keeps gzip");
    check(failures, j.package.optimize_size && !j.deploy.backup, "json fields applied");

    write_text(dir.path / "broken.json", "{ not json");
    bool threw = false;
    try {
      taptik::load_taptik_config(dir.path / "broken.json");
    } catch (const taptik::ValidationError&) {
      threw = true;
    }
    check(failures, threw, "malformed config rejected");
  }

  // Test: path resolution.
  {
    taptik_test::TempDir dir("paths");
    if (!std::getenv("TAPTIK_HOME")) {
      const auto paths = taptik::resolve_paths(dir.path);
      check(failures, paths.workdir == fs::absolute(dir.path), "override used");
      check(failures, paths.backups_dir == paths.workdir / ".taptik" / "backups", "backups under state dir");
      check(failures, paths.config_file.filename() == "config.yaml", "config file name");
    }
  }

  // Test: glob patterns.
  {
    check(failures, taptik::glob_match("**/node_modules/**", "web/node_modules/x/index.js"), "nested dir glob");
    check(failures, taptik::glob_match("**/node_modules/**", "node_modules/index.js"), "zero-dir prefix");
    check(failures, taptik::glob_match("**/*.log", "debug.log"), "root level log");
    check(failures, taptik::glob_match("*.md", "README.md") && !taptik::glob_match("*.md", "docs/README.md"),
          "star stays within a segment");
    check(failures, taptik::glob_match("file?.txt", "file1.txt") && !taptik::glob_match("file?.txt", "file10.txt"),
          "question mark");
    check(failures, taptik::matches_any(taptik::default_exclude_patterns(), "a/.git/config"), "default excludes");
    check(failures, !taptik::matches_any(taptik::default_exclude_patterns(), "src/main.cpp"), "sources kept");
  }

  // Test: filesystem error classification.
  {
    const auto denied =
        taptik::classify_filesystem_error(std::make_error_code(std::errc::permission_denied), "writing", "/etc/x");
    check(failures, denied.is_critical && !denied.should_continue, "permission denied is critical");
    check(failures, denied.user_message.find("Permission denied") != std::string::npos, "permission message");
    const auto missing = taptik::classify_filesystem_error(
        std::make_error_code(std::errc::no_such_file_or_directory), "reading", "/tmp/missing");
    check(failures, !missing.is_critical && missing.should_continue, "not found continues");
    const auto full =
        taptik::classify_filesystem_error(std::make_error_code(std::errc::no_space_on_device), "writing", "/tmp/x");
    check(failures, std::find(full.suggestions.begin(), full.suggestions.end(), "Check disk usage with: df -h") !=
                        full.suggestions.end(),
          "disk full suggestion");
    const taptik::FilesystemError error(std::make_error_code(std::errc::read_only_file_system), "writing", "/ro");
    check(failures, error.kind() == taptik::ErrorKind::Filesystem && error.is_critical() && !error.suggestions().empty(),
          "filesystem error carries classification");
  }

  // Test: log ring keeps recent lines.
  {
    taptik::log::set_level(taptik::log::Level::Debug);
    taptik::log::info("ring marker one");
    taptik::log::debug("ring marker two");
    const auto lines = taptik::log::recent(2);
    check(failures, lines.size() == 2, "recent returns requested count");
    check(failures, lines.size() == 2 && lines[0].find("[INFO] ring marker one") != std::string::npos &&
                        lines[1].find("[DEBUG] ring marker two") != std::string::npos,
          "log line format");
    taptik::log::set_level(taptik::log::Level::Error);
    taptik::log::warn("filtered out");
    check(failures, taptik::log::recent(1).back().find("filtered out") == std::string::npos, "level filter");
    taptik::log::Level parsed = taptik::log::Level::Info;
    check(failures, taptik::log::parse_level("warning", parsed) && parsed == taptik::log::Level::Warn, "parse level");
    taptik::log::set_level(taptik::log::Level::Warn);
  }

  // Test: timestamps and atomic writes.
  {
    check(failures, taptik::millis_to_iso(0) == "1970-01-01T00:00:00.000Z", "epoch iso");
    check(failures, taptik::millis_to_iso(1704067200123) == "2024-01-01T00:00:00.123Z", "millisecond iso");
    taptik_test::TempDir dir("serialization");
    taptik::write_json_file(dir.path / "deep" / "doc.json", json{{"a", 1}});
    check(failures, taptik::read_json_file(dir.path / "deep" / "doc.json")["a"] == 1, "json file round trip");
    check(failures, !fs::exists(dir.path / "deep" / "doc.json.tmp"), "temp file renamed away");
    bool threw = false;
    try {
      taptik::read_file_or_throw(dir.path / "nope");
    } catch (const taptik::NotFoundError&) {
      threw = true;
    }
    check(failures, threw, "missing file raises NotFoundError");
  }

  // Test: ustar archives.
  {
    taptik_test::TempDir dir("tar");
    const fs::path src = dir.path / "src";
    write_text(src / "top.txt", "top");
    const std::string long_dir = std::string(60, 'a') + "/" + std::string(60, 'b');
    write_text(src / long_dir / "deep.txt", "deep");
    taptik::create_tar_gz(src, dir.path / "out.tar.gz");
    const size_t count = taptik::extract_tar_gz(dir.path / "out.tar.gz", dir.path / "dst");
    check(failures, count >= 2, "entries extracted");
    check(failures, read_text(dir.path / "dst" / "top.txt") == "top", "file content extracted");
    check(failures, read_text(dir.path / "dst" / long_dir / "deep.txt") == "deep", "long path uses prefix field");

    taptik::TarWriter writer;
    writer.add_file("../escape.txt", "x", 0);
    bool threw = false;
    try {
      taptik::extract_tar_bytes(writer.finish(), dir.path / "evil");
    } catch (const taptik::ValidationError&) {
      threw = true;
    }
    check(failures, threw && !fs::exists(dir.path / "escape.txt"), "path traversal refused");

    taptik::TarWriter single;
    single.add_file("a.txt", "hello", 1700000000);
    std::string bytes = single.finish();
    const auto entries = taptik::read_tar(bytes);
    check(failures, entries.size() == 1 && entries[0].data == "hello" && entries[0].mtime == 1700000000,
          "tar entry read back");
    bytes[0] = 'b';
    threw = false;
    try {
      taptik::read_tar(bytes);
    } catch (const taptik::ValidationError&) {
      threw = true;
    }
    check(failures, threw, "header checksum verified");
  }

  // Test: parallel batches.
  {
    std::atomic<int> ran{0};
    std::vector<taptik::ParallelOperation> ops;
    for (int i = 0; i < 12; ++i) {
      ops.push_back({"op" + std::to_string(i), "write", [&ran, i]() {
                       if (i == 5) throw std::runtime_error("disk on fire");
                       ++ran;
                     }});
    }
    taptik::ParallelOptions options;
    options.max_concurrency = 3;
    options.batch_size = 5;
    const auto result = taptik::ParallelBatchProcessor(options).run(ops);
    check(failures, result.total_batches == 3 && result.total_operations == 12, "batch accounting");
    check(failures, result.succeeded == 11 && result.failed == 1 && ran == 11, "failure isolated");
    check(failures, !result.success && result.errors.size() == 1 && result.errors[0].id == "op5" &&
                        result.errors[0].message == "disk on fire",
          "error recorded");
    check(failures, result.completed.size() == 11, "completions recorded");

    std::atomic<int> dry_ran{0};
    std::vector<taptik::ParallelOperation> dry_ops = {{"a", "write", [&dry_ran]() { ++dry_ran; }}};
    taptik::ParallelOptions dry;
    dry.dry_run = true;
    const auto preview = taptik::ParallelBatchProcessor(dry).run(dry_ops);
    check(failures, dry_ran == 0 && preview.total_operations == 1, "dry run executes nothing");

    taptik::ParallelOptions zero;
    zero.max_concurrency = 0;
    zero.batch_size = 0;
    const taptik::ParallelBatchProcessor clamped(zero);
    check(failures, clamped.options().max_concurrency == 1 && clamped.options().batch_size == 1, "options clamped");

    // Threads started before a failure are joined, not abandoned.
    std::atomic<int> finished{0};
    bool caught = false;
    try {
      taptik::ThreadJoiner joiner;
      for (int i = 0; i < 3; ++i) {
        joiner.spawn([&finished]() {
          std::this_thread::sleep_for(std::chrono::milliseconds(20));
          ++finished;
        });
      }
      throw std::runtime_error("spawn failed");
    } catch (const std::runtime_error&) {
      caught = true;
    }
    check(failures, caught && finished == 3, "joiner waits for started threads on unwind");
  }

  if (failures == 0) {
    std::cout << "test_support: ok\n";
  }
  return failures == 0 ? 0 : 1;
}
