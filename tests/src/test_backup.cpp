#include "taptik/backup.h"
#include "taptik/errors.h"
#include "taptik/log.h"

#include "test_util.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using taptik_test::check;
using taptik_test::read_text;
using taptik_test::write_text;

namespace {

void seed_source(const fs::path& source) {
  write_text(source / "a.txt", "alpha");
  write_text(source / "nested" / "b.json", "{\"b\":1}");
  write_text(source / ".hidden", "dotfile");
  write_text(source / "node_modules" / "dep.js", "ignored");
}

} // namespace

int main() {
  taptik::log::set_level(taptik::log::Level::Warn);
  int failures = 0;

  // Test: plain backup layout, metadata and verification.
  {
    taptik_test::TempDir dir("backup_plain");
    const fs::path source = dir.path / "source";
    seed_source(source);
    taptik::BackupRegistry registry(dir.path / "backups");
    registry.initialize();
    taptik::BackupManager manager(registry);

    const taptik::BackupMetadata m = manager.create_backup(source, "kiro");
    check(failures, m.id.rfind("backup_", 0) == 0, "backup id prefix");
    check(failures, m.artifact == "files" && !m.compressed && !m.encrypted, "plain artifact");
    check(failures, m.files == std::vector<std::string>{".hidden", "a.txt", "nested/b.json"},
          "files sorted with exclusions applied");
    check(failures, m.file_sizes.at("a.txt") == 5, "per-file size recorded");
    check(failures, fs::exists(m.backup_path / "metadata.json"), "metadata written beside backup");
    check(failures, m.checksum.size() == 64, "checksum recorded");
    check(failures, manager.verify_backup(m), "fresh backup verifies");

    taptik::BackupRegistry reloaded(dir.path / "backups");
    reloaded.initialize();
    const auto found = reloaded.find(m.id);
    check(failures, found && found->checksum == m.checksum && found->files == m.files, "registry reload");

    write_text(m.backup_path / "files" / "a.txt", "tampered");
    check(failures, !manager.verify_backup(m), "tampered backup fails verification");
    bool threw = false;
    try {
      manager.restore_backup(m.id, dir.path / "restore");
    } catch (const taptik::IntegrityError&) {
      threw = true;
    }
    check(failures, threw, "restore refuses corrupted backup");
  }

  // Test: hidden files can be excluded.
  {
    taptik_test::TempDir dir("backup_hidden");
    seed_source(dir.path / "source");
    taptik::BackupRegistry registry(dir.path / "backups");
    registry.initialize();
    taptik::BackupManager manager(registry);
    taptik::BackupOptions options;
    options.include_hidden = false;
    const auto m = manager.create_backup(dir.path / "source", "kiro", options);
    check(failures, m.files == std::vector<std::string>{"a.txt", "nested/b.json"}, "hidden excluded");
  }

  // Test: restore skips files that changed since the backup.
  {
    taptik_test::TempDir dir("backup_skip");
    const fs::path source = dir.path / "source";
    write_text(source / "a.txt", "original");
    taptik::BackupRegistry registry(dir.path / "backups");
    registry.initialize();
    taptik::BackupManager manager(registry);
    const auto m = manager.create_backup(source, "claude-code");

    const fs::path target = dir.path / "target";
    write_text(target / "a.txt", "edited by the user");
    fs::last_write_time(target / "a.txt", fs::last_write_time(source / "a.txt") + std::chrono::hours(1));

    const taptik::RestoreResult result = manager.restore_backup(m.id, target);
    check(failures, result.success, "skip restore succeeds");
    check(failures, result.skipped_files == std::vector<std::string>{"a.txt"}, "conflicting file skipped");
    check(failures, result.restored_files.empty(), "nothing restored");
    check(failures, result.conflicts.size() == 1 && result.conflicts[0].reason == "newer" &&
                        result.conflicts[0].resolution == "skip",
          "conflict recorded as newer");
    check(failures, read_text(target / "a.txt") == "edited by the user", "target left alone");

    taptik::RestoreOptions overwrite;
    overwrite.conflict_strategy = taptik::ConflictStrategy::Overwrite;
    const auto forced = manager.restore_backup(m.id, target, overwrite);
    check(failures, forced.restored_files == std::vector<std::string>{"a.txt"}, "overwrite restores");
    check(failures, forced.conflicts.size() == 1 && forced.conflicts[0].resolution == "overwrite",
          "overwrite conflict recorded");
    check(failures, read_text(target / "a.txt") == "original", "target replaced");

    taptik::RestoreOptions merge;
    merge.conflict_strategy = taptik::ConflictStrategy::Merge;
    write_text(target / "a.txt", "changed again, longer");
    const auto merged = manager.restore_backup(m.id, target, merge);
    check(failures, merged.skipped_files.size() == 1 && merged.conflicts.size() == 1, "merge degrades to skip");

    taptik::RestoreOptions dry;
    dry.overwrite = true;
    dry.dry_run = true;
    const auto preview = manager.restore_backup(m.id, target, dry);
    check(failures, preview.restored_files.size() == 1, "dry run reports restore");
    check(failures, read_text(target / "a.txt") == "changed again, longer", "dry run writes nothing");
  }

  // Test: compressed and encrypted backups restore to the same content.
  {
    taptik_test::TempDir dir("backup_sealed");
    const fs::path source = dir.path / "source";
    seed_source(source);
    taptik::BackupRegistry registry(dir.path / "backups");
    registry.initialize();
    taptik::BackupManager manager(registry);

    taptik::BackupOptions options;
    options.compress = true;
    options.encrypt = true;
    options.encryption_key = "correct horse";
    const auto m = manager.create_backup(source, "kiro", options);
    check(failures, m.artifact == "archive.tar.gz.enc" && m.compressed && m.encrypted, "sealed artifact");
    check(failures, !fs::exists(m.backup_path / "files"), "loose files removed");
    check(failures, manager.verify_backup(m), "sealed backup verifies");

    bool threw = false;
    try {
      manager.restore_backup(m.id, dir.path / "restore");
    } catch (const taptik::ValidationError&) {
      threw = true;
    }
    check(failures, threw, "missing key rejected");

    taptik::RestoreOptions restore;
    restore.decryption_key = "correct horse";
    const auto result = manager.restore_backup(m.id, dir.path / "restore", restore);
    check(failures, result.success && result.restored_files.size() == 3, "sealed restore");
    check(failures, read_text(dir.path / "restore" / "nested" / "b.json") == "{\"b\":1}", "content restored");

    taptik::BackupOptions compress_only;
    compress_only.compress = true;
    const auto gz = manager.create_backup(source, "kiro", compress_only);
    check(failures, gz.artifact == "archive.tar.gz", "compressed artifact");
    const auto plain = manager.restore_backup(gz.id, dir.path / "restore_gz");
    check(failures, plain.success && read_text(dir.path / "restore_gz" / "a.txt") == "alpha", "gzip restore");

    threw = false;
    try {
      taptik::BackupOptions keyless;
      keyless.encrypt = true;
      manager.create_backup(source, "kiro", keyless);
    } catch (const taptik::ValidationError&) {
      threw = true;
    }
    check(failures, threw, "encryption without key rejected");
  }

  // Test: retention, listing, deletion and comparison.
  {
    taptik_test::TempDir dir("backup_retention");
    const fs::path source = dir.path / "source";
    write_text(source / "a.txt", "one");
    taptik::BackupRegistry registry(dir.path / "backups");
    registry.initialize();
    taptik::BackupManager manager(registry);

    taptik::BackupOptions options;
    options.max_backups = 2;
    const auto first = manager.create_backup(source, "kiro", options);
    const auto second = manager.create_backup(source, "kiro", options);
    const auto third = manager.create_backup(source, "kiro", options);
    manager.create_backup(source, "claude-code");

    const auto kiro = manager.list_backups("kiro");
    check(failures, kiro.size() == 2, "retention keeps two");
    check(failures, kiro.size() == 2 && kiro[0].id == third.id && kiro[1].id == second.id, "newest first");
    check(failures, !registry.find(first.id).has_value() && !fs::exists(first.backup_path), "oldest deleted");
    check(failures, manager.list_backups().size() == 3, "list spans platforms");
    check(failures, manager.list_backups({}, 1).size() == 1, "list limit");

    write_text(source / "a.txt", "one plus more");
    write_text(source / "new.txt", "fresh");
    const auto diff = manager.compare_with_current(third.id, source);
    check(failures, !diff.identical, "comparison sees changes");
    check(failures, diff.modified == std::vector<std::string>{"a.txt"}, "size change is a modification");
    check(failures, diff.added == std::vector<std::string>{"new.txt"}, "new file added");

    check(failures, manager.delete_backup(second.id), "delete existing backup");
    check(failures, !manager.delete_backup(second.id), "delete twice fails");

    bool threw = false;
    try {
      manager.restore_backup("backup_missing", dir.path / "restore");
    } catch (const taptik::NotFoundError&) {
      threw = true;
    }
    check(failures, threw, "unknown id raises NotFoundError");
  }

  // Test: include paths limit the backup to selected files and directories.
  {
    taptik_test::TempDir dir("backup_include");
    const fs::path source = dir.path / "source";
    seed_source(source);
    write_text(source / "CLAUDE.md", "rules");
    taptik::BackupRegistry registry(dir.path / "backups");
    registry.initialize();
    taptik::BackupManager manager(registry);

    taptik::BackupOptions options;
    options.include_paths = {"nested", "CLAUDE.md", "missing.txt"};
    const auto m = manager.create_backup(source, "claude-code", options);
    check(failures, m.files == std::vector<std::string>{"CLAUDE.md", "nested/b.json"}, "only included paths");
    check(failures, m.source_path == fs::absolute(source), "paths stay relative to the source");

    const auto restored = manager.restore_backup(m.id, dir.path / "restore");
    check(failures, restored.success && restored.restored_files.size() == 2, "selected files restored");
    check(failures, read_text(dir.path / "restore" / "CLAUDE.md") == "rules", "root file restored in place");
    check(failures, !fs::exists(dir.path / "restore" / "a.txt"), "unselected files left out");
  }

  // Test: concurrent backups on one manager get distinct ids.
  {
    taptik_test::TempDir dir("backup_concurrent");
    const fs::path source = dir.path / "source";
    seed_source(source);
    taptik::BackupRegistry registry(dir.path / "backups");
    registry.initialize();
    taptik::BackupManager manager(registry);

    constexpr int kThreads = 4;
    constexpr int kPerThread = 5;
    std::vector<std::vector<taptik::BackupMetadata>> made(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
      threads.emplace_back([&manager, &source, &made, t]() {
        for (int i = 0; i < kPerThread; ++i) {
          made[t].push_back(manager.create_backup(source, "kiro"));
        }
      });
    }
    for (auto& t : threads) t.join();

    std::set<std::string> ids;
    std::set<int64_t> stamps;
    for (const auto& batch : made) {
      for (const auto& m : batch) {
        ids.insert(m.id);
        stamps.insert(m.timestamp_ms);
      }
    }
    check(failures, ids.size() == kThreads * kPerThread, "ids unique across threads");
    check(failures, stamps.size() == kThreads * kPerThread, "timestamps strictly increasing across threads");
    check(failures, manager.list_backups("kiro").size() == kThreads * kPerThread, "all backups registered");
  }

  // Test: strategy names.
  {
    check(failures, taptik::conflict_strategy_from_string("overwrite") == taptik::ConflictStrategy::Overwrite,
          "overwrite parses");
    bool threw = false;
    try {
      taptik::conflict_strategy_from_string("clobber");
    } catch (const taptik::ValidationError&) {
      threw = true;
    }
    check(failures, threw, "unknown strategy rejected");
  }

  if (failures == 0) {
    std::cout << "test_backup: ok\n";
  }
  return failures == 0 ? 0 : 1;
}
