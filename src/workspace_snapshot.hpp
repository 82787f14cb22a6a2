#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "ignore_rules.hpp"

class Logger;

struct FileRecord {
  std::string name;
  std::uint64_t size = 0;
  std::string hash;       // SHA-256, hex
  std::string full_path;  // absolute path on the sharing side

  bool operator==(const FileRecord& other) const {
    return name == other.name && size == other.size &&
           hash == other.hash && full_path == other.full_path;
  }
  bool operator!=(const FileRecord& other) const { return !(*this == other); }
};

struct DirectoryNode {
  std::string full_path;
  std::map<std::string, DirectoryNode> folders;
  std::map<std::string, FileRecord> files;

  bool operator==(const DirectoryNode& other) const {
    return full_path == other.full_path && folders == other.folders && files == other.files;
  }
  bool operator!=(const DirectoryNode& other) const { return !(*this == other); }

  // Looks up a file by workspace-relative path ("src/a.txt").
  const FileRecord* find_file(const std::string& relative_path) const;
  std::size_t file_count() const;
  bool empty() const { return folders.empty() && files.empty(); }
};

void to_json(nlohmann::json& j, const FileRecord& record);
void from_json(const nlohmann::json& j, FileRecord& record);
void to_json(nlohmann::json& j, const DirectoryNode& node);
void from_json(const nlohmann::json& j, DirectoryNode& node);

struct ChangeHistoryEntry {
  std::filesystem::path file_path;
  std::optional<FileRecord> previous;        // nullopt: file did not exist
  std::optional<std::string> previous_content;
  std::chrono::system_clock::time_point timestamp;
};

// Authoritative view of a shared directory.
//
// Scans honor the ignore rules, fingerprint every included file and keep a
// bounded cache of file contents (keyed by fingerprint) so that the change
// history can restore real bytes on rollback.
class WorkspaceSnapshot {
public:
  struct Options {
    std::vector<std::string> exclude;  // extra gitignore-style lines
    std::size_t content_cache_bytes = 64 * 1024 * 1024;
    std::shared_ptr<Logger> logger;
  };

  // Throws ConfigError when root is missing or not a directory.
  WorkspaceSnapshot(std::filesystem::path root, Options options);

  // One-shot scan with no caching or history.
  static DirectoryNode scan(const std::filesystem::path& root, const IgnoreRules& rules);

  // Loads the root .gitignore on top of the defaults and extra lines.
  static IgnoreRules rules_for(const std::filesystem::path& root,
                               const std::vector<std::string>& extra = {});

  // Re-scans and reports whether the structure differs from the last scan.
  bool detect_changes();

  // Re-fingerprints one file (or records its deletion) and appends the
  // previous state to the change history.
  void update(const std::filesystem::path& file);

  // Undoes the most recent update. False when there is nothing to undo or
  // the previous bytes are no longer known; the file is then left alone.
  bool rollback();

  DirectoryNode structure() const;
  nlohmann::json structure_json() const;
  std::vector<ChangeHistoryEntry> history() const;
  std::optional<FileRecord> record(const std::string& relative_path) const;

  // Containment check on normalized, symlink-resolved, component-wise paths.
  bool contains(const std::filesystem::path& path) const;
  // Resolves a requested path against the root; nullopt when it escapes.
  std::optional<std::filesystem::path> resolve_inside(const std::string& requested) const;

  const std::filesystem::path& root() const { return root_; }
  const IgnoreRules& rules() const { return rules_; }

private:
  class ContentCache {
  public:
    explicit ContentCache(std::size_t budget) : budget_(budget) {}
    void put(const std::string& hash, const std::string& bytes);
    std::optional<std::string> get(const std::string& hash) const;
    std::size_t size_bytes() const { return used_; }
  private:
    std::size_t budget_;
    std::size_t used_ = 0;
    std::unordered_map<std::string, std::string> entries_;
    std::deque<std::string> order_;
  };

  using RecordMap = std::map<std::string, FileRecord>;  // relative path -> record

  RecordMap scan_records(ContentCache* cache) const;
  static RecordMap scan_records(const std::filesystem::path& root,
                                const IgnoreRules& rules,
                                ContentCache* cache,
                                Logger* logger);
  static DirectoryNode build_structure(const std::filesystem::path& root, const RecordMap& records);
  static std::optional<FileRecord> fingerprint(const std::filesystem::path& root,
                                               const std::string& relative,
                                               ContentCache* cache);
  std::string relative_key(const std::filesystem::path& file) const;

  std::filesystem::path root_;
  IgnoreRules rules_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  RecordMap records_;
  DirectoryNode structure_;
  ContentCache cache_;
  std::vector<ChangeHistoryEntry> history_;
};
