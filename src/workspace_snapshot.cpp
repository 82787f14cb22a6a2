#include "workspace_snapshot.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

std::vector<std::string> split_relative(const std::string& relative) {
  std::vector<std::string> parts;
  std::size_t start = 0;
  while(start <= relative.size()) {
    auto pos = relative.find('/', start);
    if(pos == std::string::npos) pos = relative.size();
    if(pos > start) parts.push_back(relative.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

// Component-wise prefix test; "/work/app2" is not inside "/work/app".
bool is_within(const fs::path& root, const fs::path& candidate) {
  auto r = root.begin();
  auto c = candidate.begin();
  for(; r != root.end(); ++r, ++c) {
    if(c == candidate.end() || *r != *c) return false;
  }
  return true;
}

} // namespace

const FileRecord* DirectoryNode::find_file(const std::string& relative_path) const {
  auto parts = split_relative(relative_path);
  if(parts.empty()) return nullptr;
  const DirectoryNode* node = this;
  for(std::size_t i = 0; i + 1 < parts.size(); ++i) {
    auto it = node->folders.find(parts[i]);
    if(it == node->folders.end()) return nullptr;
    node = &it->second;
  }
  auto it = node->files.find(parts.back());
  return it == node->files.end() ? nullptr : &it->second;
}

std::size_t DirectoryNode::file_count() const {
  std::size_t count = files.size();
  for(const auto& folder : folders) count += folder.second.file_count();
  return count;
}

void to_json(nlohmann::json& j, const FileRecord& record) {
  j = nlohmann::json{
    {"name", record.name},
    {"size", record.size},
    {"hash", record.hash},
    {"fullPath", record.full_path}
  };
}

void from_json(const nlohmann::json& j, FileRecord& record) {
  record.name = j.at("name").get<std::string>();
  record.size = j.value("size", std::uint64_t{0});
  record.hash = j.value("hash", std::string());
  record.full_path = j.value("fullPath", std::string());
}

void to_json(nlohmann::json& j, const DirectoryNode& node) {
  j = nlohmann::json::object();
  if(!node.full_path.empty()) j["fullPath"] = node.full_path;
  if(!node.folders.empty()) {
    auto& folders = j["folders"];
    folders = nlohmann::json::object();
    for(const auto& [name, child] : node.folders) folders[name] = child;
  }
  if(!node.files.empty()) {
    auto& files = j["files"];
    files = nlohmann::json::object();
    for(const auto& [name, record] : node.files) files[name] = record;
  }
}

void from_json(const nlohmann::json& j, DirectoryNode& node) {
  if(!j.is_object()) {
    throw ProtocolError("directory snapshot must be a JSON object");
  }
  node.full_path = j.value("fullPath", std::string());
  node.folders.clear();
  node.files.clear();
  if(j.contains("folders")) {
    for(const auto& item : j.at("folders").items()) {
      node.folders[item.key()] = item.value().get<DirectoryNode>();
    }
  }
  if(j.contains("files")) {
    for(const auto& item : j.at("files").items()) {
      node.files[item.key()] = item.value().get<FileRecord>();
    }
  }
}

void WorkspaceSnapshot::ContentCache::put(const std::string& hash, const std::string& bytes) {
  if(bytes.size() > budget_ || entries_.count(hash)) return;
  while(used_ + bytes.size() > budget_ && !order_.empty()) {
    auto it = entries_.find(order_.front());
    if(it != entries_.end()) {
      used_ -= it->second.size();
      entries_.erase(it);
    }
    order_.pop_front();
  }
  entries_.emplace(hash, bytes);
  order_.push_back(hash);
  used_ += bytes.size();
}

std::optional<std::string> WorkspaceSnapshot::ContentCache::get(const std::string& hash) const {
  auto it = entries_.find(hash);
  if(it == entries_.end()) return std::nullopt;
  return it->second;
}

WorkspaceSnapshot::WorkspaceSnapshot(fs::path root, Options options)
  : logger_(options.logger ? std::move(options.logger) : logger_for("workspace")),
    cache_(options.content_cache_bytes) {
  std::error_code ec;
  if(root.empty() || !fs::is_directory(root, ec)) {
    throw ConfigError("workspace root '" + root.string() + "' is not a directory");
  }
  root_ = fs::canonical(root, ec);
  if(ec) {
    throw ConfigError("cannot resolve workspace root '" + root.string() + "': " + ec.message());
  }
  rules_ = rules_for(root_, options.exclude);
  records_ = scan_records(&cache_);
  structure_ = build_structure(root_, records_);
  logger_->info("Tracking {} files under {}", records_.size(), root_.string());
}

IgnoreRules WorkspaceSnapshot::rules_for(const fs::path& root, const std::vector<std::string>& extra) {
  auto rules = IgnoreRules::with_defaults();
  rules.load_file(root / ".gitignore");
  for(const auto& line : extra) rules.add_line(line);
  return rules;
}

DirectoryNode WorkspaceSnapshot::scan(const fs::path& root, const IgnoreRules& rules) {
  return build_structure(root, scan_records(root, rules, nullptr, nullptr));
}

WorkspaceSnapshot::RecordMap WorkspaceSnapshot::scan_records(ContentCache* cache) const {
  return scan_records(root_, rules_, cache, logger_.get());
}

WorkspaceSnapshot::RecordMap WorkspaceSnapshot::scan_records(const fs::path& root,
                                                             const IgnoreRules& rules,
                                                             ContentCache* cache,
                                                             Logger* logger) {
  RecordMap records;
  std::vector<fs::path> pending{root};
  while(!pending.empty()) {
    fs::path dir = std::move(pending.back());
    pending.pop_back();

    std::error_code ec;
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if(ec) {
      log_to(logger, LogChannel::Warn, "Cannot list {}: {}", dir.string(), ec.message());
      continue;
    }
    for(const auto& entry : it) {
      std::string relative = entry.path().lexically_relative(root).generic_string();
      std::error_code status_ec;
      bool is_symlink = entry.is_symlink(status_ec);
      bool is_dir = entry.is_directory(status_ec);
      if(rules.ignores(relative, is_dir)) continue;
      if(is_dir) {
        if(!is_symlink) pending.push_back(entry.path());
        continue;
      }
      if(!entry.is_regular_file(status_ec)) continue;
      auto record = fingerprint(root, relative, cache);
      if(!record) {
        log_to(logger, LogChannel::Warn, "Cannot fingerprint {}", relative);
        continue;
      }
      records.emplace(relative, std::move(*record));
    }
  }
  return records;
}

std::optional<FileRecord> WorkspaceSnapshot::fingerprint(const fs::path& root,
                                                         const std::string& relative,
                                                         ContentCache* cache) {
  fs::path full = root / fs::path(relative);
  std::error_code ec;
  auto size = fs::file_size(full, ec);
  if(ec) return std::nullopt;

  FileRecord record;
  record.name = full.filename().string();
  record.size = size;
  record.full_path = full.generic_string();

  if(cache) {
    auto bytes = read_file_bytes(full);
    if(!bytes) return std::nullopt;
    record.size = bytes->size();
    record.hash = sha256_hex(*bytes);
    cache->put(record.hash, *bytes);
    return record;
  }
  auto hash = sha256_file(full);
  if(!hash) return std::nullopt;
  record.hash = std::move(*hash);
  return record;
}

DirectoryNode WorkspaceSnapshot::build_structure(const fs::path& root, const RecordMap& records) {
  DirectoryNode tree;
  tree.full_path = root.generic_string();
  for(const auto& [relative, record] : records) {
    auto parts = split_relative(relative);
    if(parts.empty()) continue;
    DirectoryNode* node = &tree;
    fs::path folder_path = root;
    for(std::size_t i = 0; i + 1 < parts.size(); ++i) {
      folder_path /= parts[i];
      auto& child = node->folders[parts[i]];
      if(child.full_path.empty()) child.full_path = folder_path.generic_string();
      node = &child;
    }
    node->files[parts.back()] = record;
  }
  return tree;
}

bool WorkspaceSnapshot::detect_changes() {
  auto fresh = scan_records(root_, rules_, nullptr, logger_.get());
  std::lock_guard<std::mutex> lock(mutex_);
  // Only newly seen content needs reading again for the cache.
  for(const auto& [relative, record] : fresh) {
    if(!cache_.get(record.hash)) {
      if(auto bytes = read_file_bytes(root_ / fs::path(relative))) {
        if(sha256_hex(*bytes) == record.hash) cache_.put(record.hash, *bytes);
      }
    }
  }
  auto tree = build_structure(root_, fresh);
  bool changed = (tree != structure_);
  records_ = std::move(fresh);
  structure_ = std::move(tree);
  if(changed) {
    logger_->debug("Workspace changed, {} files tracked", records_.size());
  }
  return changed;
}

std::string WorkspaceSnapshot::relative_key(const fs::path& file) const {
  fs::path absolute = file.is_absolute() ? file : root_ / file;
  return absolute.lexically_normal().lexically_relative(root_).generic_string();
}

void WorkspaceSnapshot::update(const fs::path& file) {
  if(!contains(file)) {
    throw AuthorizationError("'" + file.string() + "' is outside the workspace");
  }
  const std::string key = relative_key(file);

  std::lock_guard<std::mutex> lock(mutex_);
  ChangeHistoryEntry entry;
  entry.file_path = root_ / fs::path(key);
  entry.timestamp = std::chrono::system_clock::now();
  auto existing = records_.find(key);
  if(existing != records_.end()) {
    entry.previous = existing->second;
    entry.previous_content = cache_.get(existing->second.hash);
  }

  std::error_code ec;
  if(fs::exists(entry.file_path, ec)) {
    auto record = fingerprint(root_, key, &cache_);
    if(!record) {
      throw TightropeError("cannot fingerprint '" + key + "'");
    }
    records_[key] = std::move(*record);
  } else {
    records_.erase(key);
  }
  history_.push_back(std::move(entry));
  structure_ = build_structure(root_, records_);
}

bool WorkspaceSnapshot::rollback() {
  std::lock_guard<std::mutex> lock(mutex_);
  if(history_.empty()) return false;
  ChangeHistoryEntry entry = std::move(history_.back());
  history_.pop_back();
  const std::string key = entry.file_path.lexically_relative(root_).generic_string();

  if(entry.previous) {
    if(!entry.previous_content) {
      logger_->warn("Cannot roll back {}: previous content is not retained", key);
      return false;
    }
    if(!write_file_bytes(entry.file_path, *entry.previous_content)) {
      logger_->error("Cannot roll back {}: write failed", key);
      return false;
    }
    records_[key] = *entry.previous;
  } else {
    std::error_code ec;
    fs::remove(entry.file_path, ec);
    if(ec) {
      logger_->error("Cannot roll back {}: {}", key, ec.message());
      return false;
    }
    records_.erase(key);
  }
  structure_ = build_structure(root_, records_);
  logger_->info("Rolled back {}", key);
  return true;
}

DirectoryNode WorkspaceSnapshot::structure() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return structure_;
}

nlohmann::json WorkspaceSnapshot::structure_json() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return structure_;
}

std::vector<ChangeHistoryEntry> WorkspaceSnapshot::history() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return history_;
}

std::optional<FileRecord> WorkspaceSnapshot::record(const std::string& relative_path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(relative_path);
  if(it == records_.end()) return std::nullopt;
  return it->second;
}

bool WorkspaceSnapshot::contains(const fs::path& path) const {
  if(path.empty()) return false;
  fs::path absolute = path.is_absolute() ? path : root_ / path;
  std::error_code ec;
  fs::path resolved = fs::weakly_canonical(absolute, ec);
  if(ec) return false;
  return is_within(root_, resolved);
}

std::optional<fs::path> WorkspaceSnapshot::resolve_inside(const std::string& requested) const {
  if(requested.empty()) return std::nullopt;
  fs::path candidate(requested);
  if(!contains(candidate)) return std::nullopt;
  fs::path absolute = candidate.is_absolute() ? candidate : root_ / candidate;
  std::error_code ec;
  auto resolved = fs::weakly_canonical(absolute, ec);
  if(ec) return std::nullopt;
  return resolved;
}
