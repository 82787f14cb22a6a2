#include "console_editor_bridge.hpp"

#include <algorithm>

#include "log.hpp"
#include "utils.hpp"
#include "workspace_snapshot.hpp"

namespace fs = std::filesystem;

namespace {

std::size_t offset_of(const std::string& content, const Position& position) {
  std::size_t offset = 0;
  for(int line = 0; line < position.line; ++line) {
    auto newline = content.find('\n', offset);
    if(newline == std::string::npos) return content.size();
    offset = newline + 1;
  }
  auto line_end = content.find('\n', offset);
  if(line_end == std::string::npos) line_end = content.size();
  auto column = static_cast<std::size_t>(std::max(position.character, 0));
  return std::min(offset + column, line_end);
}

} // namespace

std::string apply_text_edit(const std::string& content, const EditDescriptor& edit) {
  auto start = offset_of(content, edit.range.start);
  auto end = offset_of(content, edit.range.end);
  if(end < start) std::swap(start, end);
  return content.substr(0, start) + edit.text + content.substr(end);
}

ConsoleEditorBridge::ConsoleEditorBridge(fs::path workspace_root, std::shared_ptr<Logger> logger)
  : workspace_root_(std::move(workspace_root)),
    logger_(logger ? std::move(logger) : logger_for("editor")) {
  if(!workspace_root_.empty()) {
    std::error_code ec;
    auto canonical = fs::weakly_canonical(workspace_root_, ec);
    if(!ec) workspace_root_ = canonical;
  }
}

void ConsoleEditorBridge::open_document(const fs::path& local_copy, const std::string& remote_path) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    documents_[remote_path] = local_copy;
  }
  logger_->print("Opened {} -> {}", remote_path, local_copy.string());
}

fs::path ConsoleEditorBridge::target_for(const std::string& path) const {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = documents_.find(path);
    if(it != documents_.end()) return it->second;
  }
  if(workspace_root_.empty()) return {};
  std::error_code ec;
  auto candidate = fs::weakly_canonical(fs::path(path).is_absolute() ? fs::path(path)
                                                                    : workspace_root_ / path, ec);
  if(ec) return {};
  auto rel = candidate.lexically_relative(workspace_root_);
  if(rel.empty() || *rel.begin() == "..") return {};
  return candidate;
}

void ConsoleEditorBridge::apply_edit(const std::string& path, const EditDescriptor& edit) {
  auto target = target_for(path);
  if(target.empty()) {
    logger_->print("Edit for {} (not open here): {}:{}-{}:{} \"{}\"", path,
                   edit.range.start.line, edit.range.start.character,
                   edit.range.end.line, edit.range.end.character, edit.text);
    return;
  }
  auto content = read_file_bytes(target);
  if(!content) {
    logger_->warn("Cannot read {} to apply an edit", target.string());
    return;
  }
  if(!write_file_bytes(target, apply_text_edit(*content, edit))) {
    logger_->warn("Cannot write edit to {}", target.string());
    return;
  }
  logger_->print("Applied edit to {}", path);
}

void ConsoleEditorBridge::highlight_selection(const SelectionInfo& selection) {
  logger_->print("Peer selection in {} {}:{}-{}:{}", selection.file_name,
                 selection.range.start.line, selection.range.start.character,
                 selection.range.end.line, selection.range.end.character);
}

void ConsoleEditorBridge::status_changed(const std::string& status) {
  logger_->print("[status] {}", status);
}

void ConsoleEditorBridge::peers_changed(const std::vector<PeerInfo>& peers) {
  if(peers.empty()) {
    logger_->print("No peers connected");
    return;
  }
  for(const auto& peer : peers) {
    logger_->print("Peer {} ({}) {}", peer.username, peer.id, peer.status);
  }
}

void ConsoleEditorBridge::workspace_changed(const DirectoryNode& structure) {
  logger_->print("Workspace {} now has {} files", structure.full_path, structure.file_count());
}

void ConsoleEditorBridge::pong_received(const std::string& peer_id) {
  logger_->print("Pong from {}", peer_id.empty() ? "peer" : peer_id);
}

std::map<std::string, fs::path> ConsoleEditorBridge::documents() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return documents_;
}
