#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "editor_bridge.hpp"

class Logger;

// Applies a line/character range replacement to text. Positions past the
// end of a line or of the text clamp to it.
std::string apply_text_edit(const std::string& content, const EditDescriptor& edit);

// Terminal stand-in for an editor. Received files are tracked as open
// documents; edits land in the open document for that path or, on the
// sharing side, in the workspace file itself.
class ConsoleEditorBridge : public EditorBridge {
public:
  explicit ConsoleEditorBridge(std::filesystem::path workspace_root = {},
                               std::shared_ptr<Logger> logger = nullptr);

  void open_document(const std::filesystem::path& local_copy,
                     const std::string& remote_path) override;
  void apply_edit(const std::string& path, const EditDescriptor& edit) override;
  void highlight_selection(const SelectionInfo& selection) override;

  void status_changed(const std::string& status) override;
  void peers_changed(const std::vector<PeerInfo>& peers) override;
  void workspace_changed(const DirectoryNode& structure) override;
  void pong_received(const std::string& peer_id) override;

  std::map<std::string, std::filesystem::path> documents() const;

private:
  std::filesystem::path target_for(const std::string& path) const;

  std::filesystem::path workspace_root_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex mutex_;
  std::map<std::string, std::filesystem::path> documents_;
};
