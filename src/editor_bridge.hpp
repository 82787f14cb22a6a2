#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "protocol.hpp"

struct DirectoryNode;

struct PeerInfo {
  std::string id;
  std::string username;
  std::string status = "connected";
};

// What the session needs from the editor integration. Calls arrive on the
// session's io thread.
class EditorBridge {
public:
  virtual ~EditorBridge() = default;

  // A requested file has arrived and been written to local_copy.
  virtual void open_document(const std::filesystem::path& local_copy,
                             const std::string& remote_path) = 0;
  virtual void apply_edit(const std::string& path, const EditDescriptor& edit) = 0;
  virtual void highlight_selection(const SelectionInfo& selection) = 0;

  virtual void status_changed(const std::string& /*status*/) {}
  virtual void peers_changed(const std::vector<PeerInfo>& /*peers*/) {}
  virtual void workspace_changed(const DirectoryNode& /*structure*/) {}
  virtual void pong_received(const std::string& /*peer_id*/) {}
};
