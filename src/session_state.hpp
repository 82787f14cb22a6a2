#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "chunk_codec.hpp"
#include "editor_bridge.hpp"
#include "workspace_snapshot.hpp"

// Initiator owns the shared workspace; Responder only mirrors it.
enum class Role { Initiator, Responder };

const char* to_string(Role role);
// Accepts "initiator"/"create" and "responder"/"join".
std::optional<Role> parse_role(const std::string& text);

// Insertion-ordered, never holds two peers with the same id.
class PeerList {
public:
  // False when a peer with that id is already present.
  bool add(PeerInfo peer);
  bool remove(const std::string& id);
  bool contains(const std::string& id) const;
  std::vector<PeerInfo> list() const;
  std::size_t size() const;
  void clear();

private:
  mutable std::mutex mutex_;
  std::vector<PeerInfo> peers_;
};

// Everything one participant knows about its session. Owned by Session and
// handed by reference to the router.
class SessionState {
public:
  SessionState(std::string local_id, Role role, std::string username,
               std::chrono::milliseconds transfer_timeout = std::chrono::seconds(60));

  const std::string& local_id() const { return local_id_; }
  Role role() const { return role_; }
  const std::string& username() const { return username_; }

  PeerList& peers() { return peers_; }
  const PeerList& peers() const { return peers_; }
  TransferRegistry& transfers() { return transfers_; }

  // Initiator only; null on the responder side.
  WorkspaceSnapshot* workspace() { return workspace_.get(); }
  const WorkspaceSnapshot* workspace() const { return workspace_.get(); }
  void set_workspace(std::unique_ptr<WorkspaceSnapshot> workspace) { workspace_ = std::move(workspace); }

  void set_mirror(DirectoryNode mirror);
  DirectoryNode mirror() const;
  bool has_mirror() const;

private:
  std::string local_id_;
  Role role_;
  std::string username_;
  PeerList peers_;
  TransferRegistry transfers_;
  std::unique_ptr<WorkspaceSnapshot> workspace_;

  mutable std::mutex mirror_mutex_;
  std::optional<DirectoryNode> mirror_;
};
