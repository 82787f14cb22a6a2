#include "session_state.hpp"

#include <algorithm>
#include <cctype>

const char* to_string(Role role) {
  return role == Role::Initiator ? "initiator" : "responder";
}

std::optional<Role> parse_role(const std::string& text) {
  std::string lowered = text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  if(lowered == "initiator" || lowered == "create" || lowered == "creator") return Role::Initiator;
  if(lowered == "responder" || lowered == "join" || lowered == "joiner") return Role::Responder;
  return std::nullopt;
}

bool PeerList::add(PeerInfo peer) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(peers_.begin(), peers_.end(),
                         [&](const PeerInfo& p){ return p.id == peer.id; });
  if(it != peers_.end()) return false;
  peers_.push_back(std::move(peer));
  return true;
}

bool PeerList::remove(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(peers_.begin(), peers_.end(),
                         [&](const PeerInfo& p){ return p.id == id; });
  if(it == peers_.end()) return false;
  peers_.erase(it);
  return true;
}

bool PeerList::contains(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::any_of(peers_.begin(), peers_.end(),
                     [&](const PeerInfo& p){ return p.id == id; });
}

std::vector<PeerInfo> PeerList::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_;
}

std::size_t PeerList::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.size();
}

void PeerList::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  peers_.clear();
}

SessionState::SessionState(std::string local_id, Role role, std::string username,
                           std::chrono::milliseconds transfer_timeout)
  : local_id_(std::move(local_id)),
    role_(role),
    username_(std::move(username)),
    transfers_(transfer_timeout) {}

void SessionState::set_mirror(DirectoryNode mirror) {
  std::lock_guard<std::mutex> lock(mirror_mutex_);
  mirror_ = std::move(mirror);
}

DirectoryNode SessionState::mirror() const {
  std::lock_guard<std::mutex> lock(mirror_mutex_);
  return mirror_ ? *mirror_ : DirectoryNode{};
}

bool SessionState::has_mirror() const {
  std::lock_guard<std::mutex> lock(mirror_mutex_);
  return mirror_.has_value();
}
