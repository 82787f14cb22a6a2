#include "chunk_codec.hpp"

#include "errors.hpp"

const char* to_string(TransferKind kind) {
  switch(kind) {
    case TransferKind::WorkspaceSnapshot: return "snapshot";
    case TransferKind::FileContent: return "file";
    case TransferKind::Edit: return "edit";
  }
  return "unknown";
}

std::size_t fragment_ceiling(TransferKind kind) {
  switch(kind) {
    case TransferKind::WorkspaceSnapshot: return kSnapshotFragmentSize;
    case TransferKind::FileContent: return kFileFragmentSize;
    case TransferKind::Edit: return kEditFragmentSize;
  }
  return kEditFragmentSize;
}

std::size_t max_chunks(TransferKind kind) {
  return kMaxTransferBytes / fragment_ceiling(kind) + 1;
}

std::vector<std::string> split_payload(const std::string& payload, std::size_t max_fragment_size) {
  if(max_fragment_size == 0) {
    throw ConfigError("fragment size must be greater than zero");
  }
  std::vector<std::string> fragments;
  if(payload.empty()) {
    fragments.emplace_back();
    return fragments;
  }
  fragments.reserve((payload.size() + max_fragment_size - 1) / max_fragment_size);
  for(std::size_t offset = 0; offset < payload.size(); offset += max_fragment_size) {
    fragments.push_back(payload.substr(offset, max_fragment_size));
  }
  return fragments;
}

ChunkedTransfer::ChunkedTransfer(TransferKind kind_, std::string target_, std::size_t total)
  : kind(kind_),
    target(std::move(target_)),
    total_chunks(total),
    last_update(Clock::now()) {}

void ChunkedTransfer::put(std::size_t index, std::string fragment) {
  if(index >= total_chunks) {
    throw ProtocolError("chunk index " + std::to_string(index) +
                        " out of range for " + std::to_string(total_chunks) + " chunks");
  }
  slots[index] = std::move(fragment);
}

std::optional<std::string> ChunkedTransfer::reassemble() const {
  if(!complete()) return std::nullopt;
  std::size_t size = 0;
  for(const auto& slot : slots) size += slot.second.size();
  std::string out;
  out.reserve(size);
  for(const auto& slot : slots) out += slot.second;
  return out;
}

TransferRegistry::TransferRegistry(std::chrono::milliseconds idle_timeout)
  : idle_timeout_(idle_timeout) {}

std::optional<std::string> TransferRegistry::add_fragment(TransferKind kind,
                                                          const std::string& target,
                                                          std::size_t index,
                                                          std::size_t total,
                                                          std::string fragment,
                                                          Clock::time_point now) {
  if(total == 0) {
    throw ProtocolError("chunked message announces zero chunks");
  }
  if(index >= total) {
    throw ProtocolError("chunk index " + std::to_string(index) +
                        " out of range for " + std::to_string(total) + " chunks");
  }
  if(total > max_chunks(kind)) {
    throw ProtocolError(std::string(to_string(kind)) + " transfer announces " + std::to_string(total) +
                        " chunks, limit is " + std::to_string(max_chunks(kind)));
  }
  if(fragment.size() > fragment_ceiling(kind)) {
    throw ProtocolError(std::string(to_string(kind)) + " fragment of " + std::to_string(fragment.size()) +
                        " bytes exceeds " + std::to_string(fragment_ceiling(kind)));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  Key key{kind, target};
  auto it = transfers_.find(key);
  if(it != transfers_.end() && it->second.total_chunks != total) {
    transfers_.erase(it);
    it = transfers_.end();
  }
  if(it == transfers_.end()) {
    it = transfers_.emplace(key, ChunkedTransfer(kind, target, total)).first;
  }

  auto& transfer = it->second;
  transfer.put(index, std::move(fragment));
  transfer.last_update = now;
  if(!transfer.complete()) return std::nullopt;

  auto payload = transfer.reassemble();
  transfers_.erase(it);
  return payload;
}

std::size_t TransferRegistry::expire(Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t dropped = 0;
  for(auto it = transfers_.begin(); it != transfers_.end();) {
    if(now - it->second.last_update > idle_timeout_) {
      it = transfers_.erase(it);
      ++dropped;
    } else {
      ++it;
    }
  }
  return dropped;
}

void TransferRegistry::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  transfers_.clear();
}

std::size_t TransferRegistry::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return transfers_.size();
}

bool TransferRegistry::has_pending(TransferKind kind, const std::string& target) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return transfers_.count(Key{kind, target}) != 0;
}
