#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Fragment ceilings for the three chunked message kinds.
inline constexpr std::size_t kSnapshotFragmentSize = 14000;
inline constexpr std::size_t kFileFragmentSize = 12000;
inline constexpr std::size_t kEditFragmentSize = 10000;

// Largest encoded payload a receiver will reassemble for one transfer.
inline constexpr std::size_t kMaxTransferBytes = 256u * 1024u * 1024u;

enum class TransferKind {
  WorkspaceSnapshot,
  FileContent,
  Edit
};

const char* to_string(TransferKind kind);

std::size_t fragment_ceiling(TransferKind kind);

// Most chunks a transfer of this kind may announce.
std::size_t max_chunks(TransferKind kind);

// Splits payload into ceil(len/max) ordered fragments. An empty payload
// still produces one (empty) fragment. Throws ConfigError when max is 0.
std::vector<std::string> split_payload(const std::string& payload, std::size_t max_fragment_size);

// One in-flight reassembly. Slots are addressed by index, so arrival order
// does not matter and a repeated index just overwrites. Only received slots
// are stored.
struct ChunkedTransfer {
  using Clock = std::chrono::steady_clock;

  TransferKind kind = TransferKind::WorkspaceSnapshot;
  std::string target;
  std::size_t total_chunks = 0;
  std::map<std::size_t, std::string> slots;
  Clock::time_point last_update{};

  ChunkedTransfer(TransferKind kind, std::string target, std::size_t total);

  // Throws ProtocolError for an index outside [0, total).
  void put(std::size_t index, std::string fragment);
  bool complete() const { return slots.size() == total_chunks; }

  // Joined payload, or nullopt while any slot is still empty.
  std::optional<std::string> reassemble() const;
};

// Pending transfers keyed by (kind, target). Target is the file path for
// file and edit transfers and empty for snapshots.
class TransferRegistry {
public:
  using Clock = ChunkedTransfer::Clock;

  explicit TransferRegistry(std::chrono::milliseconds idle_timeout = std::chrono::seconds(60));

  // Records one fragment. Throws ProtocolError when the announced total
  // exceeds max_chunks(kind) or the fragment exceeds the kind's ceiling.
  // Returns the full payload the moment the last slot
  // fills, and forgets the transfer. A fragment announcing a different total
  // than the pending transfer restarts it.
  std::optional<std::string> add_fragment(TransferKind kind,
                                          const std::string& target,
                                          std::size_t index,
                                          std::size_t total,
                                          std::string fragment,
                                          Clock::time_point now = Clock::now());

  // Drops transfers idle for longer than the timeout. Returns how many.
  std::size_t expire(Clock::time_point now = Clock::now());
  void clear();

  std::size_t pending() const;
  bool has_pending(TransferKind kind, const std::string& target) const;

  std::chrono::milliseconds idle_timeout() const { return idle_timeout_; }

private:
  using Key = std::pair<TransferKind, std::string>;

  mutable std::mutex mutex_;
  std::map<Key, ChunkedTransfer> transfers_;
  std::chrono::milliseconds idle_timeout_;
};
