#pragma once

#include <asio.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

#include "chunk_codec.hpp"
#include "editor_bridge.hpp"
#include "message_channel.hpp"
#include "protocol.hpp"
#include "session_state.hpp"

class Logger;

// Protocol state machine on top of an open channel.
//
// Inbound lines are decoded, chunked kinds are reassembled through the
// session's transfer registry and complete messages are dispatched. Every
// handler runs on the io_context; malformed input is logged and dropped.
class MessageRouter : public std::enable_shared_from_this<MessageRouter> {
public:
  struct Options {
    std::size_t snapshot_fragment_size = kSnapshotFragmentSize;
    std::size_t file_fragment_size = kFileFragmentSize;
    std::size_t edit_fragment_size = kEditFragmentSize;
    std::chrono::milliseconds poll_interval{5000};
    std::filesystem::path scratch_dir;
  };

  MessageRouter(asio::io_context& io,
                SessionState& state,
                std::shared_ptr<EditorBridge> editor,
                Options options,
                std::shared_ptr<Logger> logger = nullptr);
  ~MessageRouter();

  // Starts consuming the channel and the housekeeping timer.
  void attach(std::shared_ptr<MessageChannel> channel);
  // Stops the timer and forgets partial transfers. The channel is left open.
  void detach();

  // Decodes and dispatches one inbound line. Never throws.
  void handle_line(const std::string& line);

  // Outbound operations. All throw TransportError when the channel is down.
  void send_greeting();
  void send_ping();
  void request_file(const std::string& path);
  void send_edit(const std::string& path, const EditDescriptor& edit);
  void send_selection(const SelectionInfo& selection);
  void push_snapshot();
  void send_disconnect();
  // Pushes a fresh snapshot to a connected peer after a local change.
  void workspace_updated();

  bool attached() const { return static_cast<bool>(channel_); }
  bool pushing_snapshots() const { return pushing_; }
  std::filesystem::path scratch_path_for(const std::string& remote_path) const;

private:
  void send(const ChannelMessage& message);
  void send_chunked(TransferKind kind, const std::string& target,
                    const std::string& payload, std::size_t fragment_size);

  void handle(const msg::Ping&);
  void handle(const msg::Pong&);
  void handle(const msg::Greeting& m);
  void handle(const msg::Disconnect& m);
  void handle(const msg::NfsUpdate& m);
  void handle(const msg::RequestFile& m);
  void handle(const msg::FileData& m);
  void handle(const msg::ApplyEdit& m);
  void handle(const msg::SelectionChange& m);

  // Resolves a peer-supplied path inside the workspace. Throws
  // AuthorizationError for paths outside it or excluded by the ignore rules.
  std::filesystem::path shared_path(const WorkspaceSnapshot& workspace,
                                    const std::string& path,
                                    const char* what) const;

  void schedule_tick();
  void tick();

  asio::io_context& io_;
  SessionState& state_;
  std::shared_ptr<EditorBridge> editor_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  std::shared_ptr<MessageChannel> channel_;
  asio::steady_timer tick_timer_;
  bool pushing_ = false;
  std::string last_greeting_from_;
};
