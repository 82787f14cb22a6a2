#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "editor_bridge.hpp"
#include "message_router.hpp"
#include "peer_link.hpp"
#include "session_negotiator.hpp"
#include "session_state.hpp"
#include "signaling_client.hpp"

class Logger;
class SettingsManager;

// One participant: owns the io_context every event runs on and wires the
// relay client, negotiator and router together.
class Session {
public:
  struct Options {
    Role role = Role::Responder;
    std::string local_id;          // random when empty
    std::string target_id;
    std::string username;          // random when empty
    std::string relay_url = "ws://127.0.0.1:6789";
    std::filesystem::path workspace;
    std::vector<std::string> exclude;
    std::size_t history_cache_bytes = 64 * 1024 * 1024;
    std::chrono::milliseconds negotiation_timeout{30000};
    std::chrono::milliseconds transfer_timeout{60000};
    MessageRouter::Options router;

    SignalingSocketFactory socket_factory;
    PeerLinkFactory link_factory;
    std::shared_ptr<EditorBridge> editor;
  };

  // Reads role, peer, relay and timing settings. Throws ConfigError when
  // the role is unknown or a joiner has no peer id. Transport factories and
  // the editor are left for the caller.
  static Options options_from(const SettingsManager& settings);

  explicit Session(Options options);
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  // Throws ConfigError for an Initiator without a usable workspace and
  // TransportError when the relay socket cannot be opened.
  void start();
  void run();
  void start_background();
  void stop();

  // Thread-safe; the work is posted onto the session's io_context.
  void request_file(const std::string& path);
  void ping();
  void send_edit(const std::string& path, const EditDescriptor& edit);
  void send_selection(const SelectionInfo& selection);
  void rollback();
  void disconnect();

  const std::string& local_id() const { return options_.local_id; }
  const std::string& username() const { return options_.username; }
  Role role() const { return options_.role; }

  SessionNegotiator::State negotiation_state() const { return negotiation_state_.load(); }
  std::string status() const;
  std::vector<PeerInfo> peers() const;
  std::optional<DirectoryNode> mirror() const;
  std::optional<DirectoryNode> workspace_structure() const;

  asio::io_context& io() { return io_; }

private:
  using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

  void handle_channel_open(std::shared_ptr<MessageChannel> channel);
  void handle_negotiation_state(SessionNegotiator::State state, const std::string& detail);
  void set_status(const std::string& status);
  void teardown(const std::string& reason);

  template<typename Fn>
  void post_guarded(const char* what, Fn fn);

  Options options_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::optional<WorkGuard> work_;
  std::thread io_thread_;
  std::atomic<bool> started_{false};

  std::unique_ptr<SessionState> state_;
  std::shared_ptr<SignalingClient> signaling_;
  std::shared_ptr<SessionNegotiator> negotiator_;
  std::shared_ptr<MessageRouter> router_;

  std::atomic<SessionNegotiator::State> negotiation_state_{SessionNegotiator::State::Idle};
  mutable std::mutex status_mutex_;
  std::string status_ = "Idle";
};
