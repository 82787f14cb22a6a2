#pragma once

#include "editor_bridge.hpp"
#include "message_channel.hpp"
#include "peer_link.hpp"
#include "relay_router.hpp"
#include "signaling_client.hpp"
#include "workspace_snapshot.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tightrope::test {

// ---- data channel ---------------------------------------------------------

// One end of an in-memory ordered channel. Delivery is synchronous on the
// sender's thread; consumers post onto their own loop as they would for a
// real transport.
class LoopbackChannel : public MessageChannel {
public:
  using SendFilter = std::function<bool(const std::string&)>;

  static std::pair<std::shared_ptr<LoopbackChannel>, std::shared_ptr<LoopbackChannel>> make_pair() {
    auto a = std::make_shared<LoopbackChannel>();
    auto b = std::make_shared<LoopbackChannel>();
    a->peer_ = b;
    b->peer_ = a;
    return {a, b};
  }

  static void connect(const std::shared_ptr<LoopbackChannel>& a, const std::shared_ptr<LoopbackChannel>& b) {
    a->peer_ = b;
    b->peer_ = a;
  }

  bool send(const std::string& line) override {
    SendFilter filter;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if(!open_ || refusing_) return false;
      sent_.push_back(line);
      filter = filter_;
    }
    if(filter && !filter(line)) return true;
    auto peer = peer_.lock();
    if(!peer) return false;
    peer->deliver(line);
    return true;
  }

  bool is_open() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
  }

  void close() override {
    bool was_open = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      was_open = open_;
      open_ = false;
    }
    if(!was_open) return;
    fire_closed();
    if(auto peer = peer_.lock()) peer->remote_closed();
  }

  void on_open(OpenHandler handler) override {
    bool fire = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      open_handler_ = handler;
      fire = open_ && handler;
    }
    if(fire) handler();
  }

  void on_message(MessageHandler handler) override {
    std::lock_guard<std::mutex> lock(mutex_);
    message_handler_ = std::move(handler);
  }

  void on_closed(ClosedHandler handler) override {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_handler_ = std::move(handler);
  }

  // Marks this end open and fires its open handler.
  void open() {
    OpenHandler handler;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if(open_) return;
      open_ = true;
      handler = open_handler_;
    }
    if(handler) handler();
  }

  // Lines that pass the filter reach the peer; the rest are only recorded.
  void set_send_filter(SendFilter filter) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_ = std::move(filter);
  }

  // While refusing, send() fails as a congested transport would.
  void set_refusing(bool refusing) {
    std::lock_guard<std::mutex> lock(mutex_);
    refusing_ = refusing;
  }

  std::vector<std::string> sent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
  }

  std::vector<std::string> sent_of_type(const std::string& type) const {
    std::vector<std::string> out;
    for(const auto& line : sent()) {
      if(line == type || line.rfind(type + " ", 0) == 0) out.push_back(line);
    }
    return out;
  }

  // Hands a raw line to this end's consumer as if the peer had sent it.
  void deliver(const std::string& line) {
    MessageHandler handler;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      handler = message_handler_;
    }
    if(handler) handler(line);
  }

private:
  void remote_closed() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if(!open_) return;
      open_ = false;
    }
    fire_closed();
  }

  void fire_closed() {
    ClosedHandler handler;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      handler = closed_handler_;
    }
    if(handler) handler();
  }

  mutable std::mutex mutex_;
  bool open_ = false;
  bool refusing_ = false;
  std::weak_ptr<LoopbackChannel> peer_;
  OpenHandler open_handler_;
  MessageHandler message_handler_;
  ClosedHandler closed_handler_;
  SendFilter filter_;
  std::vector<std::string> sent_;
};

// ---- relay ----------------------------------------------------------------

// In-memory relay built on the real routing table.
class FakeRelay : public std::enable_shared_from_this<FakeRelay> {
public:
  struct SocketCore {
    std::mutex mutex;
    bool open = false;
    RelayRouter::ConnectionId connection = 0;
    std::string registered_id;
    std::function<void()> on_open;
    std::function<void(const std::string&)> on_message;
    std::function<void()> on_closed;
    std::function<void(const std::string&)> on_error;

    template<typename Fn>
    Fn get(Fn SocketCore::*member) {
      std::lock_guard<std::mutex> lock(mutex);
      return this->*member;
    }
  };

  class Socket : public SignalingSocket {
  public:
    Socket(std::shared_ptr<FakeRelay> relay)
      : relay_(std::move(relay)), core_(std::make_shared<SocketCore>()) {}

    ~Socket() override { close(); }

    void open(const std::string& url) override {
      if(!relay_->accepting_) {
        if(auto fn = core_->get(&SocketCore::on_error)) fn("connection refused: " + url);
        if(auto fn = core_->get(&SocketCore::on_closed)) fn();
        return;
      }
      std::weak_ptr<SocketCore> weak = core_;
      auto connection = relay_->router_.add_connection([weak](const std::string& text){
        auto core = weak.lock();
        if(!core) return false;
        auto fn = core->get(&SocketCore::on_message);
        if(fn) fn(text);
        return true;
      });
      {
        std::lock_guard<std::mutex> lock(core_->mutex);
        core_->open = true;
        core_->connection = connection;
      }
      relay_->track(core_);
      if(auto fn = core_->get(&SocketCore::on_open)) fn();
    }

    bool send(const std::string& text) override {
      RelayRouter::ConnectionId connection = 0;
      {
        std::lock_guard<std::mutex> lock(core_->mutex);
        if(!core_->open) return false;
        connection = core_->connection;
      }
      relay_->record(text);
      auto message = nlohmann::json::parse(text, nullptr, false);
      if(message.is_object() && message.value("type", nlohmann::json()) == "register" &&
         message.contains("id") && message.at("id").is_string()) {
        std::lock_guard<std::mutex> lock(core_->mutex);
        core_->registered_id = message.at("id").get<std::string>();
      }
      relay_->router_.handle_message(connection, text);
      return true;
    }

    bool is_open() const override {
      std::lock_guard<std::mutex> lock(core_->mutex);
      return core_->open;
    }

    void close() override { relay_->disconnect(core_); }

    void on_open(std::function<void()> handler) override {
      std::lock_guard<std::mutex> lock(core_->mutex);
      core_->on_open = std::move(handler);
    }
    void on_message(std::function<void(const std::string&)> handler) override {
      std::lock_guard<std::mutex> lock(core_->mutex);
      core_->on_message = std::move(handler);
    }
    void on_closed(std::function<void()> handler) override {
      std::lock_guard<std::mutex> lock(core_->mutex);
      core_->on_closed = std::move(handler);
    }
    void on_error(std::function<void(const std::string&)> handler) override {
      std::lock_guard<std::mutex> lock(core_->mutex);
      core_->on_error = std::move(handler);
    }

  private:
    std::shared_ptr<FakeRelay> relay_;
    std::shared_ptr<SocketCore> core_;
  };

  SignalingSocketFactory socket_factory() {
    auto self = shared_from_this();
    return [self](){ return std::unique_ptr<SignalingSocket>(std::make_unique<Socket>(self)); };
  }

  // Closes every connected socket, as if the relay process went away.
  void shutdown() {
    accepting_ = false;
    std::vector<std::shared_ptr<SocketCore>> cores;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for(auto& weak : sockets_) {
        if(auto core = weak.lock()) cores.push_back(core);
      }
      sockets_.clear();
    }
    for(auto& core : cores) disconnect(core);
  }

  void set_accepting(bool accepting) { accepting_ = accepting; }

  // Hands raw text to the client registered under `id`, bypassing routing,
  // as a misbehaving relay could.
  bool inject(const std::string& id, const std::string& text) {
    std::vector<std::shared_ptr<SocketCore>> cores;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for(auto& weak : sockets_) {
        if(auto core = weak.lock()) cores.push_back(core);
      }
    }
    for(auto& core : cores) {
      std::function<void(const std::string&)> handler;
      {
        std::lock_guard<std::mutex> lock(core->mutex);
        if(!core->open || core->registered_id != id) continue;
        handler = core->on_message;
      }
      if(handler) handler(text);
      return static_cast<bool>(handler);
    }
    return false;
  }

  std::vector<std::string> traffic() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return traffic_;
  }

  RelayRouter& router() { return router_; }

private:
  void track(const std::shared_ptr<SocketCore>& core) {
    std::lock_guard<std::mutex> lock(mutex_);
    sockets_.push_back(core);
  }

  void record(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    traffic_.push_back(text);
  }

  void disconnect(const std::shared_ptr<SocketCore>& core) {
    RelayRouter::ConnectionId connection = 0;
    std::function<void()> closed;
    {
      std::lock_guard<std::mutex> lock(core->mutex);
      if(!core->open) return;
      core->open = false;
      connection = core->connection;
      closed = core->on_closed;
    }
    router_.remove_connection(connection);
    if(closed) closed();
  }

  RelayRouter router_;
  std::atomic<bool> accepting_{true};
  mutable std::mutex mutex_;
  std::vector<std::weak_ptr<SocketCore>> sockets_;
  std::vector<std::string> traffic_;
};

// ---- peer links -----------------------------------------------------------

// Pairs fake peer links by the "sdp" token carried through the relay. A
// channel opens once both sides hold a remote description and at least one
// remote candidate. Like a real peer connection, a candidate added before
// the remote description is an error.
class FakeNetwork : public std::enable_shared_from_this<FakeNetwork> {
public:
  struct LinkCore {
    std::mutex mutex;
    PeerLink::Callbacks callbacks;
    std::string token;
    std::string remote_token;
    bool has_remote_description = false;
    std::vector<IceCandidate> remote_candidates;
    std::shared_ptr<LoopbackChannel> channel;
    bool channel_reported = false;
    bool closed = false;
  };

  class Link : public PeerLink {
  public:
    Link(std::shared_ptr<FakeNetwork> network, Callbacks callbacks)
      : network_(std::move(network)), core_(std::make_shared<LinkCore>()) {
      core_->callbacks = std::move(callbacks);
      core_->token = network_->register_core(core_);
    }

    ~Link() override { close(); }

    void create_offer(const std::string& channel_label) override {
      network_->record_label(channel_label);
      core_->channel = std::make_shared<LoopbackChannel>();
      report_channel(core_);
      emit(core_, SessionDescription{"offer", core_->token});
    }

    void accept_offer(const SessionDescription& offer) override {
      if(offer.type != "offer") throw std::runtime_error("expected an offer");
      auto remote = network_->find(offer.sdp);
      if(!remote) throw std::runtime_error("unknown offer " + offer.sdp);
      {
        std::lock_guard<std::mutex> lock(core_->mutex);
        core_->remote_token = offer.sdp;
        core_->has_remote_description = true;
        core_->channel = std::make_shared<LoopbackChannel>();
      }
      emit(core_, SessionDescription{"answer", core_->token});
      network_->maybe_connect(core_);
    }

    void accept_answer(const SessionDescription& answer) override {
      if(answer.type != "answer") throw std::runtime_error("expected an answer");
      {
        std::lock_guard<std::mutex> lock(core_->mutex);
        core_->remote_token = answer.sdp;
        core_->has_remote_description = true;
      }
      network_->maybe_connect(core_);
    }

    void add_remote_candidate(const IceCandidate& candidate) override {
      {
        std::lock_guard<std::mutex> lock(core_->mutex);
        if(!core_->has_remote_description) {
          throw std::runtime_error("remote candidate before remote description");
        }
        core_->remote_candidates.push_back(candidate);
      }
      network_->maybe_connect(core_);
    }

    void close() override {
      std::shared_ptr<LoopbackChannel> channel;
      {
        std::lock_guard<std::mutex> lock(core_->mutex);
        if(core_->closed) return;
        core_->closed = true;
        channel = core_->channel;
      }
      if(channel) channel->close();
      auto state = core_->callbacks.state;
      if(state) state(State::Closed);
    }

  private:
    std::shared_ptr<FakeNetwork> network_;
    std::shared_ptr<LinkCore> core_;
  };

  PeerLinkFactory link_factory() {
    auto self = shared_from_this();
    return [self](PeerLink::Callbacks callbacks) -> std::unique_ptr<PeerLink> {
      self->links_created_++;
      return std::make_unique<Link>(self, std::move(callbacks));
    };
  }

  // When disabled, descriptions and candidates still flow but no channel
  // ever opens.
  void set_connectable(bool connectable) { connectable_ = connectable; }

  std::size_t links_created() const { return links_created_; }

  std::vector<std::string> labels() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return labels_;
  }

  // Remote candidates accepted across all live links.
  std::size_t candidates_applied_total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t total = 0;
    for(const auto& entry : cores_) {
      if(auto core = entry.second.lock()) {
        std::lock_guard<std::mutex> core_lock(core->mutex);
        total += core->remote_candidates.size();
      }
    }
    return total;
  }

private:
  static void report_channel(const std::shared_ptr<LinkCore>& core) {
    std::shared_ptr<LoopbackChannel> channel;
    {
      std::lock_guard<std::mutex> lock(core->mutex);
      if(core->channel_reported || !core->channel) return;
      core->channel_reported = true;
      channel = core->channel;
    }
    if(core->callbacks.channel) core->callbacks.channel(channel);
  }

  static void emit(const std::shared_ptr<LinkCore>& core, const SessionDescription& description) {
    if(core->callbacks.local_description) core->callbacks.local_description(description);
    if(core->callbacks.local_candidate) {
      core->callbacks.local_candidate(IceCandidate{"candidate:1 1 UDP 1 127.0.0.1 9 typ host " + core->token, "0"});
    }
  }

  std::string register_core(const std::shared_ptr<LinkCore>& core) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto token = "fake-sdp-" + std::to_string(next_token_++);
    cores_[token] = core;
    return token;
  }

  std::shared_ptr<LinkCore> find(const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cores_.find(token);
    return it == cores_.end() ? nullptr : it->second.lock();
  }

  void record_label(const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);
    labels_.push_back(label);
  }

  static bool ready(const std::shared_ptr<LinkCore>& core) {
    std::lock_guard<std::mutex> lock(core->mutex);
    return !core->closed && core->has_remote_description && !core->remote_candidates.empty();
  }

  void maybe_connect(const std::shared_ptr<LinkCore>& core) {
    if(!connectable_) return;
    std::string remote_token;
    {
      std::lock_guard<std::mutex> lock(core->mutex);
      remote_token = core->remote_token;
    }
    auto remote = find(remote_token);
    if(!remote || !ready(core) || !ready(remote)) return;

    std::shared_ptr<LoopbackChannel> a;
    std::shared_ptr<LoopbackChannel> b;
    {
      std::scoped_lock lock(core->mutex, remote->mutex);
      if(core->channel && core->channel->is_open()) return;
      a = core->channel;
      b = remote->channel;
    }
    if(!a || !b) return;
    LoopbackChannel::connect(a, b);
    for(const auto& side : {core, remote}) {
      if(side->callbacks.state) side->callbacks.state(PeerLink::State::Connected);
      report_channel(side);
    }
    a->open();
    b->open();
  }

  mutable std::mutex mutex_;
  std::map<std::string, std::weak_ptr<LinkCore>> cores_;
  std::vector<std::string> labels_;
  std::size_t next_token_ = 1;
  std::atomic<bool> connectable_{true};
  std::atomic<std::size_t> links_created_{0};
};

// ---- editor ---------------------------------------------------------------

class RecordingEditorBridge : public EditorBridge {
public:
  struct OpenedDocument {
    std::filesystem::path local_copy;
    std::string remote_path;
  };

  void open_document(const std::filesystem::path& local_copy, const std::string& remote_path) override {
    std::lock_guard<std::mutex> lock(mutex_);
    opened_.push_back({local_copy, remote_path});
  }

  void apply_edit(const std::string& path, const EditDescriptor& edit) override {
    std::lock_guard<std::mutex> lock(mutex_);
    edits_.emplace_back(path, edit);
  }

  void highlight_selection(const SelectionInfo& selection) override {
    std::lock_guard<std::mutex> lock(mutex_);
    selections_.push_back(selection);
  }

  void status_changed(const std::string& status) override {
    std::lock_guard<std::mutex> lock(mutex_);
    statuses_.push_back(status);
  }

  void peers_changed(const std::vector<PeerInfo>& peers) override {
    std::lock_guard<std::mutex> lock(mutex_);
    peers_ = peers;
  }

  void workspace_changed(const DirectoryNode& structure) override {
    std::lock_guard<std::mutex> lock(mutex_);
    workspaces_.push_back(structure);
  }

  void pong_received(const std::string& peer_id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    pongs_.push_back(peer_id);
  }

  std::vector<OpenedDocument> opened() const { std::lock_guard<std::mutex> lock(mutex_); return opened_; }
  std::vector<std::pair<std::string, EditDescriptor>> edits() const { std::lock_guard<std::mutex> lock(mutex_); return edits_; }
  std::vector<SelectionInfo> selections() const { std::lock_guard<std::mutex> lock(mutex_); return selections_; }
  std::vector<std::string> statuses() const { std::lock_guard<std::mutex> lock(mutex_); return statuses_; }
  std::vector<PeerInfo> peers() const { std::lock_guard<std::mutex> lock(mutex_); return peers_; }
  std::vector<DirectoryNode> workspaces() const { std::lock_guard<std::mutex> lock(mutex_); return workspaces_; }
  std::vector<std::string> pongs() const { std::lock_guard<std::mutex> lock(mutex_); return pongs_; }

  bool saw_status(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for(const auto& status : statuses_) {
      if(status.find(needle) != std::string::npos) return true;
    }
    return false;
  }

private:
  mutable std::mutex mutex_;
  std::vector<OpenedDocument> opened_;
  std::vector<std::pair<std::string, EditDescriptor>> edits_;
  std::vector<SelectionInfo> selections_;
  std::vector<std::string> statuses_;
  std::vector<PeerInfo> peers_;
  std::vector<DirectoryNode> workspaces_;
  std::vector<std::string> pongs_;
};

} // namespace tightrope::test
