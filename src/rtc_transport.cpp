#include "rtc_transport.hpp"

#include <rtc/rtc.hpp>

#include <mutex>
#include <variant>

#include "log.hpp"

namespace {

template<typename Fn>
class HandlerSlot {
public:
  void set(Fn fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    fn_ = std::move(fn);
  }
  Fn get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fn_;
  }
private:
  mutable std::mutex mutex_;
  Fn fn_;
};

std::string text_of(const rtc::message_variant& data) {
  if(const auto* text = std::get_if<std::string>(&data)) return *text;
  const auto& bytes = std::get<rtc::binary>(data);
  return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

// Handlers live in shared slots so the libdatachannel callbacks never point
// at a destroyed wrapper.
struct ChannelHandlers {
  HandlerSlot<MessageChannel::OpenHandler> open;
  HandlerSlot<MessageChannel::MessageHandler> message;
  HandlerSlot<MessageChannel::ClosedHandler> closed;
};

class RtcChannel : public MessageChannel {
public:
  explicit RtcChannel(std::shared_ptr<rtc::DataChannel> dc)
    : dc_(std::move(dc)), handlers_(std::make_shared<ChannelHandlers>()) {
    auto handlers = handlers_;
    dc_->onOpen([handlers](){
      if(auto fn = handlers->open.get()) fn();
    });
    dc_->onMessage([handlers](rtc::message_variant data){
      if(auto fn = handlers->message.get()) fn(text_of(data));
    });
    dc_->onClosed([handlers](){
      if(auto fn = handlers->closed.get()) fn();
    });
  }

  ~RtcChannel() override {
    handlers_->open.set(nullptr);
    handlers_->message.set(nullptr);
    handlers_->closed.set(nullptr);
  }

  bool send(const std::string& line) override {
    if(!dc_->isOpen()) return false;
    try {
      return dc_->send(line);
    } catch(const std::exception& e) {
      logger_for("rtc")->warn("Data channel send failed: {}", e.what());
      return false;
    }
  }

  bool is_open() const override { return dc_->isOpen(); }

  void close() override {
    if(!dc_->isClosed()) dc_->close();
  }

  void on_open(OpenHandler handler) override {
    handlers_->open.set(handler);
    if(handler && dc_->isOpen()) handler();
  }

  void on_message(MessageHandler handler) override {
    handlers_->message.set(std::move(handler));
  }

  void on_closed(ClosedHandler handler) override {
    handlers_->closed.set(std::move(handler));
  }

private:
  std::shared_ptr<rtc::DataChannel> dc_;
  std::shared_ptr<ChannelHandlers> handlers_;
};

PeerLink::State map_state(rtc::PeerConnection::State state) {
  switch(state) {
    case rtc::PeerConnection::State::New: return PeerLink::State::New;
    case rtc::PeerConnection::State::Connecting: return PeerLink::State::Connecting;
    case rtc::PeerConnection::State::Connected: return PeerLink::State::Connected;
    case rtc::PeerConnection::State::Disconnected: return PeerLink::State::Disconnected;
    case rtc::PeerConnection::State::Failed: return PeerLink::State::Failed;
    case rtc::PeerConnection::State::Closed: return PeerLink::State::Closed;
  }
  return PeerLink::State::Failed;
}

class RtcPeerLink : public PeerLink {
public:
  RtcPeerLink(const rtc::Configuration& config, Callbacks callbacks)
    : callbacks_(std::move(callbacks)),
      pc_(std::make_shared<rtc::PeerConnection>(config)) {
    auto cb = callbacks_;
    pc_->onLocalDescription([cb](rtc::Description description){
      if(cb.local_description) {
        cb.local_description(SessionDescription{description.typeString(), std::string(description)});
      }
    });
    pc_->onLocalCandidate([cb](rtc::Candidate candidate){
      if(cb.local_candidate) cb.local_candidate(IceCandidate{std::string(candidate), candidate.mid()});
    });
    pc_->onStateChange([cb](rtc::PeerConnection::State state){
      if(cb.state) cb.state(map_state(state));
    });
    pc_->onDataChannel([cb](std::shared_ptr<rtc::DataChannel> dc){
      if(cb.channel) cb.channel(std::make_shared<RtcChannel>(std::move(dc)));
    });
  }

  ~RtcPeerLink() override {
    pc_->resetCallbacks();
    pc_->close();
  }

  void create_offer(const std::string& channel_label) override {
    // Creating the first channel triggers the local offer.
    auto dc = pc_->createDataChannel(channel_label);
    if(callbacks_.channel) callbacks_.channel(std::make_shared<RtcChannel>(std::move(dc)));
  }

  void accept_offer(const SessionDescription& offer) override {
    pc_->setRemoteDescription(rtc::Description(offer.sdp, offer.type.empty() ? "offer" : offer.type));
  }

  void accept_answer(const SessionDescription& answer) override {
    pc_->setRemoteDescription(rtc::Description(answer.sdp, answer.type.empty() ? "answer" : answer.type));
  }

  void add_remote_candidate(const IceCandidate& candidate) override {
    pc_->addRemoteCandidate(rtc::Candidate(candidate.candidate, candidate.mid));
  }

  void close() override {
    pc_->close();
  }

private:
  Callbacks callbacks_;
  std::shared_ptr<rtc::PeerConnection> pc_;
};

struct SocketHandlers {
  HandlerSlot<std::function<void()>> open;
  HandlerSlot<std::function<void(const std::string&)>> message;
  HandlerSlot<std::function<void()>> closed;
  HandlerSlot<std::function<void(const std::string&)>> error;
};

class RtcSignalingSocket : public SignalingSocket {
public:
  RtcSignalingSocket()
    : ws_(std::make_shared<rtc::WebSocket>()),
      handlers_(std::make_shared<SocketHandlers>()) {
    auto handlers = handlers_;
    ws_->onOpen([handlers](){
      if(auto fn = handlers->open.get()) fn();
    });
    ws_->onMessage([handlers](rtc::message_variant data){
      if(auto fn = handlers->message.get()) fn(text_of(data));
    });
    ws_->onClosed([handlers](){
      if(auto fn = handlers->closed.get()) fn();
    });
    ws_->onError([handlers](std::string error){
      if(auto fn = handlers->error.get()) fn(error);
    });
  }

  ~RtcSignalingSocket() override {
    ws_->resetCallbacks();
    ws_->close();
  }

  void open(const std::string& url) override { ws_->open(url); }

  bool send(const std::string& text) override {
    if(!ws_->isOpen()) return false;
    try {
      return ws_->send(text);
    } catch(const std::exception& e) {
      logger_for("rtc")->warn("Relay send failed: {}", e.what());
      return false;
    }
  }

  bool is_open() const override { return ws_->isOpen(); }
  void close() override { ws_->close(); }

  void on_open(std::function<void()> handler) override { handlers_->open.set(std::move(handler)); }
  void on_message(std::function<void(const std::string&)> handler) override {
    handlers_->message.set(std::move(handler));
  }
  void on_closed(std::function<void()> handler) override { handlers_->closed.set(std::move(handler)); }
  void on_error(std::function<void(const std::string&)> handler) override {
    handlers_->error.set(std::move(handler));
  }

private:
  std::shared_ptr<rtc::WebSocket> ws_;
  std::shared_ptr<SocketHandlers> handlers_;
};

spdlog::level::level_enum map_level(rtc::LogLevel level) {
  switch(level) {
    case rtc::LogLevel::Fatal:
    case rtc::LogLevel::Error: return spdlog::level::err;
    case rtc::LogLevel::Warning: return spdlog::level::warn;
    case rtc::LogLevel::Info: return spdlog::level::info;
    default: return spdlog::level::debug;
  }
}

} // namespace

void init_rtc_logging(bool verbose) {
  auto logger = logger_for("rtc");
  rtc::InitLogger(verbose ? rtc::LogLevel::Info : rtc::LogLevel::Warning,
                  [logger](rtc::LogLevel level, std::string message){
                    logger->write(map_level(level), message);
                  });
}

PeerLinkFactory make_rtc_peer_link_factory(const std::string& stun_server) {
  return [stun_server](PeerLink::Callbacks callbacks) -> std::unique_ptr<PeerLink> {
    rtc::Configuration config;
    if(!stun_server.empty()) {
      config.iceServers.emplace_back(stun_server);
    }
    return std::make_unique<RtcPeerLink>(config, std::move(callbacks));
  };
}

SignalingSocketFactory make_rtc_signaling_socket_factory() {
  return [](){ return std::unique_ptr<SignalingSocket>(std::make_unique<RtcSignalingSocket>()); };
}
