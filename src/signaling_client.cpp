#include "signaling_client.hpp"

#include "errors.hpp"
#include "log.hpp"

const char* to_string(SignalingClient::Status status) {
  switch(status) {
    case SignalingClient::Status::Idle: return "idle";
    case SignalingClient::Status::Connecting: return "connecting";
    case SignalingClient::Status::Registered: return "registered";
    case SignalingClient::Status::Closed: return "closed";
    case SignalingClient::Status::Failed: return "failed";
  }
  return "unknown";
}

SignalingClient::SignalingClient(asio::io_context& io,
                                 std::unique_ptr<SignalingSocket> socket,
                                 std::string local_id,
                                 std::shared_ptr<Logger> logger)
  : io_(io),
    socket_(std::move(socket)),
    local_id_(std::move(local_id)),
    logger_(logger ? std::move(logger) : logger_for("signaling")) {
  if(!socket_) {
    throw ConfigError("signaling client needs a socket");
  }
}

SignalingClient::~SignalingClient() {
  if(socket_) {
    socket_->on_open(nullptr);
    socket_->on_message(nullptr);
    socket_->on_closed(nullptr);
    socket_->on_error(nullptr);
    socket_->close();
  }
}

void SignalingClient::connect(const std::string& relay_url) {
  std::weak_ptr<SignalingClient> weak = shared_from_this();
  // Socket callbacks arrive on transport threads; hop onto the loop.
  socket_->on_open([io = &io_, weak](){
    asio::post(*io, [weak](){ if(auto self = weak.lock()) self->handle_open(); });
  });
  socket_->on_message([io = &io_, weak](const std::string& text){
    asio::post(*io, [weak, text](){ if(auto self = weak.lock()) self->handle_text(text); });
  });
  socket_->on_closed([io = &io_, weak](){
    asio::post(*io, [weak](){ if(auto self = weak.lock()) self->handle_closed(); });
  });
  socket_->on_error([io = &io_, weak](const std::string& error){
    asio::post(*io, [weak, error](){ if(auto self = weak.lock()) self->handle_error(error); });
  });

  set_status(Status::Connecting, relay_url);
  logger_->info("Connecting to relay {}", relay_url);
  try {
    socket_->open(relay_url);
  } catch(const std::exception& e) {
    set_status(Status::Failed, e.what());
    throw TransportError("cannot open relay connection to " + relay_url + ": " + e.what());
  }
}

void SignalingClient::send(const json& envelope) {
  if(!socket_->is_open()) {
    throw TransportError("relay connection is not open");
  }
  if(!socket_->send(envelope.dump())) {
    throw TransportError("relay refused " + envelope.value("type", std::string("message")));
  }
  logger_->debug("-> relay {} to {}", envelope.value("type", std::string()),
                 envelope.value("to", std::string()));
}

void SignalingClient::close() {
  set_status(Status::Closed, "closed locally");
  if(socket_) socket_->close();
}

void SignalingClient::on_envelope(EnvelopeHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  envelope_handler_ = std::move(handler);
}

void SignalingClient::on_status(StatusHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  status_handler_ = std::move(handler);
}

SignalingClient::Status SignalingClient::status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_;
}

void SignalingClient::handle_open() {
  try {
    send(make_register(local_id_));
  } catch(const TransportError& e) {
    logger_->error("Registration failed: {}", e.what());
    set_status(Status::Failed, e.what());
    return;
  }
  logger_->info("Registered with relay as {}", local_id_);
  set_status(Status::Registered, local_id_);
}

void SignalingClient::handle_text(const std::string& text) {
  SignalingEnvelope envelope;
  try {
    envelope = parse_envelope(text);
  } catch(const ProtocolError& e) {
    logger_->warn("Dropping relay message: {}", e.what());
    return;
  }
  if(envelope.type != "offer" && envelope.type != "answer" && envelope.type != "candidate") {
    logger_->warn("Ignoring unknown signal '{}'", envelope.type);
    return;
  }
  logger_->debug("<- relay {} from {}", envelope.type, envelope.from);
  EnvelopeHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handler = envelope_handler_;
  }
  if(handler) handler(envelope);
}

void SignalingClient::handle_closed() {
  Status current = status();
  if(current == Status::Closed || current == Status::Failed) return;
  logger_->warn("Relay connection closed");
  set_status(Status::Closed, "relay connection closed");
}

void SignalingClient::handle_error(const std::string& error) {
  logger_->error("Relay connection error: {}", error);
  set_status(Status::Failed, error);
}

void SignalingClient::set_status(Status status, const std::string& detail) {
  StatusHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(status_ == status) return;
    status_ = status;
    handler = status_handler_;
  }
  if(handler) handler(status, detail);
}
