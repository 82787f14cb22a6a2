#include "session_negotiator.hpp"

#include "errors.hpp"
#include "log.hpp"

const char* to_string(SessionNegotiator::State state) {
  switch(state) {
    case SessionNegotiator::State::Idle: return "idle";
    case SessionNegotiator::State::AwaitingRelay: return "awaiting-relay";
    case SessionNegotiator::State::Negotiating: return "negotiating";
    case SessionNegotiator::State::Open: return "open";
    case SessionNegotiator::State::Closed: return "closed";
  }
  return "unknown";
}

const char* to_string(PeerLink::State state) {
  switch(state) {
    case PeerLink::State::New: return "new";
    case PeerLink::State::Connecting: return "connecting";
    case PeerLink::State::Connected: return "connected";
    case PeerLink::State::Disconnected: return "disconnected";
    case PeerLink::State::Failed: return "failed";
    case PeerLink::State::Closed: return "closed";
  }
  return "unknown";
}

SessionNegotiator::SessionNegotiator(asio::io_context& io,
                                     std::shared_ptr<SignalingClient> signaling,
                                     PeerLinkFactory link_factory,
                                     Options options,
                                     std::shared_ptr<Logger> logger)
  : io_(io),
    signaling_(std::move(signaling)),
    link_factory_(std::move(link_factory)),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : logger_for("negotiator")),
    timeout_timer_(io) {
  if(!signaling_ || !link_factory_) {
    throw ConfigError("negotiator needs a signaling client and a peer link factory");
  }
  if(options_.negotiation_timeout.count() <= 0) {
    throw ConfigError("negotiation timeout must be positive");
  }
}

SessionNegotiator::~SessionNegotiator() {
  std::error_code ec;
  timeout_timer_.cancel(ec);
  if(link_) link_->close();
}

void SessionNegotiator::start() {
  if(state_ != State::Idle) return;
  std::weak_ptr<SessionNegotiator> weak = shared_from_this();
  // The signaling client already delivers on the loop.
  signaling_->on_envelope([weak](const SignalingEnvelope& envelope){
    if(auto self = weak.lock()) self->handle_envelope(envelope);
  });
  signaling_->on_status([weak](SignalingClient::Status status, const std::string& detail){
    if(auto self = weak.lock()) self->handle_relay_status(status, detail);
  });
  transition(State::AwaitingRelay, "connecting to relay");
}

void SessionNegotiator::close() {
  if(state_ == State::Closed) return;
  std::error_code ec;
  timeout_timer_.cancel(ec);
  if(channel_) channel_->close();
  if(link_) link_->close();
  transition(State::Closed, "closed locally");
}

void SessionNegotiator::handle_relay_status(SignalingClient::Status status, const std::string& detail) {
  switch(status) {
    case SignalingClient::Status::Registered:
      if(state_ != State::AwaitingRelay) return;
      if(!options_.target_id.empty()) {
        begin_offer();
      } else {
        logger_->info("Registered as {}, waiting for a peer to connect", options_.local_id);
        if(state_handler_) state_handler_(state_, "awaiting peer");
      }
      break;
    case SignalingClient::Status::Closed:
    case SignalingClient::Status::Failed:
      if(state_ == State::Open) {
        // The data channel no longer needs the relay.
        logger_->warn("Relay lost after negotiation: {}", detail);
        if(state_handler_) state_handler_(state_, "relay lost: " + detail);
        return;
      }
      fail(TransportError("relay: " + detail).what());
      break;
    default:
      break;
  }
}

void SessionNegotiator::handle_envelope(const SignalingEnvelope& envelope) {
  if(state_ == State::Closed) {
    logger_->debug("Ignoring {} after close", envelope.type);
    return;
  }
  try {
    if(envelope.type == "offer") {
      handle_offer(envelope);
    } else if(envelope.type == "answer") {
      handle_answer(envelope);
    } else if(envelope.type == "candidate") {
      handle_candidate(envelope);
    }
  } catch(const ProtocolError& e) {
    logger_->warn("Dropping {} from {}: {}", envelope.type, envelope.from, e.what());
  } catch(const std::exception& e) {
    logger_->error("Failed to handle {} from {}: {}", envelope.type, envelope.from, e.what());
  }
}

void SessionNegotiator::begin_offer() {
  remote_id_ = options_.target_id;
  transition(State::Negotiating, "sending offer to " + remote_id_);
  arm_timeout();
  if(!create_link()) return;
  try {
    link_->create_offer(options_.channel_label);
  } catch(const std::exception& e) {
    fail(TransportError(std::string("cannot create offer: ") + e.what()).what());
  }
}

void SessionNegotiator::handle_offer(const SignalingEnvelope& envelope) {
  if(link_ || state_ == State::Negotiating || state_ == State::Open) {
    logger_->warn("Ignoring offer from {}: already negotiating with {}", envelope.from, remote_id_);
    return;
  }
  if(!options_.target_id.empty() && envelope.from != options_.target_id) {
    logger_->warn("Ignoring offer from unexpected peer {}", envelope.from);
    return;
  }
  if(envelope.from.empty()) {
    throw ProtocolError("offer without a sender");
  }
  auto offer = description_from(envelope);

  remote_id_ = envelope.from;
  transition(State::Negotiating, "answering offer from " + remote_id_);
  arm_timeout();
  if(!create_link()) return;
  try {
    link_->accept_offer(offer);
  } catch(const std::exception& e) {
    fail(TransportError(std::string("cannot accept offer: ") + e.what()).what());
    return;
  }
  remote_description_set_ = true;
  flush_pending_candidates();
}

void SessionNegotiator::handle_answer(const SignalingEnvelope& envelope) {
  if(!link_ || remote_description_set_ || envelope.from != remote_id_) {
    logger_->warn("Ignoring unexpected answer from {}", envelope.from);
    return;
  }
  auto answer = description_from(envelope);
  try {
    link_->accept_answer(answer);
  } catch(const std::exception& e) {
    fail(TransportError(std::string("cannot accept answer: ") + e.what()).what());
    return;
  }
  remote_description_set_ = true;
  flush_pending_candidates();
}

void SessionNegotiator::handle_candidate(const SignalingEnvelope& envelope) {
  auto candidate = candidate_from(envelope);
  if(link_ && remote_description_set_) {
    if(envelope.from == remote_id_) {
      apply_candidate(candidate);
    } else {
      logger_->debug("Dropping candidate from {}: connected to {}", envelope.from, remote_id_);
    }
    return;
  }
  logger_->debug("Queueing candidate from {} until its description arrives", envelope.from);
  pending_candidates_.push_back({envelope.from, std::move(candidate)});
}

void SessionNegotiator::flush_pending_candidates() {
  std::vector<PendingCandidate> pending;
  pending.swap(pending_candidates_);
  for(auto& entry : pending) {
    if(entry.from == remote_id_) {
      apply_candidate(entry.candidate);
    } else {
      logger_->debug("Dropping queued candidate from {}", entry.from);
    }
  }
}

void SessionNegotiator::apply_candidate(const IceCandidate& candidate) {
  try {
    link_->add_remote_candidate(candidate);
  } catch(const std::exception& e) {
    logger_->warn("Remote candidate rejected: {}", e.what());
  }
}

bool SessionNegotiator::create_link() {
  std::weak_ptr<SessionNegotiator> weak = shared_from_this();
  asio::io_context* io = &io_;

  PeerLink::Callbacks callbacks;
  callbacks.local_description = [io, weak](const SessionDescription& description){
    asio::post(*io, [weak, description](){
      if(auto self = weak.lock()) self->send_local_description(description);
    });
  };
  callbacks.local_candidate = [io, weak](const IceCandidate& candidate){
    asio::post(*io, [weak, candidate](){
      if(auto self = weak.lock()) self->send_local_candidate(candidate);
    });
  };
  callbacks.channel = [io, weak](std::shared_ptr<MessageChannel> channel){
    asio::post(*io, [weak, channel](){
      if(auto self = weak.lock()) self->attach_channel(channel);
    });
  };
  callbacks.state = [io, weak](PeerLink::State state){
    asio::post(*io, [weak, state](){
      if(auto self = weak.lock()) self->handle_link_state(state);
    });
  };
  try {
    link_ = link_factory_(std::move(callbacks));
  } catch(const std::exception& e) {
    fail(TransportError(std::string("cannot create peer connection: ") + e.what()).what());
    return false;
  }
  if(!link_) {
    fail("peer link factory returned nothing");
    return false;
  }
  return true;
}

void SessionNegotiator::send_local_description(const SessionDescription& description) {
  if(state_ != State::Negotiating) return;
  try {
    if(description.type == "answer") {
      signaling_->send(make_answer(description, remote_id_, options_.local_id));
    } else {
      signaling_->send(make_offer(description, remote_id_, options_.local_id));
    }
    logger_->info("Sent {} to {}", description.type, remote_id_);
  } catch(const TransportError& e) {
    fail(e.what());
  }
}

void SessionNegotiator::send_local_candidate(const IceCandidate& candidate) {
  if(state_ != State::Negotiating && state_ != State::Open) return;
  try {
    signaling_->send(make_candidate(candidate, remote_id_, options_.local_id));
  } catch(const TransportError& e) {
    // Candidates gathered after the relay went away are harmless to lose.
    logger_->debug("Candidate not sent: {}", e.what());
  }
}

void SessionNegotiator::attach_channel(std::shared_ptr<MessageChannel> channel) {
  if(!channel || state_ == State::Closed) return;
  channel_ = std::move(channel);
  std::weak_ptr<SessionNegotiator> weak = shared_from_this();
  asio::io_context* io = &io_;
  channel_->on_closed([io, weak](){
    asio::post(*io, [weak](){ if(auto self = weak.lock()) self->handle_channel_closed(); });
  });
  channel_->on_open([io, weak](){
    asio::post(*io, [weak](){ if(auto self = weak.lock()) self->handle_channel_open(); });
  });
}

void SessionNegotiator::handle_channel_open() {
  if(state_ != State::Negotiating) return;
  std::error_code ec;
  timeout_timer_.cancel(ec);
  transition(State::Open, "connected to " + remote_id_);
  if(channel_handler_) channel_handler_(channel_);
}

void SessionNegotiator::handle_channel_closed() {
  if(state_ == State::Closed) return;
  logger_->warn("Data channel to {} closed", remote_id_);
  std::error_code ec;
  timeout_timer_.cancel(ec);
  if(link_) link_->close();
  transition(State::Closed, "data channel closed");
}

void SessionNegotiator::handle_link_state(PeerLink::State state) {
  logger_->debug("Peer connection {}", to_string(state));
  if(state == PeerLink::State::Failed) {
    fail(TransportError("peer connection failed").what());
  } else if((state == PeerLink::State::Disconnected || state == PeerLink::State::Closed) &&
            state_ == State::Open) {
    handle_channel_closed();
  }
}

void SessionNegotiator::arm_timeout() {
  timeout_timer_.expires_after(options_.negotiation_timeout);
  std::weak_ptr<SessionNegotiator> weak = shared_from_this();
  timeout_timer_.async_wait([weak](const std::error_code& ec){
    if(ec) return;
    auto self = weak.lock();
    if(!self || self->state_ != State::Negotiating) return;
    TimeoutError error("no data channel after " +
                       std::to_string(self->options_.negotiation_timeout.count()) + " ms");
    self->fail(error.what());
  });
}

void SessionNegotiator::fail(const std::string& reason) {
  if(state_ == State::Closed) return;
  logger_->error("Negotiation failed: {}", reason);
  std::error_code ec;
  timeout_timer_.cancel(ec);
  if(channel_) channel_->close();
  if(link_) link_->close();
  transition(State::Closed, reason);
}

void SessionNegotiator::transition(State next, const std::string& detail) {
  if(state_ == next) return;
  logger_->debug("{} -> {} ({})", to_string(state_), to_string(next), detail);
  state_ = next;
  if(state_handler_) state_handler_(next, detail);
}
