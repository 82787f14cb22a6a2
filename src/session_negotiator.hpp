#pragma once

#include <asio.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "peer_link.hpp"
#include "signaling_client.hpp"

class Logger;

// Drives one offer/answer/candidate exchange through the relay and hands
// out the data channel once it opens.
//
// Idle -> AwaitingRelay -> Negotiating -> Open -> Closed
//
// The side that knows a target id makes the offer as soon as the relay
// accepts its registration. The other side waits for an offer and answers
// it. There is no renegotiation: once Closed, a new negotiator is needed.
class SessionNegotiator : public std::enable_shared_from_this<SessionNegotiator> {
public:
  enum class State { Idle, AwaitingRelay, Negotiating, Open, Closed };

  struct Options {
    std::string local_id;
    std::string target_id;
    std::chrono::milliseconds negotiation_timeout{30000};
    std::string channel_label = "dataChannel";
  };

  using ChannelHandler = std::function<void(std::shared_ptr<MessageChannel>)>;
  using StateHandler = std::function<void(State, const std::string& detail)>;

  SessionNegotiator(asio::io_context& io,
                    std::shared_ptr<SignalingClient> signaling,
                    PeerLinkFactory link_factory,
                    Options options,
                    std::shared_ptr<Logger> logger = nullptr);
  ~SessionNegotiator();

  // Subscribes to the signaling client. Call before connecting it.
  void start();
  void close();

  void on_channel_open(ChannelHandler handler) { channel_handler_ = std::move(handler); }
  void on_state(StateHandler handler) { state_handler_ = std::move(handler); }

  State state() const { return state_; }
  const std::string& remote_id() const { return remote_id_; }
  std::shared_ptr<MessageChannel> channel() const { return channel_; }
  std::size_t queued_candidates() const { return pending_candidates_.size(); }

private:
  struct PendingCandidate {
    std::string from;
    IceCandidate candidate;
  };

  void handle_relay_status(SignalingClient::Status status, const std::string& detail);
  void handle_envelope(const SignalingEnvelope& envelope);
  void handle_offer(const SignalingEnvelope& envelope);
  void handle_answer(const SignalingEnvelope& envelope);
  void handle_candidate(const SignalingEnvelope& envelope);

  void begin_offer();
  // False when the link could not be built; the negotiation is then closed.
  bool create_link();
  void attach_channel(std::shared_ptr<MessageChannel> channel);
  void handle_channel_open();
  void handle_channel_closed();
  void handle_link_state(PeerLink::State state);
  void send_local_description(const SessionDescription& description);
  void send_local_candidate(const IceCandidate& candidate);
  void flush_pending_candidates();
  void apply_candidate(const IceCandidate& candidate);

  void arm_timeout();
  void fail(const std::string& reason);
  void transition(State next, const std::string& detail);

  asio::io_context& io_;
  std::shared_ptr<SignalingClient> signaling_;
  PeerLinkFactory link_factory_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  State state_ = State::Idle;
  std::string remote_id_;
  std::unique_ptr<PeerLink> link_;
  std::shared_ptr<MessageChannel> channel_;
  bool remote_description_set_ = false;
  std::vector<PendingCandidate> pending_candidates_;
  asio::steady_timer timeout_timer_;

  ChannelHandler channel_handler_;
  StateHandler state_handler_;
};

const char* to_string(SessionNegotiator::State state);
