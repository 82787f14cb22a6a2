#pragma once

#include <functional>
#include <memory>
#include <string>

#include "message_channel.hpp"
#include "protocol.hpp"

// One peer connection: SDP exchange, trickled ICE candidates and the single
// data channel carried over it.
class PeerLink {
public:
  enum class State { New, Connecting, Connected, Disconnected, Failed, Closed };

  struct Callbacks {
    std::function<void(const SessionDescription&)> local_description;
    std::function<void(const IceCandidate&)> local_candidate;
    std::function<void(std::shared_ptr<MessageChannel>)> channel;
    std::function<void(State)> state;
  };

  virtual ~PeerLink() = default;

  // Offerer side: creates the data channel, which produces a local offer
  // through Callbacks::local_description. The channel is reported right away.
  virtual void create_offer(const std::string& channel_label) = 0;
  // Answerer side: applies the remote offer, which produces a local answer.
  // The channel is reported once the remote side opens it.
  virtual void accept_offer(const SessionDescription& offer) = 0;
  virtual void accept_answer(const SessionDescription& answer) = 0;
  virtual void add_remote_candidate(const IceCandidate& candidate) = 0;
  virtual void close() = 0;
};

using PeerLinkFactory = std::function<std::unique_ptr<PeerLink>(PeerLink::Callbacks)>;

const char* to_string(PeerLink::State state);
