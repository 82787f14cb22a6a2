#pragma once

#include <memory>
#include <string>

#include "peer_link.hpp"
#include "signaling_client.hpp"

// libdatachannel-backed implementations of the transport seams.

// Routes libdatachannel's own log into the "rtc" logger.
void init_rtc_logging(bool verbose);

// Peer links use the given STUN server; an empty string means host
// candidates only.
PeerLinkFactory make_rtc_peer_link_factory(const std::string& stun_server);

SignalingSocketFactory make_rtc_signaling_socket_factory();
