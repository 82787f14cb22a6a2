#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "relay_router.hpp"

namespace rtc {
class WebSocket;
class WebSocketServer;
}

class Logger;

// Plain (non-TLS) WebSocket front end for RelayRouter.
class RelayServer {
public:
  struct Options {
    std::string listen_ip = "0.0.0.0";
    std::uint16_t listen_port = 6789;
  };

  explicit RelayServer(Options options, std::shared_ptr<Logger> logger = nullptr);
  ~RelayServer();

  // Throws TransportError when the port cannot be bound.
  void start();
  void stop();

  std::uint16_t port() const;
  RelayRouter& router() { return router_; }

private:
  void accept(std::shared_ptr<rtc::WebSocket> ws);
  void forget(RelayRouter::ConnectionId connection);

  Options options_;
  std::shared_ptr<Logger> logger_;
  RelayRouter router_;
  std::unique_ptr<rtc::WebSocketServer> server_;

  std::mutex sockets_mutex_;
  std::unordered_map<RelayRouter::ConnectionId, std::shared_ptr<rtc::WebSocket>> sockets_;
};
