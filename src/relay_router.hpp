#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

class Logger;

// Routing table of the relay. Knows nothing about sockets: each connection
// is a handle plus a function that delivers text to it.
class RelayRouter {
public:
  using ConnectionId = std::uint64_t;
  using Sender = std::function<bool(const std::string&)>;

  enum class Outcome {
    Registered,
    Forwarded,
    UnknownTarget,
    Unregistered,  // sender has not registered yet
    Malformed,
    Ignored,       // no "to" field
    SendFailed
  };

  explicit RelayRouter(std::shared_ptr<Logger> logger = nullptr);

  ConnectionId add_connection(Sender sender);
  // Drops the connection and every id registered through it.
  void remove_connection(ConnectionId connection);

  // "register" binds its id to the connection (a later registration of the
  // same id wins). Anything carrying "to" from a registered connection is
  // delivered verbatim to the connection registered under that id.
  Outcome handle_message(ConnectionId from, const std::string& text);

  bool is_registered(const std::string& id) const;
  std::size_t connection_count() const;
  std::size_t registered_count() const;

private:
  struct Connection {
    Sender sender;
    std::string id;
  };

  std::shared_ptr<Logger> logger_;
  mutable std::mutex mutex_;
  ConnectionId next_connection_ = 1;
  std::unordered_map<ConnectionId, Connection> connections_;
  std::unordered_map<std::string, ConnectionId> ids_;
};

const char* to_string(RelayRouter::Outcome outcome);
