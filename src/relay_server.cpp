#include "relay_server.hpp"

#include <rtc/rtc.hpp>

#include <variant>

#include "errors.hpp"
#include "log.hpp"

RelayServer::RelayServer(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : logger_for("relay")),
    router_(logger_) {}

RelayServer::~RelayServer() {
  stop();
}

void RelayServer::start() {
  if(server_) return;
  rtc::WebSocketServer::Configuration config;
  config.port = options_.listen_port;
  config.enableTls = false;
  config.bindAddress = options_.listen_ip;
  try {
    server_ = std::make_unique<rtc::WebSocketServer>(config);
  } catch(const std::exception& e) {
    throw TransportError("cannot listen on " + options_.listen_ip + ":" +
                         std::to_string(options_.listen_port) + ": " + e.what());
  }
  server_->onClient([this](std::shared_ptr<rtc::WebSocket> ws){
    accept(std::move(ws));
  });
  logger_->info("Relay listening on {}:{}", options_.listen_ip, server_->port());
}

void RelayServer::stop() {
  if(!server_) return;
  server_->stop();
  std::unordered_map<RelayRouter::ConnectionId, std::shared_ptr<rtc::WebSocket>> sockets;
  {
    std::lock_guard<std::mutex> lock(sockets_mutex_);
    sockets.swap(sockets_);
  }
  for(auto& entry : sockets) {
    entry.second->resetCallbacks();
    entry.second->close();
    router_.remove_connection(entry.first);
  }
  server_.reset();
}

std::uint16_t RelayServer::port() const {
  return server_ ? server_->port() : options_.listen_port;
}

void RelayServer::accept(std::shared_ptr<rtc::WebSocket> ws) {
  std::weak_ptr<rtc::WebSocket> weak = ws;
  auto connection = router_.add_connection([weak](const std::string& text){
    auto socket = weak.lock();
    return socket && socket->isOpen() && socket->send(text);
  });
  {
    std::lock_guard<std::mutex> lock(sockets_mutex_);
    sockets_[connection] = ws;
  }
  logger_->debug("Connection {} accepted", connection);

  ws->onMessage([this, connection](rtc::message_variant data){
    if(!std::holds_alternative<std::string>(data)) {
      logger_->warn("Ignoring binary frame from connection {}", connection);
      return;
    }
    auto outcome = router_.handle_message(connection, std::get<std::string>(data));
    logger_->debug("Connection {}: {}", connection, to_string(outcome));
  });
  ws->onError([this, connection](std::string error){
    logger_->warn("Connection {} error: {}", connection, error);
  });
  ws->onClosed([this, connection](){
    forget(connection);
  });
}

void RelayServer::forget(RelayRouter::ConnectionId connection) {
  router_.remove_connection(connection);
  std::shared_ptr<rtc::WebSocket> socket;
  {
    std::lock_guard<std::mutex> lock(sockets_mutex_);
    auto it = sockets_.find(connection);
    if(it == sockets_.end()) return;
    socket = std::move(it->second);
    sockets_.erase(it);
  }
  logger_->debug("Connection {} closed", connection);
}
