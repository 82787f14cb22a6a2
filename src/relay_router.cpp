#include "relay_router.hpp"

#include <nlohmann/json.hpp>

#include "log.hpp"

using json = nlohmann::json;

const char* to_string(RelayRouter::Outcome outcome) {
  switch(outcome) {
    case RelayRouter::Outcome::Registered: return "registered";
    case RelayRouter::Outcome::Forwarded: return "forwarded";
    case RelayRouter::Outcome::UnknownTarget: return "unknown-target";
    case RelayRouter::Outcome::Unregistered: return "unregistered";
    case RelayRouter::Outcome::Malformed: return "malformed";
    case RelayRouter::Outcome::Ignored: return "ignored";
    case RelayRouter::Outcome::SendFailed: return "send-failed";
  }
  return "unknown";
}

RelayRouter::RelayRouter(std::shared_ptr<Logger> logger)
  : logger_(logger ? std::move(logger) : logger_for("relay")) {}

RelayRouter::ConnectionId RelayRouter::add_connection(Sender sender) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto id = next_connection_++;
  connections_.emplace(id, Connection{std::move(sender), {}});
  return id;
}

void RelayRouter::remove_connection(ConnectionId connection) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(connection);
  if(it == connections_.end()) return;
  if(!it->second.id.empty()) {
    auto registered = ids_.find(it->second.id);
    if(registered != ids_.end() && registered->second == connection) {
      ids_.erase(registered);
      logger_->info("Unregistered {}", it->second.id);
    }
  }
  connections_.erase(it);
}

RelayRouter::Outcome RelayRouter::handle_message(ConnectionId from, const std::string& text) {
  json message;
  try {
    message = json::parse(text);
  } catch(const json::parse_error& e) {
    logger_->warn("Malformed message from connection {}: {}", from, e.what());
    return Outcome::Malformed;
  }
  if(!message.is_object()) {
    logger_->warn("Non-object message from connection {}", from);
    return Outcome::Malformed;
  }

  Sender target_sender;
  std::string target;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sender = connections_.find(from);
    if(sender == connections_.end()) return Outcome::Ignored;

    auto type_it = message.find("type");
    if(type_it != message.end() && !type_it->is_string()) {
      logger_->warn("Message with a non-string type from connection {}", from);
      return Outcome::Malformed;
    }
    std::string type = type_it != message.end() ? type_it->get<std::string>() : std::string();
    if(type == "register") {
      auto id_it = message.find("id");
      if(id_it == message.end() || !id_it->is_string() || id_it->get<std::string>().empty()) {
        logger_->warn("Register without an id from connection {}", from);
        return Outcome::Malformed;
      }
      auto id = id_it->get<std::string>();
      if(!sender->second.id.empty() && sender->second.id != id) {
        auto previous = ids_.find(sender->second.id);
        if(previous != ids_.end() && previous->second == from) ids_.erase(previous);
      }
      sender->second.id = id;
      ids_[id] = from;
      logger_->info("Registered {}", id);
      return Outcome::Registered;
    }

    auto to_it = message.find("to");
    if(to_it == message.end() || !to_it->is_string()) {
      logger_->debug("Ignoring '{}' without a target", type);
      return Outcome::Ignored;
    }
    if(sender->second.id.empty()) {
      logger_->warn("Dropping '{}' from an unregistered connection", type);
      return Outcome::Unregistered;
    }
    target = to_it->get<std::string>();
    auto registered = ids_.find(target);
    if(registered == ids_.end()) {
      logger_->warn("Dropping '{}' for unknown target {}", type, target);
      return Outcome::UnknownTarget;
    }
    target_sender = connections_.at(registered->second).sender;
  }

  // Delivered outside the lock; the sender may call back into the router.
  if(!target_sender || !target_sender(text)) {
    logger_->warn("Delivery to {} failed", target);
    return Outcome::SendFailed;
  }
  logger_->debug("Forwarded {} bytes to {}", text.size(), target);
  return Outcome::Forwarded;
}

bool RelayRouter::is_registered(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ids_.count(id) > 0;
}

std::size_t RelayRouter::connection_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

std::size_t RelayRouter::registered_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ids_.size();
}
