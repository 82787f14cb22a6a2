#pragma once

#include <asio.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "protocol.hpp"

class Logger;

// Text WebSocket to the relay. Handlers may fire on any thread.
class SignalingSocket {
public:
  virtual ~SignalingSocket() = default;

  virtual void open(const std::string& url) = 0;
  virtual bool send(const std::string& text) = 0;
  virtual bool is_open() const = 0;
  virtual void close() = 0;

  virtual void on_open(std::function<void()> handler) = 0;
  virtual void on_message(std::function<void(const std::string&)> handler) = 0;
  virtual void on_closed(std::function<void()> handler) = 0;
  virtual void on_error(std::function<void(const std::string&)> handler) = 0;
};

using SignalingSocketFactory = std::function<std::unique_ptr<SignalingSocket>()>;

// Registers the local id with the relay and turns relay traffic into
// envelopes, delivered in arrival order on the io_context.
class SignalingClient : public std::enable_shared_from_this<SignalingClient> {
public:
  enum class Status { Idle, Connecting, Registered, Closed, Failed };

  using EnvelopeHandler = std::function<void(const SignalingEnvelope&)>;
  using StatusHandler = std::function<void(Status, const std::string& detail)>;

  SignalingClient(asio::io_context& io,
                  std::unique_ptr<SignalingSocket> socket,
                  std::string local_id,
                  std::shared_ptr<Logger> logger = nullptr);
  ~SignalingClient();

  // Registration is sent as soon as the socket opens. A drop afterwards is
  // reported through the status handler and never retried.
  void connect(const std::string& relay_url);
  // Throws TransportError when the relay socket is not open.
  void send(const json& envelope);
  void close();

  void on_envelope(EnvelopeHandler handler);
  void on_status(StatusHandler handler);

  Status status() const;
  const std::string& local_id() const { return local_id_; }

private:
  void handle_open();
  void handle_text(const std::string& text);
  void handle_closed();
  void handle_error(const std::string& error);
  void set_status(Status status, const std::string& detail);

  asio::io_context& io_;
  std::unique_ptr<SignalingSocket> socket_;
  std::string local_id_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  Status status_ = Status::Idle;
  EnvelopeHandler envelope_handler_;
  StatusHandler status_handler_;
};

const char* to_string(SignalingClient::Status status);
