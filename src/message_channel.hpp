#pragma once

#include <functional>
#include <string>

// Ordered text channel between the two participants. Implementations may
// invoke handlers from any thread; consumers post onto their own loop.
class MessageChannel {
public:
  using OpenHandler = std::function<void()>;
  using MessageHandler = std::function<void(const std::string&)>;
  using ClosedHandler = std::function<void()>;

  virtual ~MessageChannel() = default;

  // False when the channel is not open or the transport refused the line.
  virtual bool send(const std::string& line) = 0;
  virtual bool is_open() const = 0;
  virtual void close() = 0;

  // Installing an open handler on a channel that is already open fires it.
  virtual void on_open(OpenHandler handler) = 0;
  virtual void on_message(MessageHandler handler) = 0;
  virtual void on_closed(ClosedHandler handler) = 0;
};
