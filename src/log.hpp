#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

// Stamped channels carry time and level; the print channels are bare text
// for user-facing output.
enum class LogChannel { Debug, Info, Warn, Error, Print, PrintErr };

const char* to_string(LogChannel channel);
spdlog::level::level_enum level_of(LogChannel channel);

// Configures the console sinks. Safe to call more than once; the level is
// re-applied on every call.
void init(bool verbose = false);

// When disabled, nothing reaches the console. Listeners still fire, which is
// how the test runners keep output quiet while capturing it.
void set_log_passthrough(bool enabled);
bool log_passthrough();

using LogListenerHandle = std::size_t;

// Named source of log lines ("session", "router", ...). Lines go to every
// listener first and reach the console unless one of them claims the line.
class Logger {
public:
  // Returning true from a listener marks the line as handled and keeps it off
  // the console.
  using Listener = std::function<bool(void* user_data,
                                      const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  Logger() = default;
  explicit Logger(std::string name) : name_(std::move(name)) {}

  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Debug, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Info, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Warn, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Error, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Print, fmt::format(fmt, std::forward<Args>(args)...));
  }

  // Pre-formatted text from other libraries, routed by level.
  void write(spdlog::level::level_enum level, const std::string& message);

  void emit(LogChannel channel, const std::string& message);

private:
  struct ListenerBinding {
    void* user_data = nullptr;
    Listener callback;
  };

  bool dispatch(const std::string& channel, spdlog::level::level_enum level, const std::string& message);

  std::string name_;
  std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, ListenerBinding> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

// Process-wide named loggers. Components constructed without an explicit
// logger pick theirs from here so tests can attach to a well known name.
std::shared_ptr<Logger> logger_for(const std::string& name);

namespace detail {
void emit_to_console(LogChannel channel, const std::string& source, const std::string& message);
} // namespace detail

// Logs through `logger` when there is one, straight to the console otherwise.
template<typename... Args>
inline void log_to(Logger* logger,
                   LogChannel channel,
                   spdlog::format_string_t<Args...> fmt,
                   Args&&... args) {
  auto message = fmt::format(fmt, std::forward<Args>(args)...);
  if(logger) {
    logger->emit(channel, message);
  } else {
    detail::emit_to_console(channel, std::string(), message);
  }
}

template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Print, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::PrintErr, fmt, std::forward<Args>(args)...);
}
