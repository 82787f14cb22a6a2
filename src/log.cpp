#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <map>
#include <vector>

namespace {

// One spdlog logger per console destination.
enum Sink { Stamped, StampedErr, Plain, PlainErr, SinkCount };

std::mutex g_sinks_mutex;
std::array<std::shared_ptr<spdlog::logger>, SinkCount> g_sinks;
std::atomic<bool> g_log_passthrough{true};

std::mutex g_named_mutex;
std::map<std::string, std::shared_ptr<Logger>> g_named_loggers;

template<typename SinkType>
std::shared_ptr<spdlog::logger> make_console(const char* name, const char* pattern, spdlog::level::level_enum flush_level) {
  auto sink = std::make_shared<SinkType>();
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  return logger;
}

void ensure_sinks() {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  if(g_sinks[Stamped]) return;
  const char* stamped = "[%H:%M:%S.%e] [%^%l%$] %v";
  g_sinks[Stamped] = make_console<spdlog::sinks::stdout_color_sink_mt>("tightrope", stamped, spdlog::level::warn);
  g_sinks[StampedErr] = make_console<spdlog::sinks::stderr_color_sink_mt>("tightrope.err", stamped, spdlog::level::err);
  g_sinks[Plain] = make_console<spdlog::sinks::stdout_color_sink_mt>("tightrope.out", "%v", spdlog::level::info);
  g_sinks[PlainErr] = make_console<spdlog::sinks::stderr_color_sink_mt>("tightrope.out_err", "%v", spdlog::level::err);
}

Sink sink_for(LogChannel channel) {
  switch(channel) {
    case LogChannel::Error: return StampedErr;
    case LogChannel::Print: return Plain;
    case LogChannel::PrintErr: return PlainErr;
    default: return Stamped;
  }
}

LogChannel channel_for(spdlog::level::level_enum level) {
  switch(level) {
    case spdlog::level::trace:
    case spdlog::level::debug: return LogChannel::Debug;
    case spdlog::level::warn: return LogChannel::Warn;
    case spdlog::level::err:
    case spdlog::level::critical: return LogChannel::Error;
    default: return LogChannel::Info;
  }
}

} // namespace

const char* to_string(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug: return "debug";
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

spdlog::level::level_enum level_of(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug: return spdlog::level::debug;
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr: return spdlog::level::err;
    default: return spdlog::level::info;
  }
}

void init(bool verbose) {
  ensure_sinks();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  g_sinks[Stamped]->set_level(level);
  g_sinks[StampedErr]->set_level(spdlog::level::info);
  g_sinks[Plain]->set_level(spdlog::level::info);
  g_sinks[PlainErr]->set_level(spdlog::level::info);
  spdlog::set_level(level);
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::write(spdlog::level::level_enum level, const std::string& message) {
  emit(channel_for(level), message);
}

void Logger::emit(LogChannel channel, const std::string& message) {
  std::string channel_name = name_.empty() ? std::string(to_string(channel))
                                           : name_ + ":" + to_string(channel);
  if(dispatch(channel_name, level_of(channel), message)) return;
  detail::emit_to_console(channel, name_, message);
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> bindings;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    bindings.reserve(listeners_.size());
    for(const auto& entry : listeners_) bindings.push_back(entry.second);
  }
  bool handled = false;
  for(auto& binding : bindings) {
    try {
      if(binding.callback(binding.user_data, channel, level, message)) handled = true;
    } catch(const std::exception& e) {
      detail::emit_to_console(LogChannel::Error, channel, fmt::format("log listener failed: {}", e.what()));
    }
  }
  return handled;
}

std::shared_ptr<Logger> logger_for(const std::string& name) {
  std::lock_guard<std::mutex> lock(g_named_mutex);
  auto& slot = g_named_loggers[name];
  if(!slot) slot = std::make_shared<Logger>(name);
  return slot;
}

namespace detail {

void emit_to_console(LogChannel channel, const std::string& source, const std::string& message) {
  ensure_sinks();
  if(!log_passthrough()) return;
  std::shared_ptr<spdlog::logger> sink;
  {
    std::lock_guard<std::mutex> lock(g_sinks_mutex);
    sink = g_sinks[sink_for(channel)];
  }
  bool bare = (channel == LogChannel::Print || channel == LogChannel::PrintErr);
  if(bare || source.empty()) {
    sink->log(level_of(channel), message);
  } else {
    sink->log(level_of(channel), fmt::format("[{}] {}", source, message));
  }
}

} // namespace detail
