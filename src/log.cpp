#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <exception>
#include <vector>

namespace docsync {

namespace {

constexpr const char* kStampedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

// One spdlog logger per destination: stamped stdout, stamped stderr,
// plain stdout, plain stderr.
enum Destination { kStampedOut, kStampedErr, kPlainOut, kPlainErr, kDestinationCount };

struct Sinks {
  std::array<std::shared_ptr<spdlog::logger>, kDestinationCount> loggers;
};

std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_logger(const char* name,
                                            spdlog::sink_ptr sink,
                                            const char* pattern,
                                            spdlog::level::level_enum flush_level) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  return logger;
}

Sinks& sinks() {
  static Sinks instance = []{
    Sinks s;
    s.loggers[kStampedOut] = make_logger("docsync",
      std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), kStampedPattern, spdlog::level::warn);
    s.loggers[kStampedErr] = make_logger("docsync.err",
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), kStampedPattern, spdlog::level::err);
    s.loggers[kPlainOut] = make_logger("docsync.out",
      std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), "%v", spdlog::level::info);
    s.loggers[kPlainErr] = make_logger("docsync.out_err",
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), "%v", spdlog::level::err);
    return s;
  }();
  return instance;
}

Destination destination_for(LogStream stream) {
  switch(stream) {
    case LogStream::print: return kPlainOut;
    case LogStream::print_err: return kPlainErr;
    case LogStream::error: return kStampedErr;
    default: return kStampedOut;
  }
}

} // namespace

const char* log_stream_name(LogStream stream) {
  switch(stream) {
    case LogStream::info: return "info";
    case LogStream::warn: return "warn";
    case LogStream::error: return "error";
    case LogStream::debug: return "debug";
    case LogStream::print: return "print";
    case LogStream::print_err: return "print_err";
  }
  return "info";
}

spdlog::level::level_enum log_stream_level(LogStream stream) {
  switch(stream) {
    case LogStream::warn: return spdlog::level::warn;
    case LogStream::error:
    case LogStream::print_err: return spdlog::level::err;
    case LogStream::debug: return spdlog::level::debug;
    default: return spdlog::level::info;
  }
}

void init_logging(bool verbose) {
  auto& s = sinks();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  s.loggers[kStampedOut]->set_level(level);
  for(auto d : {kStampedErr, kPlainOut, kPlainErr}) {
    s.loggers[d]->set_level(spdlog::level::info);
  }
  spdlog::set_default_logger(s.loggers[kStampedOut]);
  spdlog::set_level(level);
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void write_to_sinks(LogStream stream, const std::string& channel, const std::string& message) {
  if(!log_passthrough()) return;
  auto& target = sinks().loggers[destination_for(stream)];
  auto level = log_stream_level(stream);
  const bool plain = stream == LogStream::print || stream == LogStream::print_err;
  if(channel.empty() || plain) {
    target->log(level, message);
  } else {
    target->log(level, fmt::format("[{}] {}", channel, message));
  }
}

Logger::Logger(std::string name)
  : name_(std::move(name)), listeners_(std::make_shared<ListenerSet>()) {}

Logger::Logger(std::string name, std::shared_ptr<ListenerSet> listeners)
  : name_(std::move(name)), listeners_(std::move(listeners)) {}

std::shared_ptr<Logger> Logger::child(const std::string& name) {
  std::string full = name_.empty() ? name : name_ + "/" + name;
  return std::shared_ptr<Logger>(new Logger(std::move(full), listeners_));
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listeners_->mutex);
  const auto id = listeners_->next_id++;
  listeners_->listeners.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listeners_->mutex);
  listeners_->listeners.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(listeners_->mutex);
  listeners_->listeners.clear();
}

void Logger::emit(LogStream stream, const std::string& message) {
  const std::string channel = name_.empty()
    ? std::string(log_stream_name(stream))
    : name_ + ":" + log_stream_name(stream);
  if(notify_listeners(channel, log_stream_level(stream), message)) return;
  write_to_sinks(stream, name_, message);
}

bool Logger::notify_listeners(const std::string& channel,
                              spdlog::level::level_enum level,
                              const std::string& message) {
  std::vector<ListenerBinding> snapshot;
  {
    std::lock_guard<std::mutex> lock(listeners_->mutex);
    snapshot.reserve(listeners_->listeners.size());
    for(const auto& entry : listeners_->listeners) snapshot.push_back(entry.second);
  }
  bool consumed = false;
  for(auto& binding : snapshot) {
    try {
      consumed |= binding.callback(binding.user_data, channel, level, message);
    } catch(const std::exception& e) {
      write_to_sinks(LogStream::error, channel, fmt::format("log listener threw: {}", e.what()));
    }
  }
  return consumed;
}

} // namespace docsync
