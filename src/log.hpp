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

namespace docsync {

void init_logging(bool verbose = false);
void set_log_passthrough(bool enabled);
bool log_passthrough();

// Where a message ends up when no listener consumes it. The diagnostic
// streams are timestamped, the print streams carry bare CLI output.
enum class LogStream {
  info,
  warn,
  error,
  debug,
  print,
  print_err,
};

const char* log_stream_name(LogStream stream);
spdlog::level::level_enum log_stream_level(LogStream stream);

// Writes straight to the process sinks, tagging the line with `channel`
// unless it is empty.
void write_to_sinks(LogStream stream, const std::string& channel, const std::string& message);

using LogListenerHandle = std::size_t;

// Named logging channel. Listeners see every message before the default
// sinks do; a listener returning true consumes the message.
class Logger {
public:
  using Listener = std::function<bool(void* user_data,
                                      const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  explicit Logger(std::string name);

  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);
  void clear_listeners();

  // Child loggers share the listener set of their parent and prefix the
  // parent's name, e.g. "coordinator/watchdog".
  std::shared_ptr<Logger> child(const std::string& name);

  template<typename... Args>
  void write(LogStream stream, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(stream, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogStream::info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogStream::warn, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogStream::error, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogStream::debug, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogStream::print, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogStream::print_err, fmt, std::forward<Args>(args)...);
  }

private:
  struct ListenerBinding {
    void* user_data = nullptr;
    Listener callback;
  };

  struct ListenerSet {
    std::mutex mutex;
    std::unordered_map<LogListenerHandle, ListenerBinding> listeners;
    std::atomic<LogListenerHandle> next_id{1};
  };

  Logger(std::string name, std::shared_ptr<ListenerSet> listeners);

  void emit(LogStream stream, const std::string& message);
  bool notify_listeners(const std::string& channel,
                        spdlog::level::level_enum level,
                        const std::string& message);

  std::string name_;
  std::shared_ptr<ListenerSet> listeners_;
};

// Helpers for components that may run without a logger attached.
template<typename... Args>
void log_to(Logger* logger, LogStream stream, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) {
    logger->write(stream, fmt, std::forward<Args>(args)...);
  } else {
    write_to_sinks(stream, std::string(), fmt::format(fmt, std::forward<Args>(args)...));
  }
}

template<typename... Args>
void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogStream::info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogStream::warn, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogStream::error, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogStream::debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogStream::print, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogStream::print_err, fmt, std::forward<Args>(args)...);
}

} // namespace docsync
