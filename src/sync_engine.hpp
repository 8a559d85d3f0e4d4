#pragma once

#include <asio.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "log.hpp"

namespace docsync {

class LocalStore;
class SettingsManager;
class SyncCoordinator;

// Owns the io_context, the worker thread, the local store and the
// coordinator built from the current settings.
class SyncEngine {
public:
  struct Options {
    std::filesystem::path workspace_root = std::filesystem::current_path();
    // Worker threads started by start_background().
    std::size_t threads = 1;
  };

  SyncEngine(std::shared_ptr<SettingsManager> settings, Options options);
  ~SyncEngine();

  // Builds the store and coordinator. Throws std::runtime_error when the
  // settings cannot be turned into coordinator options.
  void start();
  void run();
  void start_background();
  void stop();

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  std::shared_ptr<LocalStore> store() const { return store_; }
  SyncCoordinator& coordinator();
  asio::io_context& io() { return io_; }

  const std::filesystem::path& workspace_root() const { return options_.workspace_root; }
  std::string container_id() const;

  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);
  void clear_log_listeners();

private:
  void ensure_workspace() const;

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  asio::io_context io_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::vector<std::thread> io_threads_;
  std::shared_ptr<LocalStore> store_;
  std::unique_ptr<SyncCoordinator> coordinator_;
  bool started_ = false;
  std::shared_ptr<Logger> logger_;
};

} // namespace docsync
