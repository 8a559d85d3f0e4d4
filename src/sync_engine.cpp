#include "sync_engine.hpp"

#include <stdexcept>

#include "local_store.hpp"
#include "settings_manager.hpp"
#include "sync_coordinator.hpp"

namespace docsync {

SyncEngine::SyncEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("docsync")) {
  if(options_.workspace_root.empty()) {
    options_.workspace_root = std::filesystem::current_path();
  }
  if(options_.threads == 0) {
    options_.threads = 1;
  }
}

SyncEngine::~SyncEngine() {
  stop();
  coordinator_.reset();
}

void SyncEngine::ensure_workspace() const {
  std::error_code ec;
  std::filesystem::create_directories(options_.workspace_root, ec);
  if(ec) {
    logger_->warn("Unable to create workspace {}: {}", options_.workspace_root.string(), ec.message());
  }
}

void SyncEngine::start() {
  if(started_) return;

  ensure_workspace();

  if(settings_->settings_path().empty()) {
    settings_->set_settings_path(options_.workspace_root / ".config" / "docsync.json");
  }

  init_logging(settings_->get<bool>("verbose"));

  CoordinatorOptions coordinator_options;
  std::string error;
  if(!coordinator_options_from_settings(*settings_, coordinator_options, error)) {
    logger_->error("Invalid settings: {}", error);
    throw std::runtime_error("Invalid settings: " + error);
  }

  LocalStoreOptions store_options;
  store_options.root = settings_->get_path("store_root", options_.workspace_root);
  store_options.auto_materialize = settings_->get<bool>("auto_materialize");
  store_options.auto_upload = settings_->get<bool>("auto_upload");
  store_ = std::make_shared<LocalStore>(store_options, logger_->child("local-store"));

  coordinator_ = std::make_unique<SyncCoordinator>(io_, store_, coordinator_options,
                                                   logger_->child("coordinator"));
  logger_->debug("Store root {}, read schedule {}, download schedule {}",
                 store_options.root.string(),
                 coordinator_options.read_schedule.describe(),
                 coordinator_options.download_schedule.describe());
  started_ = true;
}

SyncCoordinator& SyncEngine::coordinator() {
  if(!coordinator_) start();
  return *coordinator_;
}

std::string SyncEngine::container_id() const {
  return settings_->get<std::string>("container");
}

void SyncEngine::run() {
  if(!started_) start();
  work_.emplace(asio::make_work_guard(io_));
  io_.run();
}

void SyncEngine::start_background() {
  if(!started_) start();
  if(!io_threads_.empty()) return;
  work_.emplace(asio::make_work_guard(io_));
  for(std::size_t i = 0; i < options_.threads; ++i) {
    io_threads_.emplace_back([this](){
      io_.run();
    });
  }
}

void SyncEngine::stop() {
  if(!started_) return;
  started_ = false;

  work_.reset();
  io_.stop();
  for(auto& thread : io_threads_) {
    if(thread.joinable()) thread.join();
  }
  io_threads_.clear();
  io_.restart();
}

LogListenerHandle SyncEngine::add_log_listener(Logger::Listener listener, void* user_data) {
  if(!logger_) return 0;
  return logger_->add_listener(std::move(listener), user_data);
}

void SyncEngine::remove_log_listener(LogListenerHandle handle) {
  if(logger_ && handle != 0) {
    logger_->remove_listener(handle);
  }
}

void SyncEngine::clear_log_listeners() {
  if(logger_) {
    logger_->clear_listeners();
  }
}

} // namespace docsync
