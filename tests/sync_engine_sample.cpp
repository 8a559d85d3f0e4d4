#include "settings_manager.hpp"
#include "sync_coordinator.hpp"
#include "sync_engine.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <future>
#include <iostream>
#include <stdexcept>

int main() {
  namespace fs = std::filesystem;
  using namespace docsync;

  auto base = fs::temp_directory_path() / "docsync_engine_sample";
  std::error_code ec;
  fs::remove_all(base, ec);
  fs::create_directories(base, ec);

  auto settings = std::make_shared<SettingsManager>();
  settings->set_settings_path(base / ".config" / "docsync.json");
  auto configure = [&](const std::string& key, const nlohmann::json& value){
    std::string error;
    if(!settings->set_from_json(key, value, error)) {
      throw std::runtime_error("Failed to set setting " + key + ": " + error);
    }
  };
  configure("container", "sample");
  configure("store_root", "store");
  configure("idle_schedule", "2,2");
  configure("backoff_schedule", "1");

  SyncEngine::Options options;
  options.workspace_root = base;
  options.threads = 2;
  SyncEngine engine(settings, options);
  engine.start();
  engine.start_background();

  auto& coordinator = engine.coordinator();
  const auto container = engine.container_id();

  std::promise<SyncError> written;
  coordinator.write_in_place(container, "notes/hello.txt", "hello from the sample",
                             [&](const SyncError& err){ written.set_value(err); });
  if(auto err = written.get_future().get()) {
    std::cerr << "write failed: " << err.message() << "\n";
    return 1;
  }

  std::promise<std::optional<std::string>> read;
  coordinator.read_in_place(container, "notes/hello.txt",
                            [&](const SyncError& err, const std::optional<std::string>& bytes){
                              if(err) std::cerr << "read failed: " << err.message() << "\n";
                              read.set_value(bytes);
                            });
  auto bytes = read.get_future().get();
  std::cout << "read back: " << bytes.value_or("<absent>") << "\n";

  std::promise<ItemListing> listed;
  coordinator.list_items(container, [&](const SyncError& err, const ItemListing& listing){
    if(err) std::cerr << "list failed: " << err.message() << "\n";
    listed.set_value(listing);
  });
  std::cout << to_json(listed.get_future().get()).dump(2) << "\n";

  engine.stop();
  fs::remove_all(base, ec);
  return 0;
}
