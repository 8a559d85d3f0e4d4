#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>
#include <nlohmann/json.hpp>

#include <csignal>
#include <filesystem>
#include <future>
#include <optional>
#include <string>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "sync_coordinator.hpp"
#include "sync_engine.hpp"
#include "utils.hpp"

using namespace docsync;

namespace {

// Request-layer path rules: non-empty, relative, no ".." component.
bool validate_path(const std::string& path, std::string& error) {
  if(path.empty()) {
    error = "path is empty";
    return false;
  }
  std::filesystem::path p(path);
  if(p.is_absolute()) {
    error = "path must be relative: " + path;
    return false;
  }
  for(const auto& part : p) {
    if(part == "..") {
      error = "path must not contain '..': " + path;
      return false;
    }
  }
  return true;
}

int report(const SyncError& error) {
  if(!error) return 0;
  print_err(nullptr, "{} {}", error_tag(error.code), error.message());
  return 1;
}

int reject(const std::string& message) {
  print_err(nullptr, "{} {}", error_tag(make_error_code(sync_errc::invalid_argument)), message);
  return 2;
}

class CommandRunner {
public:
  explicit CommandRunner(SyncEngine& engine)
    : engine_(engine),
      coordinator_(engine.coordinator()),
      container_(engine.container_id()),
      show_progress_(engine.settings()->get<bool>("progress")) {}

  int run(const std::string& command, const std::string& arg1, const std::string& arg2) {
    if(command == "available") {
      nlohmann::json out = {{"available", coordinator_.available()}};
      print_out(nullptr, "{}", out.dump());
      return 0;
    }
    if(command == "path") {
      std::filesystem::path root;
      if(auto err = coordinator_.container_path(container_, root)) return report(err);
      print_out(nullptr, "{}", root.string());
      return 0;
    }
    if(command == "list") return list();

    std::string error;
    if(!validate_path(arg1, error)) return reject(error);
    if(command == "upload") {
      if(!validate_path(arg2, error)) return reject(error);
      return upload(arg1, arg2);
    }
    if(command == "download") {
      if(arg2.empty()) return reject("download needs a local destination");
      return download(arg1, arg2);
    }
    if(command == "read") return read(arg1);
    if(command == "write") return write(arg1, arg2);
    if(command == "exists") return exists(arg1);
    if(command == "metadata") return metadata(arg1);
    if(command == "delete") return wait_done([&](auto done){ return coordinator_.remove(container_, arg1, done); });
    if(command == "move" || command == "copy") {
      if(!validate_path(arg2, error)) return reject(error);
      if(command == "move") {
        return wait_done([&](auto done){ return coordinator_.move(container_, arg1, arg2, done); });
      }
      return wait_done([&](auto done){ return coordinator_.copy(container_, arg1, arg2, done); });
    }
    return reject("unknown command '" + command + "'");
  }

private:
  template<typename Start>
  int wait_done(Start start) {
    std::promise<SyncError> result;
    start([&result](const SyncError& err){ result.set_value(err); });
    return report(result.get_future().get());
  }

  int list() {
    std::promise<SyncError> result;
    if(!engine_.settings()->get<bool>("watch")) {
      ItemListing listing;
      coordinator_.list_items(container_, [&](const SyncError& err, const ItemListing& items){
        listing = items;
        result.set_value(err);
      });
      auto err = result.get_future().get();
      if(err) return report(err);
      print_out(nullptr, "{}", to_json(listing).dump(2));
      return 0;
    }

    asio::signal_set signals(engine_.io(), SIGINT, SIGTERM);
    auto id = coordinator_.list_items(container_,
      [&result](const SyncError& err, const ItemListing&){ result.set_value(err); },
      [](const SyncError&, const ItemListing& listing){
        print_out(nullptr, "{}", to_json(listing).dump());
      });
    signals.async_wait([this, id](const std::error_code& ec, int){
      if(!ec) coordinator_.cancel(id);
    });
    auto err = result.get_future().get();
    // Stop the io threads before the signal set goes away.
    engine_.stop();
    if(err.is(sync_errc::canceled)) return 0;
    return report(err);
  }

  std::string open_channel(const std::string& name, std::promise<void>* terminal) {
    if(!show_progress_ && !terminal) return {};
    auto show = show_progress_;
    coordinator_.create_progress_channel(name, [show, terminal](const TransferEvent& event){
      if(event.type == TransferEvent::Type::Progress) {
        if(show) print_err(nullptr, "progress {:.1f}%", event.fraction * 100.0);
        return;
      }
      if(terminal) terminal->set_value();
    });
    return name;
  }

  int upload(const std::string& local, const std::string& remote) {
    std::promise<void> monitored;
    auto channel = open_channel("upload:" + remote, show_progress_ ? &monitored : nullptr);
    int rc = wait_done([&](auto done){
      return coordinator_.upload(container_, local, remote, done, channel);
    });
    if(channel.empty()) return rc;
    // The channel always ends with exactly one terminal event; wait for it
    // so the sink never outlives `monitored`.
    auto terminal = monitored.get_future();
    if(rc == 0 && terminal.wait_for(coordinator_.options().lookup.timeout) != std::future_status::ready) {
      print_err(nullptr, "upload of {} is still being transferred", remote);
      coordinator_.cancel_progress_channel(channel);
    }
    terminal.wait();
    return rc;
  }

  int download(const std::string& remote, const std::string& local) {
    auto channel = open_channel("download:" + remote, nullptr);
    return wait_done([&](auto done){
      return coordinator_.download(container_, remote, local, done, channel);
    });
  }

  int read(const std::string& remote) {
    std::promise<SyncError> result;
    std::optional<std::string> content;
    coordinator_.read_in_place(container_, remote,
      [&](const SyncError& err, const std::optional<std::string>& bytes){
        content = bytes;
        result.set_value(err);
      });
    auto err = result.get_future().get();
    if(err) return report(err);
    if(!content) return report(SyncError(sync_errc::not_found, remote));
    print_out(nullptr, "{}", *content);
    return 0;
  }

  int write(const std::string& remote, const std::string& text) {
    return wait_done([&](auto done){
      return coordinator_.write_in_place(container_, remote, text, done);
    });
  }

  int exists(const std::string& path) {
    std::promise<SyncError> result;
    bool found = false;
    coordinator_.exists(container_, path, [&](const SyncError& err, bool value){
      found = value;
      result.set_value(err);
    });
    auto err = result.get_future().get();
    if(err) return report(err);
    nlohmann::json out = {{"exists", found}};
    print_out(nullptr, "{}", out.dump());
    return 0;
  }

  int metadata(const std::string& path) {
    std::promise<SyncError> result;
    std::optional<ItemDescriptor> item;
    coordinator_.metadata(container_, path,
      [&](const SyncError& err, const std::optional<ItemDescriptor>& value){
        item = value;
        result.set_value(err);
      });
    auto err = result.get_future().get();
    if(err) return report(err);
    if(!item) {
      print_out(nullptr, "null");
      return 0;
    }
    auto j = to_json(*item);
    std::filesystem::path root;
    if(!item->is_directory && item->download_state == DownloadState::Current &&
       !coordinator_.container_path(container_, root)) {
      auto digest = sha256_file_hex(root / item->relative_path);
      if(!digest.empty()) j["sha256"] = digest;
    }
    print_out(nullptr, "{}", j.dump(2));
    return 0;
  }

  SyncEngine& engine_;
  SyncCoordinator& coordinator_;
  std::string container_;
  bool show_progress_ = true;
};

} // namespace

int main(int argc, char** argv){
  try {
    SyncEngine::Options options;
    options.workspace_root = std::filesystem::current_path();

    SyncEngine engine(nullptr, options);
    auto settings = engine.settings();
    settings->set_settings_path(options.workspace_root / ".config" / "docsync.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "docsync");
    if(!parser.parse(argc, argv, *settings)) {
      return 2;
    }
    if(settings->help_requested()) {
      parser.usage(*settings);
      return 0;
    }

    auto logger = engine.logger();
    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    auto command = settings->get<std::string>("command");
    if(command.empty()) {
      if(settings->save_requested()) return 0;
      parser.usage(*settings);
      return 2;
    }

    engine.start();
    if(settings->get<bool>("verbose")) {
      logger->debug("Verbose logging enabled");
    }
    engine.start_background();

    CommandRunner runner(engine);
    int rc = runner.run(command, settings->get<std::string>("arg1"), settings->get<std::string>("arg2"));
    engine.stop();
    return rc;
  } catch(std::exception& e) {
    init_logging(false);
    Logger logger("docsync-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
