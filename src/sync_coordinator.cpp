#include "sync_coordinator.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

#include "settings_manager.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace docsync {

namespace {

class StringByteReader : public ByteReader {
public:
  explicit StringByteReader(const std::string& data) : data_(data) {}

  std::size_t read(char* buffer, std::size_t size, std::error_code& ec) override {
    ec.clear();
    std::size_t n = std::min(size, data_.size() - offset_);
    std::memcpy(buffer, data_.data() + offset_, n);
    offset_ += n;
    return n;
  }

private:
  const std::string& data_;
  std::size_t offset_ = 0;
};

class StringByteWriter : public ByteWriter {
public:
  std::size_t write(const char* buffer, std::size_t size, std::error_code& ec) override {
    ec.clear();
    data_.append(buffer, size);
    return size;
  }

  std::string take() { return std::move(data_); }

private:
  std::string data_;
};

SyncError item_path(const std::string& raw, std::string& out) {
  out = strip_trailing_slash(normalize_relative_path(raw));
  if(out.empty()) return SyncError(sync_errc::invalid_argument, "empty item path");
  return {};
}

SyncError remove_existing(const fs::path& target) {
  std::error_code ec;
  if(!fs::exists(fs::symlink_status(target, ec))) return {};
  fs::remove_all(target, ec);
  if(ec) return wrap_store_error(ec, "cannot remove " + target.string());
  return {};
}

SyncError ensure_parent(const fs::path& target) {
  if(!target.has_parent_path()) return {};
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if(ec) return wrap_store_error(ec, "cannot create " + target.parent_path().string());
  return {};
}

} // namespace

bool coordinator_options_from_settings(const SettingsManager& settings,
                                       CoordinatorOptions& options,
                                       std::string& error) {
  auto schedule = [&](const char* idle_key, const char* backoff_key, WatchdogSchedule& out){
    auto idle = settings.get_schedule(idle_key, error);
    if(!error.empty()) return false;
    auto backoff = settings.get_schedule(backoff_key, error);
    if(!error.empty()) return false;
    out.idle = std::move(idle);
    out.backoff = std::move(backoff);
    out.attempts = 0;
    return true;
  };
  if(!schedule("idle_schedule", "backoff_schedule", options.read_schedule)) return false;
  if(!schedule("download_idle_schedule", "download_backoff_schedule", options.download_schedule)) return false;

  int timeout_s = settings.get<int>("query_timeout_s");
  int warning_s = settings.get<int>("query_warning_s");
  int buffer_kb = settings.get<int>("copy_buffer_kb");
  if(timeout_s <= 0) {
    error = "query_timeout_s must be positive";
    return false;
  }
  if(warning_s < 0) {
    error = "query_warning_s must not be negative";
    return false;
  }
  if(buffer_kb <= 0) {
    error = "copy_buffer_kb must be positive";
    return false;
  }
  options.lookup.timeout = std::chrono::seconds(timeout_s);
  options.lookup.warning = std::chrono::seconds(warning_s);
  options.copy_buffer_size = static_cast<std::size_t>(buffer_kb) * 1024;
  return true;
}

SyncCoordinator::SyncCoordinator(asio::io_context& io,
                                 std::shared_ptr<StoreBackend> backend,
                                 CoordinatorOptions options,
                                 std::shared_ptr<Logger> logger)
  : io_(io),
    backend_(std::move(backend)),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("coordinator")),
    query_logger_(logger_->child("live-query")),
    watchdog_logger_(logger_->child("watchdog")),
    registry_(std::make_shared<ObserverRegistry>()),
    resolver_(ConflictResolver::create(io, backend_, logger_->child("conflicts"))),
    copier_(options_.copy_buffer_size) {
  resolver_->attach();
}

SyncCoordinator::~SyncCoordinator() {
  resolver_->detach();
  auto active = active_operations();
  if(active > 0) {
    log_debug(logger_.get(), "coordinator destroyed with {} operation(s) in flight", active);
  }
}

bool SyncCoordinator::available() const {
  return backend_->available();
}

SyncError SyncCoordinator::container_path(const std::string& container_id, fs::path& out) const {
  SyncError error;
  auto container = backend_->resolve_container(container_id, error);
  if(!container) return error;
  out = container->root;
  return {};
}

std::optional<Container> SyncCoordinator::resolve(const std::string& container_id, SyncError& error) {
  return backend_->resolve_container(container_id, error);
}

SyncCoordinator::OperationPtr SyncCoordinator::begin(const char* kind) {
  std::lock_guard lg(operations_mutex_);
  auto op = std::make_shared<Operation>(next_operation_id_++, kind, asio::make_strand(io_));
  operations_[op->id] = op;
  log_debug(logger_.get(), "{} operation {} started", kind, op->id);
  return op;
}

bool SyncCoordinator::complete(const OperationPtr& op) {
  if(op->finished) return false;
  op->finished = true;
  op->on_cancel = nullptr;
  op->fail = nullptr;
  std::lock_guard lg(operations_mutex_);
  operations_.erase(op->id);
  return true;
}

bool SyncCoordinator::cancel(OperationId id) {
  OperationPtr op;
  {
    std::lock_guard lg(operations_mutex_);
    auto it = operations_.find(id);
    if(it == operations_.end()) return false;
    op = it->second;
  }
  asio::dispatch(op->strand, [this, op]{
    if(op->finished) return;
    log_debug(logger_.get(), "{} operation {} canceled", op->kind, op->id);
    // Stopping the inner work may already complete the operation with
    // `canceled`; whichever path gets there first delivers it.
    auto stop = std::move(op->on_cancel);
    op->on_cancel = nullptr;
    if(stop) stop();
    auto fail = op->fail;
    if(complete(op) && fail) {
      fail(SyncError(sync_errc::canceled, std::string(op->kind) + " canceled"));
    }
  });
  return true;
}

std::size_t SyncCoordinator::active_operations() const {
  std::lock_guard lg(operations_mutex_);
  return operations_.size();
}

void SyncCoordinator::run_blocking(const OperationPtr& op,
                                   std::function<SyncError()> work,
                                   std::function<void(const SyncError&)> then) {
  asio::post(io_.get_executor(), [op, work = std::move(work), then = std::move(then)]() mutable {
    SyncError result = work();
    asio::post(op->strand, [op, then = std::move(then), result = std::move(result)]{
      if(op->finished) return;
      then(result);
    });
  });
}

std::shared_ptr<ItemLookup> SyncCoordinator::start_lookup(const OperationPtr& op,
                                                          const Container& container,
                                                          const std::string& path,
                                                          ItemLookup::Completion then) {
  auto lookup = ItemLookup::create(op->strand, backend_, container, path, registry_,
                                   options_.lookup, query_logger_);
  op->on_cancel = [lookup]{ lookup->cancel(); };
  lookup->start(std::move(then));
  return lookup;
}

void SyncCoordinator::require_item(const OperationPtr& op,
                                   const Container& container,
                                   const std::string& path,
                                   std::function<void(const SyncError&, const ItemDescriptor&)> then) {
  start_lookup(op, container, path,
    [op, path, then = std::move(then)](const SyncError& error, const std::optional<ItemDescriptor>& item){
      if(op->finished) return;
      op->on_cancel = nullptr;
      if(error) {
        then(error, ItemDescriptor{});
        return;
      }
      if(!item) {
        then(SyncError(sync_errc::not_found, path), ItemDescriptor{});
        return;
      }
      then({}, *item);
    });
}

std::shared_ptr<ProgressChannel> SyncCoordinator::create_progress_channel(const std::string& name,
                                                                          ProgressChannel::Sink sink) {
  return channels_.create(name, std::move(sink));
}

bool SyncCoordinator::cancel_progress_channel(const std::string& name) {
  return channels_.cancel(name);
}

std::shared_ptr<ProgressChannel> SyncCoordinator::find_channel(const std::string& name) const {
  if(name.empty()) return nullptr;
  auto channel = channels_.find(name);
  if(!channel) log_warn(logger_.get(), "no progress channel named '{}'", name);
  return channel;
}

void SyncCoordinator::finish_channel(const std::shared_ptr<ProgressChannel>& channel, const SyncError& error) {
  if(!channel) return;
  channel->set_cancel_handler({});
  if(error) {
    channel->emit_error(error);
  } else {
    channel->emit_done();
  }
  channels_.remove(channel->name());
}

std::optional<SyncError> SyncCoordinator::conflict_error(const std::string& container_id,
                                                         const std::string& path) const {
  return resolver_->last_error(container_id, strip_trailing_slash(normalize_relative_path(path)));
}

void SyncCoordinator::report_conflict_state(const std::string& container_id, const std::string& path) const {
  if(auto error = resolver_->last_error(container_id, path)) {
    log_warn(logger_.get(), "{} still has unresolved conflicts: {}", path, error->message());
  }
}

OperationId SyncCoordinator::list_items(const std::string& container_id,
                                        ListingHandler done,
                                        ListingHandler on_update) {
  auto op = begin("list");
  op->fail = [done](const SyncError& error){ done(error, ItemListing{}); };
  asio::post(op->strand, [this, op, container_id, done, on_update]{
    if(op->finished) return;
    SyncError error;
    auto container = resolve(container_id, error);
    if(!container) {
      if(complete(op)) done(error, ItemListing{});
      return;
    }
    const bool watch = static_cast<bool>(on_update);
    auto query = LiveQuery::create(op->strand, backend_, *container, QueryPredicate::container(),
                                   registry_, query_logger_);
    query->subscribe_all([this, op, done, on_update, watch](LiveQuery& q, MetadataEvent event){
      if(op->finished) return;
      if(event == MetadataEvent::GatheringProgress) return;
      auto listing = map_listing(q.results(), logger_.get());
      if(!listing.invalid_entries.empty()) {
        log_warn(logger_.get(), "{} of {} record(s) could not be mapped",
                 listing.invalid_entries.size(), q.result_count());
      }
      if(watch) {
        on_update({}, listing);
        return;
      }
      q.stop();
      if(complete(op)) done({}, listing);
    });
    op->on_cancel = [query]{ query->stop(); };
    query->start();
  });
  return op->id;
}

OperationId SyncCoordinator::upload(const std::string& container_id,
                                    const fs::path& local_source,
                                    const std::string& remote_path,
                                    DoneHandler done,
                                    const std::string& progress_channel) {
  auto op = begin("upload");
  auto channel = find_channel(progress_channel);
  op->fail = [this, done, channel](const SyncError& error){
    finish_channel(channel, error);
    done(error);
  };
  if(channel) {
    channel->set_cancel_handler([this, id = op->id]{ cancel(id); });
  }
  asio::post(op->strand, [this, op, container_id, local_source, remote_path, done, channel]{
    if(op->finished) return;
    auto fail = [this, op, done, channel](const SyncError& error){
      if(!complete(op)) return;
      finish_channel(channel, error);
      done(error);
    };
    std::string path;
    if(auto err = item_path(remote_path, path)) return fail(err);
    SyncError error;
    auto container = resolve(container_id, error);
    if(!container) return fail(error);

    run_blocking(op,
      [this, container = *container, local_source, path]{
        return backend_->coordinate(container, {{path, AccessIntent::Replacing}},
          [this, &local_source](const std::vector<fs::path>& targets){
            return copier_.copy_file(local_source, targets.front());
          });
      },
      [this, op, container = *container, path, done, channel, fail](const SyncError& err){
        if(err) return fail(err);
        if(!complete(op)) return;
        log_info(logger_.get(), "uploaded {} into {}", path, container.id);
        if(channel) monitor_upload(container, path, channel);
        done({});
      });
  });
  return op->id;
}

void SyncCoordinator::monitor_upload(const Container& container,
                                     const std::string& remote_path,
                                     const std::shared_ptr<ProgressChannel>& channel) {
  auto strand = asio::make_strand(io_);
  auto query = LiveQuery::create(strand, backend_, container, QueryPredicate::item(remote_path),
                                 registry_, query_logger_);
  // The channel's cancel handler keeps the query alive until a terminal event.
  channel->set_cancel_handler([this, strand, query, channel]{
    asio::dispatch(strand, [this, query, channel]{
      query->stop();
      finish_channel(channel, SyncError(sync_errc::canceled, "upload monitoring canceled"));
    });
  });
  query->subscribe_all([this, channel](LiveQuery& q, MetadataEvent event){
    if(channel->terminated()) {
      q.stop();
      return;
    }
    if(const auto* raw = q.first_result()) {
      ItemDescriptor item;
      std::string error;
      if(!map_item(*raw, item, error, logger_.get())) {
        log_warn(logger_.get(), "ignoring malformed upload metadata: {}", error);
        return;
      }
      auto fields = read_transfer_fields(*raw);
      if(!fields.upload_error.empty()) {
        q.stop();
        finish_channel(channel, wrap_store_error(fields.upload_error));
        return;
      }
      if(fields.percent_uploaded) {
        double fraction = *fields.percent_uploaded / 100.0;
        if(fraction >= 1.0) {
          q.stop();
          finish_channel(channel, {});
          return;
        }
        channel->emit(fraction);
        return;
      }
      if(item.is_uploaded) {
        q.stop();
        finish_channel(channel, {});
      }
      return;
    }
    if(event == MetadataEvent::GatheringFinished && q.result_count() == 0) {
      q.stop();
      finish_channel(channel, {});
    }
  });
  query->start();
}

OperationId SyncCoordinator::download(const std::string& container_id,
                                      const std::string& remote_path,
                                      const fs::path& local_destination,
                                      DoneHandler done,
                                      const std::string& progress_channel) {
  auto op = begin("download");
  auto channel = find_channel(progress_channel);
  op->fail = [this, done, channel](const SyncError& error){
    finish_channel(channel, error);
    done(error);
  };
  if(channel) {
    channel->set_cancel_handler([this, id = op->id]{ cancel(id); });
  }
  asio::post(op->strand, [this, op, container_id, remote_path, local_destination, done, channel]{
    if(op->finished) return;
    auto finish = [this, op, done, channel](const SyncError& error){
      if(!complete(op)) return;
      finish_channel(channel, error);
      done(error);
    };
    std::string path;
    if(auto err = item_path(remote_path, path)) return finish(err);
    SyncError error;
    auto container = resolve(container_id, error);
    if(!container) return finish(error);
    report_conflict_state(container->id, path);

    auto watchdog = DownloadWatchdog::create(op->strand, backend_, *container, path,
                                             options_.download_schedule, registry_, watchdog_logger_);
    if(channel) {
      watchdog->set_progress_handler([channel](double fraction){ channel->emit(fraction); });
    }
    op->on_cancel = [watchdog]{ watchdog->cancel(); };
    watchdog->start([this, op, container = *container, path, local_destination, finish](const SyncError& err){
      if(op->finished) return;
      op->on_cancel = nullptr;
      if(err) return finish(err);
      run_blocking(op,
        [this, container, path, local_destination]{
          return backend_->coordinate(container, {{path, AccessIntent::Reading}},
            [this, &local_destination](const std::vector<fs::path>& sources){
              const auto& source = sources.front();
              std::error_code ec;
              if(!fs::is_directory(source, ec)) return copier_.copy_file(source, local_destination);
              // Directory items land as a tree, replacing whatever was at the destination.
              if(auto remove_err = remove_existing(local_destination)) return remove_err;
              if(auto parent_err = ensure_parent(local_destination)) return parent_err;
              fs::copy(source, local_destination, fs::copy_options::recursive, ec);
              if(ec) return wrap_store_error(ec, "cannot copy " + source.string());
              return SyncError{};
            });
        },
        finish);
    });
  });
  return op->id;
}

OperationId SyncCoordinator::read_in_place(const std::string& container_id,
                                           const std::string& remote_path,
                                           BytesHandler done,
                                           std::optional<WatchdogSchedule> schedule) {
  auto op = begin("read");
  op->fail = [done](const SyncError& error){ done(error, std::nullopt); };
  asio::post(op->strand, [this, op, container_id, remote_path, done, schedule = std::move(schedule)]{
    if(op->finished) return;
    auto fail = [this, op, done](const SyncError& error){
      if(complete(op)) done(error, std::nullopt);
    };
    std::string path;
    if(auto err = item_path(remote_path, path)) return fail(err);
    SyncError error;
    auto container = resolve(container_id, error);
    if(!container) return fail(error);
    report_conflict_state(container->id, path);

    auto watchdog = DownloadWatchdog::create(op->strand, backend_, *container, path,
                                             schedule.value_or(options_.read_schedule),
                                             registry_, watchdog_logger_);
    op->on_cancel = [watchdog]{ watchdog->cancel(); };
    watchdog->start([this, op, container = *container, path, done, fail](const SyncError& err){
      if(op->finished) return;
      op->on_cancel = nullptr;
      if(err.is(sync_errc::not_found)) {
        if(complete(op)) done({}, std::nullopt);
        return;
      }
      if(err) return fail(err);
      auto content = std::make_shared<std::string>();
      run_blocking(op,
        [this, container, path, content]{
          return backend_->coordinate(container, {{path, AccessIntent::Reading}},
            [this, content](const std::vector<fs::path>& sources){
              FileByteReader reader;
              std::error_code ec;
              if(!reader.open(sources.front(), ec)) {
                return SyncError(sync_errc::read_error, sources.front().string() + ": " + ec.message());
              }
              StringByteWriter writer;
              if(auto copy_err = copier_.copy(reader, writer)) return copy_err;
              *content = writer.take();
              return SyncError{};
            });
        },
        [this, op, done, content](const SyncError& copy_err){
          if(!complete(op)) return;
          if(copy_err) {
            done(copy_err, std::nullopt);
            return;
          }
          done({}, std::move(*content));
        });
    });
  });
  return op->id;
}

OperationId SyncCoordinator::write_in_place(const std::string& container_id,
                                            const std::string& remote_path,
                                            std::string bytes,
                                            DoneHandler done) {
  auto op = begin("write");
  op->fail = done;
  auto content = std::make_shared<std::string>(std::move(bytes));
  asio::post(op->strand, [this, op, container_id, remote_path, done, content]{
    if(op->finished) return;
    auto finish = [this, op, done](const SyncError& error){
      if(complete(op)) done(error);
    };
    std::string path;
    if(auto err = item_path(remote_path, path)) return finish(err);
    SyncError error;
    auto container = resolve(container_id, error);
    if(!container) return finish(error);

    run_blocking(op,
      [this, container = *container, path, content]{
        return backend_->coordinate(container, {{path, AccessIntent::Replacing}},
          [this, content](const std::vector<fs::path>& targets){
            const auto& target = targets.front();
            if(auto err = ensure_parent(target)) return err;
            FileByteWriter writer;
            std::error_code ec;
            if(!writer.open(target, ec)) return wrap_store_error(ec, "cannot open " + target.string());
            StringByteReader reader(*content);
            if(auto err = copier_.copy(reader, writer)) return err;
            if(!writer.close(ec)) return wrap_store_error(ec, "cannot close " + target.string());
            return SyncError{};
          });
      },
      finish);
  });
  return op->id;
}

OperationId SyncCoordinator::exists(const std::string& container_id, const std::string& path, ExistsHandler done) {
  auto op = begin("exists");
  op->fail = [done](const SyncError& error){ done(error, false); };
  asio::post(op->strand, [this, op, container_id, path, done]{
    if(op->finished) return;
    std::string item;
    if(auto err = item_path(path, item)) {
      if(complete(op)) done(err, false);
      return;
    }
    SyncError error;
    auto container = resolve(container_id, error);
    if(!container) {
      if(complete(op)) done(error, false);
      return;
    }
    start_lookup(op, *container, item,
      [this, op, item, done](const SyncError& err, const std::optional<ItemDescriptor>& found){
        if(!complete(op)) return;
        if(err.is(sync_errc::query_timeout)) {
          log_warn(logger_.get(), "existence check for {} timed out, reporting absent", item);
          done({}, false);
          return;
        }
        done(err, !err && found.has_value());
      });
  });
  return op->id;
}

OperationId SyncCoordinator::metadata(const std::string& container_id, const std::string& path, MetadataHandler done) {
  auto op = begin("metadata");
  op->fail = [done](const SyncError& error){ done(error, std::nullopt); };
  asio::post(op->strand, [this, op, container_id, path, done]{
    if(op->finished) return;
    std::string item;
    if(auto err = item_path(path, item)) {
      if(complete(op)) done(err, std::nullopt);
      return;
    }
    SyncError error;
    auto container = resolve(container_id, error);
    if(!container) {
      if(complete(op)) done(error, std::nullopt);
      return;
    }
    report_conflict_state(container->id, item);
    start_lookup(op, *container, item,
      [this, op, done](const SyncError& err, const std::optional<ItemDescriptor>& found){
        if(!complete(op)) return;
        if(err) {
          done(err, std::nullopt);
          return;
        }
        done({}, found);
      });
  });
  return op->id;
}

OperationId SyncCoordinator::remove(const std::string& container_id, const std::string& path, DoneHandler done) {
  auto op = begin("delete");
  op->fail = done;
  asio::post(op->strand, [this, op, container_id, path, done]{
    if(op->finished) return;
    auto finish = [this, op, done](const SyncError& error){
      if(complete(op)) done(error);
    };
    std::string item;
    if(auto err = item_path(path, item)) return finish(err);
    SyncError error;
    auto container = resolve(container_id, error);
    if(!container) return finish(error);

    require_item(op, *container, item,
      [this, op, container = *container, item, finish](const SyncError& err, const ItemDescriptor&){
        if(err) return finish(err);
        run_blocking(op,
          [this, container, item]{
            return backend_->coordinate(container, {{item, AccessIntent::Deleting}},
              [](const std::vector<fs::path>& targets){
                return remove_existing(targets.front());
              });
          },
          finish);
      });
  });
  return op->id;
}

OperationId SyncCoordinator::move(const std::string& container_id,
                                  const std::string& from,
                                  const std::string& to,
                                  DoneHandler done) {
  auto op = begin("move");
  op->fail = done;
  asio::post(op->strand, [this, op, container_id, from, to, done]{
    if(op->finished) return;
    auto finish = [this, op, done](const SyncError& error){
      if(complete(op)) done(error);
    };
    std::string source;
    std::string destination;
    if(auto err = item_path(from, source)) return finish(err);
    if(auto err = item_path(to, destination)) return finish(err);
    if(source == destination) {
      return finish(SyncError(sync_errc::invalid_argument, "source and destination are the same item"));
    }
    SyncError error;
    auto container = resolve(container_id, error);
    if(!container) return finish(error);

    require_item(op, *container, source,
      [this, op, container = *container, source, destination, finish](const SyncError& err, const ItemDescriptor&){
        if(err) return finish(err);
        run_blocking(op,
          [this, container, source, destination]{
            return backend_->coordinate(container,
              {{source, AccessIntent::Moving}, {destination, AccessIntent::Replacing}},
              [](const std::vector<fs::path>& paths){
                if(auto parent_err = ensure_parent(paths[1])) return parent_err;
                std::error_code ec;
                fs::rename(paths[0], paths[1], ec);
                if(ec) return wrap_store_error(ec, "cannot move " + paths[0].string());
                return SyncError{};
              });
          },
          finish);
      });
  });
  return op->id;
}

OperationId SyncCoordinator::copy(const std::string& container_id,
                                  const std::string& from,
                                  const std::string& to,
                                  DoneHandler done) {
  auto op = begin("copy");
  op->fail = done;
  asio::post(op->strand, [this, op, container_id, from, to, done]{
    if(op->finished) return;
    auto finish = [this, op, done](const SyncError& error){
      if(complete(op)) done(error);
    };
    std::string source;
    std::string destination;
    if(auto err = item_path(from, source)) return finish(err);
    if(auto err = item_path(to, destination)) return finish(err);
    if(source == destination) {
      return finish(SyncError(sync_errc::invalid_argument, "source and destination are the same item"));
    }
    SyncError error;
    auto container = resolve(container_id, error);
    if(!container) return finish(error);

    require_item(op, *container, source,
      [this, op, container = *container, source, destination, finish](const SyncError& err,
                                                                       const ItemDescriptor& item){
        if(err) return finish(err);
        const bool directory = item.is_directory;
        run_blocking(op,
          [this, container, source, destination, directory]{
            return backend_->coordinate(container,
              {{source, AccessIntent::Reading}, {destination, AccessIntent::Replacing}},
              [this, directory](const std::vector<fs::path>& paths){
                if(auto remove_err = remove_existing(paths[1])) return remove_err;
                if(!directory) return copier_.copy_file(paths[0], paths[1]);
                if(auto parent_err = ensure_parent(paths[1])) return parent_err;
                std::error_code ec;
                fs::copy(paths[0], paths[1], fs::copy_options::recursive, ec);
                if(ec) return wrap_store_error(ec, "cannot copy " + paths[0].string());
                return SyncError{};
              });
          },
          finish);
      });
  });
  return op->id;
}

} // namespace docsync
