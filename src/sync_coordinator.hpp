#pragma once

#include <asio.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "conflict_resolver.hpp"
#include "download_watchdog.hpp"
#include "item_descriptor.hpp"
#include "item_lookup.hpp"
#include "live_query.hpp"
#include "log.hpp"
#include "progress_channel.hpp"
#include "store_backend.hpp"
#include "stream_copier.hpp"
#include "sync_error.hpp"

namespace docsync {

class SettingsManager;

struct CoordinatorOptions {
  WatchdogSchedule read_schedule{{std::chrono::seconds(60), std::chrono::seconds(90), std::chrono::seconds(180)},
                                 {std::chrono::seconds(2), std::chrono::seconds(4)}};
  WatchdogSchedule download_schedule{{std::chrono::seconds(60), std::chrono::seconds(90), std::chrono::seconds(180)},
                                     {std::chrono::seconds(2), std::chrono::seconds(4)}};
  LookupTiming lookup;
  std::size_t copy_buffer_size = StreamCopier::kDefaultBufferSize;
};

// False with a message when a schedule or number in the settings is invalid.
bool coordinator_options_from_settings(const SettingsManager& settings,
                                       CoordinatorOptions& options,
                                       std::string& error);

using OperationId = uint64_t;

// Entry point for every request. Each operation runs on its own strand and
// completes exactly once: with a value, with a typed error, or with
// `canceled` when cancel() gets there first. Handlers run on io_context
// threads.
class SyncCoordinator {
public:
  using DoneHandler = std::function<void(const SyncError&)>;
  using ListingHandler = std::function<void(const SyncError&, const ItemListing&)>;
  using BytesHandler = std::function<void(const SyncError&, const std::optional<std::string>&)>;
  using ExistsHandler = std::function<void(const SyncError&, bool)>;
  using MetadataHandler = std::function<void(const SyncError&, const std::optional<ItemDescriptor>&)>;

  SyncCoordinator(asio::io_context& io,
                  std::shared_ptr<StoreBackend> backend,
                  CoordinatorOptions options = {},
                  std::shared_ptr<Logger> logger = nullptr);
  ~SyncCoordinator();

  SyncCoordinator(const SyncCoordinator&) = delete;
  SyncCoordinator& operator=(const SyncCoordinator&) = delete;

  bool available() const;
  SyncError container_path(const std::string& container_id, std::filesystem::path& out) const;

  // With on_update set the query stays open: the first listing and every
  // later change go to on_update, and done only reports a failure or the
  // `canceled` that ends the watch.
  OperationId list_items(const std::string& container_id,
                         ListingHandler done,
                         ListingHandler on_update = {});

  OperationId upload(const std::string& container_id,
                     const std::filesystem::path& local_source,
                     const std::string& remote_path,
                     DoneHandler done,
                     const std::string& progress_channel = {});
  OperationId download(const std::string& container_id,
                       const std::string& remote_path,
                       const std::filesystem::path& local_destination,
                       DoneHandler done,
                       const std::string& progress_channel = {});

  // Absent when the item does not exist.
  OperationId read_in_place(const std::string& container_id,
                            const std::string& remote_path,
                            BytesHandler done,
                            std::optional<WatchdogSchedule> schedule = std::nullopt);
  OperationId write_in_place(const std::string& container_id,
                             const std::string& remote_path,
                             std::string bytes,
                             DoneHandler done);

  OperationId exists(const std::string& container_id, const std::string& path, ExistsHandler done);
  OperationId metadata(const std::string& container_id, const std::string& path, MetadataHandler done);

  OperationId remove(const std::string& container_id, const std::string& path, DoneHandler done);
  OperationId move(const std::string& container_id,
                   const std::string& from,
                   const std::string& to,
                   DoneHandler done);
  OperationId copy(const std::string& container_id,
                   const std::string& from,
                   const std::string& to,
                   DoneHandler done);

  // False when the operation is unknown or already finished.
  bool cancel(OperationId id);

  std::shared_ptr<ProgressChannel> create_progress_channel(const std::string& name, ProgressChannel::Sink sink);
  bool cancel_progress_channel(const std::string& name);

  // Last failed conflict resolution for the item, if any.
  std::optional<SyncError> conflict_error(const std::string& container_id, const std::string& path) const;

  std::size_t active_operations() const;
  std::shared_ptr<ObserverRegistry> registry() const { return registry_; }
  std::shared_ptr<ConflictResolver> conflict_resolver() const { return resolver_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  const CoordinatorOptions& options() const { return options_; }

private:
  struct Operation {
    OperationId id = 0;
    const char* kind = "";
    Strand strand;
    // Strand-only state.
    bool finished = false;
    // Tears down whatever the operation is currently waiting on.
    std::function<void()> on_cancel;
    // Delivers a failure to the caller's handler.
    std::function<void(const SyncError&)> fail;

    Operation(OperationId op_id, const char* op_kind, Strand op_strand)
      : id(op_id), kind(op_kind), strand(std::move(op_strand)) {}
  };
  using OperationPtr = std::shared_ptr<Operation>;

  OperationPtr begin(const char* kind);
  // Marks the operation finished; false if something else already did.
  bool complete(const OperationPtr& op);
  std::optional<Container> resolve(const std::string& container_id, SyncError& error);

  // Runs blocking I/O off the operation's strand, then `then` back on it.
  void run_blocking(const OperationPtr& op,
                    std::function<SyncError()> work,
                    std::function<void(const SyncError&)> then);

  // Lookup that maps timeout to query_timeout and absence to not_found.
  void require_item(const OperationPtr& op,
                    const Container& container,
                    const std::string& path,
                    std::function<void(const SyncError&, const ItemDescriptor&)> then);
  std::shared_ptr<ItemLookup> start_lookup(const OperationPtr& op,
                                           const Container& container,
                                           const std::string& path,
                                           ItemLookup::Completion then);

  void monitor_upload(const Container& container,
                      const std::string& remote_path,
                      const std::shared_ptr<ProgressChannel>& channel);
  std::shared_ptr<ProgressChannel> find_channel(const std::string& name) const;
  void finish_channel(const std::shared_ptr<ProgressChannel>& channel, const SyncError& error);
  void report_conflict_state(const std::string& container_id, const std::string& path) const;

  asio::io_context& io_;
  std::shared_ptr<StoreBackend> backend_;
  CoordinatorOptions options_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<Logger> query_logger_;
  std::shared_ptr<Logger> watchdog_logger_;
  std::shared_ptr<ObserverRegistry> registry_;
  std::shared_ptr<ConflictResolver> resolver_;
  ProgressChannelTable channels_;
  StreamCopier copier_;

  mutable std::mutex operations_mutex_;
  std::map<OperationId, OperationPtr> operations_;
  OperationId next_operation_id_ = 1;
};

} // namespace docsync
