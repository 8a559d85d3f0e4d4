#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "log.hpp"
#include "store_backend.hpp"

namespace docsync {

struct LocalStoreOptions {
  std::filesystem::path root;
  // start_download() materializes remote-only items immediately.
  bool auto_materialize = true;
  // Coordinated writes are reported as uploaded immediately.
  bool auto_upload = true;
};

// Store substrate backed by a directory per container. The remote side
// (transfer state, index visibility, version history) is simulated in
// memory and driven through the controls below.
class LocalStore : public StoreBackend {
public:
  explicit LocalStore(LocalStoreOptions options, std::shared_ptr<Logger> logger = nullptr);
  ~LocalStore() override;

  bool available() const override;
  std::optional<Container> resolve_container(const std::string& container_id, SyncError& error) override;

  SyncError start_download(const Container& container, const std::string& relative_path) override;

  BackendQueryId open_query(const Container& container,
                            const QueryPredicate& predicate,
                            MetadataSink sink) override;
  void close_query(BackendQueryId id) override;

  LocalItemStatus local_status(const Container& container, const std::string& relative_path) override;

  SyncError coordinate(const Container& container,
                       const std::vector<CoordinatedItem>& items,
                       const CoordinatedAccessor& accessor) override;

  std::vector<ConflictVersion> unresolved_conflict_versions(const Container& container,
                                                            const std::string& relative_path,
                                                            SyncError& error) override;
  SyncError replace_with_version(const Container& container,
                                 const std::string& relative_path,
                                 const std::string& version_id) override;
  SyncError mark_version_resolved(const Container& container,
                                  const std::string& relative_path,
                                  const std::string& version_id) override;
  SyncError remove_other_versions(const Container& container,
                                  const std::string& relative_path) override;

  StateListenerId add_state_listener(StateListener listener) override;
  void remove_state_listener(StateListenerId id) override;

  // ---- simulation controls -----------------------------------------------

  void set_available(bool available);
  void set_auto_materialize(bool enabled);
  void set_auto_upload(bool enabled);

  // While held, new queries receive no "gathering finished" until released.
  void hold_gathering();
  void release_gathering();

  // An item that exists remotely but has no local content yet.
  bool seed_remote_item(const std::string& container_id,
                        const std::string& relative_path,
                        std::string content);
  // Hidden items are omitted from query results but stay on disk.
  void set_indexed(const std::string& container_id, const std::string& relative_path, bool indexed);
  // Appended verbatim to container-scoped query results.
  void inject_raw_entry(const std::string& container_id, nlohmann::json raw);

  bool report_download_progress(const std::string& container_id,
                                const std::string& relative_path,
                                double percent);
  bool complete_download(const std::string& container_id, const std::string& relative_path);
  bool fail_download(const std::string& container_id,
                     const std::string& relative_path,
                     const std::string& message);

  bool report_upload_progress(const std::string& container_id,
                              const std::string& relative_path,
                              double percent);
  bool fail_upload(const std::string& container_id,
                   const std::string& relative_path,
                   const std::string& message);

  // Returns the new version's identifier; empty if the item is unknown.
  std::string add_conflict_version(const std::string& container_id,
                                   const std::string& relative_path,
                                   std::string content,
                                   std::optional<WallTime> modification_time);
  void fail_next_replace(std::string message);

  std::size_t download_requests(const std::string& container_id, const std::string& relative_path) const;
  std::size_t open_query_count() const;
  std::size_t version_count(const std::string& container_id, const std::string& relative_path) const;
  bool has_unresolved_conflicts(const std::string& container_id, const std::string& relative_path) const;
  std::size_t path_lock_count() const;

  const std::filesystem::path& root() const { return options_.root; }

private:
  struct StoredVersion {
    std::string id;
    std::string content;
    std::optional<WallTime> modification_time;
    bool resolved = false;
  };

  struct RemoteItem {
    DownloadState download_state = DownloadState::Current;
    bool is_downloading = false;
    bool is_uploading = false;
    bool is_uploaded = true;
    std::optional<double> percent_downloaded;
    std::optional<double> percent_uploaded;
    std::string download_error;
    std::string upload_error;
    bool indexed = true;
    std::optional<std::string> pending_content;
    WallTime created = std::chrono::system_clock::now();
    std::size_t download_requests = 0;
    std::vector<StoredVersion> versions;

    bool has_unresolved_conflicts() const;
  };

  struct ContainerState {
    std::filesystem::path root;
    std::map<std::string, RemoteItem> items;
    std::vector<nlohmann::json> injected;
  };

  struct OpenQuery {
    std::string container_id;
    QueryPredicate predicate;
    MetadataSink sink;
    bool gathering_finished = false;
  };

  using Notification = std::pair<MetadataSink, std::pair<MetadataEvent, std::vector<nlohmann::json>>>;

  ContainerState& container_locked(const std::string& container_id);
  const ContainerState* find_container_locked(const std::string& container_id) const;
  RemoteItem* find_item_locked(const std::string& container_id, const std::string& relative_path);
  RemoteItem& item_locked(const std::string& container_id, const std::string& relative_path);

  nlohmann::json describe_locked(const std::string& relative_path,
                                 const std::filesystem::path& absolute,
                                 const RemoteItem* item) const;
  std::vector<nlohmann::json> snapshot_locked(const std::string& container_id,
                                              const QueryPredicate& predicate);
  std::vector<Notification> changed_locked(const std::string& container_id,
                                           const std::vector<std::string>& paths);
  SyncError materialize_locked(const std::string& container_id, const std::string& relative_path, RemoteItem& item);
  void apply_access_locked(const Container& container, const std::vector<CoordinatedItem>& items);

  void deliver(std::vector<Notification> notifications);
  void notify_state(const ItemStateChange& change);

  using PathSlot = std::pair<std::string, std::shared_ptr<std::mutex>>;

  // Per-path mutexes held for one coordinated access, taken in key order.
  // Releasing drops the slots no other access is waiting on.
  class PathLease {
  public:
    PathLease(LocalStore& store, const Container& container, const std::vector<CoordinatedItem>& items);
    ~PathLease();
    PathLease(const PathLease&) = delete;
    PathLease& operator=(const PathLease&) = delete;

  private:
    LocalStore& store_;
    std::vector<PathSlot> slots_;
    std::vector<std::unique_lock<std::mutex>> held_;
  };

  LocalStoreOptions options_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex m_;
  bool available_ = true;
  bool hold_gathering_ = false;
  std::optional<std::string> fail_next_replace_;
  uint64_t version_sequence_ = 0;
  std::unordered_map<std::string, ContainerState> containers_;
  std::map<BackendQueryId, OpenQuery> queries_;
  BackendQueryId next_query_id_ = 1;
  std::map<StateListenerId, StateListener> state_listeners_;
  StateListenerId next_listener_id_ = 1;

  mutable std::mutex path_lock_mutex_;
  std::map<std::string, std::shared_ptr<std::mutex>> path_locks_;
};

} // namespace docsync
