#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "item_descriptor.hpp"
#include "sync_error.hpp"

namespace docsync {

// A resolved container: identifier plus the local root the store syncs.
struct Container {
  std::string id;
  std::filesystem::path root;
};

struct QueryPredicate {
  enum class Scope { Item, Container };

  Scope scope = Scope::Item;
  std::string path; // exact item path, or prefix ("" = whole container)

  static QueryPredicate item(std::string relative_path) {
    return QueryPredicate{Scope::Item, std::move(relative_path)};
  }
  static QueryPredicate container(std::string prefix = {}) {
    return QueryPredicate{Scope::Container, std::move(prefix)};
  }

  bool matches(const std::string& relative_path) const;
  std::string describe() const;
};

enum class MetadataEvent {
  GatheringProgress,
  GatheringFinished,
  Updated
};

const char* to_string(MetadataEvent event);

struct LocalItemStatus {
  bool exists = false;
  bool is_directory = false;
  DownloadState download_state = DownloadState::Unknown;
  std::string download_error;
};

enum class AccessIntent {
  Reading,
  Replacing,
  Deleting,
  Moving
};

struct CoordinatedItem {
  std::string relative_path;
  AccessIntent intent = AccessIntent::Reading;
};

struct ConflictVersion {
  std::string version_id;
  std::optional<WallTime> modification_time;
  bool resolved = false;
};

struct ItemStateChange {
  std::string container_id;
  std::string relative_path;
  bool has_unresolved_conflicts = false;
};

using BackendQueryId = uint64_t;
using StateListenerId = uint64_t;

// Boundary to the remote sync engine. Everything behind it (transfers,
// indexing, version storage) is opaque to the coordination layer.
class StoreBackend {
public:
  using MetadataSink = std::function<void(MetadataEvent, const std::vector<nlohmann::json>&)>;
  using CoordinatedAccessor = std::function<SyncError(const std::vector<std::filesystem::path>&)>;
  using StateListener = std::function<void(const ItemStateChange&)>;

  virtual ~StoreBackend() = default;

  virtual bool available() const = 0;
  virtual std::optional<Container> resolve_container(const std::string& container_id, SyncError& error) = 0;

  virtual SyncError start_download(const Container& container, const std::string& relative_path) = 0;

  // Sink may be invoked from any thread, including inside open_query().
  virtual BackendQueryId open_query(const Container& container,
                                    const QueryPredicate& predicate,
                                    MetadataSink sink) = 0;
  virtual void close_query(BackendQueryId id) = 0;

  // Direct filesystem view of the item at its original location.
  virtual LocalItemStatus local_status(const Container& container, const std::string& relative_path) = 0;

  virtual SyncError coordinate(const Container& container,
                               const std::vector<CoordinatedItem>& items,
                               const CoordinatedAccessor& accessor) = 0;

  virtual std::vector<ConflictVersion> unresolved_conflict_versions(const Container& container,
                                                                    const std::string& relative_path,
                                                                    SyncError& error) = 0;
  virtual SyncError replace_with_version(const Container& container,
                                         const std::string& relative_path,
                                         const std::string& version_id) = 0;
  virtual SyncError mark_version_resolved(const Container& container,
                                          const std::string& relative_path,
                                          const std::string& version_id) = 0;
  virtual SyncError remove_other_versions(const Container& container,
                                          const std::string& relative_path) = 0;

  virtual StateListenerId add_state_listener(StateListener listener) = 0;
  virtual void remove_state_listener(StateListenerId id) = 0;
};

} // namespace docsync
