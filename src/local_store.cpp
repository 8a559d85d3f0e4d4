#include "local_store.hpp"

#include <algorithm>
#include <fstream>
#include <set>

#include "utils.hpp"

namespace docsync {

namespace fs = std::filesystem;

namespace {

WallTime to_wall_time(fs::file_time_type t) {
  using namespace std::chrono;
  return time_point_cast<system_clock::duration>(t - fs::file_time_type::clock::now() + system_clock::now());
}

bool valid_container_id(const std::string& id) {
  if(id.empty() || id == "." || id == "..") return false;
  return id.find('/') == std::string::npos && id.find('\\') == std::string::npos;
}

SyncError write_content(const fs::path& path, const std::string& content) {
  std::error_code ec;
  if(path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if(ec) return wrap_store_error(ec, "cannot create " + path.parent_path().string());
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if(!out) return wrap_store_error("cannot open " + path.string() + " for writing");
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  if(!out) return wrap_store_error("short write to " + path.string());
  return {};
}

bool is_under(const std::string& path, const std::string& prefix) {
  return path == prefix ||
         (path.size() > prefix.size() && path.compare(0, prefix.size(), prefix) == 0 && path[prefix.size()] == '/');
}

} // namespace

bool LocalStore::RemoteItem::has_unresolved_conflicts() const {
  return std::any_of(versions.begin(), versions.end(),
                     [](const StoredVersion& v){ return !v.resolved; });
}

LocalStore::LocalStore(LocalStoreOptions options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("local-store")) {
  if(options_.root.empty()) {
    options_.root = fs::current_path() / "store";
  }
}

LocalStore::~LocalStore() = default;

bool LocalStore::available() const {
  std::lock_guard lg(m_);
  return available_;
}

std::optional<Container> LocalStore::resolve_container(const std::string& container_id, SyncError& error) {
  std::lock_guard lg(m_);
  if(!available_) {
    error = SyncError(sync_errc::container_unavailable, "store is not reachable");
    return std::nullopt;
  }
  if(!valid_container_id(container_id)) {
    error = SyncError(sync_errc::container_unavailable, "invalid container identifier '" + container_id + "'");
    return std::nullopt;
  }
  auto& state = container_locked(container_id);
  std::error_code ec;
  fs::create_directories(state.root, ec);
  if(ec) {
    error = SyncError(sync_errc::container_unavailable, state.root.string() + ": " + ec.message());
    return std::nullopt;
  }
  return Container{container_id, state.root};
}

LocalStore::ContainerState& LocalStore::container_locked(const std::string& container_id) {
  auto it = containers_.find(container_id);
  if(it == containers_.end()) {
    ContainerState state;
    state.root = options_.root / container_id;
    it = containers_.emplace(container_id, std::move(state)).first;
  }
  return it->second;
}

const LocalStore::ContainerState* LocalStore::find_container_locked(const std::string& container_id) const {
  auto it = containers_.find(container_id);
  return it == containers_.end() ? nullptr : &it->second;
}

LocalStore::RemoteItem* LocalStore::find_item_locked(const std::string& container_id,
                                                     const std::string& relative_path) {
  auto it = containers_.find(container_id);
  if(it == containers_.end()) return nullptr;
  auto item = it->second.items.find(relative_path);
  return item == it->second.items.end() ? nullptr : &item->second;
}

LocalStore::RemoteItem& LocalStore::item_locked(const std::string& container_id,
                                                const std::string& relative_path) {
  return container_locked(container_id).items[relative_path];
}

nlohmann::json LocalStore::describe_locked(const std::string& relative_path,
                                           const fs::path& absolute,
                                           const RemoteItem* item) const {
  nlohmann::json j;
  j["relativePath"] = relative_path;

  std::error_code ec;
  auto status = fs::status(absolute, ec);
  bool on_disk = !ec && fs::exists(status);
  bool is_dir = on_disk && fs::is_directory(status);
  j["isDirectory"] = is_dir;

  if(on_disk) {
    if(!is_dir) {
      auto size = fs::file_size(absolute, ec);
      if(!ec) j["sizeInBytes"] = size;
    }
    auto mtime = fs::last_write_time(absolute, ec);
    if(!ec) {
      auto seconds = to_epoch_seconds(to_wall_time(mtime));
      j["contentChangeDate"] = seconds;
      j["creationDate"] = item ? to_epoch_seconds(item->created) : seconds;
    }
  } else if(item) {
    j["creationDate"] = to_epoch_seconds(item->created);
  }

  if(!item) {
    j["downloadStatus"] = to_string(DownloadState::Current);
    j["isDownloading"] = false;
    j["isUploading"] = false;
    j["isUploaded"] = true;
    j["hasUnresolvedConflicts"] = false;
    return j;
  }

  j["downloadStatus"] = to_string(item->download_state);
  j["isDownloading"] = item->is_downloading;
  j["isUploading"] = item->is_uploading;
  j["isUploaded"] = item->is_uploaded;
  j["hasUnresolvedConflicts"] = item->has_unresolved_conflicts();
  if(item->percent_downloaded) j["percentDownloaded"] = *item->percent_downloaded;
  if(item->percent_uploaded) j["percentUploaded"] = *item->percent_uploaded;
  if(!item->download_error.empty()) j["downloadError"] = item->download_error;
  if(!item->upload_error.empty()) j["uploadError"] = item->upload_error;
  return j;
}

std::vector<nlohmann::json> LocalStore::snapshot_locked(const std::string& container_id,
                                                        const QueryPredicate& predicate) {
  auto& state = container_locked(container_id);
  std::vector<nlohmann::json> out;

  if(predicate.scope == QueryPredicate::Scope::Item) {
    auto absolute = state.root / predicate.path;
    auto it = state.items.find(predicate.path);
    const RemoteItem* item = it == state.items.end() ? nullptr : &it->second;
    if(item && !item->indexed) return out;
    std::error_code ec;
    bool present = (item && item->pending_content) || (!predicate.path.empty() && fs::exists(absolute, ec));
    if(present) {
      out.push_back(describe_locked(predicate.path, absolute, item));
    }
    return out;
  }

  std::set<std::string> seen;
  std::error_code ec;
  fs::recursive_directory_iterator it(state.root, fs::directory_options::skip_permission_denied, ec);
  for(fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
    auto rel = relative_to(state.root, it->path());
    if(rel.empty() || !predicate.matches(rel)) continue;
    seen.insert(rel);
    auto record = state.items.find(rel);
    const RemoteItem* item = record == state.items.end() ? nullptr : &record->second;
    if(item && !item->indexed) continue;
    out.push_back(describe_locked(rel, it->path(), item));
  }
  if(ec) {
    log_warn(logger_.get(), "scan of {} stopped early: {}", state.root.string(), ec.message());
  }
  for(const auto& [rel, item] : state.items) {
    if(seen.count(rel) || !item.indexed || !predicate.matches(rel)) continue;
    if(!item.pending_content) continue;
    out.push_back(describe_locked(rel, state.root / rel, &item));
  }
  std::sort(out.begin(), out.end(), [](const nlohmann::json& a, const nlohmann::json& b){
    return a.at("relativePath").get<std::string>() < b.at("relativePath").get<std::string>();
  });
  for(const auto& raw : state.injected) out.push_back(raw);
  return out;
}

std::vector<LocalStore::Notification> LocalStore::changed_locked(const std::string& container_id,
                                                                 const std::vector<std::string>& paths) {
  std::vector<Notification> out;
  for(auto& [id, query] : queries_) {
    if(query.container_id != container_id) continue;
    bool matched = std::any_of(paths.begin(), paths.end(), [&](const std::string& p){
      if(query.predicate.scope == QueryPredicate::Scope::Item) return is_under(query.predicate.path, p);
      return query.predicate.matches(p);
    });
    if(!matched) continue;
    auto event = query.gathering_finished ? MetadataEvent::Updated : MetadataEvent::GatheringProgress;
    out.push_back({query.sink, {event, snapshot_locked(container_id, query.predicate)}});
  }
  return out;
}

void LocalStore::deliver(std::vector<Notification> notifications) {
  for(auto& n : notifications) {
    if(n.first) n.first(n.second.first, n.second.second);
  }
}

void LocalStore::notify_state(const ItemStateChange& change) {
  std::vector<StateListener> listeners;
  {
    std::lock_guard lg(m_);
    for(const auto& [id, listener] : state_listeners_) listeners.push_back(listener);
  }
  for(auto& listener : listeners) listener(change);
}

SyncError LocalStore::start_download(const Container& container, const std::string& relative_path) {
  std::vector<Notification> notifications;
  SyncError result;
  {
    std::lock_guard lg(m_);
    auto* item = find_item_locked(container.id, relative_path);
    if(!item) {
      std::error_code ec;
      if(fs::exists(container_locked(container.id).root / relative_path, ec)) return {};
      return SyncError(sync_errc::not_found, relative_path);
    }
    ++item->download_requests;
    if(item->download_state == DownloadState::Current && !item->pending_content) return {};

    item->is_downloading = true;
    item->download_error.clear();
    if(options_.auto_materialize) {
      result = materialize_locked(container.id, relative_path, *item);
    }
    notifications = changed_locked(container.id, {relative_path});
  }
  deliver(std::move(notifications));
  log_debug(logger_.get(), "download requested for {}/{}", container.id, relative_path);
  return result;
}

SyncError LocalStore::materialize_locked(const std::string& container_id,
                                         const std::string& relative_path,
                                         RemoteItem& item) {
  if(item.pending_content) {
    auto err = write_content(container_locked(container_id).root / relative_path, *item.pending_content);
    if(err) {
      item.is_downloading = false;
      item.download_error = err.detail;
      return err;
    }
    item.pending_content.reset();
  }
  item.download_state = DownloadState::Current;
  item.is_downloading = false;
  item.percent_downloaded = 100.0;
  return {};
}

BackendQueryId LocalStore::open_query(const Container& container,
                                      const QueryPredicate& predicate,
                                      MetadataSink sink) {
  std::vector<Notification> notifications;
  BackendQueryId id = 0;
  {
    std::lock_guard lg(m_);
    id = next_query_id_++;
    OpenQuery query{container.id, predicate, sink, !hold_gathering_};
    queries_.emplace(id, query);
    if(query.gathering_finished) {
      notifications.push_back({sink, {MetadataEvent::GatheringFinished, snapshot_locked(container.id, predicate)}});
    }
  }
  deliver(std::move(notifications));
  return id;
}

void LocalStore::close_query(BackendQueryId id) {
  std::lock_guard lg(m_);
  queries_.erase(id);
}

LocalItemStatus LocalStore::local_status(const Container& container, const std::string& relative_path) {
  LocalItemStatus status;
  std::lock_guard lg(m_);
  auto absolute = container_locked(container.id).root / relative_path;
  auto* item = find_item_locked(container.id, relative_path);
  std::error_code ec;
  auto st = fs::status(absolute, ec);
  status.exists = !ec && fs::exists(st);
  status.is_directory = status.exists && fs::is_directory(st);
  if(item) {
    status.download_state = item->download_state;
    status.download_error = item->download_error;
  } else if(status.exists) {
    status.download_state = DownloadState::Current;
  }
  return status;
}

LocalStore::PathLease::PathLease(LocalStore& store,
                                 const Container& container,
                                 const std::vector<CoordinatedItem>& items)
  : store_(store) {
  std::set<std::string> keys;
  for(const auto& item : items) keys.insert(container.id + "/" + item.relative_path);
  {
    std::lock_guard lg(store_.path_lock_mutex_);
    for(const auto& key : keys) {
      auto& slot = store_.path_locks_[key];
      if(!slot) slot = std::make_shared<std::mutex>();
      slots_.emplace_back(key, slot);
    }
  }
  held_.reserve(slots_.size());
  for(auto& slot : slots_) held_.emplace_back(*slot.second);
}

LocalStore::PathLease::~PathLease() {
  held_.clear();
  std::lock_guard lg(store_.path_lock_mutex_);
  for(auto& slot : slots_) {
    auto it = store_.path_locks_.find(slot.first);
    // The map and this lease are the only owners when nobody else waits.
    if(it != store_.path_locks_.end() && it->second == slot.second && slot.second.use_count() == 2) {
      store_.path_locks_.erase(it);
    }
  }
  slots_.clear();
}

std::size_t LocalStore::path_lock_count() const {
  std::lock_guard lg(path_lock_mutex_);
  return path_locks_.size();
}

SyncError LocalStore::coordinate(const Container& container,
                                 const std::vector<CoordinatedItem>& items,
                                 const CoordinatedAccessor& accessor) {
  // Locks are taken in key order so overlapping requests cannot deadlock.
  PathLease lease(*this, container, items);

  std::vector<fs::path> absolute;
  std::vector<std::string> touched;
  for(const auto& item : items) {
    absolute.push_back(container.root / item.relative_path);
    touched.push_back(item.relative_path);
  }

  if(auto err = accessor(absolute)) return err;

  std::vector<Notification> notifications;
  {
    std::lock_guard lg(m_);
    apply_access_locked(container, items);
    notifications = changed_locked(container.id, touched);
  }
  deliver(std::move(notifications));
  return {};
}

void LocalStore::apply_access_locked(const Container& container, const std::vector<CoordinatedItem>& items) {
  auto& state = container_locked(container.id);
  for(const auto& access : items) {
    switch(access.intent) {
      case AccessIntent::Reading:
        break;
      case AccessIntent::Replacing: {
        auto& item = state.items[access.relative_path];
        item.pending_content.reset();
        item.download_state = DownloadState::Current;
        item.is_downloading = false;
        item.download_error.clear();
        item.upload_error.clear();
        item.is_uploading = !options_.auto_upload;
        item.is_uploaded = options_.auto_upload;
        if(options_.auto_upload) {
          item.percent_uploaded = 100.0;
        } else {
          item.percent_uploaded.reset();
        }
        break;
      }
      case AccessIntent::Deleting:
      case AccessIntent::Moving:
        for(auto it = state.items.begin(); it != state.items.end();) {
          if(is_under(it->first, access.relative_path)) {
            it = state.items.erase(it);
          } else {
            ++it;
          }
        }
        break;
    }
  }
}

std::vector<ConflictVersion> LocalStore::unresolved_conflict_versions(const Container& container,
                                                                      const std::string& relative_path,
                                                                      SyncError& error) {
  std::vector<ConflictVersion> out;
  std::lock_guard lg(m_);
  if(!available_) {
    error = SyncError(sync_errc::container_unavailable, "store is not reachable");
    return out;
  }
  auto* item = find_item_locked(container.id, relative_path);
  if(!item) return out;
  for(const auto& v : item->versions) {
    if(!v.resolved) out.push_back(ConflictVersion{v.id, v.modification_time, v.resolved});
  }
  return out;
}

SyncError LocalStore::replace_with_version(const Container& container,
                                           const std::string& relative_path,
                                           const std::string& version_id) {
  std::vector<Notification> notifications;
  {
    std::lock_guard lg(m_);
    if(fail_next_replace_) {
      auto message = std::move(*fail_next_replace_);
      fail_next_replace_.reset();
      return wrap_store_error(message);
    }
    auto* item = find_item_locked(container.id, relative_path);
    if(!item) return SyncError(sync_errc::not_found, relative_path);
    auto version = std::find_if(item->versions.begin(), item->versions.end(),
                                [&](const StoredVersion& v){ return v.id == version_id; });
    if(version == item->versions.end()) {
      return SyncError(sync_errc::not_found, "version " + version_id + " of " + relative_path);
    }
    if(auto err = write_content(container_locked(container.id).root / relative_path, version->content)) {
      return err;
    }
    item->pending_content.reset();
    item->download_state = DownloadState::Current;
    notifications = changed_locked(container.id, {relative_path});
  }
  deliver(std::move(notifications));
  return {};
}

SyncError LocalStore::mark_version_resolved(const Container& container,
                                            const std::string& relative_path,
                                            const std::string& version_id) {
  std::vector<Notification> notifications;
  bool cleared = false;
  {
    std::lock_guard lg(m_);
    auto* item = find_item_locked(container.id, relative_path);
    if(!item) return SyncError(sync_errc::not_found, relative_path);
    auto version = std::find_if(item->versions.begin(), item->versions.end(),
                                [&](const StoredVersion& v){ return v.id == version_id; });
    if(version == item->versions.end()) {
      return SyncError(sync_errc::not_found, "version " + version_id + " of " + relative_path);
    }
    if(version->resolved) return {};
    version->resolved = true;
    cleared = !item->has_unresolved_conflicts();
    notifications = changed_locked(container.id, {relative_path});
  }
  deliver(std::move(notifications));
  if(cleared) notify_state(ItemStateChange{container.id, relative_path, false});
  return {};
}

SyncError LocalStore::remove_other_versions(const Container& container, const std::string& relative_path) {
  std::lock_guard lg(m_);
  auto* item = find_item_locked(container.id, relative_path);
  if(!item) return SyncError(sync_errc::not_found, relative_path);
  auto& versions = item->versions;
  versions.erase(std::remove_if(versions.begin(), versions.end(),
                                [](const StoredVersion& v){ return v.resolved; }),
                 versions.end());
  return {};
}

StateListenerId LocalStore::add_state_listener(StateListener listener) {
  std::lock_guard lg(m_);
  auto id = next_listener_id_++;
  state_listeners_.emplace(id, std::move(listener));
  return id;
}

void LocalStore::remove_state_listener(StateListenerId id) {
  std::lock_guard lg(m_);
  state_listeners_.erase(id);
}

void LocalStore::set_available(bool available) {
  std::lock_guard lg(m_);
  available_ = available;
}

void LocalStore::set_auto_materialize(bool enabled) {
  std::lock_guard lg(m_);
  options_.auto_materialize = enabled;
}

void LocalStore::set_auto_upload(bool enabled) {
  std::lock_guard lg(m_);
  options_.auto_upload = enabled;
}

void LocalStore::hold_gathering() {
  std::lock_guard lg(m_);
  hold_gathering_ = true;
}

void LocalStore::release_gathering() {
  std::vector<Notification> notifications;
  {
    std::lock_guard lg(m_);
    hold_gathering_ = false;
    for(auto& [id, query] : queries_) {
      if(query.gathering_finished) continue;
      query.gathering_finished = true;
      notifications.push_back({query.sink,
                               {MetadataEvent::GatheringFinished, snapshot_locked(query.container_id, query.predicate)}});
    }
  }
  deliver(std::move(notifications));
}

bool LocalStore::seed_remote_item(const std::string& container_id,
                                  const std::string& relative_path,
                                  std::string content) {
  std::vector<Notification> notifications;
  {
    std::lock_guard lg(m_);
    auto& state = container_locked(container_id);
    std::error_code ec;
    if(fs::exists(state.root / relative_path, ec)) return false;
    auto& item = state.items[relative_path];
    item = RemoteItem{};
    item.download_state = DownloadState::NotDownloaded;
    item.pending_content = std::move(content);
    item.percent_downloaded = 0.0;
    notifications = changed_locked(container_id, {relative_path});
  }
  deliver(std::move(notifications));
  return true;
}

void LocalStore::set_indexed(const std::string& container_id, const std::string& relative_path, bool indexed) {
  std::vector<Notification> notifications;
  {
    std::lock_guard lg(m_);
    item_locked(container_id, relative_path).indexed = indexed;
    notifications = changed_locked(container_id, {relative_path});
  }
  deliver(std::move(notifications));
}

void LocalStore::inject_raw_entry(const std::string& container_id, nlohmann::json raw) {
  std::lock_guard lg(m_);
  container_locked(container_id).injected.push_back(std::move(raw));
}

bool LocalStore::report_download_progress(const std::string& container_id,
                                          const std::string& relative_path,
                                          double percent) {
  std::vector<Notification> notifications;
  {
    std::lock_guard lg(m_);
    auto* item = find_item_locked(container_id, relative_path);
    if(!item) return false;
    item->percent_downloaded = percent;
    item->is_downloading = true;
    notifications = changed_locked(container_id, {relative_path});
  }
  deliver(std::move(notifications));
  return true;
}

bool LocalStore::complete_download(const std::string& container_id, const std::string& relative_path) {
  std::vector<Notification> notifications;
  {
    std::lock_guard lg(m_);
    auto* item = find_item_locked(container_id, relative_path);
    if(!item) return false;
    if(auto err = materialize_locked(container_id, relative_path, *item)) {
      log_error(logger_.get(), "cannot materialize {}: {}", relative_path, err.message());
    }
    notifications = changed_locked(container_id, {relative_path});
  }
  deliver(std::move(notifications));
  return true;
}

bool LocalStore::fail_download(const std::string& container_id,
                               const std::string& relative_path,
                               const std::string& message) {
  std::vector<Notification> notifications;
  {
    std::lock_guard lg(m_);
    auto* item = find_item_locked(container_id, relative_path);
    if(!item) return false;
    item->is_downloading = false;
    item->download_error = message;
    notifications = changed_locked(container_id, {relative_path});
  }
  deliver(std::move(notifications));
  return true;
}

bool LocalStore::report_upload_progress(const std::string& container_id,
                                        const std::string& relative_path,
                                        double percent) {
  std::vector<Notification> notifications;
  {
    std::lock_guard lg(m_);
    auto* item = find_item_locked(container_id, relative_path);
    if(!item) return false;
    item->percent_uploaded = percent;
    item->is_uploading = percent < 100.0;
    item->is_uploaded = percent >= 100.0;
    notifications = changed_locked(container_id, {relative_path});
  }
  deliver(std::move(notifications));
  return true;
}

bool LocalStore::fail_upload(const std::string& container_id,
                             const std::string& relative_path,
                             const std::string& message) {
  std::vector<Notification> notifications;
  {
    std::lock_guard lg(m_);
    auto* item = find_item_locked(container_id, relative_path);
    if(!item) return false;
    item->is_uploading = false;
    item->upload_error = message;
    notifications = changed_locked(container_id, {relative_path});
  }
  deliver(std::move(notifications));
  return true;
}

std::string LocalStore::add_conflict_version(const std::string& container_id,
                                             const std::string& relative_path,
                                             std::string content,
                                             std::optional<WallTime> modification_time) {
  std::vector<Notification> notifications;
  std::string id;
  {
    std::lock_guard lg(m_);
    auto& state = container_locked(container_id);
    std::error_code ec;
    if(!state.items.count(relative_path) && !fs::exists(state.root / relative_path, ec)) return {};
    auto& item = state.items[relative_path];
    id = sha256_hex(container_id + "/" + relative_path + "#" + std::to_string(++version_sequence_) + ":" + content)
           .substr(0, 16);
    item.versions.push_back(StoredVersion{id, std::move(content), modification_time, false});
    notifications = changed_locked(container_id, {relative_path});
  }
  deliver(std::move(notifications));
  notify_state(ItemStateChange{container_id, relative_path, true});
  return id;
}

void LocalStore::fail_next_replace(std::string message) {
  std::lock_guard lg(m_);
  fail_next_replace_ = std::move(message);
}

std::size_t LocalStore::download_requests(const std::string& container_id,
                                          const std::string& relative_path) const {
  std::lock_guard lg(m_);
  const auto* state = find_container_locked(container_id);
  if(!state) return 0;
  auto it = state->items.find(relative_path);
  return it == state->items.end() ? 0 : it->second.download_requests;
}

std::size_t LocalStore::open_query_count() const {
  std::lock_guard lg(m_);
  return queries_.size();
}

std::size_t LocalStore::version_count(const std::string& container_id, const std::string& relative_path) const {
  std::lock_guard lg(m_);
  const auto* state = find_container_locked(container_id);
  if(!state) return 0;
  auto it = state->items.find(relative_path);
  return it == state->items.end() ? 0 : it->second.versions.size();
}

bool LocalStore::has_unresolved_conflicts(const std::string& container_id,
                                          const std::string& relative_path) const {
  std::lock_guard lg(m_);
  const auto* state = find_container_locked(container_id);
  if(!state) return false;
  auto it = state->items.find(relative_path);
  return it != state->items.end() && it->second.has_unresolved_conflicts();
}

} // namespace docsync
