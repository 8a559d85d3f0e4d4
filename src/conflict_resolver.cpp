#include "conflict_resolver.hpp"

#include <algorithm>
#include <numeric>

namespace docsync {

std::optional<std::size_t> select_winning_version(const std::vector<ConflictVersion>& versions) {
  if(versions.empty()) return std::nullopt;
  std::vector<std::size_t> order(versions.size());
  std::iota(order.begin(), order.end(), 0);
  auto time_of = [&](std::size_t i){
    return versions[i].modification_time.value_or(WallTime::min());
  };
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b){
    return time_of(a) > time_of(b);
  });
  return order.front();
}

std::shared_ptr<ConflictResolver> ConflictResolver::create(asio::io_context& io,
                                                           std::shared_ptr<StoreBackend> backend,
                                                           std::shared_ptr<Logger> logger) {
  return std::shared_ptr<ConflictResolver>(new ConflictResolver(io, std::move(backend), std::move(logger)));
}

ConflictResolver::ConflictResolver(asio::io_context& io,
                                   std::shared_ptr<StoreBackend> backend,
                                   std::shared_ptr<Logger> logger)
  : strand_(asio::make_strand(io)),
    backend_(std::move(backend)),
    logger_(std::move(logger)) {}

ConflictResolver::~ConflictResolver() {
  detach();
}

void ConflictResolver::attach() {
  std::lock_guard lg(listener_mutex_);
  if(listener_id_ != 0) return;
  std::weak_ptr<ConflictResolver> weak = weak_from_this();
  listener_id_ = backend_->add_state_listener([weak](const ItemStateChange& change){
    if(auto self = weak.lock()) self->on_state_change(change);
  });
}

void ConflictResolver::detach() {
  std::lock_guard lg(listener_mutex_);
  if(listener_id_ == 0) return;
  backend_->remove_state_listener(listener_id_);
  listener_id_ = 0;
}

void ConflictResolver::on_state_change(const ItemStateChange& change) {
  if(!change.has_unresolved_conflicts) return;
  std::weak_ptr<ConflictResolver> weak = weak_from_this();
  asio::post(strand_, [weak, change]{
    auto self = weak.lock();
    if(!self) return;
    SyncError error;
    auto container = self->backend_->resolve_container(change.container_id, error);
    if(!container) {
      self->record_error(change.container_id, change.relative_path, error);
      return;
    }
    // Failures are recorded by resolve() and surface on the next access.
    self->resolve(*container, change.relative_path);
  });
}

SyncError ConflictResolver::resolve(const Container& container, const std::string& relative_path) {
  SyncError error;
  auto versions = backend_->unresolved_conflict_versions(container, relative_path, error);
  if(error) {
    record_error(container.id, relative_path, error);
    return error;
  }
  auto winner = select_winning_version(versions);
  if(!winner) return {};

  const auto& chosen = versions[*winner];
  if(auto err = backend_->replace_with_version(container, relative_path, chosen.version_id)) {
    record_error(container.id, relative_path, err);
    return err;
  }
  for(const auto& version : versions) {
    if(auto err = backend_->mark_version_resolved(container, relative_path, version.version_id)) {
      record_error(container.id, relative_path, err);
      return err;
    }
  }
  if(auto err = backend_->remove_other_versions(container, relative_path)) {
    record_error(container.id, relative_path, err);
    return err;
  }

  clear_error(container.id, relative_path);
  resolved_.fetch_add(1, std::memory_order_acq_rel);
  log_info(logger_.get(), "resolved {} conflicting version(s) of {} with version {}",
           versions.size(), relative_path, chosen.version_id);
  return {};
}

void ConflictResolver::record_error(const std::string& container_id,
                                    const std::string& relative_path,
                                    const SyncError& error) {
  log_warn(logger_.get(), "conflict resolution for {} failed: {}", relative_path, error.message());
  std::lock_guard lg(errors_mutex_);
  errors_[{container_id, relative_path}] = error;
}

void ConflictResolver::clear_error(const std::string& container_id, const std::string& relative_path) {
  std::lock_guard lg(errors_mutex_);
  errors_.erase({container_id, relative_path});
}

std::optional<SyncError> ConflictResolver::last_error(const std::string& container_id,
                                                      const std::string& relative_path) const {
  std::lock_guard lg(errors_mutex_);
  auto it = errors_.find({container_id, relative_path});
  if(it == errors_.end()) return std::nullopt;
  return it->second;
}

} // namespace docsync
