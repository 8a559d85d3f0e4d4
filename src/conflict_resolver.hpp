#pragma once

#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "log.hpp"
#include "store_backend.hpp"
#include "sync_clock.hpp"
#include "sync_error.hpp"

namespace docsync {

// Index of the version that wins last-write-wins: latest modification time,
// a missing time counting as the earliest possible. Ties keep store order.
std::optional<std::size_t> select_winning_version(const std::vector<ConflictVersion>& versions);

// Collapses conflicted items to a single version whenever the store reports
// that an item entered a conflicted state. Failures leave the item untouched
// and are remembered per item until the next successful resolution.
class ConflictResolver : public std::enable_shared_from_this<ConflictResolver> {
public:
  static std::shared_ptr<ConflictResolver> create(asio::io_context& io,
                                                  std::shared_ptr<StoreBackend> backend,
                                                  std::shared_ptr<Logger> logger = nullptr);
  ~ConflictResolver();

  ConflictResolver(const ConflictResolver&) = delete;
  ConflictResolver& operator=(const ConflictResolver&) = delete;

  // Subscribes to the store's state-change events.
  void attach();
  void detach();

  // Runs the policy for one item on the calling thread.
  SyncError resolve(const Container& container, const std::string& relative_path);

  std::optional<SyncError> last_error(const std::string& container_id, const std::string& relative_path) const;
  std::size_t resolved_count() const { return resolved_.load(std::memory_order_acquire); }

private:
  ConflictResolver(asio::io_context& io, std::shared_ptr<StoreBackend> backend, std::shared_ptr<Logger> logger);

  void on_state_change(const ItemStateChange& change);
  void record_error(const std::string& container_id, const std::string& relative_path, const SyncError& error);
  void clear_error(const std::string& container_id, const std::string& relative_path);

  Strand strand_;
  std::shared_ptr<StoreBackend> backend_;
  std::shared_ptr<Logger> logger_;

  std::mutex listener_mutex_;
  StateListenerId listener_id_ = 0;

  mutable std::mutex errors_mutex_;
  std::map<std::pair<std::string, std::string>, SyncError> errors_;
  std::atomic<std::size_t> resolved_{0};
};

} // namespace docsync
