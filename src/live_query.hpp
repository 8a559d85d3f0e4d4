#pragma once

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "log.hpp"
#include "store_backend.hpp"
#include "sync_clock.hpp"

namespace docsync {

using QueryKey = uint64_t;
using ObserverToken = uint64_t;

// Arena of listener registrations keyed by query. release_all() drains a
// key's list and runs every release handle exactly once; later calls for
// the same key find nothing and return 0.
class ObserverRegistry {
public:
  using Release = std::function<void()>;

  QueryKey next_key();

  void add(QueryKey key, ObserverToken token, Release release);
  std::size_t release_all(QueryKey key);

  std::size_t token_count(QueryKey key) const;
  std::size_t active_queries() const;

private:
  struct Entry {
    ObserverToken token = 0;
    Release release;
  };

  mutable std::mutex m_;
  std::unordered_map<QueryKey, std::vector<Entry>> entries_;
  std::atomic<QueryKey> next_key_{1};
};

enum class QueryPhase {
  Started,
  Gathering,
  Settled,
  Stopped
};

const char* to_string(QueryPhase phase);

// Standing query against the store's index. Notifications are delivered on
// the owning strand, one at a time; stop() may be called from any listener
// and is a no-op after the first call.
class LiveQuery : public std::enable_shared_from_this<LiveQuery> {
public:
  using Listener = std::function<void(LiveQuery& query, MetadataEvent event)>;

  static std::shared_ptr<LiveQuery> create(Strand strand,
                                           std::shared_ptr<StoreBackend> backend,
                                           Container container,
                                           QueryPredicate predicate,
                                           std::shared_ptr<ObserverRegistry> registry,
                                           std::shared_ptr<Logger> logger = nullptr);
  ~LiveQuery();

  ObserverToken subscribe(MetadataEvent event, Listener listener);
  // Subscribes the same listener to every event kind.
  void subscribe_all(const Listener& listener);

  void start();
  // Returns true only for the call that actually tore the query down.
  bool stop();

  QueryPhase phase() const { return phase_.load(std::memory_order_acquire); }
  bool stopped() const { return stopped_.load(std::memory_order_acquire); }
  QueryKey key() const { return key_; }
  const Container& container() const { return container_; }
  const QueryPredicate& predicate() const { return predicate_; }

  // Snapshot of the latest result set; only meaningful on the strand.
  const std::vector<nlohmann::json>& results() const { return results_; }
  std::size_t result_count() const { return results_.size(); }
  const nlohmann::json* first_result() const;

private:
  LiveQuery(Strand strand,
            std::shared_ptr<StoreBackend> backend,
            Container container,
            QueryPredicate predicate,
            std::shared_ptr<ObserverRegistry> registry,
            std::shared_ptr<Logger> logger);

  void deliver(MetadataEvent event, std::vector<nlohmann::json> results);
  void remove_listener(ObserverToken token);

  Strand strand_;
  std::shared_ptr<StoreBackend> backend_;
  Container container_;
  QueryPredicate predicate_;
  std::shared_ptr<ObserverRegistry> registry_;
  std::shared_ptr<Logger> logger_;
  QueryKey key_ = 0;

  std::atomic<QueryPhase> phase_{QueryPhase::Started};
  std::atomic<bool> started_{false};
  std::atomic<bool> stopped_{false};
  BackendQueryId backend_id_ = 0;

  mutable std::mutex listener_mutex_;
  std::map<ObserverToken, std::pair<MetadataEvent, Listener>> listeners_;
  ObserverToken next_token_ = 1;

  std::vector<nlohmann::json> results_;
};

} // namespace docsync
