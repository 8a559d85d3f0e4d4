#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "item_descriptor.hpp"
#include "live_query.hpp"
#include "log.hpp"
#include "store_backend.hpp"
#include "sync_clock.hpp"
#include "sync_error.hpp"

namespace docsync {

struct LookupTiming {
  std::chrono::milliseconds timeout{30000};
  std::chrono::milliseconds warning{10000};
};

// One-shot metadata lookup for a single item. Completes with the item on the
// first notification that carries it, with nothing once gathering finishes
// empty, or with query_timeout when the index never answers.
class ItemLookup : public std::enable_shared_from_this<ItemLookup> {
public:
  using Completion = std::function<void(const SyncError&, const std::optional<ItemDescriptor>&)>;

  static std::shared_ptr<ItemLookup> create(Strand strand,
                                            std::shared_ptr<StoreBackend> backend,
                                            Container container,
                                            std::string relative_path,
                                            std::shared_ptr<ObserverRegistry> registry,
                                            LookupTiming timing,
                                            std::shared_ptr<Logger> logger = nullptr);
  ~ItemLookup();

  void start(Completion completion);
  void cancel();

  bool finished() const { return finished_; }
  // Raw record behind the result; null when absent.
  const nlohmann::json& raw() const { return raw_; }

private:
  ItemLookup(Strand strand,
             std::shared_ptr<StoreBackend> backend,
             Container container,
             std::string relative_path,
             std::shared_ptr<ObserverRegistry> registry,
             LookupTiming timing,
             std::shared_ptr<Logger> logger);

  void on_query_event(LiveQuery& query, MetadataEvent event);
  void finish(const SyncError& error, const std::optional<ItemDescriptor>& item);

  Strand strand_;
  std::shared_ptr<StoreBackend> backend_;
  Container container_;
  std::string relative_path_;
  std::shared_ptr<ObserverRegistry> registry_;
  LookupTiming timing_;
  std::shared_ptr<Logger> logger_;

  SyncTimer timeout_timer_;
  SyncTimer warning_timer_;
  std::shared_ptr<LiveQuery> query_;
  nlohmann::json raw_;
  Completion completion_;
  bool finished_ = false;
  std::shared_ptr<ItemLookup> self_;
};

} // namespace docsync
