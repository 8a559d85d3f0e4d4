#include "live_query.hpp"

#include <utility>

namespace docsync {

QueryKey ObserverRegistry::next_key() {
  return next_key_.fetch_add(1);
}

void ObserverRegistry::add(QueryKey key, ObserverToken token, Release release) {
  std::lock_guard lg(m_);
  entries_[key].push_back(Entry{token, std::move(release)});
}

std::size_t ObserverRegistry::release_all(QueryKey key) {
  std::vector<Entry> drained;
  {
    std::lock_guard lg(m_);
    auto it = entries_.find(key);
    if(it == entries_.end()) return 0;
    drained = std::move(it->second);
    entries_.erase(it);
  }
  for(auto& entry : drained) {
    if(entry.release) entry.release();
  }
  return drained.size();
}

std::size_t ObserverRegistry::token_count(QueryKey key) const {
  std::lock_guard lg(m_);
  auto it = entries_.find(key);
  return it == entries_.end() ? 0 : it->second.size();
}

std::size_t ObserverRegistry::active_queries() const {
  std::lock_guard lg(m_);
  return entries_.size();
}

const char* to_string(QueryPhase phase) {
  switch(phase) {
    case QueryPhase::Started: return "started";
    case QueryPhase::Gathering: return "gathering";
    case QueryPhase::Settled: return "settled";
    case QueryPhase::Stopped: return "stopped";
  }
  return "unknown";
}

std::shared_ptr<LiveQuery> LiveQuery::create(Strand strand,
                                             std::shared_ptr<StoreBackend> backend,
                                             Container container,
                                             QueryPredicate predicate,
                                             std::shared_ptr<ObserverRegistry> registry,
                                             std::shared_ptr<Logger> logger) {
  return std::shared_ptr<LiveQuery>(new LiveQuery(std::move(strand),
                                                  std::move(backend),
                                                  std::move(container),
                                                  std::move(predicate),
                                                  std::move(registry),
                                                  std::move(logger)));
}

LiveQuery::LiveQuery(Strand strand,
                     std::shared_ptr<StoreBackend> backend,
                     Container container,
                     QueryPredicate predicate,
                     std::shared_ptr<ObserverRegistry> registry,
                     std::shared_ptr<Logger> logger)
  : strand_(std::move(strand)),
    backend_(std::move(backend)),
    container_(std::move(container)),
    predicate_(std::move(predicate)),
    registry_(registry ? std::move(registry) : std::make_shared<ObserverRegistry>()),
    logger_(std::move(logger)),
    key_(registry_->next_key()) {}

LiveQuery::~LiveQuery() {
  stop();
}

ObserverToken LiveQuery::subscribe(MetadataEvent event, Listener listener) {
  if(stopped() || !listener) return 0;
  ObserverToken token = 0;
  {
    std::lock_guard lg(listener_mutex_);
    token = next_token_++;
    listeners_.emplace(token, std::make_pair(event, std::move(listener)));
  }
  std::weak_ptr<LiveQuery> weak = weak_from_this();
  registry_->add(key_, token, [weak, token](){
    if(auto self = weak.lock()) self->remove_listener(token);
  });
  return token;
}

void LiveQuery::subscribe_all(const Listener& listener) {
  subscribe(MetadataEvent::GatheringProgress, listener);
  subscribe(MetadataEvent::GatheringFinished, listener);
  subscribe(MetadataEvent::Updated, listener);
}

void LiveQuery::remove_listener(ObserverToken token) {
  std::lock_guard lg(listener_mutex_);
  listeners_.erase(token);
}

void LiveQuery::start() {
  if(started_.exchange(true)) return;
  std::lock_guard lg(listener_mutex_);
  if(stopped()) return;
  phase_.store(QueryPhase::Gathering, std::memory_order_release);
  std::weak_ptr<LiveQuery> weak = weak_from_this();
  backend_id_ = backend_->open_query(container_, predicate_,
    [weak](MetadataEvent event, const std::vector<nlohmann::json>& results){
      auto self = weak.lock();
      if(!self || self->stopped()) return;
      asio::post(self->strand_, [self, event, results]() mutable {
        self->deliver(event, std::move(results));
      });
    });
  log_debug(logger_.get(), "query {} started for {}", key_, predicate_.describe());
}

void LiveQuery::deliver(MetadataEvent event, std::vector<nlohmann::json> results) {
  if(stopped()) return;

  // The store may report changes before its first scan completes; those are
  // folded into gathering progress so "finished" always comes first.
  auto phase = this->phase();
  if(phase == QueryPhase::Gathering) {
    if(event == MetadataEvent::Updated) event = MetadataEvent::GatheringProgress;
    if(event == MetadataEvent::GatheringFinished) {
      phase_.store(QueryPhase::Settled, std::memory_order_release);
    }
  } else if(phase == QueryPhase::Settled) {
    event = MetadataEvent::Updated;
  }
  results_ = std::move(results);

  std::vector<Listener> targets;
  {
    std::lock_guard lg(listener_mutex_);
    for(const auto& [token, binding] : listeners_) {
      if(binding.first == event) targets.push_back(binding.second);
    }
  }
  for(auto& listener : targets) {
    if(stopped()) break;
    listener(*this, event);
  }
}

bool LiveQuery::stop() {
  if(stopped_.exchange(true)) return false;
  phase_.store(QueryPhase::Stopped, std::memory_order_release);
  BackendQueryId id = 0;
  {
    std::lock_guard lg(listener_mutex_);
    id = backend_id_;
    backend_id_ = 0;
  }
  if(id != 0) backend_->close_query(id);
  auto released = registry_->release_all(key_);
  log_debug(logger_.get(), "query {} stopped, {} observer(s) released", key_, released);
  return true;
}

const nlohmann::json* LiveQuery::first_result() const {
  if(results_.empty()) return nullptr;
  return &results_.front();
}

} // namespace docsync
