#include "item_lookup.hpp"

namespace docsync {

std::shared_ptr<ItemLookup> ItemLookup::create(Strand strand,
                                               std::shared_ptr<StoreBackend> backend,
                                               Container container,
                                               std::string relative_path,
                                               std::shared_ptr<ObserverRegistry> registry,
                                               LookupTiming timing,
                                               std::shared_ptr<Logger> logger) {
  return std::shared_ptr<ItemLookup>(new ItemLookup(std::move(strand),
                                                    std::move(backend),
                                                    std::move(container),
                                                    std::move(relative_path),
                                                    std::move(registry),
                                                    timing,
                                                    std::move(logger)));
}

ItemLookup::ItemLookup(Strand strand,
                       std::shared_ptr<StoreBackend> backend,
                       Container container,
                       std::string relative_path,
                       std::shared_ptr<ObserverRegistry> registry,
                       LookupTiming timing,
                       std::shared_ptr<Logger> logger)
  : strand_(std::move(strand)),
    backend_(std::move(backend)),
    container_(std::move(container)),
    relative_path_(std::move(relative_path)),
    registry_(registry ? std::move(registry) : std::make_shared<ObserverRegistry>()),
    timing_(timing),
    logger_(std::move(logger)),
    timeout_timer_(strand_),
    warning_timer_(strand_) {}

ItemLookup::~ItemLookup() {
  if(query_) query_->stop();
}

void ItemLookup::start(Completion completion) {
  asio::post(strand_, [self = shared_from_this(), completion = std::move(completion)]() mutable {
    if(self->finished_ || self->query_) return;
    self->completion_ = std::move(completion);
    self->self_ = self;

    std::weak_ptr<ItemLookup> weak = self;
    self->warning_timer_.expires_after(self->timing_.warning);
    self->warning_timer_.async_wait([weak](const std::error_code& ec){
      auto s = weak.lock();
      if(!s || ec || s->finished_) return;
      log_warn(s->logger_.get(), "metadata lookup for {} still pending after {} ms",
               s->relative_path_, s->timing_.warning.count());
    });
    self->timeout_timer_.expires_after(self->timing_.timeout);
    self->timeout_timer_.async_wait([weak](const std::error_code& ec){
      auto s = weak.lock();
      if(!s || ec || s->finished_) return;
      s->finish(SyncError(sync_errc::query_timeout,
                          fmt::format("{} after {} ms", s->relative_path_, s->timing_.timeout.count())),
                std::nullopt);
    });

    self->query_ = LiveQuery::create(self->strand_, self->backend_, self->container_,
                                     QueryPredicate::item(self->relative_path_),
                                     self->registry_, self->logger_);
    self->query_->subscribe_all([weak](LiveQuery& query, MetadataEvent event){
      if(auto s = weak.lock()) s->on_query_event(query, event);
    });
    self->query_->start();
  });
}

void ItemLookup::cancel() {
  asio::dispatch(strand_, [self = shared_from_this()]{
    if(self->finished_) return;
    self->finish(SyncError(sync_errc::canceled, self->relative_path_), std::nullopt);
  });
}

void ItemLookup::on_query_event(LiveQuery& query, MetadataEvent event) {
  if(finished_) return;
  if(const auto* raw = query.first_result()) {
    ItemDescriptor item;
    std::string error;
    raw_ = *raw;
    if(map_item(*raw, item, error, logger_.get())) {
      finish({}, item);
    } else {
      log_warn(logger_.get(), "metadata for {} is malformed: {}", relative_path_, error);
      finish({}, std::nullopt);
    }
    return;
  }
  if(event == MetadataEvent::GatheringFinished) {
    finish({}, std::nullopt);
  }
}

void ItemLookup::finish(const SyncError& error, const std::optional<ItemDescriptor>& item) {
  if(finished_) return;
  finished_ = true;
  auto keep_alive = std::move(self_);

  if(query_) query_->stop();
  timeout_timer_.cancel();
  warning_timer_.cancel();

  auto completion = std::move(completion_);
  completion_ = nullptr;
  if(completion) completion(error, item);
}

} // namespace docsync
