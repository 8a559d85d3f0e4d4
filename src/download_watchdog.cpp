#include "download_watchdog.hpp"

#include <algorithm>

#include "item_descriptor.hpp"
#include "utils.hpp"

namespace docsync {

std::size_t WatchdogSchedule::attempt_count() const {
  if(attempts > 0) return attempts;
  return std::max<std::size_t>(idle.size(), 1);
}

std::chrono::milliseconds WatchdogSchedule::idle_for(std::size_t attempt) const {
  if(idle.empty()) return std::chrono::milliseconds::zero();
  return idle[std::min(attempt, idle.size() - 1)];
}

std::chrono::milliseconds WatchdogSchedule::backoff_for(std::size_t attempt) const {
  if(backoff.empty()) return std::chrono::milliseconds::zero();
  return backoff[std::min(attempt, backoff.size() - 1)];
}

std::string WatchdogSchedule::describe() const {
  return fmt::format("idle [{}]s, backoff [{}]s, {} attempt(s)",
                     format_schedule(idle), format_schedule(backoff), attempt_count());
}

const char* to_string(WatchdogState state) {
  switch(state) {
    case WatchdogState::Idle: return "idle";
    case WatchdogState::CheckingCurrentState: return "checking-current-state";
    case WatchdogState::AttemptRunning: return "attempt-running";
    case WatchdogState::Backoff: return "backoff";
    case WatchdogState::Completed: return "completed";
    case WatchdogState::Failed: return "failed";
  }
  return "unknown";
}

const char* to_string(WatchdogEvent event) {
  switch(event) {
    case WatchdogEvent::Start: return "start";
    case WatchdogEvent::AlreadyMaterialized: return "already-materialized";
    case WatchdogEvent::BeginAttempt: return "begin-attempt";
    case WatchdogEvent::ProgressObserved: return "progress-observed";
    case WatchdogEvent::Materialized: return "materialized";
    case WatchdogEvent::ErrorObserved: return "error-observed";
    case WatchdogEvent::NotFound: return "not-found";
    case WatchdogEvent::TimerFired: return "timer-fired";
    case WatchdogEvent::BackoffElapsed: return "backoff-elapsed";
    case WatchdogEvent::CancelRequested: return "cancel-requested";
  }
  return "unknown";
}

WatchdogState next_watchdog_state(WatchdogState state, WatchdogEvent event, bool last_attempt) {
  if(is_terminal(state)) return state;
  if(event == WatchdogEvent::CancelRequested) return WatchdogState::Failed;

  switch(state) {
    case WatchdogState::Idle:
      return event == WatchdogEvent::Start ? WatchdogState::CheckingCurrentState : state;

    case WatchdogState::CheckingCurrentState:
      switch(event) {
        case WatchdogEvent::AlreadyMaterialized: return WatchdogState::Completed;
        case WatchdogEvent::BeginAttempt: return WatchdogState::AttemptRunning;
        case WatchdogEvent::ErrorObserved:
        case WatchdogEvent::NotFound: return WatchdogState::Failed;
        default: return state;
      }

    case WatchdogState::AttemptRunning:
      switch(event) {
        case WatchdogEvent::Materialized: return WatchdogState::Completed;
        case WatchdogEvent::ErrorObserved:
        case WatchdogEvent::NotFound: return WatchdogState::Failed;
        case WatchdogEvent::TimerFired:
          return last_attempt ? WatchdogState::Failed : WatchdogState::Backoff;
        default: return state;
      }

    case WatchdogState::Backoff:
      return event == WatchdogEvent::BackoffElapsed ? WatchdogState::AttemptRunning : state;

    case WatchdogState::Completed:
    case WatchdogState::Failed:
      break;
  }
  return state;
}

std::shared_ptr<DownloadWatchdog> DownloadWatchdog::create(Strand strand,
                                                           std::shared_ptr<StoreBackend> backend,
                                                           Container container,
                                                           std::string relative_path,
                                                           WatchdogSchedule schedule,
                                                           std::shared_ptr<ObserverRegistry> registry,
                                                           std::shared_ptr<Logger> logger) {
  return std::shared_ptr<DownloadWatchdog>(new DownloadWatchdog(std::move(strand),
                                                                std::move(backend),
                                                                std::move(container),
                                                                std::move(relative_path),
                                                                std::move(schedule),
                                                                std::move(registry),
                                                                std::move(logger)));
}

DownloadWatchdog::DownloadWatchdog(Strand strand,
                                   std::shared_ptr<StoreBackend> backend,
                                   Container container,
                                   std::string relative_path,
                                   WatchdogSchedule schedule,
                                   std::shared_ptr<ObserverRegistry> registry,
                                   std::shared_ptr<Logger> logger)
  : strand_(std::move(strand)),
    backend_(std::move(backend)),
    container_(std::move(container)),
    relative_path_(std::move(relative_path)),
    schedule_(std::move(schedule)),
    registry_(registry ? std::move(registry) : std::make_shared<ObserverRegistry>()),
    logger_(std::move(logger)),
    timer_(strand_) {}

DownloadWatchdog::~DownloadWatchdog() {
  if(query_) query_->stop();
}

void DownloadWatchdog::set_progress_handler(ProgressHandler handler) {
  progress_ = std::move(handler);
}

void DownloadWatchdog::start(Completion completion) {
  asio::post(strand_, [self = shared_from_this(), completion = std::move(completion)]() mutable {
    if(self->state() != WatchdogState::Idle) return;
    self->completion_ = std::move(completion);
    self->self_ = self;
    self->run_start();
  });
}

void DownloadWatchdog::cancel() {
  asio::dispatch(strand_, [self = shared_from_this()]{
    if(is_terminal(self->state())) return;
    self->apply(WatchdogEvent::CancelRequested);
    self->finish(SyncError(sync_errc::canceled, self->relative_path_));
  });
}

WatchdogState DownloadWatchdog::apply(WatchdogEvent event) {
  auto current = state();
  auto next = next_watchdog_state(current, event, last_attempt());
  if(next != current) {
    log_debug(logger_.get(), "{}: {} --{}--> {}",
              relative_path_, to_string(current), to_string(event), to_string(next));
    state_.store(next, std::memory_order_release);
  }
  return next;
}

bool DownloadWatchdog::last_attempt() const {
  return attempt() + 1 >= schedule_.attempt_count();
}

void DownloadWatchdog::run_start() {
  apply(WatchdogEvent::Start);
  if(schedule_.idle.empty()) {
    apply(WatchdogEvent::ErrorObserved);
    finish(SyncError(sync_errc::invalid_argument, "idle schedule is empty"));
    return;
  }

  // Materialized content needs no query at all.
  auto status = backend_->local_status(container_, relative_path_);
  if(status.exists && (status.is_directory || status.download_state == DownloadState::Current)) {
    apply(WatchdogEvent::AlreadyMaterialized);
    finish({});
    return;
  }

  log_debug(logger_.get(), "waiting for {} ({})", relative_path_, schedule_.describe());
  apply(WatchdogEvent::BeginAttempt);
  begin_attempt(0);
}

void DownloadWatchdog::begin_attempt(std::size_t index) {
  if(query_) {
    invariant_violation(fmt::format("{}: attempt {} started while the previous one is live", relative_path_, index + 1),
                        logger_.get());
  }
  attempt_.store(index, std::memory_order_release);
  last_progress_ = 0.0;
  log_debug(logger_.get(), "attempt {} of {} for {} (idle window {} ms)",
            index + 1, schedule_.attempt_count(), relative_path_, schedule_.idle_for(index).count());

  if(auto err = backend_->start_download(container_, relative_path_)) {
    apply(err.is(sync_errc::not_found) ? WatchdogEvent::NotFound : WatchdogEvent::ErrorObserved);
    finish(std::move(err));
    return;
  }

  query_ = LiveQuery::create(strand_, backend_, container_, QueryPredicate::item(relative_path_), registry_, logger_);
  std::weak_ptr<DownloadWatchdog> weak = weak_from_this();
  query_->subscribe_all([weak](LiveQuery& query, MetadataEvent){
    if(auto self = weak.lock()) self->on_query_event(query);
  });
  arm_timer(schedule_.idle_for(index), WatchdogEvent::TimerFired);
  query_->start();
}

void DownloadWatchdog::on_query_event(LiveQuery& query) {
  if(state() != WatchdogState::AttemptRunning || &query != query_.get()) return;

  bool have_result = false;
  bool is_directory = false;
  bool exists_locally = false;
  DownloadState download_state = DownloadState::Unknown;
  std::string download_error;
  std::optional<double> percent;

  // Stage one: the query's own view of the item.
  if(const auto* raw = query.first_result()) {
    ItemDescriptor item;
    std::string map_error;
    if(map_item(*raw, item, map_error, logger_.get())) {
      have_result = true;
      is_directory = item.is_directory;
      download_state = item.download_state;
      auto fields = read_transfer_fields(*raw);
      download_error = fields.download_error;
      percent = fields.percent_downloaded;
    } else {
      log_warn(logger_.get(), "ignoring malformed metadata for {}: {}", relative_path_, map_error);
    }
  }

  // Stage two: the index has nothing yet, ask the filesystem directly.
  if(!have_result) {
    auto status = backend_->local_status(container_, relative_path_);
    exists_locally = status.exists;
    is_directory = status.is_directory;
    download_state = status.exists ? status.download_state : DownloadState::Unknown;
    download_error = status.download_error;
  }

  if(!download_error.empty()) {
    apply(WatchdogEvent::ErrorObserved);
    finish(wrap_store_error(download_error));
    return;
  }
  if((have_result || exists_locally) && (is_directory || download_state == DownloadState::Current)) {
    if(progress_) progress_(1.0);
    apply(WatchdogEvent::Materialized);
    finish({});
    return;
  }
  if(!have_result && !exists_locally &&
     query.phase() == QueryPhase::Settled && query.result_count() == 0) {
    apply(WatchdogEvent::NotFound);
    finish(SyncError(sync_errc::not_found, relative_path_));
    return;
  }
  if(percent) observe_progress(*percent);
}

void DownloadWatchdog::observe_progress(double percent) {
  if(progress_) progress_(percent / 100.0);
  // Re-reported values must not keep a stalled transfer alive.
  if(percent <= last_progress_) return;
  last_progress_ = percent;
  apply(WatchdogEvent::ProgressObserved);
  arm_timer(schedule_.idle_for(attempt()), WatchdogEvent::TimerFired);
}

void DownloadWatchdog::arm_timer(std::chrono::milliseconds delay, WatchdogEvent on_fire) {
  // One timer per watchdog: the previous wait is always cancelled first.
  timer_.cancel();
  auto generation = ++timer_generation_;
  timer_.expires_after(delay);
  std::weak_ptr<DownloadWatchdog> weak = weak_from_this();
  timer_.async_wait(asio::bind_executor(strand_, [weak, generation, on_fire](const std::error_code& ec){
    auto self = weak.lock();
    if(!self || ec || generation != self->timer_generation_) return;
    self->on_timer(on_fire);
  }));
}

void DownloadWatchdog::on_timer(WatchdogEvent event) {
  if(event == WatchdogEvent::BackoffElapsed) {
    if(state() != WatchdogState::Backoff) return;
    apply(WatchdogEvent::BackoffElapsed);
    begin_attempt(attempt() + 1);
    return;
  }

  if(state() != WatchdogState::AttemptRunning) return;
  auto idle = schedule_.idle_for(attempt());
  auto next = apply(WatchdogEvent::TimerFired);
  if(next == WatchdogState::Failed) {
    finish(SyncError(sync_errc::stalled_transfer,
                     fmt::format("{}: no progress for {} ms on attempt {} of {}",
                                 relative_path_, idle.count(), attempt() + 1, schedule_.attempt_count())));
    return;
  }

  auto delay = schedule_.backoff_for(attempt());
  log_info(logger_.get(), "{} idle for {} ms on attempt {} of {}, retrying in {} ms",
           relative_path_, idle.count(), attempt() + 1, schedule_.attempt_count(), delay.count());
  release_attempt();
  arm_timer(delay, WatchdogEvent::BackoffElapsed);
}

void DownloadWatchdog::release_attempt() {
  if(query_) {
    query_->stop();
    query_.reset();
  }
  timer_.cancel();
  ++timer_generation_;
}

void DownloadWatchdog::finish(SyncError error) {
  if(finished_) return;
  finished_ = true;
  auto keep_alive = std::move(self_);

  release_attempt();
  cleanups_.fetch_add(1, std::memory_order_acq_rel);
  log_debug(logger_.get(), "watchdog for {} released after {} attempt(s): {}",
            relative_path_, attempt() + 1, error ? error.message() : std::string("materialized"));

  auto completion = std::move(completion_);
  completion_ = nullptr;
  progress_ = nullptr;
  if(completion) completion(error);
}

} // namespace docsync
