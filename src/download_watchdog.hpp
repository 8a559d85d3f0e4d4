#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "live_query.hpp"
#include "log.hpp"
#include "store_backend.hpp"
#include "sync_clock.hpp"
#include "sync_error.hpp"

namespace docsync {

// Idle timeouts and inter-attempt delays. Both lists reuse their last entry
// when more attempts run than there are entries.
struct WatchdogSchedule {
  std::vector<std::chrono::milliseconds> idle;
  std::vector<std::chrono::milliseconds> backoff;
  std::size_t attempts = 0; // 0 = one attempt per idle entry

  std::size_t attempt_count() const;
  std::chrono::milliseconds idle_for(std::size_t attempt) const;
  std::chrono::milliseconds backoff_for(std::size_t attempt) const;
  std::string describe() const;
};

enum class WatchdogState {
  Idle,
  CheckingCurrentState,
  AttemptRunning,
  Backoff,
  Completed,
  Failed
};

enum class WatchdogEvent {
  Start,
  AlreadyMaterialized,
  BeginAttempt,
  ProgressObserved,
  Materialized,
  ErrorObserved,
  NotFound,
  TimerFired,
  BackoffElapsed,
  CancelRequested
};

const char* to_string(WatchdogState state);
const char* to_string(WatchdogEvent event);

inline bool is_terminal(WatchdogState state) {
  return state == WatchdogState::Completed || state == WatchdogState::Failed;
}

// Transition table. Events that do not apply to a state leave it unchanged;
// terminal states absorb everything.
WatchdogState next_watchdog_state(WatchdogState state, WatchdogEvent event, bool last_attempt);

// Waits for one item to become fully materialized locally. Each attempt
// requests the download, watches the item through a LiveQuery and fails the
// attempt when no progress is seen for the attempt's idle window. All work
// runs on the strand passed to create().
class DownloadWatchdog : public std::enable_shared_from_this<DownloadWatchdog> {
public:
  using Completion = std::function<void(const SyncError&)>;
  using ProgressHandler = std::function<void(double fraction)>;

  static std::shared_ptr<DownloadWatchdog> create(Strand strand,
                                                  std::shared_ptr<StoreBackend> backend,
                                                  Container container,
                                                  std::string relative_path,
                                                  WatchdogSchedule schedule,
                                                  std::shared_ptr<ObserverRegistry> registry,
                                                  std::shared_ptr<Logger> logger = nullptr);
  ~DownloadWatchdog();

  DownloadWatchdog(const DownloadWatchdog&) = delete;
  DownloadWatchdog& operator=(const DownloadWatchdog&) = delete;

  void set_progress_handler(ProgressHandler handler);

  // The completion runs once, after the query and timer are released.
  void start(Completion completion);
  // Safe from any thread; a no-op once a terminal state is reached.
  void cancel();

  WatchdogState state() const { return state_.load(std::memory_order_acquire); }
  std::size_t attempt() const { return attempt_.load(std::memory_order_acquire); }
  std::size_t cleanup_count() const { return cleanups_.load(std::memory_order_acquire); }
  const std::string& relative_path() const { return relative_path_; }

private:
  DownloadWatchdog(Strand strand,
                   std::shared_ptr<StoreBackend> backend,
                   Container container,
                   std::string relative_path,
                   WatchdogSchedule schedule,
                   std::shared_ptr<ObserverRegistry> registry,
                   std::shared_ptr<Logger> logger);

  WatchdogState apply(WatchdogEvent event);
  bool last_attempt() const;

  void run_start();
  void begin_attempt(std::size_t index);
  void on_query_event(LiveQuery& query);
  void observe_progress(double percent);
  void arm_timer(std::chrono::milliseconds delay, WatchdogEvent on_fire);
  void on_timer(WatchdogEvent event);
  void release_attempt();
  void finish(SyncError error);

  Strand strand_;
  std::shared_ptr<StoreBackend> backend_;
  Container container_;
  std::string relative_path_;
  WatchdogSchedule schedule_;
  std::shared_ptr<ObserverRegistry> registry_;
  std::shared_ptr<Logger> logger_;

  SyncTimer timer_;
  uint64_t timer_generation_ = 0;
  std::shared_ptr<LiveQuery> query_;
  double last_progress_ = 0.0;

  Completion completion_;
  ProgressHandler progress_;
  bool finished_ = false;
  // Held from start() until the completion has run.
  std::shared_ptr<DownloadWatchdog> self_;
  std::atomic<WatchdogState> state_{WatchdogState::Idle};
  std::atomic<std::size_t> attempt_{0};
  std::atomic<std::size_t> cleanups_{0};
};

} // namespace docsync
