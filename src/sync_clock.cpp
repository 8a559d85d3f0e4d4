#include "sync_clock.hpp"

#include <atomic>

namespace docsync {

namespace {
std::atomic<bool> g_manual{false};
std::atomic<SyncClock::rep> g_manual_ticks{0};

SyncClock::rep real_ticks() noexcept {
  return std::chrono::steady_clock::now().time_since_epoch().count();
}
} // namespace

SyncClock::time_point SyncClock::now() noexcept {
  if(g_manual.load(std::memory_order_acquire)) {
    return time_point(duration(g_manual_ticks.load(std::memory_order_acquire)));
  }
  return time_point(duration(real_ticks()));
}

void SyncClock::set_manual(bool enabled) noexcept {
  if(enabled) {
    g_manual_ticks.store(real_ticks(), std::memory_order_release);
  }
  g_manual.store(enabled, std::memory_order_release);
}

bool SyncClock::manual() noexcept {
  return g_manual.load(std::memory_order_acquire);
}

void SyncClock::advance(duration d) noexcept {
  g_manual_ticks.fetch_add(d.count(), std::memory_order_acq_rel);
}

} // namespace docsync
