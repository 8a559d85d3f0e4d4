#pragma once

#include <asio.hpp>

#include <chrono>

namespace docsync {

// Clock behind every timer in the library. Follows steady_clock unless manual
// time is enabled, in which case now() only moves through advance().
class SyncClock {
public:
  using duration = std::chrono::steady_clock::duration;
  using rep = duration::rep;
  using period = duration::period;
  using time_point = std::chrono::time_point<SyncClock, duration>;
  static constexpr bool is_steady = true;

  static time_point now() noexcept;

  // Freezes the clock at its current reading. Disabling resumes real time.
  static void set_manual(bool enabled) noexcept;
  static bool manual() noexcept;
  static void advance(duration d) noexcept;
};

struct SyncClockWaitTraits {
  // In manual mode the reactor is asked to re-check timers immediately, so
  // a poll() after advance() fires everything that became due.
  static SyncClock::duration to_wait_duration(const SyncClock::duration& d) {
    if(SyncClock::manual()) return SyncClock::duration::zero();
    return d;
  }

  static SyncClock::duration to_wait_duration(const SyncClock::time_point& t) {
    return to_wait_duration(t - SyncClock::now());
  }
};

using SyncTimer = asio::basic_waitable_timer<SyncClock, SyncClockWaitTraits>;
using Strand = asio::strand<asio::io_context::executor_type>;

} // namespace docsync
