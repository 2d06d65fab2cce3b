// Repository: Storyline
// Component: Progress Clock
// Purpose: Cancellable countdown for one item's display window. Reports
//          normalized progress while running and expires at most once per
//          Start/Reset cycle.
// Copyright (c) 2025 Storyline

#ifndef STORYLINE_TIMING_PROGRESS_CLOCK_HPP_
#define STORYLINE_TIMING_PROGRESS_CLOCK_HPP_

#include <cstdint>
#include <functional>
#include <memory>

#include "storyline/timing/IEventLoop.hpp"

namespace storyline::timing {

// ProgressClock runs entirely on the control thread of its IEventLoop.
//
// Expiry delivery:
// - Start(0), or Resume() with nothing left, posts the expiry to the loop;
//   it is never delivered synchronously from inside Start/Resume.
// - Pause() cancels any pending expiry; Resume() re-arms with the remaining
//   time (deadline = now + remaining).
// - Reset() and a new Start() cancel everything pending, including a posted
//   expiry that has not run yet.
//
// Callbacks may destroy the clock. The destructor cancels all timers.
class ProgressClock {
 public:
  static constexpr int64_t kDefaultTickIntervalMs = 16;

  enum class Phase { kIdle, kRunning, kPaused, kExpired };

  explicit ProgressClock(IEventLoop& loop, int64_t tick_interval_ms = kDefaultTickIntervalMs);
  ~ProgressClock();

  ProgressClock(const ProgressClock&) = delete;
  ProgressClock& operator=(const ProgressClock&) = delete;

  void Start(int64_t duration_ms);
  void Pause();
  void Resume();
  void Reset();

  void OnExpire(std::function<void()> callback) { on_expire_ = std::move(callback); }
  void OnTick(std::function<void(double)> callback) { on_tick_ = std::move(callback); }

  // [0, 1], non-decreasing within one Start/Reset cycle.
  double Progress() const;
  int64_t RemainingMs() const;
  int64_t DurationMs() const { return duration_ms_; }
  Phase phase() const { return phase_; }

 private:
  int64_t ElapsedMs() const;
  void Arm(int64_t remaining_ms);
  void Disarm();
  void ScheduleTick();
  void FireExpiry();

  IEventLoop& loop_;
  const int64_t tick_interval_ms_;

  Phase phase_ = Phase::kIdle;
  int64_t duration_ms_ = 0;
  int64_t elapsed_before_ms_ = 0;  // accumulated before the current run
  int64_t running_since_ms_ = 0;
  mutable double last_progress_ = 0.0;
  bool expired_fired_ = false;

  TimerId expiry_timer_ = kInvalidTimerId;
  TimerId tick_timer_ = kInvalidTimerId;
  uint64_t arm_seq_ = 0;  // invalidates posted expiries on Disarm()

  std::function<void()> on_expire_;
  std::function<void(double)> on_tick_;

  // Posted tasks cannot be cancelled; they hold a weak reference to this.
  std::shared_ptr<int> life_token_ = std::make_shared<int>(0);
};

const char* ClockPhaseName(ProgressClock::Phase phase);

}  // namespace storyline::timing

#endif  // STORYLINE_TIMING_PROGRESS_CLOCK_HPP_
