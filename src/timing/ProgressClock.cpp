// Repository: Storyline
// Component: Progress Clock
// Copyright (c) 2025 Storyline

#include "storyline/timing/ProgressClock.hpp"

#include <algorithm>

namespace storyline::timing {

const char* ClockPhaseName(ProgressClock::Phase phase) {
  switch (phase) {
    case ProgressClock::Phase::kIdle:
      return "idle";
    case ProgressClock::Phase::kRunning:
      return "running";
    case ProgressClock::Phase::kPaused:
      return "paused";
    case ProgressClock::Phase::kExpired:
      return "expired";
  }
  return "unknown";
}

ProgressClock::ProgressClock(IEventLoop& loop, int64_t tick_interval_ms)
    : loop_(loop),
      tick_interval_ms_(tick_interval_ms > 0 ? tick_interval_ms : kDefaultTickIntervalMs) {}

ProgressClock::~ProgressClock() { Disarm(); }

void ProgressClock::Start(int64_t duration_ms) {
  Disarm();
  duration_ms_ = std::max<int64_t>(0, duration_ms);
  elapsed_before_ms_ = 0;
  last_progress_ = 0.0;
  expired_fired_ = false;
  phase_ = Phase::kRunning;
  running_since_ms_ = loop_.NowMs();
  Arm(duration_ms_);
}

void ProgressClock::Pause() {
  if (phase_ != Phase::kRunning) return;
  elapsed_before_ms_ = ElapsedMs();
  phase_ = Phase::kPaused;
  Disarm();
}

void ProgressClock::Resume() {
  if (phase_ != Phase::kPaused) return;
  phase_ = Phase::kRunning;
  running_since_ms_ = loop_.NowMs();
  Arm(duration_ms_ - elapsed_before_ms_);
}

void ProgressClock::Reset() {
  Disarm();
  phase_ = Phase::kIdle;
  duration_ms_ = 0;
  elapsed_before_ms_ = 0;
  running_since_ms_ = 0;
  last_progress_ = 0.0;
  expired_fired_ = false;
}

double ProgressClock::Progress() const {
  double p = 0.0;
  switch (phase_) {
    case Phase::kIdle:
      return 0.0;
    case Phase::kExpired:
      p = 1.0;
      break;
    case Phase::kRunning:
    case Phase::kPaused:
      if (duration_ms_ > 0) {
        p = std::min(1.0, static_cast<double>(ElapsedMs()) /
                              static_cast<double>(duration_ms_));
      }
      break;
  }
  last_progress_ = std::max(last_progress_, p);
  return last_progress_;
}

int64_t ProgressClock::RemainingMs() const {
  if (phase_ == Phase::kIdle || phase_ == Phase::kExpired) return 0;
  return std::max<int64_t>(0, duration_ms_ - ElapsedMs());
}

int64_t ProgressClock::ElapsedMs() const {
  int64_t elapsed = elapsed_before_ms_;
  if (phase_ == Phase::kRunning) {
    elapsed += loop_.NowMs() - running_since_ms_;
  }
  return std::clamp<int64_t>(elapsed, 0, duration_ms_);
}

void ProgressClock::Arm(int64_t remaining_ms) {
  const uint64_t seq = ++arm_seq_;

  if (remaining_ms <= 0) {
    std::weak_ptr<int> life = life_token_;
    loop_.Post([this, life, seq]() {
      if (life.expired() || seq != arm_seq_) return;
      FireExpiry();
    });
    return;
  }

  expiry_timer_ = loop_.ScheduleAfter(remaining_ms, [this]() {
    expiry_timer_ = kInvalidTimerId;
    FireExpiry();
  });
  ScheduleTick();
}

void ProgressClock::Disarm() {
  ++arm_seq_;
  if (expiry_timer_ != kInvalidTimerId) {
    loop_.Cancel(expiry_timer_);
    expiry_timer_ = kInvalidTimerId;
  }
  if (tick_timer_ != kInvalidTimerId) {
    loop_.Cancel(tick_timer_);
    tick_timer_ = kInvalidTimerId;
  }
}

void ProgressClock::ScheduleTick() {
  tick_timer_ = loop_.ScheduleAfter(tick_interval_ms_, [this]() {
    tick_timer_ = kInvalidTimerId;
    ScheduleTick();
    // Last statement: the callback may destroy this clock.
    if (on_tick_) {
      auto tick = on_tick_;
      tick(Progress());
    }
  });
}

void ProgressClock::FireExpiry() {
  if (expired_fired_ || phase_ != Phase::kRunning) return;
  expired_fired_ = true;
  Disarm();
  elapsed_before_ms_ = duration_ms_;
  phase_ = Phase::kExpired;
  last_progress_ = 1.0;

  std::weak_ptr<int> life = life_token_;
  auto tick = on_tick_;
  auto expire = on_expire_;
  if (tick) tick(1.0);
  if (life.expired()) return;
  if (expire) expire();
}

}  // namespace storyline::timing
