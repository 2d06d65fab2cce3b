// Repository: Storyline
// Component: Event Loop Interface
// Purpose: The single control thread on which commands, clock ticks and
//          adapter callbacks are serialized.
//          Production: RealtimeEventLoop (steady_clock, condition variable).
//          Tests: DeterministicEventLoop (virtual time, no sleep).
// Copyright (c) 2025 Storyline

#ifndef STORYLINE_TIMING_IEVENT_LOOP_HPP_
#define STORYLINE_TIMING_IEVENT_LOOP_HPP_

#include <cstdint>
#include <functional>

namespace storyline::timing {

using TimerId = uint64_t;
constexpr TimerId kInvalidTimerId = 0;

class IEventLoop {
 public:
  virtual ~IEventLoop() = default;

  // Monotonic milliseconds. Only differences are meaningful.
  virtual int64_t NowMs() const = 0;

  // Enqueues a task to run on the control thread. Safe from any thread.
  // Tasks posted from one thread run in posting order.
  virtual void Post(std::function<void()> task) = 0;

  // Runs `task` on the control thread once `delay_ms` has elapsed.
  // Control thread only.
  virtual TimerId ScheduleAfter(int64_t delay_ms, std::function<void()> task) = 0;

  // Cancels a pending timer. Unknown or already-fired ids are ignored.
  // Control thread only.
  virtual void Cancel(TimerId id) = 0;
};

}  // namespace storyline::timing

#endif  // STORYLINE_TIMING_IEVENT_LOOP_HPP_
