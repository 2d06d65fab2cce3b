// Repository: Storyline
// Component: Realtime Event Loop
// Purpose: Production IEventLoop. Run() blocks the calling thread, which
//          becomes the control thread, until Stop().
// Copyright (c) 2025 Storyline

#ifndef STORYLINE_TIMING_REALTIME_EVENT_LOOP_HPP_
#define STORYLINE_TIMING_REALTIME_EVENT_LOOP_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>

#include "storyline/timing/IEventLoop.hpp"

namespace storyline::timing {

class RealtimeEventLoop : public IEventLoop {
 public:
  RealtimeEventLoop();
  ~RealtimeEventLoop() override = default;

  RealtimeEventLoop(const RealtimeEventLoop&) = delete;
  RealtimeEventLoop& operator=(const RealtimeEventLoop&) = delete;

  int64_t NowMs() const override;
  void Post(std::function<void()> task) override;
  TimerId ScheduleAfter(int64_t delay_ms, std::function<void()> task) override;
  void Cancel(TimerId id) override;

  // Consecutive posted tasks allowed to run while a timer is overdue.
  static constexpr std::size_t kMaxPostedBeforeDueTimer = 64;

  // Dispatches posted tasks and due timers until Stop() is called.
  // Posted tasks run before timers that fall due at the same moment, but a
  // due timer is never held back by more than kMaxPostedBeforeDueTimer posts.
  void Run();

  // Safe from any thread, including from inside a task.
  void Stop();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

 private:
  using Clock = std::chrono::steady_clock;

  // Pops the next runnable task, waiting as needed. Returns false on stop.
  bool NextTask(std::function<void()>& task);

  const Clock::time_point epoch_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> posted_;

  // Ordered by (deadline, id) so equal deadlines fire in scheduling order.
  std::map<std::pair<int64_t, TimerId>, std::function<void()>> timers_;
  std::unordered_map<TimerId, int64_t> timer_deadlines_;
  TimerId next_timer_id_ = 1;
  std::size_t posted_streak_ = 0;

  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> running_{false};
};

}  // namespace storyline::timing

#endif  // STORYLINE_TIMING_REALTIME_EVENT_LOOP_HPP_
