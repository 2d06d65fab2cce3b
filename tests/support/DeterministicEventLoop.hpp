// Repository: Storyline
// Component: Deterministic Event Loop (test only)
// Purpose: Virtual-time IEventLoop. Time moves only through AdvanceMs(); due
//          timers fire in deadline order with posted tasks drained between
//          them. No sleep, no wall-clock drift.
// Copyright (c) 2025 Storyline

#ifndef STORYLINE_TESTS_SUPPORT_DETERMINISTIC_EVENT_LOOP_HPP_
#define STORYLINE_TESTS_SUPPORT_DETERMINISTIC_EVENT_LOOP_HPP_

#include <algorithm>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>

#include "storyline/timing/IEventLoop.hpp"

namespace storyline::tests::support {

class DeterministicEventLoop : public timing::IEventLoop {
 public:
  explicit DeterministicEventLoop(int64_t start_ms = 0) : now_ms_(start_ms) {}

  int64_t NowMs() const override { return now_ms_; }

  // Thread-safe, like the real loop.
  void Post(std::function<void()> task) override {
    std::lock_guard<std::mutex> lock(mutex_);
    posted_.push_back(std::move(task));
  }

  timing::TimerId ScheduleAfter(int64_t delay_ms, std::function<void()> task) override {
    const timing::TimerId id = next_timer_id_++;
    const int64_t deadline = now_ms_ + std::max<int64_t>(0, delay_ms);
    timers_.emplace(std::make_pair(deadline, id), std::move(task));
    timer_deadlines_.emplace(id, deadline);
    return id;
  }

  void Cancel(timing::TimerId id) override {
    auto it = timer_deadlines_.find(id);
    if (it == timer_deadlines_.end()) return;
    timers_.erase(std::make_pair(it->second, id));
    timer_deadlines_.erase(it);
  }

  // Runs posted tasks, including ones they post, until none are left.
  // Returns the number of tasks run.
  std::size_t RunPending() {
    std::size_t ran = 0;
    for (;;) {
      std::function<void()> task;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (posted_.empty()) break;
        task = std::move(posted_.front());
        posted_.pop_front();
      }
      task();
      ++ran;
    }
    return ran;
  }

  // Moves virtual time forward by `delta_ms`, firing every timer that falls
  // due on the way at its exact deadline.
  void AdvanceMs(int64_t delta_ms) {
    const int64_t target = now_ms_ + delta_ms;
    RunPending();
    while (!timers_.empty()) {
      auto first = timers_.begin();
      const int64_t deadline = first->first.first;
      if (deadline > target) break;

      now_ms_ = std::max(now_ms_, deadline);
      std::function<void()> task = std::move(first->second);
      timer_deadlines_.erase(first->first.second);
      timers_.erase(first);
      task();
      RunPending();
    }
    now_ms_ = target;
  }

  std::size_t PendingTimers() const { return timers_.size(); }

  std::size_t PendingPosts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return posted_.size();
  }

 private:
  int64_t now_ms_;

  mutable std::mutex mutex_;
  std::deque<std::function<void()>> posted_;

  std::map<std::pair<int64_t, timing::TimerId>, std::function<void()>> timers_;
  std::unordered_map<timing::TimerId, int64_t> timer_deadlines_;
  timing::TimerId next_timer_id_ = 1;
};

}  // namespace storyline::tests::support

#endif  // STORYLINE_TESTS_SUPPORT_DETERMINISTIC_EVENT_LOOP_HPP_
