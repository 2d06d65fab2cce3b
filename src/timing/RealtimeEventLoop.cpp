// Repository: Storyline
// Component: Realtime Event Loop
// Copyright (c) 2025 Storyline

#include "storyline/timing/RealtimeEventLoop.hpp"

namespace storyline::timing {

RealtimeEventLoop::RealtimeEventLoop() : epoch_(Clock::now()) {}

int64_t RealtimeEventLoop::NowMs() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - epoch_)
      .count();
}

void RealtimeEventLoop::Post(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    posted_.push_back(std::move(task));
  }
  cv_.notify_one();
}

TimerId RealtimeEventLoop::ScheduleAfter(int64_t delay_ms, std::function<void()> task) {
  if (delay_ms < 0) delay_ms = 0;
  TimerId id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = next_timer_id_++;
    const int64_t deadline = NowMs() + delay_ms;
    timers_.emplace(std::make_pair(deadline, id), std::move(task));
    timer_deadlines_.emplace(id, deadline);
  }
  cv_.notify_one();
  return id;
}

void RealtimeEventLoop::Cancel(TimerId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = timer_deadlines_.find(id);
  if (it == timer_deadlines_.end()) return;
  timers_.erase(std::make_pair(it->second, id));
  timer_deadlines_.erase(it);
}

bool RealtimeEventLoop::NextTask(std::function<void()>& task) {
  std::unique_lock<std::mutex> lock(mutex_);
  for (;;) {
    if (stop_requested_.load(std::memory_order_acquire)) return false;

    const bool timer_due = !timers_.empty() && timers_.begin()->first.first <= NowMs();

    if (!posted_.empty() && !(timer_due && posted_streak_ >= kMaxPostedBeforeDueTimer)) {
      task = std::move(posted_.front());
      posted_.pop_front();
      ++posted_streak_;
      return true;
    }
    posted_streak_ = 0;

    if (timers_.empty()) {
      cv_.wait(lock);
      continue;
    }

    auto first = timers_.begin();
    const int64_t deadline = first->first.first;
    const int64_t now = NowMs();
    if (deadline <= now) {
      task = std::move(first->second);
      timer_deadlines_.erase(first->first.second);
      timers_.erase(first);
      return true;
    }
    cv_.wait_for(lock, std::chrono::milliseconds(deadline - now));
  }
}

void RealtimeEventLoop::Run() {
  running_.store(true, std::memory_order_release);
  std::function<void()> task;
  while (NextTask(task)) {
    task();
    task = nullptr;
  }
  running_.store(false, std::memory_order_release);
}

void RealtimeEventLoop::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_.store(true, std::memory_order_release);
  }
  cv_.notify_all();
}

}  // namespace storyline::timing
