// Repository: Storyline
// Component: Loop Inbox
// Copyright (c) 2025 Storyline

#include "storyline/timing/LoopInbox.hpp"

#include <utility>

namespace storyline::timing {

LoopInbox::LoopInbox(IEventLoop& loop) : loop_(&loop) {}

bool LoopInbox::Post(std::function<void()> task) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (loop_ == nullptr) return false;
  loop_->Post(std::move(task));
  return true;
}

void LoopInbox::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  loop_ = nullptr;
}

bool LoopInbox::IsClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return loop_ == nullptr;
}

}  // namespace storyline::timing
