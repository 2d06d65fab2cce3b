// Repository: Storyline
// Component: Loop Inbox
// Purpose: Posting handle for threads that may outlive the event loop they
//          feed (e.g. a detached stdin reader). Shared by owner and feeder;
//          the owner closes it before tearing the loop down.
// Copyright (c) 2025 Storyline

#ifndef STORYLINE_TIMING_LOOP_INBOX_HPP_
#define STORYLINE_TIMING_LOOP_INBOX_HPP_

#include <functional>
#include <mutex>

#include "storyline/timing/IEventLoop.hpp"

namespace storyline::timing {

class LoopInbox {
 public:
  explicit LoopInbox(IEventLoop& loop);

  LoopInbox(const LoopInbox&) = delete;
  LoopInbox& operator=(const LoopInbox&) = delete;

  // Safe from any thread. Returns false, dropping the task, once closed.
  bool Post(std::function<void()> task);

  // Returns after any in-flight Post() has reached the loop.
  void Close();

  bool IsClosed() const;

 private:
  mutable std::mutex mutex_;
  IEventLoop* loop_;
};

}  // namespace storyline::timing

#endif  // STORYLINE_TIMING_LOOP_INBOX_HPP_
