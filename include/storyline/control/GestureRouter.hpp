// Repository: Storyline
// Component: Gesture Router
// Purpose: Maps recognized gestures to commands. Each gesture consults an
//          optional host delegate first; a delegate that resolves `true`
//          suppresses the default command.
//          Also maps host app lifecycle transitions to play/pause.
// Copyright (c) 2025 Storyline

#ifndef STORYLINE_CONTROL_GESTURE_ROUTER_HPP_
#define STORYLINE_CONTROL_GESTURE_ROUTER_HPP_

#include <functional>
#include <memory>

#include "storyline/control/CommandChannel.hpp"

namespace storyline::control {

// Delegates receive a resolver and call it exactly once, now or later, from
// the control thread. Only the first call counts.
using Resolve = std::function<void(bool handled)>;
using GestureDelegate = std::function<void(Resolve resolve)>;

struct GestureDelegates {
  GestureDelegate on_left_tap;        // default: previous
  GestureDelegate on_right_tap;       // default: next
  GestureDelegate on_pause_hold;      // default: pause
  GestureDelegate on_resume_release;  // default: play
};

struct DragEvent {
  double x = 0.0;
  double y = 0.0;
  double delta_y = 0.0;
};

struct DragCallbacks {
  std::function<void(const DragEvent&)> on_vertical_drag_start;
  std::function<void(const DragEvent&)> on_vertical_drag_update;
};

class GestureRouter {
 public:
  GestureRouter(CommandChannel& channel, GestureDelegates delegates = {},
                DragCallbacks drag = {});
  ~GestureRouter() = default;

  GestureRouter(const GestureRouter&) = delete;
  GestureRouter& operator=(const GestureRouter&) = delete;

  void OnLeftTap();
  void OnRightTap();
  // Long-press began.
  void OnPauseHold();
  // Long-press released, ended or cancelled.
  void OnResumeRelease();

  // Drags are never interpreted, only forwarded.
  void OnVerticalDragStart(const DragEvent& event);
  void OnVerticalDragUpdate(const DragEvent& event);

 private:
  void Route(const GestureDelegate& delegate, CommandType fallback);

  CommandChannel& channel_;
  GestureDelegates delegates_;
  DragCallbacks drag_;

  // Resolutions arriving after destruction are ignored.
  std::shared_ptr<int> life_token_ = std::make_shared<int>(0);
};

enum class HostLifecycleState {
  kResumed,
  kInactive,
  kPaused,
  kHidden,
  kDetached,
};

const char* HostLifecycleStateName(HostLifecycleState state);

// resumed -> play; inactive/paused/hidden -> pause; detached -> nothing.
// Returns whether the channel accepted a command.
bool ApplyHostLifecycle(CommandChannel& channel, HostLifecycleState state);

}  // namespace storyline::control

#endif  // STORYLINE_CONTROL_GESTURE_ROUTER_HPP_
