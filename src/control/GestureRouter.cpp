// Repository: Storyline
// Component: Gesture Router
// Copyright (c) 2025 Storyline

#include "storyline/control/GestureRouter.hpp"

#include <string>

#include "storyline/util/Logger.hpp"

namespace storyline::control {

using util::Logger;

GestureRouter::GestureRouter(CommandChannel& channel, GestureDelegates delegates,
                             DragCallbacks drag)
    : channel_(channel), delegates_(std::move(delegates)), drag_(std::move(drag)) {}

void GestureRouter::OnLeftTap() { Route(delegates_.on_left_tap, CommandType::kPrevious); }

void GestureRouter::OnRightTap() { Route(delegates_.on_right_tap, CommandType::kNext); }

void GestureRouter::OnPauseHold() { Route(delegates_.on_pause_hold, CommandType::kPause); }

void GestureRouter::OnResumeRelease() {
  Route(delegates_.on_resume_release, CommandType::kPlay);
}

void GestureRouter::OnVerticalDragStart(const DragEvent& event) {
  if (drag_.on_vertical_drag_start) drag_.on_vertical_drag_start(event);
}

void GestureRouter::OnVerticalDragUpdate(const DragEvent& event) {
  if (drag_.on_vertical_drag_update) drag_.on_vertical_drag_update(event);
}

void GestureRouter::Route(const GestureDelegate& delegate, CommandType fallback) {
  if (!delegate) {
    channel_.Emit({fallback});
    return;
  }

  auto resolved = std::make_shared<bool>(false);
  std::weak_ptr<int> life = life_token_;
  CommandChannel* channel = &channel_;

  delegate([resolved, life, channel, fallback](bool handled) {
    if (*resolved) {
      Logger::Debug(std::string("[GestureRouter] duplicate resolution ignored for ") +
                    CommandTypeName(fallback));
      return;
    }
    *resolved = true;
    if (life.expired()) return;
    if (!handled) channel->Emit({fallback});
  });
}

const char* HostLifecycleStateName(HostLifecycleState state) {
  switch (state) {
    case HostLifecycleState::kResumed:
      return "resumed";
    case HostLifecycleState::kInactive:
      return "inactive";
    case HostLifecycleState::kPaused:
      return "paused";
    case HostLifecycleState::kHidden:
      return "hidden";
    case HostLifecycleState::kDetached:
      return "detached";
  }
  return "unknown";
}

bool ApplyHostLifecycle(CommandChannel& channel, HostLifecycleState state) {
  switch (state) {
    case HostLifecycleState::kResumed:
      return channel.Play();
    case HostLifecycleState::kInactive:
    case HostLifecycleState::kPaused:
    case HostLifecycleState::kHidden:
      return channel.Pause();
    case HostLifecycleState::kDetached:
      return false;
  }
  return false;
}

}  // namespace storyline::control
