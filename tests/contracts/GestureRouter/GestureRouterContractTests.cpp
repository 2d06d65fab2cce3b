// Repository: Storyline
// Component: Gesture Router Contract Tests
// Purpose: Default commands, delegate veto, single-shot resolution and
//          lifecycle mapping.
// Copyright (c) 2025 Storyline

#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "storyline/control/CommandChannel.hpp"
#include "storyline/control/GestureRouter.hpp"

namespace {

using storyline::control::ApplyHostLifecycle;
using storyline::control::Command;
using storyline::control::CommandChannel;
using storyline::control::CommandType;
using storyline::control::DragCallbacks;
using storyline::control::DragEvent;
using storyline::control::GestureDelegates;
using storyline::control::GestureRouter;
using storyline::control::HostLifecycleState;
using storyline::control::Resolve;
using storyline::model::PlaybackStatus;

class GestureRouterContract : public ::testing::Test {
 protected:
  void SetUp() override {
    sub_ = channel_.Subscribe([this](const Command& c) { seen_.push_back(c.type); });
  }

  CommandChannel channel_;
  storyline::util::Subscription sub_;
  std::vector<CommandType> seen_;
};

TEST_F(GestureRouterContract, DefaultsWithoutDelegates) {
  GestureRouter router(channel_);
  router.OnLeftTap();
  router.OnRightTap();
  router.OnPauseHold();
  router.OnResumeRelease();

  ASSERT_EQ(seen_.size(), 4u);
  EXPECT_EQ(seen_[0], CommandType::kPrevious);
  EXPECT_EQ(seen_[1], CommandType::kNext);
  EXPECT_EQ(seen_[2], CommandType::kPause);
  EXPECT_EQ(seen_[3], CommandType::kPlay);
}

TEST_F(GestureRouterContract, DelegateResolvingTrueSuppressesDefault) {
  GestureDelegates delegates;
  int consulted = 0;
  delegates.on_right_tap = [&](Resolve resolve) {
    ++consulted;
    resolve(true);
  };
  GestureRouter router(channel_, delegates);

  router.OnRightTap();
  EXPECT_EQ(consulted, 1);
  EXPECT_TRUE(seen_.empty());
}

TEST_F(GestureRouterContract, DelegateResolvingFalseFallsBack) {
  GestureDelegates delegates;
  delegates.on_left_tap = [](Resolve resolve) { resolve(false); };
  GestureRouter router(channel_, delegates);

  router.OnLeftTap();
  ASSERT_EQ(seen_.size(), 1u);
  EXPECT_EQ(seen_[0], CommandType::kPrevious);
}

TEST_F(GestureRouterContract, LateResolutionStillApplies) {
  GestureDelegates delegates;
  Resolve pending;
  delegates.on_pause_hold = [&](Resolve resolve) { pending = resolve; };
  GestureRouter router(channel_, delegates);

  router.OnPauseHold();
  EXPECT_TRUE(seen_.empty());
  ASSERT_TRUE(pending);

  pending(false);
  ASSERT_EQ(seen_.size(), 1u);
  EXPECT_EQ(seen_[0], CommandType::kPause);
  EXPECT_EQ(channel_.CurrentStatus(), PlaybackStatus::kPaused);
}

TEST_F(GestureRouterContract, OnlyTheFirstResolutionCounts) {
  GestureDelegates delegates;
  delegates.on_right_tap = [](Resolve resolve) {
    resolve(false);
    resolve(false);
    resolve(true);
  };
  GestureRouter router(channel_, delegates);

  router.OnRightTap();
  EXPECT_EQ(seen_.size(), 1u);
}

TEST_F(GestureRouterContract, EachGestureGetsItsOwnResolver) {
  GestureDelegates delegates;
  std::vector<Resolve> pending;
  delegates.on_right_tap = [&](Resolve resolve) { pending.push_back(resolve); };
  GestureRouter router(channel_, delegates);

  router.OnRightTap();
  router.OnRightTap();
  ASSERT_EQ(pending.size(), 2u);
  pending[1](false);
  pending[0](false);
  EXPECT_EQ(seen_.size(), 2u);
}

TEST_F(GestureRouterContract, ResolutionAfterRouterDestroyedIsIgnored) {
  GestureDelegates delegates;
  Resolve pending;
  delegates.on_left_tap = [&](Resolve resolve) { pending = resolve; };
  {
    GestureRouter router(channel_, delegates);
    router.OnLeftTap();
  }
  pending(false);
  EXPECT_TRUE(seen_.empty());
}

TEST_F(GestureRouterContract, HoldThenReleaseRestoresPlaying) {
  GestureRouter router(channel_);
  router.OnPauseHold();
  router.OnResumeRelease();
  EXPECT_EQ(channel_.CurrentStatus(), PlaybackStatus::kPlaying);
  EXPECT_EQ(seen_.size(), 2u);
}

TEST_F(GestureRouterContract, DragsAreForwardedNotInterpreted) {
  std::vector<double> starts;
  std::vector<double> updates;
  DragCallbacks drag;
  drag.on_vertical_drag_start = [&](const DragEvent& e) { starts.push_back(e.y); };
  drag.on_vertical_drag_update = [&](const DragEvent& e) { updates.push_back(e.delta_y); };
  GestureRouter router(channel_, {}, drag);

  router.OnVerticalDragStart({10.0, 20.0, 0.0});
  router.OnVerticalDragUpdate({10.0, 35.0, 15.0});
  router.OnVerticalDragUpdate({10.0, 50.0, 15.0});

  ASSERT_EQ(starts.size(), 1u);
  EXPECT_DOUBLE_EQ(starts[0], 20.0);
  EXPECT_EQ(updates.size(), 2u);
  EXPECT_TRUE(seen_.empty());
}

TEST_F(GestureRouterContract, DragWithoutCallbacksIsANoOp) {
  GestureRouter router(channel_);
  router.OnVerticalDragStart({});
  router.OnVerticalDragUpdate({});
  EXPECT_TRUE(seen_.empty());
}

TEST_F(GestureRouterContract, HostLifecycleMapsToPlayPause) {
  EXPECT_TRUE(ApplyHostLifecycle(channel_, HostLifecycleState::kHidden));
  EXPECT_EQ(channel_.CurrentStatus(), PlaybackStatus::kPaused);
  EXPECT_FALSE(ApplyHostLifecycle(channel_, HostLifecycleState::kInactive));
  EXPECT_FALSE(ApplyHostLifecycle(channel_, HostLifecycleState::kPaused));

  EXPECT_TRUE(ApplyHostLifecycle(channel_, HostLifecycleState::kResumed));
  EXPECT_EQ(channel_.CurrentStatus(), PlaybackStatus::kPlaying);

  EXPECT_FALSE(ApplyHostLifecycle(channel_, HostLifecycleState::kDetached));
  EXPECT_EQ(seen_.size(), 2u);
}

}  // namespace
