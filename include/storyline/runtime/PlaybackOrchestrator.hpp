// Repository: Storyline
// Component: Playback Orchestrator
// Purpose: Root state machine of a playback session. Owns the single live
//          slot (adapter + clock) and reconciles commands, adapter events
//          and clock events on the control thread.
// Copyright (c) 2025 Storyline

#ifndef STORYLINE_RUNTIME_PLAYBACK_ORCHESTRATOR_HPP_
#define STORYLINE_RUNTIME_PLAYBACK_ORCHESTRATOR_HPP_

#include <cstdint>
#include <deque>
#include <memory>
#include <vector>

#include "storyline/control/CommandChannel.hpp"
#include "storyline/media/IMediaAdapter.hpp"
#include "storyline/media/MediaAdapterFactory.hpp"
#include "storyline/model/StoryItem.hpp"
#include "storyline/runtime/SessionTypes.hpp"
#include "storyline/timing/IEventLoop.hpp"
#include "storyline/timing/ProgressClock.hpp"
#include "storyline/util/Subscription.hpp"

namespace storyline::runtime {

// PlaybackOrchestrator lives on the control thread of `loop`.
//
// Live slot invariants:
// - Exactly one adapter is activated and not yet released from Start()
//   until destruction; at most one clock exists.
// - A transition stops the clock, drops the adapter subscriptions, releases
//   the adapter and only then creates the next one.
// - Every adapter and clock callback carries the generation of the slot it
//   was registered for and is ignored once that slot has been replaced.
//
// Completed keeps the last adapter live (paused) with no clock; progress
// reads 1.0. next() is ignored there; previous() and jumpTo() leave it.
//
// `channel`, `loop` and `factory` must outlive the orchestrator.
class PlaybackOrchestrator {
 public:
  // Throws util::InvalidIndexError if the sequence is empty or
  // config.initial_index is outside [0, size).
  PlaybackOrchestrator(model::StorySequence sequence, control::CommandChannel& channel,
                       timing::IEventLoop& loop, media::IMediaAdapterFactory& factory,
                       OrchestratorConfig config = {}, OrchestratorCallbacks callbacks = {});
  ~PlaybackOrchestrator();

  PlaybackOrchestrator(const PlaybackOrchestrator&) = delete;
  PlaybackOrchestrator& operator=(const PlaybackOrchestrator&) = delete;

  // Enters Loading(initial_index). Only the first call has an effect.
  void Start();

  int32_t CurrentIndex() const { return current_index_; }
  double Progress() const;
  model::PlaybackStatus Status() const { return status_; }
  bool IsMuted() const { return muted_; }
  OrchestratorState state() const { return state_; }
  SessionSnapshot Snapshot() const;

  // Null before Start().
  media::IMediaAdapter* LiveAdapter() const;

  const model::StorySequence& sequence() const { return sequence_; }

 private:
  // Why a slot is being entered; decides which outbound callback fires.
  enum class EntryReason { kInitial, kNavigate, kReturnedToStart, kRestart };

  struct LiveSlot {
    int32_t index = 0;
    uint64_t generation = 0;
    std::unique_ptr<media::IMediaAdapter> adapter;
    std::unique_ptr<timing::ProgressClock> clock;
    std::vector<util::Subscription> subscriptions;
    bool buffering = false;
    int64_t effective_duration_ms = 0;
  };

  // Runs `step` with commands deferred, then drains the deferred queue.
  template <typename Step>
  void Serialized(Step&& step);
  void DrainDeferred();

  void OnCommand(const control::Command& command);
  void Dispatch(const control::Command& command);

  void TransitionTo(int32_t index, EntryReason reason);
  void Advance();
  void EnterCompleted();
  void TeardownLive();
  void ActivateSlot(int32_t index);
  void StartClock(int64_t duration_ms);
  void ApplyRunState();

  void OnAdapterReady(uint64_t generation);
  void OnAdapterFailed(uint64_t generation, const util::LoadError& error);
  void OnAdapterEnded(uint64_t generation);
  void OnBufferingChanged(uint64_t generation, bool buffering);
  void OnClockExpired(uint64_t generation);
  void OnClockTick(uint64_t generation, double progress);

  bool IsLive(uint64_t generation) const {
    return live_ && live_->generation == generation;
  }
  void SetState(OrchestratorState next);

  const model::StorySequence sequence_;
  control::CommandChannel& channel_;
  timing::IEventLoop& loop_;
  media::IMediaAdapterFactory& factory_;
  const OrchestratorConfig config_;
  OrchestratorCallbacks callbacks_;

  OrchestratorState state_ = OrchestratorState::kIdle;
  int32_t current_index_;
  model::PlaybackStatus status_;
  bool muted_;

  std::unique_ptr<LiveSlot> live_;
  uint64_t generation_ = 0;

  bool busy_ = false;
  std::deque<control::Command> deferred_;

  util::Subscription command_subscription_;
};

}  // namespace storyline::runtime

#endif  // STORYLINE_RUNTIME_PLAYBACK_ORCHESTRATOR_HPP_
