// Repository: Storyline
// Component: Playback Orchestrator
// Copyright (c) 2025 Storyline

#include "storyline/runtime/PlaybackOrchestrator.hpp"

#include <stdexcept>
#include <string>

#include "storyline/model/SequenceValidator.hpp"
#include "storyline/util/Errors.hpp"
#include "storyline/util/Logger.hpp"

namespace storyline::runtime {

using control::Command;
using control::CommandType;
using model::PlaybackStatus;
using util::Logger;

const char* OrchestratorStateName(OrchestratorState state) {
  switch (state) {
    case OrchestratorState::kIdle:
      return "Idle";
    case OrchestratorState::kLoading:
      return "Loading";
    case OrchestratorState::kActive:
      return "Active";
    case OrchestratorState::kFailed:
      return "Failed";
    case OrchestratorState::kTransitioning:
      return "Transitioning";
    case OrchestratorState::kCompleted:
      return "Completed";
  }
  return "Unknown";
}

PlaybackOrchestrator::PlaybackOrchestrator(model::StorySequence sequence,
                                           control::CommandChannel& channel,
                                           timing::IEventLoop& loop,
                                           media::IMediaAdapterFactory& factory,
                                           OrchestratorConfig config,
                                           OrchestratorCallbacks callbacks)
    : sequence_(std::move(sequence)),
      channel_(channel),
      loop_(loop),
      factory_(factory),
      config_(config),
      callbacks_(std::move(callbacks)),
      current_index_(config.initial_index),
      status_(channel.CurrentStatus()),
      muted_(config.start_muted) {
  if (sequence_.empty() || config_.initial_index < 0 ||
      static_cast<std::size_t>(config_.initial_index) >= sequence_.size()) {
    Logger::Error("[PlaybackOrchestrator] initial_index=" +
                  std::to_string(config_.initial_index) +
                  " outside sequence of length " + std::to_string(sequence_.size()));
    throw util::InvalidIndexError(config_.initial_index, sequence_.size());
  }

  // Unusable items are not fatal: their adapters fail and the session
  // moves past them on the configured duration.
  for (std::size_t i = 0; i < sequence_.size(); ++i) {
    model::ValidationResult result = model::ValidateStoryItem(sequence_[i]);
    if (!result.valid) {
      Logger::Warn("[PlaybackOrchestrator] item " + std::to_string(i) + " is invalid: " +
                   model::SequenceErrorName(result.error) + " " + result.detail);
    }
  }

  channel_.BindSequenceLength(sequence_.size());
  command_subscription_ =
      channel_.Subscribe([this](const Command& command) { OnCommand(command); });
}

PlaybackOrchestrator::~PlaybackOrchestrator() {
  command_subscription_.Reset();
  TeardownLive();
}

// =============================================================================
// Serialization of re-entrant commands
// =============================================================================

template <typename Step>
void PlaybackOrchestrator::Serialized(Step&& step) {
  if (busy_) {
    step();
    return;
  }
  busy_ = true;
  try {
    step();
  } catch (...) {
    busy_ = false;
    throw;
  }
  busy_ = false;
  DrainDeferred();
}

void PlaybackOrchestrator::DrainDeferred() {
  while (!busy_ && !deferred_.empty()) {
    const Command command = deferred_.front();
    deferred_.pop_front();
    busy_ = true;
    try {
      Dispatch(command);
    } catch (...) {
      busy_ = false;
      throw;
    }
    busy_ = false;
  }
}

void PlaybackOrchestrator::OnCommand(const Command& command) {
  if (busy_) {
    Logger::Debug(std::string("[PlaybackOrchestrator] deferring ") +
                  control::CommandTypeName(command.type));
    deferred_.push_back(command);
    return;
  }
  Serialized([this, &command]() { Dispatch(command); });
}

// =============================================================================
// Public surface
// =============================================================================

void PlaybackOrchestrator::Start() {
  if (state_ != OrchestratorState::kIdle) {
    Logger::Warn("[PlaybackOrchestrator] Start ignored: already started");
    return;
  }
  Logger::Info("[PlaybackOrchestrator] start items=" + std::to_string(sequence_.size()) +
               " initial_index=" + std::to_string(config_.initial_index) +
               " status=" + model::PlaybackStatusName(status_) +
               " muted=" + (muted_ ? "true" : "false"));
  Serialized([this]() { TransitionTo(config_.initial_index, EntryReason::kInitial); });
}

double PlaybackOrchestrator::Progress() const {
  if (state_ == OrchestratorState::kCompleted) return 1.0;
  if (live_ && live_->clock) return live_->clock->Progress();
  return 0.0;
}

SessionSnapshot PlaybackOrchestrator::Snapshot() const {
  SessionSnapshot snap;
  snap.state = state_;
  snap.index = current_index_;
  snap.progress = Progress();
  snap.status = status_;
  snap.muted = muted_;
  snap.kind = sequence_[static_cast<std::size_t>(current_index_)].kind;
  if (live_) {
    snap.buffering = live_->buffering;
    snap.effective_duration_ms = live_->effective_duration_ms;
    snap.generation = live_->generation;
  }
  return snap;
}

media::IMediaAdapter* PlaybackOrchestrator::LiveAdapter() const {
  return live_ ? live_->adapter.get() : nullptr;
}

// =============================================================================
// Commands
// =============================================================================

void PlaybackOrchestrator::Dispatch(const Command& command) {
  switch (command.type) {
    case CommandType::kPlay:
    case CommandType::kPause: {
      const PlaybackStatus next = command.type == CommandType::kPlay ? PlaybackStatus::kPlaying
                                                                     : PlaybackStatus::kPaused;
      if (next == status_) return;
      status_ = next;
      // Completed keeps its adapter parked.
      if (live_ && state_ != OrchestratorState::kCompleted) {
        live_->adapter->SetPlaybackState(status_);
        ApplyRunState();
      }
      return;
    }

    case CommandType::kMute:
    case CommandType::kUnmute:
      muted_ = command.type == CommandType::kMute;
      if (live_) live_->adapter->SetMuted(muted_);
      return;

    case CommandType::kNext:
    case CommandType::kPrevious:
    case CommandType::kJumpTo:
      break;
  }

  if (state_ == OrchestratorState::kIdle) {
    Logger::Debug(std::string("[PlaybackOrchestrator] ") + control::CommandTypeName(command.type) +
                  " ignored before Start");
    return;
  }

  const int32_t count = static_cast<int32_t>(sequence_.size());
  switch (command.type) {
    case CommandType::kNext:
      if (state_ == OrchestratorState::kCompleted) {
        Logger::Debug("[PlaybackOrchestrator] next ignored: sequence completed");
        return;
      }
      Advance();
      return;

    case CommandType::kPrevious:
      if (current_index_ == 0) {
        TransitionTo(0, EntryReason::kReturnedToStart);
      } else {
        TransitionTo(current_index_ - 1, EntryReason::kNavigate);
      }
      return;

    case CommandType::kJumpTo:
      if (command.target_index < 0 || command.target_index >= count) {
        Logger::Warn("[PlaybackOrchestrator] InvalidIndex: jumpTo(" +
                     std::to_string(command.target_index) + ") ignored");
        return;
      }
      TransitionTo(command.target_index, command.target_index == current_index_
                                             ? EntryReason::kRestart
                                             : EntryReason::kNavigate);
      return;

    default:
      return;
  }
}

// =============================================================================
// Transitions
// =============================================================================

void PlaybackOrchestrator::Advance() {
  const int32_t next = current_index_ + 1;
  if (static_cast<std::size_t>(next) < sequence_.size()) {
    TransitionTo(next, EntryReason::kNavigate);
  } else {
    EnterCompleted();
  }
}

void PlaybackOrchestrator::TransitionTo(int32_t index, EntryReason reason) {
  const int32_t previous_index = current_index_;
  if (reason != EntryReason::kInitial) {
    SetState(OrchestratorState::kTransitioning);
  }

  TeardownLive();
  current_index_ = index;
  ActivateSlot(index);

  switch (reason) {
    case EntryReason::kInitial:
      if (callbacks_.on_index_changed) callbacks_.on_index_changed(index);
      break;
    case EntryReason::kNavigate:
      if (index != previous_index && callbacks_.on_index_changed) {
        callbacks_.on_index_changed(index);
      }
      break;
    case EntryReason::kReturnedToStart:
      if (callbacks_.on_returned_to_start) callbacks_.on_returned_to_start();
      break;
    case EntryReason::kRestart:
      break;
  }
}

void PlaybackOrchestrator::EnterCompleted() {
  if (live_) {
    if (live_->clock) {
      live_->clock->Reset();
      live_->clock.reset();
    }
    live_->subscriptions.clear();
    live_->adapter->SetPlaybackState(PlaybackStatus::kPaused);
  }
  SetState(OrchestratorState::kCompleted);
  Logger::Info("[PlaybackOrchestrator] sequence completed at index " +
               std::to_string(current_index_));
  if (callbacks_.on_completed) callbacks_.on_completed();
}

void PlaybackOrchestrator::TeardownLive() {
  if (!live_) return;

  // Order matters: clock, then listeners, then the adapter itself.
  if (live_->clock) {
    live_->clock->Reset();
    live_->clock.reset();
  }
  live_->subscriptions.clear();
  if (live_->adapter->state() != media::AdapterState::kReleased) {
    live_->adapter->Release();
  }
  live_.reset();
}

void PlaybackOrchestrator::ActivateSlot(int32_t index) {
  const model::StoryItem& item = sequence_[static_cast<std::size_t>(index)];

  auto slot = std::make_unique<LiveSlot>();
  slot->index = index;
  slot->generation = ++generation_;
  slot->adapter = factory_.Create(item);
  if (!slot->adapter) {
    Logger::Error(std::string("[PlaybackOrchestrator] factory produced no adapter for kind ") +
                  model::ItemKindName(item.kind));
    throw std::logic_error("media adapter factory returned null");
  }

  const uint64_t gen = slot->generation;
  media::IMediaAdapter* adapter = slot->adapter.get();
  slot->subscriptions.push_back(adapter->OnReady([this, gen]() { OnAdapterReady(gen); }));
  slot->subscriptions.push_back(adapter->OnFailed(
      [this, gen](const util::LoadError& error) { OnAdapterFailed(gen, error); }));
  slot->subscriptions.push_back(adapter->OnEnded([this, gen]() { OnAdapterEnded(gen); }));
  slot->subscriptions.push_back(adapter->OnBufferingChanged(
      [this, gen](bool buffering) { OnBufferingChanged(gen, buffering); }));

  live_ = std::move(slot);

  adapter->SetMuted(item.mute_by_default || muted_);
  adapter->SetPlaybackState(status_);
  SetState(OrchestratorState::kLoading);

  Logger::Info("[PlaybackOrchestrator] item " + std::to_string(index + 1) + "/" +
               std::to_string(sequence_.size()) + " kind=" + model::ItemKindName(item.kind) +
               " source=" + item.source_locator + " generation=" + std::to_string(gen));
  adapter->Activate();

  if (callbacks_.on_active_adapter_changed) {
    callbacks_.on_active_adapter_changed(item.kind, adapter);
  }
}

void PlaybackOrchestrator::StartClock(int64_t duration_ms) {
  const uint64_t gen = live_->generation;
  live_->effective_duration_ms = duration_ms;
  live_->clock = std::make_unique<timing::ProgressClock>(loop_, config_.tick_interval_ms);
  live_->clock->OnExpire([this, gen]() { Serialized([this, gen]() { OnClockExpired(gen); }); });
  live_->clock->OnTick([this, gen](double progress) {
    Serialized([this, gen, progress]() { OnClockTick(gen, progress); });
  });
  live_->clock->Start(duration_ms);
  ApplyRunState();
}

void PlaybackOrchestrator::ApplyRunState() {
  if (!live_ || !live_->clock) return;
  if (status_ == PlaybackStatus::kPlaying && !live_->buffering) {
    live_->clock->Resume();
  } else {
    live_->clock->Pause();
  }
}

// =============================================================================
// Adapter and clock events
// =============================================================================

void PlaybackOrchestrator::OnAdapterReady(uint64_t generation) {
  Serialized([this, generation]() {
    if (!IsLive(generation) || state_ != OrchestratorState::kLoading) return;

    const model::StoryItem& item = sequence_[static_cast<std::size_t>(current_index_)];
    const auto intrinsic = live_->adapter->IntrinsicDurationMs();
    const int64_t duration =
        intrinsic && *intrinsic > 0 ? *intrinsic : item.configured_duration_ms;

    SetState(OrchestratorState::kActive);
    StartClock(duration);
    Logger::Debug("[PlaybackOrchestrator] ready index=" + std::to_string(current_index_) +
                  " duration_ms=" + std::to_string(duration) +
                  (intrinsic ? " (intrinsic)" : " (configured)"));
  });
}

void PlaybackOrchestrator::OnAdapterFailed(uint64_t generation, const util::LoadError& error) {
  Serialized([this, generation, &error]() {
    if (!IsLive(generation) || state_ != OrchestratorState::kLoading) return;

    const model::StoryItem& item = sequence_[static_cast<std::size_t>(current_index_)];
    Logger::Warn("[PlaybackOrchestrator] item " + std::to_string(current_index_) +
                 " failed: " + error.ToString());

    SetState(OrchestratorState::kFailed);
    StartClock(item.configured_duration_ms);
    if (callbacks_.on_item_failed) {
      callbacks_.on_item_failed(current_index_, error, item.error_view);
    }
  });
}

void PlaybackOrchestrator::OnAdapterEnded(uint64_t generation) {
  Serialized([this, generation]() {
    if (!IsLive(generation) || state_ != OrchestratorState::kActive) return;
    Logger::Debug("[PlaybackOrchestrator] media ended index=" + std::to_string(current_index_));
    Advance();
  });
}

void PlaybackOrchestrator::OnBufferingChanged(uint64_t generation, bool buffering) {
  Serialized([this, generation, buffering]() {
    if (!IsLive(generation)) return;
    live_->buffering = buffering;
    ApplyRunState();
  });
}

void PlaybackOrchestrator::OnClockExpired(uint64_t generation) {
  if (!IsLive(generation)) return;
  if (state_ != OrchestratorState::kActive && state_ != OrchestratorState::kFailed) return;
  Advance();
}

void PlaybackOrchestrator::OnClockTick(uint64_t generation, double progress) {
  if (!IsLive(generation)) return;
  if (callbacks_.on_progress) callbacks_.on_progress(current_index_, progress);
}

void PlaybackOrchestrator::SetState(OrchestratorState next) {
  if (next == state_) return;
  const OrchestratorState from = state_;
  state_ = next;
  if (Logger::DebugEnabled()) {
    Logger::Debug(std::string("[PlaybackOrchestrator] ") + OrchestratorStateName(from) + " -> " +
                  OrchestratorStateName(next) + " index=" + std::to_string(current_index_));
  }
  if (callbacks_.on_state_changed) callbacks_.on_state_changed(from, next);
}

}  // namespace storyline::runtime
