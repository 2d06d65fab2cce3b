// Repository: Storyline
// Component: Session Types
// Purpose: Configuration, outbound callbacks and read-only snapshot of a
//          playback session.
// Copyright (c) 2025 Storyline

#ifndef STORYLINE_RUNTIME_SESSION_TYPES_HPP_
#define STORYLINE_RUNTIME_SESSION_TYPES_HPP_

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "storyline/media/IMediaAdapter.hpp"
#include "storyline/model/StoryTypes.hpp"
#include "storyline/timing/ProgressClock.hpp"
#include "storyline/util/Errors.hpp"

namespace storyline::runtime {

// Idle -> Loading(i) -> Active(i) | Failed(i) -> Transitioning ->
// Loading(j) | Completed
enum class OrchestratorState {
  kIdle,
  kLoading,
  kActive,
  kFailed,
  kTransitioning,
  kCompleted,
};

const char* OrchestratorStateName(OrchestratorState state);

struct OrchestratorConfig {
  int32_t initial_index = 0;
  int64_t tick_interval_ms = timing::ProgressClock::kDefaultTickIntervalMs;
  bool start_muted = false;
};

// All callbacks run on the control thread. Commands emitted from inside a
// callback are queued and applied once the current step has finished.
struct OrchestratorCallbacks {
  // A different item became current (also raised once at Start).
  std::function<void(int32_t)> on_index_changed;

  // The last item finished. Raised once per arrival in Completed.
  std::function<void()> on_completed;

  // previous() was requested at index 0; item 0 restarts instead.
  std::function<void()> on_returned_to_start;

  // A new adapter was created and activated for the current item.
  std::function<void(model::ItemKind, media::IMediaAdapter*)> on_active_adapter_changed;

  // Parameters: index, error, the item's error view (if any).
  std::function<void(int32_t, const util::LoadError&, const std::optional<std::string>&)>
      on_item_failed;

  // Per clock tick. Parameters: index, progress in [0, 1].
  std::function<void(int32_t, double)> on_progress;

  std::function<void(OrchestratorState, OrchestratorState)> on_state_changed;
};

struct SessionSnapshot {
  OrchestratorState state = OrchestratorState::kIdle;
  int32_t index = 0;
  double progress = 0.0;
  model::PlaybackStatus status = model::PlaybackStatus::kPlaying;
  bool muted = false;
  bool buffering = false;
  model::ItemKind kind = model::ItemKind::kImage;
  int64_t effective_duration_ms = 0;  // 0 until the clock has started
  uint64_t generation = 0;
};

}  // namespace storyline::runtime

#endif  // STORYLINE_RUNTIME_SESSION_TYPES_HPP_
