// Repository: Storyline
// Component: Media Adapter Interface
// Purpose: Uniform lifecycle over one item's media content, whatever its kind.
// Copyright (c) 2025 Storyline

#ifndef STORYLINE_MEDIA_IMEDIA_ADAPTER_HPP_
#define STORYLINE_MEDIA_IMEDIA_ADAPTER_HPP_

#include <cstdint>
#include <functional>
#include <optional>

#include "storyline/model/StoryItem.hpp"
#include "storyline/util/Errors.hpp"
#include "storyline/util/Subscription.hpp"

namespace storyline::media {

enum class AdapterState {
  kCreated,
  kActivating,
  kReady,
  kFailed,
  kReleased,
};

const char* AdapterStateName(AdapterState state);

// One adapter is bound to exactly one StoryItem for its whole life.
//
// Lifecycle events are delivered on the control thread:
// - ready XOR failed, at most once, never synchronously from Activate();
// - ended only after ready, for timed media reaching its natural end;
// - buffering(true/false) only while ready.
// Nothing is delivered after Release().
class IMediaAdapter {
 public:
  virtual ~IMediaAdapter() = default;

  virtual void Activate() = 0;

  // Must be called exactly once. A second call throws
  // util::DoubleReleaseViolation.
  virtual void Release() = 0;

  [[nodiscard]] virtual util::Subscription OnReady(std::function<void()> callback) = 0;
  [[nodiscard]] virtual util::Subscription OnFailed(
      std::function<void(const util::LoadError&)> callback) = 0;
  [[nodiscard]] virtual util::Subscription OnEnded(std::function<void()> callback) = 0;
  [[nodiscard]] virtual util::Subscription OnBufferingChanged(
      std::function<void(bool)> callback) = 0;

  // Known only once ready, and only for kinds with their own timeline.
  virtual std::optional<int64_t> IntrinsicDurationMs() const = 0;

  virtual void SetMuted(bool muted) = 0;
  virtual void SetPlaybackState(model::PlaybackStatus status) = 0;

  virtual AdapterState state() const = 0;
  virtual model::ItemKind kind() const = 0;
  virtual const model::StoryItem& item() const = 0;
};

}  // namespace storyline::media

#endif  // STORYLINE_MEDIA_IMEDIA_ADAPTER_HPP_
