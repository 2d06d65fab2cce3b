// Repository: Storyline
// Component: Command Channel
// Purpose: Observable surface through which the host (and the gesture router)
//          drives playback. Tracks the current play/pause status.
// Copyright (c) 2025 Storyline

#ifndef STORYLINE_CONTROL_COMMAND_CHANNEL_HPP_
#define STORYLINE_CONTROL_COMMAND_CHANNEL_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>

#include "storyline/model/StoryTypes.hpp"
#include "storyline/util/Signal.hpp"
#include "storyline/util/Subscription.hpp"

namespace storyline::control {

enum class CommandType {
  kPlay,
  kPause,
  kNext,
  kPrevious,
  kMute,
  kUnmute,
  kJumpTo,
};

const char* CommandTypeName(CommandType type);

struct Command {
  CommandType type = CommandType::kPlay;
  int32_t target_index = -1;  // kJumpTo only

  static Command JumpTo(int32_t index) { return {CommandType::kJumpTo, index}; }
};

// CommandChannel is used from the control thread only.
//
// Acceptance rules:
// - kPlay/kPause matching the current status are dropped (no renotify).
// - kJumpTo outside [0, bound length) is dropped with a warning.
// - Every other command is accepted and notifies every subscriber, in
//   subscription order, before Emit() returns.
class CommandChannel {
 public:
  using Listener = std::function<void(const Command&)>;

  explicit CommandChannel(model::PlaybackStatus initial = model::PlaybackStatus::kPlaying)
      : status_(initial) {}

  CommandChannel(const CommandChannel&) = delete;
  CommandChannel& operator=(const CommandChannel&) = delete;

  // Returns true if the command was accepted and dispatched.
  bool Emit(const Command& command);

  bool Play() { return Emit({CommandType::kPlay}); }
  bool Pause() { return Emit({CommandType::kPause}); }
  bool Next() { return Emit({CommandType::kNext}); }
  bool Previous() { return Emit({CommandType::kPrevious}); }
  bool Mute() { return Emit({CommandType::kMute}); }
  bool Unmute() { return Emit({CommandType::kUnmute}); }
  bool JumpTo(int32_t index) { return Emit(Command::JumpTo(index)); }

  [[nodiscard]] util::Subscription Subscribe(Listener listener);

  model::PlaybackStatus CurrentStatus() const { return status_; }

  // Sets the jumpTo domain to [0, length).
  void BindSequenceLength(std::size_t length) { sequence_length_ = length; }
  std::size_t SequenceLength() const { return sequence_length_; }

  std::size_t SubscriberCount() const { return listeners_.size(); }

 private:
  model::PlaybackStatus status_;
  std::size_t sequence_length_ = 0;
  util::Signal<const Command&> listeners_;
};

}  // namespace storyline::control

#endif  // STORYLINE_CONTROL_COMMAND_CHANNEL_HPP_
