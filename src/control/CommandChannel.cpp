// Repository: Storyline
// Component: Command Channel
// Copyright (c) 2025 Storyline

#include "storyline/control/CommandChannel.hpp"

#include <string>

#include "storyline/util/Logger.hpp"

namespace storyline::control {

using util::Logger;

const char* CommandTypeName(CommandType type) {
  switch (type) {
    case CommandType::kPlay:
      return "play";
    case CommandType::kPause:
      return "pause";
    case CommandType::kNext:
      return "next";
    case CommandType::kPrevious:
      return "previous";
    case CommandType::kMute:
      return "mute";
    case CommandType::kUnmute:
      return "unmute";
    case CommandType::kJumpTo:
      return "jumpTo";
  }
  return "unknown";
}

bool CommandChannel::Emit(const Command& command) {
  switch (command.type) {
    case CommandType::kPlay:
      if (status_ == model::PlaybackStatus::kPlaying) return false;
      status_ = model::PlaybackStatus::kPlaying;
      break;
    case CommandType::kPause:
      if (status_ == model::PlaybackStatus::kPaused) return false;
      status_ = model::PlaybackStatus::kPaused;
      break;
    case CommandType::kJumpTo:
      if (command.target_index < 0 ||
          static_cast<std::size_t>(command.target_index) >= sequence_length_) {
        Logger::Warn("[CommandChannel] InvalidIndex: jumpTo(" +
                     std::to_string(command.target_index) + ") outside [0, " +
                     std::to_string(sequence_length_) + ")");
        return false;
      }
      break;
    case CommandType::kNext:
    case CommandType::kPrevious:
    case CommandType::kMute:
    case CommandType::kUnmute:
      break;
  }

  if (Logger::DebugEnabled()) {
    std::string line = std::string("[CommandChannel] emit ") + CommandTypeName(command.type);
    if (command.type == CommandType::kJumpTo) {
      line += "(" + std::to_string(command.target_index) + ")";
    }
    Logger::Debug(line);
  }

  listeners_.Emit(command);
  return true;
}

util::Subscription CommandChannel::Subscribe(Listener listener) {
  return listeners_.Connect(std::move(listener));
}

}  // namespace storyline::control
