// Repository: Storyline
// Component: Story Types
// Purpose: Enumerations shared by the model, the adapters and the runtime.
// Copyright (c) 2025 Storyline

#ifndef STORYLINE_MODEL_STORY_TYPES_HPP_
#define STORYLINE_MODEL_STORY_TYPES_HPP_

#include <optional>
#include <string>

namespace storyline::model {

enum class ItemKind {
  kImage,
  kVideo,
  kAudio,  // audio-bearing item: backing track decides the duration
  kText,
  kWeb,
  kCustom,
};

enum class SourceOrigin {
  kNetwork,
  kFile,
  kAsset,
};

enum class PlaybackStatus {
  kPlaying,
  kPaused,
};

const char* ItemKindName(ItemKind kind);
const char* SourceOriginName(SourceOrigin origin);
const char* PlaybackStatusName(PlaybackStatus status);

std::optional<ItemKind> ParseItemKind(const std::string& name);
std::optional<SourceOrigin> ParseSourceOrigin(const std::string& name);

// True for kinds that own an audio/video channel (mute, pause and natural
// end are meaningful).
bool HasMediaChannel(ItemKind kind);

}  // namespace storyline::model

#endif  // STORYLINE_MODEL_STORY_TYPES_HPP_
