// Repository: Storyline
// Component: StoryItem
// Purpose: Immutable descriptor of one item in a story sequence.
// Copyright (c) 2025 Storyline

#ifndef STORYLINE_MODEL_STORY_ITEM_HPP_
#define STORYLINE_MODEL_STORY_ITEM_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "storyline/media/ICustomView.hpp"
#include "storyline/model/StoryTypes.hpp"

namespace storyline::model {

// Kind-specific configuration. The orchestrator never reads these; only the
// adapter (and the presentation layer) for the matching kind does.

struct ImageConfig {
  std::string fit = "cover";
};

struct VideoConfig {
  bool looping = false;
  bool use_aspect_ratio = false;
};

struct AudioConfig {
  bool looping = false;
};

struct TextConfig {
  std::string text;              // empty: the source locator is displayed
  std::string background_color;  // "#RRGGBB", empty for transparent
  std::string alignment = "center";
};

struct WebConfig {
  std::string user_agent;
};

using CustomViewFactory = std::function<std::unique_ptr<media::ICustomView>()>;

struct StoryItem {
  static constexpr int64_t kDefaultDurationMs = 3'000;

  ItemKind kind = ItemKind::kImage;

  // URL, file path or asset path. Required unless kind == kCustom.
  std::string source_locator;
  SourceOrigin origin = SourceOrigin::kNetwork;

  // Display time when the adapter reports no intrinsic duration.
  int64_t configured_duration_ms = kDefaultDurationMs;

  // Applicable to kVideo and kAudio.
  bool mute_by_default = false;

  std::optional<ImageConfig> image;
  std::optional<VideoConfig> video;
  std::optional<AudioConfig> audio;
  std::optional<TextConfig> text;
  std::optional<WebConfig> web;

  // Presentation-layer id of the view shown while the item is Failed.
  std::optional<std::string> error_view;

  // Required when kind == kCustom.
  CustomViewFactory custom_factory;

  static StoryItem Image(std::string locator, SourceOrigin origin = SourceOrigin::kNetwork,
                         int64_t duration_ms = kDefaultDurationMs);
  static StoryItem Video(std::string locator, SourceOrigin origin = SourceOrigin::kNetwork,
                         bool mute_by_default = false);
  static StoryItem Audio(std::string locator, SourceOrigin origin = SourceOrigin::kNetwork);
  static StoryItem Text(std::string text, int64_t duration_ms = kDefaultDurationMs);
  static StoryItem Web(std::string url, int64_t duration_ms = kDefaultDurationMs);
  static StoryItem Custom(CustomViewFactory factory, int64_t duration_ms = kDefaultDurationMs);
};

using StorySequence = std::vector<StoryItem>;

}  // namespace storyline::model

#endif  // STORYLINE_MODEL_STORY_ITEM_HPP_
