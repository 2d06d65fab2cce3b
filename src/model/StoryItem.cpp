// Repository: Storyline
// Component: StoryItem
// Copyright (c) 2025 Storyline

#include "storyline/model/StoryItem.hpp"

#include <utility>

namespace storyline::model {

const char* ItemKindName(ItemKind kind) {
  switch (kind) {
    case ItemKind::kImage:
      return "image";
    case ItemKind::kVideo:
      return "video";
    case ItemKind::kAudio:
      return "audio";
    case ItemKind::kText:
      return "text";
    case ItemKind::kWeb:
      return "web";
    case ItemKind::kCustom:
      return "custom";
  }
  return "unknown";
}

const char* SourceOriginName(SourceOrigin origin) {
  switch (origin) {
    case SourceOrigin::kNetwork:
      return "network";
    case SourceOrigin::kFile:
      return "file";
    case SourceOrigin::kAsset:
      return "asset";
  }
  return "unknown";
}

const char* PlaybackStatusName(PlaybackStatus status) {
  return status == PlaybackStatus::kPlaying ? "playing" : "paused";
}

std::optional<ItemKind> ParseItemKind(const std::string& name) {
  if (name == "image") return ItemKind::kImage;
  if (name == "video") return ItemKind::kVideo;
  if (name == "audio") return ItemKind::kAudio;
  if (name == "text") return ItemKind::kText;
  if (name == "web") return ItemKind::kWeb;
  if (name == "custom") return ItemKind::kCustom;
  return std::nullopt;
}

std::optional<SourceOrigin> ParseSourceOrigin(const std::string& name) {
  if (name == "network") return SourceOrigin::kNetwork;
  if (name == "file") return SourceOrigin::kFile;
  if (name == "asset") return SourceOrigin::kAsset;
  return std::nullopt;
}

bool HasMediaChannel(ItemKind kind) {
  return kind == ItemKind::kVideo || kind == ItemKind::kAudio;
}

StoryItem StoryItem::Image(std::string locator, SourceOrigin origin, int64_t duration_ms) {
  StoryItem item;
  item.kind = ItemKind::kImage;
  item.source_locator = std::move(locator);
  item.origin = origin;
  item.configured_duration_ms = duration_ms;
  item.image = ImageConfig{};
  return item;
}

StoryItem StoryItem::Video(std::string locator, SourceOrigin origin, bool mute_by_default) {
  StoryItem item;
  item.kind = ItemKind::kVideo;
  item.source_locator = std::move(locator);
  item.origin = origin;
  item.mute_by_default = mute_by_default;
  item.video = VideoConfig{};
  return item;
}

StoryItem StoryItem::Audio(std::string locator, SourceOrigin origin) {
  StoryItem item;
  item.kind = ItemKind::kAudio;
  item.source_locator = std::move(locator);
  item.origin = origin;
  item.audio = AudioConfig{};
  return item;
}

StoryItem StoryItem::Text(std::string text, int64_t duration_ms) {
  StoryItem item;
  item.kind = ItemKind::kText;
  item.source_locator = text;
  item.configured_duration_ms = duration_ms;
  item.text = TextConfig{};
  item.text->text = std::move(text);
  return item;
}

StoryItem StoryItem::Web(std::string url, int64_t duration_ms) {
  StoryItem item;
  item.kind = ItemKind::kWeb;
  item.source_locator = std::move(url);
  item.origin = SourceOrigin::kNetwork;
  item.configured_duration_ms = duration_ms;
  item.web = WebConfig{};
  return item;
}

StoryItem StoryItem::Custom(CustomViewFactory factory, int64_t duration_ms) {
  StoryItem item;
  item.kind = ItemKind::kCustom;
  item.custom_factory = std::move(factory);
  item.configured_duration_ms = duration_ms;
  return item;
}

}  // namespace storyline::model
