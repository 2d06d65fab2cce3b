// Repository: Storyline
// Component: Media Adapter Factory
// Copyright (c) 2025 Storyline

#include "storyline/media/MediaAdapterFactory.hpp"

#include "storyline/media/CustomAdapter.hpp"
#include "storyline/media/ImageAdapter.hpp"
#include "storyline/media/TextAdapter.hpp"
#include "storyline/media/TimedMediaAdapter.hpp"
#include "storyline/media/WebAdapter.hpp"

namespace storyline::media {

std::unique_ptr<IMediaAdapter> MediaAdapterFactory::Create(const model::StoryItem& item) {
  switch (item.kind) {
    case model::ItemKind::kImage:
      return std::make_unique<ImageAdapter>(item, loop_, backend_);
    case model::ItemKind::kVideo:
      return std::make_unique<VideoAdapter>(item, loop_, backend_);
    case model::ItemKind::kAudio:
      return std::make_unique<AudioAdapter>(item, loop_, backend_);
    case model::ItemKind::kText:
      return std::make_unique<TextAdapter>(item, loop_);
    case model::ItemKind::kWeb:
      return std::make_unique<WebAdapter>(item, loop_, backend_);
    case model::ItemKind::kCustom:
      return std::make_unique<CustomAdapter>(item, loop_);
  }
  return nullptr;
}

}  // namespace storyline::media
