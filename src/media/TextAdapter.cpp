// Repository: Storyline
// Component: Text Adapter
// Copyright (c) 2025 Storyline

#include "storyline/media/TextAdapter.hpp"

namespace storyline::media {

std::string TextAdapter::text() const {
  if (item().text && !item().text->text.empty()) return item().text->text;
  return item().source_locator;
}

void TextAdapter::DoActivate() {
  MakeControlPoster()([this]() { NotifyReady(); });
}

}  // namespace storyline::media
