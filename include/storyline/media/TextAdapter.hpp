// Repository: Storyline
// Component: Text Adapter
// Purpose: Text needs no acquisition; ready on the next loop turn.
// Copyright (c) 2025 Storyline

#ifndef STORYLINE_MEDIA_TEXT_ADAPTER_HPP_
#define STORYLINE_MEDIA_TEXT_ADAPTER_HPP_

#include <string>

#include "storyline/media/MediaAdapterBase.hpp"

namespace storyline::media {

class TextAdapter : public MediaAdapterBase {
 public:
  TextAdapter(const model::StoryItem& item, timing::IEventLoop& loop)
      : MediaAdapterBase(item, loop) {}

  // The configured text, or the source locator when no text is configured.
  std::string text() const;

 protected:
  void DoActivate() override;
};

}  // namespace storyline::media

#endif  // STORYLINE_MEDIA_TEXT_ADAPTER_HPP_
