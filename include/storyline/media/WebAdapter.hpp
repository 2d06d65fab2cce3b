// Repository: Storyline
// Component: Web Adapter
// Purpose: Embedded web page. Ready once the backend has connected to the
//          page and read its first bytes.
// Copyright (c) 2025 Storyline

#ifndef STORYLINE_MEDIA_WEB_ADAPTER_HPP_
#define STORYLINE_MEDIA_WEB_ADAPTER_HPP_

#include <string>

#include "storyline/media/IMediaBackend.hpp"
#include "storyline/media/MediaAdapterBase.hpp"

namespace storyline::media {

class WebAdapter : public MediaAdapterBase {
 public:
  WebAdapter(const model::StoryItem& item, timing::IEventLoop& loop, IMediaBackend& backend)
      : MediaAdapterBase(item, loop), backend_(backend) {}

  const std::string& url() const { return item().source_locator; }

 protected:
  void DoActivate() override;

 private:
  IMediaBackend& backend_;
};

}  // namespace storyline::media

#endif  // STORYLINE_MEDIA_WEB_ADAPTER_HPP_
