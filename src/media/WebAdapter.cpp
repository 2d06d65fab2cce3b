// Repository: Storyline
// Component: Web Adapter
// Copyright (c) 2025 Storyline

#include "storyline/media/WebAdapter.hpp"

namespace storyline::media {

void WebAdapter::DoActivate() {
  MediaRequest request;
  request.kind = model::ItemKind::kWeb;
  request.locator = item().source_locator;
  request.origin = item().origin;
  request.decode_first_frame = false;
  if (item().web) request.user_agent = item().web->user_agent;

  ControlPoster post = MakeControlPoster();
  TrackTicket(backend_.Load(request, [this, post](const LoadResult& result) {
    post([this, result]() {
      if (result.ok) {
        NotifyReady();
      } else {
        NotifyFailed(result.error);
      }
    });
  }));
}

}  // namespace storyline::media
