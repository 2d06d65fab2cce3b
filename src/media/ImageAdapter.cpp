// Repository: Storyline
// Component: Image Adapter
// Copyright (c) 2025 Storyline

#include "storyline/media/ImageAdapter.hpp"

namespace storyline::media {

ImageAdapter::ImageAdapter(const model::StoryItem& item, timing::IEventLoop& loop,
                           IMediaBackend& backend)
    : MediaAdapterBase(item, loop), backend_(backend) {}

void ImageAdapter::DoActivate() {
  MediaRequest request;
  request.kind = model::ItemKind::kImage;
  request.locator = item().source_locator;
  request.origin = item().origin;
  request.decode_first_frame = true;

  ControlPoster post = MakeControlPoster();
  TrackTicket(backend_.Load(request, [this, post](const LoadResult& result) {
    post([this, result]() { OnLoaded(result); });
  }));
}

void ImageAdapter::OnLoaded(const LoadResult& result) {
  if (!result.ok) {
    NotifyFailed(result.error);
    return;
  }
  if (!result.info.first_frame) {
    NotifyFailed({util::LoadErrorKind::kDecodeFailed, "no frame decoded"});
    return;
  }
  image_ = result.info.first_frame;
  NotifyReady();
}

}  // namespace storyline::media
