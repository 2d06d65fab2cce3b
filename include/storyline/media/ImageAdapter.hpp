// Repository: Storyline
// Component: Image Adapter
// Purpose: Ready once the backend has decoded the image to an RGBA bitmap.
// Copyright (c) 2025 Storyline

#ifndef STORYLINE_MEDIA_IMAGE_ADAPTER_HPP_
#define STORYLINE_MEDIA_IMAGE_ADAPTER_HPP_

#include <memory>

#include "storyline/media/IMediaBackend.hpp"
#include "storyline/media/MediaAdapterBase.hpp"

namespace storyline::media {

class ImageAdapter : public MediaAdapterBase {
 public:
  ImageAdapter(const model::StoryItem& item, timing::IEventLoop& loop, IMediaBackend& backend);

  // Null until ready.
  std::shared_ptr<const DecodedImage> image() const { return image_; }

 protected:
  void DoActivate() override;
  void DoRelease() override { image_.reset(); }

 private:
  void OnLoaded(const LoadResult& result);

  IMediaBackend& backend_;
  std::shared_ptr<const DecodedImage> image_;
};

}  // namespace storyline::media

#endif  // STORYLINE_MEDIA_IMAGE_ADAPTER_HPP_
