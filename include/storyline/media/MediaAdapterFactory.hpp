// Repository: Storyline
// Component: Media Adapter Factory
// Purpose: The only place that selects an adapter variant by item kind.
// Copyright (c) 2025 Storyline

#ifndef STORYLINE_MEDIA_MEDIA_ADAPTER_FACTORY_HPP_
#define STORYLINE_MEDIA_MEDIA_ADAPTER_FACTORY_HPP_

#include <memory>

#include "storyline/media/IMediaAdapter.hpp"
#include "storyline/media/IMediaBackend.hpp"
#include "storyline/timing/IEventLoop.hpp"

namespace storyline::media {

class IMediaAdapterFactory {
 public:
  virtual ~IMediaAdapterFactory() = default;

  // `item` must outlive the returned adapter.
  virtual std::unique_ptr<IMediaAdapter> Create(const model::StoryItem& item) = 0;
};

class MediaAdapterFactory : public IMediaAdapterFactory {
 public:
  MediaAdapterFactory(timing::IEventLoop& loop, IMediaBackend& backend)
      : loop_(loop), backend_(backend) {}

  std::unique_ptr<IMediaAdapter> Create(const model::StoryItem& item) override;

 private:
  timing::IEventLoop& loop_;
  IMediaBackend& backend_;
};

}  // namespace storyline::media

#endif  // STORYLINE_MEDIA_MEDIA_ADAPTER_FACTORY_HPP_
