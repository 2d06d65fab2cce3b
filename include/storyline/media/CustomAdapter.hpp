// Repository: Storyline
// Component: Custom Adapter
// Purpose: Hosts an ICustomView built from the item's factory and relays
//          its context hooks as adapter lifecycle events.
// Copyright (c) 2025 Storyline

#ifndef STORYLINE_MEDIA_CUSTOM_ADAPTER_HPP_
#define STORYLINE_MEDIA_CUSTOM_ADAPTER_HPP_

#include <memory>

#include "storyline/media/ICustomView.hpp"
#include "storyline/media/MediaAdapterBase.hpp"

namespace storyline::media {

class CustomAdapter : public MediaAdapterBase {
 public:
  CustomAdapter(const model::StoryItem& item, timing::IEventLoop& loop)
      : MediaAdapterBase(item, loop) {}
  ~CustomAdapter() override;

  std::optional<int64_t> IntrinsicDurationMs() const override;
  void SetMuted(bool muted) override;
  void SetPlaybackState(model::PlaybackStatus status) override;

  ICustomView* view() const { return view_.get(); }

 protected:
  void DoActivate() override;
  void DoRelease() override;

 private:
  std::unique_ptr<ICustomView> view_;
  bool started_ = false;
};

}  // namespace storyline::media

#endif  // STORYLINE_MEDIA_CUSTOM_ADAPTER_HPP_
