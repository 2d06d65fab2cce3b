// Repository: Storyline
// Component: Custom View Interface
// Purpose: Host-supplied content for kind=custom items. The custom adapter
//          owns one view for the item's display window.
// Copyright (c) 2025 Storyline

#ifndef STORYLINE_MEDIA_ICUSTOM_VIEW_HPP_
#define STORYLINE_MEDIA_ICUSTOM_VIEW_HPP_

#include <cstdint>
#include <functional>
#include <optional>

#include "storyline/model/StoryTypes.hpp"
#include "storyline/util/Errors.hpp"

namespace storyline::media {

// Hooks handed to a custom view. Any of them may be called from any thread;
// the adapter marshals them onto the control thread and drops calls that
// arrive after release.
struct CustomViewContext {
  std::function<void()> ready;
  std::function<void(const util::LoadError&)> failed;
  std::function<void()> ended;
  std::function<void(bool)> buffering;
};

class ICustomView {
 public:
  virtual ~ICustomView() = default;

  // Called once on the control thread when the item is activated.
  // The view must eventually call ctx.ready or ctx.failed.
  virtual void Start(const CustomViewContext& ctx) = 0;

  // Called once when the item leaves the screen. No hook may be used after.
  virtual void Stop() = 0;

  // Views that play their own timed content (e.g. a soundtrack) may report a
  // length once ready; nullopt means the item's configured duration applies.
  virtual std::optional<int64_t> IntrinsicDurationMs() const { return std::nullopt; }

  virtual void SetMuted(bool /*muted*/) {}
  virtual void SetPlaybackState(model::PlaybackStatus /*status*/) {}
};

}  // namespace storyline::media

#endif  // STORYLINE_MEDIA_ICUSTOM_VIEW_HPP_
