// Repository: Storyline
// Component: Custom Adapter
// Copyright (c) 2025 Storyline

#include "storyline/media/CustomAdapter.hpp"

#include <exception>
#include <string>

namespace storyline::media {

CustomAdapter::~CustomAdapter() {
  if (view_ && started_) view_->Stop();
}

std::optional<int64_t> CustomAdapter::IntrinsicDurationMs() const {
  if (state() != AdapterState::kReady || !view_) return std::nullopt;
  auto duration = view_->IntrinsicDurationMs();
  if (duration && *duration <= 0) return std::nullopt;
  return duration;
}

void CustomAdapter::SetMuted(bool muted) {
  if (view_ && state() != AdapterState::kReleased) view_->SetMuted(muted);
}

void CustomAdapter::SetPlaybackState(model::PlaybackStatus status) {
  if (view_ && state() != AdapterState::kReleased) view_->SetPlaybackState(status);
}

void CustomAdapter::DoActivate() {
  ControlPoster post = MakeControlPoster();

  if (item().custom_factory) view_ = item().custom_factory();
  if (!view_) {
    post([this]() {
      NotifyFailed({util::LoadErrorKind::kInvalidItem, "custom view factory produced no view"});
    });
    return;
  }

  CustomViewContext ctx;
  ctx.ready = [this, post]() { post([this]() { NotifyReady(); }); };
  ctx.failed = [this, post](const util::LoadError& error) {
    post([this, error]() { NotifyFailed(error); });
  };
  ctx.ended = [this, post]() { post([this]() { NotifyEnded(); }); };
  ctx.buffering = [this, post](bool buffering) {
    post([this, buffering]() { NotifyBuffering(buffering); });
  };

  try {
    view_->Start(ctx);
    started_ = true;
  } catch (const std::exception& e) {
    view_.reset();
    post([this, cause = std::string(e.what())]() {
      NotifyFailed({util::LoadErrorKind::kInvalidItem, "custom view failed to start: " + cause});
    });
  }
}

void CustomAdapter::DoRelease() {
  if (view_) {
    if (started_) view_->Stop();
    started_ = false;
    view_.reset();
  }
}

}  // namespace storyline::media
