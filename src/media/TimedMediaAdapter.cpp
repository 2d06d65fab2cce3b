// Repository: Storyline
// Component: Timed Media Adapters
// Copyright (c) 2025 Storyline

#include "storyline/media/TimedMediaAdapter.hpp"

#include <string>

#include "storyline/util/Logger.hpp"

namespace storyline::media {

using util::Logger;

TimedMediaAdapter::TimedMediaAdapter(const model::StoryItem& item, timing::IEventLoop& loop,
                                     IMediaBackend& backend)
    : MediaAdapterBase(item, loop), backend_(backend), muted_(item.mute_by_default) {}

TimedMediaAdapter::~TimedMediaAdapter() = default;

std::optional<int64_t> TimedMediaAdapter::IntrinsicDurationMs() const {
  if (state() != AdapterState::kReady) return std::nullopt;
  return duration_ms_;
}

void TimedMediaAdapter::SetMuted(bool muted) {
  if (state() == AdapterState::kReleased) return;
  muted_ = muted;
}

void TimedMediaAdapter::SetPlaybackState(model::PlaybackStatus status) {
  if (state() == AdapterState::kReleased || status == status_) return;
  status_ = status;
  SyncCursor();
}

void TimedMediaAdapter::ReportStall(bool stalled) {
  if (!post_) return;
  post_([this, stalled]() {
    stalled_ = stalled;
    SyncCursor();
    NotifyBuffering(stalled);
  });
}

int64_t TimedMediaAdapter::PositionMs() const {
  if (!cursor_ || !duration_ms_) return 0;
  return *duration_ms_ - cursor_->RemainingMs();
}

void TimedMediaAdapter::DoActivate() {
  post_ = MakeControlPoster();

  MediaRequest request;
  request.kind = item().kind;
  request.locator = item().source_locator;
  request.origin = item().origin;
  request.decode_first_frame = item().kind == model::ItemKind::kVideo;

  ControlPoster post = post_;
  TrackTicket(backend_.Load(request, [this, post](const LoadResult& result) {
    post([this, result]() { OnLoaded(result); });
  }));
}

void TimedMediaAdapter::DoRelease() {
  cursor_.reset();
  first_frame_.reset();
}

void TimedMediaAdapter::OnLoaded(const LoadResult& result) {
  if (!result.ok) {
    NotifyFailed(result.error);
    return;
  }

  const MediaInfo& info = result.info;
  if (info.duration_ms && *info.duration_ms > 0) {
    duration_ms_ = info.duration_ms;
  }
  first_frame_ = info.first_frame;
  width_ = info.width;
  height_ = info.height;

  if (duration_ms_) {
    cursor_ = std::make_unique<timing::ProgressClock>(loop());
    cursor_->OnExpire([this]() { OnCursorEnd(); });
    cursor_->Start(*duration_ms_);
    SyncCursor();
  } else {
    Logger::Debug("[TimedMediaAdapter] unknown duration, no natural end: " +
                  item().source_locator);
  }

  NotifyReady();
}

void TimedMediaAdapter::OnCursorEnd() {
  if (Looping()) {
    cursor_->Start(*duration_ms_);
    SyncCursor();
    return;
  }
  NotifyEnded();
}

void TimedMediaAdapter::SyncCursor() {
  if (!cursor_) return;
  const bool advance = status_ == model::PlaybackStatus::kPlaying && !stalled_;
  if (advance) {
    cursor_->Resume();
  } else {
    cursor_->Pause();
  }
}

}  // namespace storyline::media
