// Repository: Storyline
// Component: Timed Media Adapters
// Purpose: Video and audio items. The backend probes the stream (duration,
//          first frame); a media cursor then tracks the playback position
//          and raises ended at the natural end of the stream.
// Copyright (c) 2025 Storyline

#ifndef STORYLINE_MEDIA_TIMED_MEDIA_ADAPTER_HPP_
#define STORYLINE_MEDIA_TIMED_MEDIA_ADAPTER_HPP_

#include <cstdint>
#include <memory>
#include <optional>

#include "storyline/media/IMediaBackend.hpp"
#include "storyline/media/MediaAdapterBase.hpp"
#include "storyline/timing/ProgressClock.hpp"

namespace storyline::media {

// The cursor advances only while playing and not stalled. Streams of unknown
// length never raise ended; looping streams restart instead.
class TimedMediaAdapter : public MediaAdapterBase {
 public:
  TimedMediaAdapter(const model::StoryItem& item, timing::IEventLoop& loop,
                    IMediaBackend& backend);
  ~TimedMediaAdapter() override;

  std::optional<int64_t> IntrinsicDurationMs() const override;
  void SetMuted(bool muted) override;
  void SetPlaybackState(model::PlaybackStatus status) override;

  // Player stall reports from the presentation layer. Safe from any thread
  // once Activate() has been called.
  void ReportStall(bool stalled);

  bool muted() const { return muted_; }
  model::PlaybackStatus playback_state() const { return status_; }
  // Media position in [0, duration]; 0 when the duration is unknown.
  int64_t PositionMs() const;
  std::shared_ptr<const DecodedImage> first_frame() const { return first_frame_; }
  int width() const { return width_; }
  int height() const { return height_; }

 protected:
  void DoActivate() override;
  void DoRelease() override;

  virtual bool Looping() const = 0;

 private:
  void OnLoaded(const LoadResult& result);
  void OnCursorEnd();
  void SyncCursor();

  IMediaBackend& backend_;
  ControlPoster post_;

  bool muted_;
  model::PlaybackStatus status_ = model::PlaybackStatus::kPlaying;
  bool stalled_ = false;

  std::optional<int64_t> duration_ms_;
  std::shared_ptr<const DecodedImage> first_frame_;
  int width_ = 0;
  int height_ = 0;
  std::unique_ptr<timing::ProgressClock> cursor_;
};

class VideoAdapter : public TimedMediaAdapter {
 public:
  using TimedMediaAdapter::TimedMediaAdapter;

 protected:
  bool Looping() const override { return item().video && item().video->looping; }
};

class AudioAdapter : public TimedMediaAdapter {
 public:
  using TimedMediaAdapter::TimedMediaAdapter;

 protected:
  bool Looping() const override { return item().audio && item().audio->looping; }
};

}  // namespace storyline::media

#endif  // STORYLINE_MEDIA_TIMED_MEDIA_ADAPTER_HPP_
