// Repository: Storyline
// Component: Media Adapter Base
// Purpose: Shared lifecycle bookkeeping for the concrete adapters: state
//          transitions, listener lists, release-once enforcement and
//          marshalling of backend completions onto the control thread.
// Copyright (c) 2025 Storyline

#ifndef STORYLINE_MEDIA_MEDIA_ADAPTER_BASE_HPP_
#define STORYLINE_MEDIA_MEDIA_ADAPTER_BASE_HPP_

#include <functional>
#include <memory>

#include "storyline/media/IMediaAdapter.hpp"
#include "storyline/media/IMediaBackend.hpp"
#include "storyline/timing/IEventLoop.hpp"
#include "storyline/util/Signal.hpp"

namespace storyline::media {

class MediaAdapterBase : public IMediaAdapter {
 public:
  // `item` must outlive the adapter.
  MediaAdapterBase(const model::StoryItem& item, timing::IEventLoop& loop);
  ~MediaAdapterBase() override;

  MediaAdapterBase(const MediaAdapterBase&) = delete;
  MediaAdapterBase& operator=(const MediaAdapterBase&) = delete;

  void Activate() final;
  void Release() final;

  util::Subscription OnReady(std::function<void()> callback) override;
  util::Subscription OnFailed(std::function<void(const util::LoadError&)> callback) override;
  util::Subscription OnEnded(std::function<void()> callback) override;
  util::Subscription OnBufferingChanged(std::function<void(bool)> callback) override;

  std::optional<int64_t> IntrinsicDurationMs() const override { return std::nullopt; }
  void SetMuted(bool /*muted*/) override {}
  void SetPlaybackState(model::PlaybackStatus /*status*/) override {}

  AdapterState state() const override { return state_; }
  model::ItemKind kind() const override { return item_.kind; }
  const model::StoryItem& item() const override { return item_; }

 protected:
  // Posts a task to the control thread; the task is dropped if the adapter
  // has been released (or destroyed) by the time it runs.
  using ControlPoster = std::function<void(std::function<void()>)>;

  virtual void DoActivate() = 0;
  virtual void DoRelease() {}

  // Build on the control thread, then call from any thread.
  ControlPoster MakeControlPoster();

  // Control thread only. Each enforces the lifecycle ordering and silently
  // drops events that are no longer legal (e.g. ready after failed).
  // Buffering reported while activating is held and emitted right after ready.
  void NotifyReady();
  void NotifyFailed(const util::LoadError& error);
  void NotifyEnded();
  void NotifyBuffering(bool buffering);

  // The ticket is cancelled on release.
  void TrackTicket(std::shared_ptr<LoadTicket> ticket) { ticket_ = std::move(ticket); }

  timing::IEventLoop& loop() const { return loop_; }
  bool buffering() const { return buffering_; }

 private:
  const model::StoryItem& item_;
  timing::IEventLoop& loop_;
  AdapterState state_ = AdapterState::kCreated;
  bool buffering_ = false;
  bool buffering_before_ready_ = false;

  std::shared_ptr<LoadTicket> ticket_;
  std::shared_ptr<int> life_token_ = std::make_shared<int>(0);

  util::Signal<> ready_;
  util::Signal<const util::LoadError&> failed_;
  util::Signal<> ended_;
  util::Signal<bool> buffering_changed_;
};

}  // namespace storyline::media

#endif  // STORYLINE_MEDIA_MEDIA_ADAPTER_BASE_HPP_
