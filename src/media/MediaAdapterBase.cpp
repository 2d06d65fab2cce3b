// Repository: Storyline
// Component: Media Adapter Base
// Copyright (c) 2025 Storyline

#include "storyline/media/MediaAdapterBase.hpp"

#include <string>

#include "storyline/util/Logger.hpp"

namespace storyline::media {

using util::Logger;

const char* AdapterStateName(AdapterState state) {
  switch (state) {
    case AdapterState::kCreated:
      return "created";
    case AdapterState::kActivating:
      return "activating";
    case AdapterState::kReady:
      return "ready";
    case AdapterState::kFailed:
      return "failed";
    case AdapterState::kReleased:
      return "released";
  }
  return "unknown";
}

MediaAdapterBase::MediaAdapterBase(const model::StoryItem& item, timing::IEventLoop& loop)
    : item_(item), loop_(loop) {}

MediaAdapterBase::~MediaAdapterBase() {
  // Derived parts are already gone; only cancel what the base owns.
  if (ticket_) ticket_->Cancel();
}

void MediaAdapterBase::Activate() {
  if (state_ != AdapterState::kCreated) {
    Logger::Warn(std::string("[MediaAdapter] Activate ignored in state ") +
                 AdapterStateName(state_) + " kind=" + model::ItemKindName(item_.kind));
    return;
  }
  state_ = AdapterState::kActivating;
  Logger::Debug(std::string("[MediaAdapter] activate kind=") + model::ItemKindName(item_.kind) +
                " source=" + item_.source_locator);
  DoActivate();
}

void MediaAdapterBase::Release() {
  if (state_ == AdapterState::kReleased) {
    const std::string what = std::string("DoubleReleaseViolation: ") +
                             model::ItemKindName(item_.kind) + " adapter released twice";
    Logger::Error("[MediaAdapter] " + what);
    throw util::DoubleReleaseViolation(what);
  }

  state_ = AdapterState::kReleased;
  life_token_.reset();
  if (ticket_) {
    ticket_->Cancel();
    ticket_.reset();
  }
  ready_.DisconnectAll();
  failed_.DisconnectAll();
  ended_.DisconnectAll();
  buffering_changed_.DisconnectAll();

  DoRelease();
}

util::Subscription MediaAdapterBase::OnReady(std::function<void()> callback) {
  return ready_.Connect(std::move(callback));
}

util::Subscription MediaAdapterBase::OnFailed(
    std::function<void(const util::LoadError&)> callback) {
  return failed_.Connect(std::move(callback));
}

util::Subscription MediaAdapterBase::OnEnded(std::function<void()> callback) {
  return ended_.Connect(std::move(callback));
}

util::Subscription MediaAdapterBase::OnBufferingChanged(std::function<void(bool)> callback) {
  return buffering_changed_.Connect(std::move(callback));
}

MediaAdapterBase::ControlPoster MediaAdapterBase::MakeControlPoster() {
  timing::IEventLoop* loop = &loop_;
  std::weak_ptr<int> life = life_token_;
  return [loop, life](std::function<void()> task) {
    loop->Post([life, task = std::move(task)]() {
      if (life.expired()) return;
      task();
    });
  };
}

void MediaAdapterBase::NotifyReady() {
  if (state_ != AdapterState::kActivating) return;
  state_ = AdapterState::kReady;
  ready_.Emit();
  if (buffering_before_ready_ && state_ == AdapterState::kReady) {
    buffering_before_ready_ = false;
    NotifyBuffering(true);
  }
}

void MediaAdapterBase::NotifyFailed(const util::LoadError& error) {
  if (state_ != AdapterState::kActivating) return;
  state_ = AdapterState::kFailed;
  Logger::Warn(std::string("[MediaAdapter] load failed kind=") + model::ItemKindName(item_.kind) +
               " source=" + item_.source_locator + " error=" + error.ToString());
  failed_.Emit(error);
}

void MediaAdapterBase::NotifyEnded() {
  if (state_ != AdapterState::kReady) return;
  ended_.Emit();
}

void MediaAdapterBase::NotifyBuffering(bool buffering) {
  if (state_ == AdapterState::kActivating) {
    buffering_before_ready_ = buffering;
    return;
  }
  if (state_ != AdapterState::kReady || buffering == buffering_) return;
  buffering_ = buffering;
  buffering_changed_.Emit(buffering);
}

}  // namespace storyline::media
