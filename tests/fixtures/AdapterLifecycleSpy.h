#ifndef STORYLINE_TESTS_FIXTURES_ADAPTER_LIFECYCLE_SPY_H_
#define STORYLINE_TESTS_FIXTURES_ADAPTER_LIFECYCLE_SPY_H_

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include "storyline/media/MediaAdapterFactory.hpp"

namespace storyline::tests::fixtures {

// Factory decorator that counts adapter activations and releases, so tests
// can assert the one-live-adapter invariant at any observation point.
class AdapterLifecycleSpy : public media::IMediaAdapterFactory {
 public:
  explicit AdapterLifecycleSpy(media::IMediaAdapterFactory& inner) : inner_(inner) {}

  std::unique_ptr<media::IMediaAdapter> Create(const model::StoryItem& item) override {
    ++created_;
    created_log_.push_back(item.source_locator);
    auto inner = inner_.Create(item);
    last_inner_ = inner.get();
    return std::make_unique<SpyAdapter>(std::move(inner), *this);
  }

  int created() const { return created_; }
  int activated() const { return activated_; }
  int released() const { return released_; }
  int live() const { return activated_ - released_; }
  int max_live() const { return max_live_; }

  // The concrete adapter behind the most recent Create(); for downcasts.
  media::IMediaAdapter* last_inner() const { return last_inner_; }

  const std::vector<std::string>& created_log() const { return created_log_; }
  const std::vector<std::string>& released_log() const { return released_log_; }

 private:
  class SpyAdapter : public media::IMediaAdapter {
   public:
    SpyAdapter(std::unique_ptr<media::IMediaAdapter> inner, AdapterLifecycleSpy& spy)
        : inner_(std::move(inner)), spy_(spy) {}

    void Activate() override {
      ++spy_.activated_;
      spy_.max_live_ = std::max(spy_.max_live_, spy_.live());
      inner_->Activate();
    }

    void Release() override {
      inner_->Release();
      ++spy_.released_;
      spy_.released_log_.push_back(inner_->item().source_locator);
    }

    util::Subscription OnReady(std::function<void()> cb) override {
      return inner_->OnReady(std::move(cb));
    }
    util::Subscription OnFailed(std::function<void(const util::LoadError&)> cb) override {
      return inner_->OnFailed(std::move(cb));
    }
    util::Subscription OnEnded(std::function<void()> cb) override {
      return inner_->OnEnded(std::move(cb));
    }
    util::Subscription OnBufferingChanged(std::function<void(bool)> cb) override {
      return inner_->OnBufferingChanged(std::move(cb));
    }

    std::optional<int64_t> IntrinsicDurationMs() const override {
      return inner_->IntrinsicDurationMs();
    }
    void SetMuted(bool muted) override { inner_->SetMuted(muted); }
    void SetPlaybackState(model::PlaybackStatus status) override {
      inner_->SetPlaybackState(status);
    }

    media::AdapterState state() const override { return inner_->state(); }
    model::ItemKind kind() const override { return inner_->kind(); }
    const model::StoryItem& item() const override { return inner_->item(); }

   private:
    std::unique_ptr<media::IMediaAdapter> inner_;
    AdapterLifecycleSpy& spy_;
  };

  media::IMediaAdapterFactory& inner_;
  int created_ = 0;
  int activated_ = 0;
  int released_ = 0;
  int max_live_ = 0;
  media::IMediaAdapter* last_inner_ = nullptr;
  std::vector<std::string> created_log_;
  std::vector<std::string> released_log_;
};

}  // namespace storyline::tests::fixtures

#endif  // STORYLINE_TESTS_FIXTURES_ADAPTER_LIFECYCLE_SPY_H_
