// Repository: Storyline
// Component: Media Backend Interface
// Purpose: Asynchronous acquisition of media content (probe, first-frame
//          decode, page connect) on behalf of the media adapters.
// Copyright (c) 2025 Storyline

#ifndef STORYLINE_MEDIA_IMEDIA_BACKEND_HPP_
#define STORYLINE_MEDIA_IMEDIA_BACKEND_HPP_

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "storyline/model/StoryTypes.hpp"
#include "storyline/util/Errors.hpp"

namespace storyline::media {

struct MediaRequest {
  model::ItemKind kind = model::ItemKind::kImage;
  std::string locator;
  model::SourceOrigin origin = model::SourceOrigin::kNetwork;
  bool decode_first_frame = true;  // image/video only
  std::string user_agent;          // web only
};

// Tightly packed RGBA, 4 bytes per pixel.
struct DecodedImage {
  int width = 0;
  int height = 0;
  std::vector<uint8_t> rgba;
};

struct MediaInfo {
  std::optional<int64_t> duration_ms;  // timed media only
  int width = 0;
  int height = 0;
  bool has_video = false;
  bool has_audio = false;
  std::shared_ptr<const DecodedImage> first_frame;
};

struct LoadResult {
  bool ok = false;
  MediaInfo info;
  util::LoadError error;

  static LoadResult Success(MediaInfo info) {
    LoadResult r;
    r.ok = true;
    r.info = std::move(info);
    return r;
  }

  static LoadResult Failure(util::LoadErrorKind kind, std::string cause) {
    LoadResult r;
    r.error = util::LoadError{kind, std::move(cause)};
    return r;
  }
};

// Handle to one in-flight request. Cancel() is safe from any thread.
class LoadTicket {
 public:
  void Cancel() { cancelled_.store(true, std::memory_order_release); }
  bool IsCancelled() const { return cancelled_.load(std::memory_order_acquire); }

 private:
  std::atomic<bool> cancelled_{false};
};

using LoadCompletion = std::function<void(const LoadResult&)>;

class IMediaBackend {
 public:
  virtual ~IMediaBackend() = default;

  // The completion runs exactly once, on any thread. A cancelled request
  // completes with LoadErrorKind::kCancelled or with whatever result was
  // already final; callers drop completions for cancelled tickets.
  virtual std::shared_ptr<LoadTicket> Load(const MediaRequest& request,
                                           LoadCompletion completion) = 0;
};

}  // namespace storyline::media

#endif  // STORYLINE_MEDIA_IMEDIA_BACKEND_HPP_
