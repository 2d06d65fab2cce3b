// Repository: Storyline
// Component: FFmpeg Media Backend
// Purpose: IMediaBackend on libavformat/libavcodec. Requests run FIFO on one
//          worker thread: open, probe, and (image/video) decode the first
//          frame; web requests open the page and read its first bytes.
// Copyright (c) 2025 Storyline

#ifndef STORYLINE_MEDIA_FFMPEG_MEDIA_BACKEND_HPP_
#define STORYLINE_MEDIA_FFMPEG_MEDIA_BACKEND_HPP_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "storyline/media/IMediaBackend.hpp"

namespace storyline::media {

struct FFmpegBackendConfig {
  // Root joined to locators with origin=asset.
  std::string asset_root;

  // Deadline for opening and probing one request. 0 disables it.
  int64_t open_timeout_ms = 10'000;

  // When false, image requests still decode (they have nothing else to
  // offer) but video requests stop after probing.
  bool decode_first_frame = true;
};

class FFmpegMediaBackend : public IMediaBackend {
 public:
  explicit FFmpegMediaBackend(FFmpegBackendConfig config = {});

  // Aborts the running request, completes queued ones with kCancelled and
  // joins the worker.
  ~FFmpegMediaBackend() override;

  FFmpegMediaBackend(const FFmpegMediaBackend&) = delete;
  FFmpegMediaBackend& operator=(const FFmpegMediaBackend&) = delete;

  std::shared_ptr<LoadTicket> Load(const MediaRequest& request,
                                   LoadCompletion completion) override;

  // Queued, not yet started.
  std::size_t PendingCount() const;

  const FFmpegBackendConfig& config() const { return config_; }

 private:
  struct Job {
    MediaRequest request;
    LoadCompletion completion;
    std::shared_ptr<LoadTicket> ticket;
  };

  void WorkerLoop();
  LoadResult Process(const Job& job);
  LoadResult ProbeMedia(const Job& job, const std::string& url);
  LoadResult ConnectWeb(const Job& job, const std::string& url);

  const FFmpegBackendConfig config_;

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::deque<Job> queue_;

  std::thread worker_thread_;
  std::atomic<bool> shutdown_{false};
};

}  // namespace storyline::media

#endif  // STORYLINE_MEDIA_FFMPEG_MEDIA_BACKEND_HPP_
