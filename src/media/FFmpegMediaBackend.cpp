// Repository: Storyline
// Component: FFmpeg Media Backend
// Purpose: Worker-thread media acquisition using libavformat/libavcodec.
// Copyright (c) 2025 Storyline

#include "storyline/media/FFmpegMediaBackend.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <utility>

#include "storyline/media/SourceResolver.hpp"
#include "storyline/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavformat/avio.h>
#include <libavutil/dict.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/log.h>
#include <libavutil/mathematics.h>
#include <libswscale/swscale.h>
}

namespace storyline::media {

using util::LoadErrorKind;
using util::Logger;

namespace {

constexpr int kWebProbeBytes = 4096;

// Opaque for the interrupt callback.
struct InterruptState {
  const LoadTicket* ticket = nullptr;
  const std::atomic<bool>* shutdown = nullptr;
  std::chrono::steady_clock::time_point deadline{};
  bool has_deadline = false;
  bool timed_out = false;
};

// FFmpeg interrupt callback: return non-zero to abort I/O.
int InterruptCallback(void* opaque) {
  auto* state = static_cast<InterruptState*>(opaque);
  if (state->ticket && state->ticket->IsCancelled()) return 1;
  if (state->shutdown && state->shutdown->load(std::memory_order_acquire)) return 1;
  if (state->has_deadline && std::chrono::steady_clock::now() >= state->deadline) {
    state->timed_out = true;
    return 1;
  }
  return 0;
}

std::string AvError(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return errbuf;
}

struct FormatCloser {
  void operator()(AVFormatContext* ctx) const { avformat_close_input(&ctx); }
};
struct CodecFreer {
  void operator()(AVCodecContext* ctx) const { avcodec_free_context(&ctx); }
};
struct FrameFreer {
  void operator()(AVFrame* f) const { av_frame_free(&f); }
};
struct PacketFreer {
  void operator()(AVPacket* p) const { av_packet_free(&p); }
};
struct SwsFreer {
  void operator()(SwsContext* ctx) const { sws_freeContext(ctx); }
};
struct AvioCloser {
  void operator()(AVIOContext* ctx) const { avio_closep(&ctx); }
};
struct DictFreer {
  void operator()(AVDictionary* dict) const { av_dict_free(&dict); }
};

using FormatPtr = std::unique_ptr<AVFormatContext, FormatCloser>;
using CodecPtr = std::unique_ptr<AVCodecContext, CodecFreer>;
using FramePtr = std::unique_ptr<AVFrame, FrameFreer>;
using PacketPtr = std::unique_ptr<AVPacket, PacketFreer>;
using SwsPtr = std::unique_ptr<SwsContext, SwsFreer>;

// Maps an open/read failure to the load error taxonomy.
LoadErrorKind ClassifyOpenError(int ret, const InterruptState& interrupt,
                                model::SourceOrigin origin) {
  if (ret == AVERROR_EXIT || ret == AVERROR_IMMEDIATE_EXIT) {
    return interrupt.timed_out ? LoadErrorKind::kNetwork : LoadErrorKind::kCancelled;
  }
  if (ret == AVERROR(ENOENT) || ret == AVERROR_HTTP_NOT_FOUND) {
    return LoadErrorKind::kSourceNotFound;
  }
  if (ret == AVERROR_INVALIDDATA || ret == AVERROR_PROTOCOL_NOT_FOUND ||
      ret == AVERROR_DEMUXER_NOT_FOUND) {
    return LoadErrorKind::kUnsupportedMedia;
  }
  if (origin == model::SourceOrigin::kNetwork) return LoadErrorKind::kNetwork;
  return LoadErrorKind::kSourceNotFound;
}

void InitNetworkOnce() {
  static std::once_flag once;
  std::call_once(once, []() {
    avformat_network_init();
    av_log_set_level(Logger::DebugEnabled() ? AV_LOG_INFO : AV_LOG_ERROR);
  });
}

// Decodes the first frame of `stream_index`. Returns 0 or an AVERROR.
int DecodeFirstFrame(AVFormatContext* fmt, int stream_index, AVCodecContext* codec,
                     AVFrame* frame) {
  PacketPtr packet(av_packet_alloc());
  if (!packet) return AVERROR(ENOMEM);

  int ret = 0;
  while ((ret = av_read_frame(fmt, packet.get())) >= 0) {
    if (packet->stream_index != stream_index) {
      av_packet_unref(packet.get());
      continue;
    }
    ret = avcodec_send_packet(codec, packet.get());
    av_packet_unref(packet.get());
    if (ret < 0 && ret != AVERROR(EAGAIN)) return ret;

    ret = avcodec_receive_frame(codec, frame);
    if (ret == 0) return 0;
    if (ret != AVERROR(EAGAIN)) return ret;
  }
  if (ret != AVERROR_EOF) return ret;

  // Drain: some decoders hold the first frame until flushed.
  ret = avcodec_send_packet(codec, nullptr);
  if (ret < 0 && ret != AVERROR_EOF) return ret;
  return avcodec_receive_frame(codec, frame);
}

std::shared_ptr<const DecodedImage> ConvertToRgba(const AVFrame* frame) {
  const int w = frame->width;
  const int h = frame->height;
  if (w <= 0 || h <= 0) return nullptr;

  SwsPtr sws(sws_getContext(w, h, static_cast<AVPixelFormat>(frame->format), w, h,
                            AV_PIX_FMT_RGBA, SWS_BILINEAR, nullptr, nullptr, nullptr));
  if (!sws) return nullptr;

  auto image = std::make_shared<DecodedImage>();
  image->width = w;
  image->height = h;
  image->rgba.resize(static_cast<size_t>(w) * static_cast<size_t>(h) * 4);

  uint8_t* dst[4] = {image->rgba.data(), nullptr, nullptr, nullptr};
  int dst_linesize[4] = {w * 4, 0, 0, 0};
  const int rows = sws_scale(sws.get(), frame->data, frame->linesize, 0, h, dst, dst_linesize);
  if (rows != h) return nullptr;
  return image;
}

}  // namespace

FFmpegMediaBackend::FFmpegMediaBackend(FFmpegBackendConfig config)
    : config_(std::move(config)) {
  InitNetworkOnce();
  worker_thread_ = std::thread(&FFmpegMediaBackend::WorkerLoop, this);
}

FFmpegMediaBackend::~FFmpegMediaBackend() {
  std::deque<Job> abandoned;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_.store(true, std::memory_order_release);
    abandoned.swap(queue_);
  }
  work_cv_.notify_all();
  if (worker_thread_.joinable()) {
    worker_thread_.join();
  }
  for (auto& job : abandoned) {
    job.completion(LoadResult::Failure(LoadErrorKind::kCancelled, "backend shut down"));
  }
}

std::shared_ptr<LoadTicket> FFmpegMediaBackend::Load(const MediaRequest& request,
                                                     LoadCompletion completion) {
  auto ticket = std::make_shared<LoadTicket>();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(Job{request, std::move(completion), ticket});
  }
  work_cv_.notify_one();
  return ticket;
}

std::size_t FFmpegMediaBackend::PendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

// =============================================================================
// WorkerLoop: persistent thread, FIFO
// =============================================================================

void FFmpegMediaBackend::WorkerLoop() {
  for (;;) {
    Job job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_cv_.wait(lock, [this]() {
        return shutdown_.load(std::memory_order_acquire) || !queue_.empty();
      });
      if (shutdown_.load(std::memory_order_acquire)) return;
      job = std::move(queue_.front());
      queue_.pop_front();
    }

    if (job.ticket->IsCancelled()) {
      job.completion(LoadResult::Failure(LoadErrorKind::kCancelled, "cancelled before start"));
      continue;
    }

    const auto start = std::chrono::steady_clock::now();
    LoadResult result = Process(job);
    const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - start)
                                .count();
    Logger::Debug(std::string("[FFmpegMediaBackend] ") + model::ItemKindName(job.request.kind) +
                  " " + job.request.locator + (result.ok ? " ok" : " failed") +
                  " in " + std::to_string(elapsed_ms) + "ms");

    job.completion(result);
  }
}

LoadResult FFmpegMediaBackend::Process(const Job& job) {
  const MediaRequest& req = job.request;
  if (req.locator.empty()) {
    return LoadResult::Failure(LoadErrorKind::kInvalidItem, "empty source locator");
  }

  const std::string url = ResolveLocator(req.locator, req.origin, config_.asset_root);
  switch (req.kind) {
    case model::ItemKind::kImage:
    case model::ItemKind::kVideo:
    case model::ItemKind::kAudio:
      return ProbeMedia(job, url);
    case model::ItemKind::kWeb:
      return ConnectWeb(job, url);
    case model::ItemKind::kText:
    case model::ItemKind::kCustom:
      break;
  }
  return LoadResult::Failure(LoadErrorKind::kInvalidItem,
                             std::string("backend cannot load kind ") +
                                 model::ItemKindName(req.kind));
}

LoadResult FFmpegMediaBackend::ProbeMedia(const Job& job, const std::string& url) {
  const MediaRequest& req = job.request;

  InterruptState interrupt;
  interrupt.ticket = job.ticket.get();
  interrupt.shutdown = &shutdown_;
  if (config_.open_timeout_ms > 0) {
    interrupt.has_deadline = true;
    interrupt.deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.open_timeout_ms);
  }

  AVFormatContext* raw = avformat_alloc_context();
  if (!raw) return LoadResult::Failure(LoadErrorKind::kDecodeFailed, "out of memory");
  raw->interrupt_callback.callback = InterruptCallback;
  raw->interrupt_callback.opaque = &interrupt;

  // avformat_open_input frees the context on failure.
  int ret = avformat_open_input(&raw, url.c_str(), nullptr, nullptr);
  if (ret < 0) {
    return LoadResult::Failure(ClassifyOpenError(ret, interrupt, req.origin),
                               "open " + url + ": " + AvError(ret));
  }
  FormatPtr fmt(raw);

  ret = avformat_find_stream_info(fmt.get(), nullptr);
  if (ret < 0) {
    if (job.ticket->IsCancelled()) {
      return LoadResult::Failure(LoadErrorKind::kCancelled, "cancelled during probe");
    }
    return LoadResult::Failure(LoadErrorKind::kUnsupportedMedia,
                               "stream info " + url + ": " + AvError(ret));
  }
  // The deadline covers open and probe only; decoding one frame is bounded.
  interrupt.has_deadline = false;

  MediaInfo info;
  const int video_index = av_find_best_stream(fmt.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  const int audio_index = av_find_best_stream(fmt.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
  info.has_video = video_index >= 0;
  info.has_audio = audio_index >= 0;

  if (req.kind == model::ItemKind::kAudio && !info.has_audio) {
    return LoadResult::Failure(LoadErrorKind::kUnsupportedMedia, "no audio stream: " + url);
  }
  if (req.kind != model::ItemKind::kAudio && !info.has_video) {
    return LoadResult::Failure(LoadErrorKind::kUnsupportedMedia, "no video stream: " + url);
  }

  if (req.kind != model::ItemKind::kImage) {
    if (fmt->duration != AV_NOPTS_VALUE && fmt->duration > 0) {
      info.duration_ms = fmt->duration / 1000;  // AV_TIME_BASE is microseconds
    } else {
      const int index = info.has_video && req.kind == model::ItemKind::kVideo ? video_index
                                                                              : audio_index;
      const AVStream* stream = fmt->streams[index];
      if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
        info.duration_ms = av_rescale_q(stream->duration, stream->time_base, AVRational{1, 1000});
      }
    }
  }

  const bool want_frame =
      req.kind == model::ItemKind::kImage ||
      (req.kind == model::ItemKind::kVideo && req.decode_first_frame &&
       config_.decode_first_frame);

  if (info.has_video) {
    const AVCodecParameters* par = fmt->streams[video_index]->codecpar;
    info.width = par->width;
    info.height = par->height;
  }

  if (want_frame) {
    const AVCodecParameters* par = fmt->streams[video_index]->codecpar;
    const AVCodec* codec = avcodec_find_decoder(par->codec_id);
    if (!codec) {
      return LoadResult::Failure(LoadErrorKind::kUnsupportedMedia,
                                 std::string("no decoder for ") + avcodec_get_name(par->codec_id));
    }
    CodecPtr codec_ctx(avcodec_alloc_context3(codec));
    if (!codec_ctx || avcodec_parameters_to_context(codec_ctx.get(), par) < 0 ||
        avcodec_open2(codec_ctx.get(), codec, nullptr) < 0) {
      return LoadResult::Failure(LoadErrorKind::kDecodeFailed, "cannot open decoder: " + url);
    }

    FramePtr frame(av_frame_alloc());
    if (!frame) return LoadResult::Failure(LoadErrorKind::kDecodeFailed, "out of memory");

    ret = DecodeFirstFrame(fmt.get(), video_index, codec_ctx.get(), frame.get());
    if (ret < 0) {
      if (job.ticket->IsCancelled()) {
        return LoadResult::Failure(LoadErrorKind::kCancelled, "cancelled during decode");
      }
      return LoadResult::Failure(LoadErrorKind::kDecodeFailed,
                                 "first frame " + url + ": " + AvError(ret));
    }

    info.first_frame = ConvertToRgba(frame.get());
    if (!info.first_frame) {
      return LoadResult::Failure(LoadErrorKind::kDecodeFailed, "pixel conversion failed: " + url);
    }
    info.width = frame->width;
    info.height = frame->height;
  }

  Logger::Info("[FFmpegMediaBackend] Probed: " + url + " (" +
               (info.duration_ms ? std::to_string(*info.duration_ms) + "ms" : "untimed") + ")");
  return LoadResult::Success(std::move(info));
}

LoadResult FFmpegMediaBackend::ConnectWeb(const Job& job, const std::string& url) {
  const MediaRequest& req = job.request;

  InterruptState interrupt;
  interrupt.ticket = job.ticket.get();
  interrupt.shutdown = &shutdown_;
  if (config_.open_timeout_ms > 0) {
    interrupt.has_deadline = true;
    interrupt.deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.open_timeout_ms);
  }
  AVIOInterruptCB cb{InterruptCallback, &interrupt};

  AVDictionary* raw_opts = nullptr;
  if (!req.user_agent.empty()) {
    av_dict_set(&raw_opts, "user_agent", req.user_agent.c_str(), 0);
  }
  std::unique_ptr<AVDictionary, DictFreer> opts_guard(nullptr);

  AVIOContext* raw_io = nullptr;
  int ret = avio_open2(&raw_io, url.c_str(), AVIO_FLAG_READ, &cb, &raw_opts);
  opts_guard.reset(raw_opts);
  if (ret < 0) {
    return LoadResult::Failure(ClassifyOpenError(ret, interrupt, req.origin),
                               "connect " + url + ": " + AvError(ret));
  }
  std::unique_ptr<AVIOContext, AvioCloser> io(raw_io);

  unsigned char buffer[kWebProbeBytes];
  ret = avio_read(io.get(), buffer, sizeof(buffer));
  if (ret < 0 && ret != AVERROR_EOF) {
    return LoadResult::Failure(ClassifyOpenError(ret, interrupt, req.origin),
                               "read " + url + ": " + AvError(ret));
  }
  if (ret <= 0) {
    return LoadResult::Failure(LoadErrorKind::kUnsupportedMedia, "empty page: " + url);
  }

  Logger::Info("[FFmpegMediaBackend] Connected: " + url);
  return LoadResult::Success(MediaInfo{});
}

}  // namespace storyline::media
