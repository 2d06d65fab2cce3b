// Repository: Storyline
// Component: FFmpeg Media Backend Tests
// Purpose: Probe, first-frame decode and web connect against small media
//          files written at test time, plus error mapping and worker behaviour.
// Copyright (c) 2025 Storyline

#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "storyline/media/FFmpegMediaBackend.hpp"
#include "storyline/media/SourceResolver.hpp"

namespace {

using namespace storyline;

// Collects completions delivered on the worker thread.
class CompletionCollector {
 public:
  media::LoadCompletion Callback() {
    return [this](const media::LoadResult& result) {
      std::lock_guard<std::mutex> lock(mutex_);
      results_.push_back(result);
      cv_.notify_all();
    };
  }

  bool WaitFor(std::size_t count) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, std::chrono::seconds(10),
                        [&]() { return results_.size() >= count; });
  }

  media::LoadResult At(std::size_t i) {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_.at(i);
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<media::LoadResult> results_;
};

// Writes media fixtures into a fresh directory removed on teardown.
class MediaFixtureDir : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() /
           ("storyline_backend_" + std::string(::testing::UnitTest::GetInstance()
                                                   ->current_test_info()
                                                   ->name()));
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  std::string Write(const std::string& name, const std::string& bytes) {
    const std::filesystem::path path = dir_ / name;
    std::ofstream out(path, std::ios::binary);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    return path.string();
  }

  // Binary PPM (P6), one colour per row.
  static std::string Ppm(int width, int height) {
    std::string bytes = "P6\n" + std::to_string(width) + " " + std::to_string(height) + "\n255\n";
    for (int y = 0; y < height; ++y) {
      for (int x = 0; x < width; ++x) {
        bytes.push_back(static_cast<char>(y * 60));
        bytes.push_back(static_cast<char>(255 - y * 60));
        bytes.push_back(static_cast<char>(x * 40));
      }
    }
    return bytes;
  }

  // 16-bit mono PCM WAV of silence.
  static std::string Wav(int sample_rate, int samples) {
    auto le16 = [](std::string& b, uint16_t v) {
      b.push_back(static_cast<char>(v & 0xFF));
      b.push_back(static_cast<char>((v >> 8) & 0xFF));
    };
    auto le32 = [](std::string& b, uint32_t v) {
      for (int i = 0; i < 4; ++i) b.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    };
    const uint32_t data_bytes = static_cast<uint32_t>(samples) * 2;

    std::string b = "RIFF";
    le32(b, 36 + data_bytes);
    b += "WAVEfmt ";
    le32(b, 16);
    le16(b, 1);  // PCM
    le16(b, 1);  // mono
    le32(b, static_cast<uint32_t>(sample_rate));
    le32(b, static_cast<uint32_t>(sample_rate) * 2);
    le16(b, 2);
    le16(b, 16);
    b += "data";
    le32(b, data_bytes);
    b.append(data_bytes, '\0');
    return b;
  }

  std::filesystem::path dir_;
};

TEST(SourceResolverTest, ResolvesByOrigin) {
  EXPECT_EQ(media::ResolveLocator("https://x/a.mp4", model::SourceOrigin::kNetwork, "/assets"),
            "https://x/a.mp4");
  EXPECT_EQ(media::ResolveLocator("file:///tmp/a.mp4", model::SourceOrigin::kFile, "/assets"),
            "/tmp/a.mp4");
  EXPECT_EQ(media::ResolveLocator("clips/a.mp4", model::SourceOrigin::kAsset, "/assets"),
            "/assets/clips/a.mp4");
  EXPECT_EQ(media::ResolveLocator("clips/a.mp4", model::SourceOrigin::kAsset, "/assets/"),
            "/assets/clips/a.mp4");
  EXPECT_EQ(media::ResolveLocator("clips/a.mp4", model::SourceOrigin::kAsset, ""),
            "clips/a.mp4");
}

TEST(FFmpegMediaBackendTest, MissingFileIsSourceNotFound) {
  media::FFmpegMediaBackend backend;
  CompletionCollector collector;

  media::MediaRequest request;
  request.kind = model::ItemKind::kVideo;
  request.locator = "/nonexistent/storyline/clip.mp4";
  request.origin = model::SourceOrigin::kFile;
  backend.Load(request, collector.Callback());

  ASSERT_TRUE(collector.WaitFor(1));
  const media::LoadResult result = collector.At(0);
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error.kind, util::LoadErrorKind::kSourceNotFound);
  EXPECT_NE(result.error.cause.find("clip.mp4"), std::string::npos);
}

TEST(FFmpegMediaBackendTest, MissingAssetIsResolvedAgainstAssetRoot) {
  media::FFmpegBackendConfig config;
  config.asset_root = "/nonexistent/storyline-assets";
  media::FFmpegMediaBackend backend(config);
  CompletionCollector collector;

  media::MediaRequest request;
  request.kind = model::ItemKind::kImage;
  request.locator = "a.png";
  request.origin = model::SourceOrigin::kAsset;
  backend.Load(request, collector.Callback());

  ASSERT_TRUE(collector.WaitFor(1));
  const media::LoadResult result = collector.At(0);
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error.kind, util::LoadErrorKind::kSourceNotFound);
  EXPECT_NE(result.error.cause.find("/nonexistent/storyline-assets/a.png"), std::string::npos);
}

TEST(FFmpegMediaBackendTest, EmptyLocatorIsInvalidItem) {
  media::FFmpegMediaBackend backend;
  CompletionCollector collector;

  media::MediaRequest request;
  request.kind = model::ItemKind::kImage;
  backend.Load(request, collector.Callback());

  ASSERT_TRUE(collector.WaitFor(1));
  EXPECT_EQ(collector.At(0).error.kind, util::LoadErrorKind::kInvalidItem);
}

TEST(FFmpegMediaBackendTest, TicketCancelledBeforeStartCompletesAsCancelled) {
  media::FFmpegMediaBackend backend;
  CompletionCollector collector;

  // The worker is serial: the first completion cancels the second ticket
  // before the second request can be picked up.
  std::promise<std::shared_ptr<media::LoadTicket>> second_ticket;
  auto second_future = second_ticket.get_future().share();
  auto collect = collector.Callback();

  media::MediaRequest first;
  first.kind = model::ItemKind::kImage;
  first.locator = "/nonexistent/storyline/first.png";
  first.origin = model::SourceOrigin::kFile;

  media::MediaRequest second = first;
  second.locator = "/nonexistent/storyline/second.png";

  backend.Load(first, [second_future, collect](const media::LoadResult& result) {
    second_future.get()->Cancel();
    collect(result);
  });
  second_ticket.set_value(backend.Load(second, collector.Callback()));

  ASSERT_TRUE(collector.WaitFor(2));
  const media::LoadResult result = collector.At(1);
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error.kind, util::LoadErrorKind::kCancelled);
}

TEST(FFmpegMediaBackendTest, DestructorCompletesQueuedRequests) {
  CompletionCollector collector;
  {
    media::FFmpegMediaBackend backend;
    media::MediaRequest request;
    request.kind = model::ItemKind::kAudio;
    request.origin = model::SourceOrigin::kFile;
    for (int i = 0; i < 4; ++i) {
      request.locator = "/nonexistent/storyline/track" + std::to_string(i) + ".mp3";
      backend.Load(request, collector.Callback());
    }
  }
  EXPECT_TRUE(collector.WaitFor(4));
}

TEST_F(MediaFixtureDir, ImageDecodesFirstFrameToRgba) {
  const std::string path = Write("still.ppm", Ppm(5, 3));
  media::FFmpegMediaBackend backend;
  CompletionCollector collector;

  media::MediaRequest request;
  request.kind = model::ItemKind::kImage;
  request.locator = path;
  request.origin = model::SourceOrigin::kFile;
  backend.Load(request, collector.Callback());

  ASSERT_TRUE(collector.WaitFor(1));
  const media::LoadResult result = collector.At(0);
  ASSERT_TRUE(result.ok) << result.error.ToString();
  EXPECT_FALSE(result.info.duration_ms.has_value());
  EXPECT_TRUE(result.info.has_video);
  EXPECT_EQ(result.info.width, 5);
  EXPECT_EQ(result.info.height, 3);
  ASSERT_NE(result.info.first_frame, nullptr);
  EXPECT_EQ(result.info.first_frame->width, 5);
  EXPECT_EQ(result.info.first_frame->height, 3);
  EXPECT_EQ(result.info.first_frame->rgba.size(), 5u * 3u * 4u);
}

TEST_F(MediaFixtureDir, AudioProbeReportsDuration) {
  // 4000 samples at 8 kHz.
  const std::string path = Write("tone.wav", Wav(8000, 4000));
  media::FFmpegMediaBackend backend;
  CompletionCollector collector;

  media::MediaRequest request;
  request.kind = model::ItemKind::kAudio;
  request.locator = "file://" + path;
  request.origin = model::SourceOrigin::kFile;
  backend.Load(request, collector.Callback());

  ASSERT_TRUE(collector.WaitFor(1));
  const media::LoadResult result = collector.At(0);
  ASSERT_TRUE(result.ok) << result.error.ToString();
  EXPECT_TRUE(result.info.has_audio);
  EXPECT_FALSE(result.info.has_video);
  EXPECT_EQ(result.info.first_frame, nullptr);
  ASSERT_TRUE(result.info.duration_ms.has_value());
  EXPECT_NEAR(static_cast<double>(*result.info.duration_ms), 500.0, 5.0);
}

TEST_F(MediaFixtureDir, VideoRequestWithoutVideoStreamIsUnsupported) {
  const std::string path = Write("tone.wav", Wav(8000, 800));
  media::FFmpegMediaBackend backend;
  CompletionCollector collector;

  media::MediaRequest request;
  request.kind = model::ItemKind::kVideo;
  request.locator = path;
  request.origin = model::SourceOrigin::kFile;
  backend.Load(request, collector.Callback());

  ASSERT_TRUE(collector.WaitFor(1));
  const media::LoadResult result = collector.At(0);
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error.kind, util::LoadErrorKind::kUnsupportedMedia);
}

TEST_F(MediaFixtureDir, WebPageConnectsAndReads) {
  const std::string path = Write("page.html", "<html><body>chapter</body></html>");
  media::FFmpegMediaBackend backend;
  CompletionCollector collector;

  media::MediaRequest request;
  request.kind = model::ItemKind::kWeb;
  request.locator = "file:" + path;
  request.origin = model::SourceOrigin::kNetwork;
  request.user_agent = "storyline-tests";
  backend.Load(request, collector.Callback());

  ASSERT_TRUE(collector.WaitFor(1));
  const media::LoadResult result = collector.At(0);
  ASSERT_TRUE(result.ok) << result.error.ToString();
  EXPECT_FALSE(result.info.duration_ms.has_value());
}

TEST_F(MediaFixtureDir, EmptyWebPageIsUnsupported) {
  const std::string path = Write("empty.html", "");
  media::FFmpegMediaBackend backend;
  CompletionCollector collector;

  media::MediaRequest request;
  request.kind = model::ItemKind::kWeb;
  request.locator = "file:" + path;
  request.origin = model::SourceOrigin::kNetwork;
  backend.Load(request, collector.Callback());

  ASSERT_TRUE(collector.WaitFor(1));
  const media::LoadResult result = collector.At(0);
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error.kind, util::LoadErrorKind::kUnsupportedMedia);
}

}  // namespace
