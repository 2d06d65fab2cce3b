// Repository: Storyline
// Component: Sequence Loader Tests
// Purpose: Manifest parsing and descriptor validation.
// Copyright (c) 2025 Storyline

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

#include "storyline/model/SequenceLoader.hpp"
#include "storyline/model/SequenceValidator.hpp"

namespace {

using namespace storyline::model;

TEST(SequenceLoaderTest, ParsesEveryManifestKind) {
  const std::string json = R"({
    "initial_index": 1,
    "items": [
      { "kind": "image", "source": "https://example.com/a.jpg", "duration_ms": 2500, "fit": "contain" },
      { "kind": "video", "source": "clips/intro.mp4", "origin": "asset",
        "mute_by_default": true, "loop": true },
      { "kind": "audio", "source": "/tmp/track.mp3", "origin": "file" },
      { "kind": "text", "text": "Hello {world}", "background": "#101010" },
      { "kind": "web", "source": "https://example.com/promo", "user_agent": "storyline/1",
        "error_view": "generic" }
    ]
  })";

  LoadedSequence loaded;
  ValidationResult result = SequenceLoader::Parse(json, loaded);
  ASSERT_TRUE(result.valid) << SequenceErrorName(result.error) << " " << result.detail;

  ASSERT_EQ(loaded.items.size(), 5u);
  EXPECT_EQ(loaded.initial_index, 1);

  const StoryItem& image = loaded.items[0];
  EXPECT_EQ(image.kind, ItemKind::kImage);
  EXPECT_EQ(image.origin, SourceOrigin::kNetwork);
  EXPECT_EQ(image.configured_duration_ms, 2500);
  ASSERT_TRUE(image.image.has_value());
  EXPECT_EQ(image.image->fit, "contain");

  const StoryItem& video = loaded.items[1];
  EXPECT_EQ(video.kind, ItemKind::kVideo);
  EXPECT_EQ(video.origin, SourceOrigin::kAsset);
  EXPECT_TRUE(video.mute_by_default);
  ASSERT_TRUE(video.video.has_value());
  EXPECT_TRUE(video.video->looping);
  EXPECT_EQ(video.configured_duration_ms, StoryItem::kDefaultDurationMs);

  EXPECT_EQ(loaded.items[2].origin, SourceOrigin::kFile);

  const StoryItem& text = loaded.items[3];
  ASSERT_TRUE(text.text.has_value());
  EXPECT_EQ(text.text->text, "Hello {world}");
  EXPECT_EQ(text.text->background_color, "#101010");
  EXPECT_EQ(text.source_locator, "Hello {world}");

  const StoryItem& web = loaded.items[4];
  ASSERT_TRUE(web.web.has_value());
  EXPECT_EQ(web.web->user_agent, "storyline/1");
  ASSERT_TRUE(web.error_view.has_value());
  EXPECT_EQ(*web.error_view, "generic");
}

TEST(SequenceLoaderTest, UnescapesStrings) {
  const std::string json =
      R"({ "items": [ { "kind": "text", "text": "say \"hi\"\nbye" } ] })";
  LoadedSequence loaded;
  ASSERT_TRUE(SequenceLoader::Parse(json, loaded).valid);
  EXPECT_EQ(loaded.items[0].text->text, "say \"hi\"\nbye");
}

TEST(SequenceLoaderTest, MissingItemsArrayIsMalformed) {
  LoadedSequence loaded;
  ValidationResult result = SequenceLoader::Parse(R"({ "initial_index": 0 })", loaded);
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.error, SequenceError::kMalformedManifest);
}

TEST(SequenceLoaderTest, EmptyItemsArrayIsRejected) {
  LoadedSequence loaded;
  ValidationResult result = SequenceLoader::Parse(R"({ "items": [] })", loaded);
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.error, SequenceError::kEmptySequence);
}

TEST(SequenceLoaderTest, UnknownKindNamesTheItem) {
  LoadedSequence loaded;
  ValidationResult result = SequenceLoader::Parse(
      R"({ "items": [ { "kind": "image", "source": "a.png" }, { "kind": "hologram", "source": "x" } ] })",
      loaded);
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.error, SequenceError::kUnknownKind);
  EXPECT_EQ(result.item_index, 1);
}

TEST(SequenceLoaderTest, UnknownOriginIsRejected) {
  LoadedSequence loaded;
  ValidationResult result = SequenceLoader::Parse(
      R"({ "items": [ { "kind": "image", "source": "a.png", "origin": "ftp" } ] })", loaded);
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.error, SequenceError::kUnknownOrigin);
}

TEST(SequenceLoaderTest, CustomItemsCannotComeFromManifest) {
  LoadedSequence loaded;
  ValidationResult result =
      SequenceLoader::Parse(R"({ "items": [ { "kind": "custom" } ] })", loaded);
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.error, SequenceError::kMalformedManifest);
  EXPECT_EQ(result.item_index, 0);
}

TEST(SequenceLoaderTest, MissingSourceIsRejected) {
  LoadedSequence loaded;
  ValidationResult result =
      SequenceLoader::Parse(R"({ "items": [ { "kind": "video" } ] })", loaded);
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.error, SequenceError::kMissingSource);
  EXPECT_EQ(result.item_index, 0);
}

TEST(SequenceLoaderTest, InitialIndexOutOfRangeIsRejectedAndOutputUntouched) {
  LoadedSequence loaded;
  loaded.initial_index = 42;
  ValidationResult result = SequenceLoader::Parse(
      R"({ "initial_index": 3, "items": [ { "kind": "text", "text": "only" } ] })", loaded);
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.error, SequenceError::kInitialIndexOutOfRange);
  EXPECT_TRUE(loaded.items.empty());
  EXPECT_EQ(loaded.initial_index, 42);
}

TEST(SequenceLoaderTest, InitialIndexBeyondInt32IsMalformed) {
  LoadedSequence loaded;
  ValidationResult result = SequenceLoader::Parse(
      R"({ "initial_index": 4294967296, "items": [ { "kind": "text", "text": "only" } ] })",
      loaded);
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.error, SequenceError::kMalformedManifest);
  EXPECT_NE(result.detail.find("4294967296"), std::string::npos);

  result = SequenceLoader::Parse(
      R"({ "initial_index": -2147483649, "items": [ { "kind": "text", "text": "only" } ] })",
      loaded);
  EXPECT_EQ(result.error, SequenceError::kMalformedManifest);
  EXPECT_TRUE(loaded.items.empty());
}

TEST(SequenceLoaderTest, LoadFileReportsUnreadablePath) {
  LoadedSequence loaded;
  ValidationResult result =
      SequenceLoader::LoadFile("/nonexistent/storyline/manifest.json", loaded);
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.error, SequenceError::kUnreadableManifest);
}

TEST(SequenceLoaderTest, LoadFileReadsManifestFromDisk) {
  const std::string path = ::testing::TempDir() + "storyline_manifest_test.json";
  {
    std::ofstream out(path);
    out << R"({ "items": [ { "kind": "image", "source": "a.png", "origin": "asset" } ] })";
  }
  LoadedSequence loaded;
  ValidationResult result = SequenceLoader::LoadFile(path, loaded);
  std::remove(path.c_str());

  ASSERT_TRUE(result.valid);
  ASSERT_EQ(loaded.items.size(), 1u);
  EXPECT_EQ(loaded.items[0].source_locator, "a.png");
}

TEST(SequenceValidatorTest, CustomItemRequiresFactory) {
  StoryItem item = StoryItem::Custom(nullptr);
  ValidationResult result = ValidateStoryItem(item);
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.error, SequenceError::kMissingCustomFactory);
}

TEST(SequenceValidatorTest, NegativeDurationIsRejected) {
  StoryItem item = StoryItem::Image("a.png", SourceOrigin::kAsset, -1);
  EXPECT_EQ(ValidateStoryItem(item).error, SequenceError::kNegativeDuration);
}

TEST(SequenceValidatorTest, TextFactoryDisplaysTextAsLocator) {
  StoryItem item = StoryItem::Text("Welcome");
  EXPECT_TRUE(ValidateStoryItem(item).valid);
  EXPECT_EQ(item.source_locator, "Welcome");
  EXPECT_EQ(item.configured_duration_ms, 3000);
}

}  // namespace
