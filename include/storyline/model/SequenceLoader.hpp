// Repository: Storyline
// Component: Sequence Loader
// Purpose: Reads a JSON sequence manifest into StoryItems.
//          Minimal parser - only handles the flat item structure we need.
// Copyright (c) 2025 Storyline
//
// Manifest shape:
//   { "initial_index": 0,
//     "items": [ { "kind": "video", "source": "clips/a.mp4", "origin": "asset",
//                  "duration_ms": 5000, "mute_by_default": true, "loop": false,
//                  "error_view": "generic" }, ... ] }
//
// Item keys: kind, source, origin, duration_ms, mute_by_default, loop,
// use_aspect_ratio, fit, text, background, alignment, user_agent, error_view.
// Custom items need a code-side factory and are rejected here.

#ifndef STORYLINE_MODEL_SEQUENCE_LOADER_HPP_
#define STORYLINE_MODEL_SEQUENCE_LOADER_HPP_

#include <cstdint>
#include <string>

#include "storyline/model/SequenceValidator.hpp"
#include "storyline/model/StoryItem.hpp"

namespace storyline::model {

struct LoadedSequence {
  StorySequence items;
  int32_t initial_index = 0;
};

class SequenceLoader {
 public:
  // Parses manifest text. On failure `out` is left untouched.
  static ValidationResult Parse(const std::string& json, LoadedSequence& out);

  static ValidationResult LoadFile(const std::string& path, LoadedSequence& out);
};

}  // namespace storyline::model

#endif  // STORYLINE_MODEL_SEQUENCE_LOADER_HPP_
