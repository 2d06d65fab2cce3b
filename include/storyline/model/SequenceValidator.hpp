// Repository: Storyline
// Component: Sequence Validator
// Purpose: Descriptor invariants checked before a session is built.
// Copyright (c) 2025 Storyline

#ifndef STORYLINE_MODEL_SEQUENCE_VALIDATOR_HPP_
#define STORYLINE_MODEL_SEQUENCE_VALIDATOR_HPP_

#include <cstdint>
#include <string>

#include "storyline/model/StoryItem.hpp"

namespace storyline::model {

enum class SequenceError {
  kNone,
  kEmptySequence,
  kMissingSource,         // non-custom item without a locator
  kMissingCustomFactory,  // custom item without a factory
  kNegativeDuration,
  kInitialIndexOutOfRange,
  kUnreadableManifest,
  kMalformedManifest,
  kUnknownKind,
  kUnknownOrigin,
};

const char* SequenceErrorName(SequenceError error);

struct ValidationResult {
  bool valid;
  SequenceError error;
  std::string detail;
  int32_t item_index;  // offending item, -1 when not item-specific

  static ValidationResult Success() { return {true, SequenceError::kNone, "", -1}; }

  static ValidationResult Failure(SequenceError err, const std::string& detail = "",
                                  int32_t item_index = -1) {
    return {false, err, detail, item_index};
  }
};

ValidationResult ValidateStoryItem(const StoryItem& item);

// Validates every item and the starting index.
ValidationResult ValidateSequence(const StorySequence& sequence, int32_t initial_index);

}  // namespace storyline::model

#endif  // STORYLINE_MODEL_SEQUENCE_VALIDATOR_HPP_
