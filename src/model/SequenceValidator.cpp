// Repository: Storyline
// Component: Sequence Validator
// Copyright (c) 2025 Storyline

#include "storyline/model/SequenceValidator.hpp"

namespace storyline::model {

const char* SequenceErrorName(SequenceError error) {
  switch (error) {
    case SequenceError::kNone:
      return "NONE";
    case SequenceError::kEmptySequence:
      return "EMPTY_SEQUENCE";
    case SequenceError::kMissingSource:
      return "MISSING_SOURCE";
    case SequenceError::kMissingCustomFactory:
      return "MISSING_CUSTOM_FACTORY";
    case SequenceError::kNegativeDuration:
      return "NEGATIVE_DURATION";
    case SequenceError::kInitialIndexOutOfRange:
      return "INITIAL_INDEX_OUT_OF_RANGE";
    case SequenceError::kUnreadableManifest:
      return "UNREADABLE_MANIFEST";
    case SequenceError::kMalformedManifest:
      return "MALFORMED_MANIFEST";
    case SequenceError::kUnknownKind:
      return "UNKNOWN_KIND";
    case SequenceError::kUnknownOrigin:
      return "UNKNOWN_ORIGIN";
  }
  return "UNKNOWN";
}

ValidationResult ValidateStoryItem(const StoryItem& item) {
  if (item.kind == ItemKind::kCustom) {
    if (!item.custom_factory) {
      return ValidationResult::Failure(SequenceError::kMissingCustomFactory,
                                       "custom item requires a view factory");
    }
  } else if (item.source_locator.empty()) {
    return ValidationResult::Failure(
        SequenceError::kMissingSource,
        std::string(ItemKindName(item.kind)) + " item requires a source locator");
  }

  if (item.configured_duration_ms < 0) {
    return ValidationResult::Failure(
        SequenceError::kNegativeDuration,
        "configured_duration_ms=" + std::to_string(item.configured_duration_ms));
  }

  return ValidationResult::Success();
}

ValidationResult ValidateSequence(const StorySequence& sequence, int32_t initial_index) {
  if (sequence.empty()) {
    return ValidationResult::Failure(SequenceError::kEmptySequence, "sequence has no items");
  }

  for (std::size_t i = 0; i < sequence.size(); ++i) {
    ValidationResult item_result = ValidateStoryItem(sequence[i]);
    if (!item_result.valid) {
      item_result.item_index = static_cast<int32_t>(i);
      return item_result;
    }
  }

  if (initial_index < 0 || static_cast<std::size_t>(initial_index) >= sequence.size()) {
    return ValidationResult::Failure(
        SequenceError::kInitialIndexOutOfRange,
        "initial_index=" + std::to_string(initial_index) +
            " length=" + std::to_string(sequence.size()));
  }

  return ValidationResult::Success();
}

}  // namespace storyline::model
