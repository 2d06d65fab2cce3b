// Repository: Storyline
// Component: Error Taxonomy
// Copyright (c) 2025 Storyline

#include "storyline/util/Errors.hpp"

namespace storyline::util {

const char* LoadErrorKindName(LoadErrorKind kind) {
  switch (kind) {
    case LoadErrorKind::kSourceNotFound:
      return "SOURCE_NOT_FOUND";
    case LoadErrorKind::kNetwork:
      return "NETWORK";
    case LoadErrorKind::kUnsupportedMedia:
      return "UNSUPPORTED_MEDIA";
    case LoadErrorKind::kDecodeFailed:
      return "DECODE_FAILED";
    case LoadErrorKind::kInvalidItem:
      return "INVALID_ITEM";
    case LoadErrorKind::kCancelled:
      return "CANCELLED";
  }
  return "UNKNOWN";
}

std::string LoadError::ToString() const {
  std::string out = LoadErrorKindName(kind);
  if (!cause.empty()) {
    out += ": ";
    out += cause;
  }
  return out;
}

InvalidIndexError::InvalidIndexError(int64_t index, std::size_t length)
    : std::out_of_range("index " + std::to_string(index) +
                        " outside sequence of length " + std::to_string(length)),
      index_(index),
      length_(length) {}

}  // namespace storyline::util
