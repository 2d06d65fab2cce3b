// Repository: Storyline
// Component: Error Taxonomy
// Purpose: LoadError (recoverable, absorbed into the Failed state),
//          InvalidIndexError (boundary rejection), DoubleReleaseViolation
//          (programming-contract break, never swallowed).
// Copyright (c) 2025 Storyline

#ifndef STORYLINE_UTIL_ERRORS_HPP_
#define STORYLINE_UTIL_ERRORS_HPP_

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace storyline::util {

enum class LoadErrorKind {
  kSourceNotFound,    // file/asset missing, HTTP 404
  kNetwork,           // connect/read failure on a network origin
  kUnsupportedMedia,  // no usable stream, unknown container or codec
  kDecodeFailed,      // stream found but first frame could not be decoded
  kInvalidItem,       // descriptor unusable (no locator, no custom factory)
  kCancelled,         // acquisition aborted by Release()
};

const char* LoadErrorKindName(LoadErrorKind kind);

// Reported by a media adapter through OnFailed(). Never thrown.
struct LoadError {
  LoadErrorKind kind = LoadErrorKind::kUnsupportedMedia;
  std::string cause;

  [[nodiscard]] std::string ToString() const;
};

// Index outside [0, length). Thrown only at construction boundaries;
// runtime jumpTo requests with a bad index are rejected without throwing.
class InvalidIndexError : public std::out_of_range {
 public:
  InvalidIndexError(int64_t index, std::size_t length);

  [[nodiscard]] int64_t index() const { return index_; }
  [[nodiscard]] std::size_t length() const { return length_; }

 private:
  int64_t index_;
  std::size_t length_;
};

// A media adapter was released twice. The one-live-adapter invariant has
// been broken by the caller.
class DoubleReleaseViolation : public std::logic_error {
 public:
  explicit DoubleReleaseViolation(const std::string& what)
      : std::logic_error(what) {}
};

}  // namespace storyline::util

#endif  // STORYLINE_UTIL_ERRORS_HPP_
